/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#include "ParserOptions.hpp"
#include <algorithm>

namespace abp
{
	namespace listparser
	{
		namespace options
		{

			ParserOptions::ParserOptions()
			{
				// Must initialize all atomic bools explicitly.
				std::fill(m_parsingOptions.begin(), m_parsingOptions.end(), false);

				m_parsingOptions[static_cast<size_t>(ParsingOption::StrictOptionParsing)] = true;
			}

			ParserOptions::~ParserOptions()
			{

			}

			bool ParserOptions::GetIsOptionEnabled(const ParsingOption option) const
			{
				if (static_cast<size_t>(option) >= m_parsingOptions.size())
				{
					return false;
				}

				return m_parsingOptions[static_cast<size_t>(option)];
			}

			void ParserOptions::SetIsOptionEnabled(const ParsingOption option, const bool value)
			{
				if (static_cast<size_t>(option) >= m_parsingOptions.size())
				{
					return;
				}

				m_parsingOptions[static_cast<size_t>(option)] = value;
			}

		} /* namespace options */
	} /* namespace listparser */
} /* namespace abp */
