/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#include "Utf8Util.hpp"
#include <boost/locale/encoding_errors.hpp>
#include <boost/locale/encoding_utf.hpp>
#include <boost/locale/utf.hpp>

namespace abp
{
	namespace listparser
	{
		namespace util
		{
			namespace encoding
			{

				size_t FindInvalidUtf8(boost::string_ref bytes)
				{
					using Utf8Traits = boost::locale::utf::utf_traits<char>;

					auto current = bytes.begin();
					const auto end = bytes.end();

					while (current != end)
					{
						const auto sequenceStart = current;
						const auto codePoint = Utf8Traits::decode(current, end);

						if (codePoint == boost::locale::utf::illegal || codePoint == boost::locale::utf::incomplete)
						{
							return static_cast<size_t>(sequenceStart - bytes.begin());
						}
					}

					return boost::string_ref::npos;
				}

				bool IsValidUtf8(boost::string_ref bytes)
				{
					try
					{
						boost::locale::conv::utf_to_utf<char>(bytes.begin(), bytes.end(), boost::locale::conv::stop);
					}
					catch (const boost::locale::conv::conversion_error&)
					{
						return false;
					}

					return true;
				}

			} /* namespace encoding */
		} /* namespace util */
	} /* namespace listparser */
} /* namespace abp */
