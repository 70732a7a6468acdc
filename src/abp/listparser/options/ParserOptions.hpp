/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include "ParsingOptions.hpp"

namespace abp
{
	namespace listparser
	{
		namespace options
		{

			/// <summary>
			/// The ParserOptions class holds the switches that control the behaviour of the
			/// line parser and list reader. Every switch is a simple boolean, keyed by the
			/// strongly typed ParsingOption enum which is cast to the index of an atomic
			/// boolean array, with getter/setter methods provided.
			/// 
			/// The parsers only ever read from this object, and hold a pointer to it. The
			/// object must therefore outlive every parser that was constructed with it.
			/// Because the storage is atomic, switches may be toggled from another thread
			/// while lists are being parsed, with the new value applying from the next line
			/// parsed.
			/// </summary>
			class ParserOptions
			{

			public:

				/// <summary>
				/// Constructs the options with their default values. StrictOptionParsing is
				/// enabled, everything else is disabled.
				/// </summary>
				ParserOptions();

				/// <summary>
				/// No copy no move no thx.
				/// </summary>
				ParserOptions(const ParserOptions&) = delete;
				ParserOptions(ParserOptions&&) = delete;
				ParserOptions& operator=(const ParserOptions&) = delete;

				/// <summary>
				/// Default destructor.
				/// </summary>
				~ParserOptions();

				/// <summary>
				/// Check if the specified parsing option is enabled or not.
				/// </summary>
				/// <param name="option">
				/// The parsing option to query.
				/// </param>
				/// <returns>
				/// True if the option is enabled, false otherwise. Out of range keys are
				/// always reported as disabled.
				/// </returns>
				bool GetIsOptionEnabled(const ParsingOption option) const;

				/// <summary>
				/// Set if the specified parsing option is enabled or not. Out of range keys are
				/// ignored.
				/// </summary>
				/// <param name="option">
				/// The parsing option to modify.
				/// </param>
				/// <param name="value">
				/// The value to be set for the supplied parsing option.
				/// </param>
				void SetIsOptionEnabled(const ParsingOption option, const bool value);

			private:

				/// <summary>
				/// Hold the state of enabled or disabled parsing options. Access the option
				/// using the provided keys/indices for getting/setting the current value in a
				/// thread-safe way.
				/// </summary>
				std::array<std::atomic_bool, static_cast<size_t>(ParsingOption::NUMBER_OF_ENTRIES)> m_parsingOptions;

			};

		} /* namespace options */
	} /* namespace listparser */
} /* namespace abp */
