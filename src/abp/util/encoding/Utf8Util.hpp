/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/

#pragma once

#include <cstddef>
#include <boost/utility/string_ref.hpp>

namespace abp
{
	namespace listparser
	{
		namespace util
		{
			namespace encoding
			{

				/// <summary>
				/// Checks that the supplied bytes form well formed UTF-8 as defined by RFC 3629.
				/// Overlong encodings, encoded UTF-16 surrogates and code points beyond U+10FFFF
				/// are all rejected.
				/// </summary>
				/// <param name="bytes">
				/// The bytes to validate.
				/// </param>
				/// <returns>
				/// True if the bytes are valid UTF-8, false otherwise.
				/// </returns>
				bool IsValidUtf8(boost::string_ref bytes);

				/// <summary>
				/// Finds the offset of the first byte that does not begin a valid UTF-8
				/// sequence.
				/// </summary>
				/// <returns>
				/// The byte offset of the first invalid sequence, or boost::string_ref::npos if
				/// the bytes are entirely valid.
				/// </returns>
				size_t FindInvalidUtf8(boost::string_ref bytes);

			} /* namespace encoding */
		} /* namespace util */
	} /* namespace listparser */
} /* namespace abp */
