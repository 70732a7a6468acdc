/*
* Copyright © 2017 Jesse Nicholson
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/


#pragma once

#include <cctype>
#include <vector>
#include <locale>
#include <boost/algorithm/string.hpp>
#include <boost/utility/string_ref.hpp>
#include <boost/functional/hash.hpp>

namespace abp
{
	namespace listparser
	{
		namespace util
		{
			namespace string
			{

				/// <summary>
				/// Checks if the supplied character is one of the ASCII whitespace characters.
				/// Filter list syntax only ever treats ASCII whitespace as a separator, so no
				/// locale is consulted here.
				/// </summary>
				inline bool IsWhitespace(const char c)
				{
					return std::isspace(static_cast<unsigned char>(c)) != 0;
				}

				/// <summary>
				/// Returns a view of the supplied string with leading and trailing whitespace
				/// removed. The returned string_ref refers to the same memory as the argument.
				/// </summary>
				/// <param name="what">
				/// The string_ref to trim.
				/// </param>
				/// <returns>
				/// The trimmed view. Empty if the argument consisted entirely of whitespace.
				/// </returns>
				inline boost::string_ref Trim(boost::string_ref what)
				{
					while (!what.empty() && IsWhitespace(what.front()))
					{
						what.remove_prefix(1);
					}

					while (!what.empty() && IsWhitespace(what.back()))
					{
						what.remove_suffix(1);
					}

					return what;
				}

				/// <summary>
				/// Finds the first occurrence of the supplied character at or after the
				/// supplied offset. boost::string_ref::find has no offset overload, so this
				/// fills that gap.
				/// </summary>
				inline boost::string_ref::size_type Find(boost::string_ref what, const char c, const boost::string_ref::size_type offset)
				{
					if (offset >= what.size())
					{
						return boost::string_ref::npos;
					}

					auto pos = what.substr(offset).find(c);

					if (pos == boost::string_ref::npos)
					{
						return pos;
					}

					return pos + offset;
				}

				/// <summary>
				/// Splits the supplied string_ref by the supplied character delimiter. Every
				/// part between delimiters is returned, including empty parts and the final
				/// part following the last delimiter, so that joining the result with the
				/// delimiter reproduces the input.
				/// </summary>
				/// <param name="what">
				/// The string_ref to split.
				/// </param>
				/// <param name="delim">
				/// The delimiter.
				/// </param>
				/// <returns>
				/// The parts of the supplied string, in order. An empty input yields a single
				/// empty part.
				/// </returns>
				inline std::vector<boost::string_ref> Split(boost::string_ref what, const char delim)
				{
					std::vector<boost::string_ref> ret;

					auto i = what.find(delim);
					while (i != boost::string_ref::npos)
					{
						ret.push_back(what.substr(0, i));
						what = what.substr(i + 1);
						i = what.find(delim);
					}

					ret.push_back(what);

					return ret;
				}

				/// <summary>
				/// Hash implementation for string_ref.
				/// </summary>
				struct StringRefHash
				{
					size_t operator()(const boost::string_ref strRef) const
					{
						return boost::hash_range(strRef.begin(), strRef.end());
					}
				};

				/// <summary>
				/// Case-insensitive hash implementation for string_ref. Taken from boost docs here:
				/// http://www.boost.org/doc/libs/1_62_0/doc/html/unordered/hash_equality.html
				/// </summary>
				struct StringRefICaseHash
				{
					size_t operator()(const boost::string_ref strRef) const
					{
						std::size_t seed = 0;
						std::locale locale;

						for (boost::string_ref::const_iterator it = strRef.begin(); it != strRef.end(); ++it)
						{
							boost::hash_combine(seed, std::toupper((*it), locale));
						}

						return seed;
					}
				};

				/// <summary>
				/// Case-insensitive equality predicate for string_ref. Taken from boost docs here:
				/// http://www.boost.org/doc/libs/1_62_0/doc/html/unordered/hash_equality.html
				/// </summary>
				struct StringRefIEquals
				{
					bool operator()(const boost::string_ref lhs, const boost::string_ref rhs) const
					{
						return boost::algorithm::iequals(lhs, rhs);
					}
				};

			} /* namespace string */
		} /* namespace util */
	} /* namespace listparser */
} /* namespace abp */
