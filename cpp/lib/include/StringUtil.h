/** \file    StringUtil.h
 *  \brief   Declarations for string utility functions.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Dr. Gordon W. Paynter
 */

/*
 *  Copyright 2002-2009 Project iVia.
 *  Copyright 2002-2009 The Regents of The University of California.
 *  Copyright 2002-2004 Dr. Johannes Ruscheinski.
 *  Copyright 2015 Universitätsbibliothek Tübingen
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as published
 *  by the Free Software Foundation; either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software
 *  Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */
#pragma once


#include <string>
#include <cstdint>
#include <cstring>
#include <strings.h>


/** \namespace  StringUtil
 *  \brief      Various string processing functions.
 */
namespace StringUtil {


// Tried in this order when the library gets loaded, see InitializeLocale() in StringUtil.cc.
constexpr const char *STANDARD_LOCALE("en_US.UTF-8");
constexpr const char *FALLBACK_LOCALE("C.UTF-8");

const std::string WHITE_SPACE(" \t\n\v\r\f");


/** \brief  Convert an ASCII string to lowercase (modifies its argument). */
std::string ToLower(std::string * const s);


/** \brief  Convert an ASCII string to lowercase (does not modify its agrument). */
std::string ToLower(const std::string &s);


/** \brief   Remove all occurences of a set of characters from either end of a string.
 *  \param   trim_set  The set of characters to remove.
 *  \param   s         The string to trim.
 *  \return  The trimmed string.
 */
std::string Trim(const std::string &trim_set, std::string * const s);
std::string Trim(const std::string &s, const std::string &trim_set);


inline std::string TrimWhite(std::string * const s) {
    return Trim(WHITE_SPACE, s);
}


inline std::string TrimWhite(const std::string &s) {
    std::string temp_s(s);
    return TrimWhite(&temp_s);
}


/** \brief   Does the given string start with the suggested prefix?
 *  \param   s            The string to test.
 *  \param   prefix       The prefix to test for.
 *  \param   ignore_case  If true, the match will be case-insensitive.
 *  \return  True if the string "s" equals or starts with the prefix "prefix."
 */
inline bool StartsWith(const std::string &s, const std::string &prefix, const bool ignore_case = false) {
    return prefix.empty()
           or (s.length() >= prefix.length()
               and (ignore_case ? (::strncasecmp(s.c_str(), prefix.c_str(), prefix.length()) == 0)
                                : (std::strncmp(s.c_str(), prefix.c_str(), prefix.length()) == 0)));
}


/** \brief  Split a string around a delimiter character.
 *  \param  source                     The string to split.
 *  \param  delimiter                  The character to split around.
 *  \param  container                  Where to return the resulting fields.
 *  \param  suppress_empty_components  If true we will not return empty fields.
 *  \return The number of extracted "fields".
 */
template<typename InsertableContainer> unsigned Split(const std::string &source, const char delimiter,
                                                      InsertableContainer * const container,
                                                      const bool suppress_empty_components = true)
{
    container->clear();
    if (source.empty())
        return 0;

    unsigned count(0);
    std::string::size_type start(0);
    for (;;) {
        const auto next_delimiter(source.find(delimiter, start));
        const std::string component(next_delimiter == std::string::npos ? source.substr(start)
                                                                           : source.substr(start, next_delimiter - start));
        if (not suppress_empty_components or not component.empty()) {
            container->insert(container->end(), component);
            ++count;
        }

        if (next_delimiter == std::string::npos)
            return count;
        start = next_delimiter + 1;
    }
}


/** \brief  Joins the strings in "source" separated by "separator". */
template<typename StringContainer> std::string Join(const StringContainer &source, const std::string &separator) {
    std::string joined;
    for (auto element(source.cbegin()); element != source.cend(); ++element) {
        if (element != source.cbegin())
            joined += separator;
        joined += *element;
    }

    return joined;
}


/** \brief   Converts a string to an unsigned number.
 *  \return  True if "s" consisted entirely of a decimal number that fits into an unsigned, else false.
 */
bool ToUnsigned(const std::string &s, unsigned * const n);


/** \brief   Converts a string to a double-precision number.
 *  \return  True if "s" consisted entirely of a floating point number, else false.
 */
bool ToDouble(const std::string &s, double * const n);


/** \brief   Converts "true", "yes", "on", "false", "no" or "off" (case insensitive) to a bool.
 *  \return  False if "value" was none of the above, else true.
 */
bool ToBool(const std::string &value, bool * const b);


/** \return The 8 hex digits of "u32", most significant nybble first. */
std::string ToHexString(uint32_t u32);


/** \brief  Converts "n" to a string with "precision" significant digits. */
std::string ToString(const double n, const unsigned precision = 5);


} // namespace StringUtil
