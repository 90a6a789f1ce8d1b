/** \file    StringUtil.cc
 *  \brief   Implementation of string utility functions.
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
#include "StringUtil.h"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <cctype>
#include <cerrno>
#include <climits>
#include <clocale>
#include <cstdlib>
#include <unistd.h>
#include "util.h"


namespace {


// Non-ASCII case folding and character classification in TextUtil and TitleNormaliser depend on a UTF-8 LC_CTYPE.
// Without one we carry on, but only ASCII letters and digits will be recognised.
__attribute__((constructor)) void InitializeLocale() {
    if (std::setlocale(LC_CTYPE, StringUtil::STANDARD_LOCALE) != nullptr)
        return;
    if (std::setlocale(LC_CTYPE, StringUtil::FALLBACK_LOCALE) != nullptr)
        return;

    static const char ERROR_MESSAGE[] = "in InitializeLocale: setlocale(3) failed for en_US.UTF-8 and C.UTF-8!\n";
    const ssize_t dummy(::write(STDERR_FILENO, ERROR_MESSAGE, sizeof(ERROR_MESSAGE) - 1));
    (void)dummy;
}


} // unnamed namespace


namespace StringUtil {


std::string ToLower(std::string * const s) {
    for (auto &ch : *s)
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));

    return *s;
}


std::string ToLower(const std::string &s) {
    std::string result(s);
    return ToLower(&result);
}


std::string Trim(const std::string &trim_set, std::string * const s) {
    const auto first(s->find_first_not_of(trim_set));
    if (first == std::string::npos) {
        s->clear();
        return *s;
    }

    const auto last(s->find_last_not_of(trim_set));
    *s = s->substr(first, last - first + 1);
    return *s;
}


std::string Trim(const std::string &s, const std::string &trim_set) {
    std::string temp_s(s);
    return Trim(trim_set, &temp_s);
}


bool ToUnsigned(const std::string &s, unsigned * const n) {
    std::string::const_iterator ch(s.begin());
    while (ch != s.end() and std::isspace(static_cast<unsigned char>(*ch)))
        ++ch;
    if (unlikely(ch == s.end() or *ch == '-'))
        return false;

    char *end_ptr;
    errno = 0;
    const unsigned long ul(std::strtoul(s.c_str(), &end_ptr, 10));
    *n = static_cast<unsigned>(ul);

    return (*end_ptr == '\0') and (errno == 0) and (ul <= UINT_MAX);
}


bool ToDouble(const std::string &s, double * const n) {
    if (unlikely(s.empty()))
        return false;

    char *end_ptr;
    errno = 0;
    *n = std::strtod(s.c_str(), &end_ptr);

    return (*end_ptr == '\0') and (errno == 0);
}


bool ToBool(const std::string &value, bool * const b) {
    if (::strcasecmp(value.c_str(), "true") == 0 or ::strcasecmp(value.c_str(), "yes") == 0
        or ::strcasecmp(value.c_str(), "on") == 0)
    {
        *b = true;
        return true;
    }

    if (::strcasecmp(value.c_str(), "false") == 0 or ::strcasecmp(value.c_str(), "off") == 0
        or ::strcasecmp(value.c_str(), "no") == 0)
    {
        *b = false;
        return true;
    }

    return false;
}


std::string ToHexString(uint32_t u32) {
    static const char HEX_DIGITS[] = "0123456789ABCDEF";

    std::string hex_string;
    hex_string.reserve(8);
    for (unsigned nybble(0); nybble < 8; ++nybble) {
        hex_string += HEX_DIGITS[u32 & 0xFu];
        u32 >>= 4u;
    }
    std::reverse(hex_string.begin(), hex_string.end());

    return hex_string;
}


std::string ToString(const double n, const unsigned precision) {
    std::stringstream stream;
    if (precision > 1) // Only show decimal point if we have more than one digit of precision:
        stream.setf(std::ios_base::showpoint);
    stream << std::setprecision(precision) << n;

    // Do we have a trailing naked . ?
    if (unlikely(stream.str().rfind('.') == stream.str().size() - 1))
        return stream.str().substr(0, stream.str().size() - 1);

    return stream.str();
}


} // namespace StringUtil
