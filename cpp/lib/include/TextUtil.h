/** \file    TextUtil.h
 *  \brief   Declarations of text related utility functions.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Jiangtao Hu
 */

/*
 *  Copyright 2003-2009 Project iVia.
 *  Copyright 2003-2009 The Regents of The University of California.
 *  Copyright 2015-2021 Universitätsbibliothek Tübingen.
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
#include <unordered_set>
#include <vector>
#include <cstdint>


namespace TextUtil {


constexpr uint32_t REPLACEMENT_CHARACTER(0xFFFDu);
constexpr uint32_t MAX_CODE_POINT(0x10FFFFu);


/** \brief Incremental UTF-8 decoder.
 *  \note  Feed bytes with addByte() until it returns false, then collect the code point with getUTF32Char().
 */
class UTF8ToUTF32Decoder {
    int required_count_;
    uint32_t utf32_char_;
    bool permissive_;
public:
    /** \param permissive  If false, we throw a std::runtime_error on encoding errors, if true we return Unicode replacement
     *                     characters.
     */
    explicit UTF8ToUTF32Decoder(const bool permissive = true): required_count_(-1), utf32_char_(0), permissive_(permissive) { }

    /** \return True if more bytes are needed to complete the current character, else false. */
    bool addByte(const char ch);

    uint32_t getUTF32Char() { required_count_ = -1; return utf32_char_; }
};


/** \brief Converts a UTF-8 string to a sequence of code points.
 *  \note  Malformed byte sequences, including an incomplete last character, surrogates and values beyond
 *         MAX_CODE_POINT, are replaced with REPLACEMENT_CHARACTER.  The result can always be passed to UTF32ToUTF8().
 */
void UTF8ToUTF32(const std::string &utf8_string, std::vector<uint32_t> * const utf32_chars);


/** \throws std::runtime_error if "code_point" is not a valid Unicode code point. */
std::string UTF32ToUTF8(const uint32_t code_point);
std::string UTF32ToUTF8(const std::vector<uint32_t> &code_points);


/** \brief Lowercases "code_point" according to the LC_CTYPE of the current locale. */
uint32_t UTF32ToLower(const uint32_t code_point);


/** \return True if "code_point" is a letter or a digit in the sense of the current locale's LC_CTYPE, else false. */
bool IsAlphanumeric(const uint32_t code_point);


extern const std::unordered_set<uint32_t> UNICODE_WHITESPACE;


/** \return True if "utf32_char" is one of the whitespace code points, else false. */
inline bool IsWhitespace(const uint32_t utf32_char) {
    return UNICODE_WHITESPACE.find(utf32_char) != UNICODE_WHITESPACE.end();
}


/** \brief Removes leading and trailing whitespace code points. */
void TrimWhitespace(std::vector<uint32_t> * const utf32_chars);


inline bool IsStartOfUTF8CodePoint(const char ch) {
    // Test whether we have an ASCII character or a character whose uppermost two bits are both 1.
    return (static_cast<unsigned char>(ch) & 128u) == 0 or (static_cast<unsigned char>(ch) & 192u) == 192u;
}


/** \return The number of code points in "utf8_string". */
size_t CodePointCount(const std::string &utf8_string);


/** \brief Removes a leading UTF-8 encoded byte-order mark, if there is one. */
void StripBOM(std::string * const utf8_string);


} // namespace TextUtil
