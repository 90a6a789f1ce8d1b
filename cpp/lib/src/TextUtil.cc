/** \file    TextUtil.cc
 *  \brief   Implementation of text related utility functions.
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
#include "TextUtil.h"
#include <stdexcept>
#include <cwctype>
#include "StringUtil.h"
#include "util.h"


namespace TextUtil {


bool UTF8ToUTF32Decoder::addByte(const char ch) {
    if (required_count_ == -1) {
        if ((static_cast<unsigned char>(ch) & 0b10000000) == 0b00000000) {
            utf32_char_ = static_cast<unsigned char>(ch);
            required_count_ = 0;
        } else if ((static_cast<unsigned char>(ch) & 0b11100000) == 0b11000000) {
            utf32_char_ = static_cast<unsigned char>(ch) & 0b11111;
            required_count_ = 1;
        } else if ((static_cast<unsigned char>(ch) & 0b11110000) == 0b11100000) {
            utf32_char_ = static_cast<unsigned char>(ch) & 0b1111;
            required_count_ = 2;
        } else if ((static_cast<unsigned char>(ch) & 0b11111000) == 0b11110000) {
            utf32_char_ = static_cast<unsigned char>(ch) & 0b111;
            required_count_ = 3;
        } else if (permissive_) {
            utf32_char_ = REPLACEMENT_CHARACTER;
            required_count_ = 0;
        } else
            throw std::runtime_error("in TextUtil::UTF8ToUTF32Decoder::addByte: bad UTF-8 byte "
                                     "sequence! (current char 0x" + StringUtil::ToHexString(static_cast<unsigned char>(ch))
                                     + ")");
    } else if (required_count_ > 0) {
        if (unlikely((static_cast<unsigned char>(ch) & 0b11000000) != 0b10000000)) {
            if (not permissive_)
                throw std::runtime_error("in TextUtil::UTF8ToUTF32Decoder::addByte: expected a continuation byte, found 0x"
                                         + StringUtil::ToHexString(static_cast<unsigned char>(ch)) + "!");
            utf32_char_ = REPLACEMENT_CHARACTER;
            required_count_ = 0;
            return false;
        }
        --required_count_;
        utf32_char_ <<= 6u;
        utf32_char_ |= (static_cast<unsigned char>(ch) & 0b00111111);

        // Lead bytes 0xF5-0xF7 decode to values beyond the Unicode range and surrogates are not characters.
        if (required_count_ == 0 and (utf32_char_ > MAX_CODE_POINT or (utf32_char_ >= 0xD800u and utf32_char_ <= 0xDFFFu))) {
            if (not permissive_)
                throw std::runtime_error("in TextUtil::UTF8ToUTF32Decoder::addByte: invalid code point 0x"
                                         + StringUtil::ToHexString(utf32_char_) + "!");
            utf32_char_ = REPLACEMENT_CHARACTER;
        }
    }

    return required_count_ != 0;
}


void UTF8ToUTF32(const std::string &utf8_string, std::vector<uint32_t> * const utf32_chars) {
    utf32_chars->clear();
    utf32_chars->reserve(utf8_string.size());

    UTF8ToUTF32Decoder decoder;
    bool last_addByte_retval(false);
    for (const char ch : utf8_string) {
        if (not (last_addByte_retval = decoder.addByte(ch)))
            utf32_chars->emplace_back(decoder.getUTF32Char());
    }

    if (unlikely(last_addByte_retval))
        utf32_chars->emplace_back(REPLACEMENT_CHARACTER);
}


/*
    Unicode range 0x00000000 - 0x0000007F:
       Returned byte: 0xxxxxxx

    Unicode range 0x00000080 - 0x000007FF:
       Returned bytes: 110xxxxx 10xxxxxx

    Unicode range 0x00000800 - 0x0000FFFF:
       Returned bytes: 1110xxxx 10xxxxxx 10xxxxxx

    Unicode range 0x00010000 - 0x0010FFFF:
       Returned bytes: 11110xxx 10xxxxxx 10xxxxxx 10xxxxxx
*/
std::string UTF32ToUTF8(const uint32_t code_point) {
    std::string utf8;

    if (code_point <= 0x7Fu)
        utf8 += static_cast<char>(code_point);
    else if (code_point <= 0x7FFu) {
        utf8 += static_cast<char>(0b11000000u | (code_point >> 6u));
        utf8 += static_cast<char>(0b10000000u | (code_point & 0b00111111u));
    } else if (code_point <= 0xFFFF) {
        utf8 += static_cast<char>(0b11100000u | (code_point >> 12u));
        utf8 += static_cast<char>(0b10000000u | ((code_point >> 6u) & 0b00111111u));
        utf8 += static_cast<char>(0b10000000u | (code_point & 0b00111111u));
    } else if (code_point <= MAX_CODE_POINT) {
        utf8 += static_cast<char>(0b11110000u | (code_point >> 18u));
        utf8 += static_cast<char>(0b10000000u | ((code_point >> 12u) & 0b00111111u));
        utf8 += static_cast<char>(0b10000000u | ((code_point >> 6u) & 0b00111111u));
        utf8 += static_cast<char>(0b10000000u | (code_point & 0b00111111u));
    } else
        throw std::runtime_error("in TextUtil::UTF32ToUTF8: invalid Unicode code point 0x"
                                 + StringUtil::ToHexString(code_point) + "!");

    return utf8;
}


std::string UTF32ToUTF8(const std::vector<uint32_t> &code_points) {
    std::string utf8;
    utf8.reserve(code_points.size());
    for (const auto code_point : code_points)
        utf8 += UTF32ToUTF8(code_point);

    return utf8;
}


uint32_t UTF32ToLower(const uint32_t code_point) {
    return static_cast<uint32_t>(std::towlower(static_cast<wint_t>(code_point)));
}


bool IsAlphanumeric(const uint32_t code_point) {
    return std::iswalnum(static_cast<wint_t>(code_point)) != 0;
}


const std::unordered_set<uint32_t> UNICODE_WHITESPACE {
    0x0009, 0x000A, 0x000B, 0x000C, 0x000D, 0x001C, 0x001D, 0x001E, 0x001F, 0x0020, 0x0085, 0x00A0, 0x1680, 0x2000,
    0x2001, 0x2002, 0x2003, 0x2004, 0x2005, 0x2006, 0x2007, 0x2008, 0x2009, 0x200A, 0x2028, 0x2029, 0x202F, 0x205F,
    0x3000
};


void TrimWhitespace(std::vector<uint32_t> * const utf32_chars) {
    auto last(utf32_chars->end());
    while (last != utf32_chars->begin() and IsWhitespace(*(last - 1)))
        --last;
    utf32_chars->erase(last, utf32_chars->end());

    auto first(utf32_chars->begin());
    while (first != utf32_chars->end() and IsWhitespace(*first))
        ++first;
    utf32_chars->erase(utf32_chars->begin(), first);
}


size_t CodePointCount(const std::string &utf8_string) {
    size_t code_point_count(0);
    for (const char ch : utf8_string) {
        if (IsStartOfUTF8CodePoint(ch))
            ++code_point_count;
    }

    return code_point_count;
}


void StripBOM(std::string * const utf8_string) {
    static const std::string UTF8_BOM("\xEF\xBB\xBF");
    if (StringUtil::StartsWith(*utf8_string, UTF8_BOM))
        utf8_string->erase(0, UTF8_BOM.length());
}


} // namespace TextUtil
