/** \file    MatchKey.cc
 *  \brief   Implementation of the exact-match key generation.
 */

/*
    Copyright (C) 2026 Library of the University of Tübingen

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU Affero General Public License as
    published by the Free Software Foundation, either version 3 of the
    License, or (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU Affero General Public License for more details.

    You should have received a copy of the GNU Affero General Public License
    along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/
#include "MatchKey.h"
#include <algorithm>
#include <vector>
#include "TextUtil.h"
#include "TitleNormaliser.h"


namespace MatchKey {


namespace {


bool IsBlank(const std::string &s) {
    std::vector<uint32_t> code_points;
    TextUtil::UTF8ToUTF32(s, &code_points);
    TextUtil::TrimWhitespace(&code_points);
    return code_points.empty();
}


// Counts code points, not bytes.
std::string Truncate(const std::string &utf8_string, const size_t max_length) {
    size_t length(0);
    for (auto ch(utf8_string.cbegin()); ch != utf8_string.cend(); ++ch) {
        if (TextUtil::IsStartOfUTF8CodePoint(*ch)) {
            if (length == max_length)
                return std::string(utf8_string.cbegin(), ch);
            ++length;
        }
    }

    return utf8_string;
}


} // unnamed namespace


std::string NormaliseDOI(const std::string &doi) {
    std::vector<uint32_t> code_points;
    TextUtil::UTF8ToUTF32(doi, &code_points);
    code_points.erase(std::remove(code_points.begin(), code_points.end(), TextUtil::REPLACEMENT_CHARACTER), code_points.end());
    TextUtil::TrimWhitespace(&code_points);
    for (auto &code_point : code_points)
        code_point = TextUtil::UTF32ToLower(code_point);

    return TextUtil::UTF32ToUTF8(code_points);
}


std::string TruncatedYear(const BibRecord::Record &record) {
    return Truncate(record.getYear(), 4);
}


std::string Generate(const BibRecord::Record &record) {
    const std::string doi(NormaliseDOI(record.getDOI()));
    if (not doi.empty())
        return DOI_KEY_PREFIX + doi;

    const std::string normalised_title(TitleNormaliser::Normalise(record));
    const std::string year(record.getYear());
    const std::string year_component(IsBlank(year) ? NO_YEAR_PREFIX + std::to_string(TextUtil::CodePointCount(normalised_title))
                                                   : Truncate(year, 4));

    return TITLE_KEY_PREFIX + normalised_title + "_" + year_component;
}


} // namespace MatchKey
