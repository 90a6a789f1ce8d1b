/** \file    TitleNormaliser.cc
 *  \brief   Implementation of the title normalisation.
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
#include "TitleNormaliser.h"
#include <algorithm>
#include "TextUtil.h"


namespace TitleNormaliser {


namespace {


// Tried in this order, at most one is removed.
const std::vector<std::vector<uint32_t>> LEADING_ARTICLES{
    { 't', 'h', 'e', ' ' },
    { 'a', ' ' },
    { 'a', 'n', ' ' },
};


bool StartsWith(const std::vector<uint32_t> &s, const std::vector<uint32_t> &prefix) {
    return s.size() >= prefix.size() and std::equal(prefix.cbegin(), prefix.cend(), s.cbegin());
}


} // unnamed namespace


std::vector<uint32_t> NormaliseToUTF32(const std::string &title) {
    std::vector<uint32_t> code_points;
    TextUtil::UTF8ToUTF32(title, &code_points);

    for (auto &code_point : code_points)
        code_point = TextUtil::UTF32ToLower(code_point);
    TextUtil::TrimWhitespace(&code_points);

    for (const auto &article : LEADING_ARTICLES) {
        if (StartsWith(code_points, article)) {
            code_points.erase(code_points.begin(), code_points.begin() + article.size());
            break;
        }
    }

    std::vector<uint32_t> normalised_title;
    normalised_title.reserve(code_points.size());
    for (const auto code_point : code_points) {
        if (code_point != TextUtil::REPLACEMENT_CHARACTER and TextUtil::IsAlphanumeric(code_point))
            normalised_title.emplace_back(code_point);
    }

    return normalised_title;
}


std::string Normalise(const std::string &title) {
    return TextUtil::UTF32ToUTF8(NormaliseToUTF32(title));
}


std::string Normalise(const BibRecord::Record &record) {
    return Normalise(record.getTitle());
}


} // namespace TitleNormaliser
