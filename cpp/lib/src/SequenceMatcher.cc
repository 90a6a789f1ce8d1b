/** \file    SequenceMatcher.cc
 *  \brief   Implementation of class SequenceMatcher.
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
#include "SequenceMatcher.h"
#include <algorithm>
#include <tuple>
#include "TextUtil.h"


SequenceMatcher::SequenceMatcher(const std::vector<uint32_t> &a, const std::vector<uint32_t> &b)
    : a_(a), b_(b), matching_blocks_computed_(false)
{
    for (size_t j(0); j < b_.size(); ++j)
        b_to_indices_[b_[j]].emplace_back(j);

    if (b_.size() >= AUTOJUNK_MIN_LENGTH) {
        const size_t max_occurrences(b_.size() / 100 + 1);
        for (const auto &element_and_indices : b_to_indices_) {
            if (element_and_indices.second.size() > max_occurrences)
                popular_elements_.emplace(element_and_indices.first);
        }
        for (const auto popular_element : popular_elements_)
            b_to_indices_.erase(popular_element);
    }
}


SequenceMatcher::Match SequenceMatcher::findLongestMatch(const size_t a_low, const size_t a_high, const size_t b_low,
                                                         const size_t b_high) const
{
    size_t best_i(a_low), best_j(b_low), best_size(0);

    // Maps j to the length of the match ending in a[i - 1] and b[j].
    std::unordered_map<size_t, size_t> j_to_length;
    for (size_t i(a_low); i < a_high; ++i) {
        std::unordered_map<size_t, size_t> new_j_to_length;
        const auto indices(b_to_indices_.find(a_[i]));
        if (indices != b_to_indices_.cend()) {
            for (const size_t j : indices->second) {
                if (j < b_low)
                    continue;
                if (j >= b_high)
                    break;

                size_t k(1);
                if (j > 0) {
                    const auto previous_length(j_to_length.find(j - 1));
                    if (previous_length != j_to_length.cend())
                        k += previous_length->second;
                }
                new_j_to_length[j] = k;
                if (k > best_size) {
                    best_i = i - k + 1;
                    best_j = j - k + 1;
                    best_size = k;
                }
            }
        }
        j_to_length.swap(new_j_to_length);
    }

    // Popular elements never seed a match but they may extend one.
    while (best_i > a_low and best_j > b_low and a_[best_i - 1] == b_[best_j - 1]) {
        --best_i;
        --best_j;
        ++best_size;
    }
    while (best_i + best_size < a_high and best_j + best_size < b_high and a_[best_i + best_size] == b_[best_j + best_size])
        ++best_size;

    return Match(best_i, best_j, best_size);
}


const std::vector<SequenceMatcher::Match> &SequenceMatcher::getMatchingBlocks() {
    if (matching_blocks_computed_)
        return matching_blocks_;

    std::vector<Match> matches;
    std::vector<std::tuple<size_t, size_t, size_t, size_t>> ranges_to_process{ std::make_tuple(size_t(0), a_.size(), size_t(0), b_.size()) };
    while (not ranges_to_process.empty()) {
        size_t a_low, a_high, b_low, b_high;
        std::tie(a_low, a_high, b_low, b_high) = ranges_to_process.back();
        ranges_to_process.pop_back();

        const Match match(findLongestMatch(a_low, a_high, b_low, b_high));
        if (match.size_ == 0)
            continue;

        matches.emplace_back(match);
        if (a_low < match.a_start_ and b_low < match.b_start_)
            ranges_to_process.emplace_back(a_low, match.a_start_, b_low, match.b_start_);
        if (match.a_start_ + match.size_ < a_high and match.b_start_ + match.size_ < b_high)
            ranges_to_process.emplace_back(match.a_start_ + match.size_, a_high, match.b_start_ + match.size_, b_high);
    }
    std::sort(matches.begin(), matches.end());

    // Collapse adjacent blocks:
    size_t i1(0), j1(0), k1(0);
    for (const auto &match : matches) {
        if (i1 + k1 == match.a_start_ and j1 + k1 == match.b_start_)
            k1 += match.size_;
        else {
            if (k1 > 0)
                matching_blocks_.emplace_back(i1, j1, k1);
            i1 = match.a_start_;
            j1 = match.b_start_;
            k1 = match.size_;
        }
    }
    if (k1 > 0)
        matching_blocks_.emplace_back(i1, j1, k1);
    matching_blocks_.emplace_back(a_.size(), b_.size(), 0);

    matching_blocks_computed_ = true;
    return matching_blocks_;
}


double SequenceMatcher::ratio() {
    const size_t total_length(a_.size() + b_.size());
    if (total_length == 0)
        return 1.0;

    size_t match_count(0);
    for (const auto &block : getMatchingBlocks())
        match_count += block.size_;

    return 2.0 * static_cast<double>(match_count) / static_cast<double>(total_length);
}


double SequenceMatcher::Ratio(const std::vector<uint32_t> &a, const std::vector<uint32_t> &b) {
    SequenceMatcher matcher(a, b);
    return matcher.ratio();
}


double SequenceMatcher::Ratio(const std::string &a, const std::string &b) {
    std::vector<uint32_t> a_code_points, b_code_points;
    TextUtil::UTF8ToUTF32(a, &a_code_points);
    TextUtil::UTF8ToUTF32(b, &b_code_points);
    return Ratio(a_code_points, b_code_points);
}
