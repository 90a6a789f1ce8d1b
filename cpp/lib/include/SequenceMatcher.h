/** \file    SequenceMatcher.h
 *  \brief   Ratcliff/Obershelp "gestalt pattern matching" similarity of two code point sequences.
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
#pragma once


#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <cstdint>


/** \class SequenceMatcher
 *  \brief Finds the longest common contiguous block, then recurses to its left and right.
 *
 *  For a second sequence of at least AUTOJUNK_MIN_LENGTH elements, elements that occur in more than 1% of its
 *  positions (plus one) are "popular" and never seed a match, although a match may be extended across them.
 */
class SequenceMatcher {
public:
    struct Match {
        size_t a_start_, b_start_, size_;
    public:
        Match(const size_t a_start, const size_t b_start, const size_t size): a_start_(a_start), b_start_(b_start), size_(size) { }
        inline bool operator==(const Match &rhs) const
            { return a_start_ == rhs.a_start_ and b_start_ == rhs.b_start_ and size_ == rhs.size_; }
        inline bool operator<(const Match &rhs) const {
            if (a_start_ != rhs.a_start_)
                return a_start_ < rhs.a_start_;
            if (b_start_ != rhs.b_start_)
                return b_start_ < rhs.b_start_;
            return size_ < rhs.size_;
        }
    };

    static constexpr size_t AUTOJUNK_MIN_LENGTH = 200;
private:
    const std::vector<uint32_t> a_, b_;
    std::unordered_map<uint32_t, std::vector<size_t>> b_to_indices_;
    std::unordered_set<uint32_t> popular_elements_;
    std::vector<Match> matching_blocks_;
    bool matching_blocks_computed_;
public:
    SequenceMatcher(const std::vector<uint32_t> &a, const std::vector<uint32_t> &b);

    /** \return The longest matching block in a[a_low, a_high) and b[b_low, b_high), the earliest one in "a" (and then
     *          in "b") if there are several.  The size of the returned match is zero if there is none.
     */
    Match findLongestMatch(const size_t a_low, const size_t a_high, const size_t b_low, const size_t b_high) const;

    /** \return The non-adjacent matching blocks in increasing order, terminated by the sentinel (|a|, |b|, 0). */
    const std::vector<Match> &getMatchingBlocks();

    /** \return 2.0 * M / (|a| + |b|) where M is the total size of all matching blocks, 1.0 if both are empty. */
    double ratio();

    inline const std::unordered_set<uint32_t> &getPopularElements() const { return popular_elements_; }

    static double Ratio(const std::vector<uint32_t> &a, const std::vector<uint32_t> &b);

    /** \brief Decodes both UTF-8 strings and compares their code points. */
    static double Ratio(const std::string &a, const std::string &b);
};
