/** \file    FuzzyMatcher.h
 *  \brief   Greedy near-duplicate title matching among records that failed exact matching.
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
#include <vector>
#include "BibRecord.h"


namespace FuzzyMatcher {


constexpr double DEFAULT_THRESHOLD(0.90);


/** \return True if "threshold" is a number in [0, 1], else false. */
bool IsValidThreshold(const double threshold);


struct Options {
    double threshold_;

    // Upper bound on the number of title similarity computations, 0 means unlimited.
    unsigned max_comparisons_;
public:
    explicit Options(const double threshold = DEFAULT_THRESHOLD, const unsigned max_comparisons = 0)
        : threshold_(threshold), max_comparisons_(max_comparisons) { }
};


struct MatchedPair {
    BibRecord::Record record_a_, record_b_;
    double confidence_;
    std::string reason_;
    bool is_fuzzy_;
public:
    MatchedPair(const BibRecord::Record &record_a, const BibRecord::Record &record_b, const double confidence,
                const std::string &reason, const bool is_fuzzy)
        : record_a_(record_a), record_b_(record_b), confidence_(confidence), reason_(reason), is_fuzzy_(is_fuzzy) { }
};


struct Result {
    std::vector<MatchedPair> matches_;
    std::vector<BibRecord::Record> remaining_a_, remaining_b_;
    unsigned comparison_count_;
    bool comparison_limit_reached_;
public:
    Result(): comparison_count_(0), comparison_limit_reached_(false) { }
};


/** \brief Pairs up records of "unique_a" and "unique_b" whose normalised titles are similar.
 *
 *  Every record of A, in order, is paired with the first not yet paired record of B, in order, that has a non-empty
 *  title, the same first four characters of the year (two missing years are the same) and a title similarity of at
 *  least options.threshold_.  Records without a normalised title never take part.  The remaining records keep their
 *  relative order.
 *
 *  If options.max_comparisons_ is non-zero and that many similarities have been computed, we stop and everything not
 *  yet paired remains.
 */
Result Match(const std::vector<BibRecord::Record> &unique_a, const std::vector<BibRecord::Record> &unique_b,
             const Options &options = Options());


/** \return True if the normalised titles are equal or their similarity is strictly greater than 0.9, else false. */
bool TitlesAreSimilar(const std::string &title1, const std::string &title2);


} // namespace FuzzyMatcher
