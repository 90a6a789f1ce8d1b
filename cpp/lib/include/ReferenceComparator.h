/** \file    ReferenceComparator.h
 *  \brief   Compares two collections of bibliographic references.
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


#include <vector>
#include "BibRecord.h"
#include "FuzzyMatcher.h"


namespace ReferenceComparator {


struct Options {
    bool use_fuzzy_;
    FuzzyMatcher::Options fuzzy_options_;
public:
    explicit Options(const bool use_fuzzy = true, const FuzzyMatcher::Options &fuzzy_options = FuzzyMatcher::Options())
        : use_fuzzy_(use_fuzzy), fuzzy_options_(fuzzy_options) { }
};


struct ComparisonResult {
    std::vector<BibRecord::Record> overlap_, unique_a_, unique_b_;

    // Both sides of every fuzzy match.  Only the A side also appears in overlap_.
    std::vector<FuzzyMatcher::MatchedPair> fuzzy_pairs_;
};


struct ComparisonStats {
    size_t overlap_count_, unique_a_count_, unique_b_count_, total_a_, total_b_, fuzzy_match_count_;
public:
    ComparisonStats(const ComparisonResult &result, const size_t total_a, const size_t total_b)
        : overlap_count_(result.overlap_.size()), unique_a_count_(result.unique_a_.size()),
          unique_b_count_(result.unique_b_.size()), total_a_(total_a), total_b_(total_b),
          fuzzy_match_count_(result.fuzzy_pairs_.size()) { }
};


/** \brief Splits the references into those found in both collections and those unique to either one.
 *
 *  Exact matching by MatchKey comes first.  Then, if options.use_fuzzy_ is set and both residual sets are non-empty,
 *  FuzzyMatcher pairs up near-duplicate titles.  The A side of each such pair is appended to the overlap with its
 *  fuzzy-match flag set, and the B side is dropped from the unique sets.  The overlap always consists of records
 *  from "records_a".  A "temp_key" field is removed from every returned record.
 */
ComparisonResult Compare(const std::vector<BibRecord::Record> &records_a, const std::vector<BibRecord::Record> &records_b,
                         const Options &options = Options());


} // namespace ReferenceComparator
