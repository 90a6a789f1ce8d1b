/** \file    ReferenceComparator.cc
 *  \brief   Implementation of the comparison of two reference collections.
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
#include "ReferenceComparator.h"
#include "ExactMatcher.h"
#include "util.h"


namespace ReferenceComparator {


namespace {


std::vector<BibRecord::Record> SelectRecords(const std::vector<BibRecord::Record> &records, const std::vector<size_t> &indices) {
    std::vector<BibRecord::Record> selected_records;
    selected_records.reserve(indices.size());
    for (const size_t index : indices)
        selected_records.emplace_back(records[index]);

    return selected_records;
}


void RemoveTempKeys(std::vector<BibRecord::Record> * const records) {
    for (auto &record : *records)
        record.removeField(BibRecord::TEMP_KEY_FIELD);
}


} // unnamed namespace


ComparisonResult Compare(const std::vector<BibRecord::Record> &records_a, const std::vector<BibRecord::Record> &records_b,
                         const Options &options)
{
    const auto partition(ExactMatcher::PartitionRecords(records_a, records_b));

    ComparisonResult result;
    result.overlap_ = SelectRecords(records_a, partition.overlap_);
    result.unique_a_ = SelectRecords(records_a, partition.unique_a_);
    result.unique_b_ = SelectRecords(records_b, partition.unique_b_);
    LOG_DEBUG("exact matching: " + std::to_string(result.overlap_.size()) + " overlapping, "
              + std::to_string(result.unique_a_.size()) + " only in A, " + std::to_string(result.unique_b_.size()) + " only in B");

    if (options.use_fuzzy_ and not result.unique_a_.empty() and not result.unique_b_.empty()) {
        auto fuzzy_result(FuzzyMatcher::Match(result.unique_a_, result.unique_b_, options.fuzzy_options_));
        for (auto &matched_pair : fuzzy_result.matches_) {
            matched_pair.record_a_.removeField(BibRecord::TEMP_KEY_FIELD);
            matched_pair.record_b_.removeField(BibRecord::TEMP_KEY_FIELD);
            matched_pair.record_a_.setFuzzyMatch(true);
            result.overlap_.emplace_back(matched_pair.record_a_);
        }
        result.fuzzy_pairs_.swap(fuzzy_result.matches_);
        result.unique_a_.swap(fuzzy_result.remaining_a_);
        result.unique_b_.swap(fuzzy_result.remaining_b_);
    }

    RemoveTempKeys(&result.overlap_);
    RemoveTempKeys(&result.unique_a_);
    RemoveTempKeys(&result.unique_b_);

    return result;
}


} // namespace ReferenceComparator
