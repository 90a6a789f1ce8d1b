/** \file    ExactMatcher.h
 *  \brief   Key-based partitioning of two record collections.
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
#include <unordered_set>
#include <vector>
#include "BibRecord.h"


namespace ExactMatcher {


/** Indices into the two collections that were partitioned.  Each list is in the order of its source collection. */
struct Partition {
    std::vector<size_t> overlap_;  // into records_a
    std::vector<size_t> unique_a_; // into records_a
    std::vector<size_t> unique_b_; // into records_b
};


/** \return The match keys of "records", in the same order. */
std::vector<std::string> GenerateKeys(const std::vector<BibRecord::Record> &records);


/** \brief Splits the records by key set membership.
 *
 *  A record of A lands in the overlap if some record of B has the same key and in unique_a otherwise.  A record of B
 *  lands in unique_b if no record of A shares its key.  Records sharing a key on the same side are all kept.  If one
 *  side is empty no keys are computed and the other side is unique in its entirety.
 */
Partition PartitionRecords(const std::vector<BibRecord::Record> &records_a, const std::vector<BibRecord::Record> &records_b);


} // namespace ExactMatcher
