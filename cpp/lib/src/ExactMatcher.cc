/** \file    ExactMatcher.cc
 *  \brief   Implementation of the key-based record partitioning.
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
#include "ExactMatcher.h"
#include "MatchKey.h"


namespace ExactMatcher {


std::vector<std::string> GenerateKeys(const std::vector<BibRecord::Record> &records) {
    std::vector<std::string> keys;
    keys.reserve(records.size());
    for (const auto &record : records)
        keys.emplace_back(MatchKey::Generate(record));

    return keys;
}


namespace {


std::vector<size_t> AllIndices(const size_t count) {
    std::vector<size_t> indices;
    indices.reserve(count);
    for (size_t index(0); index < count; ++index)
        indices.emplace_back(index);

    return indices;
}


} // unnamed namespace


Partition PartitionRecords(const std::vector<BibRecord::Record> &records_a, const std::vector<BibRecord::Record> &records_b) {
    Partition partition;
    if (records_a.empty()) {
        partition.unique_b_ = AllIndices(records_b.size());
        return partition;
    }
    if (records_b.empty()) {
        partition.unique_a_ = AllIndices(records_a.size());
        return partition;
    }

    const auto keys_a(GenerateKeys(records_a));
    const auto keys_b(GenerateKeys(records_b));
    const std::unordered_set<std::string> key_set_a(keys_a.cbegin(), keys_a.cend());
    const std::unordered_set<std::string> key_set_b(keys_b.cbegin(), keys_b.cend());

    for (size_t index(0); index < keys_a.size(); ++index) {
        if (key_set_b.find(keys_a[index]) != key_set_b.cend())
            partition.overlap_.emplace_back(index);
        else
            partition.unique_a_.emplace_back(index);
    }

    for (size_t index(0); index < keys_b.size(); ++index) {
        if (key_set_a.find(keys_b[index]) == key_set_a.cend())
            partition.unique_b_.emplace_back(index);
    }

    return partition;
}


} // namespace ExactMatcher
