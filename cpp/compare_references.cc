/** \brief Tool for finding the references that two bibliographies have in common.
 *
 *  \copyright 2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#include <iostream>
#include <cstdlib>
#include <cstring>
#include "FileUtil.h"
#include "IniFile.h"
#include "RIS.h"
#include "RecordJSON.h"
#include "ReferenceComparator.h"
#include "StringUtil.h"
#include "util.h"


namespace {


[[noreturn]] void Usage() {
    ::Usage("[--config-file=path] [--no-fuzzy] [--fuzzy-threshold=ratio] [--list-fuzzy-matches]\n"
            "references_a references_b [overlap_output unique_a_output unique_b_output]\n"
            "Files ending in .json are read and written as JSON, everything else as RIS.\n"
            "Settings from the [Matching] section of the config file are overridden by the flags.");
}


void LoadConfig(const std::string &config_filename, ReferenceComparator::Options * const options) {
    const IniFile ini_file(config_filename);
    const IniFile::Section * const section(ini_file.getSection("Matching"));
    if (section == nullptr) {
        LOG_WARNING("no [Matching] section in \"" + config_filename + "\", using the defaults");
        return;
    }

    options->use_fuzzy_ = section->getBool("use_fuzzy", options->use_fuzzy_);
    options->fuzzy_options_.threshold_ = section->getDouble("fuzzy_threshold", options->fuzzy_options_.threshold_);
    if (not FuzzyMatcher::IsValidThreshold(options->fuzzy_options_.threshold_))
        LOG_ERROR("fuzzy_threshold in \"" + config_filename + "\" must be a number between 0 and 1!");
    options->fuzzy_options_.max_comparisons_ = section->getUnsigned("max_fuzzy_comparisons", options->fuzzy_options_.max_comparisons_);
}


double ParseThreshold(const std::string &threshold_candidate) {
    double threshold;
    if (not StringUtil::ToDouble(threshold_candidate, &threshold) or not FuzzyMatcher::IsValidThreshold(threshold))
        LOG_ERROR("fuzzy threshold must be a number between 0 and 1, found \"" + threshold_candidate + "\"!");
    return threshold;
}


inline bool IsJSONFilename(const std::string &filename) {
    return FileUtil::GetExtension(filename, /* to_lowercase = */ true) == "json";
}


std::vector<BibRecord::Record> LoadReferences(const std::string &filename) {
    const auto records(IsJSONFilename(filename) ? RecordJSON::ReadRecordsOrDie(filename) : RIS::ReadRecordsOrDie(filename));
    LOG_INFO("loaded " + std::to_string(records.size()) + " references from \"" + filename + "\".");
    return records;
}


void WriteReferences(const std::string &filename, const std::vector<BibRecord::Record> &records) {
    if (IsJSONFilename(filename))
        RecordJSON::WriteRecordsOrDie(filename, records);
    else
        RIS::WriteRecordsOrDie(filename, records);
    LOG_INFO("wrote " + std::to_string(records.size()) + " references to \"" + filename + "\".");
}


void PrintStats(const ReferenceComparator::ComparisonStats &stats) {
    std::cout << "overlap_count: " << stats.overlap_count_ << '\n'
              << "unique_a_count: " << stats.unique_a_count_ << '\n'
              << "unique_b_count: " << stats.unique_b_count_ << '\n'
              << "total_a: " << stats.total_a_ << '\n'
              << "total_b: " << stats.total_b_ << '\n'
              << "fuzzy_match_count: " << stats.fuzzy_match_count_ << '\n';
}


void PrintFuzzyMatches(const std::vector<FuzzyMatcher::MatchedPair> &fuzzy_pairs) {
    for (const auto &fuzzy_pair : fuzzy_pairs)
        std::cout << StringUtil::ToString(fuzzy_pair.confidence_, 2) << '\t' << fuzzy_pair.reason_ << '\t'
                  << fuzzy_pair.record_a_.getTitle() << '\t' << fuzzy_pair.record_b_.getTitle() << '\n';
}


} // unnamed namespace


int Main(int argc, char *argv[]) {
    if (argc < 3)
        Usage();

    ReferenceComparator::Options options;
    if (StringUtil::StartsWith(argv[1], "--config-file=")) {
        LoadConfig(argv[1] + __builtin_strlen("--config-file="), &options);
        --argc, ++argv;
    }

    bool list_fuzzy_matches(false);
    while (argc > 1 and StringUtil::StartsWith(argv[1], "--")) {
        if (std::strcmp(argv[1], "--no-fuzzy") == 0)
            options.use_fuzzy_ = false;
        else if (StringUtil::StartsWith(argv[1], "--fuzzy-threshold="))
            options.fuzzy_options_.threshold_ = ParseThreshold(argv[1] + __builtin_strlen("--fuzzy-threshold="));
        else if (std::strcmp(argv[1], "--list-fuzzy-matches") == 0)
            list_fuzzy_matches = true;
        else
            Usage();
        --argc, ++argv;
    }

    if (argc != 3 and argc != 6)
        Usage();

    const auto references_a(LoadReferences(argv[1]));
    const auto references_b(LoadReferences(argv[2]));

    const auto result(ReferenceComparator::Compare(references_a, references_b, options));
    const ReferenceComparator::ComparisonStats stats(result, references_a.size(), references_b.size());
    PrintStats(stats);
    if (list_fuzzy_matches)
        PrintFuzzyMatches(result.fuzzy_pairs_);

    if (argc == 6) {
        WriteReferences(argv[3], result.overlap_);
        WriteReferences(argv[4], result.unique_a_);
        WriteReferences(argv[5], result.unique_b_);
    }

    return EXIT_SUCCESS;
}
