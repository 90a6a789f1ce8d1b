/** \file    FuzzyMatcher.cc
 *  \brief   Implementation of the fuzzy residual matching pass.
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
#include "FuzzyMatcher.h"
#include <cmath>
#include <cstdint>
#include "MatchConfidence.h"
#include "MatchKey.h"
#include "SequenceMatcher.h"
#include "StringUtil.h"
#include "TitleNormaliser.h"
#include "util.h"


namespace FuzzyMatcher {


namespace {


// What we need to know about a record in order to compare it, computed once per record.
struct Candidate {
    bool has_title_;
    std::vector<uint32_t> normalised_title_;
    std::string truncated_year_;
public:
    explicit Candidate(const BibRecord::Record &record)
        : has_title_(not record.getFirstNonEmpty(BibRecord::TITLE_FIELDS).isEmpty()),
          normalised_title_(TitleNormaliser::NormaliseToUTF32(record.getTitle())), truncated_year_(MatchKey::TruncatedYear(record)) { }
    inline bool isComparable() const { return has_title_ and not normalised_title_.empty(); }
};


std::vector<Candidate> GetCandidates(const std::vector<BibRecord::Record> &records) {
    std::vector<Candidate> candidates;
    candidates.reserve(records.size());
    for (const auto &record : records)
        candidates.emplace_back(record);

    return candidates;
}


} // unnamed namespace


bool IsValidThreshold(const double threshold) {
    return not std::isnan(threshold) and threshold >= 0.0 and threshold <= 1.0;
}


Result Match(const std::vector<BibRecord::Record> &unique_a, const std::vector<BibRecord::Record> &unique_b, const Options &options) {
    const auto candidates_a(GetCandidates(unique_a));
    const auto candidates_b(GetCandidates(unique_b));
    std::vector<bool> matched_a(unique_a.size(), false), matched_b(unique_b.size(), false);

    Result result;
    for (size_t i(0); i < unique_a.size() and not result.comparison_limit_reached_; ++i) {
        const Candidate &candidate_a(candidates_a[i]);
        if (not candidate_a.isComparable())
            continue;

        for (size_t j(0); j < unique_b.size(); ++j) {
            const Candidate &candidate_b(candidates_b[j]);
            if (matched_b[j] or not candidate_b.isComparable() or candidate_a.truncated_year_ != candidate_b.truncated_year_)
                continue;

            if (options.max_comparisons_ != 0 and result.comparison_count_ == options.max_comparisons_) {
                LOG_WARNING("stopped after " + std::to_string(result.comparison_count_)
                            + " title comparisons, the remaining records stay unmatched");
                result.comparison_limit_reached_ = true;
                break;
            }

            ++result.comparison_count_;
            const double similarity(SequenceMatcher::Ratio(candidate_a.normalised_title_, candidate_b.normalised_title_));
            if (similarity >= options.threshold_) {
                matched_a[i] = true;
                matched_b[j] = true;
                const auto score(MatchConfidence::Calculate(unique_a[i], unique_b[j]));
                result.matches_.emplace_back(unique_a[i], unique_b[j], score.confidence_, score.reason_, /* is_fuzzy = */ true);
                LOG_DEBUG("fuzzy match (" + StringUtil::ToString(similarity) + "): \"" + unique_a[i].getTitle() + "\" and \""
                          + unique_b[j].getTitle() + "\"");
                break;
            }
        }
    }

    for (size_t i(0); i < unique_a.size(); ++i) {
        if (not matched_a[i])
            result.remaining_a_.emplace_back(unique_a[i]);
    }
    for (size_t j(0); j < unique_b.size(); ++j) {
        if (not matched_b[j])
            result.remaining_b_.emplace_back(unique_b[j]);
    }

    return result;
}


bool TitlesAreSimilar(const std::string &title1, const std::string &title2) {
    const auto normalised_title1(TitleNormaliser::NormaliseToUTF32(title1));
    const auto normalised_title2(TitleNormaliser::NormaliseToUTF32(title2));
    if (normalised_title1 == normalised_title2)
        return true;

    return SequenceMatcher::Ratio(normalised_title1, normalised_title2) > 0.9;
}


} // namespace FuzzyMatcher
