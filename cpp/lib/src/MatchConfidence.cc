/** \file    MatchConfidence.cc
 *  \brief   Implementation of the match confidence rating.
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
#include "MatchConfidence.h"
#include <iomanip>
#include <sstream>
#include "MatchKey.h"
#include "SequenceMatcher.h"
#include "TitleNormaliser.h"


namespace MatchConfidence {


namespace {


std::string SimilarityReason(const std::string &label, const double similarity) {
    std::ostringstream reason;
    reason << label << " similarity (" << std::fixed << std::setprecision(2) << similarity << ')';
    return reason.str();
}


} // unnamed namespace


Score Calculate(const BibRecord::Record &record_a, const BibRecord::Record &record_b) {
    const std::string doi_a(MatchKey::NormaliseDOI(record_a.getDOI()));
    const std::string doi_b(MatchKey::NormaliseDOI(record_b.getDOI()));
    // Two blank DOIs are not a DOI match, they fall through to the title rules.
    if (not doi_a.empty() and doi_a == doi_b)
        return Score(DOI_MATCH, "DOI match");

    const auto title_a(TitleNormaliser::NormaliseToUTF32(record_a.getTitle()));
    const auto title_b(TitleNormaliser::NormaliseToUTF32(record_b.getTitle()));
    const std::string year_a(MatchKey::TruncatedYear(record_a));
    const std::string year_b(MatchKey::TruncatedYear(record_b));
    const bool years_are_equal(year_a == year_b);

    if (title_a == title_b and years_are_equal and not year_a.empty())
        return Score(EXACT_TITLE_AND_YEAR_MATCH, "exact title+year match");

    if (not title_a.empty() and not title_b.empty() and years_are_equal) {
        const double similarity(SequenceMatcher::Ratio(title_a, title_b));
        if (similarity >= 0.95)
            return Score(HIGH_SIMILARITY, SimilarityReason("High", similarity));
        if (similarity >= 0.90)
            return Score(GOOD_SIMILARITY, SimilarityReason("Good", similarity));
        if (similarity >= 0.85)
            return Score(FAIR_SIMILARITY, SimilarityReason("Fair", similarity));
    }

    return Score(LOW_CONFIDENCE, "low confidence match");
}


} // namespace MatchConfidence
