/** \file    MatchConfidence.h
 *  \brief   Advisory rating of how likely two records describe the same work.
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
#include "BibRecord.h"


namespace MatchConfidence {


constexpr double DOI_MATCH(1.0);
constexpr double EXACT_TITLE_AND_YEAR_MATCH(0.95);
constexpr double HIGH_SIMILARITY(0.90);
constexpr double GOOD_SIMILARITY(0.85);
constexpr double FAIR_SIMILARITY(0.75);
constexpr double LOW_CONFIDENCE(0.50);


struct Score {
    double confidence_;
    std::string reason_;
public:
    Score(const double confidence, const std::string &reason): confidence_(confidence), reason_(reason) { }
};


/** \brief Rates the pair using the first rule that applies:
 *         1. equal non-empty DOIs (ignoring case and surrounding whitespace): 1.0
 *         2. equal normalised titles and equal non-empty truncated years: 0.95
 *         3. both normalised titles non-empty, equal truncated years and a title similarity of at least
 *            0.95, 0.90 or 0.85: 0.90, 0.85 or 0.75 respectively
 *         4. anything else: 0.50
 *  \note  The reason for rule 3 contains the similarity with two decimals.
 */
Score Calculate(const BibRecord::Record &record_a, const BibRecord::Record &record_b);


} // namespace MatchConfidence
