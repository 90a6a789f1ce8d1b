/** \file    MatchKey.h
 *  \brief   Exact-match keys for bibliographic records.
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


namespace MatchKey {


const std::string DOI_KEY_PREFIX("DOI:");
const std::string TITLE_KEY_PREFIX("TY:");
const std::string NO_YEAR_PREFIX("NOYEAR_");


/** \return "doi" trimmed and lowercased with malformed UTF-8 dropped, the empty string if nothing but whitespace is
 *          left.
 */
std::string NormaliseDOI(const std::string &doi);


/** \return The first four code points of the record's year, or the empty string if it has none. */
std::string TruncatedYear(const BibRecord::Record &record);


/** \brief Derives the key under which "record" takes part in exact matching.
 *
 *  A record with a DOI is keyed as "DOI:" followed by the normalised DOI.  All others get
 *  "TY:" + normalised title + "_" + the first four characters of the year.  If there is no year we use
 *  "NOYEAR_" followed by the length of the normalised title instead, so that two year-less records with the same
 *  title only collide if their normalised titles have the same length.
 *
 *  \note The returned key is never empty.
 */
std::string Generate(const BibRecord::Record &record);


} // namespace MatchKey
