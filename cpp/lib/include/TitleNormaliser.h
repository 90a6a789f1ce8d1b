/** \file    TitleNormaliser.h
 *  \brief   Canonical title forms for keying and similarity comparisons.
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
#include <cstdint>
#include "BibRecord.h"


namespace TitleNormaliser {


/** \brief Lowercases and trims "title", strips one leading "the ", "a " or "an " and drops everything that is not a
 *         letter or a digit.
 *  \return The normalised title as UTF-8.
 *  \note   Idempotent.  Malformed UTF-8 sequences are dropped.
 */
std::string Normalise(const std::string &title);


/** \brief Like Normalise() but returns the code points, as needed by the similarity measures. */
std::vector<uint32_t> NormaliseToUTF32(const std::string &title);


/** \return The normalised title of "record" or the empty string if it has no usable title. */
std::string Normalise(const BibRecord::Record &record);


} // namespace TitleNormaliser
