/** \file    RIS.h
 *  \brief   Reading and writing references in the RIS tagged format.
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
#include "BibRecord.h"


namespace RIS {


const std::string DEFAULT_TYPE_OF_REFERENCE("JOUR");


/** \brief Parses RIS text into records.
 *
 *  Lines look like "TY  - JOUR".  TY starts a record and ER ends it.  Well-known tags are stored under descriptive
 *  field names (TY type_of_reference, TI title, T1 primary_title, AU and A1 authors, PY year, DO doi, JO journal_name,
 *  AB abstract, KW keywords), all other tags under their lowercase name.  Authors and keywords are always lists, other
 *  repeated tags turn into lists.  A line without a tag continues the previous value.
 *
 *  \note Never fails: lines we can't make sense of are logged and skipped and an unterminated last record is kept.
 */
std::vector<BibRecord::Record> ParseRecords(const std::string &ris_text);


std::vector<BibRecord::Record> ReadRecordsOrDie(const std::string &path);


/** \brief Serialises "records" as RIS.
 *  \note  Only the reference type, title, authors, year, journal, DOI and abstract are written.  Records without a
 *         reference type are written as JOUR.
 */
std::string WriteRecords(const std::vector<BibRecord::Record> &records);


void WriteRecordsOrDie(const std::string &path, const std::vector<BibRecord::Record> &records);


} // namespace RIS
