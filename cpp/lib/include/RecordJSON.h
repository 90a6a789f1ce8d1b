/** \file    RecordJSON.h
 *  \brief   JSON (de)serialisation of bibliographic records.
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
#include <nlohmann/json.hpp>
#include "BibRecord.h"


namespace RecordJSON {


const std::string FUZZY_MATCH_FIELD("fuzzy_match");


/** \brief Converts a JSON array of objects into records.
 *
 *  Strings, integers, arrays of strings and null are supported field values, null meaning absent.  Fields of any
 *  other type are dropped with a warning.
 *
 *  \throws BibRecord::InvalidRecordShape if the document is not an array or one of its elements is not an object.
 *  \throws nlohmann::json::parse_error if "json_text" is not valid JSON.
 */
std::vector<BibRecord::Record> ParseRecords(const std::string &json_text);


std::vector<BibRecord::Record> ReadRecordsOrDie(const std::string &path);


nlohmann::json ToJSON(const BibRecord::Record &record);


/** \return An array of objects.  Records flagged as fuzzy matches get "fuzzy_match": true. */
nlohmann::json ToJSON(const std::vector<BibRecord::Record> &records);


void WriteRecordsOrDie(const std::string &path, const std::vector<BibRecord::Record> &records);


} // namespace RecordJSON
