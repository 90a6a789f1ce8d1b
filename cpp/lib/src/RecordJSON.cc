/** \file    RecordJSON.cc
 *  \brief   Implementation of the JSON record (de)serialisation.
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
#include "RecordJSON.h"
#include "FileUtil.h"
#include "util.h"


namespace RecordJSON {


namespace {


bool IsStringArray(const nlohmann::json &json) {
    if (not json.is_array())
        return false;

    for (const auto &element : json) {
        if (not element.is_string())
            return false;
    }

    return true;
}


BibRecord::Record ParseRecord(const nlohmann::json &json_object, const size_t record_index) {
    BibRecord::Record record;
    for (const auto &field : json_object.items()) {
        const auto &value(field.value());
        if (value.is_null())
            continue;
        else if (field.key() == FUZZY_MATCH_FIELD) {
            if (value.is_boolean())
                record.setFuzzyMatch(value.get<bool>());
            else
                LOG_WARNING("ignoring non-boolean \"" + FUZZY_MATCH_FIELD + "\" in record #" + std::to_string(record_index));
        } else if (value.is_string())
            record.setField(field.key(), value.get<std::string>());
        else if (value.is_number_integer())
            record.setField(field.key(), value.get<long long>());
        else if (IsStringArray(value))
            record.setField(field.key(), value.get<std::vector<std::string>>());
        else
            LOG_WARNING("dropping field \"" + field.key() + "\" of record #" + std::to_string(record_index)
                        + " with unsupported type " + std::string(value.type_name()));
    }

    return record;
}


} // unnamed namespace


std::vector<BibRecord::Record> ParseRecords(const std::string &json_text) {
    const auto json(nlohmann::json::parse(json_text));
    if (not json.is_array())
        throw BibRecord::InvalidRecordShape("expected a JSON array of records, found " + std::string(json.type_name()) + "!");

    std::vector<BibRecord::Record> records;
    records.reserve(json.size());
    for (const auto &element : json) {
        if (not element.is_object())
            throw BibRecord::InvalidRecordShape("record #" + std::to_string(records.size()) + " is a JSON "
                                                + std::string(element.type_name()) + ", not an object!");
        records.emplace_back(ParseRecord(element, records.size()));
    }

    return records;
}


std::vector<BibRecord::Record> ReadRecordsOrDie(const std::string &path) {
    const std::string json_text(FileUtil::ReadStringOrDie(path));
    try {
        return ParseRecords(json_text);
    } catch (const nlohmann::json::parse_error &x) {
        LOG_ERROR("failed to parse \"" + path + "\": " + std::string(x.what()));
    }
}


nlohmann::json ToJSON(const BibRecord::Record &record) {
    nlohmann::json json_object(nlohmann::json::object());
    for (const auto &field : record) {
        switch (field.second.getType()) {
        case BibRecord::FieldValue::ABSENT:
            json_object[field.first] = nullptr;
            break;
        case BibRecord::FieldValue::STRING:
            json_object[field.first] = field.second.getString();
            break;
        case BibRecord::FieldValue::INTEGER:
            json_object[field.first] = field.second.getInteger();
            break;
        case BibRecord::FieldValue::STRING_LIST:
            json_object[field.first] = field.second.getStringList();
            break;
        }
    }

    if (record.isFuzzyMatch())
        json_object[FUZZY_MATCH_FIELD] = true;

    return json_object;
}


nlohmann::json ToJSON(const std::vector<BibRecord::Record> &records) {
    nlohmann::json json_array(nlohmann::json::array());
    for (const auto &record : records)
        json_array.emplace_back(ToJSON(record));

    return json_array;
}


void WriteRecordsOrDie(const std::string &path, const std::vector<BibRecord::Record> &records) {
    // Invalid UTF-8 in string values is written as U+FFFD.
    FileUtil::WriteStringOrDie(path, ToJSON(records).dump(4, ' ', /* ensure_ascii = */ false,
                                                          nlohmann::json::error_handler_t::replace) + "\n");
}


} // namespace RecordJSON
