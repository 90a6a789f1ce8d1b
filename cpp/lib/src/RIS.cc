/** \file    RIS.cc
 *  \brief   Implementation of the RIS reader and writer.
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
#include "RIS.h"
#include <unordered_map>
#include <unordered_set>
#include <cctype>
#include "FileUtil.h"
#include "StringUtil.h"
#include "TextUtil.h"
#include "util.h"


namespace RIS {


namespace {


const std::unordered_map<std::string, std::string> TAG_TO_FIELD_NAME{
    { "TY", "type_of_reference" },
    { "TI", "title"             },
    { "T1", "primary_title"     },
    { "AU", "authors"           },
    { "A1", "authors"           },
    { "PY", "year"              },
    { "DO", "doi"               },
    { "JO", "journal_name"      },
    { "AB", "abstract"          },
    { "KW", "keywords"          },
};


const std::unordered_set<std::string> LIST_FIELDS{ "authors", "keywords" };


// "XY  - value", "XY  -" is also acceptable.
bool SplitTagLine(const std::string &line, std::string * const tag, std::string * const value) {
    if (line.length() < 5 or not std::isupper(static_cast<unsigned char>(line[0]))
        or not (std::isupper(static_cast<unsigned char>(line[1])) or std::isdigit(static_cast<unsigned char>(line[1])))
        or line.compare(2, 3, "  -") != 0)
        return false;
    if (line.length() > 5 and line[5] != ' ')
        return false;

    *tag = line.substr(0, 2);
    *value = line.length() > 6 ? StringUtil::TrimWhite(line.substr(6)) : "";
    return true;
}


std::string TagToFieldName(const std::string &tag) {
    const auto tag_and_field_name(TAG_TO_FIELD_NAME.find(tag));
    return tag_and_field_name == TAG_TO_FIELD_NAME.cend() ? StringUtil::ToLower(tag) : tag_and_field_name->second;
}


void AddValue(BibRecord::Record * const record, const std::string &field_name, const std::string &value) {
    const BibRecord::FieldValue &existing_value(record->getField(field_name));
    if (existing_value.isStringList()) {
        auto values(existing_value.getStringList());
        values.emplace_back(value);
        record->setField(field_name, values);
    } else if (existing_value.isString())
        record->setField(field_name, std::vector<std::string>{ existing_value.getString(), value });
    else if (LIST_FIELDS.find(field_name) != LIST_FIELDS.cend())
        record->setField(field_name, std::vector<std::string>{ value });
    else
        record->setField(field_name, value);
}


void ContinueValue(BibRecord::Record * const record, const std::string &field_name, const std::string &continuation) {
    const BibRecord::FieldValue &existing_value(record->getField(field_name));
    if (existing_value.isStringList()) {
        auto values(existing_value.getStringList());
        values.back() += " " + continuation;
        record->setField(field_name, values);
    } else
        record->setField(field_name, existing_value.getString() + " " + continuation);
}


} // unnamed namespace


std::vector<BibRecord::Record> ParseRecords(const std::string &ris_text) {
    std::string text(ris_text);
    TextUtil::StripBOM(&text);

    std::vector<std::string> lines;
    StringUtil::Split(text, '\n', &lines, /* suppress_empty_components = */ false);

    std::vector<BibRecord::Record> records;
    BibRecord::Record current_record;
    bool in_record(false);
    std::string last_field_name;
    unsigned line_no(0);
    for (auto line : lines) {
        ++line_no;
        StringUtil::Trim(" \t\r", &line);
        if (line.empty())
            continue;

        std::string tag, value;
        if (not SplitTagLine(line, &tag, &value)) {
            if (in_record and not last_field_name.empty())
                ContinueValue(&current_record, last_field_name, line);
            else
                LOG_WARNING("skipping unexpected line " + std::to_string(line_no) + ": \"" + line + "\"");
            continue;
        }

        if (tag == "TY") {
            if (in_record) {
                LOG_WARNING("missing ER before the TY on line " + std::to_string(line_no));
                records.emplace_back(current_record);
            }
            current_record = BibRecord::Record();
            in_record = true;
            last_field_name.clear();
        } else if (tag == "ER") {
            if (in_record)
                records.emplace_back(current_record);
            else
                LOG_WARNING("ignoring ER without a preceding TY on line " + std::to_string(line_no));
            in_record = false;
            last_field_name.clear();
            continue;
        } else if (not in_record) {
            LOG_WARNING("skipping " + tag + " outside of a record on line " + std::to_string(line_no));
            continue;
        }

        if (value.empty()) {
            last_field_name.clear();
            continue;
        }

        last_field_name = TagToFieldName(tag);
        AddValue(&current_record, last_field_name, value);
    }

    if (in_record) {
        LOG_WARNING("the last record was not terminated with ER");
        records.emplace_back(current_record);
    }

    return records;
}


std::vector<BibRecord::Record> ReadRecordsOrDie(const std::string &path) {
    return ParseRecords(FileUtil::ReadStringOrDie(path));
}


namespace {


// The export uses its own, slightly different alias chains.
const std::vector<std::string> EXPORT_TITLE_FIELDS{ "title", "ti", "primary_title" };
const std::vector<std::string> EXPORT_YEAR_FIELDS{ "year", "py", "y1" };


std::string ToExportString(const BibRecord::FieldValue &value) {
    if (value.isString())
        return value.getString();
    if (value.isInteger())
        return std::to_string(value.getInteger());
    return "";
}


void AppendLine(std::vector<std::string> * const lines, const std::string &tag, const std::string &value) {
    if (not value.empty())
        lines->emplace_back(tag + "  - " + value);
}


} // unnamed namespace


std::string WriteRecords(const std::vector<BibRecord::Record> &records) {
    std::vector<std::string> lines;
    for (const auto &record : records) {
        const std::string type_of_reference(record.getTypeOfReference());
        lines.emplace_back("TY  - " + (type_of_reference.empty() ? DEFAULT_TYPE_OF_REFERENCE : type_of_reference));

        AppendLine(&lines, "TI", ToExportString(record.getFirstNonEmpty(EXPORT_TITLE_FIELDS)));
        for (const auto &author : record.getAuthors())
            AppendLine(&lines, "AU", author);
        AppendLine(&lines, "PY", ToExportString(record.getFirstNonEmpty(EXPORT_YEAR_FIELDS)));
        AppendLine(&lines, "JO", ToExportString(record.getFirstNonEmpty(BibRecord::JOURNAL_FIELDS)));
        AppendLine(&lines, "DO", ToExportString(record.getFirstNonEmpty(BibRecord::DOI_FIELDS)));
        AppendLine(&lines, "AB", ToExportString(record.getFirstNonEmpty(BibRecord::ABSTRACT_FIELDS)));

        lines.emplace_back("ER  - \n");
    }

    return StringUtil::Join(lines, "\n");
}


void WriteRecordsOrDie(const std::string &path, const std::vector<BibRecord::Record> &records) {
    FileUtil::WriteStringOrDie(path, WriteRecords(records));
}


} // namespace RIS
