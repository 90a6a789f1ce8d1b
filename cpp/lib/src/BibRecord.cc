/** \file    BibRecord.cc
 *  \brief   Implementation of the bibliographic record model.
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
#include "BibRecord.h"
#include "util.h"


namespace BibRecord {


const std::vector<std::string> DOI_FIELDS{ "doi", "do" };
const std::vector<std::string> TITLE_FIELDS{ "title", "primary_title", "ti" };
const std::vector<std::string> YEAR_FIELDS{ "year", "py" };
const std::vector<std::string> JOURNAL_FIELDS{ "journal_name", "jo", "t2" };
const std::vector<std::string> ABSTRACT_FIELDS{ "abstract", "ab", "n2" };
const std::vector<std::string> AUTHOR_FIELDS{ "authors", "au" };
const std::vector<std::string> TYPE_OF_REFERENCE_FIELDS{ "type_of_reference" };


bool FieldValue::isEmpty() const {
    switch (type_) {
    case ABSENT:
        return true;
    case STRING:
        return string_value_.empty();
    case INTEGER:
        return integer_value_ == 0;
    case STRING_LIST:
        return string_list_value_.empty();
    }

    return true;
}


bool FieldValue::operator==(const FieldValue &rhs) const {
    if (type_ != rhs.type_)
        return false;

    switch (type_) {
    case ABSENT:
        return true;
    case STRING:
        return string_value_ == rhs.string_value_;
    case INTEGER:
        return integer_value_ == rhs.integer_value_;
    case STRING_LIST:
        return string_list_value_ == rhs.string_list_value_;
    }

    return false;
}


std::string FieldValue::TypeToString(const Type type) {
    switch (type) {
    case ABSENT:
        return "absent";
    case STRING:
        return "string";
    case INTEGER:
        return "integer";
    case STRING_LIST:
        return "string list";
    }

    return "unknown";
}


namespace {


const FieldValue ABSENT_VALUE;


// Strings as-is, integers in decimal.  Anything else is an unsupported field type and treated as missing.
std::string ScalarToString(const FieldValue &value, const std::string &what) {
    if (value.isString())
        return value.getString();
    if (value.isInteger())
        return std::to_string(value.getInteger());
    if (not value.isAbsent())
        LOG_DEBUG("unsupported field type for the " + what + ": " + FieldValue::TypeToString(value.getType()));
    return "";
}


} // unnamed namespace


const FieldValue &Record::getField(const std::string &field_name) const {
    const auto field(fields_.find(field_name));
    return field == fields_.cend() ? ABSENT_VALUE : field->second;
}


bool Record::removeField(const std::string &field_name) {
    return fields_.erase(field_name) > 0;
}


const FieldValue &Record::getFirstNonEmpty(const std::vector<std::string> &alias_chain) const {
    for (const auto &field_name : alias_chain) {
        const FieldValue &value(getField(field_name));
        if (not value.isEmpty())
            return value;
    }

    return ABSENT_VALUE;
}


std::string Record::getTitle() const {
    const FieldValue &title(getFirstNonEmpty(TITLE_FIELDS));
    return title.isString() ? title.getString() : "";
}


std::string Record::getYear() const {
    return ScalarToString(getFirstNonEmpty(YEAR_FIELDS), "year");
}


std::string Record::getDOI() const {
    return ScalarToString(getFirstNonEmpty(DOI_FIELDS), "DOI");
}


std::string Record::getJournal() const {
    return ScalarToString(getFirstNonEmpty(JOURNAL_FIELDS), "journal");
}


std::string Record::getAbstract() const {
    return ScalarToString(getFirstNonEmpty(ABSTRACT_FIELDS), "abstract");
}


std::string Record::getTypeOfReference() const {
    return ScalarToString(getFirstNonEmpty(TYPE_OF_REFERENCE_FIELDS), "reference type");
}


std::vector<std::string> Record::getAuthors() const {
    const FieldValue &authors(getFirstNonEmpty(AUTHOR_FIELDS));
    if (authors.isStringList())
        return authors.getStringList();
    if (authors.isString())
        return { authors.getString() };
    return {};
}


} // namespace BibRecord
