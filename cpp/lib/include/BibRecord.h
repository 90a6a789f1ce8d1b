/** \file    BibRecord.h
 *  \brief   The in-memory representation of a bibliographic reference.
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


#include <initializer_list>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>


namespace BibRecord {


/** Thrown when something that should be a record is not a field-name to value mapping. */
class InvalidRecordShape : public std::runtime_error {
public:
    explicit InvalidRecordShape(const std::string &message): std::runtime_error(message) { }
};


// Ordered alias chains.  The first field with a non-empty value wins.
extern const std::vector<std::string> DOI_FIELDS;
extern const std::vector<std::string> TITLE_FIELDS;
extern const std::vector<std::string> YEAR_FIELDS;
extern const std::vector<std::string> JOURNAL_FIELDS;
extern const std::vector<std::string> ABSTRACT_FIELDS;
extern const std::vector<std::string> AUTHOR_FIELDS;
extern const std::vector<std::string> TYPE_OF_REFERENCE_FIELDS;


// Reserved for comparator-internal keys, never part of an output record.
const std::string TEMP_KEY_FIELD("temp_key");


class FieldValue {
public:
    enum Type { ABSENT, STRING, INTEGER, STRING_LIST };
private:
    Type type_;
    std::string string_value_;
    long long integer_value_;
    std::vector<std::string> string_list_value_;
public:
    FieldValue(): type_(ABSENT), integer_value_(0) { }
    FieldValue(const std::string &string_value): type_(STRING), string_value_(string_value), integer_value_(0) { }
    FieldValue(const char * const string_value): FieldValue(std::string(string_value)) { }
    FieldValue(const long long integer_value): type_(INTEGER), integer_value_(integer_value) { }
    FieldValue(const int integer_value): FieldValue(static_cast<long long>(integer_value)) { }
    FieldValue(const std::vector<std::string> &string_list_value)
        : type_(STRING_LIST), integer_value_(0), string_list_value_(string_list_value) { }

    inline Type getType() const { return type_; }
    inline bool isAbsent() const { return type_ == ABSENT; }
    inline bool isString() const { return type_ == STRING; }
    inline bool isInteger() const { return type_ == INTEGER; }
    inline bool isStringList() const { return type_ == STRING_LIST; }

    /** \return True for an absent value, an empty string, zero or an empty list. */
    bool isEmpty() const;

    inline const std::string &getString() const { return string_value_; }
    inline long long getInteger() const { return integer_value_; }
    inline const std::vector<std::string> &getStringList() const { return string_list_value_; }

    bool operator==(const FieldValue &rhs) const;
    inline bool operator!=(const FieldValue &rhs) const { return not operator==(rhs); }

    static std::string TypeToString(const Type type);
};


class Record {
    std::map<std::string, FieldValue> fields_;
    bool is_fuzzy_match_;
public:
    typedef std::map<std::string, FieldValue>::const_iterator const_iterator;
public:
    Record(): is_fuzzy_match_(false) { }
    Record(std::initializer_list<std::pair<const std::string, FieldValue>> fields): fields_(fields), is_fuzzy_match_(false) { }

    inline const_iterator begin() const { return fields_.cbegin(); }
    inline const_iterator end() const { return fields_.cend(); }
    inline size_t size() const { return fields_.size(); }
    inline bool empty() const { return fields_.empty(); }

    inline bool hasField(const std::string &field_name) const { return fields_.find(field_name) != fields_.cend(); }

    /** \return The value of "field_name" or an absent value if there is no such field. */
    const FieldValue &getField(const std::string &field_name) const;

    inline void setField(const std::string &field_name, const FieldValue &value) { fields_[field_name] = value; }

    /** \return True if the field existed, else false. */
    bool removeField(const std::string &field_name);

    /** \return The value of the first field in "alias_chain" that is not empty, or an absent value. */
    const FieldValue &getFirstNonEmpty(const std::vector<std::string> &alias_chain) const;

    /** \return The title, or the empty string if it is missing or not a string. */
    std::string getTitle() const;

    /** \return The year, integers converted to their decimal representation, or the empty string. */
    std::string getYear() const;

    /** \return The DOI exactly as stored, integers converted to their decimal representation, or the empty string. */
    std::string getDOI() const;

    std::string getJournal() const;
    std::string getAbstract() const;
    std::string getTypeOfReference() const;

    /** \note A single author stored as a string is returned as a one-element list. */
    std::vector<std::string> getAuthors() const;

    inline bool isFuzzyMatch() const { return is_fuzzy_match_; }
    inline void setFuzzyMatch(const bool is_fuzzy_match) { is_fuzzy_match_ = is_fuzzy_match; }

    bool operator==(const Record &rhs) const { return is_fuzzy_match_ == rhs.is_fuzzy_match_ and fields_ == rhs.fields_; }
    inline bool operator!=(const Record &rhs) const { return not operator==(rhs); }
};


} // namespace BibRecord
