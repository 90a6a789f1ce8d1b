/** \file    IniFile.h
 *  \brief   Declarations for an initialisation file parsing class.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Artur Kedzierski
 *  \author  Dr. Gordon W. Paynter
 */

/*
 *  Copyright 2002-2008 Project iVia.
 *  Copyright 2002-2008 The Regents of The University of California.
 *  Copyright 2015-2021 Universitätsbibliothek Tübingen
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as
 *  published by the Free Software Foundation; either version 2 of the License,
 *  or (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software Foundation, Inc.,
 *  59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */
#pragma once


#include <algorithm>
#include <string>
#include <vector>


/** \class  IniFile
 *  \brief  Reads "name = value" settings grouped into "[Section]"s.
 *
 *  Lines ending in a backslash are continued on the next line, "#" starts a comment unless it is escaped or inside
 *  a double-quoted value.  Settings before the first section header land in the unnamed global section.
 */
class IniFile {
public:
    struct Entry {
        std::string name_, value_, comment_;
    public:
        Entry(const std::string &name, const std::string &value, const std::string &comment)
            : name_(name), value_(value), comment_(comment) { }
    };

    class Section {
        friend class IniFile;
        std::string section_name_;
        std::vector<Entry> entries_;
    public:
        typedef std::vector<Entry>::const_iterator const_iterator;
    public:
        explicit Section(const std::string &section_name): section_name_(section_name) { }

        inline bool operator==(const std::string &section_name) const { return section_name == section_name_; }
        inline const std::string &getSectionName() const { return section_name_; }
        inline const_iterator begin() const { return entries_.cbegin(); }
        inline const_iterator end() const { return entries_.cend(); }
        inline size_t size() const { return entries_.size(); }

        /** \note Aborts if "variable_name" already exists in this section. */
        void insert(const std::string &variable_name, const std::string &value, const std::string &comment = "");

        bool lookup(const std::string &variable_name, std::string * const s) const;

        /** \note Aborts if the variable is not defined. */
        std::string getString(const std::string &variable_name) const;
        std::string getString(const std::string &variable_name, const std::string &default_value) const;

        /** \note Aborts if the variable is defined but cannot be converted to a double. */
        double getDouble(const std::string &variable_name, const double default_value) const;

        /** \note Aborts if the variable is defined but cannot be converted to an unsigned. */
        unsigned getUnsigned(const std::string &variable_name, const unsigned default_value) const;

        /** \brief   Retrieves a boolean value.
         *  \param   variable_name  The name of the section entry to read.
         *  \param   default_value  A default to return if the variable is not defined.
         *  \note    The expected values are case insensitive and can be any of "true", "yes", "on", "false", "no" or
         *           "off".  Any other value is fatal.
         */
        bool getBool(const std::string &variable_name, const bool default_value) const;

        // \return An iterator referencing the found entry or end() if no matching entry was found.
        inline const_iterator find(const std::string &variable_name) const {
            return std::find_if(entries_.cbegin(), entries_.cend(),
                                [&variable_name](const Entry &entry) { return entry.name_ == variable_name; });
        }

        inline bool hasEntry(const std::string &variable_name) const { return find(variable_name) != end(); }
    };

    typedef std::vector<Section> Sections;
    typedef Sections::const_iterator const_iterator;
protected:
    Sections sections_;
    std::string ini_file_name_;
    unsigned current_lineno_;
public:
    /** \brief  Construct an IniFile based on the named file.
     *  \throws std::runtime_error if the file can't be read or is malformed.
     */
    explicit IniFile(const std::string &ini_file_name);

    inline const_iterator begin() const { return sections_.cbegin(); }
    inline const_iterator end() const { return sections_.cend(); }

    std::string getFilename() const { return ini_file_name_; }

    bool sectionIsDefined(const std::string &section_name) const;

    /** \return The named section or nullptr if it does not exist. */
    const Section *getSection(const std::string &section_name) const;

    std::vector<std::string> getSections() const;

    bool lookup(const std::string &section_name, const std::string &variable_name, std::string * const s) const;

    std::string getString(const std::string &section_name, const std::string &variable_name, const std::string &default_value) const;
    double getDouble(const std::string &section_name, const std::string &variable_name, const double default_value) const;
    unsigned getUnsigned(const std::string &section_name, const std::string &variable_name, const unsigned default_value) const;
    bool getBool(const std::string &section_name, const std::string &variable_name, const bool default_value) const;
private:
    void processFile(const std::string &filename);
    void processSectionHeader(const std::string &line);
    void processSectionEntry(const std::string &line, const std::string &comment);
};
