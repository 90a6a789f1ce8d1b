/** \file    FileUtil.cc
 *  \brief   Implementation of file related utility classes and functions.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Dr. Gordon W. Paynter
 */

/*
 *  Copyright 2002-2008 Project iVia.
 *  Copyright 2002-2008 The Regents of The University of California.
 *  Copyright 2015-2021 Universitätsbibliothek Tübingen.  All rights reserved.
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
#include "FileUtil.h"
#include <fstream>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sys/stat.h>
#include "StringUtil.h"
#include "util.h"


namespace FileUtil {


AutoTempFile::AutoTempFile(const std::string &path_prefix, const std::string &path_suffix, bool automatically_remove)
    : automatically_remove_(automatically_remove)
{
    std::string path_template(path_prefix + "XXXXXX" + path_suffix);
    const int fd(::mkstemps(const_cast<char *>(path_template.c_str()), static_cast<int>(path_suffix.length())));
    if (fd == -1)
        LOG_ERROR("mkstemps(3) for path prefix \"" + path_prefix + "\" failed!");

    ::close(fd);
    path_ = path_template;
}


off_t GetFileSize(const std::string &path) {
    struct stat stat_buf;
    if (::stat(path.c_str(), &stat_buf) == -1)
        return -1;

    return stat_buf.st_size;
}


bool WriteString(const std::string &path, const std::string &data) {
    std::ofstream output(path, std::ios_base::out | std::ios_base::binary | std::ios_base::trunc);
    if (output.fail())
        return false;

    output.write(data.data(), data.size());
    return not output.bad();
}


void WriteStringOrDie(const std::string &path, const std::string &data) {
    if (not FileUtil::WriteString(path, data))
        LOG_ERROR("failed to write data to \"" + path + "\"!");
}


bool ReadString(const std::string &path, std::string * const data) {
    std::ifstream input(path, std::ios_base::in | std::ios_base::binary);
    if (input.fail())
        return false;

    const off_t file_size(GetFileSize(path));
    if (unlikely(file_size < 0))
        return false;
    data->resize(static_cast<size_t>(file_size));
    input.read(&(*data)[0], file_size);
    return not input.bad();
}


std::string ReadStringOrDie(const std::string &path) {
    std::string data;
    if (not FileUtil::ReadString(path, &data))
        LOG_ERROR("failed to read \"" + path + "\"!");
    return data;
}


bool Exists(const std::string &path, std::string * const error_message) {
    struct stat stat_buf;
    if (::stat(path.c_str(), &stat_buf) == 0)
        return true;

    if (error_message != nullptr)
        *error_message = "can't stat(2) \"" + path + "\": " + std::string(std::strerror(errno));
    errno = 0;
    return false;
}


std::string GetExtension(const std::string &filename, const bool to_lowercase) {
    const std::string::size_type last_dot_pos(filename.rfind('.'));
    if (last_dot_pos == std::string::npos)
        return "";

    // A dot inside a directory name is no extension.
    const std::string::size_type last_slash_pos(filename.rfind('/'));
    if (last_slash_pos != std::string::npos and last_slash_pos > last_dot_pos)
        return "";

    const std::string extension(filename.substr(last_dot_pos + 1));
    return to_lowercase ? StringUtil::ToLower(extension) : extension;
}


} // namespace FileUtil
