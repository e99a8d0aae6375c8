/*
    static_simple - static file middleware
    Copyright (C) 2026  The static_simple authors

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/
#ifndef __STATIC_SIMPLE_FILE_SERVER_H__
#define __STATIC_SIMPLE_FILE_SERVER_H__

#include <ctime>
#include <string>
#include <boost/optional.hpp>
#include <boost/filesystem.hpp>

#include "static_simple/mime_types.h"
#include "static_simple/static_response.h"

namespace static_simple {

/// reads files off disk into responses
class file_server
{
public:
    file_server( const mime_types& types, const boost::optional<int>& expires = boost::none )
        : m_types( types ), m_expires( expires ) {}

    /// serve root + path. 403 for ".." segments or unreadable files,
    /// 404 if there is no regular file there.
    static_response serve( const std::string& root, const std::string& path ) const;

    /// serve exactly this file, the fixed 404 if it isn't one
    static_response serve_file( const std::string& full_path ) const;

    /// RFC 1123 date, as used by Last-Modified and Expires
    static std::string http_date( std::time_t t );

private:
    static_response read_file( const boost::filesystem::path& p ) const;

    mime_types m_types;
    boost::optional<int> m_expires;
};

}

#endif // __STATIC_SIMPLE_FILE_SERVER_H__
