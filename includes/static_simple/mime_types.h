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
#ifndef __STATIC_SIMPLE_MIME_TYPES_H__
#define __STATIC_SIMPLE_MIME_TYPES_H__

#include <map>
#include <string>

namespace static_simple {

/*
 *  Content-Type for a file: configured overrides first, then the mime
 *  database (built-in table plus a mime.types file), else text/plain.
 */
class mime_types
{
public:
    mime_types( const std::map<std::string, std::string>& overrides,
                const std::string& db_file = default_db_file() );

    std::string content_type( const std::string& full_path ) const;

    /// database lookup only, "" when the extension is unknown
    std::string lookup( const std::string& ext ) const;

    /// read an apache style mime.types file, entries already known are kept.
    /// returns the number of extensions added.
    size_t load( const std::string& filename );

    static std::string default_db_file() { return "/etc/mime.types"; }

private:
    void load_builtin();

    std::map<std::string, std::string> m_overrides;
    std::map<std::string, std::string> m_db;
};

}

#endif // __STATIC_SIMPLE_MIME_TYPES_H__
