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
#ifndef __STATIC_SIMPLE_DIR_MATCHER_H__
#define __STATIC_SIMPLE_DIR_MATCHER_H__

#include <string>
#include <vector>

#include "static_simple/types.h"

namespace static_simple {

enum dir_match { dir_no_match, dir_matched, dir_bad_pattern };

/// tests a request path against the "dirs" allow-list
class dir_matcher
{
public:
    explicit dir_matcher( const std::vector<dir_spec>& dirs ) : m_dirs( dirs ) {}

    /// first matching entry wins. dir_bad_pattern means a qr/../ entry
    /// didn't compile, error then holds the reason.
    dir_match matches( const std::string& path, std::string& error ) const;

    /// compile "qr/PATTERN/FLAGS", flags are any of i m s x
    static bool compile_pattern( const std::string& text, boost::regex& re, std::string& error );

private:
    const std::vector<dir_spec>& m_dirs;
};

}

#endif // __STATIC_SIMPLE_DIR_MATCHER_H__
