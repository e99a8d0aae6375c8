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
#ifndef __STATIC_SIMPLE_TYPES_H__
#define __STATIC_SIMPLE_TYPES_H__

#include <map>
#include <string>
#include <vector>

#include <boost/function.hpp>
#include <boost/regex.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/variant.hpp>

namespace static_simple {

class static_request;
class static_response;
class static_settings;

typedef boost::shared_ptr<const static_settings> settings_ptr;

/// The wrapped application, gets every request we don't answer ourselves:
typedef boost::function< static_response (const static_request&) > fallback_handler;

/// Computes search roots at request time. Throws to report a failure.
typedef boost::function< std::vector<std::string> (const static_request&) > root_provider;

typedef std::map< std::string, root_provider > provider_map;

/// include_path entry: a literal directory or a provider
typedef boost::variant< std::string, root_provider > root_spec;

/// a textual qr/.../ pattern from the config, compiled when used
struct dir_pattern
{
    dir_pattern() {}
    explicit dir_pattern(const std::string& t) : text(t) {}

    std::string text;
};

/// dirs entry: literal directory name, textual pattern or compiled regex
typedef boost::variant< std::string, dir_pattern, boost::regex > dir_spec;

}

#endif // __STATIC_SIMPLE_TYPES_H__
