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
#ifndef __STATIC_SIMPLE_SETTINGS_H__
#define __STATIC_SIMPLE_SETTINGS_H__

#include <map>
#include <string>
#include <vector>
#include <boost/optional.hpp>

#include "static_simple/types.h"

namespace static_simple {

/*
 *  Everything the middleware is configured with. Filled in once at
 *  setup, then handed out as a settings_ptr (pointer to const) and
 *  shared by all requests.
 */
class static_settings
{
public:
    static_settings();

    const std::vector<root_spec>& include_path() const { return m_include_path; }
    void add_include_path( const std::string& root );
    void add_include_provider( const root_provider& provider );
    void clear_include_path() { m_include_path.clear(); }

    const std::vector<dir_spec>& dirs() const { return m_dirs; }
    /// strings starting with "qr/" are patterns, anything else a directory
    void add_dir( const std::string& dir );
    void add_dir( const boost::regex& re );

    const std::vector<std::string>& ignore_extensions() const { return m_ignore_extensions; }
    void set_ignore_extensions( const std::vector<std::string>& exts ) { m_ignore_extensions = exts; }

    const std::vector<std::string>& ignore_dirs() const { return m_ignore_dirs; }
    void set_ignore_dirs( const std::vector<std::string>& dirs ) { m_ignore_dirs = dirs; }

    const std::map<std::string, std::string>& mime_types() const { return m_mime_types; }
    void add_mime_type( const std::string& ext, const std::string& type ) { m_mime_types[ext] = type; }

    bool debug() const { return m_debug; }
    void set_debug( bool d ) { m_debug = d; }

    bool logging() const { return m_logging; }
    void set_logging( bool l ) { m_logging = l; }

    const boost::optional<int>& expires() const { return m_expires; }
    void set_expires( int seconds ) { m_expires = seconds; }

    /// tmpl tt tt2 html xhtml
    static std::vector<std::string> default_ignore_extensions();

private:
    std::vector<root_spec>      m_include_path;
    std::vector<dir_spec>       m_dirs;
    std::vector<std::string>    m_ignore_extensions;
    std::vector<std::string>    m_ignore_dirs;
    std::map<std::string, std::string> m_mime_types;
    bool                        m_debug;
    bool                        m_logging;
    boost::optional<int>        m_expires;
};

dir_spec make_dir_spec( const std::string& dir );

}

#endif // __STATIC_SIMPLE_SETTINGS_H__
