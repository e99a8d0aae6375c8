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
#include "static_simple/static_settings.h"

#include <boost/algorithm/string/predicate.hpp>

using namespace std;

namespace static_simple {

static_settings::static_settings()
    : m_ignore_extensions( default_ignore_extensions() ),
      m_debug( false ),
      m_logging( false )
{
}

void
static_settings::add_include_path( const string& root )
{
    m_include_path.push_back( root_spec( root ) );
}

void
static_settings::add_include_provider( const root_provider& provider )
{
    m_include_path.push_back( root_spec( provider ) );
}

void
static_settings::add_dir( const string& dir )
{
    m_dirs.push_back( make_dir_spec( dir ) );
}

void
static_settings::add_dir( const boost::regex& re )
{
    m_dirs.push_back( dir_spec( re ) );
}

vector<string>
static_settings::default_ignore_extensions()
{
    vector<string> v;
    v.push_back( "tmpl" );
    v.push_back( "tt" );
    v.push_back( "tt2" );
    v.push_back( "html" );
    v.push_back( "xhtml" );
    return v;
}

dir_spec
make_dir_spec( const string& dir )
{
    if( boost::starts_with( dir, "qr/" ) )
        return dir_spec( dir_pattern( dir ) );
    return dir_spec( dir );
}

}
