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
#include "static_simple/path_classifier.h"
#include "static_simple/dir_matcher.h"

#include <boost/algorithm/string.hpp>
#include <boost/foreach.hpp>

using namespace std;

namespace static_simple {

path_class
path_classifier::classify( const string& path, string& error ) const
{
    if( ignored_extension( path ) || ignored_dir( path ) )
        return path_ignored;

    // no dirs: everything that exists is served, the resolver decides
    if( m_settings.dirs().empty() )
        return path_eligible;

    switch( dir_matcher( m_settings.dirs() ).matches( path, error ) )
    {
        case dir_matched:     return path_eligible;
        case dir_bad_pattern: return path_fault;
        default:              return path_ignored;
    }
}

bool
path_classifier::ignored_extension( const string& path ) const
{
    BOOST_FOREACH( const string& ext, m_settings.ignore_extensions() )
    {
        if( boost::iends_with( path, "." + ext ) )
        {
            log::debug( m_log ) << "Ignoring extension `" << ext << "`";
            return true;
        }
    }
    return false;
}

bool
path_classifier::ignored_dir( const string& path ) const
{
    BOOST_FOREACH( string dir, m_settings.ignore_dirs() )
    {
        if( boost::ends_with( dir, "/" ) || boost::ends_with( dir, "\\" ) )
            dir.erase( dir.length() - 1 );

        if( boost::starts_with( path, "/" + dir + "/" ) ||
            boost::starts_with( path, "/" + dir + "\\" ) )
        {
            log::debug( m_log ) << "Ignoring directory `" << dir << "`";
            return true;
        }
    }
    return false;
}

}
