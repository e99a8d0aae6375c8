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
#include "static_simple/static_request.h"
#include "static_simple/utils/urlencoding.hpp"

#include <boost/algorithm/string.hpp>

using namespace std;

namespace static_simple {

static_request::static_request( const string& uri, const string& method )
    : m_method( boost::to_upper_copy( method ) )
{
    string query;
    size_t pos = uri.find( "?" );
    if( pos != string::npos )
        query = uri.substr( pos + 1 );

    m_path = utils::url_decode( uri.substr( 0, pos ) );
    if( m_path.empty() || m_path[0] != '/' )
        m_path.insert( m_path.begin(), '/' );

    m_env[ "REQUEST_METHOD" ] = m_method;
    m_env[ "PATH_INFO" ] = m_path;
    m_env[ "QUERY_STRING" ] = query;
}

const string
static_request::env( const string& k ) const
{
    map<string,string>::const_iterator it = m_env.find( k );
    if( it == m_env.end() )
        return "";
    return it->second;
}

}
