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
#include "static_simple/file_server.h"

#include <fstream>
#include <sstream>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/foreach.hpp>

using namespace std;
namespace fs = boost::filesystem;

namespace static_simple {

namespace {

static_response forbidden()
{
    return static_response( 403, "text/plain", "forbidden" );
}

}

static_response
file_server::serve( const string& root, const string& path ) const
{
    if( path.find( '\0' ) != string::npos )
        return static_response( 400, "text/plain", "Bad Request" );

    vector<string> parts;
    boost::split( parts, path, boost::is_any_of( "/\\" ) );
    if( parts.size() && parts[0] == "" ) parts.erase( parts.begin() );

    // "..", "..." etc. never leave the root
    BOOST_FOREACH( const string& part, parts )
    {
        if( part.length() >= 2 && part.find_first_not_of( '.' ) == string::npos )
            return forbidden();
    }

    string full = boost::trim_right_copy_if( root, boost::is_any_of( "/\\" ) );
    BOOST_FOREACH( const string& part, parts )
    {
        full += "/" + part;
    }

    boost::system::error_code ec;
    if( !fs::is_regular_file( full, ec ) )
        return static_response( 404, "text/plain", "not found" );

    return read_file( full );
}

static_response
file_server::serve_file( const string& full_path ) const
{
    boost::system::error_code ec;
    if( !fs::is_regular_file( full_path, ec ) )
        return static_response::not_found();

    return read_file( full_path );
}

static_response
file_server::read_file( const fs::path& p ) const
{
    ifstream ifs( p.string().c_str(), ios::in | ios::binary );
    if( !ifs.is_open() )
        return forbidden();

    ostringstream os;
    os << ifs.rdbuf();

    string type = m_types.content_type( p.string() );
    if( boost::starts_with( type, "text/" ) )
        type += "; charset=utf-8";

    static_response rep( 200, type, os.str() );

    boost::system::error_code ec;
    time_t mtime = fs::last_write_time( p, ec );
    if( !ec )
        rep.add_header( "Last-Modified", http_date( mtime ) );

    if( m_expires )
        rep.add_header( "Expires", http_date( time( 0 ) + *m_expires ) );

    return rep;
}

string
file_server::http_date( time_t t )
{
    tm gmt = boost::posix_time::to_tm( boost::posix_time::from_time_t( t ) );
    char buf[64];
    strftime( buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &gmt );
    return buf;
}

}
