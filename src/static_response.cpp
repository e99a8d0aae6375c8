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
#include "static_simple/static_response.h"

#include <boost/lexical_cast.hpp>

using namespace std;

namespace static_simple {

static_response::static_response( int status, const string& content_type, const string& body )
    : m_status( status ), m_body( body )
{
    add_header( "Content-Type", content_type );
    add_header( "Content-Length", boost::lexical_cast<string>( body.length() ) );
}

string
static_response::header( const string& k ) const
{
    map<string,string>::const_iterator it = m_headers.find( k );
    if( it == m_headers.end() )
        return "";
    return it->second;
}

// text/html, not text/plain, clients have always seen this one
static_response
static_response::not_found()
{
    return static_response( 404, "text/html", "not found" );
}

static_response
static_response::internal_error()
{
    return static_response( 500, "text/plain", "internal server error" );
}

}
