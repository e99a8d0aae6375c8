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
#include "static_simple/dir_matcher.h"

#include <boost/algorithm/string.hpp>
#include <boost/foreach.hpp>

using namespace std;

namespace static_simple {

namespace {

class dir_visitor : public boost::static_visitor<dir_match>
{
public:
    dir_visitor( const string& path, string& error )
        : m_path( path ), m_error( error ) {}

    // plain directory name, anchored: "dir/" must prefix the path
    dir_match operator()( const string& dir ) const
    {
        string d = dir;
        if( boost::ends_with( d, "/" ) ) d.erase( d.length() - 1 );
        return boost::starts_with( m_path, d + "/" ) ? dir_matched : dir_no_match;
    }

    dir_match operator()( const boost::regex& re ) const
    {
        return boost::regex_search( m_path, re ) ? dir_matched : dir_no_match;
    }

    dir_match operator()( const dir_pattern& p ) const
    {
        boost::regex re;
        if( !dir_matcher::compile_pattern( p.text, re, m_error ) )
            return dir_bad_pattern;
        return (*this)( re );
    }

private:
    const string& m_path;
    string& m_error;
};

}

dir_match
dir_matcher::matches( const string& path, string& error ) const
{
    string p = path;
    if( boost::starts_with( p, "/" ) ) p.erase( 0, 1 );

    dir_visitor v( p, error );
    BOOST_FOREACH( const dir_spec& d, m_dirs )
    {
        dir_match m = boost::apply_visitor( v, d );
        if( m != dir_no_match ) return m;
    }
    return dir_no_match;
}

bool
dir_matcher::compile_pattern( const string& text, boost::regex& re, string& error )
{
    const string prefix = "Error compiling static dir regex '" + text + "': ";

    size_t close = text.rfind( '/' );
    if( !boost::starts_with( text, "qr/" ) || close < 3 )
    {
        error = prefix + "missing terminating / delimiter";
        return false;
    }

    // without m, ^ and $ only anchor at the ends of the string
    boost::regex::flag_type flags = boost::regex::perl | boost::regex::no_mod_m;
    BOOST_FOREACH( char f, text.substr( close + 1 ) )
    {
        switch( f )
        {
            case 'i': flags |= boost::regex::icase; break;
            case 'm': flags &= ~boost::regex::no_mod_m; break;
            case 's': flags |= boost::regex::mod_s; break;
            case 'x': flags |= boost::regex::mod_x; break;
            default:
                error = prefix + "unknown regex modifier '" + f + "'";
                return false;
        }
    }

    try
    {
        re.assign( text.substr( 3, close - 3 ), flags );
    }
    catch( boost::regex_error& e )
    {
        error = prefix + e.what();
        return false;
    }
    return true;
}

}
