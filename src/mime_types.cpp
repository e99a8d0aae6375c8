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
#include "static_simple/mime_types.h"

#include <fstream>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/foreach.hpp>

using namespace std;

namespace static_simple {

namespace {

struct mime_entry
{
    const char* ext;
    const char* type;
};

const mime_entry builtin_types[] = {
    { "bmp",   "image/bmp" },
    { "css",   "text/css" },
    { "csv",   "text/csv" },
    { "flac",  "audio/flac" },
    { "gif",   "image/gif" },
    { "gz",    "application/x-gzip" },
    { "htm",   "text/html" },
    { "html",  "text/html" },
    { "ico",   "image/vnd.microsoft.icon" },
    { "jpeg",  "image/jpeg" },
    { "jpg",   "image/jpeg" },
    { "js",    "application/javascript" },
    { "json",  "application/json" },
    { "m4a",   "audio/mp4" },
    { "mp3",   "audio/mpeg" },
    { "mp4",   "video/mp4" },
    { "ogg",   "audio/ogg" },
    { "pdf",   "application/pdf" },
    { "png",   "image/png" },
    { "rss",   "application/rss+xml" },
    { "svg",   "image/svg+xml" },
    { "swf",   "application/x-shockwave-flash" },
    { "tar",   "application/x-tar" },
    { "tif",   "image/tiff" },
    { "tiff",  "image/tiff" },
    { "txt",   "text/plain" },
    { "wav",   "audio/x-wav" },
    { "webm",  "video/webm" },
    { "woff",  "application/font-woff" },
    { "xhtml", "application/xhtml+xml" },
    { "xml",   "text/xml" },
    { "xsl",   "text/xml" },
    { "zip",   "application/zip" },
};

// text after the last '.'
bool
extension_of( const string& path, string& ext )
{
    size_t dot = path.rfind( '.' );
    if( dot == string::npos || dot + 1 == path.length() )
        return false;
    ext = path.substr( dot + 1 );
    return true;
}

}

mime_types::mime_types( const map<string, string>& overrides, const string& db_file )
    : m_overrides( overrides )
{
    load_builtin();
    if( !db_file.empty() )
        load( db_file );
}

string
mime_types::content_type( const string& full_path ) const
{
    string ext;
    if( !extension_of( full_path, ext ) )
        return "text/plain";

    if( !m_overrides.empty() &&
        ext.find_first_of( " \t\r\n\f\v" ) == string::npos )
    {
        map<string, string>::const_iterator it = m_overrides.find( ext );
        if( it != m_overrides.end() && !it->second.empty() )
            return it->second;
    }

    string type = lookup( ext );
    return type.empty() ? "text/plain" : type;
}

string
mime_types::lookup( const string& ext ) const
{
    if( ext.empty() || !boost::all( ext, boost::is_alnum() ) )
        return "";

    map<string, string>::const_iterator it = m_db.find( boost::to_lower_copy( ext ) );
    if( it == m_db.end() )
        return "";
    return it->second;
}

size_t
mime_types::load( const string& filename )
{
    boost::system::error_code ec;
    if( !boost::filesystem::is_regular_file( filename, ec ) )
        return 0;

    ifstream ifs( filename.c_str() );
    if( ifs.fail() )
        return 0;

    size_t added = 0;
    string line;
    vector<string> toks;
    while( getline( ifs, line ) )
    {
        boost::trim( line );
        if( line.empty() || line[0] == '#' )
            continue;

        boost::split( toks, line, boost::is_space(), boost::token_compress_on );
        for( size_t i = 1; i < toks.size(); ++i )
        {
            string ext = boost::to_lower_copy( toks[i] );
            if( m_db.find( ext ) != m_db.end() )
                continue;
            m_db[ ext ] = toks[0];
            ++added;
        }
    }
    return added;
}

void
mime_types::load_builtin()
{
    BOOST_FOREACH( const mime_entry& e, builtin_types )
    {
        m_db[ e.ext ] = e.type;
    }
}

}
