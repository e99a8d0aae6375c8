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
#include "static_simple/logger.h"

using namespace std;

namespace static_simple {
namespace log {

const char*
level_name( level l )
{
    switch( l )
    {
        case level_debug:   return "DEBUG";
        case level_info:    return "INFO";
        case level_warning: return "WARNING";
        case level_error:   return "ERROR";
    }
    return "UNKNOWN";
}

void
stream_sink::write( level l, const string& message )
{
    boost::mutex::scoped_lock lk( m_mut );
    m_os << level_name( l ) << ": static_simple: " << message << endl;
}

file_sink::file_sink( const string& filename )
    : m_stream( filename.c_str(), ios_base::out | ios_base::app )
{
    cout << "Opening log file: " << filename << endl;
}

void
file_sink::write( level l, const string& message )
{
    boost::mutex::scoped_lock lk( m_mut );
    if( !m_stream.is_open() ) return;
    m_stream << level_name( l ) << ": " << message << endl;
}

channel::channel()
    : m_sink( new stream_sink ), m_debug( false )
{
}

channel::channel( sink_ptr s, bool debug )
    : m_sink( s ), m_debug( debug )
{
    if( !m_sink ) m_sink.reset( new stream_sink );
}

void
channel::write( level l, const string& message ) const
{
    if( l == level_debug && !m_debug ) return;
    m_sink->write( l, message );
}

}} // static_simple::log
