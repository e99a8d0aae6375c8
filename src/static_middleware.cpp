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
#include "static_simple/static_middleware.h"
#include "static_simple/path_classifier.h"
#include "static_simple/root_resolver.h"

#include <stdexcept>

using namespace std;

namespace static_simple {

namespace {

const static_settings&
checked( const settings_ptr& s )
{
    if( !s )
        throw invalid_argument( "static_middleware needs settings" );
    return *s;
}

}

static_middleware::static_middleware( settings_ptr settings, fallback_handler app,
                                      log::sink_ptr sink )
    : m_settings( settings ),
      m_app( app ),
      m_log( sink, checked( settings ).debug() ),
      m_files( mime_types( settings->mime_types() ), settings->expires() )
{
}

static_response
static_middleware::handle_request( const static_request& req ) const
{
    // whatever goes wrong in here, the client gets a 500 and we get a warning
    try
    {
        return respond( resolve( req ), req );
    }
    catch( std::exception& e )
    {
        log::warning( m_log ) << "Error handling " << req.path() << ": " << e.what();
    }
    catch( ... )
    {
        log::warning( m_log ) << "Error handling " << req.path() << ": unknown error";
    }
    static_response rep = static_response::internal_error();
    log_request( req, rep );
    return rep;
}

resolution
static_middleware::resolve( const static_request& req ) const
{
    string error;
    switch( path_classifier( *m_settings, m_log ).classify( req.path(), error ) )
    {
        case path_ignored:
            return resolution::make_deferred();
        case path_fault:
            return resolution::make_error( error );
        case path_eligible:
            break;
    }
    return root_resolver( *m_settings, m_files, m_log ).resolve( req );
}

static_response
static_middleware::serve_static_file( const string& full_path ) const
{
    return m_files.serve_file( full_path );
}

static_response
static_middleware::respond( const resolution& r, const static_request& req ) const
{
    static_response rep;
    switch( r.kind() )
    {
        case resolution::served:
            rep = r.response();
            break;
        case resolution::not_found:
            rep = static_response::not_found();
            break;
        case resolution::internal_error:
            log::warning( m_log ) << r.message();
            rep = static_response::internal_error();
            break;
        case resolution::deferred:
            return m_app( req );
    }
    log_request( req, rep );
    return rep;
}

void
static_middleware::log_request( const static_request& req, const static_response& rep ) const
{
    if( !m_settings->logging() ) return;
    log::info( m_log ) << req.method() << " " << req.path() << " -> " << rep.status();
}

}
