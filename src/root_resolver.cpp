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
#include "static_simple/root_resolver.h"

#include <deque>
#include <stdexcept>

#include <boost/filesystem.hpp>
#include <boost/foreach.hpp>

using namespace std;

namespace static_simple {

namespace {

// one include_path entry. returns true once the search is over.
class search_step : public boost::static_visitor<bool>
{
public:
    search_step( deque<root_spec>& queue, const static_request& req,
                 const file_server& files, resolution& result )
        : m_queue( queue ), m_req( req ), m_files( files ), m_result( result ) {}

    bool operator()( const root_provider& provider ) const
    {
        vector<string> roots;
        try
        {
            roots = provider( m_req );
        }
        catch( std::exception& e )
        {
            m_result = resolution::make_error( string( "Error in dynamic include path: " ) + e.what() );
            return true;
        }
        catch( const string& s )
        {
            m_result = resolution::make_error( "Error in dynamic include path: " + s );
            return true;
        }
        catch( ... )
        {
            m_result = resolution::make_error( "Error in dynamic include path: unknown error" );
            return true;
        }

        BOOST_REVERSE_FOREACH( const string& r, roots )
        {
            m_queue.push_front( root_spec( r ) );
        }
        return false;
    }

    bool operator()( const string& root ) const
    {
        // an empty root ends the search, it is never the filesystem root
        if( root.empty() )
        {
            m_queue.clear();
            return false;
        }

        boost::system::error_code ec;
        if( !boost::filesystem::is_regular_file( root + m_req.path(), ec ) )
            return false;

        // a 404 from the file server means try the next root, anything
        // else (403 included) is the answer
        static_response rep = m_files.serve( root, m_req.path() );
        if( rep.status() == 404 )
            return false;

        m_result = resolution::make_served( rep );
        return true;
    }

private:
    deque<root_spec>& m_queue;
    const static_request& m_req;
    const file_server& m_files;
    resolution& m_result;
};

}

resolution
root_resolver::resolve( const static_request& req ) const
{
    deque<root_spec> queue( m_settings.include_path().begin(),
                            m_settings.include_path().end() );
    resolution result;
    search_step step( queue, req, m_files, result );

    while( !queue.empty() )
    {
        root_spec spec = queue.front();
        queue.pop_front();
        if( boost::apply_visitor( step, spec ) )
            return result;
    }

    if( m_settings.dirs().empty() )
    {
        log::debug( m_log ) << "Forwarding to application (or other middleware).";
        return resolution::make_deferred();
    }

    log::debug( m_log ) << "404: file not found: " << req.path();
    return resolution::make_not_found();
}

}
