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
#ifndef __STATIC_SIMPLE_MIDDLEWARE_H__
#define __STATIC_SIMPLE_MIDDLEWARE_H__

#include <string>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>

#include "static_simple/types.h"
#include "static_simple/file_server.h"
#include "static_simple/logger.h"
#include "static_simple/resolution.h"
#include "static_simple/static_request.h"
#include "static_simple/static_response.h"
#include "static_simple/static_settings.h"

namespace static_simple {

/*
 *  Sits in front of the application. Serves the request from disk,
 *  answers 404/500 itself, or hands the request to the application.
 *  Safe to call from any number of threads at once.
 */
class static_middleware : private boost::noncopyable
{
public:
    static_middleware( settings_ptr settings, fallback_handler app,
                       log::sink_ptr sink = log::sink_ptr() );

    /// never throws, the worst a caller gets is the fixed 500
    static_response handle_request( const static_request& req ) const;

    /// the decision only, nothing is sent to the application
    resolution resolve( const static_request& req ) const;

    /// serve one file by its full path, the fixed 404 if it's not there
    static_response serve_static_file( const std::string& full_path ) const;

private:
    static_response respond( const resolution& r, const static_request& req ) const;
    void log_request( const static_request& req, const static_response& rep ) const;

    settings_ptr m_settings;
    fallback_handler m_app;
    log::channel m_log;
    file_server m_files;
};

typedef boost::shared_ptr<static_middleware> middleware_ptr;

}

#endif // __STATIC_SIMPLE_MIDDLEWARE_H__
