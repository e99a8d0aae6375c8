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
#ifndef __STATIC_SIMPLE_ROOT_RESOLVER_H__
#define __STATIC_SIMPLE_ROOT_RESOLVER_H__

#include "static_simple/file_server.h"
#include "static_simple/logger.h"
#include "static_simple/resolution.h"
#include "static_simple/static_request.h"
#include "static_simple/static_settings.h"

namespace static_simple {

/*
 *  Searches the include_path, in order, for the requested file.
 *  Providers are called when reached and their roots are searched
 *  next, ahead of whatever followed the provider.
 */
class root_resolver
{
public:
    root_resolver( const static_settings& s, const file_server& files, const log::channel& log )
        : m_settings( s ), m_files( files ), m_log( log ) {}

    resolution resolve( const static_request& req ) const;

private:
    const static_settings& m_settings;
    const file_server& m_files;
    const log::channel& m_log;
};

}

#endif // __STATIC_SIMPLE_ROOT_RESOLVER_H__
