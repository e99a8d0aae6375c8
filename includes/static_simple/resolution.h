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
#ifndef __STATIC_SIMPLE_RESOLUTION_H__
#define __STATIC_SIMPLE_RESOLUTION_H__

#include <string>

#include "static_simple/static_response.h"

namespace static_simple {

/// outcome of resolving one request
class resolution
{
public:
    enum kind_t { served, not_found, internal_error, deferred };

    resolution() : m_kind( deferred ) {}

    static resolution make_served( const static_response& rep )
    {
        resolution r( served );
        r.m_response = rep;
        return r;
    }

    static resolution make_not_found() { return resolution( not_found ); }
    static resolution make_deferred() { return resolution( deferred ); }

    static resolution make_error( const std::string& message )
    {
        resolution r( internal_error );
        r.m_message = message;
        return r;
    }

    kind_t kind() const { return m_kind; }

    /// only meaningful when served
    const static_response& response() const { return m_response; }

    /// only meaningful for internal_error
    const std::string& message() const { return m_message; }

private:
    explicit resolution( kind_t k ) : m_kind( k ) {}

    kind_t m_kind;
    static_response m_response;
    std::string m_message;
};

}

#endif // __STATIC_SIMPLE_RESOLUTION_H__
