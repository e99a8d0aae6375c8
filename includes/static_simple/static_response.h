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
#ifndef __STATIC_SIMPLE_RESPONSE_H__
#define __STATIC_SIMPLE_RESPONSE_H__

#include <string>
#include <map>

namespace static_simple {

/// status, headers and body of an http response
class static_response {
public:
    static_response() : m_status( 200 ) {}

    static_response( int status, const std::string& content_type, const std::string& body );

    void add_header( const std::string& k, const std::string& v )
    {
        m_headers[k] = v;
    }

    bool has_header( const std::string& k ) const{ return m_headers.find(k) != m_headers.end(); }

    // empty string if the header is not set
    std::string header( const std::string& k ) const;


    int status() const{ return m_status; }
    const std::string& body() const{ return m_body; }
    const std::map<std::string,std::string>& headers() const{ return m_headers; }

    // fixed replies, these must not change:
    static static_response not_found();
    static static_response internal_error();

private:
    int m_status;
    std::map<std::string,std::string> m_headers;
    std::string m_body;
};

}

#endif //__STATIC_SIMPLE_RESPONSE_H__
