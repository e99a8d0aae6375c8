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
#ifndef __STATIC_SIMPLE_REQUEST_H__
#define __STATIC_SIMPLE_REQUEST_H__

#include <map>
#include <string>

namespace static_simple {

/*
 *  What the middleware sees of a request: the decoded path and an
 *  environment map. The environment is the context handed to dynamic
 *  root providers (session data, vhost, whatever the host puts there).
 */
class static_request {
public:
    /// uri is split at '?', the path part is %-decoded
    static_request( const std::string& uri, const std::string& method = "GET" );

    const std::string& path() const{ return m_path; }
    const std::string& method() const{ return m_method; }

    const std::string env( const std::string& k ) const;
    void set_env( const std::string& k, const std::string& v ){ m_env[k] = v; }

private:
    std::string m_path;
    std::string m_method;
    std::map<std::string, std::string> m_env;
};

}

#endif //__STATIC_SIMPLE_REQUEST_H__
