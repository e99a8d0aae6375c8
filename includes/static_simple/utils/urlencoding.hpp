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
#ifndef _STATIC_SIMPLE_UTILS_URLENCODING_H_
#define _STATIC_SIMPLE_UTILS_URLENCODING_H_

#include <string>
#include <curl/curl.h>

namespace static_simple { namespace utils {
    /// %-decoding only, '+' stays a '+' in a path
    inline std::string url_decode( const std::string & s )
    {
        int outlen = 0;
        char* c = curl_easy_unescape( 0, s.c_str(), s.length(), &outlen );
        if( !c ) return s;
        const std::string ret( c, outlen );
        curl_free( c );
        return ret;
    }
}}

#endif //_STATIC_SIMPLE_UTILS_URLENCODING_H_
