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
#ifndef __STATIC_SIMPLE_PATH_CLASSIFIER_H__
#define __STATIC_SIMPLE_PATH_CLASSIFIER_H__

#include <string>

#include "static_simple/static_settings.h"
#include "static_simple/logger.h"

namespace static_simple {

enum path_class { path_eligible, path_ignored, path_fault };

// decides if a request path may be served from disk at all
class path_classifier
{
public:
    path_classifier( const static_settings& s, const log::channel& log )
        : m_settings( s ), m_log( log ) {}

    path_class classify( const std::string& path, std::string& error ) const;

private:
    bool ignored_extension( const std::string& path ) const;
    bool ignored_dir( const std::string& path ) const;

    const static_settings& m_settings;
    const log::channel& m_log;
};

}

#endif // __STATIC_SIMPLE_PATH_CLASSIFIER_H__
