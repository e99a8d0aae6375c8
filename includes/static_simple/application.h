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
#ifndef __STATIC_SIMPLE_APPLICATION_H__
#define __STATIC_SIMPLE_APPLICATION_H__

#include <string>

#include "static_simple/config.hpp"
#include "static_simple/logger.h"
#include "static_simple/static_middleware.h"
#include "static_simple/types.h"

#define STATIC_SIMPLE_VERSION "0.32.0"

namespace static_simple {

/*
 *  Application-level settings and the static middleware built from them.
 *
 *  The middleware reads the "Plugin::Static::Simple" and "static" sections
 *  of the config (merged, "static" wins). Anything not set there gets its
 *  default; include_path defaults to the application root. Named dynamic
 *  root providers are referenced from include_path as {"provider": name}.
 *
 *  Throws std::runtime_error for config it can't use.
 */
class Application
{
public:
    Application(const Config& c, const provider_map& providers = provider_map());

    /// directory static files are served from by default
    const std::string& root() const { return m_root; }

    bool debug() const { return m_debug; }

    settings_ptr settings() const { return m_settings; }

    /// put the static middleware in front of app
    middleware_ptr wrap(fallback_handler app, log::sink_ptr sink = log::sink_ptr()) const;

private:
    void setup();

    Config m_config;
    provider_map m_providers;
    std::string m_root;
    bool m_debug;
    settings_ptr m_settings;
};

}

#endif
