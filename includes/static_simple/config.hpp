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
#ifndef __STATIC_SIMPLE_JSON_CONFIG_HPP__
#define __STATIC_SIMPLE_JSON_CONFIG_HPP__

#include "json_spirit/json_spirit.h"
#include <map>
#include <string>
#include <vector>
#include <boost/algorithm/string.hpp>

namespace static_simple {

// wrapper around JSON config file

class Config
{
public:
    Config(){}

    Config(const std::string& f) : m_filename(f)
    {
        reload();
    }

    // gets directory where config files are located
    std::string config_dir() const;

    void reload();

    /// use json text instead of a file
    void parse(const std::string& json);

    // get a value from json object
    // or value from nested *objects* by using a key of first.second.third
    template <typename T>
    T get(const std::string& k, T def) const;

    /// gets json Value for a given key, null Value if missing
    json_spirit::Value get_json(const std::string& k) const;

    /// sets a top level key, replacing any existing value
    void set(const std::string& k, const json_spirit::Value& v);

private:
    void check_object();

    std::string         m_filename;
    json_spirit::Value  m_mainval;
};

////////////////////////////////////////////////////////////////////////////////

template <typename T>
T Config::get(const std::string& k, T def) const
{
    json_spirit::Value val = get_json(k);
    if(val.type() == json_spirit::null_type) return def;
    return val.get_value<T>();
}

////////////////////////////////////////////////////////////////////////////////

}

#endif
