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
#include "static_simple/config.hpp"

#include <fstream>
#include <stdexcept>

#include <boost/filesystem.hpp>

using namespace std;
using namespace json_spirit;

namespace static_simple {

string Config::config_dir() const
{
    boost::filesystem::path p(m_filename);
    return p.parent_path().string();
}

void Config::reload()
{
    fstream ifs;
    ifs.open(m_filename.c_str(), ifstream::in);
    if(ifs.fail())
    {
        throw runtime_error("Failed to open config file: " + m_filename);
    }
    if(!read(ifs, m_mainval))
    {
        throw runtime_error("Failed to parse config file: " + m_filename);
    }
    check_object();
}

void Config::parse(const string& json)
{
    if(!read(json, m_mainval))
    {
        throw runtime_error("Failed to parse config");
    }
    check_object();
}

void Config::check_object()
{
    if(m_mainval.type() != obj_type)
    {
        throw runtime_error("Config file isn't a JSON object!");
    }
}

Value Config::get_json(const string& k) const
{
    Value def;

    vector<string> toks;
    boost::split(toks, k, boost::is_any_of("."));
    Value val = m_mainval;
    map<string, Value> mp;
    unsigned int i = 0;
    do
    {
        if(val.type() != obj_type) return def;
        mp.clear();
        obj_to_map(val.get_obj(), mp);
        if( mp.find(toks[i]) == mp.end() )
        {
            return def;
        }
        val = mp[toks[i]];
    }
    while(++i < toks.size());
    return val;
}

void Config::set(const string& k, const Value& v)
{
    Object o;
    if(m_mainval.type() == obj_type)
    {
        o = m_mainval.get_obj();
    }
    bool replaced = false;
    for(Object::iterator it = o.begin(); it != o.end(); ++it)
    {
        if(it->name_ == k)
        {
            it->value_ = v;
            replaced = true;
        }
    }
    if(!replaced) o.push_back( Pair(k, v) );
    m_mainval = o;
}

}
