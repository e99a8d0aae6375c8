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
#include "static_simple/application.h"
#include "static_simple/static_settings.h"

#include <map>
#include <stdexcept>
#include <vector>

#include <boost/filesystem.hpp>
#include <boost/foreach.hpp>

using namespace std;
using namespace json_spirit;

namespace static_simple {

namespace {

// deep merge, values from right win
Object merge_objects( const Object& left, const Object& right )
{
    Object out = left;
    BOOST_FOREACH( const Pair& p, right )
    {
        bool merged = false;
        for( Object::iterator it = out.begin(); it != out.end(); ++it )
        {
            if( it->name_ != p.name_ ) continue;
            if( it->value_.type() == obj_type && p.value_.type() == obj_type )
                it->value_ = merge_objects( it->value_.get_obj(), p.value_.get_obj() );
            else
                it->value_ = p.value_;
            merged = true;
        }
        if( !merged ) out.push_back( p );
    }
    return out;
}

Object section( const Config& conf, const string& name )
{
    Value v = conf.get_json( name );
    if( v.type() == null_type ) return Object();
    if( v.type() != obj_type )
        throw runtime_error( "Config section " + name + " isn't a JSON object" );
    return v.get_obj();
}

bool as_bool( const Value& v, const string& key )
{
    switch( v.type() )
    {
        case null_type: return false;
        case bool_type: return v.get_bool();
        case int_type:  return v.get_int() != 0;
        case str_type:  return !v.get_str().empty() && v.get_str() != "0";
        default:
            throw runtime_error( "Config value " + key + " must be a boolean" );
    }
}

vector<string> string_list( const Value& v, const string& key )
{
    if( v.type() != array_type )
        throw runtime_error( "Config value " + key + " must be a list" );

    vector<string> out;
    BOOST_FOREACH( const Value& item, v.get_array() )
    {
        if( item.type() != str_type )
            throw runtime_error( "Config value " + key + " must only hold strings" );
        out.push_back( item.get_str() );
    }
    return out;
}

}

Application::Application(const Config& c, const provider_map& providers)
    : m_config(c), m_providers(providers), m_debug(false)
{
    setup();
}

middleware_ptr
Application::wrap(fallback_handler app, log::sink_ptr sink) const
{
    return middleware_ptr( new static_middleware( m_settings, app, sink ) );
}

void
Application::setup()
{
    using boost::filesystem::path;

    path base = m_config.config_dir().empty()
                ? boost::filesystem::current_path()
                : path( m_config.config_dir() );
    m_root  = m_config.get<string>( "root", ( base / "root" ).string() );
    m_debug = as_bool( m_config.get_json( "debug" ), "debug" );

    Object merged = merge_objects( section( m_config, "Plugin::Static::Simple" ),
                                   section( m_config, "static" ) );
    map<string, Value> mp;
    obj_to_map( merged, mp );

    boost::shared_ptr<static_settings> s( new static_settings );

    if( mp.count( "dirs" ) )
    {
        BOOST_FOREACH( const string& d, string_list( mp["dirs"], "dirs" ) )
        {
            s->add_dir( d );
        }
    }

    if( mp.count( "include_path" ) )
    {
        if( mp["include_path"].type() != array_type )
            throw runtime_error( "Config value include_path must be a list" );

        BOOST_FOREACH( const Value& item, mp["include_path"].get_array() )
        {
            if( item.type() == str_type )
            {
                if( item.get_str().empty() )
                    throw runtime_error( "include_path entries must not be empty" );
                s->add_include_path( item.get_str() );
                continue;
            }

            map<string, Value> entry;
            if( item.type() == obj_type )
                obj_to_map( item.get_obj(), entry );
            if( !entry.count( "provider" ) || entry["provider"].type() != str_type )
                throw runtime_error( "include_path entries must be a directory or {\"provider\": name}" );

            const string name = entry["provider"].get_str();
            provider_map::const_iterator it = m_providers.find( name );
            if( it == m_providers.end() )
                throw runtime_error( "Unknown include_path provider: " + name );
            s->add_include_provider( it->second );
        }
    }
    else
    {
        s->add_include_path( m_root );
    }

    if( mp.count( "ignore_extensions" ) )
        s->set_ignore_extensions( string_list( mp["ignore_extensions"], "ignore_extensions" ) );

    if( mp.count( "ignore_dirs" ) )
        s->set_ignore_dirs( string_list( mp["ignore_dirs"], "ignore_dirs" ) );

    if( mp.count( "mime_types" ) )
    {
        if( mp["mime_types"].type() != obj_type )
            throw runtime_error( "Config value mime_types must be an object" );

        BOOST_FOREACH( const Pair& p, mp["mime_types"].get_obj() )
        {
            if( p.value_.type() != str_type )
                throw runtime_error( "mime_types." + p.name_ + " must be a string" );
            s->add_mime_type( p.name_, p.value_.get_str() );
        }
    }

    s->set_debug( as_bool( mp["debug"], "debug" ) || m_debug );
    s->set_logging( as_bool( mp["logging"], "logging" ) );

    if( mp.count( "expires" ) )
    {
        if( mp["expires"].type() != int_type )
            throw runtime_error( "Config value expires must be a number of seconds" );
        s->set_expires( mp["expires"].get_int() );
    }

    m_settings = s;
}

}
