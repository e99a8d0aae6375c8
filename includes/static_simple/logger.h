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
#ifndef STATIC_SIMPLE_LOG_H_
#define STATIC_SIMPLE_LOG_H_

#include <string>
#include <sstream>
#include <fstream>
#include <iostream>
#include <boost/shared_ptr.hpp>
#include <boost/noncopyable.hpp>
#include <boost/thread/mutex.hpp>

namespace static_simple {
namespace log {

enum level { level_debug, level_info, level_warning, level_error };

const char* level_name( level l );

/// where log lines end up. one sink is shared by all requests.
class sink : private boost::noncopyable {
public:
    virtual ~sink(){}
    virtual void write( level l, const std::string& message ) = 0;
};

typedef boost::shared_ptr<sink> sink_ptr;

class stream_sink : public sink {
public:
    stream_sink( std::ostream& os = std::cerr ) : m_os( os ) {}
    void write( level l, const std::string& message );

private:
    std::ostream& m_os;
    boost::mutex m_mut;
};

class file_sink : public sink {
public:
    file_sink( const std::string& filename = "static_simple.log" );
    void write( level l, const std::string& message );
    bool is_open() const{ return m_stream.is_open(); }

private:
    std::ofstream m_stream;
    boost::mutex m_mut;
};

/// a sink plus the debug flag; debug lines are dropped unless enabled.
class channel {
public:
    channel();
    channel( sink_ptr s, bool debug );

    bool debug_enabled() const{ return m_debug; }
    void write( level l, const std::string& message ) const;

private:
    sink_ptr m_sink;
    bool m_debug;
};

template< class T > class base_log : private boost::noncopyable {
public:
    template<typename V> base_log& operator<<( const V& in ) {
        m_buf << in;
        return *this;
    }

    ~base_log() {
        m_channel.write( T::log_level(), m_buf.str() );
    }

protected:
    base_log( const channel& c ) : m_channel( c ) {}

    const channel& m_channel;
    std::ostringstream m_buf;
};

class debug: public base_log< debug > {
public:
    debug( const channel& c ): base_log<debug>( c ){}
    static level log_level(){ return level_debug; }
};

class info: public base_log< info > {
public:
    info( const channel& c ): base_log<info>( c ){}
    static level log_level(){ return level_info; }
};

class warning: public base_log< warning > {
public:
    warning( const channel& c ): base_log<warning>( c ){}
    static level log_level(){ return level_warning; }
};

class error: public base_log< error > {
public:
    error( const channel& c ): base_log<error>( c ){}
    static level log_level(){ return level_error; }
};

}} // static_simple::log

#endif //STATIC_SIMPLE_LOG_H_
