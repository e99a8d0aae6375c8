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
#define BOOST_TEST_MODULE file_server
#include <boost/test/included/unit_test.hpp>

#include <map>
#include <string>

#include <boost/algorithm/string/predicate.hpp>

#include "static_simple/file_server.h"
#include "test_helpers.hpp"

using namespace std;
using namespace static_simple;

namespace {

struct server_fixture
{
    server_fixture()
        : files( mime_types( map<string, string>(), "" ) )
    {
        root = tree.dir( "root" );
    }

    test::temp_tree tree;
    string root;
    file_server files;
};

}

BOOST_FIXTURE_TEST_SUITE( server, server_fixture )

BOOST_AUTO_TEST_CASE( serves_a_file )
{
    tree.write( "root/images/logo.png", "PNGDATA" );

    static_response rep = files.serve( root, "/images/logo.png" );
    BOOST_CHECK_EQUAL( rep.status(), 200 );
    BOOST_CHECK_EQUAL( rep.body(), "PNGDATA" );
    BOOST_CHECK_EQUAL( rep.header( "Content-Type" ), "image/png" );
    BOOST_CHECK_EQUAL( rep.header( "Content-Length" ), "7" );
    BOOST_CHECK( rep.has_header( "Last-Modified" ) );
    BOOST_CHECK( !rep.has_header( "Expires" ) );
}

BOOST_AUTO_TEST_CASE( root_with_trailing_slash )
{
    tree.write( "root/a.png", "x" );
    BOOST_CHECK_EQUAL( files.serve( root + "/", "/a.png" ).status(), 200 );
}

BOOST_AUTO_TEST_CASE( text_types_carry_a_charset )
{
    tree.write( "root/site.css", "body {}" );

    static_response rep = files.serve( root, "/site.css" );
    BOOST_CHECK_EQUAL( rep.header( "Content-Type" ), "text/css; charset=utf-8" );
}

BOOST_AUTO_TEST_CASE( binary_bodies_survive )
{
    string data( "a\0b\r\n\xff", 6 );
    tree.write( "root/blob.bin", data );

    static_response rep = files.serve( root, "/blob.bin" );
    BOOST_CHECK_EQUAL( rep.status(), 200 );
    BOOST_CHECK( rep.body() == data );
}

BOOST_AUTO_TEST_CASE( missing_file_is_404 )
{
    static_response rep = files.serve( root, "/nope.png" );
    BOOST_CHECK_EQUAL( rep.status(), 404 );
}

BOOST_AUTO_TEST_CASE( directory_is_404 )
{
    tree.dir( "root/images" );
    BOOST_CHECK_EQUAL( files.serve( root, "/images" ).status(), 404 );
}

BOOST_AUTO_TEST_CASE( dot_dot_segments_are_forbidden )
{
    tree.write( "secret.txt", "secret" );

    BOOST_CHECK_EQUAL( files.serve( root, "/../secret.txt" ).status(), 403 );
    BOOST_CHECK_EQUAL( files.serve( root, "/images/..\\..\\secret.txt" ).status(), 403 );
    BOOST_CHECK_EQUAL( files.serve( root, "/.../secret.txt" ).status(), 403 );
}

BOOST_AUTO_TEST_CASE( single_dots_in_names_are_fine )
{
    tree.write( "root/.hidden", "h" );
    tree.write( "root/a..b.txt", "ab" );

    BOOST_CHECK_EQUAL( files.serve( root, "/.hidden" ).status(), 200 );
    BOOST_CHECK_EQUAL( files.serve( root, "/a..b.txt" ).status(), 200 );
}

BOOST_AUTO_TEST_CASE( nul_byte_is_a_bad_request )
{
    string path( "/a.png\0.txt", 11 );
    BOOST_CHECK_EQUAL( files.serve( root, path ).status(), 400 );
}

BOOST_AUTO_TEST_CASE( expires_header )
{
    tree.write( "root/a.png", "x" );
    file_server cached( mime_types( map<string, string>(), "" ), 3600 );

    static_response rep = cached.serve( root, "/a.png" );
    BOOST_CHECK( rep.has_header( "Expires" ) );
    BOOST_CHECK( boost::ends_with( rep.header( "Expires" ), " GMT" ) );
}

BOOST_AUTO_TEST_CASE( serve_file_gives_the_fixed_404 )
{
    static_response rep = files.serve_file( root + "/gone.txt" );
    BOOST_CHECK_EQUAL( rep.status(), 404 );
    BOOST_CHECK_EQUAL( rep.header( "Content-Type" ), "text/html" );
    BOOST_CHECK_EQUAL( rep.body(), "not found" );
}

BOOST_AUTO_TEST_CASE( http_date_format )
{
    BOOST_CHECK_EQUAL( file_server::http_date( 0 ), "Thu, 01 Jan 1970 00:00:00 GMT" );
    BOOST_CHECK_EQUAL( file_server::http_date( 1234567890 ), "Fri, 13 Feb 2009 23:31:30 GMT" );
}

BOOST_AUTO_TEST_SUITE_END()
