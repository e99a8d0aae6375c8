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
#define BOOST_TEST_MODULE dir_matcher
#include <boost/test/included/unit_test.hpp>

#include <string>
#include <vector>

#include "static_simple/dir_matcher.h"
#include "static_simple/static_settings.h"

using namespace std;
using namespace static_simple;

namespace {

dir_match match( const vector<dir_spec>& dirs, const string& path )
{
    string error;
    return dir_matcher( dirs ).matches( path, error );
}

}

BOOST_AUTO_TEST_CASE( literal_dir_is_an_anchored_prefix )
{
    vector<dir_spec> dirs;
    dirs.push_back( make_dir_spec( "static" ) );

    BOOST_CHECK_EQUAL( match( dirs, "/static/css/site.css" ), dir_matched );
    BOOST_CHECK_EQUAL( match( dirs, "/staticfiles/a.css" ), dir_no_match );
    BOOST_CHECK_EQUAL( match( dirs, "/images/static/a.png" ), dir_no_match );
    BOOST_CHECK_EQUAL( match( dirs, "/static" ), dir_no_match );
}

BOOST_AUTO_TEST_CASE( literal_dir_trailing_slash_is_ignored )
{
    vector<dir_spec> dirs;
    dirs.push_back( make_dir_spec( "always-static/" ) );

    BOOST_CHECK_EQUAL( match( dirs, "/always-static/404.txt" ), dir_matched );
}

BOOST_AUTO_TEST_CASE( literal_dir_is_not_a_regex )
{
    vector<dir_spec> dirs;
    dirs.push_back( make_dir_spec( "a.b" ) );

    BOOST_CHECK_EQUAL( match( dirs, "/a.b/file.txt" ), dir_matched );
    BOOST_CHECK_EQUAL( match( dirs, "/axb/file.txt" ), dir_no_match );
}

BOOST_AUTO_TEST_CASE( textual_pattern_is_searched_without_leading_slash )
{
    vector<dir_spec> dirs;
    dirs.push_back( make_dir_spec( "qr/^(images|css)/" ) );

    BOOST_CHECK_EQUAL( match( dirs, "/images/logo.png" ), dir_matched );
    BOOST_CHECK_EQUAL( match( dirs, "/css/site.css" ), dir_matched );
    BOOST_CHECK_EQUAL( match( dirs, "/js/app.js" ), dir_no_match );
    BOOST_CHECK_EQUAL( match( dirs, "/static/images/a.png" ), dir_no_match );
}

BOOST_AUTO_TEST_CASE( textual_pattern_flags )
{
    vector<dir_spec> dirs;
    dirs.push_back( make_dir_spec( "qr/^images/i" ) );

    BOOST_CHECK_EQUAL( match( dirs, "/IMAGES/logo.png" ), dir_matched );

    vector<dir_spec> plain;
    plain.push_back( make_dir_spec( "qr/^images/" ) );
    BOOST_CHECK_EQUAL( match( plain, "/IMAGES/logo.png" ), dir_no_match );
}

BOOST_AUTO_TEST_CASE( precompiled_regex )
{
    vector<dir_spec> dirs;
    dirs.push_back( dir_spec( boost::regex( "\\.(png|jpg)$" ) ) );

    BOOST_CHECK_EQUAL( match( dirs, "/anything/logo.png" ), dir_matched );
    BOOST_CHECK_EQUAL( match( dirs, "/anything/logo.gif" ), dir_no_match );
}

BOOST_AUTO_TEST_CASE( first_match_wins_in_any_order )
{
    vector<dir_spec> a;
    a.push_back( make_dir_spec( "static" ) );
    a.push_back( make_dir_spec( "qr/^img/" ) );

    vector<dir_spec> b( a.rbegin(), a.rend() );

    BOOST_CHECK_EQUAL( match( a, "/img/x.png" ), dir_matched );
    BOOST_CHECK_EQUAL( match( b, "/img/x.png" ), dir_matched );
    BOOST_CHECK_EQUAL( match( a, "/static/x.png" ), dir_matched );
    BOOST_CHECK_EQUAL( match( b, "/static/x.png" ), dir_matched );
}

BOOST_AUTO_TEST_CASE( broken_pattern_reports_error )
{
    vector<dir_spec> dirs;
    dirs.push_back( make_dir_spec( "qr/(unclosed/" ) );

    string error;
    BOOST_CHECK_EQUAL( dir_matcher( dirs ).matches( "/unclosed/a.txt", error ), dir_bad_pattern );
    BOOST_CHECK( error.find( "Error compiling static dir regex 'qr/(unclosed/'" ) != string::npos );
}

BOOST_AUTO_TEST_CASE( broken_pattern_after_a_match_is_not_reached )
{
    vector<dir_spec> dirs;
    dirs.push_back( make_dir_spec( "static" ) );
    dirs.push_back( make_dir_spec( "qr/[/" ) );

    BOOST_CHECK_EQUAL( match( dirs, "/static/a.txt" ), dir_matched );
    BOOST_CHECK_EQUAL( match( dirs, "/other/a.txt" ), dir_bad_pattern );
}

BOOST_AUTO_TEST_CASE( compile_pattern_rejects_unknown_modifier )
{
    boost::regex re;
    string error;
    BOOST_CHECK( !dir_matcher::compile_pattern( "qr/^a/q", re, error ) );
    BOOST_CHECK( error.find( "unknown regex modifier 'q'" ) != string::npos );

    error.clear();
    BOOST_CHECK( dir_matcher::compile_pattern( "qr/^a b/x", re, error ) );
    BOOST_CHECK( error.empty() );
    BOOST_CHECK( boost::regex_search( string( "ab" ), re ) );
}
