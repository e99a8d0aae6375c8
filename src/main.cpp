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
#include <boost/algorithm/string.hpp>
#include <boost/bind.hpp>
#include <boost/foreach.hpp>
#include <boost/program_options.hpp>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "static_simple/application.h"
#include "static_simple/static_middleware.h"

using namespace std;
using namespace static_simple;
namespace po = boost::program_options;

// roots from $STATIC_SIMPLE_ROOTS, colon separated
vector<string> env_roots(const static_request&)
{
    const char* v = getenv("STATIC_SIMPLE_ROOTS");
    if(!v)
    {
        throw runtime_error("STATIC_SIMPLE_ROOTS is not set");
    }
    vector<string> roots;
    string s(v);
    boost::split(roots, s, boost::is_any_of(":"), boost::token_compress_on);
    roots.erase(remove(roots.begin(), roots.end(), string()), roots.end());
    return roots;
}

// stands in for the application behind the middleware
static_response application_stub(const static_request& req, bool* deferred)
{
    *deferred = true;
    return static_response(200, "text/plain", "handled by application: " + req.path());
}

void print_response(const string& path, const static_response& rep, bool body)
{
    cout << rep.status() << " " << path << endl;
    typedef pair<string, string> SPair;
    BOOST_FOREACH(const SPair& h, rep.headers())
    {
        cout << "  " << h.first << ": " << h.second << endl;
    }
    if(body)
    {
        cout << endl << rep.body() << endl;
    }
}

int main(int ac, char *av[])
{
    po::options_description generic("Generic options");
    generic.add_options()
        ("config,c",  po::value<string>(), "path to JSON config file")
        ("root,r",    po::value<string>(), "application root, default include_path")
        ("debug,d",   "log why requests are or aren't served")
        ("logfile,l", po::value<string>(), "log to this file instead of stderr")
        ("body,b",    "print response bodies")
        ("version,v", "print version string")
        ("help,h",    "print this message")
        ;
    po::options_description hidden("Hidden options");
    hidden.add_options()
        ("path", po::value< vector<string> >(), "request path")
        ;
    po::positional_options_description positional;
    positional.add("path", -1);

    po::options_description cmdline_options;
    cmdline_options.add(generic).add(hidden);

    po::options_description visible("static-simple [options] PATH...");
    visible.add(generic);

    po::variables_map vm;
    bool error;
    try {
        po::parsed_options parsedopts_cmd = po::command_line_parser(ac, av)
            .options(cmdline_options).positional(positional).run();
        store(parsedopts_cmd, vm);
        notify(vm);
        error = false;
    } catch (po::error& ex) {
        // probably an unknown option.
        cerr << ex.what() << "\n";
        error = true;
    }

    if (error || vm.count("help")) {
        cout << visible << "\n";
        return error ? 1 : 0;
    }
    if (vm.count("version")) {
        cout << STATIC_SIMPLE_VERSION << "\n";
        return 0;
    }
    if (!vm.count("path")) {
        cerr << "Give at least one request path." << endl;
        return 1;
    }

    try
    {
        Config conf;
        if(vm.count("config"))
        {
            string configfile = vm["config"].as<string>();
            cerr << "Using config file: " << configfile << endl;
            conf = Config(configfile);
        }
        if(vm.count("root"))  conf.set("root", vm["root"].as<string>());
        if(vm.count("debug")) conf.set("debug", true);

        provider_map providers;
        providers["env"] = &env_roots;
        Application app(conf, providers);

        log::sink_ptr sink;
        if(vm.count("logfile"))
        {
            sink.reset(new log::file_sink(vm["logfile"].as<string>()));
        }

        bool deferred = false;
        middleware_ptr mw = app.wrap(boost::bind(&application_stub, _1, &deferred), sink);

        int failures = 0;
        BOOST_FOREACH(const string& p, vm["path"].as< vector<string> >())
        {
            deferred = false;
            static_response rep = mw->handle_request(static_request(p));
            if(deferred)
            {
                cout << "DEFERRED " << p << endl;
                continue;
            }
            print_response(p, rep, vm.count("body") > 0);
            if(rep.status() >= 400) ++failures;
        }
        return failures ? 2 : 0;
    }
    catch(exception& e)
    {
        cerr << "static-simple: " << e.what() << endl;
        return 1;
    }

    return 0;
}
