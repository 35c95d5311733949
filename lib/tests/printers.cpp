//  printers.cpp -- unit tests for print queue enumeration
//  Copyright (C) 2026  The cupsconn authors
//
//  License: GPL-3.0+
//
//  This file is part of the 'cupsconn' package.
//  This package is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License or, at
//  your option, any later version.
//
//    This program is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//  You ought to have received a copy of the GNU General Public License
//  along with this package.  If not, see <http://www.gnu.org/licenses/>.

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <string>
#include <vector>

#include "cupsconn/exception.hpp"
#include "cupsconn/printers.hpp"
#include "cupsconn/test/scripted.hpp"
#include "cupsconn/test/tools.hpp"

using namespace cupsconn;

using std::chrono::seconds;

namespace {

ipp::attribute_map
printer (const std::string& name)
{
  ipp::attribute_map rv;
  rv["printer-name"].push_back (name);
  rv["printer-state"].push_back ("3");
  return rv;
}

}       // namespace

struct fixture
{
  fixture ()
    : server (std::make_shared< test::script > ())
    , pool (server->factory (), 2, seconds (10), seconds (60))
  {}

  test::script::ptr server;
  connexion_pool    pool;
};

BOOST_FIXTURE_TEST_CASE (list_names, fixture)
{
  ipp::response rsp (ipp::ok);
  rsp.groups.push_back (printer ("laser"));
  rsp.groups.push_back (ipp::attribute_map ());
  rsp.groups.push_back (printer ("ink jet"));
  server->set_response (rsp);

  std::vector< std::string > names = printer_names (pool);

  BOOST_REQUIRE_EQ (2u, names.size ());
  BOOST_CHECK_EQ ("laser", names[0]);
  BOOST_CHECK_EQ ("ink jet", names[1]);

  ipp::request req = server->last_request ();
  BOOST_CHECK_EQ (ipp::get_printers, req.op);
  BOOST_CHECK (req.printer.empty ());
  BOOST_REQUIRE_EQ (1u, req.attributes.size ());
  BOOST_CHECK_EQ ("printer-name", req.attributes[0]);
}

BOOST_FIXTURE_TEST_CASE (not_found_means_no_printers, fixture)
{
  server->set_response (ipp::response (ipp::error_not_found));

  std::vector< std::string > names;
  BOOST_CHECK_NO_THROW (names = printer_names (pool));
  BOOST_CHECK (names.empty ());
  BOOST_CHECK_EQ (1, server->ipp_calls.load ());
}

BOOST_FIXTURE_TEST_CASE (other_errors_propagate, fixture)
{
  server->set_response (ipp::response (ipp::error_forbidden));

  BOOST_CHECK_THROW (printer_names (pool), server_error);
}

BOOST_FIXTURE_TEST_CASE (single_printer_attributes, fixture)
{
  ipp::response rsp (ipp::ok);
  rsp.groups.push_back (printer ("laser"));
  server->set_response (rsp);

  std::vector< std::string > wanted;
  wanted.push_back ("printer-name");
  wanted.push_back ("printer-state");

  ipp::attribute_map attrs = printer_attributes (pool, "laser", wanted);

  BOOST_CHECK_EQ (2u, attrs.size ());
  BOOST_CHECK_EQ ("3", attrs["printer-state"].front ());

  ipp::request req = server->last_request ();
  BOOST_CHECK_EQ (ipp::get_printer_attributes, req.op);
  BOOST_CHECK_EQ ("laser", req.printer);
  BOOST_CHECK_EQ (2u, req.attributes.size ());
}

BOOST_FIXTURE_TEST_CASE (attributes_of_silent_server, fixture)
{
  server->set_response (ipp::response (ipp::ok));

  BOOST_CHECK (printer_attributes (pool, "laser",
                                   std::vector< std::string > ()).empty ());
}

BOOST_AUTO_TEST_CASE (status_names)
{
  BOOST_CHECK (ipp::is_successful (ipp::ok));
  BOOST_CHECK (ipp::is_successful (ipp::ok_conflicting));
  BOOST_CHECK (!ipp::is_successful (ipp::error_not_found));
  BOOST_CHECK_EQ ("0x1234", ipp::status_name (0x1234));
  BOOST_CHECK (!ipp::status_name (ipp::error_not_found).empty ());
}

#include "cupsconn/test/runner.ipp"
