//  capabilities.cpp -- unit tests for the capability pipeline
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

#include <fstream>
#include <string>
#include <thread>

#include "cupsconn/capabilities.hpp"
#include "cupsconn/exception.hpp"
#include "cupsconn/test/scripted.hpp"
#include "cupsconn/test/tools.hpp"

using namespace cupsconn;

using std::chrono::milliseconds;
using std::chrono::seconds;

namespace {

const std::string duplex_ppd
("*PPD-Adobe: \"4.3\"\n"
 "*Manufacturer: \"KYOCERA\"\n"
 "*NickName: \"KYOCERA FS-600 (KPDL-2) Foomatic/Postscript (recommended)\"\n"
 "*OpenUI *Duplex/Duplex: PickOne\n"
 "*DefaultDuplex: None\n"
 "*Duplex None/Off: \"\"\n"
 "*Duplex DuplexNoTumble/Long Edge: \"\"\n"
 "*CloseUI: *Duplex\n");

const std::string simplex_ppd
("*PPD-Adobe: \"4.3\"\n"
 "*Manufacturer: \"KYOCERA\"\n"
 "*NickName: \"KYOCERA FS-600\"\n"
 "*Throughput: \"8\"\n");

}       // namespace

struct fixture
{
  fixture ()
    : server (std::make_shared< test::script > ())
    , pool (server->factory (), 2, seconds (10), seconds (60))
    , cache (pool, dir.path)
    , source (cache)
  {
    server->set_ppd ("laser", duplex_ppd);
  }

  test::script::ptr         server;
  test::temporary_directory dir;
  connexion_pool            pool;
  ppd_cache                 cache;
  capability_source         source;
};

BOOST_FIXTURE_TEST_CASE (translated_description, fixture)
{
  capabilities caps = source.get ("laser");

  BOOST_CHECK_EQ ("Kyocera", caps.manufacturer);
  BOOST_CHECK_EQ ("FS-600", caps.model);
  BOOST_CHECK_EQ (cache.lookup ("laser")->hash, caps.hash);
  BOOST_REQUIRE (caps.description.duplex);
  BOOST_CHECK_EQ (2u, caps.description.duplex->option ().size ());
  BOOST_CHECK (!caps.description.printing_speed);
}

BOOST_FIXTURE_TEST_CASE (unchanged_ppd_not_translated_again, fixture)
{
  capabilities first = source.get ("laser");

  // Tamper with the cached copy behind the cache's back.  Only a new
  // translation would notice.
  {
    std::ofstream os (cache.lookup ("laser")->path.c_str (),
                      std::ios::binary | std::ios::trunc);
    os << simplex_ppd;
  }

  capabilities second = source.get ("laser");

  BOOST_CHECK_EQ (first.hash, second.hash);
  BOOST_CHECK (second.description.duplex);
  BOOST_CHECK (!second.description.printing_speed);
}

BOOST_FIXTURE_TEST_CASE (changed_ppd_translated_again, fixture)
{
  capabilities first = source.get ("laser");

  server->set_ppd ("laser", simplex_ppd);
  capabilities second = source.get ("laser");

  BOOST_CHECK_NE (first.hash, second.hash);
  BOOST_CHECK (!second.description.duplex);
  BOOST_REQUIRE (second.description.printing_speed);
  BOOST_CHECK_EQ (8.0f, second.description.printing_speed->option[0].speed_ppm);
}

BOOST_FIXTURE_TEST_CASE (invalidate_forgets_everything, fixture)
{
  source.get ("laser");
  source.invalidate ("laser");

  BOOST_CHECK (!cache.lookup ("laser"));
  BOOST_CHECK_EQ (0u, dir.file_count ());

  capabilities caps = source.get ("laser");
  BOOST_CHECK (caps.description.duplex);
}

BOOST_FIXTURE_TEST_CASE (invalidate_drops_remembered_translation, fixture)
{
  source.get ("laser");
  BOOST_CHECK_EQ (1u, source.size ());

  source.invalidate ("laser");
  BOOST_CHECK_EQ (0u, source.size ());
}

BOOST_FIXTURE_TEST_CASE (invalidate_during_get, fixture)
{
  server->latency = milliseconds (20);

  for (int delay = 0; delay < 40; delay += 5)
    {
      source.get ("laser");
      server->set_ppd ("laser", (delay % 10 ? duplex_ppd : simplex_ppd));

      bool failed = false;
      std::thread t ([this, &failed] ()
        {
          try
            {
              source.get ("laser");
            }
          catch (const error&)
            {
              // the cached file went away with the entry
              failed = true;
            }
        });
      std::this_thread::sleep_for (milliseconds (delay));
      source.invalidate ("laser");
      t.join ();

      BOOST_TEST_MESSAGE ("delay " << delay << (failed ? ": failed" : ""));
      BOOST_CHECK_LE (source.size (), cache.size ());
      if (!cache.lookup ("laser"))
        BOOST_CHECK_EQ (0u, source.size ());

      source.invalidate ("laser");
    }
}

BOOST_FIXTURE_TEST_CASE (unknown_printer, fixture)
{
  BOOST_CHECK_THROW (source.get ("ghost"), server_error);
}

BOOST_AUTO_TEST_CASE (unreadable_ppd)
{
  BOOST_CHECK_THROW (read_ppd ("/nonexistent/printer.ppd"), resource_error);
}

#include "cupsconn/test/runner.ipp"
