//  configuration.cpp -- unit tests for run-time settings
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

#include <sstream>
#include <stdexcept>

#include <boost/program_options.hpp>

#include "cupsconn/configuration.hpp"
#include "cupsconn/log.hpp"
#include "cupsconn/test/tools.hpp"

using namespace cupsconn;

namespace po = boost::program_options;

namespace {

void
parse (configuration& cfg, int argc, const char *argv[])
{
  po::variables_map vm;
  po::store (po::parse_command_line (argc, argv, cfg.options ()), vm);
  po::notify (vm);
}

}       // namespace

BOOST_AUTO_TEST_CASE (defaults)
{
  configuration cfg;
  const char *argv[] = { "test" };
  parse (cfg, 1, argv);

  BOOST_CHECK_EQ (50u, cfg.max_connexions);
  BOOST_CHECK (std::chrono::seconds (5) == cfg.connect_timeout ());
  BOOST_CHECK (std::chrono::seconds (120) == cfg.max_connexion_age ());
  BOOST_CHECK (std::chrono::milliseconds (100) == cfg.release_grace ());
  BOOST_CHECK_EQ ("brief", cfg.log_level);
  BOOST_CHECK (!cfg.cache_dir.empty ());
  BOOST_CHECK (cfg.server.empty ());
  BOOST_CHECK_EQ (0, cfg.port);
}

BOOST_AUTO_TEST_CASE (command_line)
{
  configuration cfg;
  const char *argv[] = {
    "test",
    "--max-connections", "8",
    "--release-grace", "250",
    "--cache-dir", "/var/cache/cupsconn",
    "--server", "print.example.com",
  };
  parse (cfg, sizeof (argv) / sizeof (*argv), argv);

  BOOST_CHECK_EQ (8u, cfg.max_connexions);
  BOOST_CHECK (std::chrono::milliseconds (250) == cfg.release_grace ());
  BOOST_CHECK_EQ ("/var/cache/cupsconn", cfg.cache_dir);
  BOOST_CHECK_EQ ("print.example.com", cfg.server);
}

BOOST_AUTO_TEST_CASE (config_file)
{
  configuration cfg;
  std::istringstream is ("max-connection-age = 30\n"
                         "log-level = debug\n");

  po::variables_map vm;
  po::store (po::parse_config_file (is, cfg.options ()), vm);
  po::notify (vm);

  BOOST_CHECK (std::chrono::seconds (30) == cfg.max_connexion_age ());
  BOOST_CHECK_EQ ("debug", cfg.log_level);
}

BOOST_AUTO_TEST_CASE (logging_threshold)
{
  configuration cfg;

  cfg.log_level = "trace";
  cfg.apply_logging ();
  BOOST_CHECK_EQ (log::TRACE, log::threshold);

  cfg.log_level = "loud";
  BOOST_CHECK_THROW (cfg.apply_logging (), std::invalid_argument);

  log::threshold = log::ERROR;
}

#include "cupsconn/test/runner.ipp"
