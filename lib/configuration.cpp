//  configuration.cpp -- tunables for the print server bridge
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

#include <boost/filesystem/operations.hpp>

#include "cupsconn/configuration.hpp"
#include "cupsconn/log.hpp"

namespace cupsconn {

namespace po = boost::program_options;
namespace fs = boost::filesystem;

configuration::configuration ()
  : port (0)
  , max_connexions (50)
  , connect_timeout_s (5)
  , max_connexion_age_s (120)
  , release_grace_ms (100)
  , cache_dir ((fs::temp_directory_path () / "cupsconn").string ())
  , log_level ("brief")
{}

po::options_description
configuration::options ()
{
  po::options_description desc ("Configuration options");

  desc
    .add_options ()
    ("server", po::value< std::string > (&server)
     -> default_value (server),
     "print server host name")
    ("port", po::value< int > (&port)
     -> default_value (port),
     "print server port")
    ("max-connections", po::value< std::size_t > (&max_connexions)
     -> default_value (max_connexions),
     "concurrent print server sessions")
    ("connect-timeout", po::value< int > (&connect_timeout_s)
     -> default_value (connect_timeout_s),
     "seconds to wait for a session to be established")
    ("max-connection-age", po::value< int > (&max_connexion_age_s)
     -> default_value (max_connexion_age_s),
     "seconds after which a session is re-established")
    ("release-grace", po::value< int > (&release_grace_ms)
     -> default_value (release_grace_ms),
     "milliseconds an unused session is kept around")
    ("cache-dir", po::value< std::string > (&cache_dir)
     -> default_value (cache_dir),
     "where to keep local copies of PPD files")
    ("log-level", po::value< std::string > (&log_level)
     -> default_value (log_level),
     "one of fatal, alert, error, brief, trace or debug")
    ;

  return desc;
}

void
configuration::apply_logging () const
{
  log::threshold = log::to_priority (log_level);
}

std::chrono::steady_clock::duration
configuration::connect_timeout () const
{
  return std::chrono::seconds (connect_timeout_s);
}

std::chrono::steady_clock::duration
configuration::max_connexion_age () const
{
  return std::chrono::seconds (max_connexion_age_s);
}

std::chrono::steady_clock::duration
configuration::release_grace () const
{
  return std::chrono::milliseconds (release_grace_ms);
}

}       // namespace cupsconn
