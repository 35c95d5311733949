//  configuration.hpp -- tunables for the print server bridge
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

#ifndef cupsconn_configuration_hpp_
#define cupsconn_configuration_hpp_

#include <chrono>
#include <cstddef>
#include <string>

#include <boost/filesystem/path.hpp>
#include <boost/program_options.hpp>

namespace cupsconn {

//! Run-time settings with their compiled-in defaults
/*! The options() description binds directly to the members so that a
 *  notified variables_map leaves its values in place.
 */
struct configuration
{
  configuration ();

  boost::program_options::options_description options ();

  //! Sets log::threshold from \c log_level
  void apply_logging () const;

  std::chrono::steady_clock::duration connect_timeout () const;
  std::chrono::steady_clock::duration max_connexion_age () const;
  std::chrono::steady_clock::duration release_grace () const;

  //! Print server host, empty for the client library's default
  std::string server;
  //! Print server port, zero for the client library's default
  int         port;

  std::size_t max_connexions;
  int         connect_timeout_s;
  int         max_connexion_age_s;
  int         release_grace_ms;

  std::string cache_dir;
  std::string log_level;
};

}       // namespace cupsconn

#endif  /* cupsconn_configuration_hpp_ */
