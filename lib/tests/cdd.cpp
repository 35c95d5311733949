//  cdd.cpp -- unit tests for printer description types
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
#include <vector>

#include "cupsconn/cdd.hpp"
#include "cupsconn/test/tools.hpp"

using namespace cupsconn::cdd;

namespace {

std::vector< select_option >
options (const char *a, bool a_dflt, const char *b, bool b_dflt)
{
  std::vector< select_option > rv (2);
  rv[0].value = a;
  rv[0].is_default = a_dflt;
  rv[1].value = b;
  rv[1].is_default = b_dflt;
  return rv;
}

}       // namespace

BOOST_AUTO_TEST_CASE (single_default)
{
  select_capability cap (options ("Upper", false, "Lower", true));

  BOOST_CHECK_EQ (2u, cap.option ().size ());
  BOOST_CHECK_EQ ("Lower", cap.default_option ().value);
}

BOOST_AUTO_TEST_CASE (no_default)
{
  BOOST_CHECK_THROW (select_capability (options ("Upper", false,
                                                 "Lower", false)),
                     std::invalid_argument);
}

BOOST_AUTO_TEST_CASE (two_defaults)
{
  BOOST_CHECK_THROW (select_capability (options ("Upper", true,
                                                 "Lower", true)),
                     std::invalid_argument);
}

BOOST_AUTO_TEST_CASE (no_options)
{
  BOOST_CHECK_THROW (select_capability (std::vector< select_option > ()),
                     std::invalid_argument);
}

BOOST_AUTO_TEST_CASE (vendor_key_kept)
{
  std::vector< duplex_option > opts (1);
  opts[0].type = LONG_EDGE;
  opts[0].is_default = true;
  opts[0].vendor_id = "DuplexNoTumble";

  duplex_capability cap (opts, "Duplex");

  BOOST_CHECK_EQ ("Duplex", cap.vendor_key);
  BOOST_CHECK_EQ (LONG_EDGE, cap.default_option ().type);
}

BOOST_AUTO_TEST_CASE (enum_tags)
{
  BOOST_CHECK_EQ ("STANDARD_COLOR", std::string (to_string (STANDARD_COLOR)));
  BOOST_CHECK_EQ ("CUSTOM_MONOCHROME",
                  std::string (to_string (CUSTOM_MONOCHROME)));
  BOOST_CHECK_EQ ("SHORT_EDGE", std::string (to_string (SHORT_EDGE)));
  BOOST_CHECK_EQ ("BORDERLESS", std::string (to_string (BORDERLESS)));
  BOOST_CHECK_EQ ("TYPED_VALUE", std::string (to_string (TYPED_VALUE)));
  BOOST_CHECK_EQ ("STRING", std::string (to_string (STRING)));
}

BOOST_AUTO_TEST_CASE (empty_description_output)
{
  printer_description pd;
  std::ostringstream os;

  BOOST_CHECK_NO_THROW (os << pd);
}

#include "cupsconn/test/runner.ipp"
