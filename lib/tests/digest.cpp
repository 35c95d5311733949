//  digest.cpp -- unit tests for message digests
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

#include <algorithm>
#include <stdexcept>
#include <string>

#include "cupsconn/digest.hpp"
#include "cupsconn/test/tools.hpp"

using cupsconn::md5;

namespace {

std::string
hexdigest (const std::string& data)
{
  md5 sum;
  sum.update (data.data (), data.size ());
  return sum.hexdigest ();
}

}       // namespace

BOOST_AUTO_TEST_CASE (empty_input)
{
  BOOST_CHECK_EQ ("d41d8cd98f00b204e9800998ecf8427e", hexdigest (""));
}

BOOST_AUTO_TEST_CASE (known_input)
{
  BOOST_CHECK_EQ ("900150983cd24fb0d6963f7d28e17f72", hexdigest ("abc"));
  BOOST_CHECK_EQ ("9e107d9d372bb6826bd81d3542a419d6",
                  hexdigest ("The quick brown fox jumps over the lazy dog"));
}

BOOST_AUTO_TEST_CASE (piecewise_input)
{
  const std::string text ("The quick brown fox jumps over the lazy dog");

  md5 sum;
  for (std::string::size_type i = 0; i < text.size (); i += 7)
    {
      sum.update (text.data () + i,
                  std::min< std::size_t > (7, text.size () - i));
    }
  BOOST_CHECK_EQ (hexdigest (text), sum.hexdigest ());
}

BOOST_AUTO_TEST_CASE (no_update_after_finish)
{
  md5 sum;
  sum.hexdigest ();

  BOOST_CHECK_THROW (sum.update ("a", 1), std::logic_error);
}

#include "cupsconn/test/runner.ipp"
