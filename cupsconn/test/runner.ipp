//  runner.ipp -- main() implementation for test runners
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

#ifndef cupsconn_test_runner_ipp_
#define cupsconn_test_runner_ipp_

/*! \file
 *  Boost.Test can generate a test runner's \c ::main function.  The
 *  runners here want their master test suite named after the module
 *  and suite they exercise so this file implements a custom version.
 *
 *  Include this file at the \e end of each test runner implementation
 *  and define \c CUPSCONN_TEST_MODULE and \c CUPSCONN_TEST_SUITE on
 *  the compiler's command-line.  The build files take care of that.
 */

#include <string>

#include <boost/test/unit_test.hpp>

// This is defined in <boost/test/parameterized_test.hpp>.  When that
// file is included before this one, users need to implement their own
// init_test_runner().

#ifndef BOOST_PARAM_TEST_CASE
bool
init_test_runner ()
{
  return true;
}
#endif  /* BOOST_PARAM_TEST_CASE */

int
main (int argc, char *argv[])
{
  namespace but = boost::unit_test;

  std::string test_module = CUPSCONN_TEST_MODULE;
  test_module += "::";
  test_module += CUPSCONN_TEST_SUITE;

  but::framework::master_test_suite ().p_name.value = test_module;

  return but::unit_test_main (init_test_runner, argc, argv);
}

#endif /* cupsconn_test_runner_ipp_ */
