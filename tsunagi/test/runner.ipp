//  runner.ipp -- custom test runner main function
//  Copyright (C) 2012-2015  SEIKO EPSON CORPORATION
//
//  License: GPL-3.0+
//  Author : EPSON AVASYS CORPORATION
//
//  This file is part of the 'Tsunagi' package.
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

#ifndef tsunagi_test_runner_ipp_
#define tsunagi_test_runner_ipp_

/*! \file
 *  Boost.Test can generate a test runner's \c ::main function.  Our
 *  test runners name their master test suite after the module and
 *  suite under test, which that \c ::main does not do, so this file
 *  implements a custom version.
 *
 *  Include this file at the \e end of each test runner implementation
 *  with \c TSUNAGI_TEST_MODULE and \c TSUNAGI_TEST_SUITE defined on
 *  the compiler's command-line.  The build files take care of that.
 */

#include <cstdlib>

#include <boost/test/unit_test.hpp>

#ifndef TSUNAGI_TEST_MODULE
#define TSUNAGI_TEST_MODULE "tsunagi"
#endif
#ifndef TSUNAGI_TEST_SUITE
#define TSUNAGI_TEST_SUITE "unknown"
#endif

#ifdef ENABLE_TEST_REPORTS

#include <boost/test/results_reporter.hpp>
#include <fstream>

//! Save the report as \c TSUNAGI_TEST_SUITE \c -report.xml
/*! It is assumed that XML output was requested, either through the
 *  \c BOOST_TEST_REPORT_FORMAT environment variable or the matching
 *  command-line option.
 */
struct report_redirector
{
  std::ofstream report;

  report_redirector ()
    : report (TSUNAGI_TEST_SUITE "-report.xml")
  {
    if (!report.is_open ()) std::abort ();
    boost::unit_test::results_reporter::set_stream (report);
  }
};

static report_redirector fixture;

#endif  /* ENABLE_TEST_REPORTS */

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

//! Run a test runner
/*! Sets the master test suite name and hands over to Boost.Test with
 *  init_test_runner() as the initialisation function.
 */
int
main (int argc, char *argv[])
{
  namespace but = boost::unit_test;

  std::string test_module = TSUNAGI_TEST_MODULE;
  test_module += "::";
  test_module += TSUNAGI_TEST_SUITE;

  but::framework::master_test_suite ().p_name.value = test_module;

  return but::unit_test_main (init_test_runner, argc, argv);
}

#endif /* tsunagi_test_runner_ipp_ */
