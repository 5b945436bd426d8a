//  run-time.cpp -- unit tests for the run_time API
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

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <cstdlib>
#include <fstream>

#include <boost/filesystem.hpp>
#include <boost/test/unit_test.hpp>

#include "tsunagi/native-library.hpp"
#include "tsunagi/test/environment.hpp"
#include "../run-time.ipp"

namespace {

using tsunagi::run_time;

struct fixture
{
  const char *program_name_;

  fixture ()
    : program_name_("run-time-unit-test-runner")
  {}

  ~fixture ()
  {
    delete run_time::impl::instance_;
    run_time::impl::instance_ = 0;
  }
};

BOOST_FIXTURE_TEST_SUITE (program_name, fixture)

BOOST_AUTO_TEST_CASE (main_program)
{
  const char *argv[] = { "/usr/bin/" PACKAGE_TARNAME };

  run_time rt (1, argv);

  BOOST_CHECK_EQUAL (PACKAGE_TARNAME, rt.program ());
  BOOST_CHECK (rt.command ().empty ());
}

BOOST_AUTO_TEST_CASE (command_from_arguments)
{
  const char *argv[] = {
    PACKAGE_TARNAME, "scan", "--source", "feeder",
  };

  run_time rt (sizeof (argv) / sizeof (*argv), argv);

  BOOST_CHECK_EQUAL ("scan", rt.command ());
  BOOST_REQUIRE_EQUAL (2, rt.arguments ().size ());
  BOOST_CHECK_EQUAL ("--source", rt.arguments ()[0]);
  BOOST_CHECK_EQUAL ("feeder", rt.arguments ()[1]);
}

BOOST_AUTO_TEST_CASE (installed_helper)
{
  const char *argv[] = {
    "/usr/libexec/" PACKAGE_TARNAME "/" PACKAGE_TARNAME "-worker",
  };

  run_time rt (1, argv);

  BOOST_CHECK_EQUAL (PACKAGE_TARNAME, rt.program ());
  BOOST_CHECK_EQUAL ("worker", rt.command ());
}

BOOST_AUTO_TEST_CASE (helper_keeps_its_arguments)
{
  const char *argv[] = {
    PACKAGE_TARNAME "-worker", "--driver", "fake", "--refuse", "scan",
  };

  run_time rt (sizeof (argv) / sizeof (*argv), argv);

  BOOST_CHECK_EQUAL ("worker", rt.command ());
  BOOST_CHECK_EQUAL ("fake", rt["driver"].as< std::string > ());
  BOOST_REQUIRE_EQUAL (2, rt.arguments ().size ());
  BOOST_CHECK_EQUAL ("--refuse", rt.arguments ()[0]);
}

BOOST_AUTO_TEST_SUITE_END (/* program_name */)

BOOST_FIXTURE_TEST_SUITE (command_line_options, fixture)

BOOST_AUTO_TEST_CASE (non_std_option)
{
  const char *argv[] = {
    program_name_,
    "--non-std-option",
  };

  run_time rt (sizeof (argv) / sizeof (*argv), argv);

  BOOST_REQUIRE_EQUAL (0, rt.count ("non-std-option"));
  BOOST_CHECK_NE ("--non-std-option", rt.command ());
}

BOOST_AUTO_TEST_CASE (no_command_option_permutations)
{
  const char *argv[] = {
    program_name_,
    "version",
    "--help",
  };

  run_time rt (sizeof (argv) / sizeof (*argv), argv);

  BOOST_CHECK_EQUAL (0, rt.count ("help"));
}

BOOST_AUTO_TEST_CASE (defaults)
{
  const char *argv[] = { program_name_ };

  run_time rt (1, argv);

  BOOST_CHECK_EQUAL ("sane", rt["driver"].as< std::string > ());
  BOOST_CHECK_EQUAL ("default", rt["api-version"].as< std::string > ());
  BOOST_CHECK_CLOSE (30.0, rt.worker_timeout (), 0.001);
  BOOST_CHECK_EQUAL (0, rt.count ("worker-dir"));
}

BOOST_AUTO_TEST_CASE (worker_settings)
{
  const char *argv[] = {
    program_name_,
    "--worker-timeout", "2.5",
    "--worker-dir", "/opt/workers",
  };

  run_time rt (sizeof (argv) / sizeof (*argv), argv);

  BOOST_CHECK_CLOSE (2.5, rt.worker_timeout (), 0.001);
  BOOST_CHECK_EQUAL ("/opt/workers/" PACKAGE_TARNAME "-worker",
                     rt.locate (PACKAGE_TARNAME "-worker"));
}

BOOST_AUTO_TEST_SUITE_END (/* command_line_options */)

struct environment_fixture
  : fixture, tsunagi::test::environment
{
};

BOOST_FIXTURE_TEST_SUITE (environment_variables, environment_fixture)

BOOST_AUTO_TEST_CASE (mapped_onto_options)
{
  const char *argv[] = { program_name_ };

  setenv (PACKAGE_ENV_VAR_PREFIX "WORKER_TIMEOUT", "7");
  setenv (PACKAGE_ENV_VAR_PREFIX "DRIVER", "fake");

  run_time rt (1, argv);

  BOOST_CHECK_CLOSE (7.0, rt.worker_timeout (), 0.001);
  BOOST_CHECK (!rt["driver"].defaulted ());
  BOOST_CHECK_EQUAL ("fake", rt["driver"].as< std::string > ());
}

BOOST_AUTO_TEST_CASE (command_line_wins)
{
  const char *argv[] = { program_name_, "--driver", "wia" };

  setenv (PACKAGE_ENV_VAR_PREFIX "DRIVER", "fake");

  run_time rt (sizeof (argv) / sizeof (*argv), argv);

  BOOST_CHECK_EQUAL ("wia", rt["driver"].as< std::string > ());
}

BOOST_AUTO_TEST_CASE (unknown_variables_are_ignored)
{
  const char *argv[] = { program_name_ };

  setenv (PACKAGE_ENV_VAR_PREFIX "SHELL", "/bin/false");

  run_time rt (1, argv);

  BOOST_CHECK_EQUAL (0, rt.count ("shell"));
}

BOOST_AUTO_TEST_SUITE_END (/* environment_variables */)

//! Writes a configuration file that is removed again afterwards
struct config_fixture
  : environment_fixture
{
  boost::filesystem::path file;

  config_fixture ()
    : file (boost::filesystem::temp_directory_path ()
            / boost::filesystem::unique_path ("%%%%-%%%%.conf"))
  {}

  ~config_fixture ()
  {
    boost::filesystem::remove (file);
  }

  void write (const std::string& content)
  {
    std::ofstream ofs (file.string ().c_str ());
    ofs << content;
  }
};

BOOST_FIXTURE_TEST_SUITE (configuration_file, config_fixture)

BOOST_AUTO_TEST_CASE (known_and_free_form_keys)
{
  write ("driver = wia\n"
         "worker-timeout = 12\n"
         "no-more-pages.wia = 0x80210003, 17\n");

  std::string conf (file.string ());
  const char *argv[] = { program_name_, "--config", conf.c_str () };

  run_time rt (sizeof (argv) / sizeof (*argv), argv);

  BOOST_CHECK_EQUAL ("wia", rt["driver"].as< std::string > ());
  BOOST_CHECK_CLOSE (12.0, rt.worker_timeout (), 0.001);
  BOOST_CHECK (rt.setting ("no-more-pages.sane").empty ());

  std::set< tsunagi::native::status > statuses
    (tsunagi::native::to_status_set (rt.setting ("no-more-pages.wia")));
  BOOST_CHECK_EQUAL (2, statuses.size ());
  BOOST_CHECK_EQUAL (1, statuses.count (17));
}

BOOST_AUTO_TEST_CASE (environment_beats_file)
{
  write ("driver = wia\n");
  setenv (PACKAGE_ENV_VAR_PREFIX "DRIVER", "fake");

  std::string conf (file.string ());
  const char *argv[] = { program_name_, "--config", conf.c_str () };

  run_time rt (sizeof (argv) / sizeof (*argv), argv);

  BOOST_CHECK_EQUAL ("fake", rt["driver"].as< std::string > ());
}

BOOST_AUTO_TEST_CASE (missing_file)
{
  const char *argv[] = { program_name_, "--config", "/nonexistent.conf" };

  BOOST_CHECK_THROW (run_time (sizeof (argv) / sizeof (*argv), argv),
                     std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END (/* configuration_file */)

BOOST_AUTO_TEST_CASE (status_lists)
{
  using tsunagi::native::to_status_set;

  BOOST_CHECK (to_status_set ("").empty ());
  BOOST_CHECK_EQUAL (1, to_status_set (" 0x10 ").count (16));
  BOOST_CHECK_THROW (to_status_set ("17, paper-empty"),
                     std::invalid_argument);
}

} // namespace

#include "tsunagi/test/runner.ipp"
