//  fake-worker.cpp -- worker process on top of a scripted native library
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

#include <exception>
#include <string>
#include <vector>

#include <boost/foreach.hpp>
#include <boost/program_options.hpp>

#include "tsunagi/log.hpp"
#include "tsunagi/run-time.hpp"
#include "tsunagi/scan-driver.hpp"
#include "tsunagi/worker-service.hpp"

#include "tsunagi/test/fake-library.hpp"

namespace po = boost::program_options;

using namespace tsunagi;

//! Worker service on top of a scripted fake library
/*! The device has a flatbed and a feeder with a configurable number
 *  of pages.  Capabilities can be refused to exercise profile
 *  selection.
 */
int
main (int argc, char *argv[])
{
  try
    {
      run_time rt (argc, argv);

      std::vector< std::string > refused;
      unsigned pages;
      unsigned delay;
      native::status failure;

      po::options_description opts;
      opts
        .add_options ()
        ("refuse", po::value< std::vector< std::string > > (&refused))
        ("pages", po::value< unsigned > (&pages)->default_value (2))
        ("delay", po::value< unsigned > (&delay)->default_value (0))
        ("fail-downloads", po::value< native::status > (&failure)
         ->default_value (native::ok))
        ;

      po::variables_map vm;
      po::store (po::command_line_parser (rt.arguments ())
                 .options (opts).run (), vm);
      po::notify (vm);

      test::fake_library::ptr fake (make_shared< test::fake_library > ());
      fake->devices.push_back
        (test::make_device (native::property::capability::flatbed
                            | native::property::capability::feeder, pages));
      fake->download_delay (delay);
      fake->fail_downloads_with (failure);

      shared_ptr< native_scan_driver > drv
        (make_shared< native_scan_driver >
         (fake, image_loader::create (), "fake"));

      worker_service service (drv);
      BOOST_FOREACH (const std::string& capability, refused)
        {
          service.refuse (capability);
        }
      return service.run ();
    }
  catch (const std::exception& e)
    {
      log::fatal ("%1%") % e.what ();
    }
  return EXIT_FAILURE;
}
