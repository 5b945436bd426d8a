//  worker.cpp -- host a native driver library for another process
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
#include <iostream>
#include <string>

#include <tsunagi/i18n.hpp>
#include <tsunagi/log.hpp>
#include <tsunagi/memory.hpp>
#include <tsunagi/native-library.hpp>
#include <tsunagi/run-time.hpp>
#include <tsunagi/scan-driver.hpp>
#include <tsunagi/worker-service.hpp>

using namespace tsunagi;

int
main (int argc, char *argv[])
{
  try
    {
      run_time rt (argc, argv);

      if (rt.count ("help"))
        {
          std::cout << rt.help
            (CCB_("host a native driver library for another process"));
          return EXIT_SUCCESS;
        }
      if (rt.count ("version"))
        {
          std::cout << rt.version ();
          return EXIT_SUCCESS;
        }

      std::string driver (rt["driver"].as< std::string > ());
      shared_ptr< native_scan_driver > drv;

      try
        {
          drv = make_shared< native_scan_driver >
            (native::library::create (driver), image_loader::create (),
             driver);
        }
      catch (const std::runtime_error& e)
        {
          // probes will report the driver as unsupported
          log::error ("%1%: %2%") % driver % e.what ();
        }

      if (drv)
        {
          std::string statuses (rt.setting ("no-more-pages." + driver));
          if (!statuses.empty ())
            drv->no_more_pages (native::to_status_set (statuses));
        }

      worker_service service (drv);
      return service.run ();
    }
  catch (const std::exception& e)
    {
      log::fatal ("%1%") % e.what ();
    }
  return EXIT_FAILURE;
}
