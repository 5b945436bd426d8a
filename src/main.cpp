//  main.cpp -- scan from the command-line
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

#include <signal.h>

#include <cstdlib>

#include <exception>
#include <fstream>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include <boost/exception/diagnostic_information.hpp>
#include <boost/foreach.hpp>
#include <boost/optional.hpp>
#include <boost/program_options.hpp>
#include <boost/throw_exception.hpp>

#include <tsunagi/broker.hpp>
#include <tsunagi/cancel.hpp>
#include <tsunagi/format.hpp>
#include <tsunagi/functional.hpp>
#include <tsunagi/i18n.hpp>
#include <tsunagi/log.hpp>
#include <tsunagi/run-time.hpp>
#include <tsunagi/scan-driver.hpp>
#include <tsunagi/scan-performer.hpp>
#include <tsunagi/thread.hpp>

#include "filters/pnm.hpp"

namespace po = boost::program_options;

using namespace tsunagi;

using std::runtime_error;

namespace {

//! Writes pages to files named after a Boost.Format pattern
class page_writer
{
public:
  page_writer (const std::string& pattern)
    : pattern_(pattern)
    , count_(0)
  {}

  void write (const image::ptr& img)
  {
    std::string name ((format (pattern_) % (img->index () + 1)).str ());
    std::ofstream ofs (name.c_str (), std::ios::binary);

    _flt_::pnm::write (ofs, *img);
    if (!ofs)
      BOOST_THROW_EXCEPTION
        (runtime_error ((format (CCB_("%1%: cannot write page")) % name)
                        .str ()));

    std::cout << name << "\n";
    ++count_;
  }

  unsigned count () const { return count_; }

private:
  std::string pattern_;
  unsigned    count_;
};

void
show_progress (double fraction)
{
  std::cerr << "\r" << int (100 * fraction) << "%" << std::flush;
  if (1.0 <= fraction) std::cerr << "\n";
}

//! Forward SIGINT, SIGTERM and SIGHUP to a scan's cancel_source
/*! The signals are blocked in every thread and collected by a thread
 *  of their own so that cancellation never runs in a signal handler.
 */
void
wait_for_signals (sigset_t signals, cancel_source source)
{
  int sig = 0;
  if (0 != sigwait (&signals, &sig)) return;

  log::brief ("cancelling scan on signal %1%") % sig;
  source.cancel ();
}

sigset_t
block_signals ()
{
  sigset_t signals;
  sigemptyset (&signals);
  sigaddset (&signals, SIGINT);
  sigaddset (&signals, SIGTERM);
  sigaddset (&signals, SIGHUP);
  pthread_sigmask (SIG_BLOCK, &signals, nullptr);
  return signals;
}

void
print (const std::string& label, const boost::optional< per_source_caps >& c)
{
  if (!c) return;

  std::cout << label << ":\n";
  if (c->dpi_caps)
    {
      std::cout << "  " << CCB_("resolutions:");
      if (c->dpi_caps->is_range ())
        {
          std::cout << " " << *c->dpi_caps->min << ".." << *c->dpi_caps->max;
          if (c->dpi_caps->step)
            std::cout << " (" << *c->dpi_caps->step << ")";
        }
      else
        {
          BOOST_FOREACH (int32_t dpi, c->dpi_caps->values ())
            {
              std::cout << " " << dpi;
            }
        }
      std::cout << "\n";
    }
  if (c->bit_depth_caps)
    {
      std::cout << "  " << CCB_("modes:");
      if (c->bit_depth_caps->supports_color)
        std::cout << " " << to_string (color);
      if (c->bit_depth_caps->supports_grayscale)
        std::cout << " " << to_string (grayscale);
      if (c->bit_depth_caps->supports_black_and_white)
        std::cout << " " << to_string (black_and_white);
      std::cout << "\n";
    }
  if (c->page_size_caps)
    {
      std::cout << "  " << CCB_("maximum size:") << " "
                << c->page_size_caps->width << "x"
                << c->page_size_caps->height << " (1/1000 in)\n";
    }
}

device_descriptor
find_device (const std::vector< device_descriptor >& devices,
             const std::string& id)
{
  if (devices.empty ())
    BOOST_THROW_EXCEPTION
      (runtime_error (CCB_("no usable devices available")));

  if (id.empty ()) return devices.front ();

  BOOST_FOREACH (const device_descriptor& dev, devices)
    {
      if (id == dev.id ()) return dev;
    }
  BOOST_THROW_EXCEPTION
    (runtime_error ((format (CCB_("%1%: not found")) % id).str ()));
}

}       // namespace

int
main (int argc, char *argv[])
{
  int status = EXIT_SUCCESS;

  try
    {
      run_time rt (argc, argv, true);

      if (rt.count ("help"))
        {
          std::cout << rt.help (CCB_("scan through native driver libraries"))
                    << "\n"
                    << CCB_("Commands: list, caps [DEVICE], scan [DEVICE]")
                    << "\n";
          return EXIT_SUCCESS;
        }
      if (rt.count ("version"))
        {
          std::cout << rt.version ();
          return EXIT_SUCCESS;
        }

      std::string cmd (rt.command ().empty () ? "list" : rt.command ());
      if ("list" != cmd && "caps" != cmd && "scan" != cmd)
        BOOST_THROW_EXCEPTION
          (runtime_error ((format (CCB_("%1%: unknown command")) % cmd)
                          .str ()));

      std::string device_id;
      std::string source;
      std::string mode;
      std::string output;
      std::string size;
      int32_t resolution;

      po::options_description cmd_opts (CCB_("Command options"));
      cmd_opts
        .add_options ()
        ("device", po::value< std::string > (&device_id),
         CCB_("device identifier, the first one found if not given"))
        ("source", po::value< std::string > (&source)
         ->default_value ("auto"),
         CCB_("paper source: auto, flatbed, feeder or duplex"))
        ("resolution", po::value< int32_t > (&resolution)
         ->default_value (300),
         CCB_("resolution in dots per inch"))
        ("mode", po::value< std::string > (&mode)
         ->default_value ("color"),
         CCB_("color, grayscale or black-and-white"))
        ("size", po::value< std::string > (&size)
         ->default_value ("letter"),
         CCB_("page size: letter or a4"))
        ("native-ui", po::bool_switch (),
         CCB_("let the driver's own dialog configure the scan"))
        ("output", po::value< std::string > (&output)
         ->default_value ("page-%1%.pnm"),
         CCB_("file name pattern for scanned pages"))
        ;

      po::positional_options_description cmd_pos;
      cmd_pos.add ("device", 1);

      po::variables_map cmd_vm;
      po::store (po::command_line_parser (rt.arguments ())
                 .options (cmd_opts)
                 .positional (cmd_pos)
                 .run (), cmd_vm);
      po::notify (cmd_vm);

      std::string driver (rt["driver"].as< std::string > ());
      native::api_version api
        (native::to_api_version (rt["api-version"].as< std::string > ()));

      broker::ptr workers
        (make_shared< broker > (driver, broker::default_profiles (),
                                rt.worker_timeout ()));

      scan_driver::ptr drv
        (broker::make_driver (workers, image_loader::create ()));

      shared_ptr< native_scan_driver > nd
        (dynamic_pointer_cast< native_scan_driver > (drv));
      std::string statuses (rt.setting ("no-more-pages." + driver));
      if (nd && !statuses.empty ())
        nd->no_more_pages (native::to_status_set (statuses));

      sigset_t signals (block_signals ());
      scan_performer performer (drv);

      std::vector< device_descriptor > devices
        (performer.get_devices (api).get ());

      if ("list" == cmd)
        {
          BOOST_FOREACH (const device_descriptor& dev, devices)
            {
              std::cout << dev.id () << "\t" << dev.name () << "\n";
            }
          return EXIT_SUCCESS;
        }

      scan_options options;
      options.device        = find_device (devices, device_id);
      options.paper_source  = to_paper_source (source);
      options.dpi           = resolution;
      options.bit_depth     = to_bit_depth (mode);
      options.api_version   = api;
      options.use_native_ui = cmd_vm["native-ui"].as< bool > ();
      if ("a4" == size)
        options.page_size   = page_size::a4 ();
      else if ("letter" != size)
        BOOST_THROW_EXCEPTION
          (std::invalid_argument ((format (CCB_("%1%: unknown page size"))
                                   % size).str ()));

      if ("caps" == cmd)
        {
          scan_caps caps (performer.get_caps (options).get ());

          std::cout << caps.metadata_caps.manufacturer << " "
                    << caps.metadata_caps.model << "\n";
          print (to_string (flatbed), caps.flatbed_caps);
          print (to_string (feeder) , caps.feeder_caps);
          print (to_string (duplex) , caps.duplex_caps);
          return EXIT_SUCCESS;
        }

      page_writer writer (output);
      performer.connect_page (bind (&page_writer::write, &writer,
                                   placeholders::_1));
      performer.connect_page_progress (&show_progress);

      cancel_source cancel;
      thread waiter (bind (wait_for_signals, signals, cancel));
      waiter.detach ();

      performer.scan (options, cancel.token ()).get ();

      if (cancel.is_cancellation_requested ())
        {
          std::cerr << message (system_error::user_cancelled) << "\n";
          status = EXIT_FAILURE;
        }
      else if (!writer.count ())
        {
          std::cerr << CCB_("no pages were scanned") << "\n";
        }
    }
  catch (const system_error& e)
    {
      std::cerr << (std::string (e.what ()).empty ()
                    ? message (e.code ())
                    : std::string (e.what ()))
                << "\n";
      return EXIT_FAILURE;
    }
  catch (const boost::exception& e)
    {
      std::cerr << boost::diagnostic_information (e);
      return EXIT_FAILURE;
    }
  catch (const std::exception& e)
    {
      std::cerr << e.what () << "\n";
      return EXIT_FAILURE;
    }

  return status;
}
