//  scan-performer.cpp -- unit tests for the threaded scan performer
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

#include <string>
#include <vector>

#include <boost/test/unit_test.hpp>

#include "tsunagi/functional.hpp"
#include "tsunagi/mutex.hpp"
#include "tsunagi/scan-performer.hpp"
#include "tsunagi/thread.hpp"

using namespace tsunagi;

namespace {

//! Records the order in which operations reach the driver
class recording_driver
  : public scan_driver
{
public:
  recording_driver ()
    : pages (2)
  {}

  std::vector< device_descriptor >
  get_devices (native::api_version)
  {
    note ("devices");
    return std::vector< device_descriptor >
      (1, device_descriptor ("fake", "fake:1", "Fake Scanner"));
  }

  scan_caps
  get_caps (const scan_options&)
  {
    note ("caps");
    BOOST_THROW_EXCEPTION
      (system_error (system_error::device_busy, "busy", 42));
  }

  void
  scan (const scan_options&, scan_events& events,
        const page_callback& on_page, const cancel_token& token)
  {
    note ("scan");
    for (unsigned i = 0; i < pages; ++i)
      {
        if (token.is_cancellation_requested ()) return;

        events.page_start ();
        events.page_progress (1.0);

        image::ptr img (make_shared< image > (image::gray, 1, 1));
        img->index (i);
        on_page (img);
      }
  }

  std::vector< std::string > calls ()
  {
    lock_guard< mutex > lock (mutex_);
    return calls_;
  }

  unsigned pages;

private:
  void note (const std::string& call)
  {
    lock_guard< mutex > lock (mutex_);
    calls_.push_back (call);
  }

  mutex mutex_;
  std::vector< std::string > calls_;
};

struct fixture
{
  shared_ptr< recording_driver > driver;
  std::vector< unsigned > indices;
  std::vector< thread::id > page_threads;
  unsigned starts;

  fixture ()
    : driver (make_shared< recording_driver > ())
    , starts (0)
  {}

  void on_page (const image::ptr& img)
  {
    indices.push_back (img->index ());
    page_threads.push_back (this_thread::get_id ());
  }

  void on_start ()
  {
    ++starts;
  }
};

}       // namespace

BOOST_FIXTURE_TEST_SUITE (performer, fixture)

BOOST_AUTO_TEST_CASE (results_come_back)
{
  scan_performer sp (driver);

  std::vector< device_descriptor > devices
    (sp.get_devices (native::current).get ());

  BOOST_REQUIRE_EQUAL (1, devices.size ());
  BOOST_CHECK_EQUAL ("fake:1", devices[0].id ());
}

BOOST_AUTO_TEST_CASE (errors_come_back)
{
  scan_performer sp (driver);
  future< scan_caps > caps (sp.get_caps (scan_options ()));

  try
    {
      caps.get ();
      BOOST_FAIL ("exception expected");
    }
  catch (const system_error& e)
    {
      BOOST_CHECK_EQUAL (system_error::device_busy, e.code ());
      BOOST_CHECK_EQUAL (42, e.native_code ());
    }
}

BOOST_AUTO_TEST_CASE (operations_run_in_request_order)
{
  scan_performer sp (driver);

  future< void > scan (sp.scan (scan_options (), cancel_token ()));
  future< scan_caps > caps (sp.get_caps (scan_options ()));
  future< std::vector< device_descriptor > > devices
    (sp.get_devices (native::legacy));

  devices.get ();

  std::vector< std::string > calls (driver->calls ());
  BOOST_REQUIRE_EQUAL (3, calls.size ());
  BOOST_CHECK_EQUAL ("scan", calls[0]);
  BOOST_CHECK_EQUAL ("caps", calls[1]);
  BOOST_CHECK_EQUAL ("devices", calls[2]);
}

BOOST_AUTO_TEST_CASE (pages_are_signalled_off_the_calling_thread)
{
  driver->pages = 3;
  scan_performer sp (driver);
  scoped_connection page
    (sp.connect_page (bind (&fixture::on_page, this, placeholders::_1)));
  scoped_connection start
    (sp.connect_page_start (bind (&fixture::on_start, this)));

  sp.scan (scan_options (), cancel_token ()).get ();

  BOOST_REQUIRE_EQUAL (3, indices.size ());
  for (unsigned i = 0; i < indices.size (); ++i)
    {
      BOOST_CHECK_EQUAL (i, indices[i]);
      BOOST_CHECK (this_thread::get_id () != page_threads[i]);
    }
  BOOST_CHECK_EQUAL (3, starts);
}

BOOST_AUTO_TEST_CASE (cancelled_scan_completes)
{
  scan_performer sp (driver);
  scoped_connection page
    (sp.connect_page (bind (&fixture::on_page, this, placeholders::_1)));
  cancel_source source;

  source.cancel ();
  BOOST_CHECK_NO_THROW (sp.scan (scan_options (), source.token ()).get ());
  BOOST_CHECK (indices.empty ());
}

BOOST_AUTO_TEST_CASE (pending_work_finishes_before_destruction)
{
  {
    scan_performer sp (driver);
    sp.scan (scan_options (), cancel_token ());
    sp.get_devices (native::current);
  }
  BOOST_CHECK_EQUAL (2, driver->calls ().size ());
}

BOOST_AUTO_TEST_SUITE_END (/* performer */)

#include "tsunagi/test/runner.ipp"
