//  native-object.cpp -- unit tests for native handle ownership
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

#include <vector>

#include <boost/foreach.hpp>
#include <boost/test/unit_test.hpp>

#include "tsunagi/device-manager.hpp"
#include "tsunagi/functional.hpp"
#include "tsunagi/native-object.hpp"
#include "tsunagi/thread.hpp"

#include "tsunagi/test/fake-library.hpp"

using namespace tsunagi;
using test::fake_library;

namespace {

struct fixture
{
  fake_library::ptr fake;
  native::library::ptr lib;

  fixture ()
    : fake (make_shared< fake_library > ())
    , lib (fake)
  {
    fake_library::device_spec dev ("fake:1", "Fake One");
    dev.props.push_back
      (fake_library::value_prop
       (native::property::document_handling_capabilities,
        native::property::capability::flatbed, false));
    dev.current_items.push_back (fake_library::item_spec ("Flatbed"));
    dev.flatbed_page = fake_library::page ();
    fake->devices.push_back (dev);
  }
};

//! Exposes the library accessor of a wrapper
struct bare_object
  : native::object
{
  bare_object (const native::access& token, native::handle h)
    : native::object (token, h)
  {}

  native::library& library () const
  {
    return lib ();
  }
};

void
open_and_release (native::library::ptr lib)
{
  for (int i = 0; i < 20; ++i)
    {
      native::device_manager::ptr mgr
        (native::device_manager::open (lib, native::current));
      native::device::ptr dev (mgr->find_device ("fake:1"));
      std::vector< native::item::ptr > items (dev->sub_items ());

      BOOST_FOREACH (native::item::ptr& it, items)
        {
          it->start_transfer ()->download ();
        }
    }
}

}       // namespace

BOOST_FIXTURE_TEST_SUITE (lifecycle, fixture)

BOOST_AUTO_TEST_CASE (release_is_idempotent)
{
  native::device_manager::ptr mgr
    (native::device_manager::open (lib, native::current));

  BOOST_CHECK (mgr->is_live ());
  BOOST_CHECK_EQUAL (1, fake->live_handles ());

  mgr->release ();
  mgr->release ();

  BOOST_CHECK (!mgr->is_live ());
  BOOST_CHECK_EQUAL (0, fake->live_handles ());
  BOOST_CHECK_EQUAL (1, fake->releases ());

  mgr.reset ();
  BOOST_CHECK_EQUAL (1, fake->releases ());
}

BOOST_AUTO_TEST_CASE (use_after_release_does_not_reach_library)
{
  native::device_manager::ptr mgr
    (native::device_manager::open (lib, native::current));
  native::device::ptr dev (mgr->find_device ("fake:1"));

  dev->release ();

  BOOST_CHECK_THROW (dev->handle (), native::use_after_release);
  BOOST_CHECK_THROW (dev->id (), native::use_after_release);
  BOOST_CHECK_THROW (dev->sub_items (), native::use_after_release);
}

BOOST_AUTO_TEST_CASE (null_handle_reports_last_error)
{
  native::device_manager::ptr mgr
    (native::device_manager::open (lib, native::current));

  try
    {
      mgr->find_device ("no-such-device");
      BOOST_ERROR ("expected handle_creation_failed");
    }
  catch (const native::handle_creation_failed& e)
    {
      BOOST_CHECK_EQUAL (native::status (fake_library::offline), e.code ());
    }
  BOOST_CHECK_EQUAL (1, fake->live_handles ());
}

BOOST_AUTO_TEST_CASE (wrappers_release_everything)
{
  {
    native::device_manager::ptr mgr
      (native::device_manager::open (lib, native::current));
    native::device::ptr dev (mgr->find_device ("fake:1"));
    std::vector< native::item::ptr > items (dev->sub_items ());
    std::vector< native::device_info::ptr > infos (mgr->device_infos ());

    BOOST_CHECK_EQUAL (1, items.size ());
    BOOST_CHECK_EQUAL (1, infos.size ());
    BOOST_CHECK_EQUAL (4, fake->live_handles ());
  }
  BOOST_CHECK_EQUAL (0, fake->live_handles ());
}

BOOST_AUTO_TEST_CASE (default_version_resolves)
{
  fake->default_api (native::legacy);

  native::device_manager::ptr mgr
    (native::device_manager::open (lib, native::default_version));

  BOOST_CHECK_EQUAL (native::legacy, mgr->version ());
}

BOOST_AUTO_TEST_SUITE_END (/* lifecycle */)

BOOST_FIXTURE_TEST_SUITE (exclusion, fixture)

BOOST_AUTO_TEST_CASE (monitor_is_reentrant)
{
  native::monitor& m (native::monitor::instance ());

  BOOST_CHECK (!m.is_held ());
  {
    native::access outer (lib);
    BOOST_CHECK (m.is_held ());
    {
      native::access inner (lib);
      BOOST_CHECK (m.is_held ());
    }
    BOOST_CHECK (m.is_held ());
  }
  BOOST_CHECK (!m.is_held ());
}

BOOST_AUTO_TEST_CASE (library_needs_the_monitor)
{
  shared_ptr< bare_object > obj;
  {
    native::access token (lib);
    obj = make_shared< bare_object >
      (token, token.lib ()->open_manager (native::current));
    BOOST_CHECK_EQUAL ("fake", obj->library ().name ());
  }

  BOOST_CHECK_THROW (obj->library (), native::not_locked);
  BOOST_CHECK_EQUAL (0, fake->unlocked_calls ());

  obj->release ();
  BOOST_CHECK_EQUAL (0, fake->live_handles ());
}

BOOST_AUTO_TEST_CASE (calls_are_serialised)
{
  fake->download_delay (2);

  std::vector< shared_ptr< thread > > threads;
  for (int i = 0; i < 4; ++i)
    {
      threads.push_back (make_shared< thread > (bind (open_and_release, lib)));
    }
  BOOST_FOREACH (shared_ptr< thread >& t, threads)
    {
      t->join ();
    }

  BOOST_CHECK_EQUAL (1, fake->max_concurrency ());
  BOOST_CHECK_EQUAL (0, fake->unlocked_calls ());
  BOOST_CHECK_EQUAL (80, fake->downloads ());
  BOOST_CHECK_EQUAL (0, fake->live_handles ());
}

BOOST_AUTO_TEST_SUITE_END (/* exclusion */)

BOOST_AUTO_TEST_CASE (closest_value_in_list)
{
  fake_library::ptr fake (make_shared< fake_library > ());
  fake_library::device_spec dev ("fake:2");
  fake_library::item_spec item ("Feeder");

  std::vector< int32_t > dpi;
  dpi.push_back (100);
  dpi.push_back (200);
  dpi.push_back (300);
  item.props.push_back
    (fake_library::list_prop (native::property::x_resolution, 100, dpi));
  item.props.push_back
    (fake_library::range_prop (native::property::brightness, 0,
                               -100, 100, 1));
  dev.current_items.push_back (item);
  fake->devices.push_back (dev);

  native::device_manager::ptr mgr
    (native::device_manager::open (fake, native::current));
  native::device::ptr d (mgr->find_device ("fake:2"));
  native::item::ptr it (d->find_sub_item ("Feeder"));

  BOOST_REQUIRE (it);

  int32_t value = 240;
  it->set_property_closest (native::property::x_resolution, value);
  BOOST_CHECK_EQUAL (200, value);
  BOOST_CHECK_EQUAL (200, it->value (native::property::x_resolution));

  it->set_property_range (native::property::brightness, 500, -1000, 1000);
  BOOST_CHECK_EQUAL (50, it->value (native::property::brightness));

  BOOST_CHECK_THROW (it->set_property (native::property::contrast, 1),
                     native::error);
}

#include "tsunagi/test/runner.ipp"
