//  scan-driver.cpp -- unit tests for the native scan protocol
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
#include "tsunagi/scan-driver.hpp"

#include "tsunagi/test/fake-library.hpp"

using namespace tsunagi;
using test::fake_library;
using test::make_device;

namespace prop = native::property;

namespace {

class delegate
  : public native_ui_delegate
{
public:
  delegate (const native::configuration& config)
    : config_(config)
    , calls (0)
  {}

  boost::optional< native::configuration >
  configure (const std::string&, const std::string&, native::window_handle)
  {
    ++calls;
    return config_;
  }

  native::configuration config_;
  unsigned calls;
};

struct fixture
{
  fake_library::ptr fake;
  shared_ptr< native_scan_driver > driver;
  scan_options options;
  scan_events  events;
  cancel_source source;

  std::vector< image::ptr > pages;
  unsigned page_starts;
  unsigned cancel_after;

  fixture ()
    : fake (make_shared< fake_library > ())
    , page_starts (0)
    , cancel_after (0)
  {
    driver = make_shared< native_scan_driver >
      (fake, image_loader::create (), "fake");
    options.device = device_descriptor ("fake", "fake:1", "Fake Scanner");
    events.page_start.connect (bind (&fixture::on_page_start, this));
  }

  void on_page (const image::ptr& img)
  {
    pages.push_back (img);
    if (cancel_after && cancel_after == pages.size ())
      source.cancel ();
  }

  void on_page_start ()
  {
    ++page_starts;
  }

  void scan ()
  {
    driver->scan (options, events,
                  bind (&fixture::on_page, this, placeholders::_1),
                  source.token ());
  }

  system_error::error_code scan_error ()
  {
    try
      {
        scan ();
      }
    catch (const system_error& e)
      {
        return e.code ();
      }
    return system_error::no_error;
  }
};

}       // namespace

BOOST_FIXTURE_TEST_SUITE (transfer, fixture)

BOOST_AUTO_TEST_CASE (flatbed_downloads_once)
{
  fake->devices.push_back
    (make_device (prop::capability::flatbed | prop::capability::feeder, 3));
  options.paper_source = flatbed;

  scan ();

  BOOST_CHECK_EQUAL (1, fake->downloads ());
  BOOST_REQUIRE_EQUAL (1, pages.size ());
  BOOST_CHECK_EQUAL (0x10, pages[0]->data ()[0]);
  BOOST_CHECK_EQUAL (2, page_starts);
  BOOST_CHECK_EQUAL (native_scan_driver::completed, driver->current_state ());
  BOOST_CHECK_EQUAL (0, fake->live_handles ());
}

BOOST_AUTO_TEST_CASE (legacy_feeder_downloads_until_empty)
{
  fake->devices.push_back (make_device (prop::capability::feeder, 3));
  options.paper_source = feeder;
  options.api_version  = native::legacy;

  scan ();

  BOOST_CHECK_EQUAL (4, fake->downloads ());
  BOOST_REQUIRE_EQUAL (3, pages.size ());
  for (unsigned i = 0; i < pages.size (); ++i)
    {
      BOOST_CHECK_EQUAL (i, pages[i]->index ());
      BOOST_CHECK_EQUAL (0x20 + i, unsigned (pages[i]->data ()[0]));
    }
  BOOST_CHECK_EQUAL (4, page_starts);

  int32_t select = 0;
  BOOST_CHECK (fake->was_set (prop::document_handling_select, select));
  BOOST_CHECK_EQUAL (prop::select::feeder, select);
  BOOST_CHECK_EQUAL (0, fake->live_handles ());
}

BOOST_AUTO_TEST_CASE (current_feeder_downloads_once)
{
  fake->devices.push_back (make_device (prop::capability::feeder, 3));
  options.paper_source = feeder;
  options.api_version  = native::current;

  scan ();

  BOOST_CHECK_EQUAL (1, fake->downloads ());
  BOOST_CHECK_EQUAL (3, pages.size ());

  int32_t select = 0;
  BOOST_CHECK (fake->was_set (prop::document_handling_select, select));
  BOOST_CHECK_EQUAL (prop::select::front_only, select);
}

BOOST_AUTO_TEST_CASE (auto_source_prefers_flatbed)
{
  fake->devices.push_back
    (make_device (prop::capability::flatbed | prop::capability::feeder, 2));

  scan ();

  BOOST_CHECK_EQUAL (1, pages.size ());
  BOOST_CHECK_EQUAL (0x10, pages[0]->data ()[0]);
}

BOOST_AUTO_TEST_CASE (auto_source_without_flatbed)
{
  fake->devices.push_back (make_device (prop::capability::feeder, 2));
  options.api_version = native::legacy;

  scan ();

  BOOST_CHECK_EQUAL (2, pages.size ());
}

BOOST_AUTO_TEST_CASE (falls_back_to_legacy_api)
{
  fake->devices.push_back (make_device (prop::capability::flatbed, 0));
  fake->default_api (native::current);
  fake->fail_devices_for (native::current);
  options.paper_source = flatbed;

  scan ();

  BOOST_CHECK_EQUAL (1, pages.size ());
  BOOST_CHECK_EQUAL (native_scan_driver::completed, driver->current_state ());
  BOOST_CHECK_EQUAL (0, fake->live_handles ());
}

BOOST_AUTO_TEST_CASE (no_fall_back_for_explicit_version)
{
  fake->devices.push_back (make_device (prop::capability::flatbed, 0));
  fake->fail_devices_for (native::current);
  options.paper_source = flatbed;
  options.api_version  = native::current;

  BOOST_CHECK_EQUAL (system_error::device_error, scan_error ());
  BOOST_CHECK_EQUAL (native_scan_driver::failed, driver->current_state ());
  BOOST_CHECK (pages.empty ());
}

BOOST_AUTO_TEST_CASE (duplex_needs_support)
{
  fake->devices.push_back
    (make_device (prop::capability::flatbed | prop::capability::feeder, 2));
  options.paper_source = duplex;

  BOOST_CHECK_EQUAL (system_error::no_duplex_support, scan_error ());
  BOOST_CHECK_EQUAL (0, fake->downloads ());
  BOOST_CHECK_EQUAL (0, fake->live_handles ());
}

BOOST_AUTO_TEST_CASE (feeder_needs_support)
{
  fake->devices.push_back (make_device (prop::capability::flatbed, 0));
  options.paper_source = feeder;

  BOOST_CHECK_EQUAL (system_error::no_feeder_support, scan_error ());
  BOOST_CHECK_EQUAL (0, fake->downloads ());
}

BOOST_AUTO_TEST_CASE (empty_feeder)
{
  fake->devices.push_back (make_device (prop::capability::feeder, 0));
  options.paper_source = feeder;
  options.api_version  = native::legacy;

  BOOST_CHECK_EQUAL (system_error::feeder_empty, scan_error ());
  BOOST_CHECK_EQUAL (1, fake->downloads ());
  BOOST_CHECK_EQUAL (0, fake->live_handles ());
}

BOOST_AUTO_TEST_CASE (cancel_mid_feed)
{
  fake->devices.push_back (make_device (prop::capability::feeder, 5));
  options.paper_source = feeder;
  options.api_version  = native::legacy;
  cancel_after = 2;

  BOOST_CHECK_NO_THROW (scan ());

  BOOST_CHECK_EQUAL (2, pages.size ());
  BOOST_CHECK_EQUAL (2, fake->downloads ());
  BOOST_CHECK_EQUAL (native_scan_driver::cancelled, driver->current_state ());
  BOOST_CHECK_EQUAL (0, fake->live_handles ());
}

BOOST_AUTO_TEST_CASE (cancel_before_start)
{
  fake->devices.push_back (make_device (prop::capability::feeder, 5));
  source.cancel ();

  scan ();

  BOOST_CHECK (pages.empty ());
  BOOST_CHECK_EQUAL (0, fake->downloads ());
  BOOST_CHECK_EQUAL (native_scan_driver::cancelled, driver->current_state ());
}

BOOST_AUTO_TEST_CASE (garbled_page)
{
  fake_library::device_spec dev (make_device (prop::capability::flatbed, 0));
  dev.flatbed_page = octet_buffer (16, 'x');
  fake->devices.push_back (dev);
  options.paper_source = flatbed;

  BOOST_CHECK_EQUAL (system_error::device_communication_error, scan_error ());
  BOOST_CHECK_EQUAL (0, fake->live_handles ());
}

BOOST_AUTO_TEST_CASE (empty_payload_is_ignored)
{
  fake_library::device_spec dev (make_device (prop::capability::flatbed, 0));
  dev.flatbed_page.clear ();
  fake->devices.push_back (dev);
  options.paper_source = flatbed;

  BOOST_CHECK_NO_THROW (scan ());
  BOOST_CHECK (pages.empty ());
}

BOOST_AUTO_TEST_CASE (device_errors_are_typed)
{
  fake->devices.push_back (make_device (prop::capability::flatbed, 0));
  fake->fail_downloads_with (fake_library::paper_jam);
  options.paper_source = flatbed;

  BOOST_CHECK_EQUAL (system_error::media_jam, scan_error ());
}

BOOST_AUTO_TEST_SUITE_END (/* transfer */)

BOOST_FIXTURE_TEST_SUITE (configuration, fixture)

BOOST_AUTO_TEST_CASE (closest_resolution)
{
  fake->devices.push_back (make_device (prop::capability::flatbed, 0));
  options.paper_source = flatbed;
  options.dpi = 310;
  options.bit_depth = grayscale;

  scan ();

  int32_t value = 0;
  BOOST_CHECK (fake->was_set (prop::x_resolution, value));
  BOOST_CHECK_EQUAL (300, value);
  BOOST_CHECK (fake->was_set (prop::data_type, value));
  BOOST_CHECK_EQUAL (prop::data::grayscale, value);
  BOOST_CHECK (fake->was_set (prop::y_extent, value));
  BOOST_CHECK_EQUAL (3300, value);
  BOOST_CHECK (driver->property_failures ().empty ());
}

BOOST_AUTO_TEST_CASE (brightness_maps_onto_native_range)
{
  fake->devices.push_back (make_device (prop::capability::flatbed, 0));
  options.paper_source = flatbed;
  options.brightness = 1000;
  options.contrast = -500;

  scan ();

  int32_t value = 0;
  BOOST_CHECK (fake->was_set (prop::brightness, value));
  BOOST_CHECK_EQUAL (100, value);
  BOOST_CHECK (fake->was_set (prop::contrast, value));
  BOOST_CHECK_EQUAL (-50, value);
}

BOOST_AUTO_TEST_CASE (brightness_after_scan_leaves_device_alone)
{
  fake->devices.push_back (make_device (prop::capability::flatbed, 0));
  options.paper_source = flatbed;
  options.brightness = 1000;
  options.brightness_contrast_after_scan = true;

  scan ();

  int32_t value = 0;
  BOOST_CHECK (!fake->was_set (prop::brightness, value));
}

BOOST_AUTO_TEST_CASE (unsupported_properties_are_not_fatal)
{
  fake_library::device_spec dev (make_device (prop::capability::flatbed, 0));
  std::vector< native::property_value >& props (dev.current_items[0].props);
  props.erase (props.begin () + 9);             // contrast
  fake->devices.push_back (dev);
  options.paper_source = flatbed;

  BOOST_CHECK_NO_THROW (scan ());
  BOOST_CHECK_EQUAL (1, pages.size ());
  BOOST_CHECK_EQUAL (1, driver->property_failures ().size ());
}

BOOST_AUTO_TEST_CASE (native_dialog_dismissed)
{
  fake->devices.push_back (make_device (prop::capability::flatbed, 0));
  fake->dialog_picks (-1);
  options.use_native_ui = true;

  BOOST_CHECK_NO_THROW (scan ());
  BOOST_CHECK (pages.empty ());
  BOOST_CHECK_EQUAL (0, fake->downloads ());
  BOOST_CHECK_EQUAL (native_scan_driver::cancelled, driver->current_state ());
}

BOOST_AUTO_TEST_CASE (native_dialog_from_elsewhere)
{
  fake->devices.push_back (make_device (prop::capability::flatbed, 0));
  options.use_native_ui = true;
  options.api_version = native::legacy;

  native::configuration config;
  config.item_name = "Scan";
  config.item_props[prop::x_resolution] = 150;
  config.item_props[prop::y_resolution] = 300;
  shared_ptr< delegate > d (make_shared< delegate > (config));
  driver->native_ui (d);

  scan ();

  BOOST_CHECK_EQUAL (1, d->calls);
  BOOST_CHECK_EQUAL (1, pages.size ());

  int32_t value = 0;
  BOOST_CHECK (fake->was_set (prop::x_resolution, value));
  BOOST_CHECK_EQUAL (150, value);
  BOOST_CHECK (!fake->was_set (prop::y_resolution, value));
}

BOOST_AUTO_TEST_CASE (native_dialog_outcome_is_captured)
{
  fake->devices.push_back (make_device (prop::capability::flatbed, 0));

  native::property_map props;
  props[prop::x_resolution] = 600;
  fake->dialog_picks (0, props);

  boost::optional< native::configuration > config
    (driver->configure ("fake:1", 0));

  BOOST_REQUIRE (config);
  BOOST_CHECK_EQUAL ("Scan", config->item_name);
  BOOST_CHECK_EQUAL (600, config->item_props[prop::x_resolution]);
  BOOST_CHECK_EQUAL (0, fake->live_handles ());
}

BOOST_AUTO_TEST_SUITE_END (/* configuration */)

BOOST_FIXTURE_TEST_SUITE (negotiation, fixture)

BOOST_AUTO_TEST_CASE (feeder_only_caps)
{
  fake_library::device_spec dev (make_device (prop::capability::feeder, 0));
  fake_library::item_spec& item (dev.current_items[0]);

  std::vector< int32_t > dpi;
  dpi.push_back (100);
  dpi.push_back (200);
  dpi.push_back (300);
  std::vector< int32_t > types;
  types.push_back (prop::data::grayscale);
  types.push_back (prop::data::color);

  item.props[0] = fake_library::list_prop (prop::x_resolution, 100, dpi);
  item.props[2] = fake_library::list_prop (prop::data_type, 3, types);
  fake->devices.push_back (dev);
  options.api_version = native::current;

  scan_caps caps (driver->get_caps (options));

  BOOST_CHECK (!caps.paper_source_caps.supports_flatbed);
  BOOST_CHECK (caps.paper_source_caps.supports_feeder);
  BOOST_CHECK (!caps.paper_source_caps.supports_duplex);
  BOOST_CHECK (!caps.flatbed_caps);
  BOOST_CHECK (!caps.duplex_caps);
  BOOST_REQUIRE (caps.feeder_caps);
  BOOST_REQUIRE (caps.feeder_caps->dpi_caps);
  BOOST_CHECK (!caps.feeder_caps->dpi_caps->is_range ());
  BOOST_CHECK (dpi == caps.feeder_caps->dpi_caps->values ());
  BOOST_REQUIRE (caps.feeder_caps->bit_depth_caps);
  BOOST_CHECK (caps.feeder_caps->bit_depth_caps->supports_color);
  BOOST_CHECK (caps.feeder_caps->bit_depth_caps->supports_grayscale);
  BOOST_CHECK (!caps.feeder_caps->bit_depth_caps->supports_black_and_white);
  BOOST_CHECK_EQUAL ("Fake Inc.", caps.metadata_caps.manufacturer);
  BOOST_CHECK_EQUAL ("FS-1", caps.metadata_caps.model);
  BOOST_CHECK_EQUAL (native_scan_driver::idle, driver->current_state ());
  BOOST_CHECK_EQUAL (0, fake->live_handles ());
}

BOOST_AUTO_TEST_CASE (range_caps)
{
  fake->devices.push_back (make_device (prop::capability::flatbed, 0));
  options.api_version = native::current;

  scan_caps caps (driver->get_caps (options));

  BOOST_REQUIRE (caps.flatbed_caps);
  BOOST_REQUIRE (caps.flatbed_caps->dpi_caps);
  BOOST_CHECK (caps.flatbed_caps->dpi_caps->is_range ());
  BOOST_CHECK_EQUAL (75, *caps.flatbed_caps->dpi_caps->min);
  BOOST_CHECK_EQUAL (1200, *caps.flatbed_caps->dpi_caps->max);
  BOOST_CHECK_EQUAL (16, caps.flatbed_caps->dpi_caps->values ().size ());
  BOOST_REQUIRE (caps.flatbed_caps->page_size_caps);
  BOOST_CHECK_EQUAL (8500, caps.flatbed_caps->page_size_caps->width);
}

BOOST_AUTO_TEST_CASE (caps_fall_back_to_legacy_api)
{
  fake->devices.push_back (make_device (prop::capability::flatbed, 0));
  fake->fail_devices_for (native::current);

  scan_caps caps (driver->get_caps (options));

  BOOST_CHECK (caps.paper_source_caps.supports_flatbed);
  BOOST_CHECK (caps.flatbed_caps);
}

BOOST_AUTO_TEST_CASE (unknown_device)
{
  fake->devices.push_back (make_device (prop::capability::flatbed, 0));
  options.device = device_descriptor ("fake", "fake:9", "Elsewhere");
  options.api_version = native::current;

  BOOST_CHECK_THROW (driver->get_caps (options), system_error);
  BOOST_CHECK_EQUAL (0, fake->live_handles ());
}

BOOST_AUTO_TEST_CASE (enumeration)
{
  fake->devices.push_back (make_device (prop::capability::flatbed, 0));
  fake->devices.push_back
    (fake_library::device_spec ("fake:2", "no FRIENDLY name"));

  std::vector< device_descriptor > devs
    (driver->get_devices (native::default_version));

  BOOST_REQUIRE_EQUAL (2, devs.size ());
  BOOST_CHECK_EQUAL ("fake", devs[0].driver ());
  BOOST_CHECK_EQUAL ("fake:1", devs[0].id ());
  BOOST_CHECK_EQUAL ("Fake Scanner", devs[0].name ());
  BOOST_CHECK_EQUAL ("Unknown Scanner", devs[1].name ());
  BOOST_CHECK_EQUAL (native_scan_driver::idle, driver->current_state ());
  BOOST_CHECK_EQUAL (0, fake->live_handles ());
}

BOOST_AUTO_TEST_SUITE_END (/* negotiation */)

#include "tsunagi/test/runner.ipp"
