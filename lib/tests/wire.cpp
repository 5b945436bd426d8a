//  wire.cpp -- unit tests for the message payload codec
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

#include <boost/test/unit_test.hpp>

#include "tsunagi/wire.hpp"

using namespace tsunagi;

namespace {

struct fixture
{
  wire::encoder enc;

  wire::decoder decoder () const
  {
    return wire::decoder (enc.data (), enc.size ());
  }
};

}       // namespace

BOOST_FIXTURE_TEST_SUITE (wire_format, fixture)

BOOST_AUTO_TEST_CASE (network_byte_order)
{
  enc << uint32_t (0x01020304);

  BOOST_REQUIRE_EQUAL (4, enc.size ());
  BOOST_CHECK_EQUAL (0x01, enc.data ()[0]);
  BOOST_CHECK_EQUAL (0x04, enc.data ()[3]);
}

BOOST_AUTO_TEST_CASE (truncated_message)
{
  enc << std::string ("a string that will not arrive in full");

  wire::decoder dec (enc.data (), enc.size () - 5);
  std::string s;

  try
    {
      dec >> s;
      BOOST_FAIL ("decoding should have failed");
    }
  catch (const system_error& e)
    {
      BOOST_CHECK_EQUAL (system_error::device_communication_error, e.code ());
    }
}

BOOST_AUTO_TEST_CASE (errors_keep_code_and_native_status)
{
  enc << system_error (system_error::cover_open, "close the lid",
                       int32_t (0x80210016));

  system_error e;
  wire::decoder dec (decoder ());
  dec >> e;

  BOOST_CHECK_EQUAL (system_error::cover_open, e.code ());
  BOOST_CHECK_EQUAL (int32_t (0x80210016), e.native_code ());
  BOOST_CHECK_EQUAL ("close the lid", std::string (e.what ()));
  BOOST_CHECK (dec.at_end ());
}

BOOST_AUTO_TEST_CASE (unknown_error_codes)
{
  enc << int32_t (4711) << int32_t (0) << std::string ();

  system_error e;
  wire::decoder dec (decoder ());
  dec >> e;

  BOOST_CHECK_EQUAL (system_error::unknown_error, e.code ());
}

BOOST_AUTO_TEST_CASE (scan_options_survive_transfer)
{
  scan_options in;
  in.device       = device_descriptor ("wia", "{6BDD1FC6}\\0001", "Scanner");
  in.paper_source = duplex;
  in.dpi          = 600;
  in.bit_depth    = grayscale;
  in.page_size    = page_size::a4 ();
  in.page_align   = align_right;
  in.brightness   = -250;
  in.contrast     = 1000;
  in.use_native_ui = true;
  in.dialog_parent = native::window_handle (0x12345678);
  in.api_version  = native::legacy;

  enc << in;

  scan_options out;
  wire::decoder dec (decoder ());
  dec >> out;

  BOOST_CHECK_EQUAL (in.device.id (), out.device.id ());
  BOOST_CHECK_EQUAL (in.device.driver (), out.device.driver ());
  BOOST_CHECK_EQUAL (duplex, out.paper_source);
  BOOST_CHECK_EQUAL (600, out.dpi);
  BOOST_CHECK_EQUAL (grayscale, out.bit_depth);
  BOOST_CHECK_EQUAL (page_size::a4 ().width, out.page_size.width);
  BOOST_CHECK_EQUAL (align_right, out.page_align);
  BOOST_CHECK_EQUAL (-250, out.brightness);
  BOOST_CHECK (out.use_native_ui);
  BOOST_CHECK_EQUAL (in.dialog_parent, out.dialog_parent);
  BOOST_CHECK_EQUAL (native::legacy, out.api_version);
  BOOST_CHECK (dec.at_end ());
}

BOOST_AUTO_TEST_CASE (absent_capabilities)
{
  scan_caps in;
  in.metadata_caps.manufacturer = "Fake Inc.";
  in.paper_source_caps.supports_feeder = true;
  in.feeder_caps = per_source_caps ();
  in.feeder_caps->dpi_caps = dpi_caps::for_values
    (std::vector< int32_t > (1, 300));

  enc << in;

  scan_caps out;
  wire::decoder dec (decoder ());
  dec >> out;

  BOOST_CHECK (!out.flatbed_caps);
  BOOST_CHECK (!out.duplex_caps);
  BOOST_REQUIRE (out.feeder_caps);
  BOOST_REQUIRE (out.feeder_caps->dpi_caps);
  BOOST_CHECK (!out.feeder_caps->dpi_caps->is_range ());
  BOOST_CHECK (!out.feeder_caps->bit_depth_caps);
  BOOST_CHECK_EQUAL ("Fake Inc.", out.metadata_caps.manufacturer);
}

BOOST_AUTO_TEST_CASE (image_payload)
{
  image img (image::gray, 3, 2);
  img.index (4);
  img.data ()[5] = 0x7f;

  enc << img;

  image::ptr out;
  wire::decoder dec (decoder ());
  dec >> out;

  BOOST_REQUIRE (out);
  BOOST_CHECK_EQUAL (4, out->index ());
  BOOST_CHECK_EQUAL (6, out->size ());
  BOOST_CHECK_EQUAL (0x7f, out->data ()[5]);
}

BOOST_AUTO_TEST_CASE (bogus_pixel_format)
{
  enc << int32_t (17) << int32_t (1) << int32_t (1) << uint32_t (0);

  image::ptr out;
  wire::decoder dec (decoder ());

  BOOST_CHECK_THROW (dec >> out, system_error);
  BOOST_CHECK (!out);
}

BOOST_AUTO_TEST_SUITE_END (/* wire_format */)

#include "tsunagi/test/runner.ipp"
