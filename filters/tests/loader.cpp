//  loader.cpp -- unit tests for the image decoders
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

#include <cstdio>
#include <cstdlib>

#include <sstream>
#include <string>
#include <vector>

#include <boost/test/unit_test.hpp>

#include <tsunagi/format.hpp>
#include <tsunagi/image.hpp>

#include "../jpeg.hpp"
#include "../pnm.hpp"

using namespace tsunagi;
using namespace _flt_;

namespace {

octet_buffer
payload (const std::string& header, streamsize octets, octet fill)
{
  octet_buffer rv (header.begin (), header.end ());
  rv.insert (rv.end (), octets, fill);
  return rv;
}

//! A flat grey JPEG image compressed in memory
octet_buffer
grey_jpeg (JDIMENSION width, JDIMENSION height, JSAMPLE shade)
{
  struct jpeg_compress_struct cinfo;
  struct jpeg_error_mgr jerr;

  cinfo.err = jpeg_std_error (&jerr);
  jpeg_create_compress (&cinfo);

  unsigned char *mem = NULL;
  unsigned long size = 0;
  jpeg_mem_dest (&cinfo, &mem, &size);

  cinfo.image_width = width;
  cinfo.image_height = height;
  cinfo.input_components = 1;
  cinfo.in_color_space = JCS_GRAYSCALE;
  jpeg_set_defaults (&cinfo);
  jpeg_set_quality (&cinfo, 100, TRUE);
  jpeg_start_compress (&cinfo, TRUE);

  std::vector< JSAMPLE > line (width, shade);
  JSAMPROW row = &line[0];
  while (cinfo.next_scanline < cinfo.image_height)
    {
      jpeg_write_scanlines (&cinfo, &row, 1);
    }
  jpeg_finish_compress (&cinfo);
  jpeg_destroy_compress (&cinfo);

  octet_buffer rv (mem, mem + size);
  free (mem);
  return rv;
}

}       // namespace

BOOST_AUTO_TEST_SUITE (portable_any_map)

BOOST_AUTO_TEST_CASE (grey_with_comment)
{
  octet_buffer buf (payload ("P5\n# scanned\n4 2\n255\n", 8, 0x42));
  image::ptr img (image_loader::create ()->load (&buf[0], buf.size ()));

  BOOST_CHECK_EQUAL (image::gray, img->pixel_format ());
  BOOST_CHECK_EQUAL (4, img->width ());
  BOOST_CHECK_EQUAL (2, img->height ());
  BOOST_CHECK_EQUAL (0x42, img->data ()[7]);
}

BOOST_AUTO_TEST_CASE (bilevel_rows_are_padded)
{
  octet_buffer buf (payload ("P4 10 3\n", 6, 0xff));
  image::ptr img (image_loader::create ()->load (&buf[0], buf.size ()));

  BOOST_CHECK_EQUAL (image::bilevel, img->pixel_format ());
  BOOST_CHECK_EQUAL (2, img->bytes_per_line ());
  BOOST_CHECK_EQUAL (6, img->size ());
}

BOOST_AUTO_TEST_CASE (colour)
{
  octet_buffer buf (payload ("P6 2 2 255\n", 12, 0x80));
  image::ptr img (image_loader::create ()->load (&buf[0], buf.size ()));

  BOOST_CHECK_EQUAL (image::rgb, img->pixel_format ());
  BOOST_CHECK_EQUAL (3, img->channels ());
  BOOST_CHECK_EQUAL (12, img->size ());
}

BOOST_AUTO_TEST_CASE (truncated_raster)
{
  octet_buffer buf (payload ("P5 4 4 255\n", 10, 0));

  BOOST_CHECK_THROW (image_loader::create ()->load (&buf[0], buf.size ()),
                     bad_image);
}

BOOST_AUTO_TEST_CASE (sixteen_bit_samples)
{
  octet_buffer buf (payload ("P5 2 2 65535\n", 8, 0));

  BOOST_CHECK_THROW (pnm ().load (&buf[0], buf.size ()), bad_image);
}

BOOST_AUTO_TEST_CASE (header_matches_format)
{
  image img (image::gray, 3, 5);

  BOOST_CHECK_EQUAL ("P5 3 5 255\n", pnm::header (img));

  std::ostringstream os;
  pnm::write (os, img);
  BOOST_CHECK_EQUAL (pnm::header (img).size () + 15, os.str ().size ());
}

BOOST_AUTO_TEST_SUITE_END (/* portable_any_map */)

BOOST_AUTO_TEST_SUITE (joint_photographic_experts_group)

BOOST_AUTO_TEST_CASE (recognised_by_default_loader)
{
  octet_buffer buf (grey_jpeg (16, 8, 0x60));

  BOOST_REQUIRE (jpeg::decompressor::matches (&buf[0], buf.size ()));

  image::ptr img (image_loader::create ()->load (&buf[0], buf.size ()));

  BOOST_CHECK_EQUAL (image::gray, img->pixel_format ());
  BOOST_CHECK_EQUAL (16, img->width ());
  BOOST_CHECK_EQUAL (8, img->height ());
  BOOST_CHECK_CLOSE (double (0x60), double (octet (img->data ()[0]) & 0xff),
                     2.0);
}

BOOST_AUTO_TEST_CASE (no_image_after_start_marker)
{
  std::string junk ("\xff\xd8 not really a JPEG image");
  octet_buffer buf (junk.begin (), junk.end ());

  BOOST_CHECK_THROW (image_loader::create ()->load (&buf[0], buf.size ()),
                     bad_image);
}

BOOST_AUTO_TEST_SUITE_END (/* joint_photographic_experts_group */)

BOOST_AUTO_TEST_CASE (unknown_payload)
{
  std::string junk ("GIF89a");
  octet_buffer buf (junk.begin (), junk.end ());

  BOOST_CHECK_THROW (image_loader::create ()->load (&buf[0], buf.size ()),
                     bad_image);
}

#include "tsunagi/test/runner.ipp"
