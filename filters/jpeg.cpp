//  jpeg.cpp -- JPEG image decoding
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

#include <cstring>
#include <stdexcept>

#include <boost/assert.hpp>
#include <boost/static_assert.hpp>
#include <boost/throw_exception.hpp>

#include <tsunagi/log.hpp>

#include "jpeg.hpp"

#include <jerror.h>

namespace tsunagi {
namespace _flt_ {
namespace jpeg {

//! Fake EOI marker for truncated input
static const JOCTET eoi_marker[] = { 0xFF, JPEG_EOI };

struct callback
{
  static void
  error_exit_(j_common_ptr cinfo)
  {
    detail::decompressor *self
      = static_cast< detail::decompressor * > (cinfo->client_data);
    BOOST_ASSERT (cinfo->err == &self->jerr_);
    self->error_exit (cinfo);
  }

  static void
  output_message_(j_common_ptr cinfo)
  {
    detail::decompressor *self
      = static_cast< detail::decompressor * > (cinfo->client_data);
    BOOST_ASSERT (cinfo->err == &self->jerr_);
    self->output_message (cinfo);
  }

  static void
  init_source_(j_decompress_ptr cinfo)
  {
    detail::decompressor *self
      = static_cast< detail::decompressor * > (cinfo->client_data);
    BOOST_ASSERT (cinfo == &self->cinfo_);
    self->init_source ();
  }

  static boolean
  fill_input_buffer_(j_decompress_ptr cinfo)
  {
    detail::decompressor *self
      = static_cast< detail::decompressor * > (cinfo->client_data);
    BOOST_ASSERT (cinfo == &self->cinfo_);
    return self->fill_input_buffer ();
  }

  static void
  skip_input_data_(j_decompress_ptr cinfo, long num_bytes)
  {
    detail::decompressor *self
      = static_cast< detail::decompressor * > (cinfo->client_data);
    BOOST_ASSERT (cinfo == &self->cinfo_);
    self->skip_input_data (num_bytes);
  }

  static void
  term_source_(j_decompress_ptr cinfo)
  {
    detail::decompressor *self
      = static_cast< detail::decompressor * > (cinfo->client_data);
    BOOST_ASSERT (cinfo == &self->cinfo_);
    self->term_source ();
  }
};

namespace detail {

decompressor::decompressor (const octet *data, streamsize size)
  : data_(data)
  , size_(size)
  , destroyed_(false)
{
  // Set up the error handler before creating the decompressor.  The
  // jpeg_create_decompress() call may fail already.

  cinfo_.client_data = this;
  cinfo_.err = jpeg_std_error (&jerr_);
  jerr_.error_exit     = &callback::error_exit_;
  jerr_.output_message = &callback::output_message_;

  jpeg_create_decompress (&cinfo_);

  smgr_.init_source       = &callback::init_source_;
  smgr_.fill_input_buffer = &callback::fill_input_buffer_;
  smgr_.skip_input_data   = &callback::skip_input_data_;
  smgr_.resync_to_restart = &jpeg_resync_to_restart;
  smgr_.term_source       = &callback::term_source_;
  smgr_.bytes_in_buffer   = 0;
  smgr_.next_input_byte   = nullptr;

  cinfo_.src = &smgr_;
}

decompressor::~decompressor ()
{
  if (!destroyed_)
    jpeg_destroy_decompress (&cinfo_);
}

void
decompressor::init_source ()
{
  BOOST_STATIC_ASSERT ((sizeof (JOCTET) == sizeof (octet)));

  smgr_.next_input_byte = reinterpret_cast< const JOCTET * > (data_);
  smgr_.bytes_in_buffer = size_;
}

boolean
decompressor::fill_input_buffer ()
{
  // The whole payload was handed over in init_source().  Running out
  // means the data is truncated.  Insert a fake EOI marker so that
  // the library can finish and warn about it.

  WARNMS (&cinfo_, JWRN_JPEG_EOF);

  smgr_.next_input_byte = eoi_marker;
  smgr_.bytes_in_buffer = sizeof (eoi_marker);

  return true;
}

void
decompressor::skip_input_data (long num_bytes)
{
  if (0 >= num_bytes) return;

  if (size_t (num_bytes) > smgr_.bytes_in_buffer)
    {
      fill_input_buffer ();
      return;
    }
  smgr_.next_input_byte += num_bytes;
  smgr_.bytes_in_buffer -= num_bytes;
}

void
decompressor::term_source ()
{
  if (0 != smgr_.bytes_in_buffer)
    log::trace ("%1% octets of trailing JPEG data")
      % smgr_.bytes_in_buffer;
}

void
decompressor::error_exit (j_common_ptr cinfo)
{
  char msg[JMSG_LENGTH_MAX];

  jerr_.format_message (cinfo, msg);
  jpeg_destroy (cinfo);
  destroyed_ = true;

  log::error ("%1%") % msg;

  BOOST_THROW_EXCEPTION (bad_image (msg));
}

void
decompressor::output_message (j_common_ptr cinfo)
{
  char msg[JMSG_LENGTH_MAX];

  jerr_.format_message (cinfo, msg);

  log::error ("%1%") % msg;
}

image::ptr
decompressor::decode ()
{
  jpeg_read_header (&cinfo_, true);
  log::trace ("read JPEG header");

  if (JCS_GRAYSCALE != cinfo_.jpeg_color_space)
    cinfo_.out_color_space = JCS_RGB;

  jpeg_start_decompress (&cinfo_);

  image::ptr img
    = make_shared< image > (1 == cinfo_.output_components
                            ? image::gray
                            : image::rgb,
                            cinfo_.output_width, cinfo_.output_height);

  BOOST_STATIC_ASSERT ((sizeof (JSAMPLE) == sizeof (octet)));

  while (cinfo_.output_scanline < cinfo_.output_height)
    {
      JSAMPROW row = reinterpret_cast< JSAMPROW >
        (img->data () + cinfo_.output_scanline * img->bytes_per_line ());

      if (0 == jpeg_read_scanlines (&cinfo_, &row, 1))
        BOOST_THROW_EXCEPTION (bad_image ("JPEG decompression stalled"));
    }

  jpeg_finish_decompress (&cinfo_);

  log::trace ("decoded %1%x%2% JPEG image")
    % img->width () % img->height ();

  return img;
}

}       // namespace detail

bool
decompressor::matches (const octet *data, streamsize size)
{
  return (2 <= size
          && 0xFF == static_cast< unsigned char > (data[0])
          && 0xD8 == static_cast< unsigned char > (data[1]));
}

image::ptr
decompressor::load (const octet *data, streamsize size) const
{
  if (!matches (data, size))
    BOOST_THROW_EXCEPTION (bad_image ("not a JPEG image"));

  detail::decompressor impl (data, size);

  return impl.decode ();
}

}       // namespace jpeg
}       // namespace _flt_
}       // namespace tsunagi
