//  pnm.cpp -- PNM image decoding and encoding
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

#include <cctype>
#include <cstring>

#include <boost/throw_exception.hpp>

#include <tsunagi/format.hpp>
#include <tsunagi/log.hpp>

#include "pnm.hpp"

namespace tsunagi {
namespace _flt_ {

namespace {

//! Parse one whitespace separated header number, skipping comments
streamsize
next_number (const octet *data, streamsize size, streamsize& pos)
{
  while (pos < size)
    {
      if ('#' == data[pos])
        {
          while (pos < size && '\n' != data[pos]) ++pos;
        }
      else if (isspace (static_cast< unsigned char > (data[pos])))
        {
          ++pos;
        }
      else break;
    }

  if (pos >= size || !isdigit (static_cast< unsigned char > (data[pos])))
    BOOST_THROW_EXCEPTION (bad_image ("malformed PNM header"));

  streamsize rv = 0;
  while (pos < size && isdigit (static_cast< unsigned char > (data[pos])))
    {
      rv = 10 * rv + (data[pos] - '0');
      ++pos;
    }
  return rv;
}

}       // namespace

bool
pnm::matches (const octet *data, streamsize size)
{
  return (2 <= size && 'P' == data[0]
          && ('4' == data[1] || '5' == data[1] || '6' == data[1]));
}

image::ptr
pnm::load (const octet *data, streamsize size) const
{
  if (!matches (data, size))
    BOOST_THROW_EXCEPTION (bad_image ("not a raw PNM image"));

  image::format fmt = ('4' == data[1]
                       ? image::bilevel
                       : ('5' == data[1] ? image::gray : image::rgb));

  streamsize pos = 2;
  streamsize width  = next_number (data, size, pos);
  streamsize height = next_number (data, size, pos);

  if (image::bilevel != fmt)
    {
      streamsize maxval = next_number (data, size, pos);
      if (255 != maxval)
        BOOST_THROW_EXCEPTION
          (bad_image ((format ("unsupported PNM maximum sample value: %1%")
                       % maxval).str ()));
    }

  // exactly one whitespace character separates header and raster
  if (pos >= size
      || !isspace (static_cast< unsigned char > (data[pos])))
    BOOST_THROW_EXCEPTION (bad_image ("malformed PNM header"));
  ++pos;

  image::ptr img = make_shared< image > (fmt, width, height);

  if (size - pos < img->size ())
    BOOST_THROW_EXCEPTION
      (bad_image ((format ("truncated PNM raster: %1% of %2% octets")
                   % (size - pos) % img->size ()).str ()));

  memcpy (img->data (), data + pos, img->size ());

  log::trace ("decoded %1%x%2% PNM image") % width % height;

  return img;
}

std::string
pnm::header (const image& img)
{
  format fmt;

  if (image::rgb == img.pixel_format ())
    fmt = format ("P6 %1% %2% 255\n");
  else if (image::gray == img.pixel_format ())
    fmt = format ("P5 %1% %2% 255\n");
  else
    fmt = format ("P4 %1% %2%\n");

  return (fmt % img.width () % img.height ()).str ();
}

void
pnm::write (std::ostream& os, const image& img)
{
  std::string hdr (header (img));

  os.write (hdr.c_str (), hdr.length ());
  os.write (img.data (), img.size ());
}

}       // namespace _flt_
}       // namespace tsunagi
