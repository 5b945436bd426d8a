//  image.cpp -- raw page images
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

#include <boost/throw_exception.hpp>

#include "tsunagi/image.hpp"

namespace tsunagi {

image::image (format fmt, streamsize width, streamsize height)
  : format_(fmt)
  , width_(width)
  , height_(height)
  , index_(0)
{
  if (0 >= width_ || 0 >= height_)
    BOOST_THROW_EXCEPTION (bad_image ("image without pixels"));

  pixels_.resize (bytes_per_line () * height_);
}

image::format
image::pixel_format () const
{
  return format_;
}

streamsize
image::width () const
{
  return width_;
}

streamsize
image::height () const
{
  return height_;
}

streamsize
image::bytes_per_line () const
{
  if (bilevel == format_)
    return (width_ + 7) / 8;

  return width_ * channels ();
}

int
image::depth () const
{
  return (bilevel == format_ ? 1 : 8);
}

int
image::channels () const
{
  return (rgb == format_ ? 3 : 1);
}

unsigned
image::index () const
{
  return index_;
}

void
image::index (unsigned i)
{
  index_ = i;
}

octet *
image::data ()
{
  return &pixels_[0];
}

const octet *
image::data () const
{
  return &pixels_[0];
}

streamsize
image::size () const
{
  return pixels_.size ();
}

bad_image::bad_image (const std::string& what)
  : std::runtime_error (what)
{}

}       // namespace tsunagi
