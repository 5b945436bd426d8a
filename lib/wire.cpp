//  wire.cpp -- encode and decode message payloads
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

#include <arpa/inet.h>

#include <cstring>
#include <sstream>

#include <boost/throw_exception.hpp>

#include "tsunagi/format.hpp"
#include "tsunagi/wire.hpp"

namespace tsunagi {
namespace wire {

namespace {

using native::property_map;

// Doubles travel as text so both ends agree on the representation
std::string
to_text (double d)
{
  std::ostringstream os;
  os.precision (17);
  os << d;
  return os.str ();
}

}       // namespace

encoder&
encoder::operator<< (int32_t i)
{
  return *this << uint32_t (i);
}

encoder&
encoder::operator<< (uint32_t u)
{
  uint32_t n = htonl (u);
  put (&n, sizeof (n));
  return *this;
}

encoder&
encoder::operator<< (bool b)
{
  octet o = (b ? 1 : 0);
  put (&o, 1);
  return *this;
}

encoder&
encoder::operator<< (double d)
{
  return *this << to_text (d);
}

encoder&
encoder::operator<< (const std::string& s)
{
  *this << uint32_t (s.size ());
  put (s.data (), s.size ());
  return *this;
}

encoder&
encoder::operator<< (const device_descriptor& d)
{
  return *this << d.driver () << d.id () << d.name ();
}

encoder&
encoder::operator<< (const scan_options& o)
{
  return *this
    << o.device
    << int32_t (o.paper_source)
    << o.dpi
    << int32_t (o.bit_depth)
    << o.page_size.width << o.page_size.height
    << int32_t (o.page_align)
    << o.brightness
    << o.contrast
    << o.use_native_ui
    << uint32_t (uint64_t (o.dialog_parent) >> 32)
    << uint32_t (uint64_t (o.dialog_parent) & 0xffffffff)
    << int32_t (o.api_version)
    << o.offset_width
    << o.brightness_contrast_after_scan;
}

encoder&
encoder::operator<< (const dpi_caps& c)
{
  return *this << c.min << c.max << c.step << c.list;
}

encoder&
encoder::operator<< (const per_source_caps& c)
{
  *this << c.dpi_caps;

  *this << bool (c.bit_depth_caps);
  if (c.bit_depth_caps)
    *this
      << c.bit_depth_caps->supports_color
      << c.bit_depth_caps->supports_grayscale
      << c.bit_depth_caps->supports_black_and_white;

  *this << bool (c.page_size_caps);
  if (c.page_size_caps)
    *this << c.page_size_caps->width << c.page_size_caps->height;

  return *this;
}

encoder&
encoder::operator<< (const scan_caps& c)
{
  return *this
    << c.metadata_caps.manufacturer
    << c.metadata_caps.model
    << c.paper_source_caps.supports_flatbed
    << c.paper_source_caps.supports_feeder
    << c.paper_source_caps.supports_duplex
    << c.paper_source_caps.can_check_if_feeder_has_paper
    << c.flatbed_caps
    << c.feeder_caps
    << c.duplex_caps;
}

encoder&
encoder::operator<< (const image& img)
{
  *this
    << int32_t (img.pixel_format ())
    << int32_t (img.width ())
    << int32_t (img.height ())
    << uint32_t (img.index ());
  put (img.data (), img.size ());
  return *this;
}

encoder&
encoder::operator<< (const native::configuration& c)
{
  *this << c.item_name;

  const property_map *maps[] = { &c.device_props, &c.item_props };
  for (int i = 0; i < 2; ++i)
    {
      *this << uint32_t (maps[i]->size ());
      property_map::const_iterator it;
      for (it = maps[i]->begin (); maps[i]->end () != it; ++it)
        *this << int32_t (it->first) << it->second;
    }
  return *this;
}

encoder&
encoder::operator<< (const system_error& e)
{
  return *this
    << int32_t (e.code ())
    << e.native_code ()
    << std::string (e.what ());
}

const octet *
encoder::data () const
{
  return (buf_.empty () ? nullptr : &buf_[0]);
}

streamsize
encoder::size () const
{
  return buf_.size ();
}

void
encoder::put (const void *p, streamsize n)
{
  const octet *o = static_cast< const octet * > (p);
  buf_.insert (buf_.end (), o, o + n);
}

decoder::decoder (const octet *data, streamsize size)
  : data_(data)
  , size_(size)
  , pos_(0)
{}

decoder&
decoder::operator>> (int32_t& i)
{
  uint32_t u = 0;
  *this >> u;
  i = u;
  return *this;
}

decoder&
decoder::operator>> (uint32_t& u)
{
  uint32_t n = 0;
  get (&n, sizeof (n));
  u = ntohl (n);
  return *this;
}

decoder&
decoder::operator>> (bool& b)
{
  octet o = 0;
  get (&o, 1);
  b = (0 != o);
  return *this;
}

decoder&
decoder::operator>> (double& d)
{
  std::string s;
  *this >> s;

  std::istringstream is (s);
  if (!(is >> d))
    BOOST_THROW_EXCEPTION
      (system_error (system_error::device_communication_error,
                     (format ("malformed number: '%1%'") % s).str ()));
  return *this;
}

decoder&
decoder::operator>> (std::string& s)
{
  uint32_t n = 0;
  *this >> n;
  if (size_ - pos_ < streamsize (n))
    get (nullptr, n);           // throws

  s.assign (data_ + pos_, n);
  pos_ += n;
  return *this;
}

decoder&
decoder::operator>> (device_descriptor& d)
{
  std::string driver, id, name;
  *this >> driver >> id >> name;
  d = device_descriptor (driver, id, name);
  return *this;
}

decoder&
decoder::operator>> (scan_options& o)
{
  int32_t source, depth, align, version;
  uint32_t parent_hi, parent_lo;

  *this
    >> o.device
    >> source
    >> o.dpi
    >> depth
    >> o.page_size.width >> o.page_size.height
    >> align
    >> o.brightness
    >> o.contrast
    >> o.use_native_ui
    >> parent_hi >> parent_lo
    >> version
    >> o.offset_width
    >> o.brightness_contrast_after_scan;

  o.paper_source  = paper_source (source);
  o.bit_depth     = bit_depth (depth);
  o.page_align    = horizontal_align (align);
  o.dialog_parent = native::window_handle ((uint64_t (parent_hi) << 32)
                                           | parent_lo);
  o.api_version   = native::api_version (version);

  return *this;
}

decoder&
decoder::operator>> (dpi_caps& c)
{
  return *this >> c.min >> c.max >> c.step >> c.list;
}

decoder&
decoder::operator>> (per_source_caps& c)
{
  bool present = false;

  *this >> c.dpi_caps;

  *this >> present;
  c.bit_depth_caps = boost::none;
  if (present)
    {
      bit_depth_caps b;
      *this
        >> b.supports_color
        >> b.supports_grayscale
        >> b.supports_black_and_white;
      c.bit_depth_caps = b;
    }

  *this >> present;
  c.page_size_caps = boost::none;
  if (present)
    {
      page_size_caps p;
      *this >> p.width >> p.height;
      c.page_size_caps = p;
    }

  return *this;
}

decoder&
decoder::operator>> (scan_caps& c)
{
  return *this
    >> c.metadata_caps.manufacturer
    >> c.metadata_caps.model
    >> c.paper_source_caps.supports_flatbed
    >> c.paper_source_caps.supports_feeder
    >> c.paper_source_caps.supports_duplex
    >> c.paper_source_caps.can_check_if_feeder_has_paper
    >> c.flatbed_caps
    >> c.feeder_caps
    >> c.duplex_caps;
}

decoder&
decoder::operator>> (image::ptr& img)
{
  int32_t fmt, width, height;
  uint32_t index;

  *this >> fmt >> width >> height >> index;

  if (fmt < image::bilevel || fmt > image::rgb)
    BOOST_THROW_EXCEPTION
      (system_error (system_error::device_communication_error,
                     (format ("unknown pixel format: %1%") % fmt).str ()));

  image::ptr rv;
  try
    {
      rv = make_shared< image > (image::format (fmt), width, height);
    }
  catch (const bad_image& e)
    {
      BOOST_THROW_EXCEPTION
        (system_error (system_error::device_communication_error, e.what ()));
    }
  rv->index (index);
  get (rv->data (), rv->size ());

  img = rv;
  return *this;
}

decoder&
decoder::operator>> (native::configuration& c)
{
  *this >> c.item_name;

  property_map *maps[] = { &c.device_props, &c.item_props };
  for (int i = 0; i < 2; ++i)
    {
      uint32_t n = 0;
      *this >> n;
      maps[i]->clear ();
      for (uint32_t j = 0; j < n; ++j)
        {
          int32_t id, value;
          *this >> id >> value;
          (*maps[i])[native::property::id (id)] = value;
        }
    }
  return *this;
}

decoder&
decoder::operator>> (system_error& e)
{
  int32_t ec, native_code;
  std::string message;

  *this >> ec >> native_code >> message;

  if (ec < system_error::no_error || ec > system_error::unknown_error)
    ec = system_error::unknown_error;

  e = system_error (system_error::error_code (ec), message, native_code);
  return *this;
}

bool
decoder::at_end () const
{
  return pos_ == size_;
}

void
decoder::get (void *p, streamsize n)
{
  if (size_ - pos_ < n)
    BOOST_THROW_EXCEPTION
      (system_error (system_error::device_communication_error,
                     (format ("truncated message (%1% of %2% octets left)")
                      % (size_ - pos_) % n).str ()));

  if (p) memcpy (p, data_ + pos_, n);
  pos_ += n;
}

}       // namespace wire
}       // namespace tsunagi
