//  wire.hpp -- encode and decode message payloads
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

#ifndef tsunagi_wire_hpp_
#define tsunagi_wire_hpp_

#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "capabilities.hpp"
#include "cstdint.hpp"
#include "device-manager.hpp"
#include "device.hpp"
#include "exception.hpp"
#include "image.hpp"
#include "octet.hpp"
#include "scan-options.hpp"

namespace tsunagi {

//! Message payloads exchanged with worker processes
/*! Integers go out in network byte order.  Strings and sequences are
 *  preceded by their length, optional values by a presence flag.
 */
namespace wire {

class encoder
{
public:
  encoder& operator<< (int32_t i);
  encoder& operator<< (uint32_t u);
  encoder& operator<< (bool b);
  encoder& operator<< (double d);
  encoder& operator<< (const std::string& s);

  encoder& operator<< (const device_descriptor& d);
  encoder& operator<< (const scan_options& o);
  encoder& operator<< (const dpi_caps& c);
  encoder& operator<< (const per_source_caps& c);
  encoder& operator<< (const scan_caps& c);
  encoder& operator<< (const image& img);
  encoder& operator<< (const native::configuration& c);
  encoder& operator<< (const system_error& e);

  template< typename T >
  encoder& operator<< (const std::vector< T >& v)
  {
    *this << uint32_t (v.size ());
    for (typename std::vector< T >::size_type i = 0; i < v.size (); ++i)
      *this << v[i];
    return *this;
  }

  template< typename T >
  encoder& operator<< (const boost::optional< T >& t)
  {
    *this << bool (t);
    if (t) *this << *t;
    return *this;
  }

  const octet * data () const;
  streamsize size () const;

private:
  void put (const void *p, streamsize n);

  octet_buffer buf_;
};

//! Throws system_error (device_communication_error) on short payloads
class decoder
{
public:
  decoder (const octet *data, streamsize size);

  decoder& operator>> (int32_t& i);
  decoder& operator>> (uint32_t& u);
  decoder& operator>> (bool& b);
  decoder& operator>> (double& d);
  decoder& operator>> (std::string& s);

  decoder& operator>> (device_descriptor& d);
  decoder& operator>> (scan_options& o);
  decoder& operator>> (dpi_caps& c);
  decoder& operator>> (per_source_caps& c);
  decoder& operator>> (scan_caps& c);
  decoder& operator>> (image::ptr& img);
  decoder& operator>> (native::configuration& c);
  decoder& operator>> (system_error& e);

  template< typename T >
  decoder& operator>> (std::vector< T >& v)
  {
    uint32_t n = 0;
    *this >> n;
    v.clear ();
    for (uint32_t i = 0; i < n; ++i)
      {
        T t;
        *this >> t;
        v.push_back (t);
      }
    return *this;
  }

  template< typename T >
  decoder& operator>> (boost::optional< T >& t)
  {
    bool present = false;
    *this >> present;
    t = boost::none;
    if (present)
      {
        T value;
        *this >> value;
        t = value;
      }
    return *this;
  }

  bool at_end () const;

private:
  void get (void *p, streamsize n);

  const octet *data_;
  streamsize   size_;
  streamsize   pos_;
};

}       // namespace wire
}       // namespace tsunagi

#endif  /* tsunagi_wire_hpp_ */
