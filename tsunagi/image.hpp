//  image.hpp -- raw page images
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

#ifndef tsunagi_image_hpp_
#define tsunagi_image_hpp_

#include <stdexcept>
#include <string>

#include "memory.hpp"
#include "octet.hpp"

namespace tsunagi {

//! A decoded, in-memory page image
/*! Pixels are stored row by row without padding.  Bi-level images
 *  use one bit per pixel with the most significant bit first and 1
 *  for black, the others use eight bits per sample.
 */
class image
{
public:
  typedef shared_ptr< image > ptr;

  enum format {
    bilevel,
    gray,
    rgb,
  };

  image (format fmt, streamsize width, streamsize height);

  image::format pixel_format () const;
  streamsize width () const;
  streamsize height () const;
  streamsize bytes_per_line () const;
  int depth () const;
  int channels () const;

  //! Sequence number among the pages of a scan, zero based
  unsigned index () const;
  void index (unsigned i);

  octet * data ();
  const octet * data () const;
  streamsize size () const;

private:
  format     format_;
  streamsize width_;
  streamsize height_;
  unsigned   index_;

  octet_buffer pixels_;
};

//! The payload did not decode into an image
class bad_image
  : public std::runtime_error
{
public:
  explicit bad_image (const std::string& what);
};

//! Turn a page payload as delivered by a driver into an image
class image_loader
{
public:
  typedef shared_ptr< image_loader > ptr;

  virtual ~image_loader () {}

  //! Throws bad_image if the payload cannot be decoded
  virtual image::ptr load (const octet *data, streamsize size) const = 0;

  //! A loader for the formats drivers commonly deliver
  /*! Understands PNM and, if available, JPEG payloads.
   */
  static ptr create ();
};

}       // namespace tsunagi

#endif  /* tsunagi_image_hpp_ */
