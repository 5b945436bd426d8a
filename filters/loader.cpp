//  loader.cpp -- pick a decoder based on the payload
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

#include <tsunagi/image.hpp>
#include <tsunagi/log.hpp>

#include "jpeg.hpp"
#include "pnm.hpp"

namespace tsunagi {
namespace _flt_ {

//! Pick a decoder based on the payload's leading octets
class sniffing_loader
  : public image_loader
{
public:
  image::ptr
  load (const octet *data, streamsize size) const
  {
    if (pnm::matches (data, size))
      return pnm_.load (data, size);

    if (jpeg::decompressor::matches (data, size))
      return jpeg_.load (data, size);

    log::error ("unrecognised page payload (%1% octets)") % size;
    BOOST_THROW_EXCEPTION (bad_image ("unsupported image format"));
  }

private:
  pnm pnm_;
  jpeg::decompressor jpeg_;
};

}       // namespace _flt_

image_loader::ptr
image_loader::create ()
{
  return make_shared< _flt_::sniffing_loader > ();
}

}       // namespace tsunagi
