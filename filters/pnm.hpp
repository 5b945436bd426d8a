//  pnm.hpp -- PNM image decoding and encoding
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

#ifndef filters_pnm_hpp_
#define filters_pnm_hpp_

#include <ostream>
#include <string>

#include <tsunagi/image.hpp>

namespace tsunagi {
namespace _flt_ {

//! Read and write images in portable any map format
/*! The portable any map (PNM) family of formats include formats for
 *  bi-level (PBM), grey-scale (PGM) and color (PPM) images.
 *
 *  The canonical format specifications can be found at:
 *   - http://netpbm.sourceforge.net/doc/pbm.html
 *   - http://netpbm.sourceforge.net/doc/pgm.html
 *   - http://netpbm.sourceforge.net/doc/ppm.html
 *
 *  The PBM specification is \e ink oriented and uses one to mean
 *  "inked", which matches the in-memory bilevel layout.
 *
 *  \note  Only "raw" variants of the PNM formats with a maximum sample
 *         value of 255 are supported.
 */
class pnm
  : public image_loader
{
public:
  image::ptr load (const octet *data, streamsize size) const;

  //! Whether a payload starts with a supported PNM magic
  static bool matches (const octet *data, streamsize size);

  static std::string header (const image& img);

  static void write (std::ostream& os, const image& img);
};

}       // namespace _flt_
}       // namespace tsunagi

#endif  /* filters_pnm_hpp_ */
