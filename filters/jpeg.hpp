//  jpeg.hpp -- JPEG image decoding
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

#ifndef filters_jpeg_hpp_
#define filters_jpeg_hpp_

#include <cstddef>
#include <cstdio>

#include <jpeglib.h>

#include <tsunagi/image.hpp>

namespace tsunagi {
namespace _flt_ {
namespace jpeg {

namespace detail {

//! Per image decompression state
/*! Wraps the library's decompression object together with a source
 *  manager that feeds it from a payload already held in memory.
 */
struct decompressor
{
  decompressor (const octet *data, streamsize size);
  ~decompressor ();

  void    init_source ();
  boolean fill_input_buffer ();
  void    skip_input_data (long num_bytes);
  void    term_source ();

  void error_exit (j_common_ptr cinfo) __attribute__((noreturn));
  void output_message (j_common_ptr cinfo);

  image::ptr decode ();

  struct jpeg_decompress_struct cinfo_;
  struct jpeg_source_mgr        smgr_;
  struct jpeg_error_mgr         jerr_;

  const octet *data_;
  streamsize   size_;

  bool destroyed_;
};

}       // namespace detail

//! Turn a JPEG payload into raw image data
class decompressor
  : public image_loader
{
public:
  image::ptr load (const octet *data, streamsize size) const;

  //! Whether a payload starts with the JPEG start of image marker
  static bool matches (const octet *data, streamsize size);
};

}       // namespace jpeg
}       // namespace _flt_
}       // namespace tsunagi

#endif  /* filters_jpeg_hpp_ */
