//  scan-options.hpp -- per scan settings
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

#ifndef tsunagi_scan_options_hpp_
#define tsunagi_scan_options_hpp_

#include <string>

#include "cstdint.hpp"
#include "device.hpp"
#include "native-library.hpp"

namespace tsunagi {

enum paper_source {
  auto_source,
  flatbed,
  feeder,
  duplex,
};

enum bit_depth {
  color,
  grayscale,
  black_and_white,
};

enum horizontal_align {
  align_left,
  align_center,
  align_right,
};

//! Page dimensions in thousandths of an inch
struct page_size
{
  page_size ();
  page_size (int32_t width, int32_t height);

  int32_t width;
  int32_t height;

  static page_size letter ();
  static page_size a4 ();
};

//! What a single scan should do
/*! The options are fixed for the duration of a scan.  A paper source
 *  of auto_source is resolved to a concrete one before the transfer
 *  begins.
 */
struct scan_options
{
  scan_options ();

  device_descriptor device;

  tsunagi::paper_source     paper_source;
  int32_t                   dpi;
  tsunagi::bit_depth        bit_depth;
  tsunagi::page_size        page_size;
  horizontal_align          page_align;
  int32_t                   brightness;   //!< -1000 .. 1000
  int32_t                   contrast;     //!< -1000 .. 1000

  bool                      use_native_ui;
  native::window_handle     dialog_parent;

  native::api_version       api_version;
  bool                      offset_width;
  bool                      brightness_contrast_after_scan;
};

std::string to_string (paper_source s);
std::string to_string (bit_depth d);

//! Parse a user supplied paper source or bit depth name
/*! Throw std::invalid_argument for names not recognised.
 */
paper_source to_paper_source (const std::string& name);
bit_depth to_bit_depth (const std::string& name);

}       // namespace tsunagi

#endif  /* tsunagi_scan_options_hpp_ */
