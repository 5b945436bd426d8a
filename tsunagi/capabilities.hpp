//  capabilities.hpp -- scanner capability descriptions
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

#ifndef tsunagi_capabilities_hpp_
#define tsunagi_capabilities_hpp_

#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "cstdint.hpp"

namespace tsunagi {

//! Resolutions a paper source supports
/*! Drivers describe these either as a range or as a set of discrete
 *  values.  values() gives the discrete form in both cases.
 */
struct dpi_caps
{
  static dpi_caps for_range (int32_t min, int32_t max, int32_t step);
  static dpi_caps for_values (const std::vector< int32_t >& values);

  bool is_range () const;
  std::vector< int32_t > values () const;

  boost::optional< int32_t > min;
  boost::optional< int32_t > max;
  boost::optional< int32_t > step;
  std::vector< int32_t > list;
};

struct bit_depth_caps
{
  bit_depth_caps ();

  bool supports_color;
  bool supports_grayscale;
  bool supports_black_and_white;
};

//! Largest area a paper source can scan, in thousandths of an inch
struct page_size_caps
{
  page_size_caps ();

  int32_t width;
  int32_t height;
};

struct per_source_caps
{
  boost::optional< tsunagi::dpi_caps > dpi_caps;
  boost::optional< tsunagi::bit_depth_caps > bit_depth_caps;
  boost::optional< tsunagi::page_size_caps > page_size_caps;
};

struct paper_source_caps
{
  paper_source_caps ();

  bool supports_flatbed;
  bool supports_feeder;
  bool supports_duplex;
  bool can_check_if_feeder_has_paper;
};

struct metadata_caps
{
  std::string manufacturer;
  std::string model;
};

//! Everything a capability query learned about a device
struct scan_caps
{
  tsunagi::metadata_caps     metadata_caps;
  tsunagi::paper_source_caps paper_source_caps;

  boost::optional< per_source_caps > flatbed_caps;
  boost::optional< per_source_caps > feeder_caps;
  boost::optional< per_source_caps > duplex_caps;
};

}       // namespace tsunagi

#endif  /* tsunagi_capabilities_hpp_ */
