//  capabilities.cpp -- scanner capability descriptions
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

#include <algorithm>

#include "tsunagi/capabilities.hpp"

namespace tsunagi {

dpi_caps
dpi_caps::for_range (int32_t min, int32_t max, int32_t step)
{
  dpi_caps caps;

  caps.min  = min;
  caps.max  = max;
  caps.step = step;

  return caps;
}

dpi_caps
dpi_caps::for_values (const std::vector< int32_t >& values)
{
  dpi_caps caps;

  caps.list = values;
  std::sort (caps.list.begin (), caps.list.end ());
  caps.list.erase (std::unique (caps.list.begin (), caps.list.end ()),
                   caps.list.end ());

  return caps;
}

bool
dpi_caps::is_range () const
{
  return min && max;
}

std::vector< int32_t >
dpi_caps::values () const
{
  if (!is_range ()) return list;

  std::vector< int32_t > rv;
  int32_t incr = (step && 0 < *step ? *step : 1);

  for (int32_t v = *min; v <= *max; v += incr)
    rv.push_back (v);

  return rv;
}

bit_depth_caps::bit_depth_caps ()
  : supports_color (false)
  , supports_grayscale (false)
  , supports_black_and_white (false)
{}

page_size_caps::page_size_caps ()
  : width (0)
  , height (0)
{}

paper_source_caps::paper_source_caps ()
  : supports_flatbed (false)
  , supports_feeder (false)
  , supports_duplex (false)
  , can_check_if_feeder_has_paper (false)
{}

}       // namespace tsunagi
