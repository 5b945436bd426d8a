//  scan-options.cpp -- per scan settings
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

#include <stdexcept>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/throw_exception.hpp>

#include "tsunagi/format.hpp"
#include "tsunagi/scan-options.hpp"

namespace tsunagi {

page_size::page_size ()
  : width (0)
  , height (0)
{}

page_size::page_size (int32_t width, int32_t height)
  : width (width)
  , height (height)
{}

page_size
page_size::letter ()
{
  return page_size (8500, 11000);
}

page_size
page_size::a4 ()
{
  return page_size (8268, 11693);
}

scan_options::scan_options ()
  : paper_source (auto_source)
  , dpi (300)
  , bit_depth (color)
  , page_size (page_size::letter ())
  , page_align (align_left)
  , brightness (0)
  , contrast (0)
  , use_native_ui (false)
  , dialog_parent (0)
  , api_version (native::default_version)
  , offset_width (false)
  , brightness_contrast_after_scan (false)
{}

std::string
to_string (paper_source s)
{
  switch (s)
    {
    case auto_source: return "auto";
    case flatbed:     return "flatbed";
    case feeder:      return "feeder";
    case duplex:      return "duplex";
    }
  return "unknown";
}

std::string
to_string (bit_depth d)
{
  switch (d)
    {
    case color:           return "color";
    case grayscale:       return "grayscale";
    case black_and_white: return "black-and-white";
    }
  return "unknown";
}

paper_source
to_paper_source (const std::string& name)
{
  std::string s (boost::algorithm::to_lower_copy (name));

  if ("auto"    == s) return auto_source;
  if ("flatbed" == s) return flatbed;
  if ("feeder"  == s || "adf" == s) return feeder;
  if ("duplex"  == s) return duplex;

  BOOST_THROW_EXCEPTION
    (std::invalid_argument
     ((format ("unknown paper source: '%1%'") % name).str ()));
}

bit_depth
to_bit_depth (const std::string& name)
{
  std::string s (boost::algorithm::to_lower_copy (name));

  if ("color" == s || "colour" == s) return color;
  if ("grayscale" == s || "gray" == s) return grayscale;
  if ("black-and-white" == s || "lineart" == s
      || "binary" == s) return black_and_white;

  BOOST_THROW_EXCEPTION
    (std::invalid_argument
     ((format ("unknown bit depth: '%1%'") % name).str ()));
}

}       // namespace tsunagi
