//  device.cpp -- device descriptors
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

#include "tsunagi/device.hpp"

namespace tsunagi {

device_descriptor::device_descriptor ()
{}

device_descriptor::device_descriptor (const std::string& driver,
                                      const std::string& id,
                                      const std::string& name)
  : driver_(driver)
  , id_(id)
  , name_(name)
{}

const std::string&
device_descriptor::driver () const
{
  return driver_;
}

const std::string&
device_descriptor::id () const
{
  return id_;
}

const std::string&
device_descriptor::name () const
{
  return name_;
}

bool
device_descriptor::empty () const
{
  return id_.empty ();
}

bool
device_descriptor::operator== (const device_descriptor& rhs) const
{
  return (driver_ == rhs.driver_
          && id_ == rhs.id_);
}

bool
device_descriptor::operator< (const device_descriptor& rhs) const
{
  return (driver_ < rhs.driver_
          || (driver_ == rhs.driver_ && id_ < rhs.id_));
}

}       // namespace tsunagi
