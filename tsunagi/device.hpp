//  device.hpp -- device descriptors
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

#ifndef tsunagi_device_hpp_
#define tsunagi_device_hpp_

#include <string>

#include <boost/operators.hpp>

namespace tsunagi {

//! Identifies a physical device independent of its transport
/*! Descriptors are created by enumeration and never change.  Two of
 *  them denote the same device when both driver kind and identifier
 *  match, irrespective of their display names.
 */
class device_descriptor
  : private boost::equality_comparable< device_descriptor >
  , private boost::less_than_comparable< device_descriptor >
{
public:
  device_descriptor ();
  device_descriptor (const std::string& driver, const std::string& id,
                     const std::string& name);

  //! The kind of native driver library that handles the device
  const std::string& driver () const;
  const std::string& id () const;
  const std::string& name () const;

  bool empty () const;

  bool operator== (const device_descriptor& rhs) const;
  bool operator< (const device_descriptor& rhs) const;

private:
  std::string driver_;
  std::string id_;
  std::string name_;
};

}       // namespace tsunagi

#endif  /* tsunagi_device_hpp_ */
