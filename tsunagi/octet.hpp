//  octet.hpp -- octets and octet buffers
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

#ifndef tsunagi_octet_hpp_
#define tsunagi_octet_hpp_

#include <ios>
#include <string>
#include <vector>

namespace tsunagi {

//! A set of eight bits with no particular interpretation attached
typedef char octet;

//! Signed integral type that can be used to count octets
using std::streamsize;

//! Contiguous, owning octet storage for page payloads and messages
typedef std::vector< octet > octet_buffer;

} // namespace tsunagi

#endif /* tsunagi_octet_hpp_ */
