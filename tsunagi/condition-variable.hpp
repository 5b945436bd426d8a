//  condition-variable.hpp -- condition variables in the tsunagi namespace
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

#ifndef tsunagi_condition_variable_hpp_
#define tsunagi_condition_variable_hpp_

#if __cplusplus >= 201103L && !WITH_INCLUDED_BOOST

#include <condition_variable>
#define NAMESPACE std

#else   /* emulate C++11 */

#include <boost/thread/condition_variable.hpp>
#define NAMESPACE boost

#endif

namespace tsunagi {

using NAMESPACE::condition_variable;

}       // namespace tsunagi

#undef NAMESPACE

#endif  /* tsunagi_condition_variable_hpp_ */
