//  functional.hpp -- function objects and binders
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

#ifndef tsunagi_functional_hpp_
#define tsunagi_functional_hpp_

/*! \file
 *  \brief Function objects and binders in the \c tsunagi namespace
 */

#if __cplusplus >= 201103L

#include <functional>
#define NAMESPACE std

#else   /* emulate C++11 */

#include <boost/bind.hpp>
#include <boost/function.hpp>
#include <boost/ref.hpp>
#define NAMESPACE boost

#endif

namespace tsunagi {

using NAMESPACE::bind;
using NAMESPACE::function;
using NAMESPACE::cref;
using NAMESPACE::ref;

#if __cplusplus >= 201103L
namespace placeholders = std::placeholders;
#else
namespace placeholders {
  using ::_1;
  using ::_2;
  using ::_3;
}
#endif

}       // namespace tsunagi

#undef NAMESPACE

#endif  /* tsunagi_functional_hpp_ */
