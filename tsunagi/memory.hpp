//  memory.hpp -- smart pointers in the tsunagi namespace
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

#ifndef tsunagi_memory_hpp_
#define tsunagi_memory_hpp_

/*! \file
 *  \brief Managed pointers in the \c tsunagi namespace
 *
 *  Lets the code base use \c shared_ptr and friends without caring
 *  whether they come from the C++11 standard library or from Boost.
 */

#if __cplusplus >= 201103L && !WITH_INCLUDED_BOOST

#include <memory>
#define NAMESPACE std

#else   /* emulate C++11 */

#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/weak_ptr.hpp>
#define NAMESPACE boost

#endif

namespace tsunagi {

using NAMESPACE::dynamic_pointer_cast;
using NAMESPACE::make_shared;
using NAMESPACE::shared_ptr;
using NAMESPACE::weak_ptr;

//! Keep a \c shared_ptr<T> from deleting what it does not own
struct null_deleter
{
  void operator() (const void *) const {}
};

}       // namespace tsunagi

#undef NAMESPACE

#endif  /* tsunagi_memory_hpp_ */
