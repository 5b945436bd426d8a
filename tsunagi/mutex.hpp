//  mutex.hpp -- mutexes and locks
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

#ifndef tsunagi_mutex_hpp_
#define tsunagi_mutex_hpp_

/*! \file
 *  \brief Mutexes and lock types in the \c tsunagi namespace
 *
 *  Boost.Thread stands in where the standard library cannot.
 */

#if __cplusplus >= 201103L && !WITH_INCLUDED_BOOST

#include <mutex>
#define NAMESPACE std

#else   /* emulate C++11 */

#include <boost/thread/mutex.hpp>
#include <boost/thread/locks.hpp>
#define NAMESPACE boost

#endif

namespace tsunagi {

using NAMESPACE::mutex;
using NAMESPACE::lock_guard;
using NAMESPACE::unique_lock;

}       // namespace tsunagi

#undef NAMESPACE

#endif  /* tsunagi_mutex_hpp_ */
