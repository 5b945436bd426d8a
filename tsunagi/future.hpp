//  future.hpp -- promises and futures
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

#ifndef tsunagi_future_hpp_
#define tsunagi_future_hpp_

/*! \file
 *  \brief One-shot result hand-over between threads
 *
 *  The asynchronous entry points hand their results back through a
 *  promise/future pair.  Boost.Thread provides the same interface if
 *  the standard library does not.
 */

#if __cplusplus >= 201103L && !WITH_INCLUDED_BOOST

#include <future>
#define NAMESPACE std
#define FUTURE future

#else   /* emulate C++11 */

#define BOOST_THREAD_PROVIDES_FUTURE
#include <boost/thread/future.hpp>
#define NAMESPACE boost
#define FUTURE unique_future

#endif

namespace tsunagi {

using NAMESPACE::promise;
using NAMESPACE::FUTURE;

}       // namespace tsunagi

#undef FUTURE
#undef NAMESPACE

#endif  /* tsunagi_future_hpp_ */
