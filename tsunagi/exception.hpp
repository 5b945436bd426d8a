//  exception.hpp -- typed errors
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

#ifndef tsunagi_exception_hpp_
#define tsunagi_exception_hpp_

#if __cplusplus >= 201103L && !WITH_INCLUDED_BOOST

#include <exception>
#define NAMESPACE std

#else   /* emulate C++11 */

#include <boost/exception_ptr.hpp>
#define NAMESPACE boost

#endif

namespace tsunagi {

using NAMESPACE::exception_ptr;
using NAMESPACE::current_exception;
using NAMESPACE::rethrow_exception;

}       // namespace tsunagi

#undef NAMESPACE

#include <stdexcept>
#include <string>

#include "cstdint.hpp"

namespace tsunagi {

//! Scan related error conditions
/*! Every failure that a caller may want to present differently ends
 *  up as one of the error_code values.  The native status that gave
 *  rise to the error, if any, is kept for diagnostic purposes.
 */
class system_error
  : public std::runtime_error
{
public:
  enum error_code {
    no_error = 0,

    cover_open,
    media_jam,
    permission_denied,
    device_busy,
    device_offline,
    device_error,               //!< generic native failure
    no_feeder_support,
    no_duplex_support,
    feeder_empty,
    device_communication_error,
    no_compatible_worker,
    user_cancelled,

    unknown_error               // keep this last
  };

  system_error ();
  system_error (error_code ec, const std::string& message,
                int32_t native_code = 0);

  const error_code& code () const;
  int32_t native_code () const;

private:
  error_code ec_;
  int32_t    native_;
};

//! Default, user presentable message for an error \a ec
std::string
message (system_error::error_code ec);

}       // namespace tsunagi

#endif  /* tsunagi_exception_hpp_ */
