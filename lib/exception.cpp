//  exception.cpp -- typed errors and their default messages
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

#include "tsunagi/exception.hpp"
#include "tsunagi/i18n.hpp"

using std::string;

namespace tsunagi {

system_error::system_error ()
  : std::runtime_error ("")
  , ec_(no_error)
  , native_(0)
{}

system_error::system_error (error_code ec, const string& message,
                            int32_t native_code)
  : std::runtime_error (message.empty ()
                        ? tsunagi::message (ec)
                        : message)
  , ec_(ec)
  , native_(native_code)
{}

const system_error::error_code&
system_error::code () const
{
  return ec_;
}

int32_t
system_error::native_code () const
{
  return native_;
}

string
message (system_error::error_code ec)
{
  switch (ec)
    {
    case system_error::no_error:
      return string ();
    case system_error::cover_open:
      return _("The device's cover is open.");
    case system_error::media_jam:
      return _("A paper jam occurred.");
    case system_error::permission_denied:
      return _("Access to the device was denied.");
    case system_error::device_busy:
      return _("The device is busy.");
    case system_error::device_offline:
      return _("The device is offline.");
    case system_error::device_error:
      return _("The device reported an error.");
    case system_error::no_feeder_support:
      return _("The device does not have a document feeder.");
    case system_error::no_duplex_support:
      return _("The device does not support duplex scanning.");
    case system_error::feeder_empty:
      return _("There are no pages in the document feeder.");
    case system_error::device_communication_error:
      return _("Communication with the device failed.");
    case system_error::no_compatible_worker:
      return _("No worker process can load the native driver.");
    case system_error::user_cancelled:
      return _("The scan was cancelled.");
    case system_error::unknown_error:
      break;
    }
  return _("Unknown error.");
}

}       // namespace tsunagi
