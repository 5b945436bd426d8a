//  log.cpp -- prioritised, categorised diagnostics
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

#include <iostream>
#include <sstream>
#include <stdexcept>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/throw_exception.hpp>

#include "tsunagi/log.hpp"

namespace tsunagi {

log::priority log::threshold = log::ERROR;
log::category log::matching  = log::ALL;

std::ostream& log::os = std::clog;

log::priority
log::to_priority (const std::string& name)
{
  std::string s (boost::algorithm::to_lower_copy (name));

  if ("fatal" == s) return FATAL;
  if ("alert" == s) return ALERT;
  if ("error" == s) return ERROR;
  if ("brief" == s) return BRIEF;
  if ("trace" == s) return TRACE;
  if ("debug" == s) return DEBUG;

  BOOST_THROW_EXCEPTION
    (std::invalid_argument
     ((format ("unknown log level: '%1%'") % name).str ()));
}

//! Returns a null pointer for categories that are not named in output
const char *
log::to_string (category cat)
{
  if (NATIVE == cat) return "native";
  if (BROKER == cat) return "broker";
  return nullptr;
}

log::message::~message ()
{
  try
    {
      if (arg_ < cnt_)
        {
          if (arg_count_checking)
            {
              log::error ("log::message::too_few_args: %1% < %2%")
                % arg_ % cnt_;
            }
          for (int i = arg_; i < cnt_; /**/)
            {
              std::ostringstream placeholder;
              placeholder << "%" << ++i << "%";
              *this % placeholder.str ();
            }
        }
      log::os << *this;
    }
  catch (const std::exception& e)
    {
      log::os << "log::message: " << e.what () << std::endl;
    }
}

log::message::operator std::string () const
{
  std::string rv;

  if (fmt_)
    {
      std::ostringstream os;

      os << *timestamp_ << "[" << *thread_id_ << "]: ";
      if (to_string (cat_))
        os << to_string (cat_) << ": ";
      os << *fmt_ << std::endl;

      rv = os.str ();
    }
  else if (arg_count_checking && arg_ < cnt_)
    {
      BOOST_THROW_EXCEPTION (boost::io::too_few_args (arg_, cnt_));
    }
  dumped_ = true;
  return rv;
}

}       // namespace tsunagi
