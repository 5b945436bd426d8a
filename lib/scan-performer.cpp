//  scan-performer.cpp -- run scan driver operations on their own thread
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

#include "tsunagi/log.hpp"
#include "tsunagi/scan-performer.hpp"

namespace tsunagi {

scan_performer::scan_performer (const scan_driver::ptr& driver)
  : driver_(driver)
  , stopping_(false)
  , thread_(bind (&scan_performer::run_, this))
{}

scan_performer::~scan_performer ()
{
  {
    lock_guard< mutex > lock (mutex_);
    stopping_ = true;
  }
  not_empty_.notify_one ();
  thread_.join ();
}

future< std::vector< device_descriptor > >
scan_performer::get_devices (native::api_version v)
{
  return post_(function< std::vector< device_descriptor > () >
               (bind (&scan_driver::get_devices, driver_, v)));
}

future< scan_caps >
scan_performer::get_caps (const scan_options& options)
{
  return post_(function< scan_caps () >
               (bind (&scan_driver::get_caps, driver_, options)));
}

future< void >
scan_performer::scan (const scan_options& options, const cancel_token& token)
{
  return post_(function< void () >
               (bind (&scan_performer::scan_, this, options, token)));
}

connection
scan_performer::connect_page (const page_signal_type::slot_type& slot)
{
  return signal_page_.connect (slot);
}

connection
scan_performer::connect_page_start
(const scan_events::page_start_signal_type::slot_type& slot)
{
  return events_.page_start.connect (slot);
}

connection
scan_performer::connect_page_progress
(const scan_events::page_progress_signal_type::slot_type& slot)
{
  return events_.page_progress.connect (slot);
}

void
scan_performer::enqueue_(const task& t)
{
  {
    lock_guard< mutex > lock (mutex_);
    queue_.push_back (t);
  }
  not_empty_.notify_one ();
}

void
scan_performer::run_()
{
  for (;;)
    {
      task t;
      {
        unique_lock< mutex > lock (mutex_);
        while (queue_.empty () && !stopping_)
          not_empty_.wait (lock);

        if (queue_.empty ()) break;

        t = queue_.front ();
        queue_.pop_front ();
      }
      t ();
    }
  log::trace ("scan performer stopped");
}

void
scan_performer::scan_(const scan_options& options, const cancel_token& token)
{
  driver_->scan (options, events_, tsunagi::ref (signal_page_), token);
}

}       // namespace tsunagi
