//  scan-performer.hpp -- run scan driver operations on their own thread
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

#ifndef tsunagi_scan_performer_hpp_
#define tsunagi_scan_performer_hpp_

#include <deque>
#include <vector>

#include "cancel.hpp"
#include "condition-variable.hpp"
#include "exception.hpp"
#include "functional.hpp"
#include "future.hpp"
#include "memory.hpp"
#include "mutex.hpp"
#include "scan-driver.hpp"
#include "signal.hpp"
#include "thread.hpp"

namespace tsunagi {

/*! Runs the operations of a scan_driver on a dedicated thread so that
 *  callers never block on a native call.  Operations are carried out
 *  one at a time, in the order they were requested.  Results, errors
 *  included, are handed back through futures.
 *
 *  Scan output is emitted through the signals.  Slots run on the
 *  performer's thread, pages in acquisition order.
 */
class scan_performer
{
public:
  typedef signal< void (const image::ptr&) > page_signal_type;

  explicit scan_performer (const scan_driver::ptr& driver);

  //! Finishes pending operations, then stops the thread
  ~scan_performer ();

  future< std::vector< device_descriptor > >
  get_devices (native::api_version v);

  future< scan_caps >
  get_caps (const scan_options& options);

  future< void >
  scan (const scan_options& options, const cancel_token& token);

  connection connect_page (const page_signal_type::slot_type& slot);
  connection connect_page_start
  (const scan_events::page_start_signal_type::slot_type& slot);
  connection connect_page_progress
  (const scan_events::page_progress_signal_type::slot_type& slot);

private:
  scan_performer (const scan_performer&);
  scan_performer& operator= (const scan_performer&);

  typedef function< void () > task;

  template< typename T >
  struct job
  {
    shared_ptr< promise< T > > result;
    function< T () > body;

    void operator() ()
    {
      try
        {
          result->set_value (body ());
        }
      catch (...)
        {
          result->set_exception (current_exception ());
        }
    }
  };

  template< typename T >
  future< T > post_(const function< T () >& body)
  {
    job< T > j;
    j.result = make_shared< promise< T > > ();
    j.body = body;
    future< T > rv (j.result->get_future ());
    enqueue_(j);
    return rv;
  }

  void enqueue_(const task& t);
  void run_();

  void scan_(const scan_options& options, const cancel_token& token);

  scan_driver::ptr driver_;
  scan_events      events_;
  page_signal_type signal_page_;

  mutex mutex_;
  condition_variable not_empty_;
  std::deque< task > queue_;
  bool stopping_;

  thread thread_;
};

template<>
struct scan_performer::job< void >
{
  shared_ptr< promise< void > > result;
  function< void () > body;

  void operator() ()
  {
    try
      {
        body ();
        result->set_value ();
      }
    catch (...)
      {
        result->set_exception (current_exception ());
      }
  }
};

}       // namespace tsunagi

#endif  /* tsunagi_scan_performer_hpp_ */
