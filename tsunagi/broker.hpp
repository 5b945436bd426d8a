//  broker.hpp -- choose and pool worker processes per execution profile
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

#ifndef tsunagi_broker_hpp_
#define tsunagi_broker_hpp_

#include <map>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "exception.hpp"
#include "functional.hpp"
#include "memory.hpp"
#include "mutex.hpp"
#include "scan-driver.hpp"
#include "worker.hpp"

namespace tsunagi {

/*! Runs scan driver operations in worker processes.  The profile for
 *  an operation is chosen by probing the candidates in order, host
 *  bitness first.  The choice is remembered per operation.
 *
 *  Workers are started on first need, kept for reuse while they are
 *  healthy and torn down by shutdown() or when the broker goes away.
 *  Each worker serves one operation at a time.
 */
class broker
{
public:
  typedef shared_ptr< broker > ptr;

  broker (const std::string& driver,
          const std::vector< execution_profile >& candidates,
          double timeout);
  ~broker ();

  //! The host bitness profile followed by the 32-bit one, if different
  /*! Worker executables are found via run_time::locate().
   */
  static std::vector< execution_profile > default_profiles ();

  //! A scan driver for the driver kind \a workers serve
  /*! The scan protocol runs in this process when the driver's module
   *  can be loaded here and is relayed to \a workers otherwise.  An
   *  in-process driver still shows native dialogs in a worker.
   */
  static scan_driver::ptr make_driver (const ptr& workers,
                                       const image_loader::ptr& loader);

  //! Pick the first candidate whose worker can handle \a operation
  /*! Throws system_error (no_compatible_worker) if none can.  No
   *  worker process survives a failed selection.
   */
  execution_profile select_profile (const std::string& operation);

  //! Run \a body with exclusive use of a worker for \a profile
  /*! The worker is handed back for reuse when \a body returns or
   *  throws a failure reported by the worker itself.  Otherwise the
   *  worker is torn down.
   */
  template< typename T >
  T with_worker (const execution_profile& profile,
                 const function< T (worker&) >& body)
  {
    lease l (*this, profile);
    try
      {
        T rv = body (l.get ());
        l.release ();
        return rv;
      }
    catch (const system_error& e)
      {
        if (system_error::device_communication_error != e.code ())
          l.release ();
        throw;
      }
  }

  const std::string& driver () const;

  //! Close all idle workers
  void shutdown ();

  //! Number of idle workers kept for reuse
  std::size_t idle_count () const;

private:
  broker (const broker&);
  broker& operator= (const broker&);

  class lease
  {
  public:
    lease (broker& b, const execution_profile& profile);
    ~lease ();

    worker& get ();
    void release ();

  private:
    broker&     broker_;
    worker::ptr worker_;
  };

  worker::ptr acquire_(const execution_profile& profile);
  void give_back_(const worker::ptr& w);
  worker::ptr spawn_(const execution_profile& profile) const;

  std::string driver_;
  std::vector< execution_profile > candidates_;
  double      timeout_;

  mutable mutex mutex_;
  std::multimap< std::string, worker::ptr > idle_;
  std::map< std::string, execution_profile > selected_;
};

//! A scan_driver that relays every operation to a worker process
class remote_scan_driver
  : public scan_driver
{
public:
  explicit remote_scan_driver (const broker::ptr& b);

  std::vector< device_descriptor > get_devices (native::api_version v);
  scan_caps get_caps (const scan_options& options);
  void scan (const scan_options& options, scan_events& events,
             const page_callback& on_page, const cancel_token& token);

  //! Whether the worker reported the last scan as cancelled
  bool cancelled () const;

private:
  broker::ptr broker_;
  bool cancelled_;
};

//! Shows native dialogs in a worker process
class remote_ui_delegate
  : public native_ui_delegate
{
public:
  explicit remote_ui_delegate (const broker::ptr& b);

  boost::optional< native::configuration >
  configure (const std::string& driver, const std::string& device_id,
             native::window_handle parent);

private:
  broker::ptr broker_;
};

}       // namespace tsunagi

#endif  /* tsunagi_broker_hpp_ */
