//  worker.hpp -- client side of a worker process
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

#ifndef tsunagi_worker_hpp_
#define tsunagi_worker_hpp_

#include <sys/types.h>

#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "cancel.hpp"
#include "capabilities.hpp"
#include "device-manager.hpp"
#include "device.hpp"
#include "ipc.hpp"
#include "memory.hpp"
#include "scan-driver.hpp"
#include "scan-options.hpp"
#include "wire.hpp"

namespace tsunagi {

//! How to start a worker process of a particular bitness
struct execution_profile
{
  execution_profile ();
  execution_profile (int bitness, const std::string& name,
                     const std::string& executable);

  int         bitness;
  std::string name;
  std::string executable;

  //! Passed to the executable after the standard ones
  std::vector< std::string > arguments;

  static int host_bitness ();
};

//! Client side of a worker process
/*! The constructor starts the executable named by the profile, reads
 *  the port it listens on from its standard output and connects.  The
 *  worker process lives as long as the object or until close().
 *
 *  Requests are answered synchronously.  Failures of the worker are
 *  rethrown here as the system_error it reported.  Transport failures
 *  are reported as device_communication_error.
 */
class worker
{
public:
  typedef shared_ptr< worker > ptr;

  worker (const execution_profile& profile, const std::string& driver,
          double timeout);
  ~worker ();

  //! Ask the worker to exit, kill it if it does not respond in time
  void close ();

  bool probe (const std::string& capability);

  std::vector< device_descriptor > enumerate (native::api_version v);

  scan_caps get_caps (const scan_options& options);

  //! Relay a scan, see scan_driver::scan()
  /*! Cancelling the \a token sends a CANCEL message.  The worker stops
   *  its transfer and finishes the scan normally.  Returns whether the
   *  worker reported the scan as cancelled.
   */
  bool scan (const scan_options& options, scan_events& events,
             const page_callback& on_page, const cancel_token& token);

  boost::optional< native::configuration >
  native_ui (const std::string& device_id, native::window_handle parent);

  void cancel ();

  const execution_profile& profile () const;
  pid_t pid () const;

  //! Number of worker processes that have not been reaped yet
  static unsigned live_count ();

private:
  worker (const worker&);
  worker& operator= (const worker&);

  bool fork_();
  bool connect_();
  void reap_(double timeout);

  //! Send a request and wait for its reply
  /*! A \a timeout of zero waits as long as it takes.
   */
  void request_(uint32_t type, const wire::encoder& request,
                octet_buffer& reply, double timeout);
  void check_(const ipc::header& hdr, const octet_buffer& payload) const;
  void fail_(const std::string& what) const;

  execution_profile profile_;
  std::string driver_;
  double      timeout_;

  pid_t pid_;
  int   port_;
  ipc::channel channel_;

  uint32_t id_;
};

}       // namespace tsunagi

#endif  /* tsunagi_worker_hpp_ */
