//  worker-service.hpp -- serve scan requests inside a worker process
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

#ifndef tsunagi_worker_service_hpp_
#define tsunagi_worker_service_hpp_

#include <set>
#include <string>

#include "cancel.hpp"
#include "exception.hpp"
#include "ipc.hpp"
#include "memory.hpp"
#include "mutex.hpp"
#include "scan-driver.hpp"
#include "thread.hpp"
#include "wire.hpp"

namespace tsunagi {

//! Server side of a worker process
/*! Serves the requests of a single client over a loopback socket.
 *  The port is announced on standard output before the service starts
 *  accepting.  Scans run on a separate thread so that CANCEL messages
 *  are noticed while pages are being transferred.
 */
class worker_service
{
public:
  //! \a driver may be null if no native library could be loaded
  worker_service (const shared_ptr< native_scan_driver >& driver);
  ~worker_service ();

  //! Refuse probes for a \a capability
  void refuse (const std::string& capability);

  //! Serve until the client closes the connection
  /*! Returns the process exit status to use.
   */
  int run ();

private:
  worker_service (const worker_service&);
  worker_service& operator= (const worker_service&);

  bool dispatch_(const ipc::header& hdr, const octet_buffer& payload);
  bool supports_(const std::string& capability) const;

  void start_scan_(const scan_options& options);
  void scan_(scan_options options, cancel_token token);
  bool scanning_() const;
  void finish_scan_();

  void reply_(const ipc::header& request, const wire::encoder& payload);
  void reply_(uint32_t type, const system_error& e);
  void notify_(uint32_t type, const wire::encoder& payload);

  void page_start_();
  void page_progress_(double fraction);
  void page_(const image::ptr& img);

  shared_ptr< native_scan_driver > driver_;
  std::set< std::string > refused_;

  ipc::channel channel_;
  uint32_t     id_;

  mutable mutex        mutex_;
  bool                 scanning_flag_;
  shared_ptr< thread > scan_thread_;
  cancel_source        cancel_;
};

}       // namespace tsunagi

#endif  /* tsunagi_worker_service_hpp_ */
