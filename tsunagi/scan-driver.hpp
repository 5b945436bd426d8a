//  scan-driver.hpp -- scan protocol interfaces
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

#ifndef tsunagi_scan_driver_hpp_
#define tsunagi_scan_driver_hpp_

#include <set>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "cancel.hpp"
#include "capabilities.hpp"
#include "device-manager.hpp"
#include "device.hpp"
#include "functional.hpp"
#include "image.hpp"
#include "memory.hpp"
#include "mutex.hpp"
#include "scan-options.hpp"
#include "signal.hpp"

namespace tsunagi {

//! Notifications raised while a scan is in progress
/*! page_start fires before the first page is acquired and after each
 *  page that was delivered.  page_progress reports the fraction of
 *  the current page that has been transferred.
 */
struct scan_events
{
  typedef signal< void () > page_start_signal_type;
  typedef signal< void (double) > page_progress_signal_type;

  page_start_signal_type    page_start;
  page_progress_signal_type page_progress;
};

//! Receives the pages of a scan, in acquisition order
typedef function< void (const image::ptr&) > page_callback;

//! Uniform interface to everything that can scan
/*! Implementations either talk to a native driver library directly
 *  or relay the requests to a worker process that does.
 */
class scan_driver
{
public:
  typedef shared_ptr< scan_driver > ptr;

  virtual ~scan_driver () {}

  virtual std::vector< device_descriptor >
  get_devices (native::api_version v) = 0;

  //! Throws system_error (device_error) if the device cannot be queried
  virtual scan_caps get_caps (const scan_options& options) = 0;

  //! Acquire pages according to \a options
  /*! Pages are handed to \a on_page as they come in.  A cancelled scan
   *  returns normally after delivering the pages acquired so far.
   *  Failures are reported as system_error.
   */
  virtual void scan (const scan_options& options, scan_events& events,
                     const page_callback& on_page,
                     const cancel_token& token) = 0;
};

//! Runs a native configuration dialog on behalf of another process
/*! Some native dialogs only work in a process whose bitness matches
 *  that of the driver library.  A delegate shows the dialog there and
 *  brings back what the user chose.
 */
class native_ui_delegate
{
public:
  typedef shared_ptr< native_ui_delegate > ptr;

  virtual ~native_ui_delegate () {}

  //! Returns an empty value if the user dismissed the dialog
  virtual boost::optional< native::configuration >
  configure (const std::string& driver, const std::string& device_id,
             native::window_handle parent) = 0;
};

//! Scan protocol for a native driver library
/*! All native handles acquired during an operation are scoped to that
 *  operation and released on every exit path.
 */
class native_scan_driver
  : public scan_driver
{
public:
  enum state {
    idle,
    enumerating,
    negotiating,
    configuring,
    transferring,
    completed,
    cancelled,
    failed,
  };

  native_scan_driver (const native::library::ptr& lib,
                      const image_loader::ptr& loader,
                      const std::string& driver);

  std::vector< device_descriptor > get_devices (native::api_version v);
  scan_caps get_caps (const scan_options& options);
  void scan (const scan_options& options, scan_events& events,
             const page_callback& on_page, const cancel_token& token);

  //! Show legacy native dialogs through \a delegate
  void native_ui (const native_ui_delegate::ptr& delegate);

  //! Replace the library's terminal "no more pages" statuses
  void no_more_pages (const std::set< native::status >& statuses);

  state current_state () const;

  //! Properties the last scan could not set, for diagnostics
  std::vector< std::string > property_failures () const;

  //! Run the native dialog in this process and capture the outcome
  /*! This is the counterpart of a native_ui_delegate.
   */
  boost::optional< native::configuration >
  configure (const std::string& device_id, native::window_handle parent);

private:
  class session;

  scan_caps get_caps (const scan_options& options, native::api_version v);
  bool scan (scan_options options, native::api_version v,
             scan_events& events, const page_callback& on_page,
             const cancel_token& token, unsigned& delivered);

  native::item::ptr find_item (native::device& dev,
                               const scan_options& options);
  void configure (native::device& dev, native::item& it,
                  const scan_options& options);
  void record_failure (const std::string& what);
  void transfer (native::device& dev, native::item& it,
                 const scan_options& options, scan_events& events,
                 const page_callback& on_page, const cancel_token& token,
                 unsigned& delivered);

  bool should_fall_back (const native::error& e, native::api_version v,
                         const scan_options& options) const;
  void translate (const native::error& e) const;

  void set_state (state s);

  native::library::ptr lib_;
  image_loader::ptr    loader_;
  std::string          driver_;

  native_ui_delegate::ptr  delegate_;
  std::set< native::status > no_more_pages_;

  mutable mutex mutex_;
  state state_;
  std::vector< std::string > failures_;
};

std::string to_string (native_scan_driver::state s);

}       // namespace tsunagi

#endif  /* tsunagi_scan_driver_hpp_ */
