//  library.hpp -- native driver library on top of SANE
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

#ifndef drivers_sane_library_hpp_
#define drivers_sane_library_hpp_

extern "C" {                    // needed until sane-backends-1.0.14
#include <sane/sane.h>
}

#include <map>
#include <set>
#include <string>
#include <vector>

#include "tsunagi/native-library.hpp"

namespace tsunagi {
namespace _drv_ {
namespace sane {

/*! Presents the SANE frontend API as a native driver library.
 *
 *  With the legacy API every device has a single "Scan" item and the
 *  paper source is chosen with device properties.  Feeders deliver a
 *  page per download call.  With the current API there is one item per
 *  paper source and a feeder download delivers all pages at once.
 *
 *  Pages are handed over as PNM payloads.  Geometry is only pushed to
 *  the backend when a transfer starts.
 */
class library
  : public native::library
{
public:
  library ();
  ~library ();

  std::string name () const;
  native::api_version default_version () const;
  native::status last_error () const;

  native::handle open_manager (native::api_version v);

  native::status enumerate_devices (native::handle manager,
                                    const function< void (native::handle) >& cb);
  std::string info_id (native::handle info);
  std::string info_name (native::handle info);

  native::handle open_device (native::handle manager, const std::string& id);
  std::string device_id (native::handle device);

  native::status enumerate_items (native::handle device,
                                  const function< void (native::handle) >& cb);
  std::string item_name (native::handle item);

  native::status get_properties (native::handle object,
                                 std::vector< native::property_value >& props);
  native::status set_property (native::handle object,
                               native::property::id id, int32_t value);

  native::status prompt_to_configure (native::handle device,
                                      native::window_handle parent,
                                      native::handle& item);

  native::handle start_transfer (native::handle item);
  native::status download (native::handle transfer,
                           native::transfer_sink& sink);

  void release (native::handle h);

  bool is_invalid_argument (native::status s) const;
  std::set< native::status > no_more_pages () const;
  system_error::error_code classify (native::status s) const;

  //! Map a SANE status into the native status space
  static native::status to_status (SANE_Status s);

private:
  struct node;
  struct device_state;

  node * as_node (native::handle h) const;
  native::handle fail_(SANE_Status s);

  node * make_ (int kind, native::api_version v);

  void item_props_ (const node& item,
                    std::vector< native::property_value >& props) const;
  native::status set_item_prop_ (node& item, native::property::id id,
                                 int32_t value);
  native::status apply_ (const node& item);
  native::status acquire_page_ (node& xfer, native::transfer_sink& sink,
                                bool& aborted);

  std::set< node * > nodes_;
  native::status last_error_;
};

}       // namespace sane
}       // namespace _drv_
}       // namespace tsunagi

#endif  /* drivers_sane_library_hpp_ */
