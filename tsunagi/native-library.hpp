//  native-library.hpp -- interface to native driver libraries
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

#ifndef tsunagi_native_library_hpp_
#define tsunagi_native_library_hpp_

#include <set>
#include <string>
#include <vector>

#include "cstdint.hpp"
#include "exception.hpp"
#include "functional.hpp"
#include "memory.hpp"
#include "octet.hpp"

namespace tsunagi {
namespace native {

//! Opaque value identifying a manager, device info, device, item or
//! transfer inside the native driver library
typedef void *handle;

//! Native result code, zero means success
typedef int32_t status;

static const status ok = 0;

//! Result of a native dialog that the user dismissed
static const status dialog_dismissed = 1;

//! Value passed to native dialogs to position them
typedef intptr_t window_handle;

//! Generation of the native driver API to talk to
enum api_version {
  default_version = 0,          //!< whatever the library prefers
  legacy          = 1,          //!< single "Scan" item, device level props
  current         = 2,          //!< one item per paper source
};

std::string to_string (api_version v);

//! Throws std::invalid_argument for unknown version names
api_version to_api_version (const std::string& name);

//! Parse a comma separated list of statuses, such as "0x00210003,17"
/*! Throws std::invalid_argument if an entry is not a number.
 */
std::set< status > to_status_set (const std::string& list);

//! Vendor neutral property identifiers
namespace property {

enum id {
  vendor_description = 1,
  device_description,
  document_handling_capabilities,
  document_handling_select,
  pages,
  horizontal_bed_size,
  vertical_bed_size,
  horizontal_sheet_feed_size,
  vertical_sheet_feed_size,
  max_horizontal_size,
  max_vertical_size,
  x_resolution,
  y_resolution,
  data_type,
  x_extent,
  y_extent,
  x_position,
  y_position,
  brightness,
  contrast,
};

//! Bits of the document_handling_capabilities property
namespace capability {
  static const int32_t feeder  = 0x001;
  static const int32_t flatbed = 0x002;
  static const int32_t duplex  = 0x004;
}

//! Values of the document_handling_select property
namespace select {
  static const int32_t feeder     = 0x001;
  static const int32_t flatbed    = 0x002;
  static const int32_t duplex     = 0x004;
  static const int32_t front_only = 0x008;
}

//! Values of the data_type property
namespace data {
  static const int32_t black_and_white = 0;
  static const int32_t grayscale       = 2;
  static const int32_t color           = 3;
}

}       // namespace property

//! Constraints a native property advertises for its values
struct attributes
{
  attributes ();

  bool is_range () const;
  bool is_list () const;

  enum { none, range, list } kind;
  bool editable;

  int32_t min;
  int32_t max;
  int32_t step;

  std::vector< int32_t > values;
};

//! A property as read from a native object
struct property_value
{
  property_value ();

  property::id id;
  int32_t      value;
  std::string  text;            //!< for string valued properties

  native::attributes attributes;
};

//! Receives the output of a download call
/*! Both members return \c false to ask the library to abort the
 *  transfer at the next opportunity.
 */
class transfer_sink
{
public:
  virtual ~transfer_sink () {}

  virtual bool page (const octet *data, streamsize size) = 0;
  virtual bool progress (int percent) = 0;
};

//! The non-reentrant native driver library
/*! Implementations wrap a C style driver API.  None of the members
 *  is safe to call concurrently, not even on different handles.  Use
 *  the handle wrappers from device-manager.hpp, which take care of
 *  the necessary locking, rather than calling these directly.
 *
 *  Members returning a handle return \c nullptr on failure and make
 *  the cause available through last_error().
 */
class library
{
public:
  typedef shared_ptr< library > ptr;

  virtual ~library () {}

  virtual std::string name () const = 0;

  //! The version that api_version::default_version resolves to
  virtual api_version default_version () const = 0;

  virtual status last_error () const = 0;

  virtual handle open_manager (api_version v) = 0;

  virtual status enumerate_devices (handle manager,
                                    const function< void (handle) >& cb) = 0;
  virtual std::string info_id (handle info) = 0;
  virtual std::string info_name (handle info) = 0;

  virtual handle open_device (handle manager, const std::string& id) = 0;
  virtual std::string device_id (handle device) = 0;

  virtual status enumerate_items (handle device,
                                  const function< void (handle) >& cb) = 0;
  virtual std::string item_name (handle item) = 0;

  virtual status get_properties (handle object,
                                 std::vector< property_value >& props) = 0;
  virtual status set_property (handle object, property::id id,
                               int32_t value) = 0;

  //! Run the native configuration dialog for a \a device
  /*! Returns dialog_dismissed without touching \a item when the user
   *  cancels the dialog.
   */
  virtual status prompt_to_configure (handle device, window_handle parent,
                                      handle& item) = 0;

  virtual handle start_transfer (handle item) = 0;
  virtual status download (handle transfer, transfer_sink& sink) = 0;

  //! Tear down any handle obtained from the library
  virtual void release (handle h) = 0;

  //! \name Status interpretation
  //! These do not touch the driver and need no locking.
  //! @{
  virtual bool is_invalid_argument (status s) const = 0;

  //! Statuses that end a multi-page download loop normally
  virtual std::set< status > no_more_pages () const = 0;

  //! Map a native \a s onto the scan error taxonomy
  virtual system_error::error_code classify (status s) const = 0;
  //! @}

  //! Load the driver library for a \a driver_kind
  /*! Searches for a \c libdrv-<driver_kind> module and asks it for an
   *  instance.  Throws a std::runtime_error when that fails.
   */
  static ptr create (const std::string& driver_kind);

  //! Check whether a native \a module can be loaded by this process
  static bool probe (const std::string& module);
};

}       // namespace native
}       // namespace tsunagi

#endif  /* tsunagi_native_library_hpp_ */
