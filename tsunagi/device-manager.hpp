//  device-manager.hpp -- wrappers for the native handle tree
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

#ifndef tsunagi_device_manager_hpp_
#define tsunagi_device_manager_hpp_

#include <csignal>
#include <map>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "native-object.hpp"
#include "signal.hpp"

namespace tsunagi {
namespace native {

//! Editable property values, keyed by property identifier
typedef std::map< property::id, int32_t > property_map;

class item;
class transfer;

//! Property handling shared by devices and their items
class item_base
  : public object
{
public:
  std::vector< property_value > properties () const;
  boost::optional< property_value > property (property::id id) const;

  //! Value of a property that has to be there
  /*! Throws a native::error if the object has no such property.
   */
  int32_t value (property::id id) const;

  void set_property (property::id id, int32_t value);

  //! Set the supported value closest to \a value
  /*! On return \a value holds what was actually set.
   */
  void set_property_closest (property::id id, int32_t& value);

  //! Map \a value from the expected range onto the property's range
  void set_property_range (property::id id, int32_t value,
                           int32_t expected_min, int32_t expected_max);

  property_map serialize_editable () const;

  //! Apply editable \a values one by one
  /*! Values that the driver rejects are logged and skipped.
   */
  void deserialize_editable (const property_map& values);

  //! The subset of \a values that differs from the current state
  property_map delta (const property_map& values) const;

protected:
  item_base (const access& token, native::handle h);
};

//! A device's paper source, or the single "Scan" item of legacy APIs
class item
  : public item_base
{
public:
  typedef shared_ptr< item > ptr;

  item (const access& token, native::handle h);

  std::string name () const;

  shared_ptr< transfer > start_transfer ();
};

//! An opened scanning device
class device
  : public item_base
{
public:
  typedef shared_ptr< device > ptr;

  device (const access& token, native::handle h, api_version v);

  api_version version () const;

  std::string id () const;

  bool supports_flatbed () const;
  bool supports_feeder () const;
  bool supports_duplex () const;

  std::vector< item::ptr > sub_items () const;

  //! The sub-item called \a name, a null pointer if there is none
  item::ptr find_sub_item (const std::string& name) const;

  //! Let the native dialog pick and configure an item
  /*! Returns a null pointer if the user dismissed the dialog.
   */
  item::ptr prompt_to_configure (window_handle parent);

private:
  int32_t handling_capabilities () const;

  api_version version_;
};

//! Identity of a device as seen during enumeration
class device_info
  : public object
{
public:
  typedef shared_ptr< device_info > ptr;

  device_info (const access& token, native::handle h);

  std::string id () const;
  std::string name () const;
};

//! Entry point into the native library for a given API version
class device_manager
  : public object
{
public:
  typedef shared_ptr< device_manager > ptr;

  //! Open a manager, resolving the default_version first
  static ptr open (const library::ptr& lib, api_version v);

  api_version version () const;

  std::vector< device_info::ptr > device_infos () const;

  device::ptr find_device (const std::string& id) const;

private:
  device_manager (const access& token, api_version v);

  api_version version_;
};

//! A running download from an item
/*! Page and progress notifications are emitted from within download()
 *  while the native monitor is held.
 */
class transfer
  : public object
{
public:
  typedef shared_ptr< transfer > ptr;

  typedef signal< void (const octet *, streamsize) > page_signal_type;
  typedef signal< void (int) > progress_signal_type;

  transfer (const access& token, native::handle h);

  //! Issue a single download call
  /*! Throws a native::error for any non-ok status.  The status is
   *  preserved so callers can recognise terminal statuses.
   */
  void download ();

  //! Ask the native side to stop at its next callback
  /*! Safe to call from any thread, including signal handlers.
   */
  void cancel ();

  bool is_cancel_requested () const;

  connection connect_page (const page_signal_type::slot_type& slot);
  connection connect_progress (const progress_signal_type::slot_type& slot);

  //! Number of download() calls issued so far
  unsigned download_count () const;

private:
  class sink;

  page_signal_type     signal_page_;
  progress_signal_type signal_progress_;

  volatile sig_atomic_t cancel_requested_;
  unsigned downloads_;
};

//! The outcome of a native configuration dialog
/*! Lets a dialog run in one process and its choices be applied in
 *  another.
 */
struct configuration
{
  std::string  item_name;
  property_map device_props;
  property_map item_props;
};

}       // namespace native
}       // namespace tsunagi

#endif  /* tsunagi_device_manager_hpp_ */
