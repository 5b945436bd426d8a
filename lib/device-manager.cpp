//  device-manager.cpp -- wrappers for the native handle tree
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

#include <algorithm>
#include <cstdlib>
#include <limits>

#include <boost/foreach.hpp>
#include <boost/throw_exception.hpp>

#include "tsunagi/device-manager.hpp"
#include "tsunagi/format.hpp"
#include "tsunagi/log.hpp"

namespace tsunagi {
namespace native {

namespace {

void
collect (std::vector< native::handle >& v, native::handle h)
{
  v.push_back (h);
}

//! Snap \a value onto the nearest value allowed by \a attr
int32_t
closest (const attributes& attr, int32_t value)
{
  if (attr.is_range ())
    {
      int32_t v = std::min (std::max (value, attr.min), attr.max);
      if (0 < attr.step)
        {
          int32_t steps = (v - attr.min + attr.step / 2) / attr.step;
          v = std::min (attr.min + steps * attr.step, attr.max);
        }
      return v;
    }

  if (attr.is_list () && !attr.values.empty ())
    {
      int32_t best = attr.values.front ();
      BOOST_FOREACH (int32_t candidate, attr.values)
        {
          if (std::abs (candidate - value) < std::abs (best - value))
            best = candidate;
        }
      return best;
    }

  return value;
}

}       // namespace

item_base::item_base (const access& token, native::handle h)
  : object (token, h)
{}

std::vector< property_value >
item_base::properties () const
{
  std::vector< property_value > rv;
  access lock (lib_ptr ());

  check (lib ().get_properties (handle (), rv), "get properties");
  return rv;
}

boost::optional< property_value >
item_base::property (property::id id) const
{
  std::vector< property_value > props (properties ());

  BOOST_FOREACH (const property_value& p, props)
    {
      if (id == p.id) return p;
    }
  return boost::none;
}

int32_t
item_base::value (property::id id) const
{
  boost::optional< property_value > p (property (id));

  if (!p)
    BOOST_THROW_EXCEPTION
      (error (~0, (format ("no property %1%") % id).str ()));

  return p->value;
}

void
item_base::set_property (property::id id, int32_t value)
{
  access lock (lib_ptr ());

  log::debug (log::NATIVE, "setting property %1% to %2%") % id % value;
  check (lib ().set_property (handle (), id, value),
         (format ("set property %1%") % id).str ());
}

void
item_base::set_property_closest (property::id id, int32_t& value)
{
  boost::optional< property_value > p (property (id));

  if (p) value = closest (p->attributes, value);
  set_property (id, value);
}

void
item_base::set_property_range (property::id id, int32_t value,
                               int32_t expected_min, int32_t expected_max)
{
  boost::optional< property_value > p (property (id));

  if (p && p->attributes.is_range ()
      && expected_max != expected_min)
    {
      const attributes& attr (p->attributes);
      double ratio = double (value - expected_min)
        / (expected_max - expected_min);
      value = closest (attr, attr.min
                       + int32_t (ratio * (attr.max - attr.min) + 0.5));
    }
  set_property (id, value);
}

property_map
item_base::serialize_editable () const
{
  property_map rv;
  std::vector< property_value > props (properties ());

  BOOST_FOREACH (const property_value& p, props)
    {
      if (p.attributes.editable) rv[p.id] = p.value;
    }
  return rv;
}

void
item_base::deserialize_editable (const property_map& values)
{
  property_map::const_iterator it;
  for (it = values.begin (); values.end () != it; ++it)
    {
      try
        {
          set_property (it->first, it->second);
        }
      catch (const error& e)
        {
          log::error (log::NATIVE, "cannot restore property %1%: %2%")
            % it->first % e.what ();
        }
    }
}

property_map
item_base::delta (const property_map& values) const
{
  property_map rv;
  property_map current (serialize_editable ());

  property_map::const_iterator it;
  for (it = values.begin (); values.end () != it; ++it)
    {
      property_map::const_iterator cur = current.find (it->first);
      if (current.end () == cur || cur->second != it->second)
        rv.insert (*it);
    }
  return rv;
}

item::item (const access& token, native::handle h)
  : item_base (token, h)
{}

std::string
item::name () const
{
  access lock (lib_ptr ());
  return lib ().item_name (handle ());
}

transfer::ptr
item::start_transfer ()
{
  access lock (lib_ptr ());
  return make_shared< transfer > (lock, lib ().start_transfer (handle ()));
}

device::device (const access& token, native::handle h, api_version v)
  : item_base (token, h)
  , version_(v)
{}

api_version
device::version () const
{
  return version_;
}

std::string
device::id () const
{
  access lock (lib_ptr ());
  return lib ().device_id (handle ());
}

int32_t
device::handling_capabilities () const
{
  boost::optional< property_value > p
    (property (property::document_handling_capabilities));

  return (p ? p->value : 0);
}

bool
device::supports_flatbed () const
{
  return handling_capabilities () & property::capability::flatbed;
}

bool
device::supports_feeder () const
{
  return handling_capabilities () & property::capability::feeder;
}

bool
device::supports_duplex () const
{
  return handling_capabilities () & property::capability::duplex;
}

std::vector< item::ptr >
device::sub_items () const
{
  std::vector< item::ptr > rv;
  std::vector< native::handle > handles;
  access lock (lib_ptr ());

  status s = lib ().enumerate_items
    (handle (), bind (collect, ref (handles), placeholders::_1));

  // Wrap everything we got before reporting failure so that nothing
  // leaks.
  BOOST_FOREACH (native::handle h, handles)
    {
      rv.push_back (make_shared< item > (lock, h));
    }
  check (s, "enumerate items");

  return rv;
}

item::ptr
device::find_sub_item (const std::string& name) const
{
  std::vector< item::ptr > items (sub_items ());

  BOOST_FOREACH (item::ptr& it, items)
    {
      if (name == it->name ()) return it;
    }
  return item::ptr ();
}

item::ptr
device::prompt_to_configure (window_handle parent)
{
  access lock (lib_ptr ());
  native::handle h = nullptr;

  status s = lib ().prompt_to_configure (handle (), parent, h);
  if (dialog_dismissed == s) return item::ptr ();
  check (s, "prompt to configure");

  return make_shared< item > (lock, h);
}

device_info::device_info (const access& token, native::handle h)
  : object (token, h)
{}

std::string
device_info::id () const
{
  access lock (lib_ptr ());
  return lib ().info_id (handle ());
}

std::string
device_info::name () const
{
  access lock (lib_ptr ());
  return lib ().info_name (handle ());
}

device_manager::ptr
device_manager::open (const library::ptr& lib, api_version v)
{
  access lock (lib);

  if (default_version == v)
    v = lib->default_version ();

  return ptr (new device_manager (lock, v));
}

device_manager::device_manager (const access& token, api_version v)
  : object (token, token->open_manager (v))
  , version_(v)
{
  log::brief (log::NATIVE, "%1%: opened %2% device manager")
    % token->name () % to_string (v);
}

api_version
device_manager::version () const
{
  return version_;
}

std::vector< device_info::ptr >
device_manager::device_infos () const
{
  std::vector< device_info::ptr > rv;
  std::vector< native::handle > handles;
  access lock (lib_ptr ());

  status s = lib ().enumerate_devices
    (handle (), bind (collect, ref (handles), placeholders::_1));

  BOOST_FOREACH (native::handle h, handles)
    {
      rv.push_back (make_shared< device_info > (lock, h));
    }
  check (s, "enumerate devices");

  return rv;
}

device::ptr
device_manager::find_device (const std::string& id) const
{
  access lock (lib_ptr ());

  return make_shared< device > (lock, lib ().open_device (handle (), id),
                                version_);
}

class transfer::sink
  : public transfer_sink
{
public:
  sink (transfer& t)
    : t_(t)
  {}

  bool page (const octet *data, streamsize size)
  {
    t_.signal_page_(data, size);
    return !t_.is_cancel_requested ();
  }

  bool progress (int percent)
  {
    t_.signal_progress_(percent);
    return !t_.is_cancel_requested ();
  }

private:
  transfer& t_;
};

transfer::transfer (const access& token, native::handle h)
  : object (token, h)
  , cancel_requested_(false)
  , downloads_(0)
{}

void
transfer::download ()
{
  access lock (lib_ptr ());
  sink s (*this);

  ++downloads_;
  log::trace (log::NATIVE, "download #%1%") % downloads_;
  check (lib ().download (handle (), s), "download");
}

void
transfer::cancel ()
{
  cancel_requested_ = true;
}

bool
transfer::is_cancel_requested () const
{
  return cancel_requested_;
}

connection
transfer::connect_page (const page_signal_type::slot_type& slot)
{
  return signal_page_.connect (slot);
}

connection
transfer::connect_progress (const progress_signal_type::slot_type& slot)
{
  return signal_progress_.connect (slot);
}

unsigned
transfer::download_count () const
{
  return downloads_;
}

}       // namespace native
}       // namespace tsunagi
