//  library.cpp -- native driver library on top of SANE
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

extern "C" {
#include <sane/saneopts.h>
}

#include <algorithm>
#include <cmath>
#include <cstring>

#include <boost/foreach.hpp>

#include "tsunagi/format.hpp"
#include "tsunagi/log.hpp"
#include "tsunagi/memory.hpp"

#include "library.hpp"

namespace tsunagi {
namespace _drv_ {
namespace sane {

namespace prop = native::property;

namespace {

//! Keeps SANE statuses clear of native::ok and native::dialog_dismissed
const native::status status_base = 0x53410000;

const char * const flatbed_item = "Flatbed";
const char * const feeder_item  = "Feeder";
const char * const legacy_item  = "Scan";

const double mm_per_inch = 25.4;

enum source_kind { no_source, flatbed_source, feeder_source, duplex_source };

source_kind
classify_source (const std::string& name)
{
  std::string s (name);
  std::transform (s.begin (), s.end (), s.begin (), ::tolower);

  if (std::string::npos != s.find ("duplex"))  return duplex_source;
  if (std::string::npos != s.find ("adf")
      || std::string::npos != s.find ("feeder")
      || std::string::npos != s.find ("document")) return feeder_source;
  if (std::string::npos != s.find ("flatbed")) return flatbed_source;

  return no_source;
}

int32_t
to_int (const SANE_Option_Descriptor *desc, SANE_Word w)
{
  if (SANE_TYPE_FIXED == desc->type)
    return int32_t (std::floor (SANE_UNFIX (w) + 0.5));
  return w;
}

SANE_Word
from_int (const SANE_Option_Descriptor *desc, int32_t v)
{
  if (SANE_TYPE_FIXED == desc->type)
    return SANE_FIX (double (v));
  return v;
}

//! Length in millimetres to thousandths of an inch
int32_t
to_mils (double mm)
{
  return int32_t (mm * 1000 / mm_per_inch + 0.5);
}

}       // namespace

//! Option bookkeeping for an open SANE device
/*! Shared by the device node and all nodes derived from it.  The
 *  SANE handle is closed when the last of them goes away.
 */
struct library::device_state
{
  typedef shared_ptr< device_state > ptr;

  device_state (SANE_Handle h, const std::string& id)
    : handle (h), id (id), pages (1), legacy_source (no_source)
  {}

  ~device_state ()
  {
    sane_close (handle);
  }

  //! Option index for a well-known \a name, zero if absent or inactive
  SANE_Int find (const char *name, const SANE_Option_Descriptor **desc) const
  {
    const SANE_Option_Descriptor *d;
    for (SANE_Int i = 1; (d = sane_get_option_descriptor (handle, i)); ++i)
      {
        if (!d->name || 0 != std::strcmp (d->name, name)) continue;
        if (!SANE_OPTION_IS_ACTIVE (d->cap)) return 0;
        if (desc) *desc = d;
        return i;
      }
    return 0;
  }

  SANE_Status get_word (const char *name, int32_t& value) const
  {
    const SANE_Option_Descriptor *d = nullptr;
    SANE_Int i = find (name, &d);
    if (!i) return SANE_STATUS_UNSUPPORTED;

    SANE_Word w;
    SANE_Status s = sane_control_option (handle, i, SANE_ACTION_GET_VALUE,
                                         &w, nullptr);
    if (SANE_STATUS_GOOD == s) value = to_int (d, w);
    return s;
  }

  SANE_Status set_word (const char *name, int32_t value)
  {
    const SANE_Option_Descriptor *d = nullptr;
    SANE_Int i = find (name, &d);
    if (!i) return SANE_STATUS_UNSUPPORTED;
    if (!SANE_OPTION_IS_SETTABLE (d->cap)) return SANE_STATUS_INVAL;

    SANE_Word w = from_int (d, value);
    return sane_control_option (handle, i, SANE_ACTION_SET_VALUE,
                                &w, nullptr);
  }

  SANE_Status set_fixed (const char *name, double value)
  {
    const SANE_Option_Descriptor *d = nullptr;
    SANE_Int i = find (name, &d);
    if (!i) return SANE_STATUS_UNSUPPORTED;

    SANE_Word w = (SANE_TYPE_FIXED == d->type
                   ? SANE_FIX (value)
                   : SANE_Word (value + 0.5));
    return sane_control_option (handle, i, SANE_ACTION_SET_VALUE,
                                &w, nullptr);
  }

  SANE_Status get_string (const char *name, std::string& value) const
  {
    const SANE_Option_Descriptor *d = nullptr;
    SANE_Int i = find (name, &d);
    if (!i || SANE_TYPE_STRING != d->type) return SANE_STATUS_UNSUPPORTED;

    std::vector< char > buf (d->size + 1, '\0');
    SANE_Status s = sane_control_option (handle, i, SANE_ACTION_GET_VALUE,
                                         &buf[0], nullptr);
    if (SANE_STATUS_GOOD == s) value = &buf[0];
    return s;
  }

  SANE_Status set_string (const char *name, const std::string& value)
  {
    const SANE_Option_Descriptor *d = nullptr;
    SANE_Int i = find (name, &d);
    if (!i || SANE_TYPE_STRING != d->type) return SANE_STATUS_UNSUPPORTED;

    std::vector< char > buf (std::max< size_t > (d->size, value.size () + 1),
                             '\0');
    std::copy (value.begin (), value.end (), buf.begin ());
    return sane_control_option (handle, i, SANE_ACTION_SET_VALUE,
                                &buf[0], nullptr);
  }

  //! Values of a string list constraint
  std::vector< std::string > strings (const char *name) const
  {
    std::vector< std::string > rv;
    const SANE_Option_Descriptor *d = nullptr;

    if (!find (name, &d)
        || SANE_CONSTRAINT_STRING_LIST != d->constraint_type)
      return rv;

    for (const SANE_String_Const *s = d->constraint.string_list; *s; ++s)
      rv.push_back (*s);
    return rv;
  }

  //! Largest value an option can take, in its own unit
  bool max_of (const char *name, double& value) const
  {
    const SANE_Option_Descriptor *d = nullptr;
    if (!find (name, &d)) return false;

    if (SANE_CONSTRAINT_RANGE == d->constraint_type)
      {
        SANE_Word w = d->constraint.range->max;
        value = (SANE_TYPE_FIXED == d->type ? SANE_UNFIX (w) : w);
        return true;
      }
    if (SANE_CONSTRAINT_WORD_LIST == d->constraint_type
        && 0 < d->constraint.word_list[0])
      {
        SANE_Word n = d->constraint.word_list[0];
        SANE_Word w = *std::max_element (d->constraint.word_list + 1,
                                         d->constraint.word_list + 1 + n);
        value = (SANE_TYPE_FIXED == d->type ? SANE_UNFIX (w) : w);
        return true;
      }
    return false;
  }

  //! Source option value for a \a kind of paper source
  std::string source_name (source_kind kind) const
  {
    BOOST_FOREACH (const std::string& s, strings (SANE_NAME_SCAN_SOURCE))
      {
        if (kind == classify_source (s)) return s;
      }
    return std::string ();
  }

  bool has_source (source_kind kind) const
  {
    std::vector< std::string > sources (strings (SANE_NAME_SCAN_SOURCE));

    if (sources.empty ()) return flatbed_source == kind;
    return !source_name (kind).empty ();
  }

  SANE_Handle handle;
  std::string id;
  std::string vendor;
  std::string model;

  //! \name Legacy device level settings
  //! @{
  int32_t     pages;
  source_kind legacy_source;
  //! @}
};

struct library::node
{
  enum kind_type { manager, info, device, item, transfer };

  node (kind_type k, native::api_version v)
    : kind (k), version (v), source (no_source)
    , x_extent (0), y_extent (0), x_position (0), y_position (0)
    , pages (0), duplex (false), started (false), done (false)
  {}

  kind_type kind;
  native::api_version version;

  std::string id;               //!< info and device nodes
  std::string name;

  device_state::ptr state;      //!< device, item and transfer nodes

  //! \name Item settings, applied when a transfer starts
  //! @{
  source_kind source;
  int32_t x_extent;             //!< pixels
  int32_t y_extent;
  int32_t x_position;           //!< pixels, from the right edge
  int32_t y_position;
  int32_t pages;
  bool    duplex;
  //! @}

  //! \name Transfer state
  //! @{
  bool started;
  bool done;
  //! @}
};

library::library ()
  : last_error_(native::ok)
{
  SANE_Int version = 0;
  SANE_Status s = sane_init (&version, nullptr);

  if (SANE_STATUS_GOOD != s)
    BOOST_THROW_EXCEPTION
      (std::runtime_error ((format ("sane_init: %1%")
                            % sane_strstatus (s)).str ()));

  log::brief ("SANE %1%.%2%.%3% initialised")
    % SANE_VERSION_MAJOR (version)
    % SANE_VERSION_MINOR (version)
    % SANE_VERSION_BUILD (version);
}

library::~library ()
{
  BOOST_FOREACH (node *n, nodes_)
    {
      delete n;
    }
  sane_exit ();
}

std::string
library::name () const
{
  return "sane";
}

native::api_version
library::default_version () const
{
  return native::current;
}

native::status
library::last_error () const
{
  return last_error_;
}

native::status
library::to_status (SANE_Status s)
{
  if (SANE_STATUS_GOOD == s) return native::ok;
  return status_base + s;
}

library::node *
library::as_node (native::handle h) const
{
  node *n = static_cast< node * > (h);
  return (nodes_.count (n) ? n : nullptr);
}

native::handle
library::fail_(SANE_Status s)
{
  last_error_ = to_status (s);
  return nullptr;
}

library::node *
library::make_ (int kind, native::api_version v)
{
  node *n = new node (node::kind_type (kind), v);
  nodes_.insert (n);
  return n;
}

native::handle
library::open_manager (native::api_version v)
{
  if (native::default_version == v) v = default_version ();
  return make_ (node::manager, v);
}

native::status
library::enumerate_devices (native::handle manager,
                            const function< void (native::handle) >& cb)
{
  node *m = as_node (manager);
  if (!m || node::manager != m->kind) return to_status (SANE_STATUS_INVAL);

  const SANE_Device **list = nullptr;
  SANE_Status s = sane_get_devices (&list, SANE_FALSE);
  if (SANE_STATUS_GOOD != s) return to_status (s);

  for (const SANE_Device **dev = list; dev && *dev; ++dev)
    {
      node *n = make_ (node::info, m->version);
      n->id   = (*dev)->name;
      n->name = (format ("%1% %2%") % (*dev)->vendor % (*dev)->model).str ();
      cb (n);
    }
  return native::ok;
}

std::string
library::info_id (native::handle info)
{
  node *n = as_node (info);
  return (n ? n->id : std::string ());
}

std::string
library::info_name (native::handle info)
{
  node *n = as_node (info);
  return (n ? n->name : std::string ());
}

native::handle
library::open_device (native::handle manager, const std::string& id)
{
  node *m = as_node (manager);
  if (!m || node::manager != m->kind) return fail_(SANE_STATUS_INVAL);

  SANE_Handle h;
  SANE_Status s = sane_open (id.c_str (), &h);
  if (SANE_STATUS_GOOD != s)
    {
      log::error ("%1%: %2%") % id % sane_strstatus (s);
      return fail_(s);
    }

  node *n  = make_ (node::device, m->version);
  n->id    = id;
  n->state = make_shared< device_state > (h, id);

  const SANE_Device **list = nullptr;
  if (SANE_STATUS_GOOD == sane_get_devices (&list, SANE_TRUE))
    {
      for (const SANE_Device **dev = list; dev && *dev; ++dev)
        {
          if (id != (*dev)->name) continue;
          n->state->vendor = (*dev)->vendor;
          n->state->model  = (*dev)->model;
        }
    }

  if (n->state->has_source (flatbed_source))
    n->state->legacy_source = flatbed_source;
  else if (n->state->has_source (feeder_source))
    n->state->legacy_source = feeder_source;

  return n;
}

std::string
library::device_id (native::handle device)
{
  node *n = as_node (device);
  return (n ? n->id : std::string ());
}

native::status
library::enumerate_items (native::handle device,
                          const function< void (native::handle) >& cb)
{
  node *d = as_node (device);
  if (!d || node::device != d->kind) return to_status (SANE_STATUS_INVAL);

  std::vector< std::pair< std::string, source_kind > > items;

  if (native::legacy == d->version)
    {
      items.push_back (std::make_pair (std::string (legacy_item),
                                       no_source));
    }
  else
    {
      if (d->state->has_source (flatbed_source))
        items.push_back (std::make_pair (std::string (flatbed_item),
                                         flatbed_source));
      if (d->state->has_source (feeder_source)
          || d->state->has_source (duplex_source))
        items.push_back (std::make_pair (std::string (feeder_item),
                                         feeder_source));
    }

  for (size_t i = 0; i < items.size (); ++i)
    {
      node *n   = make_ (node::item, d->version);
      n->name   = items[i].first;
      n->source = items[i].second;
      n->state  = d->state;
      n->pages  = (feeder_source == n->source ? 0 : 1);

      double w, h;
      int32_t res = 0;
      if (SANE_STATUS_GOOD == n->state->get_word (SANE_NAME_SCAN_RESOLUTION,
                                                  res)
          && n->state->max_of (SANE_NAME_SCAN_BR_X, w)
          && n->state->max_of (SANE_NAME_SCAN_BR_Y, h))
        {
          n->x_extent = int32_t (w * res / mm_per_inch);
          n->y_extent = int32_t (h * res / mm_per_inch);
        }
      cb (n);
    }
  return native::ok;
}

std::string
library::item_name (native::handle item)
{
  node *n = as_node (item);
  return (n ? n->name : std::string ());
}

native::status
library::get_properties (native::handle object,
                         std::vector< native::property_value >& props)
{
  node *n = as_node (object);
  if (!n || !n->state) return to_status (SANE_STATUS_INVAL);

  props.clear ();

  if (node::item == n->kind)
    {
      item_props_(*n, props);
      return native::ok;
    }
  if (node::device != n->kind) return to_status (SANE_STATUS_INVAL);

  const device_state& dev (*n->state);
  native::property_value p;

  p.id = prop::vendor_description;
  p.text = dev.vendor;
  props.push_back (p);

  p.id = prop::device_description;
  p.text = dev.model;
  props.push_back (p);

  p = native::property_value ();
  p.id = prop::document_handling_capabilities;
  if (dev.has_source (flatbed_source)) p.value |= prop::capability::flatbed;
  if (dev.has_source (feeder_source)
      || dev.has_source (duplex_source)) p.value |= prop::capability::feeder;
  if (dev.has_source (duplex_source))  p.value |= prop::capability::duplex;
  props.push_back (p);

  double w, h;
  if (dev.max_of (SANE_NAME_SCAN_BR_X, w)
      && dev.max_of (SANE_NAME_SCAN_BR_Y, h))
    {
      p = native::property_value ();
      p.id = prop::horizontal_bed_size;
      p.value = to_mils (w);
      props.push_back (p);
      p.id = prop::vertical_bed_size;
      p.value = to_mils (h);
      props.push_back (p);
      p.id = prop::horizontal_sheet_feed_size;
      p.value = to_mils (w);
      props.push_back (p);
      p.id = prop::vertical_sheet_feed_size;
      p.value = to_mils (h);
      props.push_back (p);
    }

  if (native::legacy == n->version)
    {
      p = native::property_value ();
      p.id = prop::document_handling_select;
      p.attributes.editable = true;
      p.attributes.kind = native::attributes::list;
      if (dev.has_source (flatbed_source))
        p.attributes.values.push_back (prop::select::flatbed);
      if (dev.has_source (feeder_source))
        p.attributes.values.push_back (prop::select::feeder);
      if (dev.has_source (duplex_source))
        p.attributes.values.push_back (prop::select::feeder
                                       | prop::select::duplex);
      switch (dev.legacy_source)
        {
        case feeder_source: p.value = prop::select::feeder; break;
        case duplex_source:
          p.value = prop::select::feeder | prop::select::duplex;
          break;
        default: p.value = prop::select::flatbed;
        }
      props.push_back (p);

      p = native::property_value ();
      p.id = prop::pages;
      p.value = dev.pages;
      p.attributes.editable = true;
      props.push_back (p);
    }
  return native::ok;
}

void
library::item_props_(const node& item,
                     std::vector< native::property_value >& props) const
{
  const device_state& dev (*item.state);
  const SANE_Option_Descriptor *d = nullptr;
  native::property_value p;

  if (dev.find (SANE_NAME_SCAN_RESOLUTION, &d))
    {
      int32_t res = 0;
      dev.get_word (SANE_NAME_SCAN_RESOLUTION, res);

      p.value = res;
      p.attributes.editable = SANE_OPTION_IS_SETTABLE (d->cap);
      if (SANE_CONSTRAINT_RANGE == d->constraint_type)
        {
          p.attributes.kind = native::attributes::range;
          p.attributes.min  = to_int (d, d->constraint.range->min);
          p.attributes.max  = to_int (d, d->constraint.range->max);
          p.attributes.step = std::max (1, to_int (d, d->constraint
                                                   .range->quant));
        }
      else if (SANE_CONSTRAINT_WORD_LIST == d->constraint_type)
        {
          p.attributes.kind = native::attributes::list;
          for (SANE_Word i = 1; i <= d->constraint.word_list[0]; ++i)
            p.attributes.values.push_back
              (to_int (d, d->constraint.word_list[i]));
        }
      p.id = prop::x_resolution;
      props.push_back (p);
      p.id = prop::y_resolution;
      props.push_back (p);

      double w, h;
      if (dev.max_of (SANE_NAME_SCAN_BR_X, w)
          && dev.max_of (SANE_NAME_SCAN_BR_Y, h) && 0 < res)
        {
          int32_t max_x = int32_t (w * res / mm_per_inch);
          int32_t max_y = int32_t (h * res / mm_per_inch);

          native::property_value q;
          q.attributes.editable = true;
          q.attributes.kind = native::attributes::range;
          q.attributes.min  = 0;
          q.attributes.step = 1;

          q.attributes.max = max_x;
          q.id = prop::x_extent;   q.value = item.x_extent;
          props.push_back (q);
          q.id = prop::x_position; q.value = item.x_position;
          props.push_back (q);
          q.attributes.max = max_y;
          q.id = prop::y_extent;   q.value = item.y_extent;
          props.push_back (q);
          q.id = prop::y_position; q.value = item.y_position;
          props.push_back (q);

          q = native::property_value ();
          q.id = prop::max_horizontal_size; q.value = to_mils (w);
          props.push_back (q);
          q.id = prop::max_vertical_size;   q.value = to_mils (h);
          props.push_back (q);
        }
    }

  std::vector< std::string > modes (dev.strings (SANE_NAME_SCAN_MODE));
  if (!modes.empty ())
    {
      std::string current;
      dev.get_string (SANE_NAME_SCAN_MODE, current);

      p = native::property_value ();
      p.id = prop::data_type;
      p.attributes.editable = true;
      p.attributes.kind = native::attributes::list;
      BOOST_FOREACH (const std::string& m, modes)
        {
          int32_t v = -1;
          /**/ if (SANE_VALUE_SCAN_MODE_COLOR == m)
            v = prop::data::color;
          else if (SANE_VALUE_SCAN_MODE_GRAY == m)
            v = prop::data::grayscale;
          else if (SANE_VALUE_SCAN_MODE_LINEART == m)
            v = prop::data::black_and_white;
          if (0 > v) continue;

          p.attributes.values.push_back (v);
          if (m == current) p.value = v;
        }
      props.push_back (p);
    }

  const char * const levels[] = {
    SANE_NAME_BRIGHTNESS, SANE_NAME_CONTRAST,
  };
  const prop::id ids[] = { prop::brightness, prop::contrast };
  for (size_t i = 0; i < 2; ++i)
    {
      d = nullptr;
      if (!dev.find (levels[i], &d)
          || SANE_CONSTRAINT_RANGE != d->constraint_type)
        continue;

      p = native::property_value ();
      p.id = ids[i];
      dev.get_word (levels[i], p.value);
      p.attributes.editable = SANE_OPTION_IS_SETTABLE (d->cap);
      p.attributes.kind = native::attributes::range;
      p.attributes.min  = to_int (d, d->constraint.range->min);
      p.attributes.max  = to_int (d, d->constraint.range->max);
      p.attributes.step = std::max (1, to_int (d, d->constraint
                                               .range->quant));
      props.push_back (p);
    }

  if (native::legacy != item.version && feeder_source == item.source)
    {
      p = native::property_value ();
      p.id = prop::pages;
      p.value = item.pages;
      p.attributes.editable = true;
      props.push_back (p);

      p = native::property_value ();
      p.id = prop::document_handling_select;
      p.value = (item.duplex
                 ? prop::select::duplex
                 : prop::select::front_only);
      p.attributes.editable = true;
      p.attributes.kind = native::attributes::list;
      p.attributes.values.push_back (prop::select::front_only);
      if (dev.has_source (duplex_source))
        p.attributes.values.push_back (prop::select::duplex);
      props.push_back (p);
    }
}

native::status
library::set_property (native::handle object, native::property::id id,
                       int32_t value)
{
  node *n = as_node (object);
  if (!n || !n->state) return to_status (SANE_STATUS_INVAL);

  if (node::item == n->kind) return set_item_prop_(*n, id, value);
  if (node::device != n->kind || native::legacy != n->version)
    return to_status (SANE_STATUS_UNSUPPORTED);

  device_state& dev (*n->state);

  switch (id)
    {
    case prop::pages:
      dev.pages = value;
      return native::ok;
    case prop::document_handling_select:
      {
        source_kind kind = flatbed_source;
        if (value & prop::select::duplex)      kind = duplex_source;
        else if (value & prop::select::feeder) kind = feeder_source;

        if (!dev.has_source (kind)) return to_status (SANE_STATUS_INVAL);
        dev.legacy_source = kind;
        return native::ok;
      }
    default:
      break;
    }
  return to_status (SANE_STATUS_UNSUPPORTED);
}

native::status
library::set_item_prop_(node& item, native::property::id id, int32_t value)
{
  device_state& dev (*item.state);

  switch (id)
    {
    case prop::x_resolution:
    case prop::y_resolution:
      {
        SANE_Status s = dev.set_word (SANE_NAME_SCAN_RESOLUTION, value);
        if (SANE_STATUS_UNSUPPORTED == s) s = dev.set_word
          (prop::x_resolution == id
           ? SANE_NAME_SCAN_X_RESOLUTION : SANE_NAME_SCAN_Y_RESOLUTION, value);
        return to_status (s);
      }
    case prop::data_type:
      {
        std::string mode;
        switch (value)
          {
          case prop::data::color:
            mode = SANE_VALUE_SCAN_MODE_COLOR;
            break;
          case prop::data::grayscale:
            mode = SANE_VALUE_SCAN_MODE_GRAY;
            break;
          case prop::data::black_and_white:
            mode = SANE_VALUE_SCAN_MODE_LINEART;
            break;
          default:
            return to_status (SANE_STATUS_INVAL);
          }
        return to_status (dev.set_string (SANE_NAME_SCAN_MODE, mode));
      }
    case prop::brightness:
      return to_status (dev.set_word (SANE_NAME_BRIGHTNESS, value));
    case prop::contrast:
      return to_status (dev.set_word (SANE_NAME_CONTRAST, value));
    case prop::x_extent:
    case prop::y_extent:
    case prop::x_position:
    case prop::y_position:
      if (0 > value) return to_status (SANE_STATUS_INVAL);
      if (prop::x_extent   == id) item.x_extent   = value;
      if (prop::y_extent   == id) item.y_extent   = value;
      if (prop::x_position == id) item.x_position = value;
      if (prop::y_position == id) item.y_position = value;
      return native::ok;
    case prop::pages:
      if (feeder_source != item.source) break;
      item.pages = value;
      return native::ok;
    case prop::document_handling_select:
      if (feeder_source != item.source) break;
      if (prop::select::duplex == value && !dev.has_source (duplex_source))
        return to_status (SANE_STATUS_INVAL);
      item.duplex = (prop::select::duplex == value);
      return native::ok;
    default:
      break;
    }
  return to_status (SANE_STATUS_UNSUPPORTED);
}

native::status
library::prompt_to_configure (native::handle device, native::window_handle,
                              native::handle&)
{
  if (!as_node (device)) return to_status (SANE_STATUS_INVAL);

  log::error ("SANE devices have no native configuration dialog");
  return to_status (SANE_STATUS_UNSUPPORTED);
}

native::handle
library::start_transfer (native::handle item)
{
  node *i = as_node (item);
  if (!i || node::item != i->kind) return fail_(SANE_STATUS_INVAL);

  native::status s = apply_(*i);
  if (native::ok != s)
    {
      last_error_ = s;
      return nullptr;
    }

  node *n   = make_ (node::transfer, i->version);
  n->state  = i->state;
  n->name   = i->name;
  n->source = (native::legacy == i->version
               ? i->state->legacy_source
               : (i->duplex ? duplex_source : i->source));
  return n;
}

native::status
library::apply_(const node& item)
{
  device_state& dev (*item.state);

  source_kind kind = (native::legacy == item.version
                      ? dev.legacy_source
                      : (item.duplex ? duplex_source : item.source));
  std::string source (dev.source_name (kind));
  if (!source.empty ())
    {
      SANE_Status s = dev.set_string (SANE_NAME_SCAN_SOURCE, source);
      if (SANE_STATUS_GOOD != s) return to_status (s);
    }

  int32_t res = 0;
  double max_w, max_h;
  if (SANE_STATUS_GOOD != dev.get_word (SANE_NAME_SCAN_RESOLUTION, res)
      || 0 >= res
      || !dev.max_of (SANE_NAME_SCAN_BR_X, max_w)
      || !dev.max_of (SANE_NAME_SCAN_BR_Y, max_h))
    {
      log::debug ("%1%: no scan area geometry, scanning everything")
        % dev.id;
      return native::ok;
    }

  double px_to_mm = mm_per_inch / res;
  double right  = std::min (max_w, item.x_position * px_to_mm);
  double left   = std::min (max_w, (item.x_position + item.x_extent)
                                   * px_to_mm);
  double top    = std::min (max_h, item.y_position * px_to_mm);
  double bottom = std::min (max_h, (item.y_position + item.y_extent)
                                   * px_to_mm);

  // positions count from the right edge of the scan area
  const char * const names[] = {
    SANE_NAME_SCAN_TL_X, SANE_NAME_SCAN_TL_Y,
    SANE_NAME_SCAN_BR_X, SANE_NAME_SCAN_BR_Y,
  };
  const double values[] = {
    max_w - left, top, max_w - right, bottom,
  };
  for (size_t i = 0; i < 4; ++i)
    {
      SANE_Status s = dev.set_fixed (names[i], values[i]);
      if (SANE_STATUS_GOOD != s && SANE_STATUS_UNSUPPORTED != s)
        return to_status (s);
    }
  return native::ok;
}

native::status
library::download (native::handle transfer, native::transfer_sink& sink)
{
  node *t = as_node (transfer);
  if (!t || node::transfer != t->kind) return to_status (SANE_STATUS_INVAL);

  if (t->done) return to_status (SANE_STATUS_NO_DOCS);

  bool feeder = (feeder_source == t->source || duplex_source == t->source);
  bool all    = (feeder && native::legacy != t->version);
  unsigned pages = 0;

  do
    {
      SANE_Status s = sane_start (t->state->handle);
      t->started = true;

      if (SANE_STATUS_NO_DOCS == s && feeder)
        {
          sane_cancel (t->state->handle);
          t->done = true;
          return (pages ? native::ok : to_status (s));
        }
      if (SANE_STATUS_GOOD != s)
        {
          sane_cancel (t->state->handle);
          t->done = true;
          return to_status (s);
        }

      bool aborted = false;
      native::status rv = acquire_page_(*t, sink, aborted);
      if (native::ok != rv || aborted)
        {
          sane_cancel (t->state->handle);
          t->done = true;
          return rv;
        }
      ++pages;
    }
  while (all);

  if (!feeder)
    {
      sane_cancel (t->state->handle);
      t->done = true;
    }
  return native::ok;
}

native::status
library::acquire_page_(node& xfer, native::transfer_sink& sink,
                       bool& aborted)
{
  SANE_Handle h = xfer.state->handle;
  SANE_Parameters par;

  SANE_Status s = sane_get_parameters (h, &par);
  if (SANE_STATUS_GOOD != s) return to_status (s);

  if ((SANE_FRAME_GRAY != par.format && SANE_FRAME_RGB != par.format)
      || !par.last_frame)
    {
      log::error ("%1%: multi-pass frames are not supported")
        % xfer.state->id;
      return to_status (SANE_STATUS_UNSUPPORTED);
    }

  octet_buffer data;
  if (0 < par.lines)
    data.reserve (par.bytes_per_line * par.lines);

  std::vector< SANE_Byte > buf (32 * 1024);
  int last_percent = -1;

  for (;;)
    {
      SANE_Int n = 0;
      s = sane_read (h, &buf[0], buf.size (), &n);
      if (SANE_STATUS_EOF == s) break;
      if (SANE_STATUS_GOOD != s) return to_status (s);

      data.insert (data.end (), buf.begin (), buf.begin () + n);

      if (0 < par.lines)
        {
          int percent = int (100.0 * data.size ()
                             / (par.bytes_per_line * par.lines));
          percent = std::min (percent, 99);
          if (percent != last_percent)
            {
              last_percent = percent;
              if (!sink.progress (percent))
                {
                  aborted = true;
                  return native::ok;
                }
            }
        }
    }

  streamsize lines = (0 < par.bytes_per_line
                      ? data.size () / par.bytes_per_line : 0);
  int channels = (SANE_FRAME_RGB == par.format ? 3 : 1);

  const char *magic = (1 == par.depth ? "P4"
                       : (3 == channels ? "P6" : "P5"));
  std::string hdr ((format ("%1% %2% %3%\n") % magic
                    % par.pixels_per_line % lines).str ());
  if (1 != par.depth) hdr += "255\n";

  octet_buffer page (hdr.begin (), hdr.end ());

  if (16 == par.depth)
    {
      // keep the most significant byte of each native order sample
      streamsize samples = lines * par.pixels_per_line * channels;
      page.reserve (page.size () + samples);
      for (streamsize i = 0; i < samples; ++i)
        {
          uint16_t v;
          std::memcpy (&v, &data[2 * i], sizeof (v));
          page.push_back (octet (v >> 8));
        }
    }
  else if (1 == par.depth || 8 == par.depth)
    {
      page.insert (page.end (), data.begin (),
                   data.begin () + lines * par.bytes_per_line);
    }
  else
    {
      log::error ("%1%: unsupported bit depth %2%")
        % xfer.state->id % par.depth;
      return to_status (SANE_STATUS_UNSUPPORTED);
    }

  if (!sink.progress (100) || !sink.page (&page[0], page.size ()))
    aborted = true;

  return native::ok;
}

void
library::release (native::handle h)
{
  node *n = as_node (h);
  if (!n) return;

  if (node::transfer == n->kind && n->started && !n->done)
    sane_cancel (n->state->handle);

  nodes_.erase (n);
  delete n;
}

bool
library::is_invalid_argument (native::status s) const
{
  return to_status (SANE_STATUS_INVAL) == s;
}

std::set< native::status >
library::no_more_pages () const
{
  std::set< native::status > rv;
  rv.insert (to_status (SANE_STATUS_NO_DOCS));
  return rv;
}

system_error::error_code
library::classify (native::status s) const
{
  if (native::ok == s) return system_error::no_error;

  switch (SANE_Status (s - status_base))
    {
    case SANE_STATUS_JAMMED:        return system_error::media_jam;
    case SANE_STATUS_COVER_OPEN:    return system_error::cover_open;
    case SANE_STATUS_DEVICE_BUSY:   return system_error::device_busy;
    case SANE_STATUS_ACCESS_DENIED: return system_error::permission_denied;
    case SANE_STATUS_NO_DOCS:       return system_error::feeder_empty;
    case SANE_STATUS_IO_ERROR:
      return system_error::device_communication_error;
    default:
      break;
    }
  return system_error::device_error;
}

}       // namespace sane
}       // namespace _drv_
}       // namespace tsunagi

extern "C" {

void
libdrv_sane_LTX_library_factory (tsunagi::native::library::ptr& lib)
{
  lib = tsunagi::make_shared< tsunagi::_drv_::sane::library > ();
}

}       // extern "C"
