//  scan-driver.cpp -- scan protocol on top of a native driver library
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

#include <boost/algorithm/string/predicate.hpp>
#include <boost/foreach.hpp>
#include <boost/throw_exception.hpp>

#include "tsunagi/exception.hpp"
#include "tsunagi/format.hpp"
#include "tsunagi/i18n.hpp"
#include "tsunagi/log.hpp"
#include "tsunagi/scan-driver.hpp"

namespace tsunagi {

namespace prop = native::property;

namespace {

//! Some drivers report this instead of a device name
const char *placeholder_name = "No friendly name";

struct scan_area
{
  int32_t width;
  int32_t height;
};

//! The largest area in thousandths of an inch the source can scan
boost::optional< scan_area >
get_scan_area (const native::device& dev, const native::item& it,
               bool flatbed)
{
  boost::optional< native::property_value > h;
  boost::optional< native::property_value > v;

  if (native::legacy == dev.version ())
    {
      h = dev.property (flatbed
                        ? prop::horizontal_bed_size
                        : prop::horizontal_sheet_feed_size);
      v = dev.property (flatbed
                        ? prop::vertical_bed_size
                        : prop::vertical_sheet_feed_size);
    }
  else
    {
      h = it.property (prop::max_horizontal_size);
      v = it.property (prop::max_vertical_size);
    }

  if (!h || !v) return boost::none;

  scan_area rv;
  rv.width  = h->value;
  rv.height = v->value;
  return rv;
}

per_source_caps
get_item_caps (const native::device& dev, const native::item& it,
               bool flatbed)
{
  per_source_caps rv;

  boost::optional< native::property_value > x_res
    (it.property (prop::x_resolution));
  if (x_res)
    {
      const native::attributes& attr (x_res->attributes);

      if (attr.is_range ())
        rv.dpi_caps = dpi_caps::for_range (attr.min, attr.max, attr.step);
      else if (attr.is_list ())
        rv.dpi_caps = dpi_caps::for_values (attr.values);
    }

  boost::optional< native::property_value > type
    (it.property (prop::data_type));
  if (type && type->attributes.is_list ())
    {
      const std::vector< int32_t >& v (type->attributes.values);
      bit_depth_caps caps;

      caps.supports_color
        = v.end () != std::find (v.begin (), v.end (), prop::data::color);
      caps.supports_grayscale
        = v.end () != std::find (v.begin (), v.end (), prop::data::grayscale);
      caps.supports_black_and_white
        = v.end () != std::find (v.begin (), v.end (),
                                 prop::data::black_and_white);
      rv.bit_depth_caps = caps;
    }

  boost::optional< scan_area > area (get_scan_area (dev, it, flatbed));
  if (area)
    {
      page_size_caps caps;
      caps.width  = area->width;
      caps.height = area->height;
      rv.page_size_caps = caps;
    }

  return rv;
}

std::string
text_of (const native::device& dev, prop::id id)
{
  boost::optional< native::property_value > p (dev.property (id));
  return (p ? p->text : std::string ());
}

}       // namespace

//! Bookkeeping for a single native transfer
/*! Connects to the transfer's notifications for the duration of the
 *  download loop.  Failures inside the notification handlers are kept
 *  until the native call returns so that they never unwind through the
 *  driver library.
 */
class native_scan_driver::session
{
public:
  session (const native::transfer::ptr& t, const image_loader& loader,
           scan_events& events, const page_callback& on_page,
           const cancel_token& token, unsigned& delivered)
    : transfer_(*t)
    , loader_(loader)
    , events_(events)
    , on_page_(on_page)
    , delivered_(delivered)
    , pages_(0)
  {
    page_ = t->connect_page (bind (&session::on_page, this,
                                   placeholders::_1, placeholders::_2));
    progress_ = t->connect_progress (bind (&session::on_progress, this,
                                           placeholders::_1));

    // cancellation may race the end of the transfer on another thread
    cancel_token::cancel_signal_type::slot_type
      cancel (&native::transfer::cancel, t.get ());
#if __cplusplus >= 201103L
    cancel_ = token.connect (cancel.track_foreign (t));
#else
    cancel_ = token.connect (cancel.track (t));
#endif
  }

  unsigned pages () const
  {
    return pages_;
  }

  void rethrow_if_failed () const
  {
    if (error_) rethrow_exception (error_);
  }

  bool has_failed () const
  {
    return bool (error_);
  }

private:
  void on_page (const octet *data, streamsize size)
  {
    if (error_) return;

    if (0 == size)
      {
        log::error ("ignoring empty page payload");
        return;
      }

    try
      {
        image::ptr img (decode (data, size));

        img->index (pages_);
        ++pages_;
        ++delivered_;
        on_page_(img);
        events_.page_start ();
      }
    catch (...)
      {
        error_ = current_exception ();
        transfer_.cancel ();
      }
  }

  void on_progress (int percent)
  {
    events_.page_progress (percent / 100.0);
  }

  image::ptr decode (const octet *data, streamsize size) const
  {
    try
      {
        return loader_.load (data, size);
      }
    catch (const std::exception& e)
      {
        // most likely a payload cut short by a communication failure
        log::error ("cannot load page: %1%") % e.what ();
        BOOST_THROW_EXCEPTION
          (system_error (system_error::device_communication_error,
                         std::string ()));
      }
  }

  native::transfer&   transfer_;
  const image_loader& loader_;
  scan_events&        events_;
  page_callback       on_page_;
  unsigned&           delivered_;
  unsigned            pages_;

  exception_ptr error_;

  scoped_connection page_;
  scoped_connection progress_;
  scoped_connection cancel_;
};

native_scan_driver::native_scan_driver (const native::library::ptr& lib,
                                        const image_loader::ptr& loader,
                                        const std::string& driver)
  : lib_(lib)
  , loader_(loader)
  , driver_(driver)
  , no_more_pages_(lib->no_more_pages ())
  , state_(idle)
{}

void
native_scan_driver::native_ui (const native_ui_delegate::ptr& delegate)
{
  delegate_ = delegate;
}

void
native_scan_driver::no_more_pages (const std::set< native::status >& statuses)
{
  no_more_pages_ = statuses;
}

native_scan_driver::state
native_scan_driver::current_state () const
{
  lock_guard< mutex > lock (mutex_);
  return state_;
}

std::vector< std::string >
native_scan_driver::property_failures () const
{
  lock_guard< mutex > lock (mutex_);
  return failures_;
}

void
native_scan_driver::set_state (state s)
{
  lock_guard< mutex > lock (mutex_);

  log::trace ("%1%: %2% -> %3%")
    % driver_ % to_string (state_) % to_string (s);
  state_ = s;
}

void
native_scan_driver::record_failure (const std::string& what)
{
  log::error ("%1%") % what;

  lock_guard< mutex > lock (mutex_);
  failures_.push_back (what);
}

std::vector< device_descriptor >
native_scan_driver::get_devices (native::api_version v)
{
  std::vector< device_descriptor > rv;

  set_state (enumerating);
  try
    {
      native::device_manager::ptr mgr (native::device_manager::open (lib_, v));
      std::vector< native::device_info::ptr > infos (mgr->device_infos ());

      BOOST_FOREACH (native::device_info::ptr& info, infos)
        {
          std::string id   (info->id ());
          std::string name (info->name ());

          if (boost::algorithm::iequals (name, placeholder_name))
            name = _("Unknown Scanner");

          rv.push_back (device_descriptor (driver_, id, name));
          info->release ();
        }
    }
  catch (const native::error& e)
    {
      set_state (idle);
      translate (e);
    }
  set_state (idle);

  log::brief ("%1%: found %2% device(s)") % driver_ % rv.size ();

  return rv;
}

scan_caps
native_scan_driver::get_caps (const scan_options& options)
{
  scan_caps rv;

  try
    {
      try
        {
          rv = get_caps (options, options.api_version);
        }
      catch (const native::error& e)
        {
          if (!should_fall_back (e, options.api_version, options)) throw;

          log::debug ("falling back to the legacy API: %1%") % e.what ();
          rv = get_caps (options, native::legacy);
        }
    }
  catch (const native::error& e)
    {
      set_state (failed);
      translate (e);
    }
  catch (const std::exception&)
    {
      set_state (failed);
      throw;
    }
  set_state (idle);

  return rv;
}

scan_caps
native_scan_driver::get_caps (const scan_options& options,
                              native::api_version v)
{
  set_state (negotiating);

  native::device_manager::ptr mgr (native::device_manager::open (lib_, v));
  native::device::ptr dev (mgr->find_device (options.device.id ()));
  std::vector< native::item::ptr > items (dev->sub_items ());

  native::item::ptr flatbed_item;
  native::item::ptr feeder_item;

  if (native::legacy == dev->version ())
    {
      // a single item serves all paper sources
      if (!items.empty ())
        {
          flatbed_item = items.front ();
          feeder_item  = items.front ();
        }
    }
  else
    {
      BOOST_FOREACH (native::item::ptr& it, items)
        {
          std::string name (it->name ());

          if (!flatbed_item && "Flatbed" == name) flatbed_item = it;
          if (!feeder_item  && "Feeder"  == name) feeder_item  = it;
        }
    }

  scan_caps caps;

  caps.metadata_caps.manufacturer = text_of (*dev, prop::vendor_description);
  caps.metadata_caps.model        = text_of (*dev, prop::device_description);

  paper_source_caps& src (caps.paper_source_caps);
  src.supports_flatbed = dev->supports_flatbed ();
  src.supports_feeder  = dev->supports_feeder ();
  src.supports_duplex  = dev->supports_duplex ();
  src.can_check_if_feeder_has_paper = true;

  boost::optional< per_source_caps > feeder_caps;
  if (feeder_item)
    feeder_caps = get_item_caps (*dev, *feeder_item, false);

  if (src.supports_flatbed && flatbed_item)
    caps.flatbed_caps = get_item_caps (*dev, *flatbed_item, true);
  if (src.supports_feeder)
    caps.feeder_caps = feeder_caps;
  if (src.supports_duplex)
    caps.duplex_caps = feeder_caps;

  return caps;
}

void
native_scan_driver::scan (const scan_options& options, scan_events& events,
                          const page_callback& on_page,
                          const cancel_token& token)
{
  {
    lock_guard< mutex > lock (mutex_);
    failures_.clear ();
  }

  if (token.is_cancellation_requested ())
    {
      set_state (cancelled);
      return;
    }

  unsigned delivered = 0;
  bool transferred = false;

  try
    {
      try
        {
          transferred = scan (options, options.api_version, events,
                              on_page, token, delivered);
        }
      catch (const native::error& e)
        {
          if (delivered
              || !should_fall_back (e, options.api_version, options))
            throw;

          log::debug ("falling back to the legacy API: %1%") % e.what ();
          transferred = scan (options, native::legacy, events,
                              on_page, token, delivered);
        }
    }
  catch (const native::error& e)
    {
      set_state (failed);
      translate (e);
    }
  catch (const std::exception&)
    {
      set_state (failed);
      throw;
    }

  set_state (!transferred || token.is_cancellation_requested ()
             ? cancelled
             : completed);

  log::brief ("%1%: scan delivered %2% page(s)") % driver_ % delivered;
}

bool
native_scan_driver::scan (scan_options options, native::api_version v,
                          scan_events& events, const page_callback& on_page,
                          const cancel_token& token, unsigned& delivered)
{
  set_state (configuring);

  native::device_manager::ptr mgr (native::device_manager::open (lib_, v));
  native::device::ptr dev (mgr->find_device (options.device.id ()));

  if (auto_source == options.paper_source)
    {
      // use the flatbed if supported or if both support checks fail
      options.paper_source = (dev->supports_flatbed ()
                              || !dev->supports_feeder ()
                              ? flatbed
                              : feeder);
      log::brief ("using %1% as the paper source")
        % to_string (options.paper_source);
    }

  native::item::ptr it (find_item (*dev, options));
  if (!it) return false;

  if (flatbed != options.paper_source && !dev->supports_feeder ())
    BOOST_THROW_EXCEPTION
      (system_error (system_error::no_feeder_support, std::string ()));

  if (duplex == options.paper_source && !dev->supports_duplex ())
    BOOST_THROW_EXCEPTION
      (system_error (system_error::no_duplex_support, std::string ()));

  if (!options.use_native_ui)
    configure (*dev, *it, options);

  transfer (*dev, *it, options, events, on_page, token, delivered);

  return true;
}

native::item::ptr
native_scan_driver::find_item (native::device& dev,
                               const scan_options& options)
{
  if (options.use_native_ui)
    {
      if (delegate_ && native::legacy == dev.version ())
        {
          boost::optional< native::configuration > config
            (delegate_->configure (driver_, options.device.id (),
                                   options.dialog_parent));
          if (!config) return native::item::ptr ();

          native::item::ptr it (dev.find_sub_item (config->item_name));
          if (!it)
            {
              log::error ("cannot find item '%1%'") % config->item_name;
              return it;
            }
          dev.deserialize_editable (dev.delta (config->device_props));
          it->deserialize_editable (it->delta (config->item_props));
          return it;
        }
      return dev.prompt_to_configure (options.dialog_parent);
    }

  std::vector< native::item::ptr > items (dev.sub_items ());

  if (items.empty ())
    BOOST_THROW_EXCEPTION
      (system_error (system_error::device_error,
                     _("The device has no scannable items.")));

  // legacy devices have a single "Scan" item
  if (native::legacy == dev.version ()) return items.front ();

  std::string preferred (flatbed == options.paper_source
                         ? "Flatbed" : "Feeder");

  BOOST_FOREACH (native::item::ptr& it, items)
    {
      if (preferred == it->name ()) return it;
    }
  return items.front ();
}

namespace {

//! Best effort property configuration
/*! Failures are reported to a sink and otherwise ignored.
 */
class configurator
{
public:
  configurator (const function< void (const std::string&) >& report)
    : report_(report)
  {}

  void set (native::item_base& obj, prop::id id, int32_t value)
  {
    try
      {
        obj.set_property (id, value);
      }
    catch (const native::error& e)
      {
        failure (id, e);
      }
  }

  void set_closest (native::item_base& obj, prop::id id, int32_t& value)
  {
    try
      {
        obj.set_property_closest (id, value);
      }
    catch (const native::error& e)
      {
        failure (id, e);
      }
  }

  void set_range (native::item_base& obj, prop::id id, int32_t value,
                  int32_t expected_min, int32_t expected_max)
  {
    try
      {
        obj.set_property_range (id, value, expected_min, expected_max);
      }
    catch (const native::error& e)
      {
        failure (id, e);
      }
  }

private:
  void failure (prop::id id, const native::error& e)
  {
    report_((format ("cannot set property %1%: %2%") % id % e.what ()).str ());
  }

  function< void (const std::string&) > report_;
};

}       // namespace

void
native_scan_driver::configure (native::device& dev, native::item& it,
                               const scan_options& options)
{
  configurator c (bind (&native_scan_driver::record_failure, this,
                        placeholders::_1));
  bool legacy = (native::legacy == dev.version ());

  if (flatbed != options.paper_source)
    {
      if (legacy) c.set (dev, prop::pages, 1);
      else        c.set (it, prop::pages, 0);
    }

  if (legacy)
    {
      switch (options.paper_source)
        {
        case flatbed:
          c.set (dev, prop::document_handling_select, prop::select::flatbed);
          break;
        case feeder:
          c.set (dev, prop::document_handling_select, prop::select::feeder);
          break;
        case duplex:
          c.set (dev, prop::document_handling_select,
                 prop::select::feeder | prop::select::duplex);
          break;
        case auto_source:
          break;
        }
    }
  else
    {
      switch (options.paper_source)
        {
        case feeder:
          c.set (it, prop::document_handling_select,
                 prop::select::front_only);
          break;
        case duplex:
          c.set (it, prop::document_handling_select, prop::select::duplex);
          break;
        case flatbed:
        case auto_source:
          break;
        }
    }

  switch (options.bit_depth)
    {
    case grayscale:
      c.set (it, prop::data_type, prop::data::grayscale);
      break;
    case color:
      c.set (it, prop::data_type, prop::data::color);
      break;
    case black_and_white:
      c.set (it, prop::data_type, prop::data::black_and_white);
      break;
    }

  int32_t x_res = options.dpi;
  int32_t y_res = options.dpi;
  c.set_closest (it, prop::x_resolution, x_res);
  c.set_closest (it, prop::y_resolution, y_res);
  if (x_res != options.dpi || y_res != options.dpi)
    {
      log::debug ("correcting resolution from %1%x%1% to %2%x%3%")
        % options.dpi % x_res % y_res;
    }

  boost::optional< scan_area > area
    (get_scan_area (dev, it, flatbed == options.paper_source));

  if (area)
    {
      int32_t page_width  = options.page_size.width  * x_res / 1000;
      int32_t page_height = options.page_size.height * y_res / 1000;
      int32_t max_width   = area->width  * x_res / 1000;
      int32_t max_height  = area->height * y_res / 1000;

      // the native x axis runs from right to left
      int32_t x_pos = 0;
      if (align_center == options.page_align)
        x_pos = (max_width - page_width) / 2;
      else if (align_left == options.page_align)
        x_pos = max_width - page_width;

      page_width  = std::min (page_width , max_width );
      page_height = std::min (page_height, max_height);

      c.set (it, prop::x_extent, (options.offset_width
                                  ? page_width + x_pos
                                  : page_width));
      c.set (it, prop::x_position, x_pos);
      c.set (it, prop::y_extent, page_height);
    }
  else
    {
      record_failure ("scan area unknown, leaving extents alone");
    }

  if (!options.brightness_contrast_after_scan)
    {
      c.set_range (it, prop::contrast  , options.contrast  , -1000, 1000);
      c.set_range (it, prop::brightness, options.brightness, -1000, 1000);
    }
}

void
native_scan_driver::transfer (native::device& dev, native::item& it,
                              const scan_options& options,
                              scan_events& events,
                              const page_callback& on_page,
                              const cancel_token& token,
                              unsigned& delivered)
{
  set_state (transferring);

  native::transfer::ptr xfer (it.start_transfer ());
  session s (xfer, *loader_, events, on_page, token, delivered);

  // legacy feeders deliver a page per download call
  bool repeat = (native::legacy == dev.version ()
                 && flatbed != options.paper_source);

  events.page_start ();
  do
    {
      try
        {
          xfer->download ();
        }
      catch (const native::error& e)
        {
          if (s.has_failed ()) break;
          if (!no_more_pages_.count (e.code ())) throw;

          log::debug ("no more pages after %1% download(s)")
            % xfer->download_count ();
          break;
        }
    }
  while (repeat && !token.is_cancellation_requested ()
         && !s.has_failed ());

  s.rethrow_if_failed ();

  if (!s.pages () && !token.is_cancellation_requested ()
      && flatbed != options.paper_source)
    BOOST_THROW_EXCEPTION
      (system_error (system_error::feeder_empty, std::string ()));
}

boost::optional< native::configuration >
native_scan_driver::configure (const std::string& device_id,
                               native::window_handle parent)
{
  try
    {
      native::device_manager::ptr mgr
        (native::device_manager::open (lib_, native::legacy));
      native::device::ptr dev (mgr->find_device (device_id));
      native::item::ptr it (dev->prompt_to_configure (parent));

      if (!it) return boost::none;

      native::configuration config;
      config.item_name    = it->name ();
      config.device_props = dev->serialize_editable ();
      config.item_props   = it->serialize_editable ();
      return config;
    }
  catch (const native::error& e)
    {
      translate (e);
    }
  return boost::none;
}

bool
native_scan_driver::should_fall_back (const native::error& e,
                                      native::api_version v,
                                      const scan_options& options) const
{
  if (native::default_version != v || options.use_native_ui) return false;
  if (!lib_->is_invalid_argument (e.code ())) return false;

  native::access lock (lib_);
  return native::current == lock->default_version ();
}

void
native_scan_driver::translate (const native::error& e) const
{
  system_error::error_code ec = lib_->classify (e.code ());

  if (system_error::no_error == ec
      || system_error::unknown_error == ec)
    ec = system_error::device_error;

  log::error ("%1%: %2%") % driver_ % e.what ();

  BOOST_THROW_EXCEPTION
    (system_error (ec, (system_error::device_error == ec
                        ? std::string (e.what ())
                        : std::string ()),
                   e.code ()));
}

std::string
to_string (native_scan_driver::state s)
{
  switch (s)
    {
    case native_scan_driver::idle:         return "idle";
    case native_scan_driver::enumerating:  return "enumerating";
    case native_scan_driver::negotiating:  return "negotiating";
    case native_scan_driver::configuring:  return "configuring";
    case native_scan_driver::transferring: return "transferring";
    case native_scan_driver::completed:    return "completed";
    case native_scan_driver::cancelled:    return "cancelled";
    case native_scan_driver::failed:       return "failed";
    }
  return "unknown";
}

}       // namespace tsunagi
