//  broker.cpp -- choose and pool worker processes per execution profile
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

#include <stdexcept>

#include <boost/foreach.hpp>
#include <boost/throw_exception.hpp>

#include "tsunagi/broker.hpp"
#include "tsunagi/format.hpp"
#include "tsunagi/i18n.hpp"
#include "tsunagi/log.hpp"
#include "tsunagi/native-library.hpp"
#include "tsunagi/run-time.hpp"

namespace tsunagi {

broker::broker (const std::string& driver,
                const std::vector< execution_profile >& candidates,
                double timeout)
  : driver_(driver)
  , candidates_(candidates)
  , timeout_(timeout)
{}

broker::~broker ()
{
  shutdown ();
}

std::vector< execution_profile >
broker::default_profiles ()
{
  run_time rt;
  std::vector< execution_profile > rv;

  int bits = execution_profile::host_bitness ();

  rv.push_back (execution_profile
                (bits, (format ("%1%-bit") % bits).str (),
                 rt.locate (PACKAGE_TARNAME "-worker")));
  if (32 != bits)
    {
      rv.push_back (execution_profile
                    (32, "32-bit", rt.locate (PACKAGE_TARNAME "-worker-32")));
    }
  return rv;
}

execution_profile
broker::select_profile (const std::string& operation)
{
  {
    lock_guard< mutex > lock (mutex_);
    std::map< std::string, execution_profile >::const_iterator
      it (selected_.find (operation));
    if (selected_.end () != it) return it->second;
  }

  BOOST_FOREACH (const execution_profile& candidate, candidates_)
    {
      worker::ptr w;
      try
        {
          w = spawn_(candidate);
        }
      catch (const std::exception& e)
        {
          log::brief (log::BROKER, "%1% profile unavailable: %2%")
            % candidate.name % e.what ();
          continue;
        }

      bool supported = false;
      try
        {
          supported = w->probe (operation);
        }
      catch (const system_error& e)
        {
          log::brief (log::BROKER, "%1% profile probe failed: %2%")
            % candidate.name % e.what ();
        }

      if (!supported)
        {
          w->close ();
          continue;
        }

      log::brief (log::BROKER, "using %1% profile for '%2%'")
        % candidate.name % operation;
      {
        lock_guard< mutex > lock (mutex_);
        selected_[operation] = candidate;
      }
      give_back_(w);
      return candidate;
    }

  BOOST_THROW_EXCEPTION
    (system_error (system_error::no_compatible_worker,
                   (format (_("No worker process can handle '%1%'"))
                    % operation).str ()));
}

scan_driver::ptr
broker::make_driver (const ptr& workers, const image_loader::ptr& loader)
{
  const std::string& kind (workers->driver ());

  if (native::library::probe ("libdrv-" + kind))
    {
      try
        {
          shared_ptr< native_scan_driver > drv
            (make_shared< native_scan_driver >
             (native::library::create (kind), loader, kind));
          drv->native_ui (make_shared< remote_ui_delegate > (workers));

          log::brief (log::BROKER, "running '%1%' driver in process")
            % kind;
          return drv;
        }
      catch (const std::runtime_error& e)
        {
          log::error ("%1%: %2%") % kind % e.what ();
        }
    }

  log::brief (log::BROKER, "relaying '%1%' driver to workers") % kind;
  return make_shared< remote_scan_driver > (workers);
}

const std::string&
broker::driver () const
{
  return driver_;
}

void
broker::shutdown ()
{
  std::multimap< std::string, worker::ptr > idle;
  {
    lock_guard< mutex > lock (mutex_);
    idle.swap (idle_);
  }

  std::multimap< std::string, worker::ptr >::iterator it;
  for (it = idle.begin (); idle.end () != it; ++it)
    {
      it->second->close ();
    }
}

std::size_t
broker::idle_count () const
{
  lock_guard< mutex > lock (mutex_);
  return idle_.size ();
}

worker::ptr
broker::acquire_(const execution_profile& profile)
{
  {
    lock_guard< mutex > lock (mutex_);
    std::multimap< std::string, worker::ptr >::iterator
      it (idle_.find (profile.name));

    if (idle_.end () != it)
      {
        worker::ptr rv (it->second);
        idle_.erase (it);
        return rv;
      }
  }
  return spawn_(profile);
}

void
broker::give_back_(const worker::ptr& w)
{
  lock_guard< mutex > lock (mutex_);
  idle_.insert (std::make_pair (w->profile ().name, w));
}

worker::ptr
broker::spawn_(const execution_profile& profile) const
{
  return make_shared< worker > (profile, driver_, timeout_);
}

broker::lease::lease (broker& b, const execution_profile& profile)
  : broker_(b)
  , worker_(b.acquire_(profile))
{}

broker::lease::~lease ()
{
  if (worker_) worker_->close ();
}

worker&
broker::lease::get ()
{
  return *worker_;
}

void
broker::lease::release ()
{
  if (!worker_) return;

  broker_.give_back_(worker_);
  worker_.reset ();
}

remote_scan_driver::remote_scan_driver (const broker::ptr& b)
  : broker_(b)
  , cancelled_(false)
{}

std::vector< device_descriptor >
remote_scan_driver::get_devices (native::api_version v)
{
  execution_profile p (broker_->select_profile ("enumerate"));

  return broker_->with_worker< std::vector< device_descriptor > >
    (p, tsunagi::bind (&worker::enumerate, placeholders::_1, v));
}

scan_caps
remote_scan_driver::get_caps (const scan_options& options)
{
  execution_profile p (broker_->select_profile ("capabilities"));

  return broker_->with_worker< scan_caps >
    (p, tsunagi::bind (&worker::get_caps, placeholders::_1,
                       cref (options)));
}

void
remote_scan_driver::scan (const scan_options& options, scan_events& events,
                          const page_callback& on_page,
                          const cancel_token& token)
{
  execution_profile p (broker_->select_profile ("scan"));

  cancelled_ = broker_->with_worker< bool >
    (p, tsunagi::bind (&worker::scan, placeholders::_1,
                       cref (options), ref (events),
                       cref (on_page), cref (token)));
}

bool
remote_scan_driver::cancelled () const
{
  return cancelled_;
}

remote_ui_delegate::remote_ui_delegate (const broker::ptr& b)
  : broker_(b)
{}

boost::optional< native::configuration >
remote_ui_delegate::configure (const std::string& driver,
                               const std::string& device_id,
                               native::window_handle parent)
{
  if (driver != broker_->driver ())
    {
      log::error ("native dialog for '%1%' requested from '%2%' workers")
        % driver % broker_->driver ();
    }

  execution_profile p (broker_->select_profile ("native-ui"));

  return broker_->with_worker< boost::optional< native::configuration > >
    (p, tsunagi::bind (&worker::native_ui, placeholders::_1,
                       device_id, parent));
}

}       // namespace tsunagi
