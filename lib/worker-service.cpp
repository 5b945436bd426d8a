//  worker-service.cpp -- serve scan requests inside a worker process
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

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>

#include <boost/throw_exception.hpp>

#include "tsunagi/format.hpp"
#include "tsunagi/functional.hpp"
#include "tsunagi/log.hpp"
#include "tsunagi/native-library.hpp"
#include "tsunagi/worker-service.hpp"

namespace tsunagi {

using ipc::header;

namespace {

void
hangup (int signum)
{
  _exit (signum == SIGHUP ? EXIT_SUCCESS : EXIT_FAILURE);
}

const octet *
data_of (const octet_buffer& buf)
{
  return (buf.empty () ? nullptr : &buf[0]);
}

const char *known_capabilities[] = {
  "enumerate",
  "capabilities",
  "scan",
  "native-ui",
};

}       // namespace

worker_service::worker_service (const shared_ptr< native_scan_driver >& driver)
  : driver_(driver)
  , id_(getpid ())
  , scanning_flag_(false)
{}

worker_service::~worker_service ()
{
  finish_scan_();
}

void
worker_service::refuse (const std::string& capability)
{
  refused_.insert (capability);
}

int
worker_service::run ()
{
  errno = 0;
  int s = socket (AF_INET, SOCK_STREAM, 0);
  if (0 > s)
    {
      log::fatal ("socket: %1%") % strerror (errno);
      return EXIT_FAILURE;
    }
  ipc::channel listener (s);

  struct sockaddr_in addr;
  memset (&addr, 0, sizeof (addr));
  addr.sin_family      = AF_INET;
  addr.sin_port        = htons (0);
  addr.sin_addr.s_addr = htonl (INADDR_LOOPBACK);

  errno = 0;
  int rv = ::bind (s, reinterpret_cast< sockaddr * > (&addr), sizeof (addr));
  if (rv)
    {
      log::fatal ("bind: %1%") % strerror (errno);
      return EXIT_FAILURE;
    }

  socklen_t n = sizeof (addr);
  errno = 0;
  rv = getsockname (s, reinterpret_cast< sockaddr * > (&addr), &n);
  if (rv)
    {
      log::fatal ("getsockname: %1%") % strerror (errno);
      return EXIT_FAILURE;
    }

  errno = 0;
  rv = listen (s, 0);
  if (rv)
    {
      log::fatal ("listen: %1%") % strerror (errno);
      return EXIT_FAILURE;
    }

  std::cout << ntohs (addr.sin_port) << std::endl;

  errno = 0;
  int as = accept (s, reinterpret_cast< sockaddr * > (&addr), &n);
  if (0 > as)
    {
      log::fatal ("accept: %1%") % strerror (errno);
      return EXIT_FAILURE;
    }
  listener.close ();
  channel_.reset (as);

  std::signal (SIGHUP, hangup);

  for (;;)
    {
      header hdr;
      octet_buffer payload;

      if (!channel_.recv (hdr, payload))
        {
          log::brief ("client went away");
          finish_scan_();
          return EXIT_FAILURE;
        }
      if (!dispatch_(hdr, payload))
        break;
    }

  return EXIT_SUCCESS;
}

/*! Returns \c false when the client asked to close the connection.
 */
bool
worker_service::dispatch_(const header& hdr, const octet_buffer& payload)
{
  if (header::CANCEL == hdr.type ())
    {
      log::brief (log::BROKER, "cancel requested");
      cancel_.cancel ();
      return true;
    }
  if (header::CLOSE == hdr.type ())
    {
      finish_scan_();
      reply_(hdr, wire::encoder ());
      return false;
    }

  if (scanning_())
    {
      reply_(hdr.type (), system_error (system_error::device_busy,
                                        "a scan is in progress"));
      return true;
    }
  if (scan_thread_) finish_scan_();

  try
    {
      wire::decoder dec (data_of (payload), payload.size ());
      wire::encoder enc;

      /**/ if (header::OPEN == hdr.type ())
        {
          log::brief (log::BROKER, "opened for '%1%'")
            % std::string (data_of (payload), payload.size ());
        }
      else if (header::PROBE == hdr.type ())
        {
          std::string capability;
          dec >> capability;
          enc << supports_(capability);
        }
      else if (!driver_)
        {
          BOOST_THROW_EXCEPTION
            (system_error (system_error::device_error,
                           "no native driver library available"));
        }
      else if (header::ENUMERATE == hdr.type ())
        {
          int32_t v;
          dec >> v;
          enc << driver_->get_devices (native::api_version (v));
        }
      else if (header::CAPABILITIES == hdr.type ())
        {
          scan_options options;
          dec >> options;
          enc << driver_->get_caps (options);
        }
      else if (header::SCAN == hdr.type ())
        {
          scan_options options;
          dec >> options;
          start_scan_(options);
          return true;          // answered with DONE when finished
        }
      else if (header::NATIVE_UI == hdr.type ())
        {
          std::string device_id;
          uint32_t hi, lo;
          dec >> device_id >> hi >> lo;
          enc << driver_->configure (device_id,
                                     native::window_handle
                                     ((uint64_t (hi) << 32) | lo));
        }
      else
        {
          BOOST_THROW_EXCEPTION
            (system_error (system_error::device_communication_error,
                           (format ("unhandled message type: %1%")
                            % hdr.type ()).str ()));
        }

      reply_(hdr, enc);
    }
  catch (const system_error& e)
    {
      reply_(hdr.type (), e);
    }
  catch (const std::exception& e)
    {
      reply_(hdr.type (), system_error (system_error::device_error,
                                        e.what ()));
    }

  return true;
}

bool
worker_service::supports_(const std::string& capability) const
{
  if (refused_.count (capability)) return false;

  const std::string module_prefix ("module:");
  if (0 == capability.compare (0, module_prefix.size (), module_prefix))
    return native::library::probe (capability.substr (module_prefix.size ()));

  if (!driver_) return false;

  const size_t n = sizeof (known_capabilities) / sizeof (*known_capabilities);
  for (size_t i = 0; i < n; ++i)
    {
      if (capability == known_capabilities[i]) return true;
    }
  return false;
}

void
worker_service::start_scan_(const scan_options& options)
{
  cancel_ = cancel_source ();
  {
    lock_guard< mutex > lock (mutex_);
    scanning_flag_ = true;
  }
  scan_thread_ = make_shared< thread >
    (bind (&worker_service::scan_, this, options, cancel_.token ()));
}

void
worker_service::scan_(scan_options options, cancel_token token)
{
  scan_events events;
  scoped_connection c1
    (events.page_start.connect (bind (&worker_service::page_start_, this)));
  scoped_connection c2
    (events.page_progress.connect (bind (&worker_service::page_progress_,
                                         this, placeholders::_1)));

  try
    {
      driver_->scan (options, events,
                     bind (&worker_service::page_, this, placeholders::_1),
                     token);
      {
        lock_guard< mutex > lock (mutex_);
        scanning_flag_ = false;
      }
      wire::encoder enc;
      enc << (native_scan_driver::cancelled == driver_->current_state ());
      notify_(header::DONE, enc);
      return;
    }
  catch (const system_error& e)
    {
      {
        lock_guard< mutex > lock (mutex_);
        scanning_flag_ = false;
      }
      reply_(header::DONE, e);
    }
  catch (const std::exception& e)
    {
      {
        lock_guard< mutex > lock (mutex_);
        scanning_flag_ = false;
      }
      reply_(header::DONE, system_error (system_error::device_error,
                                         e.what ()));
    }
}

bool
worker_service::scanning_() const
{
  lock_guard< mutex > lock (mutex_);
  return scanning_flag_;
}

void
worker_service::finish_scan_()
{
  if (!scan_thread_) return;

  if (scanning_()) cancel_.cancel ();
  scan_thread_->join ();
  scan_thread_.reset ();
}

void
worker_service::reply_(const header& request, const wire::encoder& payload)
{
  header hdr;
  hdr.token (id_);
  hdr.type (request.type ());
  hdr.size (payload.size ());

  if (!channel_.send (hdr, payload.data ()))
    log::error ("cannot reply to request %1%") % request.type ();
}

void
worker_service::reply_(uint32_t type, const system_error& e)
{
  log::error ("request %1% failed: %2%") % type % e.what ();

  wire::encoder enc;
  enc << e;

  header hdr;
  hdr.token (id_);
  hdr.type (type);
  hdr.error (e.code () ? e.code () : system_error::unknown_error);
  hdr.size (enc.size ());

  if (!channel_.send (hdr, enc.data ()))
    log::error ("cannot report failure of request %1%") % type;
}

void
worker_service::notify_(uint32_t type, const wire::encoder& payload)
{
  header hdr;
  hdr.type (type);
  reply_(hdr, payload);
}

void
worker_service::page_start_()
{
  notify_(header::PAGE_START, wire::encoder ());
}

void
worker_service::page_progress_(double fraction)
{
  wire::encoder enc;
  enc << fraction;
  notify_(header::PROGRESS, enc);
}

void
worker_service::page_(const image::ptr& img)
{
  wire::encoder enc;
  enc << *img;
  notify_(header::PAGE, enc);
}

}       // namespace tsunagi
