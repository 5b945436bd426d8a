//  worker.cpp -- client side of a worker process
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
#include <signal.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

#include <boost/foreach.hpp>
#include <boost/throw_exception.hpp>

#include "tsunagi/exception.hpp"
#include "tsunagi/format.hpp"
#include "tsunagi/functional.hpp"
#include "tsunagi/i18n.hpp"
#include "tsunagi/log.hpp"
#include "tsunagi/mutex.hpp"
#include "tsunagi/worker.hpp"

namespace tsunagi {

using ipc::header;

const double seconds = 1.0;

namespace {

// Scans may take a while between messages, a page without progress
// reports for instance
const double scan_timeout_factor = 10;

mutex    live_mutex;
unsigned live_workers = 0;

const octet *
data_of (const octet_buffer& buf)
{
  return (buf.empty () ? nullptr : &buf[0]);
}

}       // namespace

execution_profile::execution_profile ()
  : bitness (host_bitness ())
{}

execution_profile::execution_profile (int bitness, const std::string& name,
                                      const std::string& executable)
  : bitness (bitness)
  , name (name)
  , executable (executable)
{}

int
execution_profile::host_bitness ()
{
  return 8 * sizeof (void *);
}

worker::worker (const execution_profile& profile, const std::string& driver,
                double timeout)
  : profile_(profile)
  , driver_(driver)
  , timeout_(timeout)
  , pid_(-1)
  , port_(-1)
  , id_(0)
{
  if (0 != ::access (profile_.executable.c_str (), F_OK | X_OK))
    {
      BOOST_THROW_EXCEPTION
        (std::runtime_error ((format ("%1%: not executable")
                              % profile_.executable).str ()));
    }

  if (!fork_())
    {
      reap_(0);
      BOOST_THROW_EXCEPTION
        (std::runtime_error ((format ("%1%: cannot start")
                              % profile_.executable).str ()));
    }

  int tries_left = 5;
  while (!connect_()
         && 0 < --tries_left
         && ipc::delay_elapsed (0.2 * seconds));

  std::string msg ("cannot connect");

  if (tries_left)
    {
      header hdr;
      hdr.type (header::OPEN);
      hdr.size (driver_.length ());

      if (channel_.send (hdr, driver_.data ()))
        {
          header reply;
          octet_buffer payload;

          if (channel_.recv (reply, payload) && !reply.error ())
            {
              id_ = reply.token ();
              log::brief (log::BROKER,
                          "opened %1% worker for '%2%' (pid %3%)")
                % profile_.name % driver_ % pid_;
              return;
            }
          msg = "error receiving";
        }
      else
        {
          msg = "error sending";
        }
    }

  channel_.close ();
  reap_(0);

  BOOST_THROW_EXCEPTION
    (std::runtime_error ((format ("%1%: %2%")
                          % profile_.executable % msg).str ()));
}

worker::~worker ()
{
  close ();
}

/*! A worker that acknowledges the CLOSE message gets the time-out to
 *  exit by itself.  Only unresponsive workers are killed.
 */
void
worker::close ()
{
  if (0 > pid_ && !channel_.is_open ()) return;

  bool graceful = false;

  if (channel_.is_open ())
    {
      header hdr;
      hdr.token (id_);
      hdr.type (header::CLOSE);

      channel_.timeout (timeout_);
      if (channel_.send (hdr, nullptr))
        {
          header reply;
          octet_buffer payload;

          graceful = (channel_.recv (reply, payload)
                      && header::CLOSE == reply.type ());
        }
      if (!graceful)
        log::brief ("%1%: failure closing worker") % profile_.executable;
    }
  channel_.close ();

  reap_(graceful ? timeout_ : 0);
}

bool
worker::probe (const std::string& capability)
{
  wire::encoder enc;
  enc << capability;

  octet_buffer reply;
  request_(header::PROBE, enc, reply, timeout_);

  bool rv = false;
  wire::decoder (data_of (reply), reply.size ()) >> rv;

  log::brief (log::BROKER, "%1% worker %2% '%3%'")
    % profile_.name % (rv ? "supports" : "does not support") % capability;

  return rv;
}

std::vector< device_descriptor >
worker::enumerate (native::api_version v)
{
  wire::encoder enc;
  enc << int32_t (v);

  octet_buffer reply;
  request_(header::ENUMERATE, enc, reply, timeout_);

  std::vector< device_descriptor > rv;
  wire::decoder (data_of (reply), reply.size ()) >> rv;
  return rv;
}

scan_caps
worker::get_caps (const scan_options& options)
{
  wire::encoder enc;
  enc << options;

  octet_buffer reply;
  request_(header::CAPABILITIES, enc, reply, timeout_);

  scan_caps rv;
  wire::decoder (data_of (reply), reply.size ()) >> rv;
  return rv;
}

bool
worker::scan (const scan_options& options, scan_events& events,
              const page_callback& on_page, const cancel_token& token)
{
  wire::encoder enc;
  enc << options;

  header hdr;
  hdr.token (id_);
  hdr.type (header::SCAN);
  hdr.size (enc.size ());

  channel_.timeout (timeout_);
  if (!channel_.send (hdr, enc.data ()))
    fail_("cannot send scan request");

  scoped_connection c (token.connect (bind (&worker::cancel, this)));
  channel_.timeout (scan_timeout_factor * timeout_);

  exception_ptr failure;

  for (;;)
    {
      header reply;
      octet_buffer payload;

      if (!channel_.recv (reply, payload))
        fail_("worker stopped responding");

      if (header::DONE == reply.type ())
        {
          channel_.timeout (timeout_);
          if (failure) rethrow_exception (failure);
          check_(reply, payload);

          bool cancelled = false;
          wire::decoder (data_of (payload), payload.size ()) >> cancelled;
          return cancelled;
        }
      if (failure) continue;

      try
        {
          wire::decoder dec (data_of (payload), payload.size ());

          /**/ if (header::PAGE_START == reply.type ())
            {
              events.page_start ();
            }
          else if (header::PROGRESS == reply.type ())
            {
              double fraction = 0;
              dec >> fraction;
              events.page_progress (fraction);
            }
          else if (header::PAGE == reply.type ())
            {
              image::ptr img;
              dec >> img;
              on_page (img);
            }
          else
            {
              log::error ("unexpected message type during scan: %1%")
                % reply.type ();
            }
        }
      catch (const std::exception&)
        {
          // finish the worker's scan before reporting
          failure = current_exception ();
          cancel ();
        }
    }
}

boost::optional< native::configuration >
worker::native_ui (const std::string& device_id,
                   native::window_handle parent)
{
  wire::encoder enc;
  enc << device_id
      << uint32_t (uint64_t (parent) >> 32)
      << uint32_t (uint64_t (parent) & 0xffffffff);

  // the user takes as long as the user takes
  octet_buffer reply;
  request_(header::NATIVE_UI, enc, reply, 0);

  boost::optional< native::configuration > rv;
  wire::decoder (data_of (reply), reply.size ()) >> rv;
  return rv;
}

void
worker::cancel ()
{
  header hdr;
  hdr.token (id_);
  hdr.type (header::CANCEL);

  if (!channel_.send (hdr, nullptr))
    log::error ("%1%: cannot send cancel request") % profile_.executable;
}

const execution_profile&
worker::profile () const
{
  return profile_;
}

pid_t
worker::pid () const
{
  return pid_;
}

unsigned
worker::live_count ()
{
  lock_guard< mutex > lock (live_mutex);
  return live_workers;
}

bool
worker::fork_()
{
  int pipe_fd[2];

  if (-1 == pipe (pipe_fd))
    {
      log::fatal ("pipe: %1%") % strerror (errno);
      return false;
    }

  std::vector< std::string > args;
  args.push_back (profile_.executable);
  args.push_back ("--driver");
  args.push_back (driver_);
  args.insert (args.end (),
               profile_.arguments.begin (), profile_.arguments.end ());

  std::vector< char * > argv;
  BOOST_FOREACH (std::string& arg, args)
    {
      argv.push_back (&arg[0]);
    }
  argv.push_back (NULL);

  pid_ = fork ();
  if (0 == pid_)
    {
      // replace child process with the worker program

      ::signal (SIGTERM, SIG_IGN);       // dealt with by parent
      ::signal (SIGINT , SIG_IGN);

      ::close (pipe_fd[0]);             // unused read end
      if (0 <= dup2 (pipe_fd[1], STDOUT_FILENO))
        {
          execv (argv[0], &argv[0]);
        }

      // notify the parent process that we're done here

      ssize_t n = write (pipe_fd[1], "-1\n", strlen ("-1\n"));
      if (0 < n) fsync (pipe_fd[1]);

      ::close (pipe_fd[1]);
      _exit (EXIT_FAILURE);
    }

  ::close (pipe_fd[1]);

  if (0 > pid_)
    {
      log::fatal ("fork: %1%") % strerror (errno);
      ::close (pipe_fd[0]);
      return false;
    }

  {
    lock_guard< mutex > lock (live_mutex);
    ++live_workers;
  }
  log::brief (log::BROKER, "%1%[%2%]: starting")
    % profile_.executable % pid_;

  FILE *fp = fdopen (pipe_fd[0], "rb");
  if (fp)
    {
      if (1 != fscanf (fp, "%d", &port_))
        {
          log::error ("%1%[%2%]: no port announced")
            % profile_.executable % pid_;
        }
      fclose (fp);
    }
  else
    {
      log::fatal ("fdopen: %1%") % strerror (errno);
      ::close (pipe_fd[0]);
    }

  return 0 < port_;
}

bool
worker::connect_()
{
  errno = 0;
  int s = socket (AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (0 > s)
    {
      log::error ("socket: %1%") % strerror (errno);
      return false;
    }
  channel_.reset (s);
  channel_.timeout (timeout_);

  struct sockaddr_in addr;
  memset (&addr, 0, sizeof (addr));
  addr.sin_family      = AF_INET;
  addr.sin_port        = htons (port_);
  addr.sin_addr.s_addr = htonl (INADDR_LOOPBACK);

  if (0 != ::connect (s, (struct sockaddr *) &addr, sizeof (addr)))
    {
      log::error ("connect: %1%") % strerror (errno);
      channel_.close ();
      return false;
    }

  return true;
}

void
worker::reap_(double timeout)
{
  if (1 >= pid_) return;

  int status = 0;
  pid_t w = waitpid (pid_, &status, WNOHANG);

  for (double waited = 0; 0 == w && waited < timeout; waited += 0.05)
    {
      ipc::delay_elapsed (0.05 * seconds);
      w = waitpid (pid_, &status, WNOHANG);
    }

  if (0 == w)
    {
      log::brief (log::BROKER, "%1%[%2%]: not responding, killing")
        % profile_.executable % pid_;

      if (0 != kill (pid_, SIGKILL))
        {
          log::alert ("kill: %1%") % strerror (errno);
        }
      w = waitpid (pid_, &status, 0);
    }

  if (pid_ == w)
    {
      const std::string fmt ("%1%[%2%]: %3% %4%");

      /**/ if (WIFEXITED (status))
        {
          log::trace (log::BROKER, fmt)
            % profile_.executable % pid_ % "exited with status"
            % WEXITSTATUS (status)
            ;
        }
      else if (WIFSIGNALED (status))
        {
          log::trace (log::BROKER, fmt)
            % profile_.executable % pid_ % "killed by"
            % strsignal (WTERMSIG (status))
            ;
        }
      else
        {
          log::alert (log::BROKER, fmt)
            % profile_.executable % pid_ % "terminated with status"
            % status
            ;
        }
    }
  else
    {
      log::error ("waitpid: %1%") % strerror (errno);
    }

  {
    lock_guard< mutex > lock (live_mutex);
    --live_workers;
  }
  pid_ = -1;
}

void
worker::request_(uint32_t type, const wire::encoder& request,
                 octet_buffer& reply, double timeout)
{
  channel_.timeout (timeout);

  header hdr;
  hdr.token (id_);
  hdr.type (type);
  hdr.size (request.size ());

  if (!channel_.send (hdr, request.data ()))
    fail_("cannot send request");

  header rhdr;
  if (!channel_.recv (rhdr, reply))
    fail_("no reply");

  check_(rhdr, reply);

  if (type != rhdr.type ())
    fail_((format ("unexpected reply type %1% to request %2%")
           % rhdr.type () % type).str ());
}

void
worker::check_(const header& hdr, const octet_buffer& payload) const
{
  if (!hdr.error ()) return;

  system_error e;
  wire::decoder (data_of (payload), payload.size ()) >> e;

  log::brief ("%1% worker reported: %2%") % profile_.name % e.what ();

  BOOST_THROW_EXCEPTION (e);
}

void
worker::fail_(const std::string& what) const
{
  BOOST_THROW_EXCEPTION
    (system_error (system_error::device_communication_error,
                   (format ("%1% worker: %2%")
                    % profile_.name % what).str ()));
}

}       // namespace tsunagi
