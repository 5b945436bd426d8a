//  ipc.cpp -- framed messages between processes
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
#include <signal.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <ctime>

#include "tsunagi/ipc.hpp"
#include "tsunagi/log.hpp"

namespace tsunagi {
namespace ipc {

header::header ()
  : token_id_(0)
  , type_(0)
  , error_(0)
  , size_(0)
{}

uint32_t
header::token () const
{
  return ntohl (token_id_);
}

uint32_t
header::type () const
{
  return ntohl (type_);
}

uint32_t
header::error () const
{
  return ntohl (error_);
}

int32_t
header::size () const
{
  return ntohl (size_);
}

void
header::token (uint32_t token)
{
  token_id_ = htonl (token);
}

void
header::type (uint32_t type)
{
  type_ = htonl (type);
}

void
header::error (uint32_t error)
{
  error_ = htonl (error);
}

void
header::size (int32_t size)
{
  size_ = htonl (size);
}

bool
delay_elapsed (double t_sec)
{
  struct timespec t;
  t.tv_sec  =  t_sec;
  t.tv_nsec = (t_sec - t.tv_sec) * 1000000000;
  return 0 == nanosleep (&t, 0);
}

void
set_timeout (int socket, double t_sec)
{
  if (0 > socket) return;

  struct timeval t;
  t.tv_sec  =  t_sec;
  t.tv_usec = (t_sec - t.tv_sec) * 1000000;

  errno = 0;
  if (0 > setsockopt (socket, SOL_SOCKET, SO_RCVTIMEO, &t, sizeof (t)))
    {
      log::alert ("socket option: %1%") % strerror (errno);
    }
  errno = 0;
  if (0 > setsockopt (socket, SOL_SOCKET, SO_SNDTIMEO, &t, sizeof (t)))
    {
      log::alert ("socket option: %1%") % strerror (errno);
    }
}

//! Signal blocking versions of I/O system calls
/*! Applications may register signal handlers with \c SA_RESTART, so
 *  our I/O with the other process must not repeat itself when such a
 *  handler returns.  Signals are blocked for the duration of the call.
 */
namespace {

streamsize
write (int fd, const void *buf, streamsize count)
{
  sigset_t current, blocked;
  sigemptyset (&blocked);
  sigaddset (&blocked, SIGTERM);
  sigaddset (&blocked, SIGINT );
  sigprocmask (SIG_BLOCK, &blocked, &current);

  errno = 0;
  streamsize rv = ::send (fd, buf, count, MSG_NOSIGNAL);
  if (0 > rv)
    log::error ("write failed: %1%") % strerror (errno);

  sigprocmask (SIG_SETMASK, &current, NULL);

  return rv;
}

streamsize
read (int fd, void *buf, streamsize count)
{
  sigset_t current, blocked;
  sigemptyset (&blocked);
  sigaddset (&blocked, SIGTERM);
  sigaddset (&blocked, SIGINT );
  sigprocmask (SIG_BLOCK, &blocked, &current);

  errno = 0;
  streamsize rv = ::read (fd, buf, count);
  if (0 > rv)
    {
      if (EAGAIN == errno || EWOULDBLOCK == errno)
        log::brief ("read timed out");
      else
        log::error ("read failed: %1%") % strerror (errno);
    }

  sigprocmask (SIG_SETMASK, &current, NULL);

  return rv;
}

}       // namespace

channel::channel (int socket)
  : socket_(socket)
{}

channel::~channel ()
{
  close ();
}

bool
channel::is_open () const
{
  return 0 <= socket_;
}

int
channel::socket () const
{
  return socket_;
}

void
channel::reset (int socket)
{
  close ();
  socket_ = socket;
}

void
channel::close ()
{
  if (0 > socket_) return;

  if (0 != ::close (socket_))
    {
      log::alert ("close: %1%") % strerror (errno);
    }
  socket_ = -1;
}

void
channel::timeout (double t_sec)
{
  set_timeout (socket_, t_sec);
}

bool
channel::send (const header& hdr, const octet *payload)
{
  lock_guard< mutex > lock (send_mutex_);

  if (streamsize (sizeof (hdr)) != send_(&hdr, sizeof (hdr)))
    return false;

  if (!hdr.size ()) return true;
  if (!payload) return false;

  return hdr.size () == send_(payload, hdr.size ());
}

bool
channel::recv (header& hdr, octet_buffer& payload)
{
  payload.clear ();

  if (streamsize (sizeof (hdr)) != recv_(&hdr, sizeof (hdr)))
    return false;

  if (0 > hdr.size ())
    {
      log::error ("negative payload size: %1%") % hdr.size ();
      return false;
    }
  if (!hdr.size ()) return true;

  payload.resize (hdr.size ());
  return hdr.size () == recv_(&payload[0], hdr.size ());
}

streamsize
channel::send_(const void *data, streamsize size)
{
  if (!size || 0 > socket_) return -1;

  streamsize n = 0;
  streamsize t = 1;

  const octet *p = reinterpret_cast< const octet * > (data);

  while (n < size && t > 0)
    {
      t = write (socket_, p + n, size - n);
      if (0 > t)
        {
          return -1;
        }
      else
        {
          n += t;
        }
    }

  return n;
}

streamsize
channel::recv_(void *data, streamsize size)
{
  if (!size || 0 > socket_) return -1;

  streamsize n = 0;
  streamsize t = 1;

  octet *p = reinterpret_cast< octet * > (data);

  while (n < size && t > 0)
    {
      t = read (socket_, p + n, size - n);
      if (0 > t)
        {
          return -1;
        }
      else
        {
          n += t;
        }
    }

  return n;
}

}       // namespace ipc
}       // namespace tsunagi
