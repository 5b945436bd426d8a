//  ipc.hpp -- framed messages between processes
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

#ifndef tsunagi_ipc_hpp_
#define tsunagi_ipc_hpp_

#include "cstdint.hpp"
#include "mutex.hpp"
#include "octet.hpp"

namespace tsunagi {
namespace ipc {

//! Precedes every message exchanged with a worker process
/*! All fields are kept in network byte order.  A non-zero error()
 *  means the payload holds an encoded system_error.
 */
class header
{
public:
  header ();

  uint32_t token () const;
  uint32_t type () const;
  uint32_t error () const;
  int32_t size () const;

  void token (uint32_t token);
  void type (uint32_t type);
  void error (uint32_t error);
  void size (int32_t size);

  enum {
    OPEN = 4,
    CLOSE,
    ENUMERATE,
    CAPABILITIES,
    SCAN,
    CANCEL,
    PROBE,
    NATIVE_UI,
    PAGE_START,
    PROGRESS,
    PAGE,
    DONE,
  };

private:
  uint32_t token_id_;
  uint32_t type_;
  uint32_t error_;
  int32_t size_;
};

//! Conveniently change a socket's timeout settings
/*! A zero \a t_sec blocks indefinitely.
 */
void set_timeout (int socket, double t_sec);

bool delay_elapsed (double t_sec);

//! Framed message I/O over a connected stream socket
/*! Sending is safe from several threads at once.  Receiving is meant
 *  for a single thread.  The channel owns the socket.
 */
class channel
{
public:
  explicit channel (int socket = -1);
  ~channel ();

  bool is_open () const;
  int socket () const;
  void reset (int socket);
  void close ();

  void timeout (double t_sec);

  //! Returns \c false if the message could not be written completely
  bool send (const header& hdr, const octet *payload);

  //! Returns \c false on time-out, end of file or a short read
  bool recv (header& hdr, octet_buffer& payload);

private:
  channel (const channel&);
  channel& operator= (const channel&);

  streamsize send_(const void *data, streamsize size);
  streamsize recv_(      void *data, streamsize size);

  int   socket_;
  mutex send_mutex_;
};

}       // namespace ipc
}       // namespace tsunagi

#endif  /* tsunagi_ipc_hpp_ */
