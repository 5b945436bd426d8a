//  cancel.hpp -- cooperative cancellation between threads
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

#ifndef tsunagi_cancel_hpp_
#define tsunagi_cancel_hpp_

#include <csignal>

#include "memory.hpp"
#include "mutex.hpp"
#include "signal.hpp"

namespace tsunagi {

//! Cooperative cancellation shared between a requester and a worker
/*! The party that wants to cancel calls cancel_source::cancel().  The
 *  party doing the work checks the token before expensive steps and
 *  registers callbacks that forward cancellation to whatever is in
 *  progress.  Callbacks registered after cancellation run at once.
 */
class cancel_token
{
public:
  typedef signal< void () > cancel_signal_type;

  //! A token that is never cancelled
  cancel_token ();

  bool is_cancellation_requested () const;

  //! Arrange for \a slot to run when cancellation is requested
  /*! The returned connection should be kept in a scoped_connection
   *  for the duration of the work it protects.
   */
  connection connect (const cancel_signal_type::slot_type& slot) const;

private:
  friend class cancel_source;

  struct state
  {
    state ();

    mutex              mutex_;
    volatile sig_atomic_t requested_;
    cancel_signal_type signal_;
  };

  explicit cancel_token (const shared_ptr< state >& s);

  shared_ptr< state > state_;
};

class cancel_source
{
public:
  cancel_source ();

  cancel_token token () const;

  void cancel ();

  bool is_cancellation_requested () const;

private:
  shared_ptr< cancel_token::state > state_;
};

}       // namespace tsunagi

#endif  /* tsunagi_cancel_hpp_ */
