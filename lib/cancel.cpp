//  cancel.cpp -- cooperative cancellation between threads
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

#include "tsunagi/cancel.hpp"

namespace tsunagi {

cancel_token::state::state ()
  : requested_(false)
{}

cancel_token::cancel_token ()
  : state_(make_shared< state > ())
{}

cancel_token::cancel_token (const shared_ptr< state >& s)
  : state_(s)
{}

bool
cancel_token::is_cancellation_requested () const
{
  return state_->requested_;
}

connection
cancel_token::connect (const cancel_signal_type::slot_type& slot) const
{
  connection c;
  {
    lock_guard< mutex > lock (state_->mutex_);

    if (!state_->requested_)
      return state_->signal_.connect (slot);
  }
  if (!slot.expired ()) slot ();
  return c;
}

cancel_source::cancel_source ()
  : state_(make_shared< cancel_token::state > ())
{}

cancel_token
cancel_source::token () const
{
  return cancel_token (state_);
}

void
cancel_source::cancel ()
{
  {
    lock_guard< mutex > lock (state_->mutex_);

    if (state_->requested_) return;
    state_->requested_ = true;
  }
  state_->signal_ ();
}

bool
cancel_source::is_cancellation_requested () const
{
  return state_->requested_;
}

}       // namespace tsunagi
