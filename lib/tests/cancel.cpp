//  cancel.cpp -- unit tests for cooperative cancellation
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

#include <boost/test/unit_test.hpp>

#include "tsunagi/cancel.hpp"
#include "tsunagi/functional.hpp"
#include "tsunagi/memory.hpp"

using namespace tsunagi;

namespace {

struct counter
{
  int calls;

  counter () : calls (0) {}

  void operator() () { ++calls; }
};

//! Drops its owner's last reference from within its cancel callback
struct self_releasing
{
  shared_ptr< self_releasing > *owner;
  bool *kept_alive;

  void cancel ()
  {
    weak_ptr< self_releasing > self (*owner);
    owner->reset ();
    *kept_alive = !self.expired ();
  }
};

}       // namespace

BOOST_AUTO_TEST_CASE (default_token_is_never_cancelled)
{
  cancel_token token;
  counter c;
  scoped_connection sc (token.connect (ref (c)));

  BOOST_CHECK (!token.is_cancellation_requested ());
  BOOST_CHECK_EQUAL (0, c.calls);
}

BOOST_AUTO_TEST_CASE (tokens_share_state)
{
  cancel_source source;
  cancel_token  early (source.token ());

  source.cancel ();

  BOOST_CHECK (early.is_cancellation_requested ());
  BOOST_CHECK (source.token ().is_cancellation_requested ());
  BOOST_CHECK (source.is_cancellation_requested ());
}

BOOST_AUTO_TEST_CASE (callbacks_run_once)
{
  cancel_source source;
  counter c;
  scoped_connection sc (source.token ().connect (ref (c)));

  source.cancel ();
  source.cancel ();

  BOOST_CHECK_EQUAL (1, c.calls);
}

BOOST_AUTO_TEST_CASE (late_registration_runs_at_once)
{
  cancel_source source;
  counter c;

  source.cancel ();
  scoped_connection sc (source.token ().connect (ref (c)));

  BOOST_CHECK_EQUAL (1, c.calls);
}

BOOST_AUTO_TEST_CASE (disconnected_callbacks_stay_quiet)
{
  cancel_source source;
  counter c;
  {
    scoped_connection sc (source.token ().connect (ref (c)));
  }
  source.cancel ();

  BOOST_CHECK_EQUAL (0, c.calls);
}

BOOST_AUTO_TEST_CASE (tracked_callbacks_keep_their_object_alive)
{
  cancel_source source;
  bool kept_alive = false;

  shared_ptr< self_releasing > p (make_shared< self_releasing > ());
  p->owner = &p;
  p->kept_alive = &kept_alive;

  cancel_token::cancel_signal_type::slot_type
    slot (&self_releasing::cancel, p.get ());
  scoped_connection sc (source.token ().connect (slot.track_foreign (p)));
  source.cancel ();

  BOOST_CHECK (kept_alive);
  BOOST_CHECK (!p);
}

BOOST_AUTO_TEST_CASE (expired_callbacks_stay_quiet)
{
  cancel_source source;
  counter c;
  shared_ptr< int > life (make_shared< int > (0));

  cancel_token::cancel_signal_type::slot_type slot (ref (c));
  slot.track_foreign (life);

  scoped_connection sc (source.token ().connect (slot));
  life.reset ();
  source.cancel ();
  BOOST_CHECK_EQUAL (0, c.calls);

  scoped_connection late (source.token ().connect (slot));
  BOOST_CHECK_EQUAL (0, c.calls);
}

#include "tsunagi/test/runner.ipp"
