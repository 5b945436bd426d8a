//  native-object.cpp -- scoped ownership of native handles
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

#include <boost/throw_exception.hpp>

#include "tsunagi/format.hpp"
#include "tsunagi/log.hpp"
#include "tsunagi/native-object.hpp"

namespace tsunagi {
namespace native {

error::error (status code, const std::string& what)
  : std::runtime_error ((format ("%1% (status 0x%2$08x)")
                         % what % uint32_t (code)).str ())
  , code_(code)
{}

status
error::code () const
{
  return code_;
}

handle_creation_failed::handle_creation_failed (status code)
  : error (code, "cannot create native handle")
{}

use_after_release::use_after_release (const std::string& what)
  : std::logic_error (what + ": handle already released")
{}

not_locked::not_locked ()
  : std::logic_error ("native library used without holding its monitor")
{}

void
check (status s, const std::string& what)
{
  if (ok == s) return;

  BOOST_THROW_EXCEPTION (error (s, what));
}

monitor&
monitor::instance ()
{
  static monitor m;
  return m;
}

monitor::monitor ()
  : depth_(0)
{}

void
monitor::enter ()
{
  thread::id self (this_thread::get_id ());
  unique_lock< mutex > lock (mutex_);

  if (depth_ && owner_ == self)
    {
      ++depth_;
      return;
    }
  while (depth_)
    released_.wait (lock);

  owner_ = self;
  depth_ = 1;
}

void
monitor::leave ()
{
  {
    lock_guard< mutex > lock (mutex_);

    if (!depth_ || owner_ != this_thread::get_id ())
      {
        log::alert ("leaving a native monitor that is not ours");
        return;
      }
    if (--depth_) return;
    owner_ = thread::id ();
  }
  released_.notify_one ();
}

bool
monitor::is_held () const
{
  lock_guard< mutex > lock (mutex_);

  return (depth_ && owner_ == this_thread::get_id ());
}

access::access (const library::ptr& lib)
  : lib_(lib)
{
  monitor::instance ().enter ();
}

access::~access ()
{
  monitor::instance ().leave ();
}

library *
access::operator-> () const
{
  return lib_.get ();
}

const library::ptr&
access::lib () const
{
  return lib_;
}

object::object (const access& token, native::handle h)
  : lib_(token.lib ())
  , handle_(h)
  , released_(false)
{
  if (!handle_)
    {
      status code = token->last_error ();
      log::error (log::NATIVE, "%1%: no handle (status 0x%2$08x)")
        % lib_->name () % uint32_t (code);
      BOOST_THROW_EXCEPTION (handle_creation_failed (code));
    }
}

object::~object ()
{
  release ();
}

void
object::release ()
{
  access lock (lib_);

  if (released_) return;
  released_ = true;

  log::debug (log::NATIVE, "%1%: releasing %2%") % lib_->name () % handle_;
  lock->release (handle_);
}

bool
object::is_live () const
{
  return !released_;
}

native::handle
object::handle () const
{
  if (released_)
    BOOST_THROW_EXCEPTION (use_after_release (lib_->name ()));

  return handle_;
}

const library::ptr&
object::lib_ptr () const
{
  return lib_;
}

library&
object::lib () const
{
  if (!monitor::instance ().is_held ())
    BOOST_THROW_EXCEPTION (not_locked ());

  return *lib_;
}

void
object::set_already_released ()
{
  access lock (lib_);
  released_ = true;
}

}       // namespace native
}       // namespace tsunagi
