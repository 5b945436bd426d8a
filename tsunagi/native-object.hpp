//  native-object.hpp -- scoped ownership of native handles
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

#ifndef tsunagi_native_object_hpp_
#define tsunagi_native_object_hpp_

#include <stdexcept>
#include <string>

#include "condition-variable.hpp"
#include "mutex.hpp"
#include "native-library.hpp"
#include "thread.hpp"

namespace tsunagi {
namespace native {

//! Generic failure reported by the native library
class error
  : public std::runtime_error
{
public:
  error (status code, const std::string& what);

  status code () const;

private:
  status code_;
};

//! The library returned no handle where one was requested
class handle_creation_failed
  : public error
{
public:
  explicit handle_creation_failed (status code);
};

//! A released handle was used, a programming error
class use_after_release
  : public std::logic_error
{
public:
  explicit use_after_release (const std::string& what);
};

//! The library was used without holding the monitor
class not_locked
  : public std::logic_error
{
public:
  not_locked ();
};

//! Throw an error when a native call's \a s indicates failure
void check (status s, const std::string& what);

//! Process-wide exclusive access to the native driver library
/*! The native library is not reentrant.  All calls into it have to be
 *  made while holding the one and only monitor.  The monitor may be
 *  entered repeatedly by the thread that owns it.
 */
class monitor
{
public:
  static monitor& instance ();

  void enter ();
  void leave ();

  //! Whether the calling thread currently owns the monitor
  bool is_held () const;

private:
  monitor ();
  monitor (const monitor&);
  monitor& operator= (const monitor&);

  mutable mutex mutex_;
  condition_variable released_;
  thread::id owner_;
  unsigned   depth_;
};

//! Scoped ownership of the native monitor
/*! An access object is the capability token that native call sites
 *  need.  As long as it exists the calling thread owns the monitor.
 */
class access
{
public:
  explicit access (const library::ptr& lib);
  ~access ();

  library * operator-> () const;

  const library::ptr& lib () const;

private:
  access (const access&);
  access& operator= (const access&);

  library::ptr lib_;
};

//! Exclusively owned wrapper around a handle from the native library
/*! Objects are not copyable.  A handle is released exactly once, at
 *  the latest when its wrapper is destroyed.  Derived classes must
 *  not keep any handles of their own.
 */
class object
{
public:
  virtual ~object ();

  //! Give the handle back to the native library
  /*! Calling this more than once is harmless.
   */
  void release ();

  bool is_live () const;

  //! The wrapped handle, throws use_after_release if released
  native::handle handle () const;

  const library::ptr& lib_ptr () const;

protected:
  //! Take ownership of \a h, a value just returned by the library
  /*! Throws handle_creation_failed with the library's last error if
   *  \a h is null.  The \a token proves the caller holds the monitor
   *  so that the last error still belongs to the failed call.
   */
  object (const access& token, native::handle h);

  //! Access to the library for a monitor holding caller
  /*! Throws not_locked if the calling thread does not hold it.
   */
  library& lib () const;

  //! Mark the object released without telling the library
  /*! For handles whose ownership passes back to the library.
   */
  void set_already_released ();

private:
  object (const object&);
  object& operator= (const object&);

  library::ptr   lib_;
  native::handle handle_;
  bool           released_;
};

}       // namespace native
}       // namespace tsunagi

#endif  /* tsunagi_native_object_hpp_ */
