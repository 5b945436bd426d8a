//  log.hpp -- prioritised, categorised diagnostics
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

#ifndef tsunagi_log_hpp_
#define tsunagi_log_hpp_

#include <ostream>
#include <string>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/optional.hpp>
#include <boost/throw_exception.hpp>

#include "format.hpp"
#include "thread.hpp"

#ifndef TSUNAGI_LOG_ARGUMENT_COUNT_CHECK_ENABLED
#define TSUNAGI_LOG_ARGUMENT_COUNT_CHECK_ENABLED true
#endif

namespace tsunagi {

//! Prioritised, categorised diagnostics
/*! Messages go to log::os, std::clog unless redirected.  Each message
 *  is stamped with the local time and the id of the thread that made
 *  it.  Messages in the native and broker categories name their
 *  category so that driver library calls and worker traffic stand out
 *  when several threads and processes log at once.
 */
class log
{
public:
  typedef enum {
    FATAL,                      //!<  famous last words
    ALERT,                      //!<  outside intervention required
    ERROR,                      //!<  something went wrong
    BRIEF,                      //!<  short informational notes
    TRACE,                      //!<  more chattery feedback
    DEBUG                       //!<  the gory details
    ,
    QUARK = TRACE,              //!<  scope tracing feedback
  } priority;

  typedef enum {
    NOTHING,
    NATIVE = 1 << 0,            //!<  calls into the driver library
    BROKER = 1 << 1,            //!<  worker process traffic
    ALL = ~0
  } category;

  static const bool
  arg_count_checking = TSUNAGI_LOG_ARGUMENT_COUNT_CHECK_ENABLED;

  //!  Messages with a priority above this are dropped
  static priority threshold;
  //!  Only messages in matching categories are considered for output
  static category matching;

  static std::ostream& os;

  //!  Map a priority name such as "brief" onto its enumerator
  /*!  Throws std::invalid_argument for names that are not known.
   */
  static priority to_priority (const std::string& name);

  static const char * to_string (category cat);

private:
  static bool make_noise (priority level, int cat)
  {
    return (threshold >= level && (matching & cat));
  }

public:
  //!  Formatted, self-outputting log message
  /*!  Modeled after boost::format.  A message that is suppressed never
   *   constructs a formatter, so feeding it arguments is cheap.  It
   *   still counts them when argument count checking is enabled.
   *
   *   A message writes itself to log::os when it goes out of scope.
   *   Missing arguments are filled in with their own placeholder.
   */
  class message
  {
  public:
    message ()
      : cat_(ALL), arg_(0), cnt_(0), dumped_(false)
    {}

    message (priority level, const format& fmt)
      : cat_(ALL), arg_(0), dumped_(false)
    { init_(level, ALL, fmt); }

    message (priority level, const std::string& fmt)
      : cat_(ALL), arg_(0), dumped_(false)
    { init_(level, ALL, format (fmt)); }

    message (priority level, const char *fmt)
      : cat_(ALL), arg_(0), dumped_(false)
    { init_(level, ALL, format (fmt)); }

    message (priority level, category cat, const std::string& fmt)
      : cat_(cat), arg_(0), dumped_(false)
    { init_(level, cat, format (fmt)); }

    //!  A message that only checks the argument count
    message (const format& fmt, bool)
      : cat_(ALL), arg_(fmt.cur_arg_), cnt_(fmt.num_args_), dumped_(false)
    {}

    //!  Writes the message to log::os
    /*!  Errors in producing the output are reported on log::os in
     *   place of the message.  Nothing is thrown.
     */
    ~message ();

    //!  Feeds the argument \a t to a message
    template< typename T >
    message& operator% (const T& t)
    {
      if (dumped_)
        {
          arg_ = 0;
          dumped_ = false;
        }
      ++arg_;

      if (fmt_)
        {
          *fmt_ % t;
        }
      else if (arg_count_checking && arg_ > cnt_)
        {
          BOOST_THROW_EXCEPTION (boost::io::too_many_args (arg_, cnt_));
        }
      return *this;
    }

    operator std::string () const;

  private:
    void init_(priority level, category cat, const format& fmt)
    {
      cnt_ = fmt.num_args_;
      if (!make_noise (level, cat)) return;

      timestamp_ = boost::posix_time::microsec_clock::local_time ();
      thread_id_ = this_thread::get_id ();
      fmt_ = fmt;
      if (!arg_count_checking)
        fmt_->exceptions (fmt_->exceptions ()
                          ^ (boost::io::too_many_args_bit
                             | boost::io::too_few_args_bit));
    }

    boost::optional< boost::posix_time::ptime > timestamp_;
    boost::optional< thread::id > thread_id_;
    boost::optional< format >     fmt_;

    category cat_;
    int arg_;
    int cnt_;
    mutable bool dumped_;
  };

#define expand_named_ctor(ctor,level)                                   \
  static message ctor (const std::string& fmt)                          \
  {                                                                     \
    return ctor (ALL, fmt);                                             \
  }                                                                     \
  static message ctor (category cat, const std::string& fmt)            \
  {                                                                     \
    if (make_noise (level, cat)) return message (level, cat, fmt);      \
    return (arg_count_checking                                          \
            ? message (format (fmt), arg_count_checking)                \
            : message ());                                              \
  }                                                                     \
  /**/

  expand_named_ctor (fatal, FATAL);
  expand_named_ctor (alert, ALERT);
  expand_named_ctor (error, ERROR);
  expand_named_ctor (brief, BRIEF);
  expand_named_ctor (trace, TRACE);
  expand_named_ctor (debug, DEBUG);

#undef expand_named_ctor

  //! Conveniently trace scope entry and exit
  /*! Compile with \c ENABLE_LOG_QUARK defined to a true value and run
   *  at log::QUARK priority to see which scopes are entered and left.
   *  Otherwise log::quark() expands to a no-op.
   */
  class quark_impl
  {
    const char *file_;
    int         line_;
    const char *func_;
  public:
    quark_impl (const char *file, int line, const char *func)
      : file_(file), line_(line), func_(func)
    { message (QUARK, "%1%:%2%: entered %3%") % file_ % line_ % func_; }
    ~quark_impl ()
    { message (QUARK, "%1%:%2%: exiting %3%") % file_ % line_ % func_; }
  };

  static void quark_noop () {}
};

#ifndef ENABLE_LOG_QUARK
#define ENABLE_LOG_QUARK false
#endif

#if ENABLE_LOG_QUARK
#define quark() quark_impl (__FILE__, __LINE__, __func__)
#else
#define quark() quark_noop ()
#endif

inline
std::ostream&
operator<< (std::ostream& os, const log::message& msg)
{
  return os << std::string (msg);
}

}       // namespace tsunagi

#endif  /* tsunagi_log_hpp_ */
