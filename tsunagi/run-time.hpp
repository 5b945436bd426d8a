//  run-time.hpp -- information about a program's run-time environment
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

#ifndef tsunagi_run_time_hpp_
#define tsunagi_run_time_hpp_

#include <map>
#include <string>
#include <vector>

#include <boost/program_options/variables_map.hpp>

namespace tsunagi {

/*! The run_time singleton collects the settings a program runs with.
 *  Values come from the command-line, from \c TSUNAGI_* environment
 *  variables and from a configuration file, in that order of
 *  precedence.  The following settings are understood everywhere:
 *
 *  - \c log-level, the log::threshold to use
 *  - \c config, an alternative configuration file
 *  - \c driver, the default kind of native driver library
 *  - \c api-version, one of \c default, \c legacy or \c current
 *  - \c worker-dir, where the worker executables live
 *  - \c worker-timeout, seconds to wait for a worker's reply
 *
 *  The configuration file may contain additional per-driver keys such
 *  as \c no-more-pages.<driver>.  These are available via setting().
 */
class run_time
{
public:
  typedef std::vector< std::string > sequence_type;
  typedef boost::program_options::variable_value value_type;
  typedef std::map< std::string, value_type >::size_type size_type;

  //! Initialise program run-time environmental information
  /*! A program's \c main() creates the one run_time instance with all
   *  command-line arguments.  Arguments that are not recognised are
   *  passed on via arguments().
   *
   *  This constructor can only be used once.  Any additional use will
   *  throw a std::logic_error exception.
   */
  run_time (int argc, const char *const argv[], bool configure_i18n = false);

  //! Get access to run-time environmental information
  /*! Throws a std::logic_error if the singleton has not been
   *  initialised yet.
   */
  run_time ();

  std::string
  program () const;

  //! Obtain the command used in the command-line invocation
  /*! If no command was entered on the command-line, an empty string
   *  will be returned.
   */
  std::string
  command () const;

  //! Unprocessed command-line arguments
  const sequence_type&
  arguments () const;

  //! Find the executable implementing a helper \a command
  std::string
  locate (const std::string& command) const;

  size_type
  count (const std::string& option) const;

  const value_type&
  operator[] (const std::string& option) const;

  //! Value of a free-form configuration file \a key
  /*! Returns an empty string if the key was not given.
   */
  std::string
  setting (const std::string& key) const;

  //! Seconds to wait for a worker process before giving up on it
  double
  worker_timeout () const;

  std::string
  help (const std::string& summary = std::string ()) const;

  std::string
  version (const std::string& legalese   = std::string (),
           const std::string& disclaimer = std::string ()) const;

  enum scope {
    pkg,                        //!< package specific locations
    sys,                        //!< normal system locations
    usr,                        //!< user's home directory
  };

  sequence_type
  load_dirs (scope s, const std::string& component) const;

  std::string
  conf_file (scope s, const std::string& name) const;

  bool
  running_in_place () const;

  class impl;
};

}       // namespace tsunagi

#endif  /* tsunagi_run_time_hpp_ */
