//  run-time.ipp -- implementation details of the run_time singleton
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

#ifndef lib_run_time_ipp_
#define lib_run_time_ipp_

/*! \file
 *  \brief Expose enough detail to make run_time testable
 *
 *  Unit tests need to "reset" the singleton between tests.  The public
 *  API does not provide for this.  Test fixture destructors can delete
 *  the instance_ and set it to \c NULL instead.
 */

#include <boost/filesystem/path.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>

#include "tsunagi/run-time.hpp"

namespace tsunagi {

namespace fs = boost::filesystem;
namespace po = boost::program_options;

class run_time::impl
{
public:
  //! Initialise the instance_ based on the command-line arguments
  /*! Handles the standard options as well as the environment
   *  variables and configuration file that may set them.
   */
  impl (int argc, const char *const argv[]);
  ~impl ();

  static impl *instance_;

  run_time::sequence_type args_;

  fs::path    argzero_;
  std::string command_;

  po::variables_map vm_;
  po::options_description gnu_opts_;
  po::options_description std_opts_;

  run_time::sequence_type cmd_args_;

  std::map< std::string, std::string > settings_;

  fs::path top_builddir_;
  fs::path top_srcdir_;
  bool running_in_place_() const
  {
    return !top_srcdir_.empty ();
  }

  void read_config_(const fs::path& file);

  struct unrecognize;
  struct env_var_mapper;

  static const std::string libexec_prefix_;
};

}       // namespace tsunagi

#endif  /* lib_run_time_ipp_ */
