//  run-time.cpp -- information about a program's run-time environment
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

#include <clocale>
#include <cstdlib>
#include <ltdl.h>

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <vector>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/filesystem.hpp>
#include <boost/foreach.hpp>
#include <boost/program_options.hpp>
#include <boost/throw_exception.hpp>

#include "tsunagi/format.hpp"
#include "tsunagi/i18n.hpp"
#include "tsunagi/log.hpp"

#include "run-time.ipp"

#define DEFAULT_WORKER_TIMEOUT 30.0

namespace tsunagi {

namespace fs = boost::filesystem;
namespace po = boost::program_options;

using std::logic_error;
using std::runtime_error;

run_time::impl *run_time::impl::instance_(0);

const std::string run_time::impl::libexec_prefix_(PACKAGE_TARNAME "-");

run_time::run_time (int argc, const char *const argv[], bool configure_i18n)
{
  if (impl::instance_)
    BOOST_THROW_EXCEPTION
      (logic_error ("run_time has been initialized already"));

  if (configure_i18n)
    {
      const char *dirname = getenv (PACKAGE_ENV_VAR_PREFIX "LOCALEDIR");

      if (!dirname) dirname = LOCALEDIR;

      setlocale (LC_ALL, "");
      bindtextdomain (dirname);
      textdomain ();
    }

  impl::instance_ = new impl (argc, argv);
}

run_time::run_time ()
{
  if (!impl::instance_)
    BOOST_THROW_EXCEPTION
      (logic_error ("run_time has not been initialized yet"));
}

std::string
run_time::program () const
{
  return PACKAGE_TARNAME;
}

std::string
run_time::command () const
{
  return impl::instance_->command_;
}

const run_time::sequence_type&
run_time::arguments () const
{
  return impl::instance_->cmd_args_;
}

/*! An explicit \c worker-dir wins.  Otherwise installed programs look
 *  in PKGLIBEXECDIR and programs running in place in the top build
 *  directory.
 */
std::string
run_time::locate (const std::string& command) const
{
  fs::path rv;

  /**/ if (count ("worker-dir"))
    {
      rv = fs::path ((*this)["worker-dir"].as< std::string > ()) / command;
    }
  else if (!running_in_place ())
    {
      rv = fs::path (PKGLIBEXECDIR) / command;
    }
  else
    {
      rv = impl::instance_->top_builddir_ / command;
    }

  if (!fs::exists (rv))
    log::trace ("%1%: no such file") % rv.string ();

  return rv.string ();
}

run_time::size_type
run_time::count (const std::string& option) const
{
  return impl::instance_->vm_.count (option);
}

const run_time::value_type&
run_time::operator[] (const std::string& option) const
{
  return impl::instance_->vm_[option];
}

std::string
run_time::setting (const std::string& key) const
{
  std::map< std::string, std::string >::const_iterator
    it (impl::instance_->settings_.find (key));

  return (impl::instance_->settings_.end () != it
          ? it->second
          : std::string ());
}

double
run_time::worker_timeout () const
{
  return (*this)["worker-timeout"].as< double > ();
}

std::string
run_time::help (const std::string& summary) const
{
  format fmt (!command ().empty ()
              ? "%1% %2% -- %3%\n"
              : "%1% -- %3%\n");
  return (fmt
          % program ()
          % command ()
          % summary).str ();
}

std::string
run_time::version (const std::string& legalese,
                   const std::string& disclaimer) const
{
  // This string should NOT be translated
  static const std::string default_legalese
    ("Copyright (C) 2012-2015  SEIKO EPSON CORPORATION\n"
     "License: GPL-3.0+");

  format fmt (!command ().empty ()
              ? "%1% %2% (%3%) %4%\n%5%\n%6%\n"
              : "%1% (%3%) %4%\n%5%\n%6%\n");
  return (fmt
          % program ()
          % command ()
          % PACKAGE_NAME
          % PACKAGE_VERSION
          % (legalese.empty ()
             ? default_legalese
             : legalese)
          % disclaimer).str ();
}

run_time::sequence_type
run_time::load_dirs (scope s, const std::string& component) const
{
  sequence_type rv;

  if (!running_in_place ())
    {
      /**/ if (pkg == s)
        {
          rv.push_back (fs::path (PKGLIBDIR).string ());
        }
      else
        {
          log::alert ("unsupported scope: %1%") % s;
        }
    }
  else
    {
      /**/ if ("driver" == component)
        {
          rv.push_back ((impl::instance_->top_builddir_
                         / "drivers").string ());
          rv.push_back (impl::instance_->top_builddir_.string ());
        }
      else
        {
          log::alert ("unsupported component: %1%") % component;
        }
    }

  return rv;
}

std::string
run_time::conf_file (scope s, const std::string& name) const
{
  fs::path rv;

  if (!running_in_place ())
    {
      /**/ if (pkg == s || sys == s)
        {
          rv = fs::path (PKGSYSCONFDIR) / name;
        }
      else if (usr == s)
        {
          const char *home = getenv ("HOME");
          if (home)
            rv = fs::path (home) / ".config" / PACKAGE_TARNAME / name;
        }
      else
        {
          log::alert ("unsupported scope: %1%") % s;
        }
    }
  else
    {
      rv = impl::instance_->top_srcdir_ / "lib" / name;
      if (!fs::exists (rv))
        rv = impl::instance_->top_srcdir_ / name;
    }

  if (!fs::exists (rv))
    log::trace ("%1%: no such file") % rv.string ();

  return rv.string ();
}

bool
run_time::running_in_place () const
{
  return impl::instance_->running_in_place_();
}

static
bool
is_option (const std::string& s)
{
  return (0 == s.find ("-"));
}

struct run_time::impl::unrecognize
{
  bool found_first_;

  unrecognize (const std::vector< po::option >::iterator& it)
    : found_first_(false)
  {
    if (std::vector< po::option >::iterator () != it)
      operator() (*it);
  }

  po::option
  operator() (po::option& item)
  {
    found_first_ |= item.string_key.empty ();
    found_first_ |= item.unregistered;
    item.unregistered = found_first_;

    return item;
  }
};

//! Turn TSUNAGI_WORKER_TIMEOUT into worker-timeout
struct run_time::impl::env_var_mapper
{
  po::options_description opts_;

  enum { approx = true, exact = false };

  env_var_mapper (const po::options_description& opts)
    : opts_(opts)
  {}

  std::string
  operator() (const std::string& env_var)
  {
    static const std::string prefix (PACKAGE_ENV_VAR_PREFIX);

    if (0 != env_var.find (prefix))
      return std::string ();

    std::string option (env_var.substr (prefix.length ()));
    boost::algorithm::to_lower (option);
    boost::algorithm::replace_all (option, "_", "-");

    if (opts_.find_nothrow (option, exact))
      return option;

    return std::string ();
  }
};

void
run_time::impl::read_config_(const fs::path& file)
{
  std::ifstream is (file.string ().c_str ());

  if (!is)
    {
      BOOST_THROW_EXCEPTION
        (runtime_error ((format ("%1%: cannot open") % file.string ())
                        .str ()));
    }

  po::parsed_options parsed
    (po::parse_config_file (is, std_opts_, true));

  po::store (parsed, vm_);

  BOOST_FOREACH (const po::option& opt, parsed.options)
    {
      if (!opt.unregistered || opt.value.empty ()) continue;

      settings_[opt.string_key] = opt.value.front ();
      log::debug ("%1%: %2% = %3%")
        % file.string () % opt.string_key % opt.value.front ();
    }
}

run_time::impl::impl (int argc, const char *const argv[])
  : gnu_opts_(CCB_("GNU standard options"))
  , std_opts_(CCB_("Standard options"))
{
  lt_dlinit ();

  const char *srcdir (getenv ("srcdir"));
  if (srcdir)
    {
      // Set up run-in-place support
      // We search for known source and build tree files from suitable
      // starting points and walk up the file system tree until there
      // is a match.

      fs::path src (fs::absolute (srcdir));

      while (!src.empty ()
             && !fs::exists (src / "lib" / "tests" / "run-time.cpp"))
        {
          src = src.parent_path ();
        }
      top_srcdir_ = src;

      if (top_srcdir_.empty ())
        {
          log::alert ("not in a source tree: %1%") % srcdir;
        }

      fs::path obj (fs::absolute ("."));

      while (!obj.empty ()
             && !fs::exists (obj / "CMakeCache.txt"))
        {
          obj = obj.parent_path ();
        }
      top_builddir_ = obj;

      if (top_builddir_.empty ())
        {
          log::alert ("not in a build tree");
        }
    }

  argzero_ = argv[0];

  args_.resize (argc - 1);
  std::copy (argv + 1, argv + argc, args_.begin ());

  gnu_opts_
    .add_options ()
    ("help"   , CCB_("display this help and exit"))
    ("version", CCB_("output version information and exit"))
    ;

  std_opts_
    .add_options ()
    ("log-level", po::value< std::string > (),
     CCB_("only log messages of this priority or higher\n"
          "One of fatal, alert, error, brief, trace or debug"))
    ("config", po::value< std::string > (),
     CCB_("read settings from this file"))
    ("driver", po::value< std::string > ()->default_value ("sane"),
     CCB_("kind of native driver library to use"))
    ("api-version", po::value< std::string > ()->default_value ("default"),
     CCB_("native API version: default, legacy or current"))
    ("worker-dir", po::value< std::string > (),
     CCB_("look for worker programs in this directory"))
    ("worker-timeout", (po::value< double > ()
                        -> default_value (DEFAULT_WORKER_TIMEOUT)),
     CCB_("seconds to wait for a worker before giving up on it"))
    ;

  po::options_description cli_args;
  cli_args
    .add (gnu_opts_)
    .add (std_opts_)
    ;

  po::parsed_options cmd_line (po::command_line_parser (args_)
                               .options (cli_args)
                               .allow_unregistered ()
                               .run ());

  std::transform (cmd_line.options.begin (), cmd_line.options.end (),
                  cmd_line.options.begin (),
                  unrecognize (cmd_line.options.begin ()));

  po::store (cmd_line, vm_);
  po::store (po::parse_environment (std_opts_, env_var_mapper (std_opts_)),
             vm_);

  fs::path conf;
  if (vm_.count ("config"))
    {
      conf = vm_["config"].as< std::string > ();
      read_config_(conf);
    }
  else
    {
      fs::path sys (running_in_place_()
                    ? top_srcdir_ / PACKAGE_TARNAME ".conf"
                    : fs::path (PKGSYSCONFDIR) / PACKAGE_TARNAME ".conf");

      if (fs::exists (sys)) read_config_(sys);
    }

  po::notify (vm_);

  if (vm_.count ("log-level"))
    {
      log::threshold
        = log::to_priority (vm_["log-level"].as< std::string > ());
    }

  cmd_args_ = po::collect_unrecognized (cmd_line.options,
                                        po::include_positional);

  std::string cmd_name (argzero_.stem ().string ());

  if (0 == cmd_name.find (libexec_prefix_))
    cmd_name.erase (0, libexec_prefix_.length ());
  if (!(PACKAGE_TARNAME == cmd_name || "main" == cmd_name))
    command_ = cmd_name;

  if (command_.empty ())
    {
      if (!cmd_args_.empty ()
          && !is_option (cmd_args_.front ()))
        {
          command_ = cmd_args_.front ();
          cmd_args_.erase (cmd_args_.begin ());
        }
    }
}

run_time::impl::~impl ()
{
  lt_dlexit ();
}

}       // namespace tsunagi
