//  native-library.cpp -- native driver library plug-in support
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

#include <ltdl.h>

#include <cstdlib>
#include <stdexcept>

#include <boost/algorithm/string.hpp>
#include <boost/foreach.hpp>

#include <boost/filesystem.hpp>
#include <boost/throw_exception.hpp>

#include "tsunagi/log.hpp"
#include "tsunagi/native-library.hpp"
#include "tsunagi/run-time.hpp"

namespace tsunagi {
namespace native {

using std::runtime_error;
using boost::filesystem::path;

std::string
to_string (api_version v)
{
  /**/ if (legacy  == v) return "legacy";
  else if (current == v) return "current";
  return "default";
}

api_version
to_api_version (const std::string& name)
{
  /**/ if ("legacy"  == name) return legacy;
  else if ("current" == name) return current;
  else if ("default" == name) return default_version;

  BOOST_THROW_EXCEPTION
    (std::invalid_argument ("unknown API version: '" + name + "'"));
}

std::set< status >
to_status_set (const std::string& list)
{
  std::vector< std::string > entries;
  boost::algorithm::split (entries, list, boost::algorithm::is_any_of (","));

  std::set< status > rv;
  BOOST_FOREACH (std::string& entry, entries)
    {
      boost::algorithm::trim (entry);
      if (entry.empty ()) continue;

      char *end = nullptr;
      long long v = std::strtoll (entry.c_str (), &end, 0);
      if (*end)
        BOOST_THROW_EXCEPTION
          (std::invalid_argument ("not a status: '" + entry + "'"));
      rv.insert (status (v));
    }
  return rv;
}

attributes::attributes ()
  : kind (none)
  , editable (false)
  , min (0)
  , max (0)
  , step (0)
{}

bool
attributes::is_range () const
{
  return range == kind;
}

bool
attributes::is_list () const
{
  return list == kind;
}

property_value::property_value ()
  : id (property::id (0))
  , value (0)
{}

typedef void (*library_factory) (library::ptr&);

static std::string
dl_error ()
{
  const char *msg = lt_dlerror ();
  return (msg ? msg : "unknown error");
}

static library_factory
get_library_factory (const lt_dlhandle& handle)
{
  return reinterpret_cast< library_factory > (lt_dlsym
                                              (handle, "library_factory"));
}

library::ptr
library::create (const std::string& driver_kind)
{
  std::string plugin = "libdrv-" + driver_kind;

  lt_dlhandle handle = NULL;
  library_factory factory = 0;
  std::string error ("driver not found");

  lt_dlinit ();

  log::brief ("looking for preloaded '%1%' driver") % driver_kind;

  lt_dladvise advice;
  lt_dladvise_init (&advice);
  lt_dladvise_preload (&advice);
  lt_dladvise_ext (&advice);

  handle = lt_dlopenadvise (plugin.c_str (), advice);

  if (handle)
    {
      factory = get_library_factory (handle);
      if (factory)
        {
          log::brief ("using preloaded '%1%' driver") % driver_kind;
        }
      else
        {
          lt_dlclose (handle);
          handle = NULL;
        }
    }
  lt_dladvise_destroy (&advice);

  if (!factory)                 // the user and system search paths
    {
      handle = lt_dlopenext (plugin.c_str ());
      if (handle)
        {
          factory = get_library_factory (handle);
          if (factory)
            {
              log::brief ("using '%1%' from the search path") % plugin;
            }
          else
            {
              lt_dlclose (handle);
              handle = NULL;
            }
        }
    }

  if (!factory)                 // trawl the file system
    {
      run_time rt;
      run_time::sequence_type search (rt.load_dirs (run_time::pkg, "driver"));

      run_time::sequence_type::const_iterator it;
      for (it = search.begin (); !handle && it != search.end (); ++it)
        {
          path p (*it);

          log::brief ("looking for '%1%' driver in '%2%'")
            % driver_kind
            % p.string ()
            ;

          p /= plugin;

          handle = lt_dlopenext (p.string ().c_str ());

          if (handle)
            {
              factory = get_library_factory (handle);

              if (factory)
                {
                  log::brief ("using '%1%'") % p.string ();
                }
              else
                {
                  error = dl_error ();
                  lt_dlclose (handle);
                  handle = NULL;
                }
            }
          else
            {
              error = dl_error ();
            }
        }
    }

  if (!factory) BOOST_THROW_EXCEPTION (runtime_error (error));

  library::ptr rv;
  factory (rv);
  if (!rv)
    BOOST_THROW_EXCEPTION
      (runtime_error (driver_kind + ": driver failed to initialize"));

  return rv;
}

bool
library::probe (const std::string& module)
{
  if (module.empty ()) return true;

  lt_dlinit ();

  bool rv = false;
  lt_dlhandle handle = lt_dlopenext (module.c_str ());

  if (handle)
    {
      log::brief ("%1%: loadable") % module;
      lt_dlclose (handle);
      rv = true;
    }
  else
    {
      log::brief ("%1%: %2%") % module % dl_error ();
    }
  lt_dlexit ();

  return rv;
}

}       // namespace native
}       // namespace tsunagi
