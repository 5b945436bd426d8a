//  environment.hpp -- control the environment a test runs in
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

#ifndef tsunagi_test_environment_hpp_
#define tsunagi_test_environment_hpp_

#include <cstdlib>

#include <map>
#include <set>
#include <string>
#include <vector>

extern "C" {
extern char **environ;
}

namespace tsunagi {
namespace test {

//! Sanitize environment variables for testing purposes
/*! Removes all package specific environment variables and sets the
 *  locale to \c POSIX.  Whatever the fixture changed is restored when
 *  it goes out of scope.
 */
class environment
{
public:
  environment (const std::string& locale = "POSIX")
  {
    clearenv_(PACKAGE_ENV_VAR_PREFIX);
    clearenv_("LC_");
    setenv ("LANG", locale);
    unsetenv ("LANGUAGE");
  }

  ~environment ()
  {
    std::set< std::string >::const_iterator it;
    for (it = vars_set_.begin (); vars_set_.end () != it; ++it)
      {
        ::unsetenv (it->c_str ());
      }

    std::map< std::string, std::string >::const_iterator jt;
    for (jt = mod_vars_.begin (); mod_vars_.end () != jt; ++jt)
      {
        ::setenv (jt->first.c_str (), jt->second.c_str (), 1);
      }
  }

  int
  setenv (const std::string& variable, const std::string& value)
  {
    save_(variable);
    vars_set_.insert (variable);

    return ::setenv (variable.c_str (), value.c_str (), 1);
  }

  int
  unsetenv (const std::string& variable)
  {
    save_(variable);

    return ::unsetenv (variable.c_str ());
  }

private:
  void
  clearenv_(const std::string& prefix)
  {
    std::vector< std::string > names;

    for (char **p = environ; p && *p; ++p)
      {
        std::string var (*p);

        if (0 != var.compare (0, prefix.size (), prefix)) continue;
        names.push_back (var.substr (0, var.find ('=')));
      }

    for (size_t i = 0; i < names.size (); ++i)
      {
        unsetenv (names[i]);
      }
  }

  void
  save_(const std::string& variable)
  {
    const char *value (::getenv (variable.c_str ()));

    if (value && !mod_vars_.count (variable))
      mod_vars_[variable] = value;
  }

  std::map< std::string, std::string > mod_vars_;
  std::set< std::string > vars_set_;
};

}       // namespace test
}       // namespace tsunagi

#endif  /* tsunagi_test_environment_hpp_ */
