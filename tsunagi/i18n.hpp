//  i18n.hpp -- internationalisation support
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

#ifndef tsunagi_i18n_hpp_
#define tsunagi_i18n_hpp_

/*! \file
 *  \brief C++ wrappers for the \c libintl.h functionality we use
 *
 *  Honours the \c ENABLE_NLS preprocessor macro.  Define it to a \c
 *  true value before including this file to enable national language
 *  support.  For @PACKAGE_NAME@ this is achieved by including the \c
 *  config.h file.  The common markup keywords _() and N_() are
 *  supported as well.
 */

#include <libintl.h>

#include <string>

#ifndef ENABLE_NLS
#define ENABLE_NLS 0
#endif

#ifndef DEFAULT_TEXT_DOMAIN
#define DEFAULT_TEXT_DOMAIN NULL
#endif

namespace tsunagi {

static const char *default_text_domain (DEFAULT_TEXT_DOMAIN);

enum { i18n = 1 };

inline
const char *
gettext (const char *msgid)
{
  return (ENABLE_NLS
          ? ::dgettext (default_text_domain, msgid)
          : msgid);
}

inline
const char *
textdomain ()
{
  return (ENABLE_NLS
          ? ::textdomain (default_text_domain)
          : default_text_domain);
}

inline
const char *
bindtextdomain (const char *dirname)
{
  return (ENABLE_NLS
          ? ::bindtextdomain (default_text_domain, dirname)
          : dirname);
}

inline
const char *
_(const std::string& msgid)
{
  return gettext (msgid.c_str ());
}

inline
const char *
_(const char *msgid)
{
  return gettext (msgid);
}

inline
const char *
N_(const char *msgid)
{
  return msgid;
}

#define CCB_     _              /* Community Code Base */
#define CCB_N_  N_

}       // namespace tsunagi

#endif  /* tsunagi_i18n_hpp_ */
