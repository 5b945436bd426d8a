//  fake-driver.cpp -- loadable driver module on top of a scripted library
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

#include "tsunagi/test/fake-library.hpp"

extern "C" {

//! A fake library with a single flatbed scanner
void
libdrv_fake_LTX_library_factory (tsunagi::native::library::ptr& lib)
{
  namespace native = tsunagi::native;

  tsunagi::test::fake_library::ptr fake
    (tsunagi::make_shared< tsunagi::test::fake_library > ());
  fake->devices.push_back
    (tsunagi::test::make_device (native::property::capability::flatbed, 0));
  lib = fake;
}

}       // extern "C"
