//  connexion.cpp -- one session with the print server
//  Copyright (C) 2026  The cupsconn authors
//
//  License: GPL-3.0+
//
//  This file is part of the 'cupsconn' package.
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

#include "cupsconn/connexion.hpp"

namespace cupsconn {

ppd_reply::ppd_reply ()
  : modified (false), modtime (0)
{}

ppd_reply::ppd_reply (const std::string& filename, std::time_t modtime)
  : modified (true), filename (filename), modtime (modtime)
{}

decorator< connexion >::decorator (ptr instance)
  : instance_(instance)
{}

ppd_reply
decorator< connexion >::get_ppd (const std::string& printer,
                                 std::time_t modtime)
{
  return instance_->get_ppd (printer, modtime);
}

ipp::response
decorator< connexion >::request (const ipp::request& req)
{
  return instance_->request (req);
}

void
decorator< connexion >::reconnect ()
{
  instance_->reconnect ();
}

}       // namespace cupsconn
