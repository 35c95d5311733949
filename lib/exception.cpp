//  exception.cpp -- error conditions of the print server bridge
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

#include "cupsconn/exception.hpp"

namespace cupsconn {

error::error (const std::string& message)
  : std::runtime_error (message)
{}

transport_error::transport_error (const std::string& message)
  : error (message)
{}

server_error::server_error (int code, const std::string& message)
  : error (message), code_(code)
{}

int
server_error::code () const
{
  return code_;
}

resource_error::resource_error (const std::string& message)
  : error (message)
{}

}       // namespace cupsconn
