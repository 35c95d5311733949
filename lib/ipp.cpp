//  ipp.cpp -- Internet Printing Protocol request and reply model
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

#include "cupsconn/ipp.hpp"
#include "cupsconn/format.hpp"

namespace cupsconn {
namespace ipp {

request::request (operation op, const std::string& printer,
                  const std::vector< std::string >& attributes)
  : op (op), printer (printer), attributes (attributes)
{}

response::response ()
  : status (ok)
{}

response::response (int status)
  : status (status)
{}

bool
is_successful (int status)
{
  return (0x0000 <= status && status < 0x0100);
}

std::string
status_name (int status)
{
  switch (status)
    {
    case ok:                            return "successful-ok";
    case ok_ignored_or_substituted:     return "successful-ok-ignored-or-substituted-attributes";
    case ok_conflicting:                return "successful-ok-conflicting-attributes";
    case error_bad_request:             return "client-error-bad-request";
    case error_forbidden:               return "client-error-forbidden";
    case error_not_authenticated:       return "client-error-not-authenticated";
    case error_not_authorized:          return "client-error-not-authorized";
    case error_not_possible:            return "client-error-not-possible";
    case error_timeout:                 return "client-error-timeout";
    case error_not_found:               return "client-error-not-found";
    case error_gone:                    return "client-error-gone";
    case error_internal:                return "server-error-internal-error";
    case error_operation_not_supported: return "server-error-operation-not-supported";
    case error_service_unavailable:     return "server-error-service-unavailable";
    case error_device:                  return "server-error-device-error";
    case error_temporary:               return "server-error-temporary-error";
    case error_busy:                    return "server-error-busy";
    }
  return (format ("0x%04x") % status).str ();
}

}       // namespace ipp
}       // namespace cupsconn
