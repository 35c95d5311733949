//  ipp.hpp -- Internet Printing Protocol request and reply model
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

#ifndef cupsconn_ipp_hpp_
#define cupsconn_ipp_hpp_

#include <map>
#include <string>
#include <vector>

namespace cupsconn {
namespace ipp {

//! The handful of IPP operations the bridge issues
enum operation {
  get_printer_attributes = 0x000B,
  get_printers           = 0x4002,  //!< CUPS extension
};

//! IPP status codes, RFC 8011 section 4.1.6 and CUPS extensions
enum status {
  ok                           = 0x0000,
  ok_ignored_or_substituted    = 0x0001,
  ok_conflicting               = 0x0002,

  error_bad_request            = 0x0400,
  error_forbidden              = 0x0401,
  error_not_authenticated      = 0x0402,
  error_not_authorized         = 0x0403,
  error_not_possible           = 0x0404,
  error_timeout                = 0x0405,
  error_not_found              = 0x0406,
  error_gone                   = 0x0407,

  error_internal               = 0x0500,
  error_operation_not_supported = 0x0501,
  error_service_unavailable    = 0x0502,
  error_device                 = 0x0504,
  error_temporary              = 0x0505,
  error_busy                   = 0x0507,
};

//! Attribute values by attribute name, all values in textual form
typedef std::map< std::string, std::vector< std::string > > attribute_map;

struct request
{
  request (operation op, const std::string& printer = std::string (),
           const std::vector< std::string >& attributes
           = std::vector< std::string > ());

  operation op;
  //! Target printer name, empty for server wide operations
  std::string printer;
  //! The requested-attributes, empty for all
  std::vector< std::string > attributes;
};

struct response
{
  response ();
  explicit response (int status);

  int status;
  //! One map per printer attribute group in the reply
  std::vector< attribute_map > groups;
};

bool is_successful (int status);

//! Readable name for a status code, "0x%04x" for unknown codes
std::string status_name (int status);

}       // namespace ipp

namespace http {

//! HTTP status codes of a conditional PPD fetch
enum status {
  ok           = 200,
  not_modified = 304,
  not_found    = 404,
};

}       // namespace http
}       // namespace cupsconn

#endif  /* cupsconn_ipp_hpp_ */
