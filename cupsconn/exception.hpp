//  exception.hpp -- error conditions of the print server bridge
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

#ifndef cupsconn_exception_hpp_
#define cupsconn_exception_hpp_

#include <stdexcept>
#include <string>

namespace cupsconn {

//! Base for all conditions the library reports by throwing
class error
  : public std::runtime_error
{
public:
  explicit error (const std::string& message);
};

//! Connexion refused, timed out or otherwise unusable session
class transport_error
  : public error
{
public:
  explicit transport_error (const std::string& message);
};

//! The print server answered but signalled failure
/*! The server's own status code is kept for the caller's benefit.
 *  For conditional PPD requests this is an HTTP status, for IPP
 *  requests an IPP status code.
 */
class server_error
  : public error
{
public:
  server_error (int code, const std::string& message);

  int code () const;

private:
  int code_;
};

//! Local file system trouble, such as a failed write
class resource_error
  : public error
{
public:
  explicit resource_error (const std::string& message);
};

}       // namespace cupsconn

#endif  /* cupsconn_exception_hpp_ */
