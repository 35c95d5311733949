//  cups.hpp -- print server sessions through libcups
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

#ifndef connexions_cups_hpp_
#define connexions_cups_hpp_

#include <cups/cups.h>

#include <chrono>
#include <string>

#include <cupsconn/connexion.hpp>

namespace cupsconn {
namespace _cnx_ {

//! A session with a CUPS server
/*! An empty \a server or a zero \a port select whatever the client
 *  configuration (environment, client.conf) says.  The encryption
 *  policy always comes from the client configuration.
 *
 *  Errors are read back with cupsLastError() on the thread that made
 *  the failing call, immediately after that call.
 */
class cups
  : public connexion
{
public:
  cups (const std::string& server, int port,
        std::chrono::steady_clock::duration timeout);
  virtual ~cups ();

  virtual ppd_reply get_ppd (const std::string& printer, std::time_t modtime);
  virtual ipp::response request (const ipp::request& req);
  virtual void reconnect ();

private:
  cups (const cups&);
  cups& operator= (const cups&);

  std::string       host_;
  int               port_;
  int               timeout_ms_;
  http_encryption_t encryption_;
  http_t           *http_;
};

//! Whether a failed PPD fetch means the session itself is unusable
/*! HTTP_STATUS_ERROR is what libcups reports for socket failures and
 *  IPP_STATUS_ERROR_SERVICE_UNAVAILABLE for a server that went away.
 *  Everything else is an answer from a working server.
 */
bool lost_session (http_status_t status, ipp_status_t err);

} // namespace _cnx_
} // namespace cupsconn

#endif  /* connexions_cups_hpp_ */
