//  aging.hpp -- reconnects sessions that have grown stale
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

#ifndef connexions_aging_hpp_
#define connexions_aging_hpp_

#include <chrono>

#include <cupsconn/connexion.hpp>

namespace cupsconn {
namespace _cnx_ {

//! Transparently reconnect sessions older than a maximum age
/*! The print server drops sessions it considers idle for too long
 *  and the first request on such a session fails.  Re-establishing
 *  the session ahead of time avoids that failure.
 */
class aging
  : public decorator< connexion >
{
public:
  typedef std::chrono::steady_clock clock;

  aging (connexion::ptr instance, clock::duration max_age);

  virtual ppd_reply get_ppd (const std::string& printer, std::time_t modtime);
  virtual ipp::response request (const ipp::request& req);
  virtual void reconnect ();

protected:
  void check_age_();

  clock::duration   max_age_;
  clock::time_point born_;
};

} // namespace _cnx_
} // namespace cupsconn

#endif  /* connexions_aging_hpp_ */
