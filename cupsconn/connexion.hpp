//  connexion.hpp -- one session with the print server
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

#ifndef cupsconn_connexion_hpp_
#define cupsconn_connexion_hpp_

#include <ctime>
#include <memory>
#include <string>

#include "ipp.hpp"
#include "pattern/decorator.hpp"

namespace cupsconn {

//! Outcome of a conditional PPD request
struct ppd_reply
{
  ppd_reply ();
  ppd_reply (const std::string& filename, std::time_t modtime);

  //! False when the server reports the PPD unchanged since \c modtime
  bool modified;
  //! Server provided temporary copy, the caller owns and removes it
  std::string filename;
  //! New modification marker to condition the next request on
  std::time_t modtime;
};

//! An open session with the print server
/*! Sessions are not thread-safe.  A single request runs to completion
 *  on the calling thread, which is also where any error state of the
 *  underlying API is retrieved.  Destruction closes the session.
 */
class connexion
{
public:
  typedef std::shared_ptr< connexion > ptr;

  virtual ~connexion () {}

  //! Fetches the PPD for \a printer unless unchanged since \a modtime
  /*! Throws server_error carrying the HTTP status when the server
   *  signals failure and transport_error when it cannot be reached.
   */
  virtual ppd_reply get_ppd (const std::string& printer,
                             std::time_t modtime) = 0;

  //! Issues a generic IPP request
  /*! The response status is reported as is, deciding whether it is
   *  acceptable is up to the caller.
   */
  virtual ipp::response request (const ipp::request& req) = 0;

  //! Re-establishes the session
  virtual void reconnect () = 0;
};

template<>
class decorator< connexion >
  : public connexion
{
public:
  typedef std::shared_ptr< connexion > ptr;

  decorator (ptr instance);

  virtual ppd_reply get_ppd (const std::string& printer, std::time_t modtime);
  virtual ipp::response request (const ipp::request& req);
  virtual void reconnect ();

protected:
  typedef decorator base_;

  ptr instance_;
};

}       // namespace cupsconn

#endif  /* cupsconn_connexion_hpp_ */
