//  connexion-pool.hpp -- gated reuse of print server sessions
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

#ifndef cupsconn_connexion_pool_hpp_
#define cupsconn_connexion_pool_hpp_

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <set>
#include <thread>

#include "connexion.hpp"

namespace cupsconn {

//! Hands out a bounded number of print server sessions
/*! At most \c max_connexions sessions are borrowed at any one time.
 *  Callers beyond that block in acquire() until a session is given
 *  back.  Returned sessions are parked for a short grace period so a
 *  waiting or subsequent caller can reuse them.  Sessions that are not
 *  picked up in time are closed by a background reaper.
 *
 *  Every session handed out is wrapped so that it reconnects itself
 *  once it is older than \c max_age.
 *
 *  A request runs entirely on the thread that borrowed the session.
 *  This matters for native APIs that keep their error state in thread
 *  local storage.
 */
class connexion_pool
{
public:
  typedef std::chrono::steady_clock clock;
  typedef std::function< connexion::ptr () > factory;

  connexion_pool (const factory& make, std::size_t max_connexions,
                  clock::duration grace, clock::duration max_age);
  ~connexion_pool ();

  //! Borrows a session, blocking while none may be handed out
  /*! Throws whatever the factory throws when a new session cannot be
   *  made.  The caller's slot is given back in that case.
   */
  connexion::ptr acquire ();

  //! Gives a healthy session back for reuse
  void release (connexion::ptr cnx);

  //! Gives a broken session's slot back and closes the session
  void discard (connexion::ptr cnx);

  //! Runs \a fn on a borrowed session, retrying once on failure
  /*! The session is given back on all exit paths.  Sessions that fail
   *  with a transport_error are closed rather than reused.  The second
   *  attempt may well use a different session.
   */
  void execute (const std::function< void (connexion&) >& fn);

  ppd_reply get_ppd (const std::string& printer, std::time_t modtime);

  //! Issues \a req, throwing server_error on an unsuccessful status
  /*! Statuses in \a acceptable are let through as well.
   */
  ipp::response request (const ipp::request& req,
                         const std::set< int >& acceptable
                         = std::set< int > ());

  std::size_t outstanding () const;
  std::size_t parked () const;

  //! Scoped session loan
  class borrowed
  {
  public:
    explicit borrowed (connexion_pool& pool);
    ~borrowed ();

    connexion& operator* () const;
    connexion *operator-> () const;

    //! Marks the session as unfit for reuse
    void spoil ();

  private:
    borrowed (const borrowed&);
    borrowed& operator= (const borrowed&);

    connexion_pool& pool_;
    connexion::ptr  cnx_;
    bool            spoilt_;
  };

private:
  struct parking_spot
  {
    connexion::ptr    cnx;
    clock::time_point deadline;
  };

  void attempt_(const std::function< void (connexion&) >& fn);
  void reap_();

  factory         make_;
  std::size_t     max_;
  clock::duration grace_;

  mutable std::mutex        mutex_;
  std::condition_variable   gate_;
  std::condition_variable   reaper_wakeup_;
  std::size_t               outstanding_;
  std::deque< parking_spot > parked_;
  bool                      stopping_;

  std::thread reaper_;
};

}       // namespace cupsconn

#endif  /* cupsconn_connexion_pool_hpp_ */
