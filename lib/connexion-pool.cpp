//  connexion-pool.cpp -- gated reuse of print server sessions
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

#include <vector>

#include <boost/throw_exception.hpp>

#include "cupsconn/connexion-pool.hpp"
#include "cupsconn/exception.hpp"
#include "cupsconn/format.hpp"
#include "cupsconn/log.hpp"

#include "connexions/aging.hpp"

namespace cupsconn {

namespace {

  connexion::ptr
  make_aging (const connexion_pool::factory& make,
              connexion_pool::clock::duration max_age)
  {
    connexion::ptr cnx (make ());
    if (!cnx)
      BOOST_THROW_EXCEPTION (transport_error ("no connexion created"));

    return std::make_shared< _cnx_::aging > (cnx, max_age);
  }
}       // namespace

connexion_pool::connexion_pool (const factory& make,
                                std::size_t max_connexions,
                                clock::duration grace,
                                clock::duration max_age)
  : make_(std::bind (make_aging, make, max_age))
  , max_(max_connexions)
  , grace_(grace)
  , outstanding_(0)
  , stopping_(false)
{
  if (0 == max_)
    BOOST_THROW_EXCEPTION
      (std::invalid_argument ("connexion pool needs at least one slot"));

  reaper_ = std::thread (&connexion_pool::reap_, this);
}

connexion_pool::~connexion_pool ()
{
  {
    std::lock_guard< std::mutex > lock (mutex_);
    stopping_ = true;
  }
  reaper_wakeup_.notify_one ();
  reaper_.join ();

  if (!parked_.empty ())
    log::debug (log::POOL, "closing %1% parked connexions") % parked_.size ();
  parked_.clear ();
}

connexion::ptr
connexion_pool::acquire ()
{
  std::unique_lock< std::mutex > lock (mutex_);

  gate_.wait (lock, [this] { return outstanding_ < max_; });
  ++outstanding_;

  if (!parked_.empty ())
    {
      connexion::ptr cnx = parked_.back ().cnx;
      parked_.pop_back ();
      return cnx;
    }

  lock.unlock ();
  try
    {
      connexion::ptr cnx (make_());
      log::debug (log::POOL, "opened a new connexion");
      return cnx;
    }
  catch (...)
    {
      lock.lock ();
      --outstanding_;
      lock.unlock ();
      gate_.notify_one ();
      throw;
    }
}

void
connexion_pool::release (connexion::ptr cnx)
{
  {
    std::lock_guard< std::mutex > lock (mutex_);
    --outstanding_;

    parking_spot spot;
    spot.cnx = cnx;
    spot.deadline = clock::now () + grace_;
    parked_.push_back (spot);
  }
  gate_.notify_one ();
  reaper_wakeup_.notify_one ();
}

void
connexion_pool::discard (connexion::ptr cnx)
{
  {
    std::lock_guard< std::mutex > lock (mutex_);
    --outstanding_;
  }
  gate_.notify_one ();

  log::debug (log::POOL, "closing a broken connexion");
  cnx.reset ();
}

void
connexion_pool::execute (const std::function< void (connexion&) >& fn)
{
  try
    {
      attempt_(fn);
      return;
    }
  catch (const error& e)
    {
      log::brief (log::POOL, "retrying request: %1%") % e.what ();
    }
  attempt_(fn);
}

ppd_reply
connexion_pool::get_ppd (const std::string& printer, std::time_t modtime)
{
  ppd_reply rv;

  execute ([&] (connexion& cnx)
           {
             rv = cnx.get_ppd (printer, modtime);
           });
  return rv;
}

ipp::response
connexion_pool::request (const ipp::request& req,
                         const std::set< int >& acceptable)
{
  ipp::response rv;

  execute ([&] (connexion& cnx)
           {
             rv = cnx.request (req);
             if (!ipp::is_successful (rv.status)
                 && !acceptable.count (rv.status))
               BOOST_THROW_EXCEPTION
                 (server_error (rv.status,
                                (format ("IPP request 0x%1$04x failed: %2%")
                                 % req.op % ipp::status_name (rv.status))
                                .str ()));
           });
  return rv;
}

std::size_t
connexion_pool::outstanding () const
{
  std::lock_guard< std::mutex > lock (mutex_);
  return outstanding_;
}

std::size_t
connexion_pool::parked () const
{
  std::lock_guard< std::mutex > lock (mutex_);
  return parked_.size ();
}

void
connexion_pool::attempt_(const std::function< void (connexion&) >& fn)
{
  borrowed cnx (*this);

  try
    {
      fn (*cnx);
    }
  catch (const transport_error&)
    {
      cnx.spoil ();
      throw;
    }
}

//! Closes parked sessions once their grace period has run out
void
connexion_pool::reap_()
{
  std::unique_lock< std::mutex > lock (mutex_);

  while (!stopping_)
    {
      if (parked_.empty ())
        {
          reaper_wakeup_.wait (lock);
          continue;
        }

      reaper_wakeup_.wait_until (lock, parked_.front ().deadline);

      std::vector< connexion::ptr > expired;
      clock::time_point now = clock::now ();
      while (!parked_.empty () && parked_.front ().deadline <= now)
        {
          expired.push_back (parked_.front ().cnx);
          parked_.pop_front ();
        }

      if (expired.empty ()) continue;

      lock.unlock ();
      log::debug (log::POOL, "closing %1% idle connexions") % expired.size ();
      expired.clear ();
      lock.lock ();
    }
}

connexion_pool::borrowed::borrowed (connexion_pool& pool)
  : pool_(pool), cnx_(pool.acquire ()), spoilt_(false)
{}

connexion_pool::borrowed::~borrowed ()
{
  if (spoilt_)
    pool_.discard (cnx_);
  else
    pool_.release (cnx_);
}

connexion&
connexion_pool::borrowed::operator* () const
{
  return *cnx_;
}

connexion *
connexion_pool::borrowed::operator-> () const
{
  return cnx_.get ();
}

void
connexion_pool::borrowed::spoil ()
{
  spoilt_ = true;
}

}       // namespace cupsconn
