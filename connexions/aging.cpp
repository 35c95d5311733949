//  aging.cpp -- reconnects sessions that have grown stale
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

#include <cupsconn/log.hpp>

#include "aging.hpp"

namespace cupsconn {
namespace _cnx_ {

aging::aging (connexion::ptr instance, clock::duration max_age)
  : base_(instance), max_age_(max_age), born_(clock::now ())
{}

ppd_reply
aging::get_ppd (const std::string& printer, std::time_t modtime)
{
  check_age_();
  return instance_->get_ppd (printer, modtime);
}

ipp::response
aging::request (const ipp::request& req)
{
  check_age_();
  return instance_->request (req);
}

void
aging::reconnect ()
{
  instance_->reconnect ();
  born_ = clock::now ();
}

void
aging::check_age_()
{
  clock::duration age = clock::now () - born_;

  if (age < max_age_) return;

  log::debug (log::POOL, "reconnecting session after %1%ms")
    % std::chrono::duration_cast< std::chrono::milliseconds > (age).count ();

  reconnect ();
}

} // namespace _cnx_
} // namespace cupsconn
