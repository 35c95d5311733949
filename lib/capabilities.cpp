//  capabilities.cpp -- printer capabilities from cached PPDs
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

#include <fstream>
#include <iterator>

#include <boost/throw_exception.hpp>

#include "cupsconn/capabilities.hpp"
#include "cupsconn/exception.hpp"
#include "cupsconn/format.hpp"
#include "cupsconn/log.hpp"
#include "cupsconn/translate.hpp"

namespace cupsconn {

std::string
read_ppd (const std::string& path)
{
  std::ifstream is (path.c_str (), std::ios::binary);
  if (!is)
    BOOST_THROW_EXCEPTION
      (resource_error ((format ("%1%: cannot open") % path).str ()));

  std::string rv ((std::istreambuf_iterator< char > (is)),
                  std::istreambuf_iterator< char > ());
  if (is.bad ())
    BOOST_THROW_EXCEPTION
      (resource_error ((format ("%1%: read error") % path).str ()));

  return rv;
}

capability_source::capability_source (ppd_cache& cache)
  : cache_(cache)
{}

capabilities
capability_source::get (const std::string& printer)
{
  ppd_file file = cache_.refresh (printer);

  {
    std::lock_guard< std::mutex > lock (mutex_);
    std::map< std::string, capabilities >::const_iterator it
      = translated_.find (printer);
    if (translated_.end () != it && file.hash == it->second.hash)
      return it->second;
  }

  translation t = translate_ppd (read_ppd (file.path));

  capabilities rv;
  rv.description  = t.description;
  rv.manufacturer = t.manufacturer;
  rv.model        = t.model;
  rv.hash         = file.hash;

  log::brief (log::PPD, "%1%: translated PPD for %2% %3%")
    % printer % rv.manufacturer % rv.model;

  // An invalidate() that ran while we were translating has already
  // dropped the cache entry.  Holding mutex_ across the lookup orders
  // us before the memo erase of any invalidate() still in progress.
  std::lock_guard< std::mutex > lock (mutex_);
  if (cache_.lookup (printer))
    translated_[printer] = rv;

  return rv;
}

void
capability_source::invalidate (const std::string& printer)
{
  cache_.invalidate (printer);

  std::lock_guard< std::mutex > lock (mutex_);
  translated_.erase (printer);
}

std::size_t
capability_source::size () const
{
  std::lock_guard< std::mutex > lock (mutex_);
  return translated_.size ();
}

}       // namespace cupsconn
