//  printers.cpp -- print queue queries
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

#include <boost/assign/list_of.hpp>
#include <boost/foreach.hpp>

#include "cupsconn/log.hpp"
#include "cupsconn/printers.hpp"

namespace cupsconn {

std::vector< std::string >
printer_names (connexion_pool& pool)
{
  static const std::set< int > acceptable
    = boost::assign::list_of (ipp::error_not_found);

  ipp::request req (ipp::get_printers, std::string (),
                    std::vector< std::string > (1, "printer-name"));
  ipp::response rsp = pool.request (req, acceptable);

  std::vector< std::string > rv;

  // A server without queues reports "not found"
  if (ipp::error_not_found == rsp.status) return rv;

  BOOST_FOREACH (const ipp::attribute_map& group, rsp.groups)
    {
      ipp::attribute_map::const_iterator it = group.find ("printer-name");
      if (group.end () == it || it->second.empty ()) continue;

      rv.push_back (it->second.front ());
    }
  log::debug (log::POOL, "server has %1% printers") % rv.size ();

  return rv;
}

ipp::attribute_map
printer_attributes (connexion_pool& pool, const std::string& printer,
                    const std::vector< std::string >& attributes)
{
  ipp::request req (ipp::get_printer_attributes, printer, attributes);
  ipp::response rsp = pool.request (req);

  return (rsp.groups.empty () ? ipp::attribute_map () : rsp.groups.front ());
}

}       // namespace cupsconn
