//  capabilities.hpp -- printer capabilities from cached PPDs
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

#ifndef cupsconn_capabilities_hpp_
#define cupsconn_capabilities_hpp_

#include <cstddef>
#include <map>
#include <mutex>
#include <string>

#include "cdd.hpp"
#include "ppd-cache.hpp"

namespace cupsconn {

struct capabilities
{
  cdd::printer_description description;
  std::string              manufacturer;
  std::string              model;
  //! Content hash of the PPD the description was derived from
  std::string              hash;
};

//! Entry point for the printer synchronisation loop
/*! Keeps the PPD cache fresh and turns PPDs into descriptions.  A PPD
 *  is only translated again when its content hash changed.
 */
class capability_source
{
public:
  explicit capability_source (ppd_cache& cache);

  capabilities get (const std::string& printer);

  //! Forgets all about \a printer, for instance after it was removed
  void invalidate (const std::string& printer);

  //! Number of printers with a remembered translation
  std::size_t size () const;

private:
  ppd_cache& cache_;

  mutable std::mutex                    mutex_;
  std::map< std::string, capabilities > translated_;
};

//! Reads a whole PPD file, throwing a resource_error on failure
std::string read_ppd (const std::string& path);

}       // namespace cupsconn

#endif  /* cupsconn_capabilities_hpp_ */
