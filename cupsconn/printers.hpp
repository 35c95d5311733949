//  printers.hpp -- print queue queries
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

#ifndef cupsconn_printers_hpp_
#define cupsconn_printers_hpp_

#include <string>
#include <vector>

#include "connexion-pool.hpp"

namespace cupsconn {

//! Names of all print queues the server knows about
std::vector< std::string > printer_names (connexion_pool& pool);

//! Selected attributes of a single print queue
/*! An empty \a attributes list asks for all of them.
 */
ipp::attribute_map
printer_attributes (connexion_pool& pool, const std::string& printer,
                    const std::vector< std::string >& attributes);

}       // namespace cupsconn

#endif  /* cupsconn_printers_hpp_ */
