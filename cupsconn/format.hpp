//  format.hpp -- boost::format with argument count checking access
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

#ifndef cupsconn_format_hpp_
#define cupsconn_format_hpp_

#ifdef BOOST_FORMAT_HPP
#error "Include this file before <boost/format.hpp> is included."
#endif

//  The logging code peeks at the argument counters that boost::format
//  keeps private.

#ifndef BOOST_NO_MEMBER_TEMPLATE_FRIENDS
#define BOOST_NO_MEMBER_TEMPLATE_FRIENDS
#endif

#include <boost/format.hpp>

namespace cupsconn {

using boost::format;

}       // namespace cupsconn

#endif  /* cupsconn_format_hpp_ */
