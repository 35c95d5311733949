//  media.hpp -- well-known PPD page sizes
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

#ifndef cupsconn_media_hpp_
#define cupsconn_media_hpp_

#include <string>

#include <boost/optional.hpp>

#include "cdd.hpp"

namespace cupsconn {

//! Properties of the page sizes commonly found in PPDs
class media
{
public:
  //! Looks up a PPD PageSize option keyword such as "A4" or "Env10"
  /*! The result carries the schema name, dimensions, display name and
   *  the keyword as its vendor ID.  Its default flag is not set.
   */
  static boost::optional< cdd::media_size_option >
  lookup (const std::string& keyword);
};

}       // namespace cupsconn

#endif  /* cupsconn_media_hpp_ */
