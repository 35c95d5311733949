//  digest.hpp -- streaming content hashes
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

#ifndef cupsconn_digest_hpp_
#define cupsconn_digest_hpp_

#include <cstddef>
#include <string>

namespace cupsconn {

//! Incremental MD5 message digest
/*! Feed data with update() in as many pieces as convenient and obtain
 *  the lower case hexadecimal digest once all data has been seen.
 */
class md5
{
public:
  md5 ();
  ~md5 ();

  void update (const char *data, std::size_t size);

  //! Finishes the computation, no further updates are accepted
  std::string hexdigest ();

private:
  md5 (const md5&);
  md5& operator= (const md5&);

  struct impl;
  impl *pimpl_;
};

}       // namespace cupsconn

#endif  /* cupsconn_digest_hpp_ */
