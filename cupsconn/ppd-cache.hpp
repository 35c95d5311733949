//  ppd-cache.hpp -- conditionally refreshed local copies of printer PPDs
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

#ifndef cupsconn_ppd_cache_hpp_
#define cupsconn_ppd_cache_hpp_

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>

#include "connexion-pool.hpp"

namespace cupsconn {

//! Where a printer's PPD lives locally and what its content hashes to
struct ppd_file
{
  std::string path;
  std::string hash;
};

bool operator== (const ppd_file& lhs, const ppd_file& rhs);

//! Keeps one local PPD file per printer in sync with the print server
/*! Each printer gets an entry on its first refresh().  The entry owns
 *  a file under the cache directory that exists for as long as the
 *  entry does.  Subsequent refreshes ask the server for the PPD only
 *  if it changed since the last fetch and leave the file untouched
 *  when it did not.
 *
 *  Refreshes for different printers proceed independently.  Those for
 *  the same printer are serialised.
 */
class ppd_cache
{
public:
  ppd_cache (connexion_pool& pool, const boost::filesystem::path& dir);
  ~ppd_cache ();

  //! Brings the local copy up to date with the print server
  /*! When anything goes wrong the entry keeps its previous file and
   *  hash and the error is propagated.
   */
  ppd_file refresh (const std::string& printer);

  //! The current state of a printer's entry, without contacting the server
  boost::optional< ppd_file > lookup (const std::string& printer) const;

  //! Drops a printer's entry and removes its file
  void invalidate (const std::string& printer);

  std::size_t size () const;

  const boost::filesystem::path& directory () const;

  class entry;

private:
  ppd_cache (const ppd_cache&);
  ppd_cache& operator= (const ppd_cache&);

  typedef std::shared_ptr< entry > entry_ptr;

  connexion_pool&         pool_;
  boost::filesystem::path dir_;

  mutable std::mutex                 mutex_;
  std::map< std::string, entry_ptr > entries_;
};

}       // namespace cupsconn

#endif  /* cupsconn_ppd_cache_hpp_ */
