//  ppd-cache.cpp -- conditionally refreshed local copies of printer PPDs
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

#include <cctype>
#include <ctime>
#include <fstream>
#include <thread>

#include <boost/filesystem.hpp>
#include <boost/throw_exception.hpp>

#include "cupsconn/digest.hpp"
#include "cupsconn/exception.hpp"
#include "cupsconn/format.hpp"
#include "cupsconn/log.hpp"
#include "cupsconn/ppd-cache.hpp"

namespace fs = boost::filesystem;

namespace cupsconn {

namespace {

  //! Removes a file when going out of scope
  struct scoped_removal
  {
    fs::path path_;

    explicit scoped_removal (const fs::path& path)
      : path_(path)
    {}

    ~scoped_removal ()
    {
      if (path_.empty ()) return;

      boost::system::error_code ec;
      fs::remove (path_, ec);
      if (ec)
        log::error (log::CACHE, "%1%: %2%") % path_.string () % ec.message ();
    }
  };

  //! A file name component derived from a printer name
  std::string
  file_stem (const std::string& printer)
  {
    std::string rv;

    for (std::string::size_type i = 0; i < printer.size (); ++i)
      {
        char c = printer[i];
        rv += ((std::isalnum (static_cast< unsigned char > (c))
                || '-' == c || '_' == c || '.' == c)
               ? c : '_');
      }
    return rv;
  }
}       // namespace

bool
operator== (const ppd_file& lhs, const ppd_file& rhs)
{
  return lhs.path == rhs.path && lhs.hash == rhs.hash;
}

class ppd_cache::entry
{
public:
  entry (const std::string& printer, const fs::path& dir)
    : printer_(printer)
    , path_(dir / fs::unique_path (file_stem (printer) + "-%%%%-%%%%.ppd"))
    , modtime_(0)
  {}

  ~entry ()
  {
    scoped_removal rm (path_);
  }

  ppd_file refresh (connexion_pool& pool)
  {
    std::lock_guard< std::mutex > lock (mutex_);

    ppd_reply reply = pool.get_ppd (printer_, modtime_);

    if (!reply.modified)
      {
        if (hash_.empty ())
          BOOST_THROW_EXCEPTION
            (server_error (http::not_modified,
                           (format ("%1%: PPD reported unchanged before"
                                    " it was ever fetched") % printer_).str ()));

        log::trace (log::CACHE, "%1%: PPD not modified") % printer_;
        return current_();
      }

    scoped_removal rm (reply.filename);

    std::string hash = store_(reply.filename);

    hash_    = hash;
    modtime_ = reply.modtime;

    log::brief (log::CACHE, "%1%: PPD updated, MD5 %2%") % printer_ % hash_;

    return current_();
  }

  boost::optional< ppd_file > current () const
  {
    std::lock_guard< std::mutex > lock (mutex_);

    if (hash_.empty ()) return boost::none;
    return current_();
  }

private:
  ppd_file current_() const
  {
    ppd_file rv;
    rv.path = path_.string ();
    rv.hash = hash_;
    return rv;
  }

  //! Copies \a source next to the stable file, then moves it in place
  /*! The stable file is only replaced once the copy completed, which
   *  keeps the previous contents when anything fails along the way.
   */
  std::string store_(const std::string& source)
  {
    std::ifstream is (source.c_str (), std::ios::binary);
    if (!is)
      BOOST_THROW_EXCEPTION
        (resource_error ((format ("%1%: cannot open %2%")
                          % printer_ % source).str ()));

    fs::path part (path_);
    part += ".part";
    scoped_removal rm (part);

    std::ofstream os (part.string ().c_str (),
                      std::ios::binary | std::ios::trunc);
    if (!os)
      BOOST_THROW_EXCEPTION
        (resource_error ((format ("%1%: cannot create %2%")
                          % printer_ % part.string ()).str ()));

    md5  sum;
    char buffer[8192];

    while (is.read (buffer, sizeof (buffer)) || is.gcount ())
      {
        sum.update (buffer, is.gcount ());
        if (!os.write (buffer, is.gcount ()))
          BOOST_THROW_EXCEPTION
            (resource_error ((format ("%1%: cannot write %2%")
                              % printer_ % part.string ()).str ()));
      }
    if (is.bad ())
      BOOST_THROW_EXCEPTION
        (resource_error ((format ("%1%: cannot read %2%")
                          % printer_ % source).str ()));

    os.close ();
    if (!os)
      BOOST_THROW_EXCEPTION
        (resource_error ((format ("%1%: cannot write %2%")
                          % printer_ % part.string ()).str ()));

    boost::system::error_code ec;
    fs::rename (part, path_, ec);
    if (ec)
      BOOST_THROW_EXCEPTION
        (resource_error ((format ("%1%: %2%")
                          % path_.string () % ec.message ()).str ()));
    rm.path_.clear ();

    return sum.hexdigest ();
  }

  const std::string printer_;
  const fs::path    path_;
  std::time_t       modtime_;
  std::string       hash_;

  mutable std::mutex mutex_;
};

ppd_cache::ppd_cache (connexion_pool& pool, const fs::path& dir)
  : pool_(pool), dir_(dir)
{
  boost::system::error_code ec;
  fs::create_directories (dir_, ec);
  if (ec)
    BOOST_THROW_EXCEPTION
      (resource_error ((format ("%1%: %2%")
                        % dir_.string () % ec.message ()).str ()));
}

ppd_cache::~ppd_cache ()
{
  std::lock_guard< std::mutex > lock (mutex_);
  entries_.clear ();
}

ppd_file
ppd_cache::refresh (const std::string& printer)
{
  entry_ptr e;
  {
    std::lock_guard< std::mutex > lock (mutex_);
    std::map< std::string, entry_ptr >::iterator it = entries_.find (printer);
    if (entries_.end () != it) e = it->second;
  }
  if (e) return e->refresh (pool_);

  entry_ptr fresh (std::make_shared< entry > (printer, dir_));
  ppd_file rv = fresh->refresh (pool_);

  {
    std::lock_guard< std::mutex > lock (mutex_);
    std::map< std::string, entry_ptr >::iterator it = entries_.find (printer);
    if (entries_.end () == it)
      {
        entries_[printer] = fresh;
        return rv;
      }
    e = it->second;
  }

  // Somebody else created an entry while we were fetching.  Theirs
  // stays, ours goes without holding up the caller.
  log::debug (log::CACHE, "%1%: discarding duplicate entry") % printer;
  std::thread ([fresh] () mutable { fresh.reset (); }).detach ();

  boost::optional< ppd_file > winner = e->current ();
  return (winner ? *winner : e->refresh (pool_));
}

boost::optional< ppd_file >
ppd_cache::lookup (const std::string& printer) const
{
  entry_ptr e;
  {
    std::lock_guard< std::mutex > lock (mutex_);
    std::map< std::string, entry_ptr >::const_iterator it
      = entries_.find (printer);
    if (entries_.end () == it) return boost::none;
    e = it->second;
  }
  return e->current ();
}

void
ppd_cache::invalidate (const std::string& printer)
{
  entry_ptr e;
  {
    std::lock_guard< std::mutex > lock (mutex_);
    std::map< std::string, entry_ptr >::iterator it = entries_.find (printer);
    if (entries_.end () == it) return;
    e = it->second;
    entries_.erase (it);
  }
  log::brief (log::CACHE, "%1%: cache entry dropped") % printer;
}

std::size_t
ppd_cache::size () const
{
  std::lock_guard< std::mutex > lock (mutex_);
  return entries_.size ();
}

const fs::path&
ppd_cache::directory () const
{
  return dir_;
}

}       // namespace cupsconn
