//  scripted.hpp -- print server stand-ins for testing
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

#ifndef cupsconn_test_scripted_hpp_
#define cupsconn_test_scripted_hpp_

#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <boost/filesystem.hpp>
#include <boost/throw_exception.hpp>

#include "../connexion-pool.hpp"
#include "../exception.hpp"

namespace cupsconn {
namespace test {

//! What a pretend print server knows and how it misbehaves
/*! Shared by all sessions created through factory().  PPD requests
 *  are answered like cupsGetPPD3() does: a temporary file in the
 *  system's temp directory when the PPD changed since the modtime
 *  given, a not-modified reply otherwise.
 */
class script
  : public std::enable_shared_from_this< script >
{
public:
  typedef std::shared_ptr< script > ptr;

  script ()
    : sessions (0), closed (0), ppd_calls (0), ipp_calls (0)
    , reconnects (0), latency (0), last_request_(ipp::get_printers)
    , transport_failures_(0)
    , server_failures_(0), failing_factory_(false)
  {}

  //! Publishes a new version of a printer's PPD
  void
  set_ppd (const std::string& printer, const std::string& content)
  {
    std::lock_guard< std::mutex > lock (mutex_);
    ppd& p = ppds_[printer];
    p.content = content;
    ++p.modtime;
  }

  void
  remove_ppd (const std::string& printer)
  {
    std::lock_guard< std::mutex > lock (mutex_);
    ppds_.erase (printer);
  }

  //! Makes the next \a n requests fail as if the server went away
  void
  fail_transport (int n)
  {
    std::lock_guard< std::mutex > lock (mutex_);
    transport_failures_ = n;
  }

  //! Makes the next \a n requests fail with an internal server error
  void
  fail_server (int n)
  {
    std::lock_guard< std::mutex > lock (mutex_);
    server_failures_ = n;
  }

  //! Makes session creation throw a transport_error
  void
  fail_factory (bool flag)
  {
    std::lock_guard< std::mutex > lock (mutex_);
    failing_factory_ = flag;
  }

  //! The reply to every IPP request
  void
  set_response (const ipp::response& rsp)
  {
    std::lock_guard< std::mutex > lock (mutex_);
    response_ = rsp;
  }

  connexion_pool::factory factory ();

  ppd_reply
  get_ppd (const std::string& printer, std::time_t modtime)
  {
    ++ppd_calls;
    if (latency.count ()) std::this_thread::sleep_for (latency);

    std::lock_guard< std::mutex > lock (mutex_);
    check_failures_();

    std::map< std::string, ppd >::const_iterator it = ppds_.find (printer);
    if (ppds_.end () == it)
      BOOST_THROW_EXCEPTION
        (server_error (404, printer + ": no such printer"));

    if (modtime >= it->second.modtime) return ppd_reply ();

    boost::filesystem::path name
      (boost::filesystem::temp_directory_path ()
       / boost::filesystem::unique_path ("cupsconn-server-%%%%-%%%%.ppd"));
    std::ofstream ofs (name.string ().c_str (), std::ios::binary);
    ofs << it->second.content;

    return ppd_reply (name.string (), it->second.modtime);
  }

  ipp::response
  request (const ipp::request& req)
  {
    ++ipp_calls;
    if (latency.count ()) std::this_thread::sleep_for (latency);

    std::lock_guard< std::mutex > lock (mutex_);
    check_failures_();
    last_request_ = req;
    return response_;
  }

  ipp::request
  last_request () const
  {
    std::lock_guard< std::mutex > lock (mutex_);
    return last_request_;
  }

  std::atomic< int > sessions;
  std::atomic< int > closed;
  std::atomic< int > ppd_calls;
  std::atomic< int > ipp_calls;
  std::atomic< int > reconnects;

  //! Time every request takes
  std::chrono::milliseconds latency;

private:
  struct ppd
  {
    ppd () : modtime (0) {}

    std::string content;
    std::time_t modtime;
  };

  void
  check_failures_()
  {
    if (0 < transport_failures_)
      {
        --transport_failures_;
        BOOST_THROW_EXCEPTION (transport_error ("connexion reset by peer"));
      }
    if (0 < server_failures_)
      {
        --server_failures_;
        BOOST_THROW_EXCEPTION
          (server_error (ipp::error_internal, "internal error"));
      }
  }

  mutable std::mutex mutex_;
  std::map< std::string, ppd > ppds_;
  ipp::response response_;
  ipp::request  last_request_;
  int  transport_failures_;
  int  server_failures_;
  bool failing_factory_;

};

//! A session with the pretend print server
class scripted
  : public connexion
{
public:
  explicit scripted (script::ptr s)
    : script_(s)
  {
    ++script_->sessions;
  }

  ~scripted ()
  {
    ++script_->closed;
  }

  ppd_reply
  get_ppd (const std::string& printer, std::time_t modtime)
  {
    return script_->get_ppd (printer, modtime);
  }

  ipp::response
  request (const ipp::request& req)
  {
    return script_->request (req);
  }

  void
  reconnect ()
  {
    ++script_->reconnects;
  }

private:
  script::ptr script_;
};

inline
connexion_pool::factory
script::factory ()
{
  script::ptr self (shared_from_this ());
  return [self] () -> connexion::ptr
    {
      {
        std::lock_guard< std::mutex > lock (self->mutex_);
        if (self->failing_factory_)
          BOOST_THROW_EXCEPTION
            (transport_error ("connexion refused"));
      }
      return std::make_shared< scripted > (self);
    };
}

} // namespace test
} // namespace cupsconn

#endif /* cupsconn_test_scripted_hpp_ */
