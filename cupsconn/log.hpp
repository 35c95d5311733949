//  log.hpp -- formatted messages based on priority and category
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

#ifndef cupsconn_log_hpp_
#define cupsconn_log_hpp_

#include <sstream>
#include <string>
#include <thread>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/optional.hpp>
#include <boost/throw_exception.hpp>

#include "format.hpp"

#ifndef CUPSCONN_LOG_ARGUMENT_COUNT_CHECK_ENABLED
#define CUPSCONN_LOG_ARGUMENT_COUNT_CHECK_ENABLED true
#endif

namespace cupsconn {

class log
{
public:
  typedef enum {
    FATAL,                      //!<  famous last words
    ALERT,                      //!<  outside intervention required
    ERROR,                      //!<  something went wrong
    BRIEF,                      //!<  short informational notes
    TRACE,                      //!<  more chattery feedback
    DEBUG,                      //!<  the gory details
  } priority;

  typedef enum {
    NOTHING,
    POOL  = 1 << 0,             //!<  print server connexions
    CACHE = 1 << 1,             //!<  PPD file cache
    PPD   = 1 << 2,             //!<  PPD parsing and translation
    ALL   = ~0
  } category;

private:
  inline static bool make_noise (int level, int cat = ALL)
  {
    return (threshold >= level && matching & cat);
  }

public:
  template <typename charT, typename traits = std::char_traits<charT> >
  class basic_logger
  {
  public:
    static std::basic_ostream<charT, traits>& os_;
  };

  //!  Formatted, self-outputting log messages
  /*!  Modeled after boost::format.  Messages that are suppressed by
   *   log::threshold or log::matching never get formatted, only their
   *   arguments get counted.
   */
  template <typename charT, typename traits = std::char_traits<charT>,
            typename Alloc = std::allocator<charT> >
  class basic_message
  {
  public:
    typedef boost::basic_format<charT, traits, Alloc> format_type;
  private:
    boost::optional<boost::posix_time::ptime> timestamp_;
    boost::optional<std::thread::id>          thread_id_;
    boost::optional<format_type>              fmt_;
    int arg_;
    int cnt_;
    mutable bool dumped_;

    void clear_exception_bits ()
    {
      if (!arg_count_checking && fmt_)
        fmt_->exceptions (fmt_->exceptions ()
                          ^ (boost::io::too_many_args_bit
                             | boost::io::too_few_args_bit));
    }

    template <typename type>
    void init_args (const type& fmt, int lvl, int cat = ALL)
    {
      if (make_noise (lvl, cat))
        {
          timestamp_ = boost::posix_time::microsec_clock::local_time ();
          thread_id_ = std::this_thread::get_id ();
          fmt_ = format_type (fmt);
          cnt_ = fmt_->num_args_;
          clear_exception_bits ();
        }
      else
        {
          cnt_ = format_type (fmt).num_args_;
        }
    }

  public:
    typedef charT char_type;
    typedef std::basic_string<charT, traits, Alloc> string_type;

    basic_message ()
      : arg_(0), cnt_(0), dumped_(false)
    {}

    basic_message (int lvl, const string_type& fmt)
      : arg_(0), dumped_(false)
    { init_args (fmt, lvl); }
    basic_message (int lvl, const int& cat, const string_type& fmt)
      : arg_(0), dumped_(false)
    { init_args (fmt, lvl, cat); }

    //  Always noisy
    basic_message (const string_type& fmt)
      : timestamp_(boost::posix_time::microsec_clock::local_time ())
      , thread_id_(std::this_thread::get_id ())
      , fmt_(format_type (fmt)), arg_(0), cnt_(fmt_->num_args_)
      , dumped_(false)
    { clear_exception_bits (); }

    //  Never noisy, only counts arguments
    basic_message (const string_type& fmt, bool)
      : arg_(0), cnt_(format_type (fmt).num_args_), dumped_(false)
    {}

    ~basic_message ()
    {
      if (arg_ < cnt_) {
        if (log::arg_count_checking) {
          log::error ("log::message::too_few_args: %1% < %2%") % arg_ % cnt_;
        }
        for (int i = arg_; i < cnt_; /**/) {
          std::basic_ostringstream <charT, traits> os;
          os << "%" << ++i << "%";
          *this % os.str ();
        }
      }
      basic_logger<charT, traits>::os_ << *this;
    }

    //!  Feeds the argument \a t to a message
    template <typename T> basic_message& operator% (const T& t)
    {
      if (dumped_) arg_ = 0;
      ++arg_;
      if (fmt_) {
        *fmt_ % t;
      } else {
        if (arg_count_checking && arg_ > cnt_) {
          BOOST_THROW_EXCEPTION (boost::io::too_many_args (arg_, cnt_));
        }
      }
      return *this;
    }

    operator string_type () const
    {
      string_type rv;

      if (fmt_) {
        std::basic_ostringstream <charT, traits> os;
        os << *timestamp_ << "[" << *thread_id_ << "]: " << *fmt_
           << std::endl;
        rv = os.str ();
      }
      else if (log::arg_count_checking && arg_ < cnt_) {
        BOOST_THROW_EXCEPTION (boost::io::too_few_args (arg_, cnt_));
      }
      dumped_ = true;
      return rv;
    }
  };

  static const bool
  arg_count_checking = CUPSCONN_LOG_ARGUMENT_COUNT_CHECK_ENABLED;

  //!  The priority at and above which messages may be logged
  static priority threshold;
  //!  Only messages in matching categories are considered for output
  static category matching;

  typedef basic_message<char> message;

  //!  Prioritized log messages
  /*!  Lets one write
   *
   *     \code
   *     log::error ("%1%: no such printer") % name;
   *     \endcode
   *
   *   instead of constructing a log::message with an explicit level.
   */
#define expand_named_ctor(ctor,level)                                   \
  inline static message                                                 \
  ctor (const message::string_type& fmt)                                \
  { return ctor (ALL, fmt); }                                           \
  inline static message                                                 \
  ctor (const log::category& cat, const message::string_type& fmt)      \
  {                                                                     \
    if (!arg_count_checking)                                            \
      return (make_noise (level, cat) ? message (fmt) : message ());    \
                                                                        \
    return (make_noise (level, cat)                                     \
            ? message (fmt) : message (fmt, arg_count_checking));       \
  }                                                                     \
  /**/

  expand_named_ctor (fatal, FATAL);
  expand_named_ctor (alert, ALERT);
  expand_named_ctor (error, ERROR);
  expand_named_ctor (brief, BRIEF);
  expand_named_ctor (trace, TRACE);
  expand_named_ctor (debug, DEBUG);

#undef expand_named_ctor

  //! Maps a priority name such as "brief" to its level
  /*! Throws std::invalid_argument for unknown names.
   */
  static priority to_priority (const std::string& name);
};

//! Outputs a formatted log message to a stream
template <typename charT, typename traits, typename Alloc>
std::basic_ostream<charT, traits>&
operator<< (std::basic_ostream<charT, traits>& os,
            const log::basic_message<charT, traits, Alloc>& msg)
{
  os << typename log::basic_message<charT, traits, Alloc>::string_type (msg);
  return os;
}

}       // namespace cupsconn

#endif  /* cupsconn_log_hpp_ */
