//  ppd.cpp -- PostScript Printer Description statements and entries
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

#include <ostream>
#include <set>
#include <utility>

#include <boost/foreach.hpp>
#include <boost/regex.hpp>

#include "cupsconn/log.hpp"
#include "cupsconn/ppd.hpp"

namespace cupsconn {
namespace ppd {

namespace {

  const char marker = '*';

  //! Whitespace as understood by the PPD grammar
  bool
  is_space (char c)
  {
    return (' ' == c || '\t' == c || '\n' == c || '\r' == c || '\f' == c
            || '\v' == c);
  }

  bool
  only_space (const std::string& s, std::string::size_type pos)
  {
    for (; pos < s.size (); ++pos)
      if (!is_space (s[pos])) return false;
    return true;
  }

  std::string
  trim (const std::string& s)
  {
    std::string::size_type b = 0;
    std::string::size_type e = s.size ();

    while (b < e && is_space (s[b]))     ++b;
    while (e > b && is_space (s[e - 1])) --e;

    return s.substr (b, e - b);
  }

  bool
  starts_with (const std::string& s, const std::string& prefix)
  {
    return 0 == s.compare (0, prefix.size (), prefix);
  }

  //! Cuts the text at every line break that is followed by a marker
  /*! Line breaks and markers at the cuts are dropped.  Lines that do
   *  not start with a marker stay attached to the preceding chunk so
   *  that multi-line values remain whole.
   */
  std::vector< std::string >
  split_directives (const std::string& text)
  {
    std::vector< std::string > rv;
    std::string::size_type start = (!text.empty () && marker == text[0]);
    std::string::size_type i = start;

    while (i < text.size ())
      {
        char c = text[i];

        if ('\r' != c && '\n' != c)
          {
            ++i;
            continue;
          }

        std::string::size_type next = i + 1;
        if ('\r' == c && next < text.size () && '\n' == text[next]) ++next;

        if (next < text.size () && marker == text[next])
          {
            rv.push_back (text.substr (start, i - start));
            start = next + 1;
          }
        i = next;
      }
    rv.push_back (text.substr (start));

    return rv;
  }

  //! Matches one directive against the statement grammar
  bool
  scan (const std::string& s, statement& st)
  {
    std::string::size_type i = 0;

    while (i < s.size () && !is_space (s[i]) && ':' != s[i] && '/' != s[i])
      ++i;
    if (0 == i) return false;
    st.main_keyword = s.substr (0, i);

    if (i < s.size () && is_space (s[i]))
      {
        std::string::size_type b = i;
        while (b < s.size () && is_space (s[b])) ++b;
        std::string::size_type e = b;
        while (e < s.size () && '/' != s[e] && ':' != s[e]) ++e;

        st.option_keyword = trim (s.substr (b, e - b));
        i = e;
      }

    if (i < s.size () && '/' == s[i])
      {
        std::string::size_type e = s.find (':', i + 1);
        if (std::string::npos == e) e = s.size ();

        st.translation = s.substr (i + 1, e - i - 1);
        i = e;
      }

    if (i == s.size () || ':' != s[i])
      return only_space (s, i);

    ++i;
    while (i < s.size () && is_space (s[i])) ++i;

    if (i < s.size () && '"' == s[i])
      {
        std::string::size_type q = s.find ('"', i + 1);
        if (std::string::npos != q && only_space (s, q + 1))
          {
            st.value = trim (s.substr (i + 1, q - i - 1));
            return true;
          }
      }

    // Unquoted values run to the end of the line
    std::string::size_type e = s.find ('\n', i);
    if (std::string::npos == e) e = s.size ();
    if (!only_space (s, e)) return false;

    st.value = trim (s.substr (i, e - i));
    return true;
  }

  typedef std::pair< std::string, std::string > keyword_pair;

  const boost::regex constraint_re
  ("\\*([^\\s*]+)\\s+(\\S+)\\s+\\*([^\\s*]+)\\s+(\\S+)");
}       // namespace

statement::statement ()
{}

statement::statement (const std::string& main_keyword,
                      const std::string& option_keyword,
                      const std::string& translation,
                      const std::string& value)
  : main_keyword (main_keyword)
  , option_keyword (option_keyword)
  , translation (translation)
  , value (value)
{}

bool
operator== (const statement& lhs, const statement& rhs)
{
  return (lhs.main_keyword   == rhs.main_keyword
          && lhs.option_keyword == rhs.option_keyword
          && lhs.translation    == rhs.translation
          && lhs.value          == rhs.value);
}

std::ostream&
operator<< (std::ostream& os, const statement& s)
{
  os << marker << s.main_keyword;
  if (!s.option_keyword.empty ()) os << " " << s.option_keyword;
  if (!s.translation.empty ())    os << "/" << s.translation;
  os << ": \"" << s.value << "\"";
  return os;
}

std::vector< statement >
parse (const std::string& text)
{
  std::vector< statement > rv;

  BOOST_FOREACH (const std::string& line, split_directives (text))
    {
      if (starts_with (line, "%") || starts_with (line, "?"))
        continue;

      statement st;
      if (!scan (line, st)) continue;
      if ("End" == st.main_keyword) continue;

      rv.push_back (st);
    }
  return rv;
}

groups
group (const std::vector< statement >& statements)
{
  groups rv;
  block *current = nullptr;
  bool inside_installable = false;

  BOOST_FOREACH (const statement& s, statements)
    {
      const std::string& kw (s.main_keyword);

      /**/ if ("OpenUI" == kw || "JCLOpenUI" == kw)
        {
          std::vector< block >& blocks (inside_installable
                                        ? rv.installables : rv.ui);
          blocks.push_back (block (1, s));
          current = &blocks.back ();
        }
      else if ("CloseUI" == kw || "JCLCloseUI" == kw)
        {
          current = nullptr;
        }
      else if ("OpenGroup" == kw || "CloseGroup" == kw)
        {
          if (starts_with (s.value, "InstallableOptions"))
            inside_installable = ("OpenGroup" == kw);
        }
      else if ("OpenSubGroup" == kw || "CloseSubGroup" == kw)
        {
          // sub-groups only matter for presentation
        }
      else if ("UIConstraints" == kw)
        {
          rv.constraints.push_back (s);
        }
      else if (current)
        {
          current->push_back (s);
        }
      else
        {
          rv.standalone.push_back (s);
        }
    }
  return rv;
}

void
filter_constraints (groups& g)
{
  const std::string default_prefix ("Default");

  std::set< keyword_pair > installed;
  BOOST_FOREACH (const block& b, g.installables)
    {
      BOOST_FOREACH (const statement& s, b)
        {
          if (starts_with (s.main_keyword, default_prefix))
            installed.insert
              (keyword_pair (s.main_keyword.substr (default_prefix.size ()),
                             s.value));
        }
    }

  std::set< keyword_pair > forbidden;
  BOOST_FOREACH (const statement& s, g.constraints)
    {
      boost::smatch m;
      if (!boost::regex_match (s.value, m, constraint_re)) continue;

      if (installed.count (keyword_pair (m[1].str (), m[2].str ())))
        forbidden.insert (keyword_pair (m[3].str (), m[4].str ()));
    }
  if (forbidden.empty ()) return;

  BOOST_FOREACH (block& b, g.ui)
    {
      block kept;
      BOOST_FOREACH (const statement& s, b)
        {
          if (forbidden.count (keyword_pair (s.main_keyword,
                                             s.option_keyword)))
            {
              log::debug (log::PPD, "%1% %2%: ruled out by installed options")
                % s.main_keyword % s.option_keyword;
              continue;
            }
          kept.push_back (s);
        }
      b.swap (kept);
    }
}

entry::entry ()
  : type (pick_one)
{}

const entry *
entries::find (const std::string& main_keyword) const
{
  std::map< std::string, entry >::const_iterator it
    = by_main_keyword.find (main_keyword);

  return (by_main_keyword.end () == it ? nullptr : &it->second);
}

const entry *
entries::find_translation (const std::string& translation) const
{
  std::map< std::string, entry >::const_iterator it
    = by_translation.find (translation);

  return (by_translation.end () == it ? nullptr : &it->second);
}

entries
convert (const std::vector< block >& ui)
{
  entries rv;

  BOOST_FOREACH (const block& b, ui)
    {
      if (b.empty ()) continue;

      const statement& head (b.front ());
      entry e;

      e.main_keyword = head.option_keyword;
      if (!e.main_keyword.empty () && marker == e.main_keyword[0])
        e.main_keyword.erase (0, 1);
      if (e.main_keyword.empty ()) continue;

      e.translation = (head.translation.empty ()
                       ? e.main_keyword : head.translation);

      /**/ if ("PickOne" == head.value) e.type = entry::pick_one;
      else if ("Boolean" == head.value) e.type = entry::boolean;
      else
        {
          if ("PickMany" == head.value)
            log::error (log::PPD, "%1%: PickMany options are not supported")
              % e.main_keyword;
          continue;
        }

      const std::string default_keyword ("Default" + e.main_keyword);
      std::set< std::string > keywords;

      for (block::const_iterator it = b.begin () + 1; b.end () != it; ++it)
        {
          /**/ if (default_keyword == it->main_keyword)
            {
              e.default_value = it->value;
            }
          else if (starts_with (it->main_keyword, e.main_keyword)
                   && !it->option_keyword.empty ())
            {
              e.options.push_back (*it);
              keywords.insert (it->option_keyword);
            }
        }
      if (e.options.empty ()) continue;

      if (!keywords.count (e.default_value))
        e.default_value = e.options.front ().option_keyword;

      rv.by_main_keyword[e.main_keyword] = e;
      rv.by_translation[e.translation]   = e;
    }
  return rv;
}

}       // namespace ppd
}       // namespace cupsconn
