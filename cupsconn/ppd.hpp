//  ppd.hpp -- PostScript Printer Description statements and entries
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

#ifndef cupsconn_ppd_hpp_
#define cupsconn_ppd_hpp_

#include <iosfwd>
#include <map>
#include <string>
#include <vector>

namespace cupsconn {
namespace ppd {

//! A single PPD directive
/*! Parsed from text of the form
 *
 *    \code
 *    *MainKeyword OptionKeyword/Translation: Value
 *    \endcode
 *
 *  where all but the main keyword are optional.  The value has its
 *  quotes removed and surrounding whitespace trimmed.
 */
struct statement
{
  statement ();
  statement (const std::string& main_keyword,
             const std::string& option_keyword,
             const std::string& translation,
             const std::string& value);

  std::string main_keyword;
  std::string option_keyword;
  std::string translation;
  std::string value;
};

bool operator== (const statement& lhs, const statement& rhs);
std::ostream& operator<< (std::ostream& os, const statement& s);

typedef std::vector< statement > block;

//! Turns a PPD document into its sequence of statements
/*! Comments, queries and \c End directives are left out, as is any
 *  text that does not follow the statement grammar.
 */
std::vector< statement > parse (const std::string& text);

//! Statements sorted by the PPD structure they appeared in
struct groups
{
  //! One block per user selectable option, opening statement first
  std::vector< block > ui;
  //! Option blocks describing installed hardware add-ons
  std::vector< block > installables;
  std::vector< statement > constraints;
  //! Everything outside of an option block
  std::vector< statement > standalone;
};

groups group (const std::vector< statement >& statements);

//! Removes UI choices that conflict with the installed options
/*! For every \c UIConstraints statement "*A a *B b" where option \c A
 *  is installed with default \c a, choice \c b of option \c B is taken
 *  out of the regular UI blocks.
 */
void filter_constraints (groups& g);

//! A user selectable option with its choices and resolved default
struct entry
{
  enum kind {
    pick_one,
    boolean,
  };

  entry ();

  std::string main_keyword;
  std::string translation;
  kind        type;
  //! Always the option keyword of one of the options
  std::string default_value;
  std::vector< statement > options;
};

struct entries
{
  std::map< std::string, entry > by_main_keyword;
  std::map< std::string, entry > by_translation;

  const entry * find (const std::string& main_keyword) const;
  const entry * find_translation (const std::string& translation) const;
};

//! Converts UI blocks to entries, skipping unsupported and empty ones
entries convert (const std::vector< block >& ui);

}       // namespace ppd
}       // namespace cupsconn

#endif  /* cupsconn_ppd_hpp_ */
