//  cdd.hpp -- cloud device description capability types
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

#ifndef cupsconn_cdd_hpp_
#define cupsconn_cdd_hpp_

#include <cstdint>
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/throw_exception.hpp>

namespace cupsconn {
namespace cdd {

//! Mutually exclusive alternatives, exactly one of which is the default
/*! The \a Option type needs a boolean \c is_default member.  The
 *  constructor refuses option lists that violate the single default
 *  requirement with a std::invalid_argument.
 */
template< typename Option >
class choice
{
public:
  typedef Option                 option_type;
  typedef std::vector< Option >  container;

  explicit choice (const container& options)
    : option_(options)
  {
    typename container::size_type defaults = 0;

    for (typename container::const_iterator it = option_.begin ();
         option_.end () != it; ++it)
      {
        if (it->is_default) ++defaults;
      }
    if (1 != defaults)
      BOOST_THROW_EXCEPTION
        (std::invalid_argument ("choice needs exactly one default option"));
  }

  const container& option () const
  {
    return option_;
  }

  const Option& default_option () const
  {
    typename container::const_iterator it = option_.begin ();
    while (!it->is_default) ++it;
    return *it;
  }

private:
  container option_;
};

enum color_type {
  STANDARD_COLOR,
  STANDARD_MONOCHROME,
  CUSTOM_COLOR,
  CUSTOM_MONOCHROME,
  AUTO,
};

enum duplex_type {
  NO_DUPLEX,
  LONG_EDGE,
  SHORT_EDGE,
};

enum margins_type {
  BORDERLESS,
  STANDARD,
  CUSTOM,
};

enum vendor_capability_type {
  RANGE,
  SELECT,
  TYPED_VALUE,
};

enum typed_value_type {
  BOOLEAN,
  FLOAT,
  INTEGER,
  STRING,
};

struct media_size_option
{
  media_size_option ();

  //! Schema media name such as "NA_LETTER", "CUSTOM" for the others
  std::string name;
  int32_t     width_microns;
  int32_t     height_microns;
  bool        is_continuous_feed;
  bool        is_default;
  std::string vendor_id;
  std::string custom_display_name;
};

typedef choice< media_size_option > media_size_capability;

struct color_option
{
  color_option ();

  std::string vendor_id;
  color_type  type;
  std::string custom_display_name;
  bool        is_default;
};

class color_capability
  : public choice< color_option >
{
public:
  color_capability (const container& options, const std::string& vendor_key);

  //! The PPD control the options belong to
  std::string vendor_key;
};

struct duplex_option
{
  duplex_option ();

  duplex_type type;
  bool        is_default;
  std::string vendor_id;
};

class duplex_capability
  : public choice< duplex_option >
{
public:
  duplex_capability (const container& options, const std::string& vendor_key);

  std::string vendor_key;
};

struct dpi_option
{
  dpi_option ();

  int32_t     horizontal_dpi;
  int32_t     vertical_dpi;
  bool        is_default;
  std::string vendor_id;
  std::string custom_display_name;
};

typedef choice< dpi_option > dpi_capability;

struct margins_option
{
  margins_option ();

  margins_type type;
  int32_t      top_microns;
  int32_t      right_microns;
  int32_t      bottom_microns;
  int32_t      left_microns;
  bool         is_default;
};

typedef choice< margins_option > margins_capability;

struct printing_speed_option
{
  printing_speed_option ();

  float                     speed_ppm;
  std::vector< color_type > color_types;
};

struct printing_speed_capability
{
  std::vector< printing_speed_option > option;
};

struct select_option
{
  select_option ();

  std::string value;
  std::string display_name;
  bool        is_default;
};

typedef choice< select_option > select_capability;

struct typed_value_capability
{
  typed_value_capability ();

  typed_value_type value_type;
  std::string      default_value;
};

struct vendor_capability
{
  vendor_capability ();

  std::string            id;
  std::string            display_name;
  vendor_capability_type type;

  boost::optional< select_capability >      select_cap;
  boost::optional< typed_value_capability > typed_value_cap;
};

//! Everything the cloud service needs to know about a printer
/*! Sections the PPD has no usable data for are left empty.
 */
struct printer_description
{
  boost::optional< media_size_capability >     media_size;
  boost::optional< color_capability >          color;
  boost::optional< duplex_capability >         duplex;
  boost::optional< dpi_capability >            dpi;
  boost::optional< margins_capability >        margins;
  boost::optional< printing_speed_capability > printing_speed;
  std::vector< vendor_capability >             vendor_capabilities;
};

//  Schema enumeration tags
const char * to_string (color_type t);
const char * to_string (duplex_type t);
const char * to_string (margins_type t);
const char * to_string (vendor_capability_type t);
const char * to_string (typed_value_type t);

//! Human readable rendering, one capability option per line
std::ostream& operator<< (std::ostream& os, const printer_description& pd);

}       // namespace cdd
}       // namespace cupsconn

#endif  /* cupsconn_cdd_hpp_ */
