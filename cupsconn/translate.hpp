//  translate.hpp -- PPD to cloud device description mapping
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

#ifndef cupsconn_translate_hpp_
#define cupsconn_translate_hpp_

#include <string>

#include <boost/optional.hpp>

#include "cdd.hpp"
#include "ppd.hpp"

namespace cupsconn {

//! What a PPD document says about its printer
struct translation
{
  cdd::printer_description description;
  std::string              manufacturer;
  std::string              model;
};

//! Runs a PPD document through parsing, filtering and mapping
/*! Sections that the document lacks, or that cannot be made sense
 *  of, are left empty.  Problems are logged, never thrown.
 */
translation translate_ppd (const std::string& text);

//  Individual mappers, one per capability section.  They return no
//  capability when no option survives conversion.

boost::optional< cdd::media_size_capability >
convert_media_size (const ppd::entry& e);

boost::optional< cdd::color_capability >
convert_color (const ppd::entry& e);

boost::optional< cdd::duplex_capability >
convert_duplex (const ppd::entry& e);

boost::optional< cdd::dpi_capability >
convert_dpi (const ppd::entry& e);

//! Generic select or boolean vendor capability for any entry
cdd::vendor_capability
convert_vendor_capability (const ppd::entry& e);

//! Ricoh style "locked print" job type with a password entry
/*! Yields a single string valued capability if \a job_type offers a
 *  \c LockedPrint choice.  The password presets are of no concern.
 */
boost::optional< cdd::vendor_capability >
convert_locked_print_password (const ppd::entry& job_type,
                               const ppd::entry& password);

//! Converts "left bottom right top" hardware margins in points
boost::optional< cdd::margins_capability >
convert_margins (const std::string& hw_margins);

boost::optional< cdd::printing_speed_capability >
convert_printing_speed (const std::string& throughput,
                        const boost::optional< cdd::color_capability >& color);

//! Strips driver and PDL noise from a PPD NickName or ModelName
std::string cleanup_model (const std::string& model);

//! Display name for a color choice, derived from its translation
std::string cleanup_color_name (const std::string& keyword,
                                const std::string& translation);

//! Proper casing for manufacturer names that PPDs spell in capitals
std::string normalize_manufacturer (const std::string& manufacturer);

}       // namespace cupsconn

#endif  /* cupsconn_translate_hpp_ */
