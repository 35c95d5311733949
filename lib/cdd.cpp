//  cdd.cpp -- cloud device description capability types
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

#include <boost/foreach.hpp>

#include "cupsconn/cdd.hpp"

namespace cupsconn {
namespace cdd {

media_size_option::media_size_option ()
  : width_microns (0), height_microns (0)
  , is_continuous_feed (false), is_default (false)
{}

color_option::color_option ()
  : type (STANDARD_COLOR), is_default (false)
{}

color_capability::color_capability (const container& options,
                                    const std::string& vendor_key)
  : choice< color_option > (options), vendor_key (vendor_key)
{}

duplex_option::duplex_option ()
  : type (NO_DUPLEX), is_default (false)
{}

duplex_capability::duplex_capability (const container& options,
                                      const std::string& vendor_key)
  : choice< duplex_option > (options), vendor_key (vendor_key)
{}

dpi_option::dpi_option ()
  : horizontal_dpi (0), vertical_dpi (0), is_default (false)
{}

margins_option::margins_option ()
  : type (STANDARD)
  , top_microns (0), right_microns (0), bottom_microns (0), left_microns (0)
  , is_default (false)
{}

printing_speed_option::printing_speed_option ()
  : speed_ppm (0)
{}

select_option::select_option ()
  : is_default (false)
{}

typed_value_capability::typed_value_capability ()
  : value_type (STRING)
{}

vendor_capability::vendor_capability ()
  : type (SELECT)
{}

const char *
to_string (color_type t)
{
  switch (t)
    {
    case STANDARD_COLOR:      return "STANDARD_COLOR";
    case STANDARD_MONOCHROME: return "STANDARD_MONOCHROME";
    case CUSTOM_COLOR:        return "CUSTOM_COLOR";
    case CUSTOM_MONOCHROME:   return "CUSTOM_MONOCHROME";
    case AUTO:                return "AUTO";
    }
  return "";
}

const char *
to_string (duplex_type t)
{
  switch (t)
    {
    case NO_DUPLEX:  return "NO_DUPLEX";
    case LONG_EDGE:  return "LONG_EDGE";
    case SHORT_EDGE: return "SHORT_EDGE";
    }
  return "";
}

const char *
to_string (margins_type t)
{
  switch (t)
    {
    case BORDERLESS: return "BORDERLESS";
    case STANDARD:   return "STANDARD";
    case CUSTOM:     return "CUSTOM";
    }
  return "";
}

const char *
to_string (vendor_capability_type t)
{
  switch (t)
    {
    case RANGE:       return "RANGE";
    case SELECT:      return "SELECT";
    case TYPED_VALUE: return "TYPED_VALUE";
    }
  return "";
}

const char *
to_string (typed_value_type t)
{
  switch (t)
    {
    case BOOLEAN: return "BOOLEAN";
    case FLOAT:   return "FLOAT";
    case INTEGER: return "INTEGER";
    case STRING:  return "STRING";
    }
  return "";
}

namespace {

  const char *
  mark (bool is_default)
  {
    return (is_default ? " *" : "");
  }
}       // namespace

std::ostream&
operator<< (std::ostream& os, const printer_description& pd)
{
  if (pd.media_size)
    {
      os << "media_size\n";
      BOOST_FOREACH (const media_size_option& o, pd.media_size->option ())
        {
          os << "  " << o.name << " " << o.width_microns << "x"
             << o.height_microns << "um " << o.vendor_id
             << " \"" << o.custom_display_name << "\""
             << mark (o.is_default) << "\n";
        }
    }
  if (pd.color)
    {
      os << "color (" << pd.color->vendor_key << ")\n";
      BOOST_FOREACH (const color_option& o, pd.color->option ())
        {
          os << "  " << to_string (o.type) << " " << o.vendor_id
             << " \"" << o.custom_display_name << "\""
             << mark (o.is_default) << "\n";
        }
    }
  if (pd.duplex)
    {
      os << "duplex (" << pd.duplex->vendor_key << ")\n";
      BOOST_FOREACH (const duplex_option& o, pd.duplex->option ())
        {
          os << "  " << to_string (o.type) << " " << o.vendor_id
             << mark (o.is_default) << "\n";
        }
    }
  if (pd.dpi)
    {
      os << "dpi\n";
      BOOST_FOREACH (const dpi_option& o, pd.dpi->option ())
        {
          os << "  " << o.horizontal_dpi << "x" << o.vertical_dpi << " "
             << o.vendor_id << " \"" << o.custom_display_name << "\""
             << mark (o.is_default) << "\n";
        }
    }
  if (pd.margins)
    {
      os << "margins\n";
      BOOST_FOREACH (const margins_option& o, pd.margins->option ())
        {
          os << "  " << to_string (o.type)
             << " top " << o.top_microns << " right " << o.right_microns
             << " bottom " << o.bottom_microns << " left " << o.left_microns
             << mark (o.is_default) << "\n";
        }
    }
  if (pd.printing_speed)
    {
      os << "printing_speed\n";
      BOOST_FOREACH (const printing_speed_option& o, pd.printing_speed->option)
        {
          os << "  " << o.speed_ppm << " ppm";
          BOOST_FOREACH (color_type t, o.color_types)
            {
              os << " " << to_string (t);
            }
          os << "\n";
        }
    }
  BOOST_FOREACH (const vendor_capability& vc, pd.vendor_capabilities)
    {
      os << "vendor_capability " << vc.id << " \"" << vc.display_name
         << "\" " << to_string (vc.type) << "\n";
      if (vc.select_cap)
        {
          BOOST_FOREACH (const select_option& o, vc.select_cap->option ())
            {
              os << "  " << o.value << " \"" << o.display_name << "\""
                 << mark (o.is_default) << "\n";
            }
        }
      if (vc.typed_value_cap)
        {
          os << "  " << to_string (vc.typed_value_cap->value_type);
          if (!vc.typed_value_cap->default_value.empty ())
            os << " default " << vc.typed_value_cap->default_value;
          os << "\n";
        }
    }
  return os;
}

}       // namespace cdd
}       // namespace cupsconn
