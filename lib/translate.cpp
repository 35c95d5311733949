//  translate.cpp -- PPD to cloud device description mapping
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

#include <map>
#include <set>

#include <boost/assign/list_of.hpp>
#include <boost/foreach.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/regex.hpp>

#include "cupsconn/log.hpp"
#include "cupsconn/media.hpp"
#include "cupsconn/translate.hpp"
#include "cupsconn/units.hpp"

namespace cupsconn {

namespace {

  const std::string locked_print_id
  ("JobType:LockedPrint/LockedPrintPassword");
  const std::string locked_print_name ("Password (4 numbers)");

  const boost::regex model_noise_re
  ("\\s+("
   "(w/)?PS2?3?(\\(P\\))?(,\\s+[0-9.]+)?|"
   "pcl3?(,\\s+\\d+(\\.\\d+))*|"
   "-|PXL|PDF|cups-team|CUPS\\+Gutenprint\\s+v\\S+|\\(?recommended\\)?|"
   "(A4|Letter)(\\+Duplex)?|"
   "Post[Ss]cript|BR-Script2?3?J?|"
   "v[0-9.]+|"
   "\\(?KPDL(-2)?\\)?|"
   "Foomatic/\\S+|Epson Inkjet Printer Driver \\(ESC/P-R\\) for \\S+|"
   "(hpcups|hpijs|HPLIP),?\\s+\\d+(\\.\\d+)*|requires proprietary plugin"
   ")\\s*\\z");

  const boost::regex page_size_re ("([\\d.]+)(?:mm|in)?x([\\d.]+)(mm|in)?");
  const boost::regex color_re ("\\A(?:cmy|rgb|color)", boost::regex::icase);
  const boost::regex gray_re  ("\\A(?:gray|black|mono)", boost::regex::icase);
  const boost::regex on_off_re ("\\A(?:on|off)\\s*-?\\s*", boost::regex::icase);
  const boost::regex resolution_re ("(\\d+)(?:x(\\d+))?dpi");
  const boost::regex hw_margins_re ("(\\d+)\\s+(\\d+)\\s+(\\d+)\\s+(\\d+)");

  const std::map< std::string, std::string > manufacturers
  = boost::assign::map_list_of
    ("BROTHER"        , "Brother")
    ("CANON"          , "Canon")
    ("DELL"           , "Dell")
    ("EPSON"          , "Epson")
    ("FUJI XEROX"     , "Fuji Xerox")
    ("GESTETNER"      , "Gestetner")
    ("HEWLETT-PACKARD", "Hewlett-Packard")
    ("INFOTEC"        , "Infotec")
    ("KODAK"          , "Kodak")
    ("KONICA MINOLTA" , "Konica Minolta")
    ("KYOCERA"        , "Kyocera")
    ("KYOCERA MITA"   , "Kyocera Mita")
    ("LANIER"         , "Lanier")
    ("LEXMARK"        , "Lexmark")
    ("MINOLTA"        , "Minolta")
    ("NASHUATEC"      , "Nashuatec")
    ("OKIDATA"        , "Okidata")
    ("PANASONIC"      , "Panasonic")
    ("RICOH"          , "Ricoh")
    ("SAMSUNG"        , "Samsung")
    ("SAVIN"          , "Savin")
    ("SHARP"          , "Sharp")
    ("TOSHIBA"        , "Toshiba")
    ("XEROX"          , "Xerox")
    ("ZEBRA"          , "Zebra")
    ;

  bool
  starts_with (const std::string& s, const std::string& prefix)
  {
    return 0 == s.compare (0, prefix.size (), prefix);
  }

  bool
  ends_with (const std::string& s, const std::string& suffix)
  {
    return (s.size () >= suffix.size ()
            && 0 == s.compare (s.size () - suffix.size (), suffix.size (),
                               suffix));
  }

  std::string
  trim_suffix (const std::string& s, const std::string& suffix)
  {
    return (ends_with (s, suffix)
            ? s.substr (0, s.size () - suffix.size ()) : s);
  }

  //! Makes a page size out of a "WIDTHxHEIGHT[mm|in]" pattern
  /*! The option keyword is tried first, then its translation.
   *  Dimensions without units are taken to be in inches.
   */
  boost::optional< cdd::media_size_option >
  custom_media_size (const ppd::statement& option)
  {
    boost::smatch m;

    if (!boost::regex_search (option.option_keyword, m, page_size_re)
        && !boost::regex_search (option.translation, m, page_size_re))
      return boost::none;

    float width;
    float height;
    try
      {
        width  = boost::lexical_cast< float > (m[1].str ());
        height = boost::lexical_cast< float > (m[2].str ());
      }
    catch (const boost::bad_lexical_cast&)
      {
        log::brief (log::PPD, "%1%: unusable page size dimensions")
          % option.option_keyword;
        return boost::none;
      }

    bool metric = ("mm" == m[3]);
    if (metric ? !(mm_fit (width) && mm_fit (height))
        : !(inches_fit (width) && inches_fit (height)))
      {
        log::brief (log::PPD, "%1%: page size out of range")
          % option.option_keyword;
        return boost::none;
      }

    cdd::media_size_option rv;
    rv.name = "CUSTOM";
    if (metric)
      {
        rv.width_microns  = mm_to_microns (width);
        rv.height_microns = mm_to_microns (height);
      }
    else
      {
        rv.width_microns  = inches_to_microns (width);
        rv.height_microns = inches_to_microns (height);
      }
    rv.vendor_id = option.option_keyword;
    rv.custom_display_name = option.translation;

    return rv;
  }

  //! Marks the option whose \a key matches \a value, else the first
  template< typename Option, typename Key >
  void
  mark_default (std::vector< Option >& options, Key Option::*key,
                const std::string& value)
  {
    typename std::vector< Option >::iterator it = options.begin ();
    for (; options.end () != it; ++it)
      {
        if (value == (*it).*key)
          {
            it->is_default = true;
            return;
          }
      }
    options.front ().is_default = true;
  }

  cdd::color_option
  color_choice (const ppd::statement& o, cdd::color_type type)
  {
    cdd::color_option rv;

    rv.vendor_id = o.option_keyword;
    rv.type      = type;
    rv.custom_display_name = cleanup_color_name (o.option_keyword,
                                                 o.translation);
    return rv;
  }

  void
  add_color_bucket (std::vector< cdd::color_option >& options,
                    const std::vector< ppd::statement >& bucket,
                    cdd::color_type single, cdd::color_type multiple)
  {
    cdd::color_type type = (1 == bucket.size () ? single : multiple);

    BOOST_FOREACH (const ppd::statement& o, bucket)
      {
        options.push_back (color_choice (o, type));
      }
  }
}       // namespace

boost::optional< cdd::media_size_capability >
convert_media_size (const ppd::entry& e)
{
  std::vector< cdd::media_size_option > options;

  BOOST_FOREACH (const ppd::statement& o, e.options)
    {
      if (ends_with (o.option_keyword, ".FullBleed")) continue;

      boost::optional< cdd::media_size_option > size
        = media::lookup (o.option_keyword);
      if (!size) size = custom_media_size (o);
      if (!size)
        {
          log::debug (log::PPD, "%1%: unknown page size") % o.option_keyword;
          continue;
        }
      options.push_back (*size);
    }

  if (options.empty ())
    {
      log::brief (log::PPD, "%1%: no usable page sizes") % e.main_keyword;
      return boost::none;
    }

  mark_default (options, &cdd::media_size_option::vendor_id,
                e.default_value);
  return cdd::media_size_capability (options);
}

boost::optional< cdd::color_capability >
convert_color (const ppd::entry& e)
{
  std::vector< ppd::statement > colors, grays, others;

  BOOST_FOREACH (const ppd::statement& o, e.options)
    {
      /**/ if (boost::regex_search (o.option_keyword, gray_re))
        grays.push_back (o);
      else if (boost::regex_search (o.option_keyword, color_re))
        colors.push_back (o);
      else
        others.push_back (o);
    }

  std::vector< cdd::color_option > options;
  add_color_bucket (options, colors,
                    cdd::STANDARD_COLOR, cdd::CUSTOM_COLOR);
  add_color_bucket (options, grays,
                    cdd::STANDARD_MONOCHROME, cdd::CUSTOM_MONOCHROME);
  BOOST_FOREACH (const ppd::statement& o, others)
    {
      options.push_back (color_choice (o, cdd::CUSTOM_MONOCHROME));
    }

  if (options.empty ()) return boost::none;

  mark_default (options, &cdd::color_option::vendor_id, e.default_value);
  return cdd::color_capability (options, e.main_keyword);
}

boost::optional< cdd::duplex_capability >
convert_duplex (const ppd::entry& e)
{
  static const std::set< std::string > no_duplex
    = boost::assign::list_of ("None") ("False") ("Single");
  static const std::set< std::string > long_edge
    = boost::assign::list_of ("DuplexNoTumble") ("True") ("Double");
  static const std::set< std::string > short_edge
    = boost::assign::list_of ("DuplexTumble") ("Booklet");

  std::vector< cdd::duplex_option > options;

  BOOST_FOREACH (const ppd::statement& o, e.options)
    {
      const std::string& kw (o.option_keyword);
      cdd::duplex_option d;

      /**/ if (no_duplex.count (kw))  d.type = cdd::NO_DUPLEX;
      else if (long_edge.count (kw))  d.type = cdd::LONG_EDGE;
      else if (short_edge.count (kw)) d.type = cdd::SHORT_EDGE;
      else if (starts_with (kw, "1")) d.type = cdd::NO_DUPLEX;
      else if (starts_with (kw, "2")) d.type = cdd::LONG_EDGE;
      else
        {
          log::debug (log::PPD, "%1%: unknown duplex mode") % kw;
          continue;
        }
      d.vendor_id = kw;
      options.push_back (d);
    }

  if (options.empty ()) return boost::none;

  mark_default (options, &cdd::duplex_option::vendor_id, e.default_value);
  return cdd::duplex_capability (options, e.main_keyword);
}

boost::optional< cdd::dpi_capability >
convert_dpi (const ppd::entry& e)
{
  std::vector< cdd::dpi_option > options;

  BOOST_FOREACH (const ppd::statement& o, e.options)
    {
      boost::smatch m;
      if (!boost::regex_match (o.option_keyword, m, resolution_re))
        continue;

      cdd::dpi_option d;
      try
        {
          d.horizontal_dpi = boost::lexical_cast< int32_t > (m[1].str ());
          d.vertical_dpi   = (m[2].matched
                              ? boost::lexical_cast< int32_t > (m[2].str ())
                              : d.horizontal_dpi);
        }
      catch (const boost::bad_lexical_cast&)
        {
          log::brief (log::PPD, "%1%: resolution out of range")
            % o.option_keyword;
          continue;
        }
      d.vendor_id = o.option_keyword;
      d.custom_display_name = o.translation;
      options.push_back (d);
    }

  if (options.empty ())
    {
      log::brief (log::PPD, "%1%: no usable resolutions") % e.main_keyword;
      return boost::none;
    }

  mark_default (options, &cdd::dpi_option::vendor_id, e.default_value);
  return cdd::dpi_capability (options);
}

cdd::vendor_capability
convert_vendor_capability (const ppd::entry& e)
{
  cdd::vendor_capability vc;

  vc.id = e.main_keyword;
  vc.display_name = e.translation;

  if (ppd::entry::pick_one == e.type)
    {
      std::vector< cdd::select_option > options;

      BOOST_FOREACH (const ppd::statement& o, e.options)
        {
          cdd::select_option so;
          so.value = o.option_keyword;
          so.display_name = (o.translation.empty ()
                             ? o.option_keyword : o.translation);
          options.push_back (so);
        }
      mark_default (options, &cdd::select_option::value, e.default_value);

      vc.type = cdd::SELECT;
      vc.select_cap = cdd::select_capability (options);
    }
  else
    {
      cdd::typed_value_capability tv;
      tv.value_type = cdd::BOOLEAN;
      tv.default_value = e.default_value;

      vc.type = cdd::TYPED_VALUE;
      vc.typed_value_cap = tv;
    }
  return vc;
}

boost::optional< cdd::vendor_capability >
convert_locked_print_password (const ppd::entry& job_type,
                               const ppd::entry&)
{
  bool locked_print = false;

  BOOST_FOREACH (const ppd::statement& o, job_type.options)
    {
      if ("LockedPrint" == o.option_keyword) locked_print = true;
    }
  if (!locked_print) return boost::none;

  cdd::vendor_capability vc;
  vc.id = locked_print_id;
  vc.display_name = locked_print_name;
  vc.type = cdd::TYPED_VALUE;

  cdd::typed_value_capability tv;
  tv.value_type = cdd::STRING;
  vc.typed_value_cap = tv;

  return vc;
}

boost::optional< cdd::margins_capability >
convert_margins (const std::string& hw_margins)
{
  boost::smatch m;
  if (!boost::regex_match (hw_margins, m, hw_margins_re))
    {
      log::brief (log::PPD, "unsupported HWMargins: %1%") % hw_margins;
      return boost::none;
    }

  int32_t microns[4];
  bool borderless = true;

  for (int i = 0; i < 4; ++i)
    {
      int64_t points;
      try
        {
          points = boost::lexical_cast< int32_t > (m[i + 1].str ());
        }
      catch (const boost::bad_lexical_cast&)
        {
          log::brief (log::PPD, "HWMargins out of range: %1%") % hw_margins;
          return boost::none;
        }
      if (!points_fit (points))
        {
          log::brief (log::PPD, "HWMargins out of range: %1%") % hw_margins;
          return boost::none;
        }
      if (0 < points) borderless = false;
      microns[i] = points_to_microns (points);
    }

  cdd::margins_option o;
  o.type = (borderless ? cdd::BORDERLESS : cdd::STANDARD);
  o.left_microns   = microns[0];
  o.bottom_microns = microns[1];
  o.right_microns  = microns[2];
  o.top_microns    = microns[3];
  o.is_default = true;

  return cdd::margins_capability (std::vector< cdd::margins_option > (1, o));
}

boost::optional< cdd::printing_speed_capability >
convert_printing_speed (const std::string& throughput,
                        const boost::optional< cdd::color_capability >& color)
{
  int32_t ppm;
  try
    {
      ppm = boost::lexical_cast< int32_t > (throughput);
    }
  catch (const boost::bad_lexical_cast&)
    {
      log::brief (log::PPD, "unsupported Throughput: %1%") % throughput;
      return boost::none;
    }

  cdd::printing_speed_option o;
  o.speed_ppm = ppm;

  if (color)
    {
      std::set< cdd::color_type > types;
      BOOST_FOREACH (const cdd::color_option& co, color->option ())
        {
          types.insert (co.type);
        }
      o.color_types.assign (types.begin (), types.end ());
    }

  cdd::printing_speed_capability rv;
  rv.option.push_back (o);
  return rv;
}

std::string
cleanup_model (const std::string& model)
{
  std::string rv (model);

  for (;;)
    {
      std::string s = boost::regex_replace (rv, model_noise_re, "");

      // these come without leading whitespace
      s = trim_suffix (s, ",");
      s = trim_suffix (s, "(PS)");

      if (s == rv) break;
      rv = s;
    }
  return rv;
}

std::string
cleanup_color_name (const std::string& keyword,
                    const std::string& translation)
{
  std::string name = boost::regex_replace (translation, on_off_re, "");

  if (name == translation) return translation;

  if (boost::regex_search (keyword, gray_re)
      || boost::regex_search (name, gray_re))
    return (name.empty () ? "Gray" : "Gray, " + name);

  if (boost::regex_search (keyword, color_re)
      || boost::regex_search (name, color_re))
    return (name.empty () ? "Color" : "Color, " + name);

  return name;
}

std::string
normalize_manufacturer (const std::string& manufacturer)
{
  std::map< std::string, std::string >::const_iterator it
    = manufacturers.find (manufacturer);

  return (manufacturers.end () == it ? manufacturer : it->second);
}

translation
translate_ppd (const std::string& text)
{
  ppd::groups g = ppd::group (ppd::parse (text));
  ppd::filter_constraints (g);
  ppd::entries entries = ppd::convert (g.ui);

  translation rv;
  cdd::printer_description& pd (rv.description);
  const ppd::entry *e = nullptr;

  if ((e = entries.find ("PageSize")))
    pd.media_size = convert_media_size (*e);

  if ((e = entries.find ("ColorModel"))
      || (e = entries.find ("CMAndResolution"))
      || (e = entries.find ("SelectColor")))
    pd.color = convert_color (*e);

  if ((e = entries.find ("Duplex"))
      || (e = entries.find ("KMDuplex")))
    pd.duplex = convert_duplex (*e);

  if ((e = entries.find ("Resolution")))
    pd.dpi = convert_dpi (*e);

  if ((e = entries.find ("OutputBin")))
    pd.vendor_capabilities.push_back (convert_vendor_capability (*e));

  const ppd::entry *job_type = entries.find ("JobType");
  const ppd::entry *password = entries.find ("LockedPrintPassword");
  if (job_type && password)
    {
      boost::optional< cdd::vendor_capability > vc
        = convert_locked_print_password (*job_type, *password);
      if (vc) pd.vendor_capabilities.push_back (*vc);
    }

  if ((e = entries.find_translation ("Print Quality")))
    pd.vendor_capabilities.push_back (convert_vendor_capability (*e));

  std::string nick_name;
  std::string model_name;
  BOOST_FOREACH (const ppd::statement& s, g.standalone)
    {
      const std::string& kw (s.main_keyword);

      /**/ if ("Manufacturer" == kw) rv.manufacturer = s.value;
      else if ("NickName"     == kw) nick_name  = s.value;
      else if ("ModelName"    == kw) model_name = s.value;
      else if ("HWMargins"    == kw) pd.margins = convert_margins (s.value);
      else if ("Throughput"   == kw)
        pd.printing_speed = convert_printing_speed (s.value, pd.color);
    }

  std::string model
    = cleanup_model (nick_name.empty () ? model_name : nick_name);
  std::string manufacturer = normalize_manufacturer (rv.manufacturer);

  if (!rv.manufacturer.empty () && starts_with (model, rv.manufacturer))
    model.erase (0, rv.manufacturer.size ());
  else if (!manufacturer.empty () && starts_with (model, manufacturer))
    model.erase (0, manufacturer.size ());
  model.erase (0, model.find_first_not_of (' '));

  rv.manufacturer = manufacturer;
  rv.model = model;

  return rv;
}

}       // namespace cupsconn
