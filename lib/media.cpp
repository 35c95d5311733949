//  media.cpp -- well-known PPD page sizes
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

#include <boost/assign/list_inserter.hpp>

#include "cupsconn/media.hpp"
#include "cupsconn/units.hpp"

namespace cupsconn {

namespace {

  enum unit { in, mm };

  cdd::media_size_option
  size (const char *name, unit u, float width, float height,
        const char *display_name)
  {
    cdd::media_size_option rv;

    rv.name = name;
    rv.width_microns  = (in == u
                         ? inches_to_microns (width)
                         : mm_to_microns (width));
    rv.height_microns = (in == u
                         ? inches_to_microns (height)
                         : mm_to_microns (height));
    rv.custom_display_name = display_name;

    return rv;
  }

  typedef std::map< std::string, cdd::media_size_option > dictionary;

  dictionary
  make_dictionary ()
  {
    dictionary dict;

    boost::assign::insert (dict)
      ("3x5",                   size ("NA_INDEX_3X5",   in,       3,       5, "3x5"))
      ("4x6",                   size ("NA_INDEX_4X6",   in,       4,       6, "4x6"))
      ("5x7",                   size ("NA_5X7",         in,       5,       7, "5x7"))
      ("5x8",                   size ("NA_INDEX_5X8",   in,       5,       8, "5x8"))
      ("6x9",                   size ("NA_6X9",         in,       6,       9, "6x9"))
      ("6.5x9.5",               size ("NA_C5",          in,     6.5,     9.5, "6.5x9.5"))
      ("7x9",                   size ("NA_7X9",         in,       7,       9, "7x9"))
      ("8x10",                  size ("NA_GOVT_LETTER", in,       8,      10, "8x10"))
      ("8x13",                  size ("NA_GOVT_LEGAL",  in,       8,      13, "8x13"))
      ("9x11",                  size ("NA_9X11",        in,       9,      11, "9x11"))
      ("10x11",                 size ("NA_10X11",       in,      10,      11, "10x11"))
      ("10x13",                 size ("NA_10X13",       in,      10,      13, "10x13"))
      ("10x14",                 size ("NA_10X14",       in,      10,      14, "10x14"))
      ("10x15",                 size ("NA_10X15",       in,      10,      15, "10x15"))
      ("11x12",                 size ("NA_11X12",       in,      11,      12, "11x12"))
      ("11x14",                 size ("NA_EDP",         in,      11,      14, "11x14"))
      ("11x15",                 size ("NA_11X15",       in,      11,      15, "11x15"))
      ("11x17",                 size ("NA_LEDGER",      in,      11,      17, "11x17"))
      ("12x18",                 size ("NA_ARCH_B",      in,      12,      18, "12x18"))
      ("12x19",                 size ("NA_12X19",       in,      12,      19, "12x19"))
      ("13x19",                 size ("NA_SUPER_B",     in,      13,      19, "13x19"))
      ("EnvPersonal",           size ("NA_PERSONAL",    in,   3.625,     6.5, "EnvPersonal"))
      ("Monarch",               size ("NA_MONARCH",     in,   3.875,     7.5, "Monarch"))
      ("EnvMonarch",            size ("NA_MONARCH",     in,   3.875,     7.5, "Monarch"))
      ("Comm10",                size ("NA_NUMBER_10",   in,   4.125,     9.5, "Comm10"))
      ("EnvA2",                 size ("NA_A2",          in,   4.375,    5.75, "EnvA2"))
      ("Env9",                  size ("NA_NUMBER_9",    in,   3.875,   8.875, "Env9"))
      ("Env10",                 size ("NA_NUMBER_10",   in,   4.125,     9.5, "Env10"))
      ("Env11",                 size ("NA_NUMBER_11",   in,     4.5,  10.375, "Env11"))
      ("Env12",                 size ("NA_NUMBER_12",   in,    4.75,      11, "Env12"))
      ("Env14",                 size ("NA_NUMBER_14",   in,       5,    11.5, "Env14"))
      ("Statement",             size ("NA_INVOICE",     in,     5.5,     8.5, "Statement"))
      ("Executive",             size ("NA_EXECUTIVE",   in,    7.25,    10.5, "Executive"))
      ("Quarto",                size ("NA_QUARTO",      in,     8.5,   10.83, "Quarto"))
      ("EngQuatro",             size ("CUSTOM",         in,       8,      10, "English Quatro 8x10"))
      ("Letter",                size ("NA_LETTER",      in,     8.5,      11, "Letter"))
      ("LetterExtra",           size ("NA_LETTER_EXTRA", in,     9.5,      12, "Letter Extra"))
      ("LetterPlus",            size ("NA_LETTER_PLUS", in,     8.5,   12.69, "Letter Plus"))
      ("Legal",                 size ("NA_LEGAL",       in,     8.5,      14, "Legal"))
      ("LegalExtra",            size ("NA_LEGAL_EXTRA", in,     9.5,      15, "Legal Extra"))
      ("FanFoldGerman",         size ("NA_FANFOLD_EUR", in,     8.5,      12, "FanFoldGerman"))
      ("Foolscap",              size ("NA_FOOLSCAP",    in,     8.5,      13, "Foolscap"))
      ("FanFoldGermanLegal",    size ("NA_FOOLSCAP",    in,     8.5,      13, "Fan Fold German Legal"))
      ("GovernmentLG",          size ("NA_FOOLSCAP",    in,     8.5,      13, "GovernmentLG"))
      ("SuperA",                size ("NA_SUPER_A",     in,    8.94,      14, "Super A"))
      ("SuperB",                size ("NA_B_PLUS",      in,      12,   19.17, "Super B"))
      ("Tabloid",               size ("NA_LEDGER",      in,      11,      17, "Tabloid"))
      ("Ledger",                size ("NA_LEDGER",      in,      11,      17, "Ledger"))
      ("ARCHA",                 size ("NA_ARCH_A",      in,       9,      12, "Arch A"))
      ("ARCHB",                 size ("NA_ARCH_B",      in,      12,      18, "Arch B"))
      ("ARCHC",                 size ("NA_ARCH_C",      in,      18,      24, "Arch C"))
      ("ARCHD",                 size ("NA_ARCH_D",      in,      24,      36, "Arch D"))
      ("ARCHE",                 size ("NA_ARCH_E",      in,      36,      48, "Arch E"))
      ("AnsiC",                 size ("NA_C",           in,      17,      22, "ANSI C"))
      ("AnsiD",                 size ("NA_D",           in,      22,      34, "ANSI D"))
      ("AnsiE",                 size ("NA_E",           in,      34,      44, "ANSI E"))
      ("AnsiF",                 size ("NA_F",           in,      44,      68, "ANSI F"))
      ("F",                     size ("NA_F",           in,      44,      68, "ANSI F"))
      ("roc16k",                size ("ROC_16K",        in,    7.75,   10.75, "16K (ROC)"))
      ("roc8k",                 size ("ROC_8K",         in,   10.75,    15.5, "8K (ROC)"))
      ("PRC32K",                size ("PRC_32K",        mm,      97,     151, "32K (PRC)"))
      ("EnvPRC1",               size ("PRC_1",          mm,     102,     165, "EnvPRC1"))
      ("EnvPRC2",               size ("PRC_2",          mm,     102,     176, "EnvPRC2"))
      ("EnvPRC4",               size ("PRC_4",          mm,     110,     208, "EnvPRC4"))
      ("EnvPRC5",               size ("PRC_5",          mm,     110,     220, "EnvPRC5"))
      ("EnvPRC8",               size ("PRC_8",          mm,     120,     309, "EnvPRC8"))
      ("EnvPRC6",               size ("PRC_6",          mm,     120,     230, "EnvPRC6"))
      ("EnvPRC3",               size ("PRC_3",          mm,     125,     176, "EnvPRC3"))
      ("PRC16K",                size ("PRC_16K",        mm,     146,     215, "PRC16K"))
      ("EnvPRC7",               size ("PRC_7",          mm,     160,     230, "EnvPRC7"))
      ("A0",                    size ("ISO_A0",         mm,     841,    1189, "A0"))
      ("A1",                    size ("ISO_A1",         mm,     594,     841, "A1"))
      ("A2",                    size ("ISO_A2",         mm,     420,     594, "A2"))
      ("A3",                    size ("ISO_A3",         mm,     297,     420, "A3"))
      ("A3Extra",               size ("ISO_A3_EXTRA",   mm,     322,     445, "A3 Extra"))
      ("A4",                    size ("ISO_A4",         mm,     210,     297, "A4"))
      ("A4Extra",               size ("ISO_A4_EXTRA",   mm,   235.5,   322.3, "A4 Extra"))
      ("A4Tab",                 size ("ISO_A4_TAB",     mm,     225,     297, "A4 Tab"))
      ("A5",                    size ("ISO_A5",         mm,     148,     210, "A5"))
      ("A5Extra",               size ("ISO_A5_EXTRA",   mm,     174,     235, "A5 Extra"))
      ("A6",                    size ("ISO_A6",         mm,     105,     148, "A6"))
      ("A7",                    size ("ISO_A7",         mm,      74,     105, "A7"))
      ("A8",                    size ("ISO_A8",         mm,      52,      74, "A8"))
      ("A9",                    size ("ISO_A9",         mm,      37,      52, "A9"))
      ("A10",                   size ("ISO_A10",        mm,      26,      37, "A10"))
      ("ISOB0",                 size ("ISO_B0",         mm,    1000,    1414, "B0 (ISO)"))
      ("ISOB1",                 size ("ISO_B1",         mm,     707,    1000, "B1 (ISO)"))
      ("ISOB2",                 size ("ISO_B2",         mm,     500,     707, "B2 (ISO)"))
      ("ISOB3",                 size ("ISO_B3",         mm,     353,     500, "B3 (ISO)"))
      ("ISOB4",                 size ("ISO_B4",         mm,     250,     353, "B4 (ISO)"))
      ("ISOB5",                 size ("ISO_B5",         mm,     176,     250, "B5 (ISO)"))
      ("EnvISOB5",              size ("ISO_B5",         mm,     176,     250, "B5 Envelope (ISO)"))
      ("ISOB5Extra",            size ("ISO_B5_EXTRA",   mm,     201,     276, "B5 Extra (ISO)"))
      ("ISOB6",                 size ("ISO_B6",         mm,     125,     176, "B6 (ISO)"))
      ("ISOB7",                 size ("ISO_B7",         mm,      88,     125, "B7 (ISO)"))
      ("ISOB8",                 size ("ISO_B8",         mm,      62,      88, "B8 (ISO)"))
      ("ISOB9",                 size ("ISO_B9",         mm,      44,      62, "B9 (ISO)"))
      ("ISOB10",                size ("ISO_B10",        mm,      31,      44, "B10 (ISO)"))
      ("EnvC0",                 size ("ISO_C0",         mm,     917,    1297, "C0 (ISO)"))
      ("EnvC1",                 size ("ISO_C1",         mm,     648,     917, "C1 (ISO)"))
      ("EnvC2",                 size ("ISO_C2",         mm,     458,     648, "C2 (ISO)"))
      ("EnvC3",                 size ("ISO_C3",         mm,     324,     458, "C3 (ISO)"))
      ("EnvC4",                 size ("ISO_C4",         mm,     229,     324, "C4 (ISO)"))
      ("EnvC5",                 size ("ISO_C5",         mm,     162,     229, "C5 (ISO)"))
      ("EnvC6",                 size ("ISO_C6",         mm,     114,     162, "C6 (ISO)"))
      ("EnvC65",                size ("ISO_C6C5",       mm,     114,     229, "C6c5 (ISO)"))
      ("EnvC7",                 size ("ISO_C7",         mm,      81,     114, "C7 (ISO)"))
      ("EnvDL",                 size ("ISO_DL",         mm,     110,     220, "DL Envelope"))
      ("DLEnv",                 size ("ISO_DL",         mm,     110,     220, "DL Envelope"))
      ("RA0",                   size ("ISO_RA0",        mm,     860,    1220, "RA0"))
      ("RA1",                   size ("ISO_RA1",        mm,     610,     860, "RA1"))
      ("RA2",                   size ("ISO_RA2",        mm,     430,     610, "RA2"))
      ("RA3",                   size ("CUSTOM",         mm,     305,     430, "RA3"))
      ("RA4",                   size ("CUSTOM",         mm,     215,     305, "RA4"))
      ("SRA0",                  size ("ISO_SRA0",       mm,     900,    1280, "SRA0"))
      ("SRA1",                  size ("ISO_SRA1",       mm,     640,     900, "SRA1"))
      ("SRA2",                  size ("ISO_SRA2",       mm,     450,     640, "SRA2"))
      ("SRA3",                  size ("CUSTOM",         mm,     320,     450, "SRA3"))
      ("SRA4",                  size ("CUSTOM",         mm,     225,     320, "SRA4"))
      ("JISB0",                 size ("JIS_B0",         mm,    1030,    1456, "B0 (JIS)"))
      ("B0JIS",                 size ("JIS_B0",         mm,    1030,    1456, "B0 (JIS)"))
      ("B0",                    size ("JIS_B0",         mm,    1030,    1456, "B0 (JIS)"))
      ("JISB1",                 size ("JIS_B1",         mm,     728,    1030, "B1 (JIS)"))
      ("B1JIS",                 size ("JIS_B1",         mm,     728,    1030, "B1 (JIS)"))
      ("B1",                    size ("JIS_B1",         mm,     728,    1030, "B1 (JIS)"))
      ("JISB2",                 size ("JIS_B2",         mm,     515,     728, "B2 (JIS)"))
      ("B2JIS",                 size ("JIS_B2",         mm,     515,     728, "B2 (JIS)"))
      ("B2",                    size ("JIS_B2",         mm,     515,     728, "B2 (JIS)"))
      ("JISB3",                 size ("JIS_B3",         mm,     364,     515, "B3 (JIS)"))
      ("B3JIS",                 size ("JIS_B3",         mm,     364,     515, "B3 (JIS)"))
      ("B3",                    size ("JIS_B3",         mm,     364,     515, "B3 (JIS)"))
      ("JISB4",                 size ("JIS_B4",         mm,     257,     364, "B4 (JIS)"))
      ("B4JIS",                 size ("JIS_B4",         mm,     257,     364, "B4 (JIS)"))
      ("B4",                    size ("JIS_B4",         mm,     257,     364, "B4 (JIS)"))
      ("JISB5",                 size ("JIS_B5",         mm,     182,     257, "B5 (JIS)"))
      ("B5JIS",                 size ("JIS_B5",         mm,     182,     257, "B5 (JIS)"))
      ("B5",                    size ("JIS_B5",         mm,     182,     257, "B5 (JIS)"))
      ("JISB6",                 size ("JIS_B6",         mm,     128,     182, "B6 (JIS)"))
      ("B6JIS",                 size ("JIS_B6",         mm,     128,     182, "B6 (JIS)"))
      ("B6",                    size ("JIS_B6",         mm,     128,     182, "B6 (JIS)"))
      ("JISB7",                 size ("JIS_B7",         mm,      91,     128, "B7 (JIS)"))
      ("B7JIS",                 size ("JIS_B7",         mm,      91,     128, "B7 (JIS)"))
      ("B7",                    size ("JIS_B7",         mm,      91,     128, "B7 (JIS)"))
      ("JISB8",                 size ("JIS_B8",         mm,      64,      91, "B8 (JIS)"))
      ("B8JIS",                 size ("JIS_B8",         mm,      64,      91, "B8 (JIS)"))
      ("B8",                    size ("JIS_B8",         mm,      64,      91, "B8 (JIS)"))
      ("JISB9",                 size ("JIS_B9",         mm,      45,      64, "B9 (JIS)"))
      ("B9JIS",                 size ("JIS_B9",         mm,      45,      64, "B9 (JIS)"))
      ("B9",                    size ("JIS_B9",         mm,      45,      64, "B9 (JIS)"))
      ("JISB10",                size ("JIS_B10",        mm,      32,      45, "B10 (JIS)"))
      ("B10JIS",                size ("JIS_B10",        mm,      32,      45, "B10 (JIS)"))
      ("B10",                   size ("JIS_B10",        mm,      32,      45, "B10 (JIS)"))
      ("EnvChou4",              size ("JPN_CHOU4",      mm,      90,     205, "EnvChou4"))
      ("Hagaki",                size ("JPN_HAGAKI",     mm,     100,     148, "Hagaki"))
      ("JapanesePostCard",      size ("JPN_HAGAKI",     mm,     100,     148, "Japanese Postcard"))
      ("Postcard",              size ("JPN_HAGAKI",     mm,     100,     148, "Postcard"))
      ("EnvYou4",               size ("JPN_YOU4",       mm,     105,     235, "EnvYou4"))
      ("EnvChou3",              size ("JPN_CHOU3",      mm,     120,     235, "EnvChou3"))
      ("Oufuku",                size ("JPN_OUFUKU",     mm,     148,     200, "Oufuku"))
      ("DoublePostcardRotated", size ("JPN_OUFUKU",     mm,     148,     200, "Double Postcard Rotated"))
      ("EnvKaku2",              size ("JPN_KAKU2",      mm,     240,     332, "EnvKaku2"))
      ("om_small-photo",        size ("OM_SMALL_PHOTO", mm,     100,     150, "Small Photo"))
      ("EnvItalian",            size ("OM_ITALIAN",     mm,     110,     230, "EnvItalian"))
      ("om_large-photo",        size ("OM_LARGE_PHOTO", mm,     200,     300, "Large Photo"))
      ("Folio",                 size ("OM_FOLIO",       mm,     210,     330, "Folio"))
      ("FolioSP",               size ("OM_FOLIO_SP",    mm,     215,     315, "FolioSP"))
      ("EnvInvite",             size ("OM_INVITE",      mm,     220,     220, "EnvInvite"))
      ("8Kai",                  size ("CUSTOM",         in,    10.5,  15.375, "8 Kai"))
      ("8K",                    size ("CUSTOM",         in,    10.5,  15.375, "8 Kai"))
      ("16Kai",                 size ("CUSTOM",         in,  7.6875,    10.5, "16 Kai"))
      ("16K",                   size ("CUSTOM",         in,  7.6875,    10.5, "16 Kai"))
      ;

    return dict;
  }
}       // namespace

boost::optional< cdd::media_size_option >
media::lookup (const std::string& keyword)
{
  static const dictionary dict (make_dictionary ());

  dictionary::const_iterator it (dict.find (keyword));

  if (dict.end () == it) return boost::none;

  cdd::media_size_option rv (it->second);
  rv.vendor_id = keyword;
  return rv;
}

}       // namespace cupsconn
