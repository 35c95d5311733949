//  units.hpp -- physical length conversions to micrometers
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

#ifndef cupsconn_units_hpp_
#define cupsconn_units_hpp_

#include <cstdint>
#include <limits>

namespace cupsconn {

//  All conversions round to the nearest micrometer by adding one half
//  before truncating.  Single precision arithmetic is used throughout
//  so results agree with other implementations of the CDD schema.

namespace detail {

//! Whether truncating \a v yields a representable micron count
/*! The bounds are powers of two and exact in single precision.  NaN
 *  and infinities fail both comparisons.
 */
inline bool
fits_microns (float v)
{
  const float lo = std::numeric_limits< int32_t >::min ();

  return (v < -lo && v >= lo);
}

inline float inches_ (float inches) { return inches * 25400 + 0.5f; }
inline float mm_ (float mm) { return mm * 1000 + 0.5f; }
inline float points_ (int64_t points)
{
  return static_cast< float > (points * 25400) / 72 + 0.5f;
}

}       // namespace detail

//  The conversions are only defined for lengths that pass the matching
//  *_fit check.  Callers converting untrusted input check first.

inline int32_t
inches_to_microns (float inches)
{
  return static_cast< int32_t > (detail::inches_ (inches));
}

inline int32_t
mm_to_microns (float mm)
{
  return static_cast< int32_t > (detail::mm_ (mm));
}

//! Typographic points, 72 to the inch
inline int32_t
points_to_microns (int64_t points)
{
  return static_cast< int32_t > (detail::points_ (points));
}

inline bool
inches_fit (float inches)
{
  return detail::fits_microns (detail::inches_ (inches));
}

inline bool
mm_fit (float mm)
{
  return detail::fits_microns (detail::mm_ (mm));
}

inline bool
points_fit (int64_t points)
{
  return detail::fits_microns (detail::points_ (points));
}

}       // namespace cupsconn

#endif  /* cupsconn_units_hpp_ */
