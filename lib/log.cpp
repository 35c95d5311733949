//  log.cpp -- logging defaults and settings
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

#include <iostream>
#include <stdexcept>

#include "cupsconn/log.hpp"

namespace cupsconn {

log::priority log::threshold = log::ERROR;
log::category log::matching  = log::ALL;

template<>
std::ostream& log::basic_logger<char>::os_ = std::clog;

log::priority
log::to_priority (const std::string& name)
{
  /**/ if ("fatal" == name) return FATAL;
  else if ("alert" == name) return ALERT;
  else if ("error" == name) return ERROR;
  else if ("brief" == name) return BRIEF;
  else if ("trace" == name) return TRACE;
  else if ("debug" == name) return DEBUG;

  BOOST_THROW_EXCEPTION
    (std::invalid_argument ((format ("unknown log level: %1%") % name).str ()));
}

}       // namespace cupsconn
