//  cups.cpp -- print server sessions through libcups
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

#include <climits>
#include <cstring>
#include <memory>
#include <vector>

#include <boost/foreach.hpp>
#include <boost/throw_exception.hpp>

#include <cupsconn/exception.hpp>
#include <cupsconn/format.hpp>
#include <cupsconn/log.hpp>

#include "cups.hpp"

namespace cupsconn {
namespace _cnx_ {

namespace {

typedef std::unique_ptr< ipp_t, void (*) (ipp_t *) > ipp_ptr;

const char *
encryption_name (http_encryption_t encryption)
{
  switch (encryption)
    {
    case HTTP_ENCRYPTION_ALWAYS:       return "always";
    case HTTP_ENCRYPTION_IF_REQUESTED: return "if requested";
    case HTTP_ENCRYPTION_NEVER:        return "never";
    case HTTP_ENCRYPTION_REQUIRED:     return "required";
    }
  return "unknown";
}

std::string
last_error_string ()
{
  const char *msg = cupsLastErrorString ();
  return (msg ? msg : "");
}

//  Textual rendition of all values of an attribute.  Value types that
//  have no sensible textual form are skipped.
std::vector< std::string >
attribute_values (ipp_attribute_t *attr)
{
  std::vector< std::string > rv;
  int count = ippGetCount (attr);

  switch (ippGetValueTag (attr))
    {
    case IPP_TAG_NOVALUE:
    case IPP_TAG_NOTSETTABLE:
      break;

    case IPP_TAG_INTEGER:
    case IPP_TAG_ENUM:
      for (int i = 0; i < count; ++i)
        rv.push_back ((format ("%1%") % ippGetInteger (attr, i)).str ());
      break;

    case IPP_TAG_BOOLEAN:
      for (int i = 0; i < count; ++i)
        rv.push_back (ippGetBoolean (attr, i) ? "true" : "false");
      break;

    case IPP_TAG_RANGE:
      for (int i = 0; i < count; ++i)
        {
          int upper = 0;
          int lower = ippGetRange (attr, i, &upper);
          rv.push_back ((format ("%1%-%2%") % lower % upper).str ());
        }
      break;

    case IPP_TAG_RESOLUTION:
      for (int i = 0; i < count; ++i)
        {
          int yres = 0;
          ipp_res_t units;
          int xres = ippGetResolution (attr, i, &yres, &units);
          rv.push_back ((format ("%1%x%2%%3%")
                         % xres % yres
                         % (IPP_RES_PER_INCH == units ? "dpi" : "dpcm")).str ());
        }
      break;

    case IPP_TAG_STRING:
    case IPP_TAG_TEXT:
    case IPP_TAG_NAME:
    case IPP_TAG_KEYWORD:
    case IPP_TAG_URI:
    case IPP_TAG_CHARSET:
    case IPP_TAG_LANGUAGE:
    case IPP_TAG_MIMETYPE:
      for (int i = 0; i < count; ++i)
        {
          const char *s = ippGetString (attr, i, NULL);
          rv.push_back (s ? s : "");
        }
      break;

    default:
      log::debug ("%1%: skipping value tag %2%")
        % ippGetName (attr) % ippTagString (ippGetValueTag (attr));
    }
  return rv;
}

//  Collects consecutive printer group attributes into one map each.
std::vector< ipp::attribute_map >
printer_groups (ipp_t *response)
{
  std::vector< ipp::attribute_map > rv;

  ipp_attribute_t *attr = ippFirstAttribute (response);
  while (attr)
    {
      if (IPP_TAG_PRINTER != ippGetGroupTag (attr))
        {
          attr = ippNextAttribute (response);
          continue;
        }

      ipp::attribute_map group;
      for (; attr && IPP_TAG_PRINTER == ippGetGroupTag (attr);
           attr = ippNextAttribute (response))
        {
          const char *name = ippGetName (attr);
          if (name) group[name] = attribute_values (attr);
        }
      rv.push_back (group);
    }
  return rv;
}

}       // namespace

cups::cups (const std::string& server, int port,
            std::chrono::steady_clock::duration timeout)
  : host_(server.empty () ? cupsServer () : server)
  , port_(port ? port : ippPort ())
  , timeout_ms_(std::chrono::duration_cast< std::chrono::milliseconds >
                (timeout).count ())
  , encryption_(cupsEncryption ())
  , http_(NULL)
{
  http_ = httpConnect2 (host_.c_str (), port_, NULL, AF_UNSPEC,
                        encryption_, 1, timeout_ms_, NULL);
  if (!http_)
    BOOST_THROW_EXCEPTION
      (transport_error ((format ("failed to connect to %1%:%2%: %3%")
                         % host_ % port_ % last_error_string ()).str ()));

  log::brief (log::POOL, "connected to CUPS server %1%:%2% (encryption %3%)")
    % host_ % port_ % encryption_name (encryption_);
}

cups::~cups ()
{
  httpClose (http_);
}

ppd_reply
cups::get_ppd (const std::string& printer, std::time_t modtime)
{
  char buffer[PATH_MAX];
  std::memset (buffer, 0, sizeof (buffer));

  http_status_t status = cupsGetPPD3 (http_, printer.c_str (), &modtime,
                                      buffer, sizeof (buffer));

  if (HTTP_STATUS_NOT_MODIFIED == status)
    return ppd_reply ();

  if (HTTP_STATUS_OK == status)
    return ppd_reply (buffer, modtime);

  ipp_status_t err = cupsLastError ();
  if (lost_session (status, err))
    BOOST_THROW_EXCEPTION
      (transport_error ((format ("%1%: cupsGetPPD3 failed: %2% %3%")
                         % printer % ippErrorString (err)
                         % last_error_string ()).str ()));

  if (IPP_STATUS_OK != err)
    BOOST_THROW_EXCEPTION
      (server_error (status,
                     (format ("%1%: cupsGetPPD3 failed: %2% %3%")
                      % printer % ippErrorString (err)
                      % last_error_string ()).str ()));

  BOOST_THROW_EXCEPTION
    (server_error (status,
                   (format ("%1%: cupsGetPPD3 failed: HTTP status %2%")
                    % printer % status).str ()));
}

bool
lost_session (http_status_t status, ipp_status_t err)
{
  return (HTTP_STATUS_ERROR == status
          || IPP_STATUS_ERROR_SERVICE_UNAVAILABLE == err);
}

ipp::response
cups::request (const ipp::request& req)
{
  ipp_t *msg = ippNewRequest (ipp_op_t (req.op));

  if (!req.printer.empty ())
    {
      char uri[HTTP_MAX_URI];
      httpAssembleURIf (HTTP_URI_CODING_ALL, uri, sizeof (uri), "ipp",
                        NULL, "localhost", 0, "/printers/%s",
                        req.printer.c_str ());
      ippAddString (msg, IPP_TAG_OPERATION, IPP_TAG_URI, "printer-uri",
                    NULL, uri);
    }

  if (!req.attributes.empty ())
    {
      std::vector< const char * > names;
      BOOST_FOREACH (const std::string& name, req.attributes)
        names.push_back (name.c_str ());

      ippAddStrings (msg, IPP_TAG_OPERATION, IPP_TAG_KEYWORD,
                     "requested-attributes", names.size (), NULL,
                     &names[0]);
    }

  //  cupsDoRequest() takes ownership of the request
  ipp_ptr response (cupsDoRequest (http_, msg, "/"), ippDelete);

  if (!response)
    {
      ipp_status_t err = cupsLastError ();
      BOOST_THROW_EXCEPTION
        (transport_error ((format ("IPP request %1% failed: %2% %3%")
                           % ippOpString (ipp_op_t (req.op))
                           % ippErrorString (err)
                           % last_error_string ()).str ()));
    }

  ipp::response rv (ippGetStatusCode (response.get ()));
  rv.groups = printer_groups (response.get ());
  return rv;
}

void
cups::reconnect ()
{
  if (0 != httpReconnect2 (http_, timeout_ms_, NULL))
    BOOST_THROW_EXCEPTION
      (transport_error ((format ("failed to reconnect to %1%:%2%: %3%")
                         % host_ % port_ % last_error_string ()).str ()));
}

} // namespace _cnx_
} // namespace cupsconn
