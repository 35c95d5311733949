//  digest.cpp -- streaming content hashes
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

#include <openssl/evp.h>

#include <boost/throw_exception.hpp>

#include "cupsconn/digest.hpp"
#include "cupsconn/exception.hpp"
#include "cupsconn/format.hpp"

namespace cupsconn {

struct md5::impl
{
  EVP_MD_CTX *ctx_;
  bool        done_;

  impl ()
    : ctx_(EVP_MD_CTX_new ()), done_(false)
  {
    if (!ctx_)
      BOOST_THROW_EXCEPTION (resource_error ("cannot allocate MD5 context"));

    if (1 != EVP_DigestInit_ex (ctx_, EVP_md5 (), nullptr))
      {
        EVP_MD_CTX_free (ctx_);
        BOOST_THROW_EXCEPTION (resource_error ("cannot initialise MD5"));
      }
  }

  ~impl ()
  {
    EVP_MD_CTX_free (ctx_);
  }
};

md5::md5 ()
  : pimpl_(new impl)
{}

md5::~md5 ()
{
  delete pimpl_;
}

void
md5::update (const char *data, std::size_t size)
{
  if (pimpl_->done_)
    BOOST_THROW_EXCEPTION (std::logic_error ("MD5 digest already final"));

  if (1 != EVP_DigestUpdate (pimpl_->ctx_, data, size))
    BOOST_THROW_EXCEPTION (resource_error ("MD5 update failed"));
}

std::string
md5::hexdigest ()
{
  if (pimpl_->done_)
    BOOST_THROW_EXCEPTION (std::logic_error ("MD5 digest already final"));

  unsigned char sum[EVP_MAX_MD_SIZE];
  unsigned int  len = 0;

  if (1 != EVP_DigestFinal_ex (pimpl_->ctx_, sum, &len))
    BOOST_THROW_EXCEPTION (resource_error ("MD5 finalisation failed"));
  pimpl_->done_ = true;

  std::string rv;
  for (unsigned int i = 0; i < len; ++i)
    rv += (format ("%02x") % static_cast< unsigned > (sum[i])).str ();

  return rv;
}

}       // namespace cupsconn
