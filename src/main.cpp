//  main.cpp -- PPD to printer description command-line utility
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

#include <cstdlib>

#include <exception>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <boost/exception/diagnostic_information.hpp>
#include <boost/foreach.hpp>
#include <boost/program_options.hpp>
#include <boost/throw_exception.hpp>

#include <cupsconn/capabilities.hpp>
#include <cupsconn/configuration.hpp>
#include <cupsconn/translate.hpp>

#ifdef CUPSCONN_WITH_CUPS
#include <memory>
#include <cupsconn/connexion-pool.hpp>
#include <cupsconn/ppd-cache.hpp>
#include <cupsconn/printers.hpp>
#include "../connexions/cups.hpp"
#endif

#ifndef PACKAGE_NAME
#define PACKAGE_NAME "cupsconn"
#endif
#ifndef PACKAGE_VERSION
#define PACKAGE_VERSION "unknown"
#endif

namespace {

void
print (std::ostream& os, const std::string& manufacturer,
       const std::string& model, const cupsconn::cdd::printer_description& pd)
{
  os << "manufacturer: " << manufacturer << "\n"
     << "model: " << model << "\n"
     << pd;
}

}       // namespace

int
main (int argc, char *argv[])
{
  namespace po = boost::program_options;

  using std::runtime_error;

  try
    {
      cupsconn::configuration cfg;
      std::string config_file;
      std::string printer;
      std::string ppd_file;

      po::options_description cli_opts ("Options");
      cli_opts
        .add_options ()
        ("help"   , "display this help and exit")
        ("version", "output version information and exit")
        ("config" , po::value< std::string > (&config_file),
         "read configuration options from a file")
#ifdef CUPSCONN_WITH_CUPS
        ("list"   , "list the print server's printers")
        ("printer", po::value< std::string > (&printer),
         "describe a printer known to the print server")
#endif
        ;
      cli_opts.add (cfg.options ());

      po::options_description hidden_opts;
      hidden_opts
        .add_options ()
        ("ppd-file", po::value< std::string > (&ppd_file))
        ;

      po::options_description all_opts;
      all_opts.add (cli_opts).add (hidden_opts);

      po::positional_options_description positional;
      positional.add ("ppd-file", 1);

      po::variables_map vm;
      po::store (po::command_line_parser (argc, argv)
                 .options (all_opts)
                 .positional (positional)
                 .run (), vm);
      if (vm.count ("config"))
        {
          std::ifstream ifs (vm["config"].as< std::string > ().c_str ());
          if (!ifs)
            BOOST_THROW_EXCEPTION
              (runtime_error ("cannot open "
                              + vm["config"].as< std::string > ()));
          po::store (po::parse_config_file (ifs, cfg.options ()), vm);
        }
      po::notify (vm);

      if (vm.count ("help"))
        {
          std::cout << "Usage: cupsconn-ppd [OPTION]... [FILE.ppd]\n"
                    << "Describe printer capabilities from a PPD file"
#ifdef CUPSCONN_WITH_CUPS
                    << " or\na print server"
#endif
                    << ".\n\n"
                    << cli_opts;
          return EXIT_SUCCESS;
        }
      if (vm.count ("version"))
        {
          std::cout << PACKAGE_NAME " " PACKAGE_VERSION "\n";
          return EXIT_SUCCESS;
        }

      cfg.apply_logging ();

      if (!ppd_file.empty ())
        {
          cupsconn::translation t
            (cupsconn::translate_ppd (cupsconn::read_ppd (ppd_file)));
          print (std::cout, t.manufacturer, t.model, t.description);
          return EXIT_SUCCESS;
        }

#ifdef CUPSCONN_WITH_CUPS
      if (vm.count ("list") || !printer.empty ())
        {
          namespace cnx = cupsconn::_cnx_;

          cupsconn::connexion_pool pool
            ([&cfg] ()
             {
               return cupsconn::connexion::ptr
                 (std::make_shared< cnx::cups >
                  (cfg.server, cfg.port, cfg.connect_timeout ()));
             },
             cfg.max_connexions, cfg.release_grace (),
             cfg.max_connexion_age ());

          if (vm.count ("list"))
            {
              BOOST_FOREACH (const std::string& name,
                             cupsconn::printer_names (pool))
                {
                  std::cout << name << "\n";
                }
              return EXIT_SUCCESS;
            }

          cupsconn::ppd_cache cache (pool, cfg.cache_dir);
          cupsconn::capability_source source (cache);
          cupsconn::capabilities caps (source.get (printer));

          std::cout << "hash: " << caps.hash << "\n";
          print (std::cout, caps.manufacturer, caps.model, caps.description);
          return EXIT_SUCCESS;
        }
#endif

      std::cerr << "cupsconn-ppd: nothing to describe\n"
                << "Try 'cupsconn-ppd --help' for more information.\n";
      return EXIT_FAILURE;
    }
  catch (const boost::exception& e)
    {
      std::cerr << boost::diagnostic_information (e);
      return EXIT_FAILURE;
    }
  catch (std::exception& e)
    {
      std::cerr << e.what () << "\n";
      return EXIT_FAILURE;
    }

  return EXIT_SUCCESS;
}
