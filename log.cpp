//
//  log.cpp
//
//  Copyright (c) 2019 2020 Andrea Bondavalli. All rights reserved.
//
//  This program is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License, or
//  any later version.
//
//  This program is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//  GNU General Public License for more details.
//
//  You should have received a copy of the GNU General Public License
//  along with this program.  If not, see <http://www.gnu.org/licenses/>.
//

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/console.hpp>

#include <iostream>

#include "config.hpp"
#include "log.hpp"

namespace logging = boost::log;
namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;

void log_init(const Config &config) {
  boost::shared_ptr<logging::core> core = logging::core::get();
  // remove all sink in case of re-configuration
  core->remove_all_sinks();
  // messages go to stderr, subtitles and progress to stdout
  logging::add_console_log(
      std::clog, keywords::format = (expr::stream
                                     << "[" << logging::trivial::severity
                                     << "] " << expr::smessage));
  // set log level
  core->set_filter(logging::trivial::severity >=
                   static_cast<logging::trivial::severity_level>(
                       config.get_log_severity()));
}
