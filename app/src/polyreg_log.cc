/*
 * Polynomial curve fitting tool polyreg (c)
 * by CGI Estonia AS
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "polyreg_log.h"

#include <iostream>
#include <map>

#include <boost/log/expressions.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/support/date_time.hpp>  // Might be falsely flagged by CLion as unnecessary.
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>

namespace {
// Violating non-trivially destructible property. This is an exception.
const std::map<polyreg::log::Level, boost::log::trivial::severity_level> boost_level_map{
    {polyreg::log::Level::VERBOSE, boost::log::trivial::severity_level::trace},
    {polyreg::log::Level::DEBUG, boost::log::trivial::severity_level::debug},
    {polyreg::log::Level::INFO, boost::log::trivial::severity_level::info},
    {polyreg::log::Level::WARNING, boost::log::trivial::severity_level::warning},
    {polyreg::log::Level::ERROR, boost::log::trivial::severity_level::error}};

}  // namespace

namespace polyreg::log {

namespace expr = boost::log::expressions;

void Initialize(Format) {
    boost::log::add_common_attributes();
    boost::log::add_console_log(
        std::clog, boost::log::keywords::format =
                       (expr::stream << "["
                                     << expr::format_date_time<boost::posix_time::ptime>("TimeStamp",
                                                                                         "%Y-%m-%d %H:%M:%S.%f")
                                     << "] [" << boost::log::trivial::severity << "] " << expr::smessage));
    SetLevel(Level::VERBOSE);
}

void SetLevel(Level level) {
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= boost_level_map.at(level));
}
}  // namespace polyreg::log
