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

#include "args.h"

#include <algorithm>
#include <array>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/program_options.hpp>

namespace polyreg {

namespace po = boost::program_options;

void Args::Construct() {
    visible_args_.add_options()("help,h", po::bool_switch()->default_value(false), "Print help");

    // clang-format off
    visible_args_.add_options()
    ("input,i", po::value<std::string>(&input_path_)->required(),
        "CSV dataset with header, first column is used as x and the last one as y")
    ("strategy,s", po::value<std::string>(&strategy_arg_)->required(), "Type of algorithm - closed|gradient")
    ("degree,d", po::value<std::string>(&degree_arg_)->required(), "Degree of polynomial, non-negative integer")
    ("equation", po::value<std::string>(&equation_path_)->default_value("equation.txt"),
        "Destination path for the fitted equation")
    ("plot", po::value<std::string>(&plot_path_)->default_value("plot.html"),
        "Destination path for the fit plot (HTML)")
    ("log", po::value<std::string>(&log_level_arg_)->default_value("info"),
        "Log level, one of the following - verbose|debug|info|warning|error");

    hidden_args_.add_options()
        ("seed", po::value<uint32_t>(&split_seed_)->default_value(regression::DEFAULT_SPLIT_SEED));

    positional_args_.add("input", 1).add("strategy", 1).add("degree", 1);

    args_.add(visible_args_).add(hidden_args_);
    // clang-format on
}

void Args::Check() {
    boost::program_options::notify(vm_);

    log_level_ = TryFetchLogLevelFrom(log_level_arg_);
    strategy_ = regression::TryDetermineStrategyFrom(strategy_arg_);
    degree_ = regression::TryParseDegree(degree_arg_);
}

log::Level Args::TryFetchLogLevelFrom(std::string_view level_arg) {
    constexpr std::array<std::string_view, 5> ALLOWED_LEVELS{"verbose", "debug", "info", "warning", "error"};
    constexpr std::array<log::Level, 5> LOG_LEVELS{log::Level::VERBOSE, log::Level::DEBUG, log::Level::INFO,
                                                   log::Level::WARNING, log::Level::ERROR};

    size_t level_index{0};
    for (const auto level_str : ALLOWED_LEVELS) {
        if (boost::iequals(level_arg, level_str)) {
            return LOG_LEVELS.at(level_index);
        }
        level_index++;
    }

    throw std::invalid_argument("'" + std::string(level_arg) +
                                "' is not a valid log level. Valid ones are - verbose|debug|info|warning|error");
}

Args::Args(const std::vector<char*>& args) {
    if (args.size() == 0) {
        throw std::logic_error("Programming error when supplying arguments to parser - arg array length is 0.");
    }
    Construct();
    po::store(po::command_line_parser(static_cast<int>(args.size()), args.data())
                  .options(args_)
                  .positional(positional_args_)
                  .run(),
              vm_);
    const auto argc = args.size();
    const auto check_help = [](const char* a) { return strcmp(a, "--help") == 0 || strcmp(a, "-h") == 0; };
    const auto has_help = std::find_if(args.cbegin(), args.cend(), check_help) != args.end();
    if (argc > 1 && !has_help) {
        Check();
    } else {
        precheck_help = true;
    }
}

bool Args::IsHelpRequested() const { return precheck_help; }

std::string Args::GetHelp() const {
    std::stringstream help;
    help << "Usage: polyreg [input] [closed|gradient] [degree] [options]" << std::endl;
    help << visible_args_;
    return help.str();
}

regression::RegressionConfig Args::GetRegressionConfig() const {
    regression::RegressionConfig config;
    config.input_path = input_path_;
    config.strategy = strategy_;
    config.degree = degree_;
    config.equation_path = equation_path_;
    config.plot_path = plot_path_;
    config.split_seed = split_seed_;
    return config;
}

}  // namespace polyreg
