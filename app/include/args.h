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
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>

#include "polyreg_log.h"
#include "regression_config.h"

namespace polyreg {

class Args final {
public:
    Args() = delete;
    Args(const std::vector<char*>& args);

    [[nodiscard]] bool IsHelpRequested() const;
    [[nodiscard]] std::string GetHelp() const;
    [[nodiscard]] std::string_view GetInputPath() const { return input_path_; }
    [[nodiscard]] regression::Strategy GetStrategy() const { return strategy_; }
    [[nodiscard]] int GetDegree() const { return degree_; }
    [[nodiscard]] std::string_view GetEquationPath() const { return equation_path_; }
    [[nodiscard]] std::string_view GetPlotPath() const { return plot_path_; }
    [[nodiscard]] uint32_t GetSplitSeed() const { return split_seed_; }
    [[nodiscard]] log::Level GetLogLevel() const { return log_level_; }
    [[nodiscard]] regression::RegressionConfig GetRegressionConfig() const;

private:
    void Construct();
    void Check();
    static log::Level TryFetchLogLevelFrom(std::string_view level_arg);

    boost::program_options::variables_map vm_;
    boost::program_options::options_description args_{""};
    boost::program_options::options_description visible_args_{""};
    boost::program_options::options_description hidden_args_{""};
    boost::program_options::positional_options_description positional_args_;

    bool precheck_help{false};
    std::string input_path_{};
    std::string strategy_arg_{};
    std::string degree_arg_{};
    std::string equation_path_{};
    std::string plot_path_{};
    std::string log_level_arg_{};
    uint32_t split_seed_{regression::DEFAULT_SPLIT_SEED};
    regression::Strategy strategy_{regression::Strategy::CLOSED_FORM};
    int degree_{1};
    log::Level log_level_{log::Level::INFO};
};

}  // namespace polyreg
