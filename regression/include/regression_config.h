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

namespace polyreg::regression {

enum class Strategy { CLOSED_FORM, LEAST_SQUARES };

constexpr std::string_view STRATEGY_NAME_CLOSED{"closed"};
// Solved as ordinary least squares, no iterative descent takes place.
constexpr std::string_view STRATEGY_NAME_GRADIENT{"gradient"};

// Highest accepted polynomial degree.
constexpr int MAX_POLYNOMIAL_DEGREE{64};

constexpr double DEFAULT_TEST_FRACTION{0.2};
constexpr uint32_t DEFAULT_SPLIT_SEED{0};

struct RegressionConfig {
    std::string input_path;
    Strategy strategy{Strategy::CLOSED_FORM};
    int degree{1};
    std::string equation_path{"equation.txt"};
    std::string plot_path{"plot.html"};
    double test_fraction{DEFAULT_TEST_FRACTION};
    uint32_t split_seed{DEFAULT_SPLIT_SEED};
};

// Accepts exactly "closed" or "gradient", throws UnknownStrategyError otherwise.
Strategy TryDetermineStrategyFrom(std::string_view strategy_name);
std::string_view GetStrategyName(Strategy strategy);

// Whole numbers from 0 to MAX_POLYNOMIAL_DEGREE e.g. "3". Values like "2.5", "-1", "65" or "two" throw
// InvalidDegreeError.
int TryParseDegree(std::string_view degree_arg);

}  // namespace polyreg::regression
