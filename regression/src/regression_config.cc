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

#include "regression_config.h"

#include <charconv>
#include <system_error>

#include <boost/algorithm/string/trim.hpp>

#include "regression_errors.h"

namespace polyreg::regression {

Strategy TryDetermineStrategyFrom(std::string_view strategy_name) {
    if (strategy_name == STRATEGY_NAME_CLOSED) {
        return Strategy::CLOSED_FORM;
    }

    if (strategy_name == STRATEGY_NAME_GRADIENT) {
        return Strategy::LEAST_SQUARES;
    }

    throw UnknownStrategyError(__FUNCTION__, "'" + std::string(strategy_name) +
                                                 "' is not a valid algorithm type. Please choose '" +
                                                 std::string(STRATEGY_NAME_CLOSED) + "' or '" +
                                                 std::string(STRATEGY_NAME_GRADIENT) + "'.");
}

std::string_view GetStrategyName(Strategy strategy) {
    switch (strategy) {
        case Strategy::CLOSED_FORM:
            return STRATEGY_NAME_CLOSED;
        case Strategy::LEAST_SQUARES:
            return STRATEGY_NAME_GRADIENT;
    }

    throw std::logic_error("Unhandled strategy value supplied to " + std::string(__FUNCTION__));
}

int TryParseDegree(std::string_view degree_arg) {
    const auto trimmed = boost::algorithm::trim_copy(std::string(degree_arg));
    int degree{};
    const auto* const begin = trimmed.data();
    const auto* const end = trimmed.data() + trimmed.size();
    const auto [ptr, ec] = std::from_chars(begin, end, degree);
    if (trimmed.empty() || ec != std::errc() || ptr != end) {
        throw InvalidDegreeError(__FUNCTION__,
                                 "'" + std::string(degree_arg) + "' is not a whole number polynomial degree");
    }

    if (degree < 0 || degree > MAX_POLYNOMIAL_DEGREE) {
        throw InvalidDegreeError(__FUNCTION__, "polynomial degree must be within 0.." +
                                                   std::to_string(MAX_POLYNOMIAL_DEGREE) + ", got " +
                                                   std::to_string(degree));
    }

    return degree;
}

}  // namespace polyreg::regression
