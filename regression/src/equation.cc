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

#include "equation.h"

#include <fmt/format.h>

namespace polyreg::regression {

std::string FormatEquation(const std::vector<double>& coefficients) {
    std::string equation{"y = "};
    bool first{true};
    for (size_t i{0}; i < coefficients.size(); i++) {
        if (coefficients[i] == 0.0) {
            continue;
        }
        if (!first) {
            equation += " + ";
        }
        equation += fmt::format("{} * x^{}", coefficients[i], i);
        first = false;
    }

    if (first) {
        equation += "0";
    }

    return equation;
}

std::string FormatEquation(const Eigen::VectorXd& coefficients) {
    return FormatEquation(std::vector<double>(coefficients.data(), coefficients.data() + coefficients.size()));
}

}  // namespace polyreg::regression
