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

#include <string>
#include <vector>

#include <Eigen/Core>

namespace polyreg::regression {

// "y = 2 * x^1 + 5 * x^3" for [0, 2, 0, 5]. Terms with exactly zero coefficient are left out, "y = 0" if all are.
std::string FormatEquation(const Eigen::VectorXd& coefficients);
std::string FormatEquation(const std::vector<double>& coefficients);

}  // namespace polyreg::regression
