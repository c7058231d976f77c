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

#include <vector>

#include <Eigen/Core>

namespace polyreg::regression {

enum class InterceptColumn { INCLUDE, EXCLUDE };

/*
 * Design matrix of a single feature. Row i is [1, x_i, x_i^2 ... x_i^degree] when intercept column is included,
 * otherwise [x_i, x_i^2 ... x_i^degree]. Hence degree 0 without intercept has no columns at all.
 */
Eigen::MatrixXd ExpandPolynomial(const Eigen::VectorXd& x, int degree, InterceptColumn intercept);
Eigen::MatrixXd ExpandPolynomial(const std::vector<double>& x, int degree, InterceptColumn intercept);

}  // namespace polyreg::regression
