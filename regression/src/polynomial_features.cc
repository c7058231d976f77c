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

#include "polynomial_features.h"

#include <string>

#include "regression_errors.h"

namespace polyreg::regression {

Eigen::MatrixXd ExpandPolynomial(const Eigen::VectorXd& x, int degree, InterceptColumn intercept) {
    if (degree < 0) {
        throw InvalidDegreeError(__FUNCTION__, "polynomial degree must not be negative, got " + std::to_string(degree));
    }

    const int first_power = intercept == InterceptColumn::INCLUDE ? 0 : 1;
    const Eigen::Index columns = static_cast<Eigen::Index>(degree) + 1 - first_power;
    Eigen::MatrixXd a(x.size(), columns);

    for (Eigen::Index row = 0; row < a.rows(); row++) {
        double val = first_power == 0 ? 1.0 : x(row);
        const double mult = x(row);
        for (Eigen::Index col = 0; col < a.cols(); col++) {
            a(row, col) = val;
            val *= mult;
        }
    }

    return a;
}

Eigen::MatrixXd ExpandPolynomial(const std::vector<double>& x, int degree, InterceptColumn intercept) {
    const Eigen::Map<const Eigen::VectorXd> column(x.data(), static_cast<Eigen::Index>(x.size()));
    return ExpandPolynomial(Eigen::VectorXd(column), degree, intercept);
}

}  // namespace polyreg::regression
