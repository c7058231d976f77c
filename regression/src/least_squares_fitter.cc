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

#include "least_squares_fitter.h"

#include <stdexcept>

#include "polynomial_features.h"
#include "polyreg_log.h"

namespace polyreg::regression {

Eigen::VectorXd ReassembleCoefficients(const LinearRegression& model) {
    if (!model.IsFitted()) {
        throw std::logic_error("Coefficients requested from a model which has not been fitted");
    }

    const auto& weights = model.Weights();
    Eigen::VectorXd coefficients = Eigen::VectorXd::Zero(weights.size() + 1);
    coefficients.tail(weights.size()) = weights;
    coefficients(0) += model.Intercept();

    return coefficients;
}

LeastSquaresFit FitLeastSquares(const std::vector<double>& x_train, const std::vector<double>& y_train, int degree) {
    const auto features = ExpandPolynomial(x_train, degree, InterceptColumn::EXCLUDE);
    const Eigen::Map<const Eigen::VectorXd> targets(y_train.data(), static_cast<Eigen::Index>(y_train.size()));

    LOGD << "Least squares fit of degree " << degree << " on " << features.rows() << "x" << features.cols()
         << " feature matrix";

    LeastSquaresFit fit;
    fit.model.Fit(features, targets);
    fit.coefficients = ReassembleCoefficients(fit.model);
    LOGD << "Least squares intercept " << fit.model.Intercept() << ", rank " << fit.model.Rank();

    return fit;
}

}  // namespace polyreg::regression
