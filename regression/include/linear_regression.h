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

#include <Eigen/Core>

namespace polyreg::regression {

/*
 * Ordinary least squares y = X * w + b. Intercept b is fitted separately by centering the features and targets,
 * weights w are solved by column pivoting Householder QR on the centered features. No iterations are involved.
 */
class LinearRegression final {
public:
    LinearRegression() = default;
    explicit LinearRegression(bool fit_intercept) : fit_intercept_{fit_intercept} {}

    // Throws FitFailureError when the features are rank deficient or the solution is not finite.
    void Fit(const Eigen::MatrixXd& x, const Eigen::VectorXd& y);
    [[nodiscard]] Eigen::VectorXd Predict(const Eigen::MatrixXd& x) const;

    [[nodiscard]] bool IsFitted() const { return fitted_; }
    [[nodiscard]] const Eigen::VectorXd& Weights() const { return weights_; }
    [[nodiscard]] double Intercept() const { return intercept_; }
    [[nodiscard]] Eigen::Index Rank() const { return rank_; }

private:
    bool fit_intercept_{true};
    bool fitted_{false};
    Eigen::VectorXd weights_{};
    double intercept_{0.0};
    Eigen::Index rank_{0};
};

}  // namespace polyreg::regression
