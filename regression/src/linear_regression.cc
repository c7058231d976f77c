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

#include "linear_regression.h"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include <Eigen/Dense>

#include "regression_errors.h"

namespace polyreg::regression {

void LinearRegression::Fit(const Eigen::MatrixXd& x, const Eigen::VectorXd& y) {
    const auto dims = std::to_string(x.rows()) + "x" + std::to_string(x.cols());
    if (x.rows() != y.size()) {
        throw std::invalid_argument("Feature matrix " + dims + " does not match " + std::to_string(y.size()) +
                                    " targets");
    }
    if (x.rows() == 0) {
        throw FitFailureError(__FUNCTION__, "no samples to fit");
    }

    fitted_ = false;
    Eigen::VectorXd x_offset = Eigen::VectorXd::Zero(x.cols());
    double y_offset{0.0};
    if (fit_intercept_) {
        x_offset = x.colwise().mean().transpose();
        y_offset = y.mean();
    }

    if (x.cols() == 0) {
        // Intercept only model.
        weights_ = Eigen::VectorXd(0);
        intercept_ = y_offset;
        rank_ = 0;
        fitted_ = true;
        return;
    }

    const Eigen::MatrixXd x_centered = x.rowwise() - x_offset.transpose();
    const Eigen::VectorXd y_centered = (y.array() - y_offset).matrix();

    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(x_centered);
    rank_ = qr.rank();
    if (rank_ < x.cols()) {
        throw FitFailureError(__FUNCTION__, "features of " + dims + " are rank deficient, rank " +
                                                std::to_string(rank_) + " out of " + std::to_string(x.cols()) +
                                                (fit_intercept_ ? " after centering" : ""));
    }

    Eigen::VectorXd weights = qr.solve(y_centered);
    const double intercept = y_offset - x_offset.dot(weights);
    if (!weights.allFinite() || !std::isfinite(intercept)) {
        throw FitFailureError(__FUNCTION__, "least squares solve of " + dims + " features produced non-finite values");
    }

    weights_ = std::move(weights);
    intercept_ = intercept;
    fitted_ = true;
}

Eigen::VectorXd LinearRegression::Predict(const Eigen::MatrixXd& x) const {
    if (!fitted_) {
        throw std::logic_error("LinearRegression::Predict() called before a successful Fit()");
    }
    if (x.cols() != weights_.size()) {
        throw std::invalid_argument("Model has " + std::to_string(weights_.size()) + " weights, features have " +
                                    std::to_string(x.cols()) + " columns");
    }

    return ((x * weights_).array() + intercept_).matrix();
}

}  // namespace polyreg::regression
