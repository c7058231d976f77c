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

#include "linear_regression.h"

namespace polyreg::regression {

struct LeastSquaresFit {
    LinearRegression model;
    // degree + 1 values, intercept merged into the constant term.
    Eigen::VectorXd coefficients;
};

/*
 * Model weights w belong to the features [x ... x^degree] and the intercept is kept separately by the model.
 * The full basis [1, x ... x^degree] has zero weight at the constant slot, intercept is merged into it.
 */
Eigen::VectorXd ReassembleCoefficients(const LinearRegression& model);

// Throws FitFailureError propagated from the model.
LeastSquaresFit FitLeastSquares(const std::vector<double>& x_train, const std::vector<double>& y_train, int degree);

}  // namespace polyreg::regression
