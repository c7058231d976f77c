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

struct SortedPredictions {
    std::vector<double> x;
    std::vector<double> y_predicted;
    // Empty when no true values were supplied.
    std::vector<double> y_true;
};

// y = X * beta, design has to include the intercept column.
Eigen::VectorXd PredictWithCoefficients(const Eigen::MatrixXd& design, const Eigen::VectorXd& coefficients);

/*
 * Reorders x, predictions and true values jointly by ascending x. Ties keep their relative order. y_true may be
 * left empty.
 */
SortedPredictions SortByInput(const std::vector<double>& x, const Eigen::VectorXd& predictions,
                              const std::vector<double>& y_true = {});

double ResidualSumOfSquares(const Eigen::MatrixXd& design, const Eigen::VectorXd& y,
                            const Eigen::VectorXd& coefficients);
double MeanSquaredError(const std::vector<double>& y_true, const std::vector<double>& y_predicted);
// NaN when the true values have no variance.
double CoefficientOfDetermination(const std::vector<double>& y_true, const std::vector<double>& y_predicted);

}  // namespace polyreg::regression
