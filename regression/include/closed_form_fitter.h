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

/**
 * Normal equations solution beta = (X^T X)^-1 X^T y.
 *
 * @param x Design matrix including the intercept column.
 * @param y Targets, one per row of x.
 * @return Coefficients, index i multiplies x^i.
 * @throws SingularMatrixError when X^T X is not invertible or the solution is not finite.
 */
Eigen::VectorXd SolveNormalEquations(const Eigen::MatrixXd& x, const Eigen::VectorXd& y);

// Expands x_train to the given degree with intercept column and solves the normal equations.
Eigen::VectorXd FitClosedForm(const std::vector<double>& x_train, const std::vector<double>& y_train, int degree);

}  // namespace polyreg::regression
