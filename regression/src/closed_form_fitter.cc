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

#include "closed_form_fitter.h"

#include <stdexcept>
#include <string>

#include <Eigen/Dense>

#include "polynomial_features.h"
#include "polyreg_log.h"
#include "regression_errors.h"

namespace polyreg::regression {

Eigen::VectorXd SolveNormalEquations(const Eigen::MatrixXd& x, const Eigen::VectorXd& y) {
    if (x.rows() != y.size()) {
        throw std::invalid_argument("Design matrix has " + std::to_string(x.rows()) + " rows but there are " +
                                    std::to_string(y.size()) + " targets");
    }

    const auto dims = std::to_string(x.cols()) + "x" + std::to_string(x.cols());
    const Eigen::MatrixXd xtx = x.transpose() * x;
    const Eigen::VectorXd xty = x.transpose() * y;

    Eigen::FullPivLU<Eigen::MatrixXd> lu(xtx);
    if (!lu.isInvertible()) {
        throw SingularMatrixError(__FUNCTION__, "normal equations matrix X^T X of " + dims + " has rank " +
                                                    std::to_string(lu.rank()) + ", design matrix is " +
                                                    std::to_string(x.rows()) + "x" + std::to_string(x.cols()));
    }

    Eigen::VectorXd coefficients = lu.inverse() * xty;
    if (!coefficients.allFinite()) {
        throw SingularMatrixError(__FUNCTION__, "inverse of normal equations matrix X^T X of " + dims +
                                                    " produced non-finite coefficients");
    }

    return coefficients;
}

Eigen::VectorXd FitClosedForm(const std::vector<double>& x_train, const std::vector<double>& y_train, int degree) {
    const auto design = ExpandPolynomial(x_train, degree, InterceptColumn::INCLUDE);
    const Eigen::Map<const Eigen::VectorXd> targets(y_train.data(), static_cast<Eigen::Index>(y_train.size()));

    LOGD << "Closed form fit of degree " << degree << " on " << design.rows() << "x" << design.cols()
         << " design matrix";

    return SolveNormalEquations(design, targets);
}

}  // namespace polyreg::regression
