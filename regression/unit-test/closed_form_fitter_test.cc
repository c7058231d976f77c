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
#include <vector>

#include "gmock/gmock.h"

#include "polynomial_features.h"
#include "prediction.h"
#include "regression_errors.h"

namespace {

using ::testing::DoubleNear;
using ::testing::Eq;
using ::testing::Le;
using namespace polyreg::regression;

constexpr double TOLERANCE{1e-9};

TEST(ClosedFormFitter, ExactLineIsRecovered) {
    const std::vector<double> x{0, 1, 2, 3};
    const std::vector<double> y{1, 3, 5, 7};
    const auto coefficients = FitClosedForm(x, y, 1);

    ASSERT_THAT(coefficients.size(), Eq(2));
    EXPECT_THAT(coefficients(0), DoubleNear(1.0, TOLERANCE));
    EXPECT_THAT(coefficients(1), DoubleNear(2.0, TOLERANCE));
}

TEST(ClosedFormFitter, ExactQuadraticIsRecovered) {
    std::vector<double> x;
    std::vector<double> y;
    for (int i = -5; i <= 5; i++) {
        x.push_back(i * 0.5);
        y.push_back(2.0 - x.back() + 0.5 * x.back() * x.back());
    }

    const auto coefficients = FitClosedForm(x, y, 2);
    ASSERT_THAT(coefficients.size(), Eq(3));
    EXPECT_THAT(coefficients(0), DoubleNear(2.0, 1e-8));
    EXPECT_THAT(coefficients(1), DoubleNear(-1.0, 1e-8));
    EXPECT_THAT(coefficients(2), DoubleNear(0.5, 1e-8));
}

TEST(ClosedFormFitter, DegreeZeroPredictsMean) {
    const std::vector<double> x{-1.0, 4.0, 2.5, 8.0};
    const std::vector<double> y{3.0, 5.0, 10.0, 2.0};
    const auto coefficients = FitClosedForm(x, y, 0);

    ASSERT_THAT(coefficients.size(), Eq(1));
    EXPECT_THAT(coefficients(0), DoubleNear(5.0, TOLERANCE));
}

TEST(ClosedFormFitter, FitIsNoWorseThanZeroModel) {
    const std::vector<double> x{0.1, 0.7, 1.3, 2.2, 2.9, 3.4, 4.8, 5.5};
    const std::vector<double> y{2.3, 1.1, 4.0, 3.2, 7.7, 6.1, 12.5, 11.9};

    for (int degree = 0; degree <= 3; degree++) {
        const auto coefficients = FitClosedForm(x, y, degree);
        const auto design = ExpandPolynomial(x, degree, InterceptColumn::INCLUDE);
        const Eigen::Map<const Eigen::VectorXd> targets(y.data(), static_cast<Eigen::Index>(y.size()));

        const auto rss_fit = ResidualSumOfSquares(design, targets, coefficients);
        const auto rss_zero = ResidualSumOfSquares(design, targets, Eigen::VectorXd::Zero(degree + 1));
        EXPECT_THAT(rss_fit, Le(rss_zero));
    }
}

TEST(ClosedFormFitter, ThrowsSingularMatrixForConstantInput) {
    const std::vector<double> x{2.0, 2.0, 2.0, 2.0, 2.0};
    const std::vector<double> y{1.0, 2.0, 3.0, 4.0, 5.0};
    EXPECT_THROW(FitClosedForm(x, y, 1), SingularMatrixError);
}

TEST(ClosedFormFitter, SingularMatrixErrorNamesOperationAndDimensions) {
    Eigen::MatrixXd design(3, 2);
    design << 1, 0, 1, 0, 1, 0;
    const Eigen::VectorXd y = Eigen::VectorXd::Ones(3);
    try {
        SolveNormalEquations(design, y);
        FAIL() << "Expected SingularMatrixError";
    } catch (const SingularMatrixError& e) {
        EXPECT_THAT(std::string(e.GetOperation()), Eq("SolveNormalEquations"));
        EXPECT_THAT(std::string(e.what()), ::testing::HasSubstr("2x2"));
    }
}

TEST(ClosedFormFitter, ThrowsInvalidArgumentWhenTargetsDoNotMatchRows) {
    const Eigen::MatrixXd design = Eigen::MatrixXd::Ones(3, 1);
    const Eigen::VectorXd y = Eigen::VectorXd::Ones(2);
    EXPECT_THROW(SolveNormalEquations(design, y), std::invalid_argument);
}

TEST(ClosedFormFitter, ThrowsInvalidDegreeForNegativeDegree) {
    const std::vector<double> x{0, 1, 2};
    const std::vector<double> y{0, 1, 2};
    EXPECT_THROW(FitClosedForm(x, y, -1), InvalidDegreeError);
}

}  // namespace
