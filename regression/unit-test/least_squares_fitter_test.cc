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
#include <vector>

#include "gmock/gmock.h"

#include "closed_form_fitter.h"
#include "polynomial_features.h"
#include "prediction.h"
#include "regression_errors.h"

namespace {

using ::testing::DoubleNear;
using ::testing::Eq;
using ::testing::IsTrue;
using ::testing::Le;
using namespace polyreg::regression;

const std::vector<double> X_TRAIN{0.3, 1.1, 1.9, 2.4, 3.8, 4.2, 5.0, 6.7, 7.1};
const std::vector<double> Y_TRAIN{1.9, 2.8, 6.1, 6.3, 12.2, 13.9, 19.4, 31.0, 33.6};

TEST(LeastSquaresFitter, AgreesWithClosedFormSolution) {
    for (int degree = 0; degree <= 3; degree++) {
        const auto fit = FitLeastSquares(X_TRAIN, Y_TRAIN, degree);
        const auto closed = FitClosedForm(X_TRAIN, Y_TRAIN, degree);

        ASSERT_THAT(fit.coefficients.size(), Eq(degree + 1));
        for (int i = 0; i <= degree; i++) {
            EXPECT_THAT(fit.coefficients(i), DoubleNear(closed(i), 1e-6)) << "degree " << degree << " term " << i;
        }
    }
}

TEST(LeastSquaresFitter, FitIsNoWorseThanZeroModel) {
    const Eigen::Map<const Eigen::VectorXd> targets(Y_TRAIN.data(), static_cast<Eigen::Index>(Y_TRAIN.size()));
    for (int degree = 0; degree <= 3; degree++) {
        const auto fit = FitLeastSquares(X_TRAIN, Y_TRAIN, degree);
        const auto design = ExpandPolynomial(X_TRAIN, degree, InterceptColumn::INCLUDE);

        const auto rss_fit = ResidualSumOfSquares(design, targets, fit.coefficients);
        const auto rss_zero = ResidualSumOfSquares(design, targets, Eigen::VectorXd::Zero(degree + 1));
        EXPECT_THAT(rss_fit, Le(rss_zero)) << "degree " << degree;
    }
}

TEST(LeastSquaresFitter, DegreeZeroGivesMeanAsConstantTerm) {
    const std::vector<double> x{1.0, 2.0, 3.0};
    const std::vector<double> y{4.0, 8.0, 3.0};
    const auto fit = FitLeastSquares(x, y, 0);

    ASSERT_THAT(fit.coefficients.size(), Eq(1));
    EXPECT_THAT(fit.coefficients(0), DoubleNear(5.0, 1e-12));
    EXPECT_THAT(fit.model.Weights().size(), Eq(0));
}

TEST(LeastSquaresFitter, InterceptIsMergedIntoConstantTerm) {
    const std::vector<double> x{0.0, 1.0, 2.0, 3.0, 4.0};
    const std::vector<double> y{3.0, 5.0, 7.0, 9.0, 11.0};
    const auto fit = FitLeastSquares(x, y, 1);

    ASSERT_THAT(fit.coefficients.size(), Eq(2));
    EXPECT_THAT(fit.model.Intercept(), DoubleNear(3.0, 1e-12));
    EXPECT_THAT(fit.coefficients(0), DoubleNear(3.0, 1e-12));
    EXPECT_THAT(fit.coefficients(1), DoubleNear(2.0, 1e-12));
}

TEST(LeastSquaresFitter, ReassemblePutsWeightsAfterConstantTerm) {
    LinearRegression model;
    Eigen::MatrixXd features(4, 2);
    features << 1, 1, 2, 4, 3, 9, 4, 16;
    Eigen::VectorXd y(4);
    for (int i = 0; i < 4; i++) {
        y(i) = 0.5 + 1.5 * features(i, 0) - 0.25 * features(i, 1);
    }
    model.Fit(features, y);

    const auto coefficients = ReassembleCoefficients(model);
    ASSERT_THAT(coefficients.size(), Eq(3));
    EXPECT_THAT(coefficients(0), DoubleNear(0.5, 1e-9));
    EXPECT_THAT(coefficients(1), DoubleNear(1.5, 1e-9));
    EXPECT_THAT(coefficients(2), DoubleNear(-0.25, 1e-9));
}

TEST(LeastSquaresFitter, ReassembleRequiresFittedModel) {
    EXPECT_THROW(ReassembleCoefficients(LinearRegression{}), std::logic_error);
}

TEST(LeastSquaresFitter, ThrowsFitFailureForConstantInput) {
    const std::vector<double> x{1.0, 1.0, 1.0, 1.0};
    const std::vector<double> y{1.0, 2.0, 3.0, 4.0};
    try {
        FitLeastSquares(x, y, 2);
        FAIL() << "Expected FitFailureError";
    } catch (const FitFailureError& e) {
        EXPECT_THAT(std::string(e.what()).find("rank deficient") != std::string::npos, IsTrue());
    }
}

TEST(LeastSquaresFitter, ThrowsInvalidDegreeForNegativeDegree) {
    EXPECT_THROW(FitLeastSquares(X_TRAIN, Y_TRAIN, -2), InvalidDegreeError);
}

}  // namespace
