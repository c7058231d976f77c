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

#include <limits>
#include <vector>

#include "gmock/gmock.h"

#include "regression_errors.h"

namespace {

using ::testing::DoubleEq;
using ::testing::Eq;
using polyreg::regression::ExpandPolynomial;
using polyreg::regression::InterceptColumn;

TEST(PolynomialFeatures, IncludesInterceptColumnAndAscendingPowers) {
    const std::vector<double> x{2.0, -1.0, 0.5};
    const auto a = ExpandPolynomial(x, 3, InterceptColumn::INCLUDE);

    ASSERT_THAT(a.rows(), Eq(3));
    ASSERT_THAT(a.cols(), Eq(4));
    EXPECT_THAT(a(0, 0), DoubleEq(1.0));
    EXPECT_THAT(a(0, 1), DoubleEq(2.0));
    EXPECT_THAT(a(0, 2), DoubleEq(4.0));
    EXPECT_THAT(a(0, 3), DoubleEq(8.0));
    EXPECT_THAT(a(1, 0), DoubleEq(1.0));
    EXPECT_THAT(a(1, 1), DoubleEq(-1.0));
    EXPECT_THAT(a(1, 2), DoubleEq(1.0));
    EXPECT_THAT(a(1, 3), DoubleEq(-1.0));
    EXPECT_THAT(a(2, 3), DoubleEq(0.125));
}

TEST(PolynomialFeatures, ExcludedInterceptStartsFromFirstPower) {
    const std::vector<double> x{3.0, 0.0};
    const auto a = ExpandPolynomial(x, 2, InterceptColumn::EXCLUDE);

    ASSERT_THAT(a.rows(), Eq(2));
    ASSERT_THAT(a.cols(), Eq(2));
    EXPECT_THAT(a(0, 0), DoubleEq(3.0));
    EXPECT_THAT(a(0, 1), DoubleEq(9.0));
    EXPECT_THAT(a(1, 0), DoubleEq(0.0));
    EXPECT_THAT(a(1, 1), DoubleEq(0.0));
}

TEST(PolynomialFeatures, DegreeZeroIsConstantOnly) {
    const std::vector<double> x{5.0, 6.0, 7.0};
    const auto with_intercept = ExpandPolynomial(x, 0, InterceptColumn::INCLUDE);
    ASSERT_THAT(with_intercept.cols(), Eq(1));
    for (int i = 0; i < with_intercept.rows(); i++) {
        EXPECT_THAT(with_intercept(i, 0), DoubleEq(1.0));
    }

    const auto without_intercept = ExpandPolynomial(x, 0, InterceptColumn::EXCLUDE);
    EXPECT_THAT(without_intercept.rows(), Eq(3));
    EXPECT_THAT(without_intercept.cols(), Eq(0));
}

TEST(PolynomialFeatures, EmptyInputGivesNoRows) {
    const auto a = ExpandPolynomial(std::vector<double>{}, 2, InterceptColumn::INCLUDE);
    EXPECT_THAT(a.rows(), Eq(0));
    EXPECT_THAT(a.cols(), Eq(3));
}

TEST(PolynomialFeatures, ColumnCountDoesNotOverflowForLargestDegree) {
    const auto a = ExpandPolynomial(std::vector<double>{}, std::numeric_limits<int>::max(), InterceptColumn::INCLUDE);
    EXPECT_THAT(a.rows(), Eq(0));
    EXPECT_THAT(a.cols(), Eq(static_cast<Eigen::Index>(std::numeric_limits<int>::max()) + 1));
}

TEST(PolynomialFeatures, ThrowsInvalidDegreeForNegativeDegree) {
    const std::vector<double> x{1.0};
    EXPECT_THROW(ExpandPolynomial(x, -1, InterceptColumn::INCLUDE), polyreg::regression::InvalidDegreeError);
    EXPECT_THROW(ExpandPolynomial(x, -3, InterceptColumn::EXCLUDE), polyreg::regression::InvalidDegreeError);
}

}  // namespace
