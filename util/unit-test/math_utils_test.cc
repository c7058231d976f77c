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

#include "math_utils.h"

#include <vector>

#include "gmock/gmock.h"

namespace {

using ::testing::DoubleEq;
using ::testing::ElementsAre;
using ::testing::Eq;

TEST(MathUtils, PolyvalUsesAscendingPowers) {
    const std::vector<double> p{1.0, -2.0, 0.5};
    EXPECT_THAT(Polyval(p, 0.0), DoubleEq(1.0));
    EXPECT_THAT(Polyval(p, 2.0), DoubleEq(-1.0));
    EXPECT_THAT(Polyval(p, -2.0), DoubleEq(7.0));
    EXPECT_THAT(Polyval(p.data(), 1, 100.0), DoubleEq(1.0));
    EXPECT_THAT(Polyval(std::vector<double>{}, 3.0), DoubleEq(0.0));
}

TEST(MathUtils, PolyvalRangeCoversBothEnds) {
    const std::vector<double> p{0.0, 0.0, 1.0};
    std::vector<double> x;
    std::vector<double> y;
    PolyvalRange(p, -1.0, 1.0, 5, x, y);

    EXPECT_THAT(x, ElementsAre(-1.0, -0.5, 0.0, 0.5, 1.0));
    EXPECT_THAT(y, ElementsAre(1.0, 0.25, 0.0, 0.25, 1.0));
}

TEST(MathUtils, PolyvalRangeSinglePointAndEmpty) {
    const std::vector<double> p{3.0, 1.0};
    std::vector<double> x{9.0, 9.0};
    std::vector<double> y;
    PolyvalRange(p, 2.0, 5.0, 1, x, y);
    EXPECT_THAT(x, ElementsAre(2.0));
    EXPECT_THAT(y, ElementsAre(5.0));

    PolyvalRange(p, 2.0, 5.0, 0, x, y);
    EXPECT_THAT(x.size(), Eq(0u));
    EXPECT_THAT(y.size(), Eq(0u));
}

}  // namespace
