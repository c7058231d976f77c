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

#include <cstddef>
#include <cstdint>
#include <vector>

#include "regression_config.h"
#include "sample_set.h"

namespace polyreg::regression {

struct SplitIndices {
    std::vector<size_t> train;
    std::vector<size_t> test;
};

struct TrainTestSplit {
    std::vector<double> x_train;
    std::vector<double> y_train;
    std::vector<double> x_test;
    std::vector<double> y_test;
};

/*
 * Permutation of [0, n) by Fisher-Yates shuffle on a 32 bit Mersenne Twister. Bounded draws use masked rejection
 * sampling, hence the result matches the permutation numpy's legacy RandomState produces for the same seed.
 */
std::vector<size_t> SeededPermutation(size_t n, uint32_t seed);

/*
 * ceil(test_fraction * n) first indices of the seeded permutation form the test subset, the rest form the
 * training subset in permutation order. Throws InsufficientDataError when either subset would end up empty.
 */
SplitIndices SplitSampleIndices(size_t sample_count, double test_fraction = DEFAULT_TEST_FRACTION,
                                uint32_t seed = DEFAULT_SPLIT_SEED);

TrainTestSplit SplitSamples(const SampleSet& samples, double test_fraction = DEFAULT_TEST_FRACTION,
                            uint32_t seed = DEFAULT_SPLIT_SEED);

}  // namespace polyreg::regression
