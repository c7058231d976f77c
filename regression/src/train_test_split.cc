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

#include "train_test_split.h"

#include <cmath>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>

#include "polyreg_log.h"
#include "regression_errors.h"

namespace {

uint32_t BoundedDraw(std::mt19937& gen, uint32_t max) {
    if (max == 0) {
        return 0;
    }

    uint32_t mask = max;
    mask |= mask >> 1;
    mask |= mask >> 2;
    mask |= mask >> 4;
    mask |= mask >> 8;
    mask |= mask >> 16;

    uint32_t value;
    do {
        value = static_cast<uint32_t>(gen()) & mask;
    } while (value > max);

    return value;
}

}  // namespace

namespace polyreg::regression {

std::vector<size_t> SeededPermutation(size_t n, uint32_t seed) {
    std::vector<size_t> permutation(n);
    std::iota(permutation.begin(), permutation.end(), 0);

    std::mt19937 gen(seed);
    for (size_t i = n; i-- > 1;) {
        const auto j = BoundedDraw(gen, static_cast<uint32_t>(i));
        std::swap(permutation[i], permutation[j]);
    }

    return permutation;
}

SplitIndices SplitSampleIndices(size_t sample_count, double test_fraction, uint32_t seed) {
    if (sample_count < 2) {
        throw InsufficientDataError(__FUNCTION__, "at least 2 samples are required for a train/test split, got " +
                                                      std::to_string(sample_count));
    }
    if (!(test_fraction > 0.0 && test_fraction < 1.0)) {
        throw std::invalid_argument("Test fraction must be within (0, 1), got " + std::to_string(test_fraction));
    }

    const auto test_count = static_cast<size_t>(std::ceil(test_fraction * static_cast<double>(sample_count)));
    if (test_count == 0 || test_count >= sample_count) {
        throw InsufficientDataError(__FUNCTION__, std::to_string(sample_count) + " samples with test fraction " +
                                                      std::to_string(test_fraction) +
                                                      " would leave training or test subset empty");
    }

    const auto permutation = SeededPermutation(sample_count, seed);
    SplitIndices split;
    split.test.assign(permutation.cbegin(), permutation.cbegin() + test_count);
    split.train.assign(permutation.cbegin() + test_count, permutation.cend());

    LOGD << "Split " << sample_count << " samples into " << split.train.size() << " training and "
         << split.test.size() << " test samples, seed " << seed;

    return split;
}

TrainTestSplit SplitSamples(const SampleSet& samples, double test_fraction, uint32_t seed) {
    if (samples.x.size() != samples.y.size()) {
        throw std::invalid_argument("Sample set has " + std::to_string(samples.x.size()) + " x and " +
                                    std::to_string(samples.y.size()) + " y values");
    }

    const auto indices = SplitSampleIndices(samples.Size(), test_fraction, seed);
    TrainTestSplit split;
    split.x_train.reserve(indices.train.size());
    split.y_train.reserve(indices.train.size());
    for (const auto i : indices.train) {
        split.x_train.push_back(samples.x.at(i));
        split.y_train.push_back(samples.y.at(i));
    }
    split.x_test.reserve(indices.test.size());
    split.y_test.reserve(indices.test.size());
    for (const auto i : indices.test) {
        split.x_test.push_back(samples.x.at(i));
        split.y_test.push_back(samples.y.at(i));
    }

    return split;
}

}  // namespace polyreg::regression
