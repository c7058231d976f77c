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
#include <string>
#include <vector>

#include "csv_reader.h"

namespace polyreg::regression {

struct SampleSet {
    std::vector<double> x;
    std::vector<double> y;
    std::string x_name;
    std::string y_name;

    [[nodiscard]] size_t Size() const { return x.size(); }
};

/*
 * First column is taken as x and the last one as y, others are only checked for missing values. Rows where any
 * of the cells is missing are dropped silently, the rest keep their original order.
 */
SampleSet PrepareSamples(const util::csv::Table& table);

}  // namespace polyreg::regression
