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

#include "sample_set.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "polyreg_log.h"

namespace {

double ParseCell(const std::string& cell, size_t row, const std::string& column) {
    size_t pos{};
    double value{};
    try {
        value = std::stod(cell, &pos);
    } catch (const std::logic_error&) {
        pos = 0;
    }

    if (pos == 0 || pos != cell.size()) {
        throw polyreg::util::csv::DatasetException("Value '" + cell + "' at data row " + std::to_string(row + 1) +
                                                   " of column '" + column + "' is not a number");
    }
    if (!std::isfinite(value)) {
        throw polyreg::util::csv::DatasetException("Value '" + cell + "' at data row " + std::to_string(row + 1) +
                                                   " of column '" + column + "' is not finite");
    }

    return value;
}

}  // namespace

namespace polyreg::regression {

SampleSet PrepareSamples(const util::csv::Table& table) {
    if (table.header.size() < 2) {
        throw util::csv::DatasetException("Input table must have at least 2 columns, it has " +
                                          std::to_string(table.header.size()));
    }

    SampleSet samples;
    samples.x_name = table.header.front();
    samples.y_name = table.header.back();
    samples.x.reserve(table.rows.size());
    samples.y.reserve(table.rows.size());

    size_t dropped{0};
    for (size_t i{0}; i < table.rows.size(); i++) {
        const auto& row = table.rows.at(i);
        if (std::any_of(row.cbegin(), row.cend(), util::csv::IsMissingValue)) {
            dropped++;
            continue;
        }
        samples.x.push_back(ParseCell(row.front(), i, samples.x_name));
        samples.y.push_back(ParseCell(row.back(), i, samples.y_name));
    }

    LOGD << "Prepared " << samples.Size() << " samples of '" << samples.x_name << "' against '" << samples.y_name
         << "', dropped " << dropped << " rows with missing values";

    return samples;
}

}  // namespace polyreg::regression
