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

#include "csv_reader.h"

#include <algorithm>
#include <array>
#include <fstream>
#include <stdexcept>

#include <boost/algorithm/string.hpp>

#include "polyreg_log.h"

namespace {

constexpr std::array<std::string_view, 13> MISSING_VALUE_MARKERS{
    "NA", "N/A", "n/a", "NaN", "nan", "-NaN", "-nan", "null", "NULL", "None", "#N/A", "#NA", "<NA>"};

std::vector<std::string> SplitLine(const std::string& line, char delimiter) {
    std::vector<std::string> cells;
    boost::algorithm::split(cells, line, [delimiter](char c) { return c == delimiter; });
    for (auto& c : cells) {
        boost::algorithm::trim(c);
        // Plain quoting only, delimiters inside quotes are not supported.
        if (c.size() >= 2 && c.front() == '"' && c.back() == '"') {
            c = c.substr(1, c.size() - 2);
        }
    }

    return cells;
}

}  // namespace

namespace polyreg::util::csv {

bool IsMissingValue(std::string_view cell) {
    if (cell.empty()) {
        return true;
    }

    return std::find(MISSING_VALUE_MARKERS.cbegin(), MISSING_VALUE_MARKERS.cend(), cell) !=
           MISSING_VALUE_MARKERS.cend();
}

Table ReadTable(std::istream& in, char delimiter) {
    Table table;
    std::string line;
    size_t line_no{0};

    while (std::getline(in, line)) {
        line_no++;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (boost::algorithm::all(line, boost::algorithm::is_space())) {
            continue;
        }

        auto cells = SplitLine(line, delimiter);
        if (table.header.empty()) {
            table.header = std::move(cells);
            continue;
        }

        if (cells.size() != table.header.size()) {
            throw DatasetException("Line " + std::to_string(line_no) + " has " + std::to_string(cells.size()) +
                                   " fields, expected " + std::to_string(table.header.size()));
        }
        table.rows.push_back(std::move(cells));
    }

    if (table.header.empty()) {
        throw DatasetException("Table has no header line");
    }

    LOGD << "Read table of " << table.header.size() << " columns and " << table.rows.size() << " rows";

    return table;
}

Table ReadTable(const std::filesystem::path& path, char delimiter) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw DatasetException("Failed to open input - " + path.string());
    }

    return ReadTable(file, delimiter);
}

}  // namespace polyreg::util::csv
