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

#include <filesystem>
#include <istream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace polyreg::util::csv {

// Input table which can not be read or does not hold the expected contents.
class DatasetException final : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Table {
    std::vector<std::string> header;
    // Every row has header.size() trimmed cells.
    std::vector<std::vector<std::string>> rows;
};

Table ReadTable(std::istream& in, char delimiter = ',');
Table ReadTable(const std::filesystem::path& path, char delimiter = ',');

// Empty cell or one of the common "not available" markers - NA, N/A, NaN, null, None etc.
bool IsMissingValue(std::string_view cell);

}  // namespace polyreg::util::csv
