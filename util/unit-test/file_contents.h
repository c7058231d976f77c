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
#include <fstream>
#include <iterator>
#include <string>

namespace polyreg::test {

// Whole file contents, throws std::ios_base::failure when the file can not be read.
inline std::string ReadFileContents(const std::filesystem::path& loc) {
    std::ifstream file(loc, std::ios::binary);
    file.exceptions(std::ifstream::failbit | std::ifstream::badbit);

    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

}  // namespace polyreg::test
