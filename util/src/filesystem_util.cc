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

#include "filesystem_util.h"

#include <fstream>
#include <stdexcept>
#include <string>

namespace polyreg::util::filesystem {

void WriteText(const std::filesystem::path& loc, std::string_view contents) {
    std::ofstream file(loc, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open " + loc.string() + " for writing");
    }

    file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    if (!file) {
        throw std::runtime_error("Failed to write " + std::to_string(contents.size()) + " bytes to " + loc.string());
    }
}

}  // namespace polyreg::util::filesystem
