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

#include <filesystem>
#include <stdexcept>

#include "gmock/gmock.h"

#include "file_contents.h"

namespace {

using ::testing::StrEq;
using namespace polyreg::util::filesystem;

TEST(FilesystemUtil, WrittenTextIsReadBack) {
    const auto path = std::filesystem::temp_directory_path() / "polyreg_filesystem_util_test.txt";
    WriteText(path, "y = 2 * x^1");
    EXPECT_THAT(polyreg::test::ReadFileContents(path), StrEq("y = 2 * x^1"));

    WriteText(path, "short");
    EXPECT_THAT(polyreg::test::ReadFileContents(path), StrEq("short"));
    std::filesystem::remove(path);
}

TEST(FilesystemUtil, WriteToMissingDirectoryThrows) {
    const auto path = std::filesystem::temp_directory_path() / "polyreg_no_such_dir" / "equation.txt";
    std::filesystem::remove_all(path.parent_path());
    EXPECT_THROW(WriteText(path, "y = 0"), std::runtime_error);
}

}  // namespace
