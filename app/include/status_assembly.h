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

namespace polyreg::status {

enum EXIT_CODE : int { SUCCESS = 0, INVALID_ARGUMENT = 1, INVALID_DATASET = 2, FIT_FAILURE = 3, IO_FAILURE = 4 };

}
