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

#include <stdexcept>
#include <string>
#include <string_view>

namespace polyreg::regression {

/**
 * Base of all the failures that terminate a regression run. The operation names the step which failed, the
 * message carries the offending dimensions or values.
 */
class RegressionError : public std::runtime_error {
public:
    RegressionError(std::string_view operation, const std::string& message)
        : std::runtime_error(std::string(operation) + " - " + message), operation_{operation} {}

    [[nodiscard]] std::string_view GetOperation() const { return operation_; }

private:
    std::string operation_;
};

class InvalidDegreeError final : public RegressionError {
public:
    using RegressionError::RegressionError;
};

class InsufficientDataError final : public RegressionError {
public:
    using RegressionError::RegressionError;
};

class SingularMatrixError final : public RegressionError {
public:
    using RegressionError::RegressionError;
};

class FitFailureError final : public RegressionError {
public:
    using RegressionError::RegressionError;
};

class UnknownStrategyError final : public RegressionError {
public:
    using RegressionError::RegressionError;
};

}  // namespace polyreg::regression
