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

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include "VERSION"
#include "args.h"
#include "csv_reader.h"
#include "main_flow.h"
#include "polyreg_log.h"
#include "regression_errors.h"
#include "regression_run.h"
#include "status_assembly.h"

namespace {

template <typename T>
void ExceptionMessagePrint(const T& e) {
    LOGE << "Caught an exception";
    LOGE << e.what();
    LOGE << "Exiting.";
}

std::string GetSoftwareVersion() { return "polyreg/" + std::string(VERSION_STRING); }

auto TimeStart() { return std::chrono::steady_clock::now(); }

void TimeStop(std::chrono::steady_clock::time_point beg, const char* msg) {
    auto end = std::chrono::steady_clock::now();
    auto diff = std::chrono::duration_cast<std::chrono::milliseconds>(end - beg).count();
    LOGD << msg << " time = " << diff << " ms";
}
}  // namespace

int main(int argc, char* argv[]) {
    std::string args_help{};
    try {
        const std::vector<char*> args_raw(argv, argv + argc);
        polyreg::Args args(args_raw);
        args_help = args.GetHelp();
        if (args.IsHelpRequested()) {
            std::cout << GetSoftwareVersion() << std::endl;
            std::cout << args.GetHelp() << std::endl;
            return polyreg::status::EXIT_CODE::SUCCESS;
        }

        polyreg::log::Initialize();
        polyreg::log::SetLevel(args.GetLogLevel());
        LOGI << GetSoftwareVersion();

        const auto config = args.GetRegressionConfig();
        auto time_start = TimeStart();
        const auto samples = polyreg::mainflow::LoadSamples(config.input_path);
        LOGI << "Loaded " << samples.Size() << " samples from " << config.input_path;
        TimeStop(time_start, "Input dataset read");

        time_start = TimeStart();
        const auto result = polyreg::regression::RunRegression(samples, config);
        LOGI << polyreg::regression::GetPlotTitle(result.degree) << " with '"
             << polyreg::regression::GetStrategyName(result.strategy) << "' on " << result.x_train.size()
             << " training and " << result.test.x.size() << " test samples";
        LOGI << "Test MSE = " << result.test_mse << " R^2 = " << result.test_r2;
        TimeStop(time_start, "Regression");

        polyreg::mainflow::StoreEquation(config.equation_path, result);
        polyreg::mainflow::StorePlot(config.plot_path, samples, result);
    } catch (const boost::program_options::error& e) {
        ExceptionMessagePrint(e);
        std::cout << args_help << std::endl;
        return polyreg::status::EXIT_CODE::INVALID_ARGUMENT;
    } catch (const polyreg::regression::UnknownStrategyError& e) {
        ExceptionMessagePrint(e);
        return polyreg::status::EXIT_CODE::INVALID_ARGUMENT;
    } catch (const polyreg::regression::InvalidDegreeError& e) {
        ExceptionMessagePrint(e);
        return polyreg::status::EXIT_CODE::INVALID_ARGUMENT;
    } catch (const polyreg::regression::InsufficientDataError& e) {
        ExceptionMessagePrint(e);
        return polyreg::status::EXIT_CODE::INVALID_DATASET;
    } catch (const polyreg::regression::RegressionError& e) {
        // SingularMatrixError and FitFailureError.
        ExceptionMessagePrint(e);
        return polyreg::status::EXIT_CODE::FIT_FAILURE;
    } catch (const polyreg::util::csv::DatasetException& e) {
        ExceptionMessagePrint(e);
        return polyreg::status::EXIT_CODE::INVALID_DATASET;
    } catch (const std::invalid_argument& e) {
        ExceptionMessagePrint(e);
        return polyreg::status::EXIT_CODE::INVALID_ARGUMENT;
    } catch (const std::runtime_error& e) {
        // Failure to store the results.
        ExceptionMessagePrint(e);
        return polyreg::status::EXIT_CODE::IO_FAILURE;
    } catch (const std::exception& e) {
        ExceptionMessagePrint(e);
        return polyreg::status::EXIT_CODE::IO_FAILURE;
    }

    return polyreg::status::EXIT_CODE::SUCCESS;
}
