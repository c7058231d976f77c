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

#include <string>
#include <vector>

#include <Eigen/Core>

#include "prediction.h"
#include "regression_config.h"
#include "sample_set.h"

namespace polyreg::regression {

struct RegressionResult {
    Strategy strategy;
    int degree;
    std::vector<double> x_train;
    std::vector<double> y_train;
    // Test inputs with their predictions and true values, ascending by x.
    SortedPredictions test;
    Eigen::VectorXd coefficients;
    double test_mse;
    double test_r2;
};

/*
 * Single run - split the samples, fit with the configured strategy on the training subset and predict the test
 * subset. Any failure is terminal, there is no fallback to the other strategy.
 */
RegressionResult RunRegression(const SampleSet& samples, const RegressionConfig& config);

// "Linear Regression" for degree 1, "Polynomial Regression (degree N)" otherwise.
std::string GetPlotTitle(int degree);

}  // namespace polyreg::regression
