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

#include "regression_run.h"

#include <utility>

#include "closed_form_fitter.h"
#include "equation.h"
#include "least_squares_fitter.h"
#include "polynomial_features.h"
#include "polyreg_log.h"
#include "regression_errors.h"
#include "train_test_split.h"

namespace polyreg::regression {

RegressionResult RunRegression(const SampleSet& samples, const RegressionConfig& config) {
    if (config.degree < 0 || config.degree > MAX_POLYNOMIAL_DEGREE) {
        throw InvalidDegreeError(__FUNCTION__, "polynomial degree must be within 0.." +
                                                   std::to_string(MAX_POLYNOMIAL_DEGREE) + ", got " +
                                                   std::to_string(config.degree));
    }

    auto split = SplitSamples(samples, config.test_fraction, config.split_seed);

    Eigen::VectorXd coefficients;
    Eigen::VectorXd predictions;
    switch (config.strategy) {
        case Strategy::CLOSED_FORM: {
            coefficients = FitClosedForm(split.x_train, split.y_train, config.degree);
            const auto test_design = ExpandPolynomial(split.x_test, config.degree, InterceptColumn::INCLUDE);
            predictions = PredictWithCoefficients(test_design, coefficients);
            break;
        }
        case Strategy::LEAST_SQUARES: {
            auto fit = FitLeastSquares(split.x_train, split.y_train, config.degree);
            const auto test_features = ExpandPolynomial(split.x_test, config.degree, InterceptColumn::EXCLUDE);
            predictions = fit.model.Predict(test_features);
            coefficients = std::move(fit.coefficients);
            break;
        }
    }

    LOGD << GetStrategyName(config.strategy) << " fit - " << FormatEquation(coefficients);

    RegressionResult result{};
    result.strategy = config.strategy;
    result.degree = config.degree;
    result.test = SortByInput(split.x_test, predictions, split.y_test);
    result.x_train = std::move(split.x_train);
    result.y_train = std::move(split.y_train);
    result.coefficients = std::move(coefficients);
    result.test_mse = MeanSquaredError(result.test.y_true, result.test.y_predicted);
    result.test_r2 = CoefficientOfDetermination(result.test.y_true, result.test.y_predicted);

    return result;
}

std::string GetPlotTitle(int degree) {
    if (degree == 1) {
        return "Linear Regression";
    }

    return "Polynomial Regression (degree " + std::to_string(degree) + ")";
}

}  // namespace polyreg::regression
