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

#include "prediction.h"

#include <algorithm>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>

namespace {

void CheckSameLength(size_t a, size_t b, const char* what) {
    if (a != b) {
        throw std::invalid_argument(std::string(what) + " length mismatch - " + std::to_string(a) + " vs " +
                                    std::to_string(b));
    }
}

}  // namespace

namespace polyreg::regression {

Eigen::VectorXd PredictWithCoefficients(const Eigen::MatrixXd& design, const Eigen::VectorXd& coefficients) {
    CheckSameLength(design.cols(), coefficients.size(), "Design matrix columns and coefficients");
    return design * coefficients;
}

SortedPredictions SortByInput(const std::vector<double>& x, const Eigen::VectorXd& predictions,
                              const std::vector<double>& y_true) {
    CheckSameLength(x.size(), predictions.size(), "Inputs and predictions");
    if (!y_true.empty()) {
        CheckSameLength(x.size(), y_true.size(), "Inputs and true values");
    }

    std::vector<size_t> order(x.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&x](size_t a, size_t b) { return x[a] < x[b]; });

    SortedPredictions sorted;
    sorted.x.reserve(order.size());
    sorted.y_predicted.reserve(order.size());
    sorted.y_true.reserve(y_true.size());
    for (const auto i : order) {
        sorted.x.push_back(x[i]);
        sorted.y_predicted.push_back(predictions(static_cast<Eigen::Index>(i)));
        if (!y_true.empty()) {
            sorted.y_true.push_back(y_true[i]);
        }
    }

    return sorted;
}

double ResidualSumOfSquares(const Eigen::MatrixXd& design, const Eigen::VectorXd& y,
                            const Eigen::VectorXd& coefficients) {
    CheckSameLength(design.rows(), y.size(), "Design matrix rows and targets");
    return (y - PredictWithCoefficients(design, coefficients)).squaredNorm();
}

double MeanSquaredError(const std::vector<double>& y_true, const std::vector<double>& y_predicted) {
    CheckSameLength(y_true.size(), y_predicted.size(), "True and predicted values");
    if (y_true.empty()) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    double sse{0.0};
    for (size_t i{0}; i < y_true.size(); i++) {
        const double diff = y_true[i] - y_predicted[i];
        sse += diff * diff;
    }

    return sse / static_cast<double>(y_true.size());
}

double CoefficientOfDetermination(const std::vector<double>& y_true, const std::vector<double>& y_predicted) {
    CheckSameLength(y_true.size(), y_predicted.size(), "True and predicted values");
    if (y_true.empty()) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    const double mean = std::accumulate(y_true.cbegin(), y_true.cend(), 0.0) / static_cast<double>(y_true.size());
    double ss_res{0.0};
    double ss_tot{0.0};
    for (size_t i{0}; i < y_true.size(); i++) {
        ss_res += (y_true[i] - y_predicted[i]) * (y_true[i] - y_predicted[i]);
        ss_tot += (y_true[i] - mean) * (y_true[i] - mean);
    }

    if (ss_tot == 0.0) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    return 1.0 - ss_res / ss_tot;
}

}  // namespace polyreg::regression
