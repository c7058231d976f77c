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

#include "main_flow.h"

#include <algorithm>
#include <filesystem>
#include <vector>

#include "csv_reader.h"
#include "equation.h"
#include "filesystem_util.h"
#include "math_utils.h"
#include "polyreg_log.h"

namespace {
constexpr size_t FITTED_CURVE_POINTS{200};
}

namespace polyreg::mainflow {

regression::SampleSet LoadSamples(std::string_view input_path) {
    const auto table = util::csv::ReadTable(std::filesystem::path(input_path));
    return regression::PrepareSamples(table);
}

void StoreEquation(const std::string& output_path, const regression::RegressionResult& result) {
    const auto equation = regression::FormatEquation(result.coefficients);
    util::filesystem::WriteText(output_path, equation);
    LOGI << equation;
    LOGI << "Output equation at " << output_path;
}

PlotArgs AssemblePlot(const regression::SampleSet& samples, const regression::RegressionResult& result) {
    PlotArgs plot_args = {};
    plot_args.graph_name = regression::GetPlotTitle(result.degree);
    plot_args.x_axis_title = samples.x_name;
    plot_args.y_axis_title = samples.y_name;
    plot_args.data.resize(3);

    auto& training = plot_args.data[0];
    training.line_name = "Training data";
    training.mode = ScatterMode::MARKERS;
    training.color = "blue";
    training.x = result.x_train;
    training.y = result.y_train;

    auto& prediction = plot_args.data[1];
    prediction.line_name = "Prediction";
    prediction.color = "red";
    prediction.x = result.test.x;
    prediction.y = result.test.y_predicted;

    auto& curve = plot_args.data[2];
    curve.line_name = "Fitted polynomial";
    curve.color = "gray";
    const auto [x_min, x_max] = std::minmax_element(samples.x.cbegin(), samples.x.cend());
    const std::vector<double> coefficients(result.coefficients.data(),
                                           result.coefficients.data() + result.coefficients.size());
    PolyvalRange(coefficients, *x_min, *x_max, FITTED_CURVE_POINTS, curve.x, curve.y);

    return plot_args;
}

void StorePlot(const std::string& output_path, const regression::SampleSet& samples,
               const regression::RegressionResult& result) {
    auto plot_args = AssemblePlot(samples, result);
    plot_args.out_path = output_path;
    Plot(plot_args);
}

}  // namespace polyreg::mainflow
