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

enum class ScatterMode { MARKERS, LINES };

struct Scatter {
    std::string line_name;
    std::vector<double> x;
    std::vector<double> y;
    ScatterMode mode{ScatterMode::LINES};
    std::string color;
};

struct PlotArgs {
    std::string out_path;
    std::string graph_name;
    std::string x_axis_title;
    std::string y_axis_title;
    std::vector<Scatter> data;
};

// Plotly HTML document contents for the graph.
std::string RenderPlot(const PlotArgs& graph);
// Throws std::runtime_error when the output can not be written.
void Plot(const PlotArgs& graph);
