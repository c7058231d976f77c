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

#include "plot.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <boost/algorithm/string.hpp>
#include <fmt/format.h>

#include "polyreg_log.h"

namespace {
const char* HTML_TEMPLATE = R"foo(
<!DOCTYPE html>
<html lang="en">
<head>
    <meta charset="UTF-8">
    <meta http-equiv="X-UA-Compatible" content="IE=edge">
    <meta name="viewport" content="width=device-width, initial-scale=1.0">
    <title>polyreg</title>
    <script src="https://cdn.plot.ly/plotly-2.25.2.min.js" charset="utf-8"></script>
</head>
<body>
        <div id="gd"></div>

    <script>

var data = [$$0$$];

Plotly.newPlot('gd', data, $$1$$);

    </script>
</body>
</html>
)foo";

// Values are placed inside single quoted javascript strings.
std::string EscapeJs(const std::string& s) {
    auto escaped = boost::replace_all_copy(s, "\\", "\\\\");
    boost::replace_all(escaped, "'", "\\'");
    boost::replace_all(escaped, "<", "\\x3c");
    return escaped;
}

void WriteValues(std::stringstream& stream, const std::vector<double>& values) {
    for (auto j{0u}; j < values.size(); j++) {
        stream << fmt::format("{}", values[j]);
        if (j + 1 != values.size()) {
            stream << ",";
        }
    }
}
}  // namespace

std::string RenderPlot(const PlotArgs& graph) {
    std::string base_html(HTML_TEMPLATE);
    std::stringstream data;

    for (auto i{0u}; i < graph.data.size(); i++) {
        auto& line = graph.data[i];
        data << "{x:[";
        WriteValues(data, line.x);
        data << "],y:[";
        WriteValues(data, line.y);
        data << "],type:'scatter',mode:'" << (line.mode == ScatterMode::MARKERS ? "markers" : "lines") << "',name:'";
        data << EscapeJs(line.line_name) << "'";
        if (!line.color.empty()) {
            data << ",marker:{color:'" << EscapeJs(line.color) << "'}";
        }
        data << "}";
        if (i + 1 != graph.data.size()) {
            data << ",";
        }
    }

    boost::replace_first(base_html, "$$0$$", data.str());

    std::stringstream layout;
    layout << "{title:'" << EscapeJs(graph.graph_name) << "',xaxis:{title:'" << EscapeJs(graph.x_axis_title)
           << "'},yaxis:{title:'" << EscapeJs(graph.y_axis_title) << "'}}";

    boost::replace_first(base_html, "$$1$$", layout.str());

    return base_html;
}

void Plot(const PlotArgs& graph) {
    std::ofstream ofs(graph.out_path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open plot output - " + graph.out_path);
    }
    ofs << RenderPlot(graph);
    if (!ofs) {
        throw std::runtime_error("Failed to write plot output - " + graph.out_path);
    }
    LOGI << "Output plot at " << graph.out_path;
}
