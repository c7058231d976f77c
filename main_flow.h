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
#include <string_view>

#include "plot.h"
#include "regression_run.h"
#include "sample_set.h"

namespace polyreg::mainflow {

regression::SampleSet LoadSamples(std::string_view input_path);

void StoreEquation(const std::string& output_path, const regression::RegressionResult& result);

// Training points as markers, sorted test predictions as a line plus the fitted polynomial over the data range.
PlotArgs AssemblePlot(const regression::SampleSet& samples, const regression::RegressionResult& result);
void StorePlot(const std::string& output_path, const regression::SampleSet& samples,
               const regression::RegressionResult& result);

}  // namespace polyreg::mainflow
