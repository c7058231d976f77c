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

#include <cstddef>
#include <vector>

// Coefficients are in ascending power order, p[0] is the constant term.
inline double Polyval(const double* p, size_t n, double x) {
    double val = 0.0;
    // Horner's method
    for (size_t i = n; i-- > 0;) {
        val *= x;
        val += p[i];
    }
    return val;
}

inline double Polyval(const std::vector<double>& p, double x) { return Polyval(p.data(), p.size(), x); }

// Evaluates p at count evenly spaced points from x_start to x_end inclusive.
inline void PolyvalRange(const std::vector<double>& p, double x_start, double x_end, size_t count,
                         std::vector<double>& x, std::vector<double>& y) {
    x.resize(count);
    y.resize(count);
    for (size_t i = 0; i < count; i++) {
        x[i] = count == 1 ? x_start : x_start + (x_end - x_start) * static_cast<double>(i) / (count - 1);
        y[i] = Polyval(p.data(), p.size(), x[i]);
    }
}
