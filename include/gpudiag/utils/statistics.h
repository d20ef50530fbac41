// BSD 3-Clause License
//
// Copyright (c) 2021-2025, gpu_diagnostics_system contributors
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

/**
 * @file statistics.h
 * @brief Generic population statistics over numeric samples
 * @date 2025
 *
 * Provides reusable mean / variance / extremes calculations used by the
 * load-balance analysis. Variance is the population variance (divide by n).
 */

#pragma once

#include <cmath>
#include <cstddef>
#include <limits>
#include <numeric>
#include <type_traits>
#include <vector>

namespace gpudiag {
namespace stats {

/**
 * @struct population_summary
 * @brief Statistical summary for a collection of values
 *
 * @tparam T Floating-point value type
 */
template <typename T>
struct population_summary {
    T min;
    T max;
    T mean;
    T variance;
    T stddev;
    T total;
    size_t count;
};

namespace detail {

/**
 * @brief Divide value by count, zero when count is zero
 */
template <typename T>
T divide(const T& value, size_t count) {
    if (count == 0) {
        return T{0};
    }
    return value / static_cast<T>(count);
}

}  // namespace detail

/**
 * @brief Arithmetic mean, zero for an empty input
 */
template <typename T>
T mean(const std::vector<T>& values) {
    static_assert(std::is_floating_point_v<T>, "mean requires floating point type");
    T total = std::accumulate(values.begin(), values.end(), T{0});
    return detail::divide(total, values.size());
}

/**
 * @brief Population variance around a precomputed mean
 */
template <typename T>
T population_variance(const std::vector<T>& values, T mean_value) {
    static_assert(std::is_floating_point_v<T>, "population_variance requires floating point type");
    T sum_sq{0};
    for (const auto& v : values) {
        T diff = v - mean_value;
        sum_sq += diff * diff;
    }
    return detail::divide(sum_sq, values.size());
}

/**
 * @brief Compute the population summary of values
 *
 * @tparam T Floating-point value type
 * @param values Samples, in any order
 * @return population_summary<T>; all fields zero when values is empty
 *
 * @example
 * @code
 * std::vector<double> rates = {10.0, 50.0, 90.0};
 * auto s = compute_population(rates);
 * // s.mean == 50.0, s.variance ~= 1066.67, s.stddev ~= 32.66
 * @endcode
 */
template <typename T>
population_summary<T> compute_population(const std::vector<T>& values) {
    static_assert(std::is_floating_point_v<T>, "compute_population requires floating point type");
    population_summary<T> result{};

    if (values.empty()) {
        result.min = T{0};
        result.max = T{0};
        result.mean = T{0};
        result.variance = T{0};
        result.stddev = T{0};
        result.total = T{0};
        result.count = 0;
        return result;
    }

    result.count = values.size();
    result.min = std::numeric_limits<T>::max();
    result.max = std::numeric_limits<T>::lowest();
    result.total = T{0};

    for (const auto& v : values) {
        result.total += v;
        if (v < result.min) {
            result.min = v;
        }
        if (v > result.max) {
            result.max = v;
        }
    }

    result.mean = detail::divide(result.total, result.count);
    result.variance = population_variance(values, result.mean);
    result.stddev = std::sqrt(result.variance);

    return result;
}

}  // namespace stats
}  // namespace gpudiag
