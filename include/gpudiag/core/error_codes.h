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

#pragma once

/**
 * @file error_codes.h
 * @brief Diagnostics system specific error codes
 *
 * This file defines error codes used throughout the diagnostics system,
 * following the pattern established by the other kcenon-based systems.
 */

#include <cstdint>
#include <string>

namespace gpudiag {

/**
 * @enum diagnostics_error_code
 * @brief Error codes for diagnostics system operations
 */
enum class diagnostics_error_code : std::uint32_t {
    // Success
    success = 0,

    // Configuration errors (3000-3999)
    invalid_configuration = 3000,
    configuration_parse_error = 3001,
    threshold_out_of_range = 3002,

    // Snapshot / provider errors (4000-4999)
    provider_not_available = 4000,
    snapshot_fetch_failed = 4001,
    no_gpu_nodes = 4002,
    node_not_found = 4003,

    // Validation errors (5000-5999)
    invalid_snapshot = 5000,
    invalid_argument = 5001,

    // Unknown error
    unknown_error = 9999
};

/**
 * @brief Convert error code to string representation
 * @param code The error code to convert
 * @return String representation of the error code
 */
inline std::string error_code_to_string(diagnostics_error_code code) {
    switch (code) {
        case diagnostics_error_code::success:
            return "Success";

        // Configuration errors
        case diagnostics_error_code::invalid_configuration:
            return "Invalid configuration";
        case diagnostics_error_code::configuration_parse_error:
            return "Configuration parse error";
        case diagnostics_error_code::threshold_out_of_range:
            return "Threshold out of range";

        // Snapshot errors
        case diagnostics_error_code::provider_not_available:
            return "Snapshot provider not available";
        case diagnostics_error_code::snapshot_fetch_failed:
            return "Snapshot fetch failed";
        case diagnostics_error_code::no_gpu_nodes:
            return "No GPU nodes found";
        case diagnostics_error_code::node_not_found:
            return "Node not found";

        // Validation errors
        case diagnostics_error_code::invalid_snapshot:
            return "Invalid snapshot";
        case diagnostics_error_code::invalid_argument:
            return "Invalid argument";

        case diagnostics_error_code::unknown_error:
        default:
            return "Unknown error";
    }
}

}  // namespace gpudiag
