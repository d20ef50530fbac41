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
 * @file allocation_pattern_analyzer.h
 * @brief Pod allocation shape of a node and node-level advice
 */

#include <string>
#include <vector>

#include "../config/diagnostics_config.h"
#include "../core/diagnostic_types.h"

namespace gpudiag {

/**
 * @class allocation_pattern_analyzer
 * @brief Classifies pods by allocation size and derives node recommendations
 */
class allocation_pattern_analyzer {
   public:
    explicit allocation_pattern_analyzer(
        const diagnostics_config& config = diagnostics_config::defaults());

    /**
     * @brief Count fully / partially allocated pods and estimate the free block
     *
     * largest_contiguous_gpu is total_gpus minus the pod allocations; GPU
     * slot layout is not modelled.
     */
    allocation_pattern analyze(const std::vector<pod_allocation>& pods, int32_t total_gpus) const;

    /**
     * @brief Node recommendations, in rule order
     *
     * Every matching rule contributes one entry; when none matches the
     * result is the single "healthy" entry.
     */
    std::vector<std::string> recommend(const node_fragmentation& frag,
                                       const allocation_pattern& pattern) const;

   private:
    int large_pod_gpus_;
    node_advice_rules advice_;
};

}  // namespace gpudiag
