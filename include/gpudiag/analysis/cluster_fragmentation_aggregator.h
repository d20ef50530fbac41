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
 * @file cluster_fragmentation_aggregator.h
 * @brief Folds per-node fragmentation results into a cluster summary
 */

#include <string>
#include <vector>

#include "../config/diagnostics_config.h"
#include "../core/diagnostic_types.h"

namespace gpudiag {

/**
 * @class cluster_fragmentation_aggregator
 * @brief Cluster score, status tallies, waste estimate and advice
 */
class cluster_fragmentation_aggregator {
   public:
    /// Score reported for a cluster without nodes. Means "nothing to
    /// report"; callers must not read it as a health signal.
    static constexpr double empty_cluster_score = 100.0;

    explicit cluster_fragmentation_aggregator(
        const diagnostics_config& config = diagnostics_config::defaults());

    /**
     * @brief Mean node score, or empty_cluster_score when nodes is empty
     */
    static double cluster_score(const std::vector<node_fragmentation>& nodes);

    /**
     * @brief Status tallies and wasted GPUs
     *
     * Wasted GPUs are the available GPUs of every non-healthy node;
     * waste_percentage relates them to the summed capacity (0 when the
     * cluster has no capacity).
     */
    static fragmentation_summary summarize(const std::vector<node_fragmentation>& nodes);

    /**
     * @brief Cluster recommendations; all matching checks contribute
     */
    std::vector<std::string> recommend(const std::vector<node_fragmentation>& nodes) const;

    /**
     * @brief Build the full cluster summary, taking ownership of nodes
     */
    cluster_fragmentation_summary aggregate(std::vector<node_fragmentation> nodes) const;

   private:
    double low_utilization_percent_;
};

}  // namespace gpudiag
