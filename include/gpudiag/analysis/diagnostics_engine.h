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
 * @file diagnostics_engine.h
 * @brief Entry point of the fragmentation and load-balance analyses
 *
 * The engine is a pure function of its configuration and the snapshot
 * passed in: it performs no I/O, keeps no state between calls and can be
 * shared freely between threads. Snapshot acquisition belongs to a
 * snapshot_provider (see diagnostics_service for the wired-up version).
 *
 * @code
 * gpudiag::diagnostics_engine engine;
 * auto summary = engine.analyze_cluster_fragmentation(nodes, pods_by_node);
 * auto balance = engine.analyze_load_balance(nodes);
 * @endcode
 */

#include <vector>

#include "allocation_pattern_analyzer.h"
#include "cluster_fragmentation_aggregator.h"
#include "fragmentation_scorer.h"
#include "load_balance_analyzer.h"

namespace gpudiag {

class diagnostics_engine {
   public:
    explicit diagnostics_engine(diagnostics_config config = diagnostics_config::defaults());

    /**
     * @brief Score every node and summarize the cluster
     * @param nodes Node snapshots, reported in this order
     * @param pods_by_node Active GPU pods per node name; missing nodes have no pods
     */
    cluster_fragmentation_summary analyze_cluster_fragmentation(
        const std::vector<node_snapshot>& nodes, const pod_map& pods_by_node) const;

    /**
     * @brief Score one node and describe its allocation pattern
     */
    node_fragmentation_detail analyze_node_fragmentation(
        const node_snapshot& node, const std::vector<pod_allocation>& pods) const;

    /**
     * @brief Node load scores and the cluster balance summary
     */
    load_balance_summary analyze_load_balance(const std::vector<node_snapshot>& nodes) const;

    const diagnostics_config& config() const { return config_; }

   private:
    diagnostics_config config_;
    fragmentation_scorer scorer_;
    allocation_pattern_analyzer pattern_analyzer_;
    cluster_fragmentation_aggregator cluster_aggregator_;
    node_load_scorer load_scorer_;
    load_balance_aggregator balance_aggregator_;
};

}  // namespace gpudiag
