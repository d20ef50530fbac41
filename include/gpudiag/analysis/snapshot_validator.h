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
 * @file snapshot_validator.h
 * @brief Range checks on snapshot input and the configured handling policy
 *
 * A node snapshot is well-formed when
 * - total_gpus >= 0
 * - 0 <= allocated_gpus <= total_gpus
 * - 0 <= utilization_percent <= 100 (and not NaN)
 * and a pod allocation when allocated_gpus >= 0.
 */

#include <string>
#include <vector>

#include "../config/diagnostics_config.h"
#include "../core/diagnostic_types.h"
#include "../core/result_types.h"

namespace gpudiag {

class snapshot_validator {
   public:
    /**
     * @brief Check a node snapshot
     * @return invalid_snapshot naming the node and the violated range
     */
    static common::VoidResult validate_node(const node_snapshot& node);

    /**
     * @brief Check a pod allocation on node_name
     */
    static common::VoidResult validate_pod(const pod_allocation& pod, const std::string& node_name);

    /**
     * @brief Clamp a node snapshot into its valid ranges
     */
    static node_snapshot clamp_node(node_snapshot node);

    /**
     * @brief Apply a policy to a batch of nodes
     *
     * propagate returns the nodes unchanged, clamp repairs them, reject
     * fails on the first malformed node.
     */
    static common::Result<std::vector<node_snapshot>> apply_policy(
        std::vector<node_snapshot> nodes, snapshot_policy policy);

    /**
     * @brief Apply a policy to the pods of one node
     */
    static common::Result<std::vector<pod_allocation>> apply_policy(
        std::vector<pod_allocation> pods, const std::string& node_name, snapshot_policy policy);
};

}  // namespace gpudiag
