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
 * @file static_snapshot_provider.h
 * @brief In-memory snapshot provider
 *
 * Holds a cluster snapshot that is replaced as a whole or node by node.
 * Useful for tests and benchmarks, and for embedding the diagnostics in a
 * process that already receives cluster state by other means.
 */

#include <shared_mutex>
#include <string>
#include <vector>

#include "snapshot_provider.h"

namespace gpudiag {

class static_snapshot_provider : public snapshot_provider {
   public:
    static_snapshot_provider() = default;
    ~static_snapshot_provider() override = default;

    std::string get_provider_name() const override { return "static"; }

    common::Result<std::vector<node_snapshot>> list_gpu_nodes() override;
    common::Result<std::optional<node_snapshot>> get_node(const std::string& name) override;
    common::Result<std::vector<pod_allocation>> get_active_gpu_pods(
        const std::string& node_name) override;

    /**
     * @brief Replace all nodes; pods of removed nodes are kept until clear()
     */
    void set_nodes(std::vector<node_snapshot> nodes);

    /**
     * @brief Insert a node or replace the node with the same name
     */
    void upsert_node(const node_snapshot& node);

    /**
     * @brief Replace the active pods of a node
     */
    void set_pods(const std::string& node_name, std::vector<pod_allocation> pods);

    /**
     * @brief Drop every node and pod
     */
    void clear();

    size_t node_count() const;

   private:
    mutable std::shared_mutex mutex_;
    std::vector<node_snapshot> nodes_;
    pod_map pods_;
};

}  // namespace gpudiag
