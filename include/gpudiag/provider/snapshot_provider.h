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
 * @file snapshot_provider.h
 * @brief Source of node and pod snapshots for one cluster
 *
 * The diagnostics engine never fetches data itself. A provider wraps
 * whatever store holds the current cluster state (node / pod tables,
 * a metrics backend, a fixture) and is injected into diagnostics_service.
 *
 * Usage:
 * @code
 *   auto provider = std::make_shared<static_snapshot_provider>();
 *   provider->set_nodes(nodes);
 *   diagnostics_service service(provider);
 * @endcode
 */

#include <optional>
#include <string>
#include <vector>

#include "../core/diagnostic_types.h"
#include "../core/result_types.h"

namespace gpudiag {

/**
 * @class snapshot_provider
 * @brief Abstract interface for cluster snapshot acquisition
 *
 * Implementations must be safe to call from several threads when the
 * service they are injected into is shared.
 */
class snapshot_provider {
   public:
    snapshot_provider() = default;
    virtual ~snapshot_provider() = default;

    // Non-copyable, non-moveable
    snapshot_provider(const snapshot_provider&) = delete;
    snapshot_provider& operator=(const snapshot_provider&) = delete;
    snapshot_provider(snapshot_provider&&) = delete;
    snapshot_provider& operator=(snapshot_provider&&) = delete;

    /**
     * @brief Get the provider name, used in log messages
     */
    virtual std::string get_provider_name() const = 0;

    /**
     * @brief List every node that has GPUs
     * @return Node snapshots, or snapshot_fetch_failed
     */
    virtual common::Result<std::vector<node_snapshot>> list_gpu_nodes() = 0;

    /**
     * @brief Look up one node
     * @return The node, std::nullopt when it does not exist, or an error
     */
    virtual common::Result<std::optional<node_snapshot>> get_node(const std::string& name) = 0;

    /**
     * @brief Active GPU pods scheduled on a node
     */
    virtual common::Result<std::vector<pod_allocation>> get_active_gpu_pods(
        const std::string& node_name) = 0;
};

}  // namespace gpudiag
