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
 * @file diagnostics_service.h
 * @brief Snapshot acquisition, input policy and logging around the engine
 *
 * The service turns "analyze the cluster" requests into engine calls:
 * it fetches snapshots from the injected provider, applies the configured
 * snapshot_policy and reports missing data as errors instead of sentinel
 * scores. Transport layers (HTTP, MCP) serialize its results verbatim.
 *
 * Logging goes through common_system's ILogger; any implementation can be
 * injected and a null logger disables logging.
 */

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include <kcenon/common/interfaces/logger_interface.h>

#include "../analysis/diagnostics_engine.h"
#include "../core/result_types.h"
#include "../provider/snapshot_provider.h"

namespace gpudiag {

class diagnostics_service {
   public:
    /**
     * @brief Constructor with dependency injection
     * @param provider Snapshot source for one cluster
     * @param config Engine configuration (validated by the caller)
     * @param logger Optional logger instance (any ILogger implementation)
     */
    explicit diagnostics_service(
        std::shared_ptr<snapshot_provider> provider,
        diagnostics_config config = diagnostics_config::defaults(),
        std::shared_ptr<common::interfaces::ILogger> logger = nullptr);

    /**
     * @brief Fragmentation of every GPU node in the cluster
     *
     * A failed pod lookup for a single node is logged and that node is
     * scored without pods.
     *
     * @return Summary, or provider_not_available / snapshot_fetch_failed /
     *         no_gpu_nodes / invalid_snapshot
     */
    common::Result<cluster_fragmentation_summary> analyze_cluster_fragmentation();

    /**
     * @brief Fragmentation detail of one node
     * @return Detail, or invalid_argument / node_not_found / snapshot_fetch_failed /
     *         invalid_snapshot
     */
    common::Result<node_fragmentation_detail> analyze_node_fragmentation(
        const std::string& node_name);

    /**
     * @brief Load balance of every GPU node in the cluster
     */
    common::Result<load_balance_summary> analyze_load_balance();

    /**
     * @brief Set or replace the logger instance
     *
     * Not synchronized with analyses running on other threads.
     */
    void set_logger(std::shared_ptr<common::interfaces::ILogger> logger);

    std::shared_ptr<common::interfaces::ILogger> get_logger() const { return logger_; }

    const diagnostics_engine& engine() const { return engine_; }

    /**
     * @brief Number of log calls the logger reported as failed
     */
    uint64_t log_failures() const { return log_failures_.load(); }

   private:
    common::Result<std::vector<node_snapshot>> fetch_nodes(const std::string& operation);

    template <typename T>
    common::Result<T> fail(const common::error_info& err, const std::string& operation);

    void log(common::interfaces::log_level level, const std::string& message);

    std::shared_ptr<snapshot_provider> provider_;
    diagnostics_engine engine_;
    std::shared_ptr<common::interfaces::ILogger> logger_;
    std::atomic<uint64_t> log_failures_{0};
};

}  // namespace gpudiag
