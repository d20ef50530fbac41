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

#include <gpudiag/service/diagnostics_service.h>

#include <iomanip>
#include <sstream>
#include <utility>

#include <gpudiag/analysis/snapshot_validator.h>

namespace gpudiag {

namespace {

using common::interfaces::log_level;

std::string format_score(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

}  // namespace

diagnostics_service::diagnostics_service(std::shared_ptr<snapshot_provider> provider,
                                         diagnostics_config config,
                                         std::shared_ptr<common::interfaces::ILogger> logger)
    : provider_(std::move(provider))
    , engine_(std::move(config))
    , logger_(std::move(logger)) {}

void diagnostics_service::set_logger(std::shared_ptr<common::interfaces::ILogger> logger) {
    logger_ = std::move(logger);
}

void diagnostics_service::log(log_level level, const std::string& message) {
    if (!logger_) {
        return;
    }
    auto result = logger_->log(level, "[gpu_diagnostics] " + message);
    if (result.is_err()) {
        log_failures_++;
    }
}

template <typename T>
common::Result<T> diagnostics_service::fail(const common::error_info& err,
                                            const std::string& operation) {
    log(log_level::error,
        operation + " failed: " + error_info::from_common_error(err).to_string());
    return common::Result<T>::err(err);
}

common::Result<std::vector<node_snapshot>> diagnostics_service::fetch_nodes(
    const std::string& operation) {
    if (!provider_) {
        return fail<std::vector<node_snapshot>>(
            error_info(diagnostics_error_code::provider_not_available).to_common_error(),
            operation);
    }

    auto listed = provider_->list_gpu_nodes();
    if (listed.is_err()) {
        return fail<std::vector<node_snapshot>>(
            error_info(diagnostics_error_code::snapshot_fetch_failed, listed.error().message,
                       provider_->get_provider_name())
                .to_common_error(),
            operation);
    }

    if (listed.value().empty()) {
        log(log_level::warning, operation + ": no GPU nodes reported by provider '" +
                                    provider_->get_provider_name() + "'");
        return make_error<std::vector<node_snapshot>>(diagnostics_error_code::no_gpu_nodes);
    }

    auto checked = snapshot_validator::apply_policy(std::move(listed.value()),
                                                    engine_.config().policy);
    if (checked.is_err()) {
        return fail<std::vector<node_snapshot>>(checked.error(), operation);
    }
    return checked;
}

common::Result<cluster_fragmentation_summary>
diagnostics_service::analyze_cluster_fragmentation() {
    const std::string operation = "cluster fragmentation analysis";
    log(log_level::debug, "Starting " + operation);

    auto nodes = fetch_nodes(operation);
    if (nodes.is_err()) {
        return common::Result<cluster_fragmentation_summary>::err(nodes.error());
    }

    pod_map pods_by_node;
    for (const auto& node : nodes.value()) {
        auto pods = provider_->get_active_gpu_pods(node.name);
        if (pods.is_err()) {
            log(log_level::warning, "Pod lookup failed for node " + node.name +
                                        ", scoring without pods: " + pods.error().message);
            continue;
        }

        auto checked = snapshot_validator::apply_policy(std::move(pods.value()), node.name,
                                                        engine_.config().policy);
        if (checked.is_err()) {
            return fail<cluster_fragmentation_summary>(checked.error(), operation);
        }
        pods_by_node.emplace(node.name, std::move(checked.value()));
    }

    auto summary = engine_.analyze_cluster_fragmentation(nodes.value(), pods_by_node);
    log(log_level::info, "Cluster fragmentation score " + format_score(summary.cluster_score) +
                             " over " + std::to_string(summary.total_nodes) + " nodes (" +
                             std::to_string(summary.summary.critical_nodes) + " critical)");
    return make_success(std::move(summary));
}

common::Result<node_fragmentation_detail> diagnostics_service::analyze_node_fragmentation(
    const std::string& node_name) {
    const std::string operation = "node fragmentation analysis";

    if (node_name.empty()) {
        return make_error<node_fragmentation_detail>(diagnostics_error_code::invalid_argument,
                                                     "node_name is required");
    }
    if (!provider_) {
        return fail<node_fragmentation_detail>(
            error_info(diagnostics_error_code::provider_not_available).to_common_error(),
            operation);
    }

    log(log_level::debug, "Starting " + operation + " for " + node_name);

    auto found = provider_->get_node(node_name);
    if (found.is_err()) {
        return fail<node_fragmentation_detail>(
            error_info::for_node(diagnostics_error_code::snapshot_fetch_failed, node_name,
                                 found.error().message)
                .to_common_error(),
            operation);
    }
    if (!found.value().has_value()) {
        return make_node_error<node_fragmentation_detail>(diagnostics_error_code::node_not_found,
                                                          node_name, "Node not found");
    }

    auto nodes = snapshot_validator::apply_policy({*found.value()}, engine_.config().policy);
    if (nodes.is_err()) {
        return fail<node_fragmentation_detail>(nodes.error(), operation);
    }

    auto pods = provider_->get_active_gpu_pods(node_name);
    if (pods.is_err()) {
        return fail<node_fragmentation_detail>(
            error_info::for_node(diagnostics_error_code::snapshot_fetch_failed, node_name,
                                 pods.error().message)
                .to_common_error(),
            operation);
    }

    auto checked = snapshot_validator::apply_policy(std::move(pods.value()), node_name,
                                                    engine_.config().policy);
    if (checked.is_err()) {
        return fail<node_fragmentation_detail>(checked.error(), operation);
    }

    auto detail = engine_.analyze_node_fragmentation(nodes.value().front(), checked.value());
    log(log_level::info, "Node " + node_name + " fragmentation score " +
                             format_score(detail.fragmentation.fragmentation_score) + " (" +
                             fragmentation_status_to_string(detail.fragmentation.status) + ")");
    return make_success(std::move(detail));
}

common::Result<load_balance_summary> diagnostics_service::analyze_load_balance() {
    const std::string operation = "load balance analysis";
    log(log_level::debug, "Starting " + operation);

    auto nodes = fetch_nodes(operation);
    if (nodes.is_err()) {
        return common::Result<load_balance_summary>::err(nodes.error());
    }

    auto summary = engine_.analyze_load_balance(nodes.value());
    log(log_level::info, "Load balance score " +
                             format_score(summary.cluster_load_balance_score) + ", " +
                             std::to_string(summary.hotspot_nodes.size()) + " hotspot / " +
                             std::to_string(summary.idle_nodes.size()) + " idle nodes");
    return make_success(std::move(summary));
}

}  // namespace gpudiag
