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

#include <gpudiag/config/diagnostics_config.h>

#include <cmath>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>

namespace gpudiag {

namespace {

constexpr double weight_tolerance = 1e-9;

/**
 * Reads keys into fields, remembering the first malformed value.
 */
class field_reader {
   public:
    explicit field_reader(const config_map& config) : config_(config) {}

    template <typename T>
    void read(const std::string& key, T& target) {
        if (error_ || !config_parser::has_key(config_, key)) {
            return;
        }
        auto parsed = config_parser::get_optional<T>(config_, key);
        if (!parsed) {
            error_.emplace(diagnostics_error_code::configuration_parse_error,
                           "Cannot parse value '" + config_.at(key) + "'", key);
            return;
        }
        target = *parsed;
    }

    void read_policy(const std::string& key, snapshot_policy& target) {
        if (error_ || !config_parser::has_key(config_, key)) {
            return;
        }
        std::string name;
        read(key, name);
        if (error_) {
            return;
        }
        auto policy = snapshot_policy_from_string(name);
        if (policy.is_err()) {
            error_ = error_info::from_common_error(policy.error());
            error_->context = key;
            return;
        }
        target = policy.value();
    }

    const std::optional<error_info>& error() const { return error_; }

   private:
    const config_map& config_;
    std::optional<error_info> error_;
};

// NaN fails every range check below
bool in_percent_range(double value) {
    return value >= 0.0 && value <= 100.0;
}

bool sums_to(double total, double expected) {
    return std::fabs(total - expected) <= weight_tolerance;
}

common::VoidResult out_of_range(const std::string& message, const std::string& field) {
    return make_void_error(diagnostics_error_code::threshold_out_of_range, message, field);
}

}  // namespace

std::string snapshot_policy_to_string(snapshot_policy policy) {
    switch (policy) {
        case snapshot_policy::propagate:
            return "propagate";
        case snapshot_policy::clamp:
            return "clamp";
        case snapshot_policy::reject:
            return "reject";
        default:
            return "unknown";
    }
}

common::Result<snapshot_policy> snapshot_policy_from_string(const std::string& name) {
    if (name == "propagate") {
        return make_success(snapshot_policy::propagate);
    }
    if (name == "clamp") {
        return make_success(snapshot_policy::clamp);
    }
    if (name == "reject") {
        return make_success(snapshot_policy::reject);
    }
    return make_error<snapshot_policy>(diagnostics_error_code::configuration_parse_error,
                                       "Unknown snapshot policy '" + name + "'");
}

diagnostics_config diagnostics_config::defaults() {
    return diagnostics_config{};
}

common::Result<diagnostics_config> diagnostics_config::from_config_map(const config_map& config) {
    diagnostics_config cfg = defaults();
    field_reader reader(config);

    reader.read("fragmentation.weight.unused_capacity", cfg.fragmentation.unused_capacity);
    reader.read("fragmentation.weight.idle_allocation", cfg.fragmentation.idle_allocation);
    reader.read("fragmentation.weight.partial_allocation", cfg.fragmentation.partial_allocation);

    reader.read("status.fragmented", cfg.status.fragmented);
    reader.read("status.critical", cfg.status.critical);

    reader.read("penalty.small_pod_gpus", cfg.penalty.small_pod_gpus);
    reader.read("penalty.large_node_gpus", cfg.penalty.large_node_gpus);
    reader.read("penalty.large_node_small_pod_limit", cfg.penalty.large_node_small_pod_limit);
    reader.read("penalty.large_node_penalty", cfg.penalty.large_node_penalty);
    reader.read("penalty.small_pod_limit", cfg.penalty.small_pod_limit);
    reader.read("penalty.small_pod_penalty", cfg.penalty.small_pod_penalty);

    reader.read("allocation.large_pod_gpus", cfg.large_pod_gpus);

    reader.read("advice.many_partial_pods", cfg.advice.many_partial_pods);
    reader.read("advice.consolidation_node_gpus", cfg.advice.consolidation_node_gpus);
    reader.read("advice.small_block_gpus", cfg.advice.small_block_gpus);
    reader.read("advice.low_utilization_percent", cfg.advice.low_utilization_percent);

    reader.read("load.weight.allocation", cfg.load.allocation);
    reader.read("load.weight.utilization", cfg.load.utilization);
    reader.read("load.hotspot_band", cfg.balance.hotspot_band);
    reader.read("load.stddev_limit", cfg.balance.stddev_limit);
    reader.read("load.low_allocation_percent", cfg.balance.low_allocation_percent);

    reader.read_policy("snapshot.policy", cfg.policy);

    if (reader.error()) {
        return common::Result<diagnostics_config>::err(reader.error()->to_common_error());
    }

    auto validation = cfg.validate();
    if (validation.is_err()) {
        return common::Result<diagnostics_config>::err(validation.error());
    }
    return make_success(std::move(cfg));
}

common::VoidResult diagnostics_config::validate() const {
    for (double value : {fragmentation.unused_capacity, fragmentation.idle_allocation,
                         fragmentation.partial_allocation, status.fragmented, status.critical,
                         penalty.large_node_penalty, penalty.small_pod_penalty,
                         advice.low_utilization_percent, load.allocation, load.utilization,
                         balance.hotspot_band, balance.stddev_limit,
                         balance.low_allocation_percent}) {
        if (!std::isfinite(value)) {
            return make_void_error(diagnostics_error_code::invalid_configuration,
                                   "Configuration values must be finite numbers");
        }
    }

    // Fragmentation weights
    if (!(fragmentation.unused_capacity >= 0.0) || !(fragmentation.idle_allocation >= 0.0) ||
        !(fragmentation.partial_allocation >= 0.0)) {
        return out_of_range("Fragmentation weights must be non-negative", "fragmentation.weight");
    }
    double fragmentation_total = fragmentation.unused_capacity + fragmentation.idle_allocation +
                                 fragmentation.partial_allocation;
    if (!sums_to(fragmentation_total, 100.0)) {
        return make_void_error(diagnostics_error_code::invalid_configuration,
                               "Fragmentation weights must sum to 100, got " +
                                   std::to_string(fragmentation_total),
                               "fragmentation.weight");
    }

    // Status bands
    if (!in_percent_range(status.fragmented) || !in_percent_range(status.critical)) {
        return out_of_range("Status thresholds must lie in [0, 100]", "status");
    }
    if (status.fragmented >= status.critical) {
        return make_void_error(diagnostics_error_code::invalid_configuration,
                               "status.fragmented must be below status.critical", "status");
    }

    // Partial allocation penalty
    if (penalty.small_pod_gpus < 1 || penalty.large_node_gpus < 0 ||
        penalty.large_node_small_pod_limit < 0 || penalty.small_pod_limit < 0) {
        return out_of_range("Penalty counts must be non-negative", "penalty");
    }
    if (!(penalty.large_node_penalty >= 0.0 && penalty.large_node_penalty <= 1.0) ||
        !(penalty.small_pod_penalty >= 0.0 && penalty.small_pod_penalty <= 1.0)) {
        return out_of_range("Penalty increments must lie in [0, 1]", "penalty");
    }

    if (large_pod_gpus < 1) {
        return out_of_range("allocation.large_pod_gpus must be at least 1",
                            "allocation.large_pod_gpus");
    }

    // Node advice
    if (advice.many_partial_pods < 0 || advice.consolidation_node_gpus < 0 ||
        advice.small_block_gpus < 1) {
        return out_of_range("Advice limits must be positive", "advice");
    }
    if (!in_percent_range(advice.low_utilization_percent)) {
        return out_of_range("advice.low_utilization_percent must lie in [0, 100]",
                            "advice.low_utilization_percent");
    }

    // Load score
    if (!(load.allocation >= 0.0) || !(load.utilization >= 0.0)) {
        return out_of_range("Load weights must be non-negative", "load.weight");
    }
    if (!sums_to(load.allocation + load.utilization, 1.0)) {
        return make_void_error(diagnostics_error_code::invalid_configuration,
                               "Load weights must sum to 1", "load.weight");
    }
    if (!(balance.hotspot_band > 0.0)) {
        return out_of_range("load.hotspot_band must be positive", "load.hotspot_band");
    }
    if (!(balance.stddev_limit >= 0.0)) {
        return out_of_range("load.stddev_limit must be non-negative", "load.stddev_limit");
    }
    if (!in_percent_range(balance.low_allocation_percent)) {
        return out_of_range("load.low_allocation_percent must lie in [0, 100]",
                            "load.low_allocation_percent");
    }

    return common::ok();
}

}  // namespace gpudiag
