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

#include <gpudiag/analysis/snapshot_validator.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace gpudiag {

common::VoidResult snapshot_validator::validate_node(const node_snapshot& node) {
    if (node.total_gpus < 0) {
        return make_void_node_error(
            diagnostics_error_code::invalid_snapshot, node.name,
            "total_gpus is negative (" + std::to_string(node.total_gpus) + ")");
    }
    if (node.allocated_gpus < 0 || node.allocated_gpus > node.total_gpus) {
        return make_void_node_error(diagnostics_error_code::invalid_snapshot, node.name,
                                    "allocated_gpus " + std::to_string(node.allocated_gpus) +
                                        " outside [0, " + std::to_string(node.total_gpus) + "]");
    }
    if (std::isnan(node.utilization_percent) || node.utilization_percent < 0.0 ||
        node.utilization_percent > 100.0) {
        return make_void_node_error(
            diagnostics_error_code::invalid_snapshot, node.name,
            "utilization_percent " + std::to_string(node.utilization_percent) +
                " outside [0, 100]");
    }
    return common::ok();
}

common::VoidResult snapshot_validator::validate_pod(const pod_allocation& pod,
                                                    const std::string& node_name) {
    if (pod.allocated_gpus < 0) {
        return make_void_node_error(diagnostics_error_code::invalid_snapshot, node_name,
                                    "pod " + pod.pod_namespace + "/" + pod.pod_name +
                                        " has negative allocated_gpus");
    }
    return common::ok();
}

node_snapshot snapshot_validator::clamp_node(node_snapshot node) {
    node.total_gpus = std::max(node.total_gpus, int32_t{0});
    node.allocated_gpus = std::clamp(node.allocated_gpus, int32_t{0}, node.total_gpus);
    if (std::isnan(node.utilization_percent)) {
        node.utilization_percent = 0.0;
    }
    node.utilization_percent = std::clamp(node.utilization_percent, 0.0, 100.0);
    return node;
}

common::Result<std::vector<node_snapshot>> snapshot_validator::apply_policy(
    std::vector<node_snapshot> nodes, snapshot_policy policy) {
    switch (policy) {
        case snapshot_policy::propagate:
            break;
        case snapshot_policy::clamp:
            for (auto& node : nodes) {
                node = clamp_node(std::move(node));
            }
            break;
        case snapshot_policy::reject:
            for (const auto& node : nodes) {
                auto check = validate_node(node);
                if (check.is_err()) {
                    return common::Result<std::vector<node_snapshot>>::err(check.error());
                }
            }
            break;
    }
    return make_success(std::move(nodes));
}

common::Result<std::vector<pod_allocation>> snapshot_validator::apply_policy(
    std::vector<pod_allocation> pods, const std::string& node_name, snapshot_policy policy) {
    switch (policy) {
        case snapshot_policy::propagate:
            break;
        case snapshot_policy::clamp:
            for (auto& pod : pods) {
                pod.allocated_gpus = std::max(pod.allocated_gpus, int32_t{0});
            }
            break;
        case snapshot_policy::reject:
            for (const auto& pod : pods) {
                auto check = validate_pod(pod, node_name);
                if (check.is_err()) {
                    return common::Result<std::vector<pod_allocation>>::err(check.error());
                }
            }
            break;
    }
    return make_success(std::move(pods));
}

}  // namespace gpudiag
