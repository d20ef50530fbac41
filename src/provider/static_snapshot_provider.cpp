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

#include <gpudiag/provider/static_snapshot_provider.h>

#include <algorithm>
#include <iterator>
#include <mutex>
#include <utility>

namespace gpudiag {

common::Result<std::vector<node_snapshot>> static_snapshot_provider::list_gpu_nodes() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<node_snapshot> gpu_nodes;
    std::copy_if(nodes_.begin(), nodes_.end(), std::back_inserter(gpu_nodes),
                 [](const node_snapshot& node) { return node.total_gpus > 0; });
    return make_success(std::move(gpu_nodes));
}

common::Result<std::optional<node_snapshot>> static_snapshot_provider::get_node(
    const std::string& name) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = std::find_if(nodes_.begin(), nodes_.end(),
                           [&name](const node_snapshot& node) { return node.name == name; });
    if (it == nodes_.end()) {
        return make_success(std::optional<node_snapshot>{});
    }
    return make_success(std::optional<node_snapshot>{*it});
}

common::Result<std::vector<pod_allocation>> static_snapshot_provider::get_active_gpu_pods(
    const std::string& node_name) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = pods_.find(node_name);
    if (it == pods_.end()) {
        return make_success(std::vector<pod_allocation>{});
    }
    return make_success(std::vector<pod_allocation>(it->second));
}

void static_snapshot_provider::set_nodes(std::vector<node_snapshot> nodes) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    nodes_ = std::move(nodes);
}

void static_snapshot_provider::upsert_node(const node_snapshot& node) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = std::find_if(nodes_.begin(), nodes_.end(),
                           [&node](const node_snapshot& n) { return n.name == node.name; });
    if (it != nodes_.end()) {
        *it = node;
    } else {
        nodes_.push_back(node);
    }
}

void static_snapshot_provider::set_pods(const std::string& node_name,
                                        std::vector<pod_allocation> pods) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    pods_[node_name] = std::move(pods);
}

void static_snapshot_provider::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    nodes_.clear();
    pods_.clear();
}

size_t static_snapshot_provider::node_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return nodes_.size();
}

}  // namespace gpudiag
