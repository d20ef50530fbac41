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

/**
 * @file cluster_diagnostics_example.cpp
 * @brief Diagnosing a small GPU cluster through diagnostics_service
 *
 * Demonstrates:
 * - Loading thresholds from a key/value configuration
 * - Feeding a static_snapshot_provider
 * - Injecting a common_system ILogger
 * - Handling Result<T> errors from the service
 */

#include <gpudiag/provider/static_snapshot_provider.h>
#include <gpudiag/service/diagnostics_service.h>

#include <kcenon/common/interfaces/logger_interface.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace gpudiag;
using namespace kcenon::common::interfaces;

/**
 * @brief Console logger for the example
 */
class console_logger : public ILogger {
private:
    log_level min_level_ = log_level::info;

public:
    explicit console_logger(log_level min = log_level::info) : min_level_(min) {}

    common::VoidResult log(log_level level, const std::string& message) override {
        if (!is_enabled(level)) {
            return common::ok();
        }

        auto time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm_buf;
#ifdef _WIN32
        localtime_s(&tm_buf, &time);
#else
        localtime_r(&time, &tm_buf);
#endif

        std::cout << "[" << std::put_time(&tm_buf, "%H:%M:%S") << "] [" << to_string(level)
                  << "] " << message << std::endl;
        return common::ok();
    }

    common::VoidResult log(log_level level, const std::string& message, const std::string& file,
                           int line, const std::string& function) override {
        return log(level, message + " [" + file + ":" + std::to_string(line) + " " + function + "]");
    }

    common::VoidResult log(const log_entry& entry) override {
        return log(entry.level, entry.message, entry.file, entry.line, entry.function);
    }

    bool is_enabled(log_level level) const override {
        return static_cast<int>(level) >= static_cast<int>(min_level_);
    }

    common::VoidResult set_level(log_level level) override {
        min_level_ = level;
        return common::ok();
    }

    log_level get_level() const override { return min_level_; }

    common::VoidResult flush() override {
        std::cout << std::flush;
        return common::ok();
    }
};

namespace {

node_snapshot node(const std::string& name, int32_t total, int32_t allocated, double util) {
    node_snapshot snapshot;
    snapshot.name = name;
    snapshot.total_gpus = total;
    snapshot.allocated_gpus = allocated;
    snapshot.utilization_percent = util;
    return snapshot;
}

void print_list(const std::string& title, const std::vector<std::string>& items) {
    std::cout << "  " << title << ":" << std::endl;
    for (const auto& item : items) {
        std::cout << "    - " << item << std::endl;
    }
}

std::shared_ptr<static_snapshot_provider> make_demo_cluster() {
    auto provider = std::make_shared<static_snapshot_provider>();
    provider->set_nodes({node("a100-01", 8, 8, 92.0), node("a100-02", 8, 5, 18.0),
                         node("a100-03", 8, 0, 0.0), node("t4-01", 4, 4, 71.0),
                         node("cpu-01", 0, 0, 0.0)});

    provider->set_pods("a100-01", {{"llm-pretrain", "research", 8}});
    provider->set_pods("a100-02", {{"nb-alice", "dev", 1},
                                   {"nb-bob", "dev", 1},
                                   {"nb-carol", "dev", 1},
                                   {"finetune", "research", 2}});
    provider->set_pods("t4-01", {{"inference", "prod", 4}});
    return provider;
}

void example_1_cluster_fragmentation(diagnostics_service& service) {
    std::cout << "\n=== Example 1: Cluster Fragmentation ===" << std::endl;

    auto result = service.analyze_cluster_fragmentation();
    if (result.is_err()) {
        std::cout << "✗ Error: " << result.error().message << std::endl;
        return;
    }

    const auto& summary = result.value();
    std::cout << std::fixed << std::setprecision(1);
    std::cout << "  Cluster score: " << summary.cluster_score << " over " << summary.total_nodes
              << " nodes" << std::endl;
    for (const auto& frag : summary.nodes) {
        std::cout << "    " << frag.node_name << ": " << frag.fragmentation_score << " ("
                  << fragmentation_status_to_string(frag.status) << ")" << std::endl;
    }
    std::cout << "  Wasted GPUs: " << summary.summary.total_wasted_gpus << " ("
              << summary.summary.waste_percentage << "%)" << std::endl;
    print_list("Recommendations", summary.recommendations);
}

void example_2_node_detail(diagnostics_service& service) {
    std::cout << "\n=== Example 2: Node Detail ===" << std::endl;

    auto result = service.analyze_node_fragmentation("a100-02");
    if (result.is_err()) {
        std::cout << "✗ Error: " << result.error().message << std::endl;
        return;
    }

    const auto& detail = result.value();
    std::cout << "  " << detail.fragmentation.node_name << ": "
              << detail.pattern.fully_allocated_pods << " full / "
              << detail.pattern.partially_allocated_pods << " partial pods, "
              << detail.pattern.largest_contiguous_gpu << " GPUs free" << std::endl;
    print_list("Recommendations", detail.recommendations);
}

void example_3_load_balance(diagnostics_service& service) {
    std::cout << "\n=== Example 3: Load Balance ===" << std::endl;

    auto result = service.analyze_load_balance();
    if (result.is_err()) {
        std::cout << "✗ Error: " << result.error().message << std::endl;
        return;
    }

    const auto& summary = result.value();
    std::cout << "  Balance score: " << summary.cluster_load_balance_score << std::endl;
    std::cout << "  Allocation: avg " << summary.stats.avg_allocation_rate << "%, stddev "
              << summary.stats.stddev_allocation << std::endl;
    print_list("Hotspots", summary.hotspot_nodes);
    print_list("Idle", summary.idle_nodes);
    print_list("Recommendations", summary.recommendations);
}

void example_4_error_handling(diagnostics_service& service) {
    std::cout << "\n=== Example 4: Error Handling ===" << std::endl;

    auto result = service.analyze_node_fragmentation("h100-99");
    if (result.is_err()) {
        auto err = error_info::from_common_error(result.error());
        std::cout << "✓ Expected error: " << err.to_string() << std::endl;
    }
}

}  // namespace

int main() {
    std::cout << "========================================================" << std::endl;
    std::cout << "GPU Diagnostics - Cluster Example" << std::endl;
    std::cout << "========================================================" << std::endl;

    auto config = diagnostics_config::from_config_map({{"advice.low_utilization_percent", "25"},
                                                        {"snapshot.policy", "clamp"}});
    if (config.is_err()) {
        std::cerr << "Invalid configuration: " << config.error().message << std::endl;
        return 1;
    }

    auto logger = std::make_shared<console_logger>(log_level::info);
    diagnostics_service service(make_demo_cluster(), config.value(), logger);

    example_1_cluster_fragmentation(service);
    example_2_node_detail(service);
    example_3_load_balance(service);
    example_4_error_handling(service);

    if (service.log_failures() > 0) {
        std::cerr << service.log_failures() << " log writes failed" << std::endl;
    }
    return 0;
}
