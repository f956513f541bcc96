#pragma once

#include "sync/model/Throughput.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ds::sync::model {

// One sync run over one (source, destination) pair.
struct Event {
    enum class Status : uint8_t {
        PENDING,
        RUNNING,
        SUCCESS,
        ERROR,
        CANCELLED
    };

    std::string source, destination;

    std::chrono::steady_clock::time_point timestamp_begin{};
    std::chrono::steady_clock::time_point timestamp_end{};

    Status status{Status::PENDING};
    std::string error_message;

    std::vector<std::unique_ptr<Throughput>> throughputs;

    // Summary counters, derived from throughputs via computeStats()
    uint64_t num_ops_total{0};
    uint64_t num_failed_ops{0};
    uint64_t num_unresolved{0};
    uint64_t bytes_transferred{0};

    void start();
    void stop();

    [[nodiscard]] uint64_t durationMs() const noexcept;

    // Find the bucket for a metric, creating it on first use
    Throughput& throughput(Throughput::Metric metric);
    [[nodiscard]] const Throughput* getThroughput(Throughput::Metric metric) const noexcept;

    void computeStats();

    // "12.3 KiB/s (12629 bytes in 1.000 s)"
    [[nodiscard]] std::string rateString() const;

    [[nodiscard]] std::string statusToString() const;
};

}
