#include "sync/model/Event.hpp"

#include <fmt/format.h>

using namespace ds::sync::model;
using namespace std::chrono;

void Event::start() {
    timestamp_begin = steady_clock::now();
    status = Status::RUNNING;
}

void Event::stop() {
    timestamp_end = steady_clock::now();
    computeStats();
}

uint64_t Event::durationMs() const noexcept {
    const auto end = timestamp_end != steady_clock::time_point{} ? timestamp_end : steady_clock::now();
    if (end < timestamp_begin) return 0;
    return duration_cast<milliseconds>(end - timestamp_begin).count();
}

Throughput& Event::throughput(const Throughput::Metric metric) {
    for (const auto& t : throughputs)
        if (t->metric_type == metric) return *t;
    throughputs.push_back(std::make_unique<Throughput>(metric));
    return *throughputs.back();
}

const Throughput* Event::getThroughput(const Throughput::Metric metric) const noexcept {
    for (const auto& t : throughputs)
        if (t->metric_type == metric) return t.get();
    return nullptr;
}

void Event::computeStats() {
    num_ops_total = 0;
    num_failed_ops = 0;
    bytes_transferred = 0;
    for (const auto& t : throughputs) {
        t->computeStats();
        num_ops_total += t->num_ops;
        num_failed_ops += t->failed_ops;
        if (t->metric_type == Throughput::COPY) bytes_transferred += t->size_bytes;
    }
}

std::string Event::rateString() const {
    const auto ms = durationMs();
    const double seconds = static_cast<double>(ms) / 1000.0;
    const double kibps = ms ? static_cast<double>(bytes_transferred) / 1024.0 / seconds : 0.0;
    return fmt::format("{:.1f} KiB/s ({} bytes in {:.3f} s)", kibps, bytes_transferred, seconds);
}

std::string Event::statusToString() const {
    switch (status) {
        case Status::PENDING: return "pending";
        case Status::RUNNING: return "running";
        case Status::SUCCESS: return "success";
        case Status::ERROR: return "error";
        case Status::CANCELLED: return "cancelled";
        default: return "unknown";
    }
}
