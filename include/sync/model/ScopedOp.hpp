#pragma once

#include <chrono>
#include <cstdint>

namespace ds::sync::model {

struct ScopedOp {
    uint64_t size_bytes{};
    std::chrono::steady_clock::time_point timestamp_begin{};
    std::chrono::steady_clock::time_point timestamp_end{};
    bool success{};

    void start();
    void start(uint64_t size_bytes);
    void stop();
    [[nodiscard]] uint64_t duration_ms() const;
};

}
