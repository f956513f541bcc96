#pragma once

#include "sync/model/ScopedOp.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace ds::sync::model {

struct Throughput {
    enum Metric {
        COPY,
        MKDIR,
        DELETE,
        CLEAR,
        TOUCH
    };

    Metric metric_type{COPY};

    uint64_t num_ops{};
    uint64_t failed_ops{};
    uint64_t size_bytes{};
    uint64_t duration_ms{};

    std::vector<ScopedOp> scoped_ops;

    Throughput() = default;
    explicit Throughput(Metric metric) : metric_type(metric) {}

    void computeStats();

    ScopedOp& newOp();

    [[nodiscard]] std::string metricToString() const;
};

}
