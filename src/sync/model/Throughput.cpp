#include "sync/model/Throughput.hpp"

using namespace ds::sync::model;

void Throughput::computeStats() {
    num_ops = scoped_ops.size();
    failed_ops = 0;
    size_bytes = 0;
    duration_ms = 0;
    for (const auto& op : scoped_ops) {
        if (!op.success) ++failed_ops;
        else {
            size_bytes += op.size_bytes;
            duration_ms += op.duration_ms();
        }
    }
}

ScopedOp& Throughput::newOp() {
    scoped_ops.emplace_back();
    return scoped_ops.back();
}

std::string Throughput::metricToString() const {
    switch (metric_type) {
        case COPY: return "copy";
        case MKDIR: return "mkdir";
        case DELETE: return "delete";
        case CLEAR: return "clear";
        case TOUCH: return "touch";
        default: return "unknown";
    }
}
