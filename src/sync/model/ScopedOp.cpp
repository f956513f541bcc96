#include "sync/model/ScopedOp.hpp"

using namespace ds::sync::model;
using namespace std::chrono;

void ScopedOp::start() { timestamp_begin = steady_clock::now(); }
void ScopedOp::stop() { timestamp_end = steady_clock::now(); }

void ScopedOp::start(const uint64_t size_bytes) {
    this->size_bytes = size_bytes;
    start();
}

uint64_t ScopedOp::duration_ms() const {
    if (timestamp_end < timestamp_begin) return 0;
    return duration_cast<milliseconds>(timestamp_end - timestamp_begin).count();
}
