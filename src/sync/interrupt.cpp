#include "sync/interrupt.hpp"
#include "sync/errors.hpp"

#include <atomic>
#include <csignal>

namespace ds::sync::interrupt {

namespace {

std::atomic<bool> flag{false};

void onSignal(int) { flag.store(true); }

}

void install() {
    struct sigaction sa{};
    sa.sa_handler = onSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;  // no SA_RESTART, blocking reads see EINTR
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

void request() { flag.store(true); }

void reset() { flag.store(false); }

bool requested() { return flag.load(); }

void check() {
    if (requested()) throw Interrupted();
}

}
