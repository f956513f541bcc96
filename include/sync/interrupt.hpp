#pragma once

namespace ds::sync::interrupt {

// Process-wide flag set from SIGINT/SIGTERM and polled between operations.
void install();
void request();
void reset();
[[nodiscard]] bool requested();

// Throws sync::Interrupted once a stop was requested.
void check();

}
