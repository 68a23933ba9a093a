#pragma once

namespace jobforge {

/// SIGINT/SIGTERM request shutdown; SIGPIPE is ignored.
void setup_signal_handlers();
/// Blocks until a shutdown signal arrived or request_shutdown() was called.
void wait_for_shutdown();
void request_shutdown() noexcept;

} // namespace jobforge
