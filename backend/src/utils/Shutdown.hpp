#pragma once

namespace kc::runtime
{

// Safe to call from a signal handler.
void request_shutdown(int signal_number = 0) noexcept;
bool should_shutdown() noexcept;
// Signal that triggered the shutdown, 0 when requested programmatically.
int shutdown_signal() noexcept;

} // namespace kc::runtime
