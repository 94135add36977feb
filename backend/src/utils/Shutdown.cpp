#include "utils/Shutdown.hpp"

#include <atomic>

namespace kc::runtime {

namespace {
std::atomic_bool g_shutdown_requested{false};
std::atomic_int g_shutdown_signal{0};
static_assert(std::atomic_bool::is_always_lock_free);
static_assert(std::atomic_int::is_always_lock_free);
} // namespace

void request_shutdown(int signal_number) noexcept {
  g_shutdown_signal.store(signal_number, std::memory_order_relaxed);
  g_shutdown_requested.store(true, std::memory_order_release);
}

bool should_shutdown() noexcept {
  return g_shutdown_requested.load(std::memory_order_acquire);
}

int shutdown_signal() noexcept {
  return g_shutdown_signal.load(std::memory_order_relaxed);
}

} // namespace kc::runtime
