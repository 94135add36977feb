#pragma once

#include "engine/Core.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace kc::utils
{
class Clock;
}

namespace kc::engine
{

class PersistenceManager;

// Hash-and-verify primitive owned by the platform's secure storage.
class PinVerifier
{
  public:
    virtual ~PinVerifier() = default;
    virtual bool verify_pin(std::string const &candidate) = 0;
};

// Attempt counter and lockout window in front of PIN checks. Both survive
// restarts through the settings table.
class ParentalGate
{
  public:
    ParentalGate(std::shared_ptr<PinVerifier> verifier,
                 PersistenceManager *persistence,
                 std::shared_ptr<utils::Clock> clock, int max_attempts,
                 int lockout_minutes);

    void load();

    bool is_locked();
    void record_failure();
    void record_success();
    GateDecision authorize(std::string const &pin);

    int failed_attempts() const;

  private:
    bool locked_locked(std::int64_t now_ms);
    void persist_locked();

    std::shared_ptr<PinVerifier> verifier_;
    PersistenceManager *persistence_;
    std::shared_ptr<utils::Clock> clock_;
    int max_attempts_;
    std::int64_t lockout_ms_;

    mutable std::mutex mutex_;
    int failed_attempts_ = 0;
    std::int64_t lockout_until_ms_ = 0;
};

} // namespace kc::engine
