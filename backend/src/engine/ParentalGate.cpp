#include "engine/ParentalGate.hpp"
#include "engine/PersistenceManager.hpp"

#include "utils/Clock.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <charconv>
#include <system_error>
#include <string_view>

namespace kc::engine
{

namespace
{

std::int64_t parse_or_zero(std::optional<std::string> const &text)
{
    if (!text)
    {
        return 0;
    }
    std::int64_t value = 0;
    auto const *end = text->data() + text->size();
    auto [ptr, ec] = std::from_chars(text->data(), end, value);
    return ec == std::errc{} && ptr == end ? value : 0;
}

} // namespace

ParentalGate::ParentalGate(std::shared_ptr<PinVerifier> verifier,
                           PersistenceManager *persistence,
                           std::shared_ptr<utils::Clock> clock,
                           int max_attempts, int lockout_minutes)
    : verifier_(std::move(verifier)), persistence_(persistence),
      clock_(std::move(clock)), max_attempts_(std::max(1, max_attempts)),
      lockout_ms_(static_cast<std::int64_t>(std::max(0, lockout_minutes)) *
                  60'000)
{
}

void ParentalGate::load()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!persistence_)
    {
        return;
    }
    failed_attempts_ = static_cast<int>(std::clamp<std::int64_t>(
        parse_or_zero(persistence_->get_setting(setting_keys::kPinFailedAttempts)),
        0, max_attempts_));
    lockout_until_ms_ =
        parse_or_zero(persistence_->get_setting(setting_keys::kPinLockoutUntil));
    if (lockout_until_ms_ > 0)
    {
        KC_LOG_INFO("gate: PIN lockout restored");
    }
}

bool ParentalGate::locked_locked(std::int64_t now_ms)
{
    if (lockout_until_ms_ == 0)
    {
        return false;
    }
    if (now_ms < lockout_until_ms_)
    {
        return true;
    }
    lockout_until_ms_ = 0;
    failed_attempts_ = 0;
    persist_locked();
    return false;
}

bool ParentalGate::is_locked()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return locked_locked(utils::to_unix_millis(clock_->now()));
}

void ParentalGate::record_failure()
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto const now = utils::to_unix_millis(clock_->now());
    if (locked_locked(now))
    {
        return;
    }
    ++failed_attempts_;
    if (failed_attempts_ >= max_attempts_)
    {
        lockout_until_ms_ = now + lockout_ms_;
        KC_LOG_WARN("gate: {} wrong PIN attempts, locked for {} s",
                    failed_attempts_, lockout_ms_ / 1000);
    }
    persist_locked();
}

void ParentalGate::record_success()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (failed_attempts_ == 0 && lockout_until_ms_ == 0)
    {
        return;
    }
    failed_attempts_ = 0;
    lockout_until_ms_ = 0;
    persist_locked();
}

GateDecision ParentalGate::authorize(std::string const &pin)
{
    if (is_locked())
    {
        return GateDecision::LockedOut;
    }
    if (!verifier_)
    {
        KC_LOG_WARN("gate: no PIN verifier configured, denying");
        return GateDecision::WrongPin;
    }
    if (verifier_->verify_pin(pin))
    {
        record_success();
        return GateDecision::Granted;
    }
    record_failure();
    return is_locked() ? GateDecision::LockedOut : GateDecision::WrongPin;
}

int ParentalGate::failed_attempts() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_attempts_;
}

void ParentalGate::persist_locked()
{
    if (!persistence_)
    {
        return;
    }
    persistence_->set_setting(setting_keys::kPinFailedAttempts,
                              std::to_string(failed_attempts_));
    persistence_->set_setting(setting_keys::kPinLockoutUntil,
                              std::to_string(lockout_until_ms_));
}

} // namespace kc::engine
