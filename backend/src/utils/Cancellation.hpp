#pragma once

#include <atomic>
#include <memory>

namespace kc::utils
{

// Read side of a cancellation flag. A default-constructed token is never
// cancelled.
class CancellationToken
{
  public:
    CancellationToken() = default;

    bool is_cancelled() const noexcept
    {
        return flag_ && flag_->load(std::memory_order_acquire);
    }

  private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<std::atomic_bool const> flag)
        : flag_(std::move(flag))
    {
    }

    std::shared_ptr<std::atomic_bool const> flag_;
};

class CancellationSource
{
  public:
    CancellationSource() : flag_(std::make_shared<std::atomic_bool>(false))
    {
    }

    CancellationToken token() const
    {
        return CancellationToken(flag_);
    }

    void cancel() noexcept
    {
        flag_->store(true, std::memory_order_release);
    }

    bool is_cancelled() const noexcept
    {
        return flag_->load(std::memory_order_acquire);
    }

  private:
    std::shared_ptr<std::atomic_bool> flag_;
};

} // namespace kc::utils
