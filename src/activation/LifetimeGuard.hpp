#pragma once

#include <atomic>
#include <chrono>

namespace ur::activation
{

// Idle watchdog for a primary instance. It never runs a timer thread: the
// activation wait treats deadline() as its timeout, and the first accepted
// activation cancels the guard under the same lock that decides expiry.
class LifetimeGuard
{
  public:
    using Clock = std::chrono::steady_clock;

    static LifetimeGuard arm(Clock::time_point deadline) noexcept
    {
        return LifetimeGuard(deadline);
    }

    LifetimeGuard(LifetimeGuard const &) = delete;
    LifetimeGuard &operator=(LifetimeGuard const &) = delete;
    LifetimeGuard(LifetimeGuard &&other) noexcept
        : deadline_(other.deadline_),
          cancelled_(other.cancelled_.load(std::memory_order_acquire))
    {
    }

    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    bool cancelled() const noexcept
    {
        return cancelled_.load(std::memory_order_acquire);
    }

    bool expired(Clock::time_point now = Clock::now()) const noexcept
    {
        return !cancelled() && now >= deadline_;
    }

    Clock::time_point deadline() const noexcept { return deadline_; }

  private:
    explicit LifetimeGuard(Clock::time_point deadline) noexcept
        : deadline_(deadline)
    {
    }

    Clock::time_point deadline_;
    std::atomic_bool cancelled_{false};
};

} // namespace ur::activation
