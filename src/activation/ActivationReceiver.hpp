#pragma once

#include "activation/ActivationEvent.hpp"
#include "activation/LifetimeGuard.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ur::activation
{

// Join point for every activation source. The first offer wins and cancels
// the guard; once an event is held or the guard has expired every further
// offer is refused.
class ActivationLatch
{
  public:
    using Clock = LifetimeGuard::Clock;

    enum class WaitStatus
    {
        Activated,
        Expired,
        Pending,
    };

    explicit ActivationLatch(LifetimeGuard &guard);

    ActivationLatch(ActivationLatch const &) = delete;
    ActivationLatch &operator=(ActivationLatch const &) = delete;

    // Thread-safe. Returns true when this event is the one to dispatch.
    bool offer(ActivationEvent event);

    // Blocks until an event is held, the guard expires, or `until` passes.
    WaitStatus wait_until(Clock::time_point until);

    // Only meaningful after wait_until() returned Activated.
    std::optional<ActivationEvent> event() const;

  private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    LifetimeGuard &guard_;
    std::optional<ActivationEvent> event_;
    bool expired_ = false;
};

class IActivationSource
{
  public:
    virtual ~IActivationSource() noexcept = default;

    virtual char const *name() const noexcept = 0;

    // Begins delivering into latch. May offer synchronously.
    virtual void start(ActivationLatch &latch) = 0;

    // Stops delivery; after return the source never touches the latch again.
    virtual void stop() noexcept = 0;

    // Sources bound to the waiting thread's run loop are pumped from
    // ActivationReceiver::wait() in short slices.
    virtual bool needs_pump() const noexcept { return false; }
    virtual void pump(std::chrono::milliseconds /*slice*/) {}
};

// URI carried by the process's own launch arguments.
class InitialArgsSource final : public IActivationSource
{
  public:
    explicit InitialArgsSource(std::optional<std::string> uri);

    char const *name() const noexcept override { return "launch arguments"; }
    void start(ActivationLatch &latch) override;
    void stop() noexcept override {}

  private:
    std::optional<std::string> uri_;
};

class ActivationReceiver
{
  public:
    static constexpr std::chrono::milliseconds kPumpSlice{50};
    static constexpr std::chrono::milliseconds kPumpSettle{5};

    void add_source(std::unique_ptr<IActivationSource> source);

    // Starts every source, blocks for the first activation or guard expiry,
    // then stops every source. nullopt means the idle timeout fired.
    std::optional<ActivationEvent> wait(LifetimeGuard &guard);

  private:
    void stop_all() noexcept;

    std::vector<std::unique_ptr<IActivationSource>> sources_;
};

} // namespace ur::activation
