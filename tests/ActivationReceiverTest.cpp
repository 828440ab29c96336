#include "activation/ActivationReceiver.hpp"
#include "activation/LifetimeGuard.hpp"
#include "activation/OsOpenEventSource.hpp"

#include "TestUtils.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <doctest/doctest.h>

using namespace std::chrono_literals;
using ur::activation::ActivationEvent;
using ur::activation::ActivationLatch;
using ur::activation::ActivationReceiver;
using ur::activation::ActivationSource;
using ur::activation::LifetimeGuard;

namespace
{

// Offers one URI from a worker thread after a delay.
class DelayedSource final : public ur::activation::IActivationSource
{
  public:
    DelayedSource(std::string uri, std::chrono::milliseconds delay,
                  std::atomic_int *stops = nullptr)
        : uri_(std::move(uri)), delay_(delay), stops_(stops)
    {
    }
    ~DelayedSource() override { stop(); }

    char const *name() const noexcept override { return "delayed"; }

    void start(ActivationLatch &latch) override
    {
        worker_ = std::thread(
            [this, &latch]
            {
                std::this_thread::sleep_for(delay_);
                accepted_ = latch.offer(ActivationEvent{
                    uri_, ActivationSource::ForwardedFromSecondary});
            });
    }

    void stop() noexcept override
    {
        if (worker_.joinable())
        {
            worker_.join();
            if (stops_ != nullptr)
            {
                stops_->fetch_add(1);
            }
        }
    }

    bool accepted() const { return accepted_; }

  private:
    std::string uri_;
    std::chrono::milliseconds delay_;
    std::atomic_int *stops_;
    std::thread worker_;
    std::atomic_bool accepted_{false};
};

LifetimeGuard guard_for(std::chrono::milliseconds window)
{
    return LifetimeGuard::arm(LifetimeGuard::Clock::now() + window);
}

} // namespace

TEST_CASE("lifetime guard expires only when not cancelled")
{
    auto now = LifetimeGuard::Clock::now();
    auto guard = LifetimeGuard::arm(now + 100ms);
    CHECK_FALSE(guard.expired(now));
    CHECK(guard.expired(now + 100ms));
    guard.cancel();
    CHECK(guard.cancelled());
    CHECK_FALSE(guard.expired(now + 1h));
}

TEST_CASE("launch argument reaches the receiver unmodified")
{
    auto guard = guard_for(5s);
    ActivationReceiver receiver;
    receiver.add_source(std::make_unique<ur::activation::InitialArgsSource>(
        std::string(ur::tests::kSampleUri)));
    auto event = receiver.wait(guard);
    REQUIRE(event);
    CHECK(event->raw_uri == ur::tests::kSampleUri);
    CHECK(event->source == ActivationSource::InitialArgs);
    CHECK(guard.cancelled());
}

TEST_CASE("OS open event reaches the receiver unmodified")
{
    auto guard = guard_for(5s);
    auto source = std::make_unique<ur::activation::OsOpenEventSource>();
    source->post(ur::tests::kSampleUri);
    ActivationReceiver receiver;
    receiver.add_source(std::make_unique<ur::activation::InitialArgsSource>(
        std::nullopt));
    receiver.add_source(std::move(source));
    auto event = receiver.wait(guard);
    REQUIRE(event);
    CHECK(event->raw_uri == ur::tests::kSampleUri);
    CHECK(event->source == ActivationSource::OSOpenEvent);
}

TEST_CASE("asynchronous source is awaited")
{
    auto guard = guard_for(5s);
    std::atomic_int stops{0};
    ActivationReceiver receiver;
    receiver.add_source(std::make_unique<DelayedSource>(ur::tests::kSampleUri,
                                                        50ms, &stops));
    auto event = receiver.wait(guard);
    REQUIRE(event);
    CHECK(event->raw_uri == ur::tests::kSampleUri);
    CHECK(event->source == ActivationSource::ForwardedFromSecondary);
    CHECK(stops.load() == 1);
}

TEST_CASE("idle timeout ends the wait without an event")
{
    auto started = LifetimeGuard::Clock::now();
    auto guard = LifetimeGuard::arm(started + 500ms);
    ActivationReceiver receiver;
    receiver.add_source(std::make_unique<ur::activation::InitialArgsSource>(
        std::nullopt));
    receiver.add_source(std::make_unique<ur::activation::OsOpenEventSource>());
    auto event = receiver.wait(guard);
    CHECK_FALSE(event);
    CHECK(LifetimeGuard::Clock::now() - started >= 500ms);
    CHECK_FALSE(guard.cancelled());
}

TEST_CASE("only the first activation is accepted")
{
    auto guard = guard_for(5s);
    ActivationLatch latch(guard);
    CHECK(latch.offer(ActivationEvent{"ida://first", ActivationSource::OSOpenEvent}));
    CHECK_FALSE(latch.offer(
        ActivationEvent{"ida://second", ActivationSource::InitialArgs}));
    CHECK(latch.wait_until(LifetimeGuard::Clock::now()) ==
          ActivationLatch::WaitStatus::Activated);
    auto event = latch.event();
    REQUIRE(event);
    CHECK(event->raw_uri == "ida://first");
}

TEST_CASE("late source loses to the launch argument")
{
    auto guard = guard_for(5s);
    ActivationReceiver receiver;
    receiver.add_source(
        std::make_unique<ur::activation::InitialArgsSource>("ida://initial"));
    receiver.add_source(std::make_unique<DelayedSource>("ida://late", 10ms));
    auto event = receiver.wait(guard);
    REQUIRE(event);
    CHECK(event->raw_uri == "ida://initial");
}

TEST_CASE("offers after the idle timeout are refused")
{
    auto guard = guard_for(10ms);
    ActivationLatch latch(guard);
    CHECK(latch.wait_until(LifetimeGuard::Clock::now() + 1s) ==
          ActivationLatch::WaitStatus::Expired);
    CHECK_FALSE(
        latch.offer(ActivationEvent{"ida://late", ActivationSource::OSOpenEvent}));
    CHECK_FALSE(latch.event());
}

TEST_CASE("OS open events after stop are dropped")
{
    auto guard = guard_for(5s);
    ActivationLatch latch(guard);
    ur::activation::OsOpenEventSource source;
    source.start(latch);
    source.stop();
    source.post("ida://too-late");
    CHECK_FALSE(latch.event());
}
