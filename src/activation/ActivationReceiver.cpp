#include "activation/ActivationReceiver.hpp"

#include "utils/Log.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace ur::activation
{

ActivationLatch::ActivationLatch(LifetimeGuard &guard) : guard_(guard) {}

bool ActivationLatch::offer(ActivationEvent event)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (event_)
    {
        UR_LOG_INFO("Ignoring {} activation; {} activation already accepted",
                    to_string(event.source), to_string(event_->source));
        return false;
    }
    if (expired_)
    {
        UR_LOG_INFO("Ignoring {} activation after idle timeout",
                    to_string(event.source));
        return false;
    }
    guard_.cancel();
    event_ = std::move(event);
    cv_.notify_all();
    return true;
}

ActivationLatch::WaitStatus ActivationLatch::wait_until(Clock::time_point until)
{
    std::unique_lock<std::mutex> lock(mutex_);
    auto limit = std::min(until, guard_.deadline());
    cv_.wait_until(lock, limit, [this] { return event_.has_value(); });
    if (event_)
    {
        return WaitStatus::Activated;
    }
    if (guard_.expired())
    {
        expired_ = true;
        return WaitStatus::Expired;
    }
    return WaitStatus::Pending;
}

std::optional<ActivationEvent> ActivationLatch::event() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return event_;
}

InitialArgsSource::InitialArgsSource(std::optional<std::string> uri)
    : uri_(std::move(uri))
{
}

void InitialArgsSource::start(ActivationLatch &latch)
{
    if (!uri_ || uri_->empty())
    {
        return;
    }
    latch.offer(ActivationEvent{*uri_, ActivationSource::InitialArgs});
}

void ActivationReceiver::add_source(std::unique_ptr<IActivationSource> source)
{
    if (source)
    {
        sources_.push_back(std::move(source));
    }
}

std::optional<ActivationEvent> ActivationReceiver::wait(LifetimeGuard &guard)
{
    ActivationLatch latch(guard);
    for (auto &source : sources_)
    {
        try
        {
            source->start(latch);
        }
        catch (std::exception const &ex)
        {
            // The remaining sources can still deliver.
            UR_LOG_ERROR("Activation source '{}' failed to start: {}",
                         source->name(), ex.what());
        }
    }

    bool const pumping =
        std::any_of(sources_.begin(), sources_.end(),
                    [](auto const &source) { return source->needs_pump(); });

    auto status = ActivationLatch::WaitStatus::Pending;
    while (status == ActivationLatch::WaitStatus::Pending)
    {
        if (pumping)
        {
            for (auto &source : sources_)
            {
                if (source->needs_pump())
                {
                    source->pump(kPumpSlice);
                }
            }
            status = latch.wait_until(ActivationLatch::Clock::now() +
                                      kPumpSettle);
        }
        else
        {
            status = latch.wait_until(guard.deadline());
        }
    }

    stop_all();

    if (status == ActivationLatch::WaitStatus::Expired)
    {
        UR_LOG_INFO("No activation received before the idle timeout");
        return std::nullopt;
    }
    auto event = latch.event();
    if (event)
    {
        UR_LOG_INFO("Activation from {}: {}", to_string(event->source),
                    event->raw_uri);
    }
    return event;
}

void ActivationReceiver::stop_all() noexcept
{
    for (auto &source : sources_)
    {
        source->stop();
    }
}

} // namespace ur::activation
