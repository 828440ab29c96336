#include "app/Coordinator.hpp"

#include "utils/Log.hpp"

#include <stdexcept>
#include <string_view>
#include <utility>

namespace ur::app
{

namespace
{

std::string_view trim_trailing_newline(std::string_view text)
{
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r'))
    {
        text.remove_suffix(1);
    }
    return text;
}

} // namespace

char const *to_string(CoordinatorState state) noexcept
{
    switch (state)
    {
    case CoordinatorState::Starting:
        return "starting";
    case CoordinatorState::LockHeld:
        return "lock-held";
    case CoordinatorState::LockDenied:
        return "lock-denied";
    case CoordinatorState::AwaitingActivation:
        return "awaiting-activation";
    case CoordinatorState::Dispatching:
        return "dispatching";
    case CoordinatorState::ForwardingAndExiting:
        return "forwarding-and-exiting";
    case CoordinatorState::Exiting:
        return "exiting";
    }
    return "unknown";
}

Coordinator::Coordinator(Collaborators collaborators, LaunchRequest request)
    : collaborators_(std::move(collaborators)), request_(std::move(request))
{
    if (!collaborators_.configuration || !collaborators_.registrar ||
        !collaborators_.instance || !collaborators_.alerter ||
        !collaborators_.make_dispatcher)
    {
        throw std::invalid_argument("coordinator collaborators are incomplete");
    }
}

void Coordinator::transition(CoordinatorState next)
{
    UR_LOG_DEBUG("State {} -> {}", to_string(state_), to_string(next));
    state_ = next;
    history_.push_back(next);
}

int Coordinator::run()
{
    try
    {
        configuration_ = collaborators_.configuration->load();
    }
    catch (config::ConfigurationError const &ex)
    {
        UR_LOG_ERROR("{}", ex.what());
        collaborators_.alerter->error(kErrorTitle, ex.what());
        transition(CoordinatorState::Exiting);
        return 1;
    }
    if (request_.idle_timeout)
    {
        configuration_->idle_timeout = *request_.idle_timeout;
    }

    for (auto const &scheme : configuration_->schemes)
    {
        collaborators_.registrar->register_scheme(scheme);
    }

    if (collaborators_.instance->acquire() == instance::InstanceRole::Secondary)
    {
        return run_secondary();
    }
    return run_primary();
}

int Coordinator::run_secondary()
{
    transition(CoordinatorState::LockDenied);
    transition(CoordinatorState::ForwardingAndExiting);
    if (!request_.uri)
    {
        UR_LOG_INFO("Another instance is running and there is no URI to "
                    "forward");
        return 0;
    }
    if (!collaborators_.instance->forward(*request_.uri))
    {
        UR_LOG_WARN("URI was not delivered to the running instance");
    }
    return 0;
}

int Coordinator::run_primary()
{
    transition(CoordinatorState::LockHeld);
    auto guard = activation::LifetimeGuard::arm(request_.started_at +
                                                configuration_->idle_timeout);

    activation::ActivationReceiver receiver;
    receiver.add_source(
        std::make_unique<activation::InitialArgsSource>(request_.uri));
    if (auto forwarded = collaborators_.instance->forwarded_activations())
    {
        receiver.add_source(std::move(forwarded));
    }
    else
    {
        UR_LOG_WARN("No forwarding channel; later launches cannot hand over "
                    "their URI");
    }
    if (collaborators_.make_os_event_source)
    {
        if (auto os_events = collaborators_.make_os_event_source())
        {
            receiver.add_source(std::move(os_events));
        }
    }

    transition(CoordinatorState::AwaitingActivation);
    auto event = receiver.wait(guard);
    if (!event)
    {
        UR_LOG_INFO("No activation within {} ms; exiting",
                    configuration_->idle_timeout.count());
        transition(CoordinatorState::Exiting);
        return 0;
    }

    transition(CoordinatorState::Dispatching);
    int exit_code = dispatch_event(*event);
    transition(CoordinatorState::Exiting);
    return exit_code;
}

int Coordinator::dispatch_event(activation::ActivationEvent const &event)
{
    auto dispatcher = collaborators_.make_dispatcher(*configuration_);
    dispatch::DispatchResult result;
    try
    {
        result = dispatcher->dispatch(event.raw_uri);
    }
    catch (dispatch::DispatchError const &ex)
    {
        UR_LOG_ERROR("{}", ex.what());
        collaborators_.alerter->error(kErrorTitle, ex.what());
        return 1;
    }

    if (auto out = trim_trailing_newline(result.stdout_data); !out.empty())
    {
        log::print_status("{}", out);
    }
    auto err = trim_trailing_newline(result.stderr_data);
    if (!err.empty())
    {
        UR_LOG_WARN("Processing tool wrote to stderr: {}", err);
    }
    if (result.killed)
    {
        UR_LOG_ERROR("Processing tool terminated abnormally");
        return 1;
    }
    if (result.exit_code != 0)
    {
        UR_LOG_ERROR("Processing tool failed with exit code {}",
                     result.exit_code);
        return result.exit_code;
    }
    if (!err.empty())
    {
        collaborators_.alerter->warning(kWarningTitle, std::string(err));
    }
    return 0;
}

} // namespace ur::app
