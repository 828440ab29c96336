#pragma once

#include "activation/ActivationReceiver.hpp"
#include "activation/LifetimeGuard.hpp"
#include "app/Alert.hpp"
#include "config/Configuration.hpp"
#include "dispatch/Dispatcher.hpp"
#include "instance/InstanceCoordinator.hpp"
#include "services/SchemeRegistrar.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ur::app
{

enum class CoordinatorState
{
    Starting,
    LockHeld,
    LockDenied,
    AwaitingActivation,
    Dispatching,
    ForwardingAndExiting,
    Exiting,
};

char const *to_string(CoordinatorState state) noexcept;

struct LaunchRequest
{
    std::optional<std::string> uri;
    std::optional<std::chrono::milliseconds> idle_timeout;
    // The idle window counts from here, not from the end of startup.
    activation::LifetimeGuard::Clock::time_point started_at =
        activation::LifetimeGuard::Clock::now();
};

struct Collaborators
{
    using DispatcherFactory = std::function<std::unique_ptr<dispatch::IDispatcher>(
        config::Configuration const &)>;
    using SourceFactory =
        std::function<std::unique_ptr<activation::IActivationSource>()>;

    std::shared_ptr<config::IConfigurationSource> configuration;
    std::shared_ptr<services::ISchemeRegistrar> registrar;
    std::shared_ptr<instance::IInstanceCoordinator> instance;
    std::shared_ptr<IAlerter> alerter;
    DispatcherFactory make_dispatcher;
    // Optional; empty or returning nullptr adds no OS event source.
    SourceFactory make_os_event_source;
};

// One process lifetime: load configuration, register schemes, claim or
// forward, wait for the first activation, dispatch it, map the outcome to an
// exit code.
class Coordinator
{
  public:
    Coordinator(Collaborators collaborators, LaunchRequest request);

    Coordinator(Coordinator const &) = delete;
    Coordinator &operator=(Coordinator const &) = delete;

    // Returns the process exit code. Call once.
    int run();

    std::vector<CoordinatorState> const &history() const noexcept
    {
        return history_;
    }

  private:
    int run_secondary();
    int run_primary();
    int dispatch_event(activation::ActivationEvent const &event);
    void transition(CoordinatorState next);

    Collaborators collaborators_;
    LaunchRequest request_;
    std::optional<config::Configuration> configuration_;
    CoordinatorState state_ = CoordinatorState::Starting;
    std::vector<CoordinatorState> history_{CoordinatorState::Starting};
};

} // namespace ur::app
