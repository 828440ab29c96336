#include "app/Coordinator.hpp"

#include "TestUtils.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <doctest/doctest.h>

using namespace std::chrono_literals;
using ur::app::Coordinator;
using ur::app::CoordinatorState;
using ur::instance::InstanceRole;

namespace
{

class FakeConfigurationSource final : public ur::config::IConfigurationSource
{
  public:
    ur::config::Configuration load() const override
    {
        ++loads;
        if (!config)
        {
            throw ur::config::ConfigurationError(
                "Settings could not be loaded from /nowhere/settings.json");
        }
        return *config;
    }

    std::optional<ur::config::Configuration> config;
    mutable int loads = 0;
};

class FakeRegistrar final : public ur::services::ISchemeRegistrar
{
  public:
    void register_scheme(std::string const &scheme) override
    {
        registered.push_back(scheme);
    }

    std::vector<std::string> registered;
};

// Channel stand-in: offers its URI from start() when it has one.
class FakeChannel final : public ur::activation::IActivationSource
{
  public:
    explicit FakeChannel(std::optional<std::string> uri) : uri_(std::move(uri))
    {
    }

    char const *name() const noexcept override { return "fake channel"; }

    void start(ur::activation::ActivationLatch &latch) override
    {
        if (uri_)
        {
            latch.offer(ur::activation::ActivationEvent{
                *uri_, ur::activation::ActivationSource::ForwardedFromSecondary});
        }
    }

    void stop() noexcept override {}

  private:
    std::optional<std::string> uri_;
};

class FakeInstance final : public ur::instance::IInstanceCoordinator
{
  public:
    explicit FakeInstance(InstanceRole role) : role_(role) {}

    InstanceRole acquire() override
    {
        ++acquires;
        return role_;
    }

    std::unique_ptr<ur::activation::IActivationSource>
    forwarded_activations() override
    {
        return std::make_unique<FakeChannel>(pending_forward);
    }

    bool forward(std::string const &uri) override
    {
        forwarded.push_back(uri);
        return forward_succeeds;
    }

    int acquires = 0;
    std::vector<std::string> forwarded;
    bool forward_succeeds = true;
    std::optional<std::string> pending_forward;

  private:
    InstanceRole role_;
};

struct DispatchLog
{
    std::vector<std::string> uris;
};

class FakeDispatcher final : public ur::dispatch::IDispatcher
{
  public:
    FakeDispatcher(DispatchLog &log, ur::dispatch::DispatchResult result,
                   bool fail_to_start)
        : log_(log), result_(std::move(result)), fail_to_start_(fail_to_start)
    {
    }

    ur::dispatch::DispatchResult dispatch(std::string const &uri) override
    {
        log_.uris.push_back(uri);
        if (fail_to_start_)
        {
            throw ur::dispatch::DispatchError("Unable to start tool");
        }
        return result_;
    }

  private:
    DispatchLog &log_;
    ur::dispatch::DispatchResult result_;
    bool fail_to_start_;
};

class RecordingAlerter final : public ur::app::IAlerter
{
  public:
    void error(std::string const &title, std::string const &message) override
    {
        errors.push_back(title + ": " + message);
    }
    void warning(std::string const &title, std::string const &message) override
    {
        warnings.push_back(title + ": " + message);
    }

    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

struct Harness
{
    explicit Harness(InstanceRole role = InstanceRole::Primary)
        : configuration(std::make_shared<FakeConfigurationSource>()),
          registrar(std::make_shared<FakeRegistrar>()),
          instance(std::make_shared<FakeInstance>(role)),
          alerter(std::make_shared<RecordingAlerter>())
    {
        ur::config::Configuration config;
        config.processing_tool_path = "heimdallr_client";
        config.idle_timeout = 500ms;
        configuration->config = config;
    }

    int run(std::optional<std::string> uri)
    {
        ur::app::Collaborators collaborators;
        collaborators.configuration = configuration;
        collaborators.registrar = registrar;
        collaborators.instance = instance;
        collaborators.alerter = alerter;
        collaborators.make_dispatcher =
            [this](ur::config::Configuration const &config)
        {
            dispatched_config = config;
            return std::make_unique<FakeDispatcher>(dispatches, result,
                                                    fail_to_start);
        };

        ur::app::LaunchRequest request;
        request.uri = std::move(uri);
        request.idle_timeout = idle_override;
        Coordinator coordinator(std::move(collaborators), std::move(request));
        int code = coordinator.run();
        history = coordinator.history();
        return code;
    }

    std::shared_ptr<FakeConfigurationSource> configuration;
    std::shared_ptr<FakeRegistrar> registrar;
    std::shared_ptr<FakeInstance> instance;
    std::shared_ptr<RecordingAlerter> alerter;
    DispatchLog dispatches;
    ur::dispatch::DispatchResult result;
    bool fail_to_start = false;
    std::optional<std::chrono::milliseconds> idle_override;
    std::optional<ur::config::Configuration> dispatched_config;
    std::vector<CoordinatorState> history;
};

} // namespace

TEST_CASE("primary dispatches the launch URI unmodified")
{
    Harness harness;
    CHECK(harness.run(std::string(ur::tests::kSampleUri)) == 0);
    REQUIRE(harness.dispatches.uris.size() == 1);
    CHECK(harness.dispatches.uris.front() == ur::tests::kSampleUri);
    CHECK(harness.alerter->errors.empty());
    CHECK(harness.alerter->warnings.empty());
    CHECK(harness.history ==
          std::vector<CoordinatorState>{
              CoordinatorState::Starting, CoordinatorState::LockHeld,
              CoordinatorState::AwaitingActivation,
              CoordinatorState::Dispatching, CoordinatorState::Exiting});
}

TEST_CASE("forwarded URI reaches the dispatcher unmodified")
{
    Harness harness;
    harness.instance->pending_forward = ur::tests::kSampleUri;
    CHECK(harness.run(std::nullopt) == 0);
    REQUIRE(harness.dispatches.uris.size() == 1);
    CHECK(harness.dispatches.uris.front() == ur::tests::kSampleUri);
}

TEST_CASE("secondary forwards and exits without dispatching")
{
    Harness harness(InstanceRole::Secondary);
    CHECK(harness.run(std::string("ida://forward-me")) == 0);
    CHECK(harness.dispatches.uris.empty());
    REQUIRE(harness.instance->forwarded.size() == 1);
    CHECK(harness.instance->forwarded.front() == "ida://forward-me");
    CHECK(harness.history ==
          std::vector<CoordinatorState>{
              CoordinatorState::Starting, CoordinatorState::LockDenied,
              CoordinatorState::ForwardingAndExiting});
}

TEST_CASE("secondary exits 0 even when the primary is gone")
{
    Harness harness(InstanceRole::Secondary);
    harness.instance->forward_succeeds = false;
    CHECK(harness.run(std::string("ida://lost")) == 0);
    CHECK(harness.dispatches.uris.empty());
    CHECK(harness.alerter->errors.empty());
}

TEST_CASE("secondary without a URI forwards nothing")
{
    Harness harness(InstanceRole::Secondary);
    CHECK(harness.run(std::nullopt) == 0);
    CHECK(harness.instance->forwarded.empty());
}

TEST_CASE("idle timeout exits 0 without dispatching")
{
    Harness harness;
    auto started = std::chrono::steady_clock::now();
    CHECK(harness.run(std::nullopt) == 0);
    CHECK(std::chrono::steady_clock::now() - started >= 500ms);
    CHECK(harness.dispatches.uris.empty());
    CHECK(harness.history.back() == CoordinatorState::Exiting);
    CHECK(std::find(harness.history.begin(), harness.history.end(),
                    CoordinatorState::Dispatching) == harness.history.end());
}

TEST_CASE("command-line idle timeout overrides the file")
{
    Harness harness;
    harness.configuration->config->idle_timeout = 60s;
    harness.idle_override = 100ms;
    auto started = std::chrono::steady_clock::now();
    CHECK(harness.run(std::nullopt) == 0);
    CHECK(std::chrono::steady_clock::now() - started < 30s);
}

TEST_CASE("missing configuration exits 1 before registering or locking")
{
    Harness harness;
    harness.configuration->config.reset();
    CHECK(harness.run(std::string("ida://x")) == 1);
    CHECK(harness.registrar->registered.empty());
    CHECK(harness.instance->acquires == 0);
    CHECK(harness.dispatches.uris.empty());
    REQUIRE(harness.alerter->errors.size() == 1);
    CHECK(harness.alerter->errors.front().find("UriRelay Error") == 0);
}

TEST_CASE("every configured scheme is registered on each launch")
{
    Harness harness(InstanceRole::Secondary);
    harness.configuration->config->schemes = {"ida", "disasm"};
    harness.run(std::nullopt);
    CHECK(harness.registrar->registered ==
          std::vector<std::string>{"ida", "disasm"});
}

TEST_CASE("tool exit code is propagated")
{
    Harness harness;
    harness.result.exit_code = 7;
    CHECK(harness.run(std::string("ida://x")) == 7);
    CHECK(harness.alerter->warnings.empty());
}

TEST_CASE("stderr with a zero exit surfaces a warning")
{
    Harness harness;
    harness.result.stdout_data = "done\n";
    harness.result.stderr_data = "symbol not found\n";
    CHECK(harness.run(std::string("ida://x")) == 0);
    REQUIRE(harness.alerter->warnings.size() == 1);
    CHECK(harness.alerter->warnings.front() ==
          "UriRelay Warning: symbol not found");
    CHECK(harness.alerter->errors.empty());
}

TEST_CASE("tool that cannot start exits 1 with an error alert")
{
    Harness harness;
    harness.fail_to_start = true;
    CHECK(harness.run(std::string("ida://x")) == 1);
    REQUIRE(harness.alerter->errors.size() == 1);
    CHECK(harness.alerter->errors.front().find("Unable to start tool") !=
          std::string::npos);
}

TEST_CASE("killed tool exits 1")
{
    Harness harness;
    harness.result.killed = true;
    harness.result.exit_code = 1;
    CHECK(harness.run(std::string("ida://x")) == 1);
}

TEST_CASE("dispatcher sees the loaded configuration")
{
    Harness harness;
    harness.configuration->config->extra_search_paths = {"/opt/tools"};
    harness.run(std::string("ida://x"));
    REQUIRE(harness.dispatched_config);
    CHECK(harness.dispatched_config->processing_tool_path == "heimdallr_client");
    CHECK(harness.dispatched_config->extra_search_paths ==
          std::vector<std::string>{"/opt/tools"});
}
