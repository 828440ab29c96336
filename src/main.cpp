#include "activation/OsOpenEventSource.hpp"
#include "app/Alert.hpp"
#include "app/Coordinator.hpp"
#include "app/Options.hpp"
#include "config/Configuration.hpp"
#include "dispatch/Dispatcher.hpp"
#include "instance/InstanceCoordinator.hpp"
#include "services/SchemeRegistrar.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"
#include "utils/Version.hpp"

#include <cstdio>
#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#if defined(_WIN32)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <shellapi.h>

#include "utils/StringUtil.hpp"
#endif

namespace
{

#if defined(_WIN32)
// Arguments after the program name, as UTF-8.
std::vector<std::string> collect_arguments()
{
    std::vector<std::string> args;
    int count = 0;
    LPWSTR *wide = CommandLineToArgvW(GetCommandLineW(), &count);
    if (wide == nullptr)
    {
        return args;
    }
    for (int index = 1; index < count; ++index)
    {
        args.push_back(ur::utils::narrow(wide[index]));
    }
    LocalFree(wide);
    return args;
}

// A GUI-subsystem process has no console; borrow the launching terminal's
// so --help, --version and log lines still show up there.
void attach_parent_console()
{
    if (!AttachConsole(ATTACH_PARENT_PROCESS))
    {
        return;
    }
    FILE *stream = nullptr;
    if (freopen_s(&stream, "CONOUT$", "w", stdout) != 0 ||
        freopen_s(&stream, "CONOUT$", "w", stderr) != 0)
    {
        FreeConsole();
    }
}
#else
std::vector<std::string> collect_arguments(int argc, char *argv[])
{
    std::vector<std::string> args;
    for (int index = 1; index < argc; ++index)
    {
        if (argv[index] != nullptr)
        {
            args.emplace_back(argv[index]);
        }
    }
    return args;
}
#endif

ur::app::Collaborators make_collaborators(ur::app::Options const &options)
{
    ur::app::Collaborators collaborators;
    collaborators.configuration =
        std::make_shared<ur::config::FileConfigurationSource>(
            options.config_path.value_or(std::filesystem::path{}));
    collaborators.registrar = std::make_shared<ur::services::SchemeRegistrar>();
    collaborators.instance = std::make_shared<ur::instance::InstanceCoordinator>(
        ur::utils::runtime_root());
    collaborators.alerter = ur::app::make_alerter();
    collaborators.make_dispatcher = [](ur::config::Configuration const &config)
    { return std::make_unique<ur::dispatch::Dispatcher>(config); };
    collaborators.make_os_event_source = []
    { return std::make_unique<ur::activation::OsOpenEventSource>(); };
    return collaborators;
}

int run(std::vector<std::string> const &args,
        ur::activation::LifetimeGuard::Clock::time_point started_at)
{
    try
    {
        auto options = ur::app::parse_options(args);
        if (options.show_help)
        {
            ur::log::print_status("{}", ur::app::usage_text());
            return 0;
        }
        if (options.show_version)
        {
            ur::log::print_status("{}", ur::version::kDisplayVersion);
            return 0;
        }
        ur::app::apply_environment(options);

        UR_LOG_INFO("{} starting (pid {})", ur::version::kDisplayVersion,
                    ur::utils::current_process_id());

        ur::app::LaunchRequest request;
        request.uri = options.uri;
        request.idle_timeout = options.idle_timeout;
        request.started_at = started_at;
        ur::app::Coordinator coordinator(make_collaborators(options),
                                         std::move(request));
        int exit_code = coordinator.run();
        UR_LOG_INFO("Exiting with code {}", exit_code);
        return exit_code;
    }
    catch (ur::config::ConfigurationError const &ex)
    {
        UR_LOG_ERROR("{}", ex.what());
        ur::app::make_alerter()->error(ur::app::kErrorTitle, ex.what());
    }
    catch (std::exception const &ex)
    {
        std::fprintf(stderr, "UriRelay failed: %s\n", ex.what());
        UR_LOG_ERROR("UriRelay failed: {}", ex.what());
    }
    return 1;
}

} // namespace

#if defined(_WIN32)
int WINAPI wWinMain(HINSTANCE, HINSTANCE, PWSTR, int)
{
    auto const started_at = ur::activation::LifetimeGuard::Clock::now();
    attach_parent_console();
    return run(collect_arguments(), started_at);
}
#else
int main(int argc, char *argv[])
{
    auto const started_at = ur::activation::LifetimeGuard::Clock::now();
    return run(collect_arguments(argc, argv), started_at);
}
#endif
