#include "app/Options.hpp"

#include "config/Configuration.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"

#include <charconv>
#include <cstdint>
#include <format>

namespace ur::app
{

namespace
{

constexpr std::string_view kConfigFlag = "--config";
constexpr std::string_view kIdleTimeoutFlag = "--idle-timeout-ms";

// Matches "--flag=value" and "--flag value". index is advanced past a
// consumed value.
std::optional<std::string> flag_value(std::vector<std::string> const &args,
                                      std::size_t &index, std::string_view flag)
{
    std::string_view arg = args[index];
    if (arg.size() > flag.size() && arg.substr(0, flag.size()) == flag &&
        arg[flag.size()] == '=')
    {
        return std::string(arg.substr(flag.size() + 1));
    }
    if (arg == flag)
    {
        if (index + 1 >= args.size())
        {
            throw config::ConfigurationError(
                std::format("{} requires a value", flag));
        }
        ++index;
        return args[index];
    }
    return std::nullopt;
}

} // namespace

std::chrono::milliseconds parse_idle_timeout(std::string_view text,
                                             std::string_view origin)
{
    std::int64_t value = 0;
    auto const *end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (text.empty() || ec != std::errc{} || ptr != end || value <= 0 ||
        value > config::kMaxIdleTimeout.count())
    {
        throw config::ConfigurationError(std::format(
            "{}: idle timeout must be between 1 and {} milliseconds, got '{}'",
            origin, config::kMaxIdleTimeout.count(), text));
    }
    return std::chrono::milliseconds(value);
}

Options parse_options(std::vector<std::string> const &args)
{
    Options options;
    bool positional_only = false;
    for (std::size_t index = 0; index < args.size(); ++index)
    {
        auto const &arg = args[index];
        bool is_flag = !positional_only && arg.size() > 1 && arg[0] == '-';
        if (!is_flag)
        {
            if (!options.uri)
            {
                options.uri = arg;
            }
            else
            {
                UR_LOG_WARN("Ignoring extra argument '{}'", arg);
            }
            continue;
        }
        if (arg == "--")
        {
            positional_only = true;
            continue;
        }
        if (arg == "--help" || arg == "-h")
        {
            options.show_help = true;
            continue;
        }
        if (arg == "--version")
        {
            options.show_version = true;
            continue;
        }
        if (auto value = flag_value(args, index, kConfigFlag))
        {
            if (value->empty())
            {
                throw config::ConfigurationError("--config requires a path");
            }
            options.config_path = std::filesystem::path(*value);
            continue;
        }
        if (auto value = flag_value(args, index, kIdleTimeoutFlag))
        {
            options.idle_timeout = parse_idle_timeout(*value, kIdleTimeoutFlag);
            continue;
        }
        // Launchers add their own flags (macOS -psn_*, desktop environments).
        UR_LOG_INFO("Ignoring unknown option '{}'", arg);
    }
    return options;
}

void apply_environment(Options &options)
{
    if (!options.config_path)
    {
        if (auto value = utils::read_env(kConfigEnv); value && !value->empty())
        {
            options.config_path = std::filesystem::path(*value);
        }
    }
    if (!options.idle_timeout)
    {
        if (auto value = utils::read_env(kIdleTimeoutEnv);
            value && !value->empty())
        {
            options.idle_timeout = parse_idle_timeout(*value, kIdleTimeoutEnv);
        }
    }
}

std::string usage_text()
{
    return "Usage: urirelay [options] [URI]\n"
           "\n"
           "Hands URI to the configured processing tool. Registers the\n"
           "configured URI schemes on every launch.\n"
           "\n"
           "Options:\n"
           "  --config=PATH          settings.json to load instead of the\n"
           "                         per-user default\n"
           "  --idle-timeout-ms=N    exit after N ms without an activation\n"
           "  --version              print the version and exit\n"
           "  --help                 print this text and exit\n"
           "\n"
           "Environment:\n"
           "  URIRELAY_CONFIG, URIRELAY_IDLE_TIMEOUT_MS   defaults for the\n"
           "                         options above\n"
           "  URIRELAY_HEADLESS=1    print alerts instead of showing dialogs";
}

} // namespace ur::app
