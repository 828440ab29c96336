#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ur::app
{

inline constexpr char kConfigEnv[] = "URIRELAY_CONFIG";
inline constexpr char kIdleTimeoutEnv[] = "URIRELAY_IDLE_TIMEOUT_MS";

struct Options
{
    std::optional<std::filesystem::path> config_path;
    std::optional<std::chrono::milliseconds> idle_timeout;
    // First positional argument.
    std::optional<std::string> uri;
    bool show_version = false;
    bool show_help = false;
};

// args excludes the program name. Unknown flags are logged and skipped;
// malformed values of known flags throw config::ConfigurationError.
Options parse_options(std::vector<std::string> const &args);

// Fills fields the command line left unset from URIRELAY_CONFIG and
// URIRELAY_IDLE_TIMEOUT_MS.
void apply_environment(Options &options);

// Positive millisecond count; origin only feeds the error message.
std::chrono::milliseconds parse_idle_timeout(std::string_view text,
                                             std::string_view origin);

std::string usage_text();

} // namespace ur::app
