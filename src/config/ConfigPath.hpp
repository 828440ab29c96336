#pragma once

#include <filesystem>
#include <optional>

namespace ur::config
{

inline constexpr char kAppDirectoryName[] = "urirelay";
inline constexpr char kSettingsFileName[] = "settings.json";
inline constexpr char kLogFileName[] = "urirelay.log";

// Where settings.json lives. The platform branch is taken once, in detect();
// nothing else in the tree looks at HOME or APPDATA.
class ConfigPath
{
  public:
    enum class Variant
    {
        Posix,
        Windows,
    };

    // $HOME/.config/urirelay
    static ConfigPath posix(std::filesystem::path const &home);
    // %APPDATA%\urirelay
    static ConfigPath windows(std::filesystem::path const &app_data);

    // nullopt when the home / application-data root cannot be determined.
    static std::optional<ConfigPath> detect();

    Variant variant() const noexcept { return variant_; }
    std::filesystem::path const &directory() const noexcept
    {
        return directory_;
    }
    std::filesystem::path settings_file() const;
    std::filesystem::path log_file() const;

  private:
    ConfigPath(Variant variant, std::filesystem::path directory);

    Variant variant_;
    std::filesystem::path directory_;
};

} // namespace ur::config
