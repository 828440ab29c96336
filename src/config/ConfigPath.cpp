#include "config/ConfigPath.hpp"

#include <cstdlib>
#include <utility>

#if defined(_WIN32)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <Windows.h>
#include <ShlObj.h>
#endif

namespace ur::config
{

ConfigPath::ConfigPath(Variant variant, std::filesystem::path directory)
    : variant_(variant), directory_(std::move(directory))
{
}

ConfigPath ConfigPath::posix(std::filesystem::path const &home)
{
    return ConfigPath(Variant::Posix, home / ".config" / kAppDirectoryName);
}

ConfigPath ConfigPath::windows(std::filesystem::path const &app_data)
{
    return ConfigPath(Variant::Windows, app_data / kAppDirectoryName);
}

std::optional<ConfigPath> ConfigPath::detect()
{
#if defined(_WIN32)
    PWSTR roaming = nullptr;
    if (SUCCEEDED(SHGetKnownFolderPath(FOLDERID_RoamingAppData, 0, nullptr,
                                       &roaming)) &&
        roaming)
    {
        std::filesystem::path path(roaming);
        CoTaskMemFree(roaming);
        return windows(path);
    }
    if (roaming)
    {
        CoTaskMemFree(roaming);
    }
    if (char const *app_data = std::getenv("APPDATA");
        app_data && app_data[0] != '\0')
    {
        return windows(std::filesystem::u8path(app_data));
    }
    return std::nullopt;
#else
    char const *home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0')
    {
        return std::nullopt;
    }
    return posix(std::filesystem::path(home));
#endif
}

std::filesystem::path ConfigPath::settings_file() const
{
    return directory_ / kSettingsFileName;
}

std::filesystem::path ConfigPath::log_file() const
{
    return directory_ / kLogFileName;
}

} // namespace ur::config
