#include "services/SchemeRegistrar.hpp"

#include "config/Configuration.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"

#include <cstdlib>
#include <format>
#include <fstream>
#include <utility>
#include <optional>
#include <sstream>
#include <system_error>

#if defined(_WIN32)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <shlobj.h>

#include "utils/StringUtil.hpp"
#endif

namespace ur::services
{

namespace
{

#if defined(_WIN32)

RegistrationResult register_windows_handler(std::filesystem::path const &exe,
                                            std::string const &scheme)
{
    RegistrationResult result;
    std::wstring command = L"\"" + exe.wstring() + L"\" \"%1\"";
    std::wstring wide_scheme = utils::widen(scheme);
    std::wstring base = L"Software\\Classes\\" + wide_scheme;

    auto set_value = [&](std::wstring const &subkey,
                         std::wstring const &value_name,
                         std::wstring const &value) -> DWORD
    {
        HKEY handle = nullptr;
        DWORD disposition = 0;
        auto status = RegCreateKeyExW(
            HKEY_CURRENT_USER, subkey.c_str(), 0, nullptr,
            REG_OPTION_NON_VOLATILE, KEY_WRITE, nullptr, &handle, &disposition);
        if (status != ERROR_SUCCESS)
        {
            return status;
        }
        if (disposition == REG_CREATED_NEW_KEY)
        {
            result.changed = true;
        }
        auto name_ptr = value_name.empty() ? nullptr : value_name.c_str();
        auto data_ptr = reinterpret_cast<const BYTE *>(value.c_str());
        auto data_size =
            static_cast<DWORD>((value.size() + 1) * sizeof(wchar_t));
        status =
            RegSetValueExW(handle, name_ptr, 0, REG_SZ, data_ptr, data_size);
        RegCloseKey(handle);
        return status;
    };

    auto fail = [&](std::string const &context, DWORD code)
    {
        RegistrationResult failure;
        std::error_code ec(static_cast<int>(code), std::system_category());
        failure.message = context + ": " + ec.message();
        return failure;
    };

    if (auto status = set_value(base, {}, L"URL:" + wide_scheme + L" Protocol");
        status != ERROR_SUCCESS)
    {
        return fail(scheme + " registration failed", status);
    }
    if (auto status = set_value(base, L"URL Protocol", L"");
        status != ERROR_SUCCESS)
    {
        return fail(scheme + " registration failed", status);
    }
    if (auto status = set_value(base + L"\\shell\\open\\command", {}, command);
        status != ERROR_SUCCESS)
    {
        return fail(scheme + " handler registration failed", status);
    }

    SHChangeNotify(SHCNE_ASSOCCHANGED, SHCNF_IDLIST, nullptr, nullptr);
    result.success = true;
    result.message = "handler registered";
    return result;
}

#elif defined(__linux__)

std::string escape_shell_argument(std::string const &value)
{
    std::string result;
    result.reserve(value.size() + 4);
    result.push_back('\'');
    for (char ch : value)
    {
        if (ch == '\'')
        {
            result += "'\\''";
            continue;
        }
        result.push_back(ch);
    }
    result.push_back('\'');
    return result;
}

// Quoted Exec= argument per the desktop entry specification.
std::string quote_exec_argument(std::string const &value)
{
    std::string result = "\"";
    for (char ch : value)
    {
        if (ch == '"' || ch == '`' || ch == '$' || ch == '\\')
        {
            result.push_back('\\');
        }
        result.push_back(ch);
    }
    result.push_back('"');
    return result;
}

std::optional<std::filesystem::path> data_home()
{
    if (auto xdg = utils::read_env("XDG_DATA_HOME"))
    {
        return std::filesystem::path(*xdg);
    }
    if (auto home = utils::read_env("HOME"))
    {
        return std::filesystem::path(*home) / ".local/share";
    }
    return std::nullopt;
}

std::string compose_desktop_entry(std::filesystem::path const &exe,
                                  std::string const &scheme)
{
    std::string entry;
    entry += "[Desktop Entry]\n";
    entry += "Type=Application\n";
    entry += std::format("Name=UriRelay ({})\n", scheme);
    entry += std::format("Exec={} %u\n", quote_exec_argument(exe.string()));
    entry += std::format("MimeType=x-scheme-handler/{};\n", scheme);
    entry += "NoDisplay=true\n";
    entry += "Terminal=false\n";
    entry += "StartupNotify=false\n";
    return entry;
}

std::optional<std::string> read_file(std::filesystem::path const &path)
{
    std::ifstream input(path, std::ios::binary);
    if (!input)
    {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

RegistrationResult register_linux_handler(std::filesystem::path const &exe,
                                          std::string const &scheme)
{
    RegistrationResult result;
    auto root = data_home();
    if (!root)
    {
        result.message = "neither XDG_DATA_HOME nor HOME is set";
        return result;
    }
    auto applications = *root / "applications";
    std::error_code ec;
    std::filesystem::create_directories(applications, ec);
    if (ec)
    {
        result.message = std::format("unable to ensure {}: {}",
                                     applications.string(), ec.message());
        return result;
    }

    auto entry_name = desktop_entry_name(scheme);
    auto desktop_file = applications / entry_name;
    auto content = compose_desktop_entry(exe, scheme);
    if (read_file(desktop_file) != content)
    {
        auto tmp_file = desktop_file;
        tmp_file += ".tmp";
        std::ofstream output(tmp_file, std::ios::trunc | std::ios::binary);
        if (!output)
        {
            result.message =
                std::format("unable to write {}", tmp_file.string());
            return result;
        }
        output << content;
        output.close();
        if (!output)
        {
            result.message =
                std::format("failed to write {}", tmp_file.string());
            return result;
        }
        std::filesystem::rename(tmp_file, desktop_file, ec);
        if (ec)
        {
            result.message = std::format("unable to store {}: {}",
                                         desktop_file.string(), ec.message());
            std::filesystem::remove(tmp_file, ec);
            return result;
        }
        result.changed = true;
    }
    result.success = true;

    // Reasserted on every call; another handler may have claimed the scheme.
    auto command = std::format(
        "xdg-mime default {} {} >/dev/null 2>&1",
        escape_shell_argument(entry_name),
        escape_shell_argument("x-scheme-handler/" + scheme));
    if (std::system(command.c_str()) == 0)
    {
        result.message = result.changed ? "handler registered"
                                        : "handler already registered";
    }
    else
    {
        result.message = "desktop entry in place; xdg-mime failed (ensure "
                         "xdg-utils installed)";
    }
    return result;
}

#endif

} // namespace

std::string desktop_entry_name(std::string const &scheme)
{
    return std::format("urirelay-{}.desktop", scheme);
}

SchemeRegistrar::SchemeRegistrar(std::filesystem::path executable)
    : executable_(std::move(executable))
{
}

RegistrationResult SchemeRegistrar::try_register(std::string const &scheme) const
{
    RegistrationResult result;
    if (!config::is_valid_scheme(scheme))
    {
        result.message = std::format("'{}' is not a valid URI scheme", scheme);
        return result;
    }
    auto exe = executable_;
    if (exe.empty())
    {
        auto detected = utils::executable_path();
        if (!detected)
        {
            result.message = "unable to determine executable path";
            return result;
        }
        exe = *detected;
    }
#if defined(_WIN32)
    return register_windows_handler(exe, scheme);
#elif defined(__linux__)
    return register_linux_handler(exe, scheme);
#elif defined(__APPLE__)
    (void)exe;
    result.success = true;
    result.message = "declared by the application bundle";
    return result;
#else
    (void)exe;
    result.message = "scheme registration unsupported on this platform";
    return result;
#endif
}

void SchemeRegistrar::register_scheme(std::string const &scheme)
{
    try
    {
        auto result = try_register(scheme);
        if (result.success)
        {
            if (result.changed)
            {
                UR_LOG_INFO("Registered {}:// handler: {}", scheme,
                            result.message);
            }
            else
            {
                UR_LOG_DEBUG("{}:// handler: {}", scheme, result.message);
            }
            return;
        }
        UR_LOG_WARN("Unable to register {}:// handler: {}", scheme,
                    result.message);
    }
    catch (std::exception const &ex)
    {
        UR_LOG_WARN("Unable to register {}:// handler: {}", scheme, ex.what());
    }
}

} // namespace ur::services
