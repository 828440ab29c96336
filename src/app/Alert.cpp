#include "app/Alert.hpp"

#include "utils/FS.hpp"
#include "utils/Log.hpp"

#include <cstdio>
#include <cstdlib>
#include <format>

#if defined(_WIN32)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include "utils/StringUtil.hpp"
#elif !defined(__APPLE__)
#include <sys/wait.h>
#endif

namespace ur::app
{

namespace
{

enum class Severity
{
    Error,
    Warning,
};

void print_to_console(std::string const &title, std::string const &message)
{
    std::fprintf(stderr, "%s: %s\n", title.c_str(), message.c_str());
    std::fflush(stderr);
}

#if defined(_WIN32)

bool show_dialog(Severity severity, std::string const &title,
                 std::string const &message)
{
    UINT flags = MB_OK | MB_SETFOREGROUND | MB_TOPMOST;
    flags |= severity == Severity::Error ? MB_ICONERROR : MB_ICONWARNING;
    return MessageBoxW(nullptr, utils::widen(message).c_str(),
                       utils::widen(title).c_str(), flags) != 0;
}

#else

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

bool run_external_command(std::string const &command)
{
    if (command.empty())
    {
        return false;
    }
    return std::system(command.c_str()) == 0;
}

#if defined(__APPLE__)

constexpr char kTitleEnv[] = "URIRELAY_ALERT_TITLE";
constexpr char kMessageEnv[] = "URIRELAY_ALERT_MESSAGE";

// Title and message travel through the environment so that nothing the
// user controls is ever parsed as AppleScript.
bool show_dialog(Severity severity, std::string const &title,
                 std::string const &message)
{
    if (::setenv(kTitleEnv, title.c_str(), 1) != 0 ||
        ::setenv(kMessageEnv, message.c_str(), 1) != 0)
    {
        return false;
    }
    auto script = std::format(
        "display dialog (system attribute \"{}\") with title (system "
        "attribute \"{}\") buttons {{\"OK\"}} default button \"OK\" with "
        "icon {}",
        kMessageEnv, kTitleEnv,
        severity == Severity::Error ? "stop" : "caution");
    auto shown = run_external_command(std::format(
        "/usr/bin/osascript -e {} >/dev/null 2>&1", escape_shell_argument(script)));
    ::unsetenv(kTitleEnv);
    ::unsetenv(kMessageEnv);
    return shown;
}

#else

bool show_dialog(Severity severity, std::string const &title,
                 std::string const &message)
{
    if (!utils::read_env("DISPLAY") && !utils::read_env("WAYLAND_DISPLAY"))
    {
        return false;
    }
    if (utils::find_executable("zenity", {}))
    {
        // zenity exits 1 when the dialog is closed instead of confirmed;
        // only 0 and 1 mean it was shown.
        auto command = std::format(
            "zenity {} --no-markup --title={} --text={} >/dev/null 2>&1",
            severity == Severity::Error ? "--error" : "--warning",
            escape_shell_argument(title), escape_shell_argument(message));
        int status = std::system(command.c_str());
        if (status != -1 && WIFEXITED(status) &&
            (WEXITSTATUS(status) == 0 || WEXITSTATUS(status) == 1))
        {
            return true;
        }
    }
    if (utils::find_executable("kdialog", {}))
    {
        return run_external_command(std::format(
            "kdialog --title {} {} {} >/dev/null 2>&1",
            escape_shell_argument(title),
            severity == Severity::Error ? "--error" : "--sorry",
            escape_shell_argument(message)));
    }
    return false;
}

#endif
#endif

} // namespace

void ConsoleAlerter::error(std::string const &title, std::string const &message)
{
    print_to_console(title, message);
}

void ConsoleAlerter::warning(std::string const &title,
                             std::string const &message)
{
    print_to_console(title, message);
}

void DialogAlerter::error(std::string const &title, std::string const &message)
{
    if (!show_dialog(Severity::Error, title, message))
    {
        UR_LOG_DEBUG("No dialog available; printing the error instead");
        fallback_.error(title, message);
    }
}

void DialogAlerter::warning(std::string const &title,
                            std::string const &message)
{
    if (!show_dialog(Severity::Warning, title, message))
    {
        UR_LOG_DEBUG("No dialog available; printing the warning instead");
        fallback_.warning(title, message);
    }
}

std::unique_ptr<IAlerter> make_alerter()
{
    if (auto headless = utils::read_env(kHeadlessEnv); headless && *headless != "0")
    {
        return std::make_unique<ConsoleAlerter>();
    }
    return std::make_unique<DialogAlerter>();
}

} // namespace ur::app
