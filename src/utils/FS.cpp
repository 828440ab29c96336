#include "utils/FS.hpp"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#if defined(_WIN32)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <Windows.h>
#elif defined(__APPLE__)
#include <mach-o/dyld.h>
#include <unistd.h>
#else
#include <unistd.h>
#endif

namespace ur::utils
{

namespace
{

#if defined(_WIN32)
constexpr char kPathSeparator = ';';
#else
constexpr char kPathSeparator = ':';
#endif

bool is_launchable(std::filesystem::path const &candidate)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(candidate, ec) || ec)
    {
        return false;
    }
#if defined(_WIN32)
    return true;
#else
    return ::access(candidate.c_str(), X_OK) == 0;
#endif
}

std::optional<std::filesystem::path>
probe_directory(std::filesystem::path const &dir, std::string const &name)
{
    if (dir.empty())
    {
        return std::nullopt;
    }
    auto candidate = dir / name;
    if (is_launchable(candidate))
    {
        return candidate;
    }
#if defined(_WIN32)
    if (!candidate.has_extension())
    {
        auto with_ext = candidate;
        with_ext += ".exe";
        if (is_launchable(with_ext))
        {
            return with_ext;
        }
    }
#endif
    return std::nullopt;
}

} // namespace

std::optional<std::filesystem::path> executable_path()
{
#if defined(_WIN32)
    std::vector<wchar_t> buffer(32768);
    while (true)
    {
        DWORD length = GetModuleFileNameW(nullptr, buffer.data(),
                                          static_cast<DWORD>(buffer.size()));
        if (length == 0)
        {
            return std::nullopt;
        }
        if (length < buffer.size())
        {
            return std::filesystem::path(buffer.data(), buffer.data() + length);
        }
        if (buffer.size() >= (1 << 16))
        {
            return std::nullopt;
        }
        buffer.resize(buffer.size() * 2);
    }
#elif defined(__APPLE__)
    uint32_t size = 0;
    _NSGetExecutablePath(nullptr, &size);
    if (size == 0)
    {
        return std::nullopt;
    }
    std::vector<char> buffer(size);
    if (_NSGetExecutablePath(buffer.data(), &size) != 0)
    {
        return std::nullopt;
    }
    return std::filesystem::path(buffer.data());
#else
    std::vector<char> buffer(4096);
    while (true)
    {
        ssize_t length =
            readlink("/proc/self/exe", buffer.data(), buffer.size());
        if (length == -1)
        {
            return std::nullopt;
        }
        if (static_cast<std::size_t>(length) < buffer.size())
        {
            return std::filesystem::path(buffer.data(), buffer.data() + length);
        }
        buffer.resize(buffer.size() * 2);
    }
#endif
}

std::filesystem::path runtime_root()
{
#if defined(_WIN32)
    return std::filesystem::temp_directory_path() / "urirelay";
#else
    if (auto xdg = read_env("XDG_RUNTIME_DIR"); xdg && !xdg->empty())
    {
        return std::filesystem::path(*xdg) / "urirelay";
    }
    return std::filesystem::path("/tmp") /
           ("urirelay-" + std::to_string(::getuid()));
#endif
}

std::optional<std::filesystem::path>
find_executable(std::string const &name,
                std::vector<std::string> const &extra_dirs)
{
    if (name.empty())
    {
        return std::nullopt;
    }
    std::filesystem::path as_path(name);
    if (as_path.has_parent_path())
    {
        return as_path;
    }
    for (auto const &dir : extra_dirs)
    {
        if (auto found = probe_directory(std::filesystem::path(dir), name))
        {
            return found;
        }
    }
    auto path_env = read_env("PATH");
    if (!path_env)
    {
        return std::nullopt;
    }
    std::string::size_type start = 0;
    while (start <= path_env->size())
    {
        auto end = path_env->find(kPathSeparator, start);
        if (end == std::string::npos)
        {
            end = path_env->size();
        }
        auto entry = path_env->substr(start, end - start);
        if (auto found = probe_directory(std::filesystem::path(entry), name))
        {
            return found;
        }
        start = end + 1;
    }
    return std::nullopt;
}

std::optional<std::string> read_env(char const *key)
{
    auto value = std::getenv(key);
    if (value == nullptr)
    {
        return std::nullopt;
    }
    return std::string(value);
}

unsigned long current_process_id() noexcept
{
#if defined(_WIN32)
    return static_cast<unsigned long>(GetCurrentProcessId());
#else
    return static_cast<unsigned long>(::getpid());
#endif
}

} // namespace ur::utils
