#pragma once

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <system_error>

#if !defined(_WIN32)
#include <unistd.h>
#endif

namespace ur::tests
{

inline constexpr char kSampleUri[] =
    "scheme://host/path?offset=0x100003f10&hash=fea074789acc4a748d2ba0c6d82a0f8f";

// Fresh directory under the system temp dir, removed on destruction.
class TempDir
{
  public:
    explicit TempDir(std::string const &prefix)
    {
        static std::atomic_int counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
#if defined(_WIN32)
        auto pid = 0;
#else
        auto pid = static_cast<long>(::getpid());
#endif
        path_ = std::filesystem::temp_directory_path() /
                (prefix + "-" + std::to_string(pid) + "-" +
                 std::to_string(stamp % 1000000) + "-" +
                 std::to_string(counter.fetch_add(1)));
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        std::filesystem::create_directories(path_, ec);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(TempDir const &) = delete;
    TempDir &operator=(TempDir const &) = delete;

    std::filesystem::path const &path() const noexcept { return path_; }

  private:
    std::filesystem::path path_;
};

// Sets (or clears, for nullopt) an environment variable for one scope.
class ScopedEnv
{
  public:
    ScopedEnv(char const *key, std::optional<std::string> const &value)
        : key_(key)
    {
        if (auto const *previous = std::getenv(key))
        {
            previous_ = previous;
        }
        assign(value);
    }

    ~ScopedEnv() { assign(previous_); }

    ScopedEnv(ScopedEnv const &) = delete;
    ScopedEnv &operator=(ScopedEnv const &) = delete;

  private:
    void assign(std::optional<std::string> const &value)
    {
#if defined(_WIN32)
        _putenv_s(key_.c_str(), value ? value->c_str() : "");
#else
        if (value)
        {
            ::setenv(key_.c_str(), value->c_str(), 1);
        }
        else
        {
            ::unsetenv(key_.c_str());
        }
#endif
    }

    std::string key_;
    std::optional<std::string> previous_;
};

inline void write_file(std::filesystem::path const &path,
                       std::string const &content)
{
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output << content;
}

inline std::string read_file(std::filesystem::path const &path)
{
    std::ifstream input(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(input)),
                       std::istreambuf_iterator<char>());
}

#if !defined(_WIN32)
// Writes a /bin/sh script and marks it executable.
inline std::filesystem::path write_script(std::filesystem::path const &dir,
                                          std::string const &name,
                                          std::string const &body)
{
    auto path = dir / name;
    write_file(path, "#!/bin/sh\n" + body + "\n");
    std::filesystem::permissions(path,
                                 std::filesystem::perms::owner_all |
                                     std::filesystem::perms::group_read |
                                     std::filesystem::perms::group_exec);
    return path;
}
#endif

} // namespace ur::tests
