#include "dispatch/Dispatcher.hpp"

#include "utils/FS.hpp"
#include "utils/Log.hpp"

#include <cerrno>
#include <format>
#include <string>
#include <system_error>
#include <vector>

#if defined(_WIN32)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include <thread>

#include "utils/StringUtil.hpp"
#else
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace ur::dispatch
{

namespace
{

#if defined(_WIN32)

std::string format_win_error_message(DWORD code)
{
    return std::error_code(static_cast<int>(code), std::system_category())
        .message();
}

// CommandLineToArgvW quoting rules: backslashes only escape when they precede
// a double quote.
std::wstring quote_argument(std::wstring const &arg)
{
    if (!arg.empty() && arg.find_first_of(L" \t\n\v\"") == std::wstring::npos)
    {
        return arg;
    }
    std::wstring out = L"\"";
    std::size_t backslashes = 0;
    for (wchar_t ch : arg)
    {
        if (ch == L'\\')
        {
            ++backslashes;
            continue;
        }
        if (ch == L'"')
        {
            out.append(backslashes * 2 + 1, L'\\');
        }
        else
        {
            out.append(backslashes, L'\\');
        }
        backslashes = 0;
        out.push_back(ch);
    }
    out.append(backslashes * 2, L'\\');
    out.push_back(L'"');
    return out;
}

class UniqueHandle
{
  public:
    UniqueHandle() = default;
    explicit UniqueHandle(HANDLE handle) noexcept : handle_(handle) {}
    ~UniqueHandle() { reset(); }
    UniqueHandle(UniqueHandle const &) = delete;
    UniqueHandle &operator=(UniqueHandle const &) = delete;

    HANDLE get() const noexcept { return handle_; }
    HANDLE *put() noexcept
    {
        reset();
        return &handle_;
    }
    void reset() noexcept
    {
        if (handle_ != nullptr && handle_ != INVALID_HANDLE_VALUE)
        {
            CloseHandle(handle_);
        }
        handle_ = nullptr;
    }

  private:
    HANDLE handle_ = nullptr;
};

void drain_handle(HANDLE handle, std::string &out)
{
    char chunk[4096];
    DWORD read = 0;
    while (ReadFile(handle, chunk, sizeof(chunk), &read, nullptr) && read > 0)
    {
        out.append(chunk, read);
    }
}

DispatchResult run_child(std::filesystem::path const &tool,
                         std::string const &uri)
{
    SECURITY_ATTRIBUTES sa{};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    UniqueHandle out_read;
    UniqueHandle out_write;
    UniqueHandle err_read;
    UniqueHandle err_write;
    if (!CreatePipe(out_read.put(), out_write.put(), &sa, 0) ||
        !CreatePipe(err_read.put(), err_write.put(), &sa, 0))
    {
        throw DispatchError(std::format("CreatePipe failed: {}",
                                        format_win_error_message(GetLastError())));
    }
    SetHandleInformation(out_read.get(), HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(err_read.get(), HANDLE_FLAG_INHERIT, 0);

    STARTUPINFOW si{};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdInput = GetStdHandle(STD_INPUT_HANDLE);
    si.hStdOutput = out_write.get();
    si.hStdError = err_write.get();

    // CreateProcessW may write into the command line buffer.
    std::wstring command_line = quote_argument(tool.wstring()) + L" " +
                                quote_argument(utils::widen(uri));
    PROCESS_INFORMATION pi{};
    if (!CreateProcessW(tool.wstring().c_str(), command_line.data(), nullptr,
                        nullptr, TRUE, CREATE_NO_WINDOW, nullptr, nullptr, &si,
                        &pi))
    {
        throw DispatchError(std::format("Unable to start {}: {}",
                                        tool.string(),
                                        format_win_error_message(GetLastError())));
    }
    UniqueHandle process(pi.hProcess);
    UniqueHandle thread(pi.hThread);
    out_write.reset();
    err_write.reset();

    DispatchResult result;
    std::thread err_reader(
        [&] { drain_handle(err_read.get(), result.stderr_data); });
    drain_handle(out_read.get(), result.stdout_data);
    err_reader.join();

    WaitForSingleObject(process.get(), INFINITE);
    DWORD code = 1;
    if (!GetExitCodeProcess(process.get(), &code))
    {
        UR_LOG_WARN("GetExitCodeProcess failed: {}",
                    format_win_error_message(GetLastError()));
        code = 1;
    }
    result.exit_code = static_cast<int>(code);
    return result;
}

#else

std::string errno_message(int err)
{
    return std::error_code(err, std::generic_category()).message();
}

void close_fd(int &fd) noexcept
{
    if (fd >= 0)
    {
        ::close(fd);
        fd = -1;
    }
}

struct PipePair
{
    int read_end = -1;
    int write_end = -1;

    ~PipePair()
    {
        close_fd(read_end);
        close_fd(write_end);
    }

    void open()
    {
        int fds[2] = {-1, -1};
        if (::pipe(fds) != 0)
        {
            throw DispatchError(
                std::format("pipe() failed: {}", errno_message(errno)));
        }
        read_end = fds[0];
        write_end = fds[1];
    }
};

int wait_child(pid_t pid)
{
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0)
    {
        if (errno != EINTR)
        {
            throw DispatchError(
                std::format("waitpid() failed: {}", errno_message(errno)));
        }
    }
    return status;
}

// Reads both pipes until each reaches EOF.
void drain_pipes(int &out_fd, int &err_fd, DispatchResult &result)
{
    pollfd fds[2] = {{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}};
    std::string *sinks[2] = {&result.stdout_data, &result.stderr_data};
    int open = 2;
    char chunk[4096];
    while (open > 0)
    {
        int ret = ::poll(fds, 2, -1);
        if (ret < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            UR_LOG_ERROR("poll() on child pipes failed: {}",
                         errno_message(errno));
            break;
        }
        for (int i = 0; i < 2; ++i)
        {
            if (fds[i].fd < 0 || fds[i].revents == 0)
            {
                continue;
            }
            auto n = ::read(fds[i].fd, chunk, sizeof(chunk));
            if (n > 0)
            {
                sinks[i]->append(chunk, static_cast<std::size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR)
            {
                continue;
            }
            fds[i].fd = -1;
            --open;
        }
    }
    close_fd(out_fd);
    close_fd(err_fd);
}

DispatchResult run_child(std::filesystem::path const &tool,
                         std::string const &uri)
{
    PipePair out;
    PipePair err;
    PipePair status;
    out.open();
    err.open();
    status.open();
    ::fcntl(status.write_end, F_SETFD, FD_CLOEXEC);

    // Everything the child touches is prepared before fork().
    std::string const tool_str = tool.string();
    std::vector<char *> argv{const_cast<char *>(tool_str.c_str()),
                             const_cast<char *>(uri.c_str()), nullptr};

    pid_t pid = ::fork();
    if (pid < 0)
    {
        throw DispatchError(
            std::format("fork() failed: {}", errno_message(errno)));
    }
    if (pid == 0)
    {
        ::dup2(out.write_end, STDOUT_FILENO);
        ::dup2(err.write_end, STDERR_FILENO);
        ::close(out.read_end);
        ::close(err.read_end);
        ::close(out.write_end);
        ::close(err.write_end);
        ::close(status.read_end);
        ::execv(argv[0], argv.data());
        int exec_errno = errno;
        auto ignored = ::write(status.write_end, &exec_errno, sizeof(exec_errno));
        (void)ignored;
        _exit(127);
    }

    close_fd(out.write_end);
    close_fd(err.write_end);
    close_fd(status.write_end);

    int exec_errno = 0;
    ssize_t got = 0;
    do
    {
        got = ::read(status.read_end, &exec_errno, sizeof(exec_errno));
    } while (got < 0 && errno == EINTR);
    if (got == static_cast<ssize_t>(sizeof(exec_errno)))
    {
        wait_child(pid);
        throw DispatchError(std::format("Unable to start {}: {}", tool_str,
                                        errno_message(exec_errno)));
    }

    DispatchResult result;
    drain_pipes(out.read_end, err.read_end, result);
    int status_code = wait_child(pid);
    if (WIFEXITED(status_code))
    {
        result.exit_code = WEXITSTATUS(status_code);
    }
    else
    {
        result.killed = true;
        result.exit_code = 1;
        if (WIFSIGNALED(status_code))
        {
            UR_LOG_WARN("{} was killed by signal {}", tool_str,
                        WTERMSIG(status_code));
        }
    }
    return result;
}

#endif

} // namespace

Dispatcher::Dispatcher(config::Configuration const &config) : config_(config)
{
}

std::filesystem::path Dispatcher::resolve_tool() const
{
    auto const &tool = config_.processing_tool_path;
    if (auto found = utils::find_executable(tool, config_.extra_search_paths))
    {
        return *found;
    }
    return std::filesystem::path(tool);
}

DispatchResult Dispatcher::dispatch(std::string const &uri)
{
    auto tool = resolve_tool();
    UR_LOG_INFO("Dispatching to {}", tool.string());
    auto result = run_child(tool, uri);
    UR_LOG_INFO("{} exited with code {} ({} bytes stdout, {} bytes stderr)",
                tool.string(), result.exit_code, result.stdout_data.size(),
                result.stderr_data.size());
    return result;
}

} // namespace ur::dispatch
