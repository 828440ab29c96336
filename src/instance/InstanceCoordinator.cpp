#include "instance/InstanceCoordinator.hpp"

#include "instance/ForwardFrame.hpp"
#include "utils/Log.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

#if defined(_WIN32)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include "utils/StringUtil.hpp"
#else
#include <fcntl.h>
#include <poll.h>
#include <sys/file.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>
#endif

namespace ur::instance
{

namespace
{

constexpr std::chrono::milliseconds kRetryInterval{50};

#if defined(_WIN32)

std::string format_win_error_message(DWORD code)
{
    std::error_code ec(static_cast<int>(code), std::system_category());
    return ec.message();
}

// Mailslot reader. Mailslot handles cannot be waited on, so the worker
// polls for the next message and checks the stop flag in between.
class MailslotForwardSource final : public activation::IActivationSource
{
  public:
    explicit MailslotForwardSource(HANDLE mailslot) : mailslot_(mailslot) {}
    ~MailslotForwardSource() override { stop(); }

    char const *name() const noexcept override { return "forwarded launches"; }

    void start(activation::ActivationLatch &latch) override
    {
        stop_requested_.store(false, std::memory_order_relaxed);
        worker_ = std::thread([this, &latch] { run(latch); });
    }

    void stop() noexcept override
    {
        stop_requested_.store(true, std::memory_order_relaxed);
        if (worker_.joinable())
        {
            worker_.join();
        }
        if (mailslot_ != INVALID_HANDLE_VALUE)
        {
            CloseHandle(mailslot_);
            mailslot_ = INVALID_HANDLE_VALUE;
        }
    }

  private:
    void run(activation::ActivationLatch &latch)
    {
        while (!stop_requested_.load(std::memory_order_relaxed))
        {
            DWORD next_size = 0;
            if (!GetMailslotInfo(mailslot_, nullptr, &next_size, nullptr,
                                 nullptr))
            {
                UR_LOG_ERROR("GetMailslotInfo failed: {}",
                             format_win_error_message(GetLastError()));
                return;
            }
            if (next_size == MAILSLOT_NO_MESSAGE)
            {
                std::this_thread::sleep_for(kRetryInterval);
                continue;
            }
            std::string buffer(next_size, '\0');
            DWORD read = 0;
            if (!ReadFile(mailslot_, buffer.data(), next_size, &read, nullptr))
            {
                UR_LOG_ERROR("Reading the activation mailslot failed: {}",
                             format_win_error_message(GetLastError()));
                continue;
            }
            buffer.resize(read);
            auto decoded = decode_frame(buffer);
            if (!decoded.uri)
            {
                UR_LOG_WARN("Dropping forwarded message: {}", decoded.error);
                continue;
            }
            latch.offer(activation::ActivationEvent{
                std::move(*decoded.uri),
                activation::ActivationSource::ForwardedFromSecondary});
        }
    }

    HANDLE mailslot_ = INVALID_HANDLE_VALUE;
    std::atomic_bool stop_requested_{false};
    std::thread worker_;
};

#else

constexpr std::chrono::milliseconds kReadWindow{1000};
constexpr int kListenBacklog = 16;

#if defined(MSG_NOSIGNAL)
constexpr int kSendFlags = MSG_NOSIGNAL;
#else
constexpr int kSendFlags = 0;
#endif

class UniqueFd
{
  public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(UniqueFd &&other) noexcept : fd_(other.release()) {}
    UniqueFd &operator=(UniqueFd &&other) noexcept
    {
        if (this != &other)
        {
            reset(other.release());
        }
        return *this;
    }
    UniqueFd(UniqueFd const &) = delete;
    UniqueFd &operator=(UniqueFd const &) = delete;

    int get() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }

    int release() noexcept
    {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1) noexcept
    {
        if (fd_ >= 0)
        {
            ::close(fd_);
        }
        fd_ = fd;
    }

  private:
    int fd_ = -1;
};

std::string errno_message(int err)
{
    return std::error_code(err, std::generic_category()).message();
}

void set_cloexec(int fd)
{
    int flags = ::fcntl(fd, F_GETFD);
    if (flags >= 0)
    {
        ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
    }
}

bool fill_socket_address(std::filesystem::path const &path, sockaddr_un &addr)
{
    auto const &native = path.native();
    if (native.size() >= sizeof(addr.sun_path))
    {
        return false;
    }
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, native.c_str(), native.size() + 1);
    return true;
}

bool send_all(int fd, std::string_view data)
{
    std::size_t offset = 0;
    while (offset < data.size())
    {
        auto sent =
            ::send(fd, data.data() + offset, data.size() - offset, kSendFlags);
        if (sent < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            UR_LOG_WARN("Sending forwarded URI failed: {}",
                        errno_message(errno));
            return false;
        }
        offset += static_cast<std::size_t>(sent);
    }
    ::shutdown(fd, SHUT_WR);
    return true;
}

// Reads until the peer closes, the frame limit is passed, the read window
// ends, or wake_fd becomes readable.
std::string read_client(int fd, int wake_fd)
{
    std::string buffer;
    char chunk[4096];
    auto deadline = std::chrono::steady_clock::now() + kReadWindow;
    while (buffer.size() <= kMaxFrameSize)
    {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                             deadline - std::chrono::steady_clock::now())
                             .count();
        if (remaining <= 0)
        {
            break;
        }
        pollfd fds[2] = {{fd, POLLIN, 0}, {wake_fd, POLLIN, 0}};
        int ret = ::poll(fds, 2, static_cast<int>(remaining));
        if (ret < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            break;
        }
        if (ret == 0 || fds[1].revents != 0)
        {
            break;
        }
        auto n = ::read(fd, chunk, sizeof(chunk));
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            break;
        }
        if (n == 0)
        {
            break;
        }
        buffer.append(chunk, static_cast<std::size_t>(n));
    }
    return buffer;
}

class SocketForwardSource final : public activation::IActivationSource
{
  public:
    explicit SocketForwardSource(UniqueFd listener)
        : listener_(std::move(listener))
    {
    }
    ~SocketForwardSource() override { stop(); }

    char const *name() const noexcept override { return "forwarded launches"; }

    void start(activation::ActivationLatch &latch) override
    {
        int fds[2] = {-1, -1};
        if (::pipe(fds) != 0)
        {
            throw std::system_error(errno, std::generic_category(),
                                    "wake pipe");
        }
        wake_read_.reset(fds[0]);
        wake_write_.reset(fds[1]);
        set_cloexec(fds[0]);
        set_cloexec(fds[1]);
        worker_ = std::thread([this, &latch] { run(latch); });
    }

    void stop() noexcept override
    {
        if (worker_.joinable())
        {
            char byte = 1;
            while (::write(wake_write_.get(), &byte, 1) < 0 && errno == EINTR)
            {
            }
            worker_.join();
        }
        listener_.reset();
        wake_read_.reset();
        wake_write_.reset();
    }

  private:
    void run(activation::ActivationLatch &latch)
    {
        while (true)
        {
            pollfd fds[2] = {{listener_.get(), POLLIN, 0},
                             {wake_read_.get(), POLLIN, 0}};
            int ret = ::poll(fds, 2, -1);
            if (ret < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                UR_LOG_ERROR("Polling the forwarding socket failed: {}",
                             errno_message(errno));
                return;
            }
            if (fds[1].revents != 0)
            {
                return;
            }
            if ((fds[0].revents & POLLIN) == 0)
            {
                if ((fds[0].revents & (POLLERR | POLLHUP | POLLNVAL)) != 0)
                {
                    UR_LOG_ERROR("Forwarding socket closed unexpectedly");
                    return;
                }
                continue;
            }
            UniqueFd client(::accept(listener_.get(), nullptr, nullptr));
            if (!client.valid())
            {
                if (errno == EINTR || errno == EAGAIN ||
                    errno == ECONNABORTED)
                {
                    continue;
                }
                UR_LOG_ERROR("accept() on the forwarding socket failed: {}",
                             errno_message(errno));
                return;
            }
            set_cloexec(client.get());
            auto bytes = read_client(client.get(), wake_read_.get());
            auto decoded = decode_frame(bytes);
            if (!decoded.uri)
            {
                UR_LOG_WARN("Dropping forwarded message: {}", decoded.error);
                continue;
            }
            latch.offer(activation::ActivationEvent{
                std::move(*decoded.uri),
                activation::ActivationSource::ForwardedFromSecondary});
        }
    }

    UniqueFd listener_;
    UniqueFd wake_read_;
    UniqueFd wake_write_;
    std::thread worker_;
};

#endif

} // namespace

#if defined(_WIN32)

struct InstanceCoordinator::Impl
{
    std::string identity;
    std::optional<InstanceRole> role;
    HANDLE mutex = nullptr;
    HANDLE mailslot = INVALID_HANDLE_VALUE;

    ~Impl()
    {
        if (mailslot != INVALID_HANDLE_VALUE)
        {
            CloseHandle(mailslot);
        }
        if (mutex != nullptr)
        {
            CloseHandle(mutex);
        }
    }

    std::wstring mutex_name() const
    {
        return L"Local\\" + utils::widen(identity) + L".Instance";
    }

    std::wstring mailslot_name() const
    {
        return L"\\\\.\\mailslot\\" + utils::widen(identity) + L"\\activation";
    }

    InstanceRole acquire()
    {
        HANDLE handle = CreateMutexW(nullptr, TRUE, mutex_name().c_str());
        DWORD error = GetLastError();
        if (handle == nullptr)
        {
            UR_LOG_ERROR("CreateMutexW failed ({}); continuing without an "
                         "instance lock",
                         format_win_error_message(error));
            return InstanceRole::Primary;
        }
        if (error == ERROR_ALREADY_EXISTS)
        {
            CloseHandle(handle);
            return InstanceRole::Secondary;
        }
        mutex = handle;
        mailslot = CreateMailslotW(mailslot_name().c_str(), 0, 0, nullptr);
        if (mailslot == INVALID_HANDLE_VALUE)
        {
            UR_LOG_ERROR("CreateMailslotW failed: {}",
                         format_win_error_message(GetLastError()));
        }
        return InstanceRole::Primary;
    }

    std::unique_ptr<activation::IActivationSource> take_channel()
    {
        if (mailslot == INVALID_HANDLE_VALUE)
        {
            return nullptr;
        }
        auto source = std::make_unique<MailslotForwardSource>(mailslot);
        mailslot = INVALID_HANDLE_VALUE;
        return source;
    }

    bool forward(std::string const &frame)
    {
        auto name = mailslot_name();
        auto deadline =
            std::chrono::steady_clock::now() + InstanceCoordinator::kForwardWindow;
        while (true)
        {
            HANDLE slot = CreateFileW(name.c_str(), GENERIC_WRITE,
                                      FILE_SHARE_READ, nullptr, OPEN_EXISTING,
                                      FILE_ATTRIBUTE_NORMAL, nullptr);
            if (slot != INVALID_HANDLE_VALUE)
            {
                DWORD written = 0;
                BOOL ok = WriteFile(slot, frame.data(),
                                    static_cast<DWORD>(frame.size()), &written,
                                    nullptr);
                DWORD error = GetLastError();
                CloseHandle(slot);
                if (!ok || written != frame.size())
                {
                    UR_LOG_WARN("Writing to the activation mailslot failed: {}",
                                format_win_error_message(error));
                    return false;
                }
                return true;
            }
            DWORD error = GetLastError();
            if (error != ERROR_FILE_NOT_FOUND)
            {
                UR_LOG_WARN("Opening the activation mailslot failed: {}",
                            format_win_error_message(error));
                return false;
            }
            if (std::chrono::steady_clock::now() >= deadline)
            {
                return false;
            }
            std::this_thread::sleep_for(kRetryInterval);
        }
    }
};

#else

struct InstanceCoordinator::Impl
{
    std::filesystem::path runtime_dir;
    std::optional<InstanceRole> role;
    UniqueFd lock_fd;
    UniqueFd listener;

    std::filesystem::path lock_path() const
    {
        return runtime_dir / "instance.lock";
    }

    std::filesystem::path socket_path() const
    {
        return runtime_dir / "instance.sock";
    }

    InstanceRole acquire()
    {
        std::error_code ec;
        std::filesystem::create_directories(runtime_dir, ec);
        if (ec)
        {
            UR_LOG_WARN("Unable to create {}: {}", runtime_dir.string(),
                        ec.message());
        }
        else
        {
            std::filesystem::permissions(runtime_dir,
                                         std::filesystem::perms::owner_all,
                                         std::filesystem::perm_options::replace,
                                         ec);
        }

        UniqueFd fd(::open(lock_path().c_str(), O_RDWR | O_CREAT | O_CLOEXEC,
                           0600));
        if (!fd.valid())
        {
            UR_LOG_ERROR("Unable to open instance lock {} ({}); continuing "
                         "without an instance lock",
                         lock_path().string(), errno_message(errno));
            return InstanceRole::Primary;
        }
        while (::flock(fd.get(), LOCK_EX | LOCK_NB) != 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            if (errno == EWOULDBLOCK)
            {
                return InstanceRole::Secondary;
            }
            UR_LOG_ERROR("flock({}) failed ({}); continuing without an "
                         "instance lock",
                         lock_path().string(), errno_message(errno));
            return InstanceRole::Primary;
        }
        lock_fd = std::move(fd);
        open_channel();
        return InstanceRole::Primary;
    }

    // Bound and listening before acquire() returns, so a secondary's connect
    // is queued by the kernel even before the receiver starts accepting.
    void open_channel()
    {
        sockaddr_un addr{};
        auto path = socket_path();
        if (!fill_socket_address(path, addr))
        {
            UR_LOG_ERROR("Socket path {} is too long", path.string());
            return;
        }
        UniqueFd sock(::socket(AF_UNIX, SOCK_STREAM, 0));
        if (!sock.valid())
        {
            UR_LOG_ERROR("socket(AF_UNIX) failed: {}", errno_message(errno));
            return;
        }
        set_cloexec(sock.get());
        // A leftover socket belongs to a dead primary: we hold the lock now.
        ::unlink(path.c_str());
        if (::bind(sock.get(), reinterpret_cast<sockaddr *>(&addr),
                   sizeof(addr)) != 0)
        {
            UR_LOG_ERROR("bind({}) failed: {}", path.string(),
                         errno_message(errno));
            return;
        }
        ::chmod(path.c_str(), 0600);
        if (::listen(sock.get(), kListenBacklog) != 0)
        {
            UR_LOG_ERROR("listen({}) failed: {}", path.string(),
                         errno_message(errno));
            return;
        }
        listener = std::move(sock);
    }

    std::unique_ptr<activation::IActivationSource> take_channel()
    {
        if (!listener.valid())
        {
            return nullptr;
        }
        return std::make_unique<SocketForwardSource>(std::move(listener));
    }

    bool forward(std::string const &frame)
    {
        sockaddr_un addr{};
        auto path = socket_path();
        if (!fill_socket_address(path, addr))
        {
            UR_LOG_ERROR("Socket path {} is too long", path.string());
            return false;
        }
        auto deadline =
            std::chrono::steady_clock::now() + InstanceCoordinator::kForwardWindow;
        while (true)
        {
            UniqueFd sock(::socket(AF_UNIX, SOCK_STREAM, 0));
            if (!sock.valid())
            {
                UR_LOG_ERROR("socket(AF_UNIX) failed: {}", errno_message(errno));
                return false;
            }
            set_cloexec(sock.get());
#if defined(SO_NOSIGPIPE)
            int one = 1;
            ::setsockopt(sock.get(), SOL_SOCKET, SO_NOSIGPIPE, &one,
                         sizeof(one));
#endif
            if (::connect(sock.get(), reinterpret_cast<sockaddr *>(&addr),
                          sizeof(addr)) == 0)
            {
                return send_all(sock.get(), frame);
            }
            int error = errno;
            if (error != ENOENT && error != ECONNREFUSED && error != EAGAIN &&
                error != EINTR)
            {
                UR_LOG_WARN("connect({}) failed: {}", path.string(),
                            errno_message(error));
                return false;
            }
            if (std::chrono::steady_clock::now() >= deadline)
            {
                return false;
            }
            std::this_thread::sleep_for(kRetryInterval);
        }
    }
};

#endif

InstanceCoordinator::InstanceCoordinator(std::filesystem::path runtime_dir,
                                         std::string identity)
    : impl_(std::make_unique<Impl>())
{
#if defined(_WIN32)
    (void)runtime_dir;
    impl_->identity = std::move(identity);
#else
    (void)identity;
    impl_->runtime_dir = std::move(runtime_dir);
#endif
}

InstanceCoordinator::~InstanceCoordinator() = default;

InstanceRole InstanceCoordinator::acquire()
{
    if (!impl_->role)
    {
        impl_->role = impl_->acquire();
        UR_LOG_INFO("Instance role: {}", to_string(*impl_->role));
    }
    return *impl_->role;
}

std::unique_ptr<activation::IActivationSource>
InstanceCoordinator::forwarded_activations()
{
    if (impl_->role != InstanceRole::Primary)
    {
        return nullptr;
    }
    return impl_->take_channel();
}

bool InstanceCoordinator::forward(std::string const &uri)
{
    if (impl_->role != InstanceRole::Secondary)
    {
        return false;
    }
    std::string frame;
    try
    {
        frame = encode_frame(uri);
    }
    catch (std::invalid_argument const &ex)
    {
        UR_LOG_WARN("Not forwarding URI: {}", ex.what());
        return false;
    }
    if (!impl_->forward(frame))
    {
        UR_LOG_WARN("Primary instance did not take the forwarded URI within "
                    "{} ms; dropping it",
                    kForwardWindow.count());
        return false;
    }
    UR_LOG_INFO("Forwarded URI to the primary instance");
    return true;
}

} // namespace ur::instance
