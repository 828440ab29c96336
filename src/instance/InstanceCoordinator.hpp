#pragma once

#include "activation/ActivationReceiver.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace ur::instance
{

enum class InstanceRole
{
    Primary,
    Secondary,
};

constexpr char const *to_string(InstanceRole role) noexcept
{
    return role == InstanceRole::Primary ? "primary" : "secondary";
}

class IInstanceCoordinator
{
  public:
    virtual ~IInstanceCoordinator() noexcept = default;

    // Called once per process. The result never changes afterwards.
    virtual InstanceRole acquire() = 0;

    // Primary only: the channel opened by acquire(), as an activation
    // source. nullptr when no channel could be opened.
    virtual std::unique_ptr<activation::IActivationSource>
    forwarded_activations() = 0;

    // Secondary only: hands uri to the primary. false when the primary could
    // not be reached within the forward window; the message is then lost.
    virtual bool forward(std::string const &uri) = 0;
};

// OS-enforced single-instance lock plus the forwarding channel.
//   POSIX:   flock() on <runtime_dir>/instance.lock,
//            Unix stream socket <runtime_dir>/instance.sock
//   Windows: named mutex Local\<identity>.Instance,
//            mailslot \\.\mailslot\<identity>\activation
// The lock is never released explicitly; process exit drops it, including
// after a crash.
class InstanceCoordinator final : public IInstanceCoordinator
{
  public:
    static constexpr std::chrono::milliseconds kForwardWindow{2000};
    static constexpr char kDefaultIdentity[] = "UriRelay";

    explicit InstanceCoordinator(std::filesystem::path runtime_dir,
                                 std::string identity = kDefaultIdentity);
    ~InstanceCoordinator() override;

    InstanceCoordinator(InstanceCoordinator const &) = delete;
    InstanceCoordinator &operator=(InstanceCoordinator const &) = delete;

    InstanceRole acquire() override;
    std::unique_ptr<activation::IActivationSource>
    forwarded_activations() override;
    bool forward(std::string const &uri) override;

  private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ur::instance
