#pragma once

#include "activation/ActivationReceiver.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace ur::activation
{

// "Open this URI" notifications delivered by the OS to a running process.
// macOS sends a kAEGetURL Apple event; Linux and Windows hand the URI over on
// the command line instead, so there the source only fires through post().
class OsOpenEventSource final : public IActivationSource
{
  public:
    OsOpenEventSource() = default;
    ~OsOpenEventSource() override;

    OsOpenEventSource(OsOpenEventSource const &) = delete;
    OsOpenEventSource &operator=(OsOpenEventSource const &) = delete;

    char const *name() const noexcept override { return "OS open-URI event"; }
    void start(ActivationLatch &latch) override;
    void stop() noexcept override;
    bool needs_pump() const noexcept override;
    void pump(std::chrono::milliseconds slice) override;

    // Called from the platform event handler. URIs posted before start()
    // are held and offered when the source starts.
    void post(std::string uri);

  private:
    std::mutex mutex_;
    ActivationLatch *latch_ = nullptr;
    std::vector<std::string> pending_;
    bool handler_installed_ = false;
    bool stopped_ = false;
};

} // namespace ur::activation
