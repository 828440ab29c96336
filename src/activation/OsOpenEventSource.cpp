#include "activation/OsOpenEventSource.hpp"

#include "utils/Log.hpp"

#include <utility>

#if defined(__APPLE__)
#include <CoreFoundation/CoreFoundation.h>
#include <CoreServices/CoreServices.h>
#endif

namespace ur::activation
{

#if defined(__APPLE__)
namespace
{

OSErr handle_get_url(AppleEvent const *event, AppleEvent * /*reply*/,
                     SRefCon refcon)
{
    auto *self = static_cast<OsOpenEventSource *>(refcon);
    AEDesc desc{};
    if (AEGetParamDesc(event, keyDirectObject, typeUTF8Text, &desc) != noErr)
    {
        return errAEDescNotFound;
    }
    auto size = AEGetDescDataSize(&desc);
    std::string uri(static_cast<std::size_t>(size), '\0');
    OSErr err = AEGetDescData(&desc, uri.data(), size);
    AEDisposeDesc(&desc);
    if (err != noErr)
    {
        return err;
    }
    self->post(std::move(uri));
    return noErr;
}

AEEventHandlerUPP get_url_handler()
{
    static AEEventHandlerUPP upp = NewAEEventHandlerUPP(handle_get_url);
    return upp;
}

} // namespace
#endif

OsOpenEventSource::~OsOpenEventSource()
{
    stop();
}

void OsOpenEventSource::start(ActivationLatch &latch)
{
    std::vector<std::string> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        latch_ = &latch;
        pending.swap(pending_);
#if defined(__APPLE__)
        if (!handler_installed_)
        {
            auto status = AEInstallEventHandler(
                kInternetEventClass, kAEGetURL, get_url_handler(),
                static_cast<SRefCon>(this), false);
            handler_installed_ = status == noErr;
            if (!handler_installed_)
            {
                UR_LOG_ERROR("AEInstallEventHandler(kAEGetURL) failed: {}",
                             static_cast<int>(status));
            }
        }
#endif
    }
    for (auto &uri : pending)
    {
        latch.offer(ActivationEvent{std::move(uri),
                                    ActivationSource::OSOpenEvent});
    }
}

void OsOpenEventSource::stop() noexcept
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (latch_ != nullptr)
    {
        stopped_ = true;
    }
    latch_ = nullptr;
#if defined(__APPLE__)
    if (handler_installed_)
    {
        AERemoveEventHandler(kInternetEventClass, kAEGetURL, get_url_handler(),
                             false);
        handler_installed_ = false;
    }
#endif
}

bool OsOpenEventSource::needs_pump() const noexcept
{
#if defined(__APPLE__)
    return true;
#else
    return false;
#endif
}

void OsOpenEventSource::pump(std::chrono::milliseconds slice)
{
#if defined(__APPLE__)
    // Apple events are dispatched by the main thread's run loop.
    CFRunLoopRunInMode(kCFRunLoopDefaultMode,
                       std::chrono::duration<double>(slice).count(), true);
#else
    (void)slice;
#endif
}

void OsOpenEventSource::post(std::string uri)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_)
    {
        UR_LOG_INFO("Dropping OS open-URI event received after dispatch: {}",
                    uri);
        return;
    }
    if (latch_ == nullptr)
    {
        pending_.push_back(std::move(uri));
        return;
    }
    latch_->offer(
        ActivationEvent{std::move(uri), ActivationSource::OSOpenEvent});
}

} // namespace ur::activation
