#pragma once

#include <string>

namespace ur::activation
{

enum class ActivationSource
{
    InitialArgs,
    ForwardedFromSecondary,
    OSOpenEvent,
};

constexpr char const *to_string(ActivationSource source) noexcept
{
    switch (source)
    {
    case ActivationSource::InitialArgs:
        return "initial-args";
    case ActivationSource::ForwardedFromSecondary:
        return "forwarded";
    case ActivationSource::OSOpenEvent:
        return "os-open-event";
    }
    return "unknown";
}

struct ActivationEvent
{
    std::string raw_uri;
    ActivationSource source = ActivationSource::InitialArgs;
};

} // namespace ur::activation
