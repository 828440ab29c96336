#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ur::instance
{

// Wire format of a URI forwarded from a secondary launch to the primary:
//
//   "URLY" | u32 little-endian payload length | payload (UTF-8 URI)
//
// One frame per connection / mailslot message. The payload is delivered
// byte for byte; nothing is trimmed.
inline constexpr char kFrameMagic[4] = {'U', 'R', 'L', 'Y'};
inline constexpr std::size_t kFrameHeaderSize = 8;
inline constexpr std::size_t kMaxFramePayload = 64 * 1024;
inline constexpr std::size_t kMaxFrameSize = kFrameHeaderSize + kMaxFramePayload;

// Throws std::invalid_argument for an empty or oversized uri.
std::string encode_frame(std::string_view uri);

struct DecodedFrame
{
    std::optional<std::string> uri;
    std::string error;
};

DecodedFrame decode_frame(std::string_view bytes);

} // namespace ur::instance
