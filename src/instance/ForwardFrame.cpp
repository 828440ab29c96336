#include "instance/ForwardFrame.hpp"

#include <cstring>
#include <format>
#include <stdexcept>

namespace ur::instance
{

std::string encode_frame(std::string_view uri)
{
    if (uri.empty())
    {
        throw std::invalid_argument("cannot forward an empty URI");
    }
    if (uri.size() > kMaxFramePayload)
    {
        throw std::invalid_argument(
            std::format("URI of {} bytes exceeds the {} byte forward limit",
                        uri.size(), kMaxFramePayload));
    }
    auto length = static_cast<std::uint32_t>(uri.size());
    std::string frame;
    frame.reserve(kFrameHeaderSize + uri.size());
    frame.append(kFrameMagic, sizeof(kFrameMagic));
    for (int shift = 0; shift < 32; shift += 8)
    {
        frame.push_back(static_cast<char>((length >> shift) & 0xFF));
    }
    frame.append(uri);
    return frame;
}

DecodedFrame decode_frame(std::string_view bytes)
{
    DecodedFrame result;
    if (bytes.size() < kFrameHeaderSize)
    {
        result.error = std::format("short frame ({} bytes)", bytes.size());
        return result;
    }
    if (std::memcmp(bytes.data(), kFrameMagic, sizeof(kFrameMagic)) != 0)
    {
        result.error = "bad frame magic";
        return result;
    }
    std::uint32_t length = 0;
    for (int index = 0; index < 4; ++index)
    {
        auto byte = static_cast<unsigned char>(bytes[4 + index]);
        length |= static_cast<std::uint32_t>(byte) << (8 * index);
    }
    if (length == 0 || length > kMaxFramePayload)
    {
        result.error = std::format("invalid payload length {}", length);
        return result;
    }
    auto payload = bytes.substr(kFrameHeaderSize);
    if (payload.size() < length)
    {
        result.error = std::format("truncated payload ({} of {} bytes)",
                                   payload.size(), length);
        return result;
    }
    if (payload.size() > length)
    {
        result.error = std::format("{} trailing bytes after payload",
                                   payload.size() - length);
        return result;
    }
    result.uri = std::string(payload);
    return result;
}

} // namespace ur::instance
