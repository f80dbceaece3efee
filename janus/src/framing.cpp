#include "framing.hpp"

#include "error.hpp"

namespace janus::framing {

std::string encode_frame(const std::string& payload, size_t max_frame_size) {
    if (payload.size() > max_frame_size || payload.size() > UINT32_MAX) {
        throw JanusError(ErrorCode::resource_limit_exceeded,
                         "frame of " + std::to_string(payload.size()) + " bytes exceeds maximum " +
                             std::to_string(max_frame_size));
    }

    uint32_t length = static_cast<uint32_t>(payload.size());
    std::string frame;
    frame.reserve(kLengthPrefixSize + payload.size());
    frame.push_back(static_cast<char>((length >> 24) & 0xFF));
    frame.push_back(static_cast<char>((length >> 16) & 0xFF));
    frame.push_back(static_cast<char>((length >> 8) & 0xFF));
    frame.push_back(static_cast<char>(length & 0xFF));
    frame.append(payload);
    return frame;
}

std::optional<DecodedFrame> decode_frame(const std::string& buffer, size_t max_frame_size) {
    if (buffer.size() < kLengthPrefixSize) {
        return std::nullopt;
    }

    const auto* bytes = reinterpret_cast<const unsigned char*>(buffer.data());
    uint32_t length = (static_cast<uint32_t>(bytes[0]) << 24) |
                      (static_cast<uint32_t>(bytes[1]) << 16) |
                      (static_cast<uint32_t>(bytes[2]) << 8) |
                      static_cast<uint32_t>(bytes[3]);

    if (length == 0) {
        throw JanusError(ErrorCode::parse_error, "zero-length frame");
    }
    if (length > max_frame_size) {
        throw JanusError(ErrorCode::resource_limit_exceeded,
                         "frame length " + std::to_string(length) + " exceeds maximum " +
                             std::to_string(max_frame_size));
    }
    if (buffer.size() < kLengthPrefixSize + length) {
        return std::nullopt;
    }

    DecodedFrame frame;
    frame.payload = buffer.substr(kLengthPrefixSize, length);
    frame.consumed = kLengthPrefixSize + length;
    return frame;
}

std::optional<std::string> FrameReader::next() {
    auto frame = decode_frame(buffer_, max_frame_size_);
    if (!frame) {
        return std::nullopt;
    }
    buffer_.erase(0, frame->consumed);
    return std::move(frame->payload);
}

} // namespace janus::framing
