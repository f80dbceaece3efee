#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace janus::framing {

constexpr size_t kLengthPrefixSize = 4;
constexpr size_t kDefaultMaxFrameSize = 10 * 1024 * 1024;

/// 4-byte big-endian length followed by the payload.
/// Throws JanusError (resource_limit_exceeded) when payload exceeds max_frame_size.
std::string encode_frame(const std::string& payload, size_t max_frame_size = kDefaultMaxFrameSize);

struct DecodedFrame {
    std::string payload;
    size_t consumed = 0;
};

/// Returns std::nullopt while the buffer holds less than one full frame.
/// Throws JanusError on a zero-length or oversized frame.
std::optional<DecodedFrame> decode_frame(const std::string& buffer, size_t max_frame_size = kDefaultMaxFrameSize);

/// Accumulates stream bytes and yields complete frames in order.
class FrameReader {
public:
    explicit FrameReader(size_t max_frame_size = kDefaultMaxFrameSize) : max_frame_size_(max_frame_size) {}

    void append(const char* data, size_t size) { buffer_.append(data, size); }
    std::optional<std::string> next();
    size_t buffered() const { return buffer_.size(); }

private:
    size_t max_frame_size_;
    std::string buffer_;
};

} // namespace janus::framing
