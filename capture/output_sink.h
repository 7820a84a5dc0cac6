#pragma once

#include <cstddef>
#include <cstdint>
#include <unistd.h>

namespace Trace::Capture {

enum class StreamId : uint8_t {
    STDOUT = 0,
    STDERR = 1
};

enum class Channel : uint8_t {
    PRIMARY = 0,     // user-facing stdout
    DIAGNOSTIC = 1   // stderr
};

/// Where a chunk from the child is mirrored. Quiet mode keeps the primary
/// channel free for a structured transport, so both streams go to DIAGNOSTIC.
constexpr Channel selectChannel(StreamId stream, bool quiet) noexcept {
    if (quiet) {
        return Channel::DIAGNOSTIC;
    }
    return stream == StreamId::STDOUT ? Channel::PRIMARY : Channel::DIAGNOSTIC;
}

/// Live mirror for captured output
class OutputSink {
public:
    virtual ~OutputSink() = default;

    /// False when the chunk could not be delivered in full
    virtual bool write(Channel channel, const char* data, size_t len) noexcept = 0;
};

/// Writes straight to two file descriptors, no stdio buffering
class ConsoleSink final : public OutputSink {
public:
    explicit ConsoleSink(int primary_fd = STDOUT_FILENO, int diagnostic_fd = STDERR_FILENO) noexcept
        : primary_fd_(primary_fd), diagnostic_fd_(diagnostic_fd) {}

    bool write(Channel channel, const char* data, size_t len) noexcept override;

private:
    int primary_fd_;
    int diagnostic_fd_;
};

} // namespace Trace::Capture
