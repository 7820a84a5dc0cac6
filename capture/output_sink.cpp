#include "capture/output_sink.h"
#include <cerrno>

namespace Trace::Capture {

bool ConsoleSink::write(Channel channel, const char* data, size_t len) noexcept {
    int fd = channel == Channel::PRIMARY ? primary_fd_ : diagnostic_fd_;
    size_t written = 0;
    while (written < len) {
        ssize_t n = ::write(fd, data + written, len - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

} // namespace Trace::Capture
