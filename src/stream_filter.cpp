#include "stream_filter.hpp"
#include "globalvar.hpp"
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <vector>

namespace hilite {

StreamFilter::StreamFilter(const Highlighter& highlighter, int in_fd, int out_fd)
    : highlighter_(highlighter), in_fd_(in_fd), out_fd_(out_fd) {}

std::string StreamFilter::process(const std::string& chunk) const {
    std::string result;
    size_t start = 0;
    while (start < chunk.size()) {
        size_t nl = chunk.find_first_of("\r\n", start);
        if (nl == std::string::npos) {
            result += highlighter_.highlight(chunk.substr(start));
            break;
        }
        // "\r\n" is one terminator
        size_t term_end = nl + 1;
        if (chunk[nl] == '\r' && term_end < chunk.size() && chunk[term_end] == '\n') term_end++;

        result += highlighter_.highlight(chunk.substr(start, nl - start));
        result.append(chunk, nl, term_end - nl);
        start = term_end;
    }
    return result;
}

void StreamFilter::write_all(const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = write(out_fd_, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("write failed: " + std::string(strerror(errno)));
        }
        written += static_cast<size_t>(n);
    }
}

void StreamFilter::run() {
    if (in_fd_ < 0 || out_fd_ < 0) {
        throw std::runtime_error("invalid file descriptor");
    }
    std::string output_buffer;
    std::vector<char> buf(globalvar::read_buffer_size);

    while (true) {
        struct pollfd fds[1];
        fds[0].fd = in_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;

        int poll_timeout = output_buffer.empty()
            ? -1 : static_cast<int>(globalvar::flush_timeout.count());
        int ret = poll(fds, 1, poll_timeout);

        if (ret == -1) {
            if (errno == EINTR) continue;
            throw std::runtime_error("poll failed: " + std::string(strerror(errno)));
        }

        if (ret == 0) {
            // Timeout: flush incomplete line
            write_all(process(output_buffer));
            output_buffer.clear();
            continue;
        }

        if (fds[0].revents & POLLNVAL) {
            throw std::runtime_error("invalid input file descriptor");
        }

        ssize_t n = read(in_fd_, buf.data(), buf.size());
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            throw std::runtime_error("read failed: " + std::string(strerror(errno)));
        }
        if (n == 0) break; // EOF

        output_buffer.append(buf.data(), static_cast<size_t>(n));

        // Find the last newline in the buffer
        size_t last_nl = std::string::npos;
        for (size_t i = output_buffer.size(); i > 0; i--) {
            char c = output_buffer[i - 1];
            if (c == '\n' || c == '\r') {
                last_nl = i;
                break;
            }
        }

        if (last_nl != std::string::npos) {
            std::string complete = output_buffer.substr(0, last_nl);
            output_buffer = output_buffer.substr(last_nl);
            write_all(process(complete));
        }
    }

    // Flush remaining buffer
    if (!output_buffer.empty()) {
        write_all(process(output_buffer));
    }
}

} // namespace hilite
