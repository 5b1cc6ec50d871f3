#pragma once
#include "highlighter.hpp"
#include <string>

namespace hilite {

// Copies in_fd to out_fd, highlighting each line on the way.
// Complete lines are written as soon as they arrive; a partial line is
// flushed once the input has been idle for globalvar::flush_timeout.
class StreamFilter {
public:
    StreamFilter(const Highlighter& highlighter, int in_fd, int out_fd);

    // Main loop: runs until EOF on in_fd. Throws std::runtime_error on I/O errors.
    void run();

private:
    // Highlight every line of chunk separately, keeping line terminators
    std::string process(const std::string& chunk) const;
    void write_all(const std::string& data);

    const Highlighter& highlighter_;
    int in_fd_;
    int out_fd_;
};

} // namespace hilite
