#pragma once
#define PCRE2_CODE_UNIT_WIDTH 8
#include <pcre2.h>
#include <string>
#include <vector>
#include <utility>
#include <cstdint>
#include <stdexcept>

namespace hilite {
namespace pcre2_regex {

// Exception for patterns that fail to compile
class pattern_error : public std::runtime_error {
public:
    pattern_error(const std::string& pattern, const std::string& message, size_t offset);

    const std::string& pattern() const { return pattern_; }
    const std::string& message() const { return message_; }
    size_t offset() const { return offset_; }

private:
    std::string pattern_;
    std::string message_;
    size_t offset_;
};

// Pattern compile options
enum PatternOptions : uint32_t {
    IGNORE_CASE = 1 << 0,
    LITERAL = 1 << 1,
};

// RAII wrapper for pcre2_code; throws pattern_error on failure
class Pattern {
public:
    explicit Pattern(const std::string& pattern, uint32_t options = 0);
    ~Pattern();

    Pattern(const Pattern&) = delete;
    Pattern& operator=(const Pattern&) = delete;

    const std::string& str() const { return pattern_; }
    uint32_t capture_count() const { return capture_count_; }
    pcre2_code* code() const { return code_; }

private:
    std::string pattern_;
    uint32_t capture_count_;
    pcre2_code* code_;
};

// A single match result
struct Match {
    size_t start;  // byte offset in subject
    size_t end;    // byte offset past match

    // (start, end) for each group; [0] = full match, unset groups are (npos, npos)
    std::vector<std::pair<size_t, size_t>> group_offsets;

    bool group_matched(size_t index) const {
        return index < group_offsets.size() && group_offsets[index].first != std::string::npos;
    }
};

// Find all non-overlapping matches of pattern in subject, left to right.
// Never throws: a match error ends the iteration.
std::vector<Match> finditer(const Pattern& pattern, const std::string& subject);

} // namespace pcre2_regex
} // namespace hilite
