#define PCRE2_CODE_UNIT_WIDTH 8
#include "pcre2_regex.hpp"
#include <memory>

namespace hilite {
namespace pcre2_regex {

// Helper: get PCRE2 error message
static std::string pcre2_error_message(int errorcode) {
    PCRE2_UCHAR buffer[256];
    pcre2_get_error_message(errorcode, buffer, sizeof(buffer));
    return reinterpret_cast<const char*>(buffer);
}

pattern_error::pattern_error(const std::string& pattern, const std::string& message, size_t offset)
    : std::runtime_error("invalid pattern \"" + pattern + "\": " + message +
                         " at offset " + std::to_string(offset)),
      pattern_(pattern), message_(message), offset_(offset) {}

static uint32_t compile_flags(uint32_t options) {
    uint32_t flags = PCRE2_UTF | PCRE2_MATCH_INVALID_UTF | PCRE2_MULTILINE;
    if (options & IGNORE_CASE) flags |= PCRE2_CASELESS;
    if (options & LITERAL) flags |= PCRE2_LITERAL;
    return flags;
}

Pattern::Pattern(const std::string& pattern, uint32_t options)
    : pattern_(pattern), capture_count_(0), code_(nullptr) {
    int errorcode;
    PCRE2_SIZE erroroffset;
    code_ = pcre2_compile(
        reinterpret_cast<PCRE2_SPTR>(pattern.c_str()),
        pattern.size(),
        compile_flags(options),
        &errorcode, &erroroffset, nullptr);
    if (code_ == nullptr) {
        throw pattern_error(pattern, pcre2_error_message(errorcode), erroroffset);
    }
    pcre2_pattern_info(code_, PCRE2_INFO_CAPTURECOUNT, &capture_count_);
}

Pattern::~Pattern() { if (code_) pcre2_code_free(code_); }

static Match build_match(pcre2_match_data* match_data) {
    Match m;
    PCRE2_SIZE* ovector = pcre2_get_ovector_pointer(match_data);
    uint32_t count = pcre2_get_ovector_count(match_data);

    m.start = ovector[0];
    m.end = ovector[1];

    for (uint32_t i = 0; i < count; i++) {
        if (ovector[2 * i] == PCRE2_UNSET) {
            m.group_offsets.push_back({std::string::npos, std::string::npos});
        } else {
            m.group_offsets.push_back({ovector[2 * i], ovector[2 * i + 1]});
        }
    }
    return m;
}

// Length of the UTF-8 sequence starting at subject[pos] (1 for invalid lead bytes)
static size_t utf8_char_length(const std::string& subject, size_t pos) {
    unsigned char c = static_cast<unsigned char>(subject[pos]);
    size_t len = 1;
    if (c >= 0xF0 && c <= 0xF4) len = 4;
    else if (c >= 0xE0) len = 3;
    else if (c >= 0xC2 && c <= 0xDF) len = 2;
    if (c > 0xF4) len = 1;
    for (size_t i = 1; i < len; i++) {
        if (pos + i >= subject.size() ||
            (static_cast<unsigned char>(subject[pos + i]) & 0xC0) != 0x80) {
            return 1;
        }
    }
    return len;
}

std::vector<Match> finditer(const Pattern& pattern, const std::string& subject) {
    std::unique_ptr<pcre2_match_data, decltype(&pcre2_match_data_free)> match_data(
        pcre2_match_data_create_from_pattern(pattern.code(), nullptr),
        &pcre2_match_data_free);

    std::vector<Match> results;
    if (!match_data) return results;

    size_t offset = 0;
    const size_t end_offset = subject.size();

    while (offset <= end_offset) {
        int rc = pcre2_match(pattern.code(),
                             reinterpret_cast<PCRE2_SPTR>(subject.c_str()),
                             end_offset, offset, 0, match_data.get(), nullptr);
        if (rc < 0) break;

        Match m = build_match(match_data.get());
        results.push_back(m);

        // Advance past match (handle zero-length matches)
        if (m.end == m.start) {
            if (m.end >= end_offset) break;
            offset = m.end + utf8_char_length(subject, m.end);
        } else {
            offset = m.end;
        }
    }

    return results;
}

} // namespace pcre2_regex
} // namespace hilite
