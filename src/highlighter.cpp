#include "highlighter.hpp"
#include <algorithm>
#include <stdexcept>
#include <tuple>
#include <utility>
#include <vector>

namespace hilite {

namespace {

// A code to insert at a text offset
struct MatchEvent {
    enum Kind { RESET = 0, ACTIVATE = 1 };

    size_t offset;
    Kind kind;
    size_t order; // registration order of the pattern that produced it
    const std::string* code; // points into the color_code cache
};

// Resets sort before activations at the same offset, so a span starting
// where another ends is not cleared immediately.
bool event_less(const MatchEvent& lhs, const MatchEvent& rhs) {
    return std::tie(lhs.offset, lhs.kind, lhs.order) < std::tie(rhs.offset, rhs.kind, rhs.order);
}

} // namespace

Highlighter::Highlighter(const Color& default_color) : default_color_(default_color) {}

void Highlighter::add_pattern(const std::string& pattern, const std::optional<Color>& color,
                              uint32_t options) {
    add_pattern(std::make_shared<const pcre2_regex::Pattern>(pattern, options), color);
}

void Highlighter::add_pattern(std::shared_ptr<const pcre2_regex::Pattern> pattern,
                              const std::optional<Color>& color) {
    if (!pattern) throw std::invalid_argument("null pattern");
    Color bound = color.value_or(default_color_);
    registrations_.push_back({std::move(pattern), bound, &color_code::get(bound), registrations_.size()});
}

std::string Highlighter::highlight(const std::string& text) const {
    std::vector<MatchEvent> events;
    const std::string* reset = &color_code::reset();

    auto add_span = [&](size_t start, size_t end, const Registration& reg) {
        // Empty spans color nothing
        if (start >= end) return;
        events.push_back({start, MatchEvent::ACTIVATE, reg.order, reg.code});
        events.push_back({end, MatchEvent::RESET, reg.order, reset});
    };

    for (const auto& reg : registrations_) {
        uint32_t groups = reg.pattern->capture_count();
        for (const auto& m : pcre2_regex::finditer(*reg.pattern, text)) {
            if (groups == 0) {
                add_span(m.start, m.end, reg);
                continue;
            }
            // Only the capture groups are colored, not the whole match
            for (uint32_t g = 1; g <= groups; g++) {
                if (!m.group_matched(g)) continue;
                add_span(m.group_offsets[g].first, m.group_offsets[g].second, reg);
            }
        }
    }

    if (events.empty()) return text;

    std::sort(events.begin(), events.end(), event_less);

    std::string result;
    result.reserve(text.size() + events.size() * 16);
    // Codes already inserted at the current offset. Equal codes share one
    // cache entry, so comparing pointers compares codes.
    std::vector<const std::string*> emitted;
    size_t last = 0;

    for (const auto& ev : events) {
        if (ev.offset != last) emitted.clear();
        if (std::find(emitted.begin(), emitted.end(), ev.code) != emitted.end()) continue;
        emitted.push_back(ev.code);
        result.append(text, last, ev.offset - last);
        result += *ev.code;
        last = ev.offset;
    }
    result.append(text, last, std::string::npos);

    return result;
}

} // namespace hilite
