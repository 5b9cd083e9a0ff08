#include "../include/lookout/sanitizer.hpp"

#include "../include/lookout/log.hpp"

#include <algorithm>

namespace lookout {

namespace {

constexpr std::string_view kTagMarker = "[search_id:";

constexpr std::string_view kMarkers[] = {
    "SEARCH:", "GOOGLE:", "WEB:", "WEATHER:", "REDDIT:", "RECALL:", "WIKIPEDIA:", "WIKI:", kTagMarker,
};

enum class MarkerMatch { None, Partial, Full };

MarkerMatch match_marker(std::string_view rest, std::string_view& matched) {
    MarkerMatch result = MarkerMatch::None;
    for (const auto marker : kMarkers) {
        if (rest.size() >= marker.size()) {
            if (rest.compare(0, marker.size(), marker) == 0) {
                matched = marker;
                return MarkerMatch::Full;
            }
        } else if (marker.compare(0, rest.size(), rest) == 0) {
            result = MarkerMatch::Partial;
        }
    }
    return result;
}

// A tool marker body ends at a newline or a sentence break.
std::size_t body_end(const std::string& body) {
    const std::size_t newline = body.find('\n');
    const std::size_t sentence = body.find(". ");
    return std::min(newline, sentence);
}

} // namespace

std::string_view sanitizer_state_name(SanitizerState state) {
    switch (state) {
    case SanitizerState::Normal: return "normal";
    case SanitizerState::BufferingMarker: return "buffering-marker";
    case SanitizerState::EmittingToolCall: return "emitting-tool-call";
    case SanitizerState::CutoffDetected: return "cutoff-detected";
    case SanitizerState::Terminal: return "terminal";
    }
    return "normal";
}

StreamSanitizer::StreamSanitizer(const QueryAnalyzer& analyzer, SanitizerOptions options)
    : m_analyzer(analyzer), m_options(options), m_holding(options.hold_first_line) {}

SanitizerOutput StreamSanitizer::feed(std::string_view token) {
    SanitizerOutput out;
    if (m_state != SanitizerState::Normal && m_state != SanitizerState::BufferingMarker) {
        return out;
    }
    m_buffer.append(token);
    scan(out);
    return out;
}

SanitizerOutput StreamSanitizer::finish() {
    SanitizerOutput out;
    if (m_state == SanitizerState::Terminal) {
        return out;
    }
    if (m_state == SanitizerState::BufferingMarker) {
        m_body += m_buffer;
        m_buffer.clear();
        if (m_marker == kTagMarker) {
            // Truncated tag at the end of the stream.
            m_marker.clear();
            m_body.clear();
            m_state = SanitizerState::Normal;
        } else {
            complete_marker(out, true);
        }
    }
    if (m_state == SanitizerState::Normal && !m_buffer.empty()) {
        const std::string partial = std::move(m_buffer);
        m_buffer.clear();
        release(partial, out);
    }
    if (m_state == SanitizerState::Normal && m_holding) {
        if (m_options.cutoff == CutoffMode::Abort && m_analyzer.detect_cutoff(m_hold)) {
            m_cutoff_seen = true;
            m_hold.clear();
            m_holding = false;
            out.signal = SanitizerSignal{SanitizerSignal::Kind::Cutoff, std::nullopt};
        } else {
            release_hold(out);
        }
    }
    if (m_options.cutoff == CutoffMode::Observe && m_analyzer.detect_cutoff(m_emitted)) {
        m_cutoff_seen = true;
    }
    m_state = SanitizerState::Terminal;
    return out;
}

void StreamSanitizer::scan(SanitizerOutput& out) {
    while (!m_buffer.empty()) {
        if (m_state == SanitizerState::BufferingMarker) {
            m_body += m_buffer;
            m_buffer.clear();
            const bool tag = m_marker == kTagMarker;
            const std::size_t end = tag ? m_body.find(']') : body_end(m_body);
            if (end == std::string::npos) {
                if (m_body.size() > m_options.max_marker_body) {
                    complete_marker(out, false);
                }
                return;
            }
            m_buffer = m_body.substr(end + 1);
            m_body.erase(end);
            complete_marker(out, true);
            continue;
        }
        if (m_state != SanitizerState::Normal) {
            return;
        }

        const std::string_view view(m_buffer);
        std::size_t i = 0;
        MarkerMatch match = MarkerMatch::None;
        std::string_view marker;
        for (; i < view.size(); ++i) {
            match = match_marker(view.substr(i), marker);
            if (match != MarkerMatch::None) {
                break;
            }
        }

        if (match == MarkerMatch::None) {
            const std::string text = std::move(m_buffer);
            m_buffer.clear();
            release(text, out);
            return;
        }

        const std::string before = m_buffer.substr(0, i);
        if (match == MarkerMatch::Partial) {
            m_buffer.erase(0, i);
            release(before, out);
            return;
        }

        m_buffer.erase(0, i + marker.size());
        release(before, out);
        if (m_state != SanitizerState::Normal) {
            return;
        }
        m_marker = std::string(marker);
        m_body.clear();
        m_state = SanitizerState::BufferingMarker;
    }
}

void StreamSanitizer::complete_marker(SanitizerOutput& out, bool terminated) {
    std::string marker = std::move(m_marker);
    std::string body = std::move(m_body);
    m_marker.clear();
    m_body.clear();
    m_state = SanitizerState::Normal;

    if (marker == kTagMarker) {
        if (!terminated) {
            release(marker + body, out);
        }
        return;
    }

    if (!m_options.allow_tool_calls) {
        log::debug("Sanitizer", "stripped marker " + marker + body);
        return;
    }

    auto call = m_analyzer.parse_marker(marker + body);
    if (!call) {
        log::debug("Sanitizer", "ignored empty marker " + marker);
        return;
    }
    m_hold.clear();
    m_holding = false;
    m_buffer.clear();
    m_state = SanitizerState::EmittingToolCall;
    out.signal = SanitizerSignal{SanitizerSignal::Kind::ToolCall, std::move(call)};
}

void StreamSanitizer::release(std::string_view text, SanitizerOutput& out) {
    if (text.empty()) {
        return;
    }
    if (!m_holding) {
        emit(text, out);
        return;
    }
    m_hold.append(text);
    if (m_options.cutoff == CutoffMode::Abort && m_analyzer.detect_cutoff(m_hold)) {
        log::info("Sanitizer", "cutoff phrase in first line");
        m_cutoff_seen = true;
        m_hold.clear();
        m_holding = false;
        m_buffer.clear();
        m_marker.clear();
        m_body.clear();
        m_state = SanitizerState::CutoffDetected;
        out.signal = SanitizerSignal{SanitizerSignal::Kind::Cutoff, std::nullopt};
        return;
    }
    const std::size_t newline = m_hold.find('\n');
    const std::size_t first_visible = m_hold.find_first_not_of(" \t\r\n");
    const bool line_done = newline != std::string::npos && first_visible < newline;
    if (line_done || m_hold.size() >= m_options.max_hold_chars) {
        release_hold(out);
    }
}

void StreamSanitizer::release_hold(SanitizerOutput& out) {
    m_holding = false;
    std::string held = std::move(m_hold);
    m_hold.clear();
    emit(held, out);
}

void StreamSanitizer::emit(std::string_view text, SanitizerOutput& out) {
    if (text.empty()) {
        return;
    }
    out.text.append(text);
    m_emitted.append(text);
}

} // namespace lookout
