#pragma once

#include "analyzer.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace lookout {

enum class SanitizerState { Normal, BufferingMarker, EmittingToolCall, CutoffDetected, Terminal };

std::string_view sanitizer_state_name(SanitizerState state);

enum class CutoffMode { Abort, Observe, Off };

struct SanitizerOptions {
    // Withhold the first visible line until it is known not to be a cutoff phrase.
    bool hold_first_line = true;
    CutoffMode cutoff = CutoffMode::Abort;
    // When false, tool markers are stripped from the output instead of signalled.
    bool allow_tool_calls = true;
    std::size_t max_hold_chars = 400;
    std::size_t max_marker_body = 200;
};

struct SanitizerSignal {
    enum class Kind { ToolCall, Cutoff };

    Kind kind = Kind::ToolCall;
    std::optional<ToolCall> tool;
};

struct SanitizerOutput {
    std::string text;
    std::optional<SanitizerSignal> signal;
};

// Consumes one generation stream token by token. Text is passed through in order, minus tool
// markers and [search_id: N] tags; a signal ends the stream for the caller.
class StreamSanitizer {
public:
    StreamSanitizer(const QueryAnalyzer& analyzer, SanitizerOptions options = {});

    SanitizerOutput feed(std::string_view token);
    // Flushes withheld text. The sanitizer is terminal afterwards.
    SanitizerOutput finish();

    SanitizerState state() const noexcept { return m_state; }
    bool cutoff_seen() const noexcept { return m_cutoff_seen; }
    // Everything released as visible text so far.
    const std::string& emitted() const noexcept { return m_emitted; }

private:
    void scan(SanitizerOutput& out);
    void complete_marker(SanitizerOutput& out, bool at_end);
    void release(std::string_view text, SanitizerOutput& out);
    void release_hold(SanitizerOutput& out);
    void emit(std::string_view text, SanitizerOutput& out);

    const QueryAnalyzer& m_analyzer;
    SanitizerOptions m_options;
    SanitizerState m_state = SanitizerState::Normal;
    std::string m_buffer;
    std::string m_marker;
    std::string m_body;
    std::string m_hold;
    bool m_holding;
    bool m_cutoff_seen = false;
    std::string m_emitted;
};

} // namespace lookout
