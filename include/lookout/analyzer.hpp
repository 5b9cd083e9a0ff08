#pragma once

#include "types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lookout {

struct ToolCall {
    ToolKind kind = ToolKind::Web;
    std::string query;
};

// Explicit intent found in the prompt. `fresh` is the recency pre-filter result.
struct Routing {
    std::optional<ToolCall> tool;
    bool fresh = false;
};

class QueryAnalyzer {
public:
    explicit QueryAnalyzer(double small_model_threshold = 4.0);

    Routing route(const Request& request) const;

    bool needs_fresh_info(std::string_view prompt) const;

    // History window for the call that turns the prompt into a single "KIND: query" line.
    std::vector<Turn> extraction_messages(const Request& request) const;
    // Falls back to a web search for the prompt itself when the reply is unusable.
    ToolCall parse_extraction(std::string_view text, const std::string& prompt) const;

    // First tool marker in the text, if any. Markers are upper case.
    std::optional<ToolCall> parse_marker(std::string_view text) const;

    bool detect_cutoff(std::string_view text) const;

    // Removes marker lines and [search_id: N] tags.
    std::string clean_response(std::string_view text) const;

    bool is_small_model(const std::string& model) const;
    // Parameter count in billions from names such as "llama3.1:8b" or "qwen2.5-0.5b".
    static std::optional<double> parameter_size(const std::string& model);

    // Newest "[search_id: N]" tag in the assistant turns of the history.
    static std::optional<std::uint64_t> latest_search_id(const std::vector<Turn>& history);

private:
    double m_small_model_threshold;
};

} // namespace lookout
