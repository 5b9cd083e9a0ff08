#pragma once

#include "json.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lookout {

enum class ToolKind { Web, Reddit, Wikipedia, Weather, Recall };

std::string_view tool_name(ToolKind kind);
// Accepts the canonical names plus the marker aliases ("google", "search", "wiki").
std::optional<ToolKind> parse_tool(std::string_view name);

struct Turn {
    std::string role;
    std::string content;
};

struct Request {
    std::string prompt;
    std::vector<Turn> history;
    std::string user_memory;
    std::string model;
    std::string system_prompt;

    // Throws std::runtime_error when "prompt" is missing or the history is malformed.
    static Request from_json(const Json& params, const std::string& default_model);
};

// Computed once per processing cycle and only read afterwards.
class SearchDecision {
public:
    enum class Kind { None, CacheHit, Tool };

    static SearchDecision none() { return SearchDecision(Kind::None, ToolKind::Web, std::string()); }
    static SearchDecision cache_hit(ToolKind tool, std::string query) {
        return SearchDecision(Kind::CacheHit, tool, std::move(query));
    }
    static SearchDecision use_tool(ToolKind tool, std::string query) {
        return SearchDecision(Kind::Tool, tool, std::move(query));
    }

    Kind kind() const noexcept { return m_kind; }
    ToolKind tool() const noexcept { return m_tool; }
    const std::string& query() const noexcept { return m_query; }
    bool searches() const noexcept { return m_kind != Kind::None; }

    // "none", "cache-hit:web", "tool:weather"
    std::string describe() const;

private:
    SearchDecision(Kind kind, ToolKind tool, std::string query)
        : m_kind(kind), m_tool(tool), m_query(std::move(query)) {}

    Kind m_kind;
    ToolKind m_tool;
    std::string m_query;
};

struct TokenUsage {
    std::size_t used = 0;
    std::size_t limit = 0;
    std::size_t model_max = 0;
    double usage_percent = 0.0;

    Json to_json() const;
};

struct Response {
    std::string text;
    std::string model;
    bool search_performed = false;
    std::string search_type;
    std::string search_query;
    std::string source;
    std::string source_url;
    std::optional<std::uint64_t> search_id;
    bool cache_hit = false;
    int cutoff_reroutes = 0;
    bool retrieval_suppressed = false;
    bool no_data = false;
    std::size_t context_messages_count = 0;
    TokenUsage token_usage;

    // search_performed, search_type, search_query and cache_hit all follow the cycle's one decision.
    void record(const SearchDecision& decision);

    Json to_json() const;
};

} // namespace lookout
