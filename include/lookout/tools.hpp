#pragma once

#include "cancel.hpp"
#include "config.hpp"
#include "search.hpp"
#include "token_budget.hpp"
#include "types.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace lookout {

struct ToolContext {
    SearchProvider& search;
    const Settings& settings;
    const CancellationToken& cancel;
};

// Parallel fallback chains plus what the search itself returned.
struct CandidatePlan {
    std::vector<std::vector<Candidate>> chains;
    std::vector<Candidate> listing;
    std::string quick_answer;
};

using CandidateFn = CandidatePlan (*)(const ToolContext& ctx, const std::string& query);
using ExtractFn = std::string (*)(std::string_view body);

struct ToolSpec {
    ToolKind kind;
    SizeClass size_class;
    CandidateFn candidates;
    ExtractFn extract;
    bool reader_fallback;
};

// One row per ToolKind. Recall has no fetch strategy; it is served from the cache.
const ToolSpec& tool_spec(ToolKind kind);

std::chrono::seconds ttl_for(ToolKind kind, const CacheSettings& settings);

struct Section {
    std::string url;
    std::string title;
    std::string content;
};

// Joins extracted sections, the quick answer and the search listing into one prompt-ready block.
// Returns an empty string when nothing usable was retrieved.
std::string assemble_content(ToolKind kind,
                             const std::vector<Section>& sections,
                             const CandidatePlan& plan,
                             std::size_t max_chars);

} // namespace lookout
