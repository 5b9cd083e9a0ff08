#pragma once

#include "analyzer.hpp"
#include "cache.hpp"
#include "cancel.hpp"
#include "chat/backend.hpp"
#include "config.hpp"
#include "events.hpp"
#include "fetcher.hpp"
#include "sanitizer.hpp"
#include "search.hpp"
#include "token_budget.hpp"
#include "types.hpp"

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lookout {

// "context_limit_exceeded", "generation_timeout", "generation_error", "cancelled" or "internal".
std::string_view error_kind_of(const std::exception& ex);

class Orchestrator {
public:
    Orchestrator(Settings settings,
                 chat::BackendPtr backend,
                 std::shared_ptr<SimilarityCache> cache,
                 std::shared_ptr<SearchProvider> search,
                 std::shared_ptr<PageSource> pages);

    // Throws ContextLimitError, chat::GenerationError or net::CancelledError.
    Response run(const Request& request, const CancellationToken& cancel = CancellationToken());

    // Never throws. The sink sees status and token events closed by exactly one done or error event.
    void stream(const Request& request, const EventSink& sink, const CancellationToken& cancel = CancellationToken());

    const QueryAnalyzer& analyzer() const noexcept { return m_analyzer; }
    TokenManager& tokens() noexcept { return m_tokens; }
    const Settings& settings() const noexcept { return m_settings; }

private:
    struct Cycle;

    struct Generation {
        std::string text;
        std::optional<ToolCall> tool;
        bool cutoff = false;
    };

    Response process(const Request& request, EventEmitter* events, const CancellationToken& cancel);

    Response direct_answer(Cycle& cycle);
    Response retrieve_and_synthesize(Cycle& cycle, ToolCall call);
    std::optional<Response> try_recall(Cycle& cycle, const std::string& id);
    ToolCall extract_query(Cycle& cycle);
    std::optional<CachePayload> gather(Cycle& cycle, const ToolCall& call);
    Response synthesize(Cycle& cycle, ContextPlan plan, const std::string& content);

    Generation generate(Cycle& cycle, const ContextPlan& plan, SanitizerOptions options);
    void status(Cycle& cycle, std::string_view stage, std::string_view message) const;
    std::size_t section_chars(const std::string& model) const;

    Settings m_settings;
    chat::BackendPtr m_backend;
    std::shared_ptr<SimilarityCache> m_cache;
    std::shared_ptr<SearchProvider> m_search;
    QueryAnalyzer m_analyzer;
    TokenManager m_tokens;
    Fetcher m_fetcher;
};

} // namespace lookout
