#include "../include/lookout/orchestrator.hpp"

#include "../include/lookout/log.hpp"
#include "../include/lookout/net/http.hpp"
#include "../include/lookout/prompts.hpp"
#include "../include/lookout/tools.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace lookout {

namespace {

constexpr double kLargeModelBillions = 12.0;

void check_cancel(const CancellationToken& cancel) {
    if (cancel.cancelled()) {
        throw net::CancelledError("request cancelled");
    }
}

std::vector<chat::Message> to_messages(const ContextPlan& plan) {
    std::vector<chat::Message> messages;
    messages.reserve(plan.history.size() + 2);
    if (!plan.system_prompt.empty()) {
        messages.push_back(chat::Message{"system", plan.system_prompt});
    }
    for (const auto& turn : plan.history) {
        messages.push_back(chat::Message{turn.role, turn.content});
    }
    messages.push_back(chat::Message{"user", plan.prompt});
    return messages;
}

// Newest max_messages turns, never starting with an assistant reply cut off from its question.
std::vector<Turn> recent_history(const std::vector<Turn>& history, std::size_t max_messages) {
    auto begin = history.begin();
    if (history.size() > max_messages) {
        begin = history.end() - static_cast<std::ptrdiff_t>(max_messages);
        while (begin != history.end() && begin->role == "assistant") {
            ++begin;
        }
    }
    return std::vector<Turn>(begin, history.end());
}

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return std::string();
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

} // namespace

std::string_view error_kind_of(const std::exception& ex) {
    if (dynamic_cast<const ContextLimitError*>(&ex)) {
        return "context_limit_exceeded";
    }
    if (const auto* generation = dynamic_cast<const chat::GenerationError*>(&ex)) {
        return generation->timeout() ? "generation_timeout" : "generation_error";
    }
    if (dynamic_cast<const net::CancelledError*>(&ex)) {
        return "cancelled";
    }
    return "internal";
}

struct Orchestrator::Cycle {
    Request request;
    EventEmitter* events = nullptr;
    CancellationToken cancel;
    Response response;
};

Orchestrator::Orchestrator(Settings settings,
                           chat::BackendPtr backend,
                           std::shared_ptr<SimilarityCache> cache,
                           std::shared_ptr<SearchProvider> search,
                           std::shared_ptr<PageSource> pages)
    : m_settings(std::move(settings)),
      m_backend(std::move(backend)),
      m_cache(std::move(cache)),
      m_search(std::move(search)),
      m_analyzer(m_settings.small_model_threshold),
      m_tokens(m_settings.tokens),
      m_fetcher(std::move(pages), m_cache, m_settings) {
    if (!m_backend || !m_cache || !m_search) {
        throw std::invalid_argument("orchestrator requires a backend, a cache and a search provider");
    }
    if (m_settings.generation.probe_context_length) {
        m_tokens.set_context_probe([backend = m_backend](const std::string& model) {
            return backend->context_length(model);
        });
    }
}

Response Orchestrator::run(const Request& request, const CancellationToken& cancel) {
    return process(request, nullptr, cancel);
}

void Orchestrator::stream(const Request& request, const EventSink& sink, const CancellationToken& cancel) {
    EventEmitter events(sink, cancel);
    try {
        const Response response = process(request, &events, cancel);
        events.done(response);
    } catch (const std::exception& ex) {
        const std::string_view kind = error_kind_of(ex);
        if (kind == "internal") {
            log::error("Orchestrator", std::string("request failed: ") + ex.what());
        } else {
            log::warn("Orchestrator", std::string(kind) + ": " + ex.what());
        }
        events.error(kind, ex.what());
    }
}

Response Orchestrator::process(const Request& request, EventEmitter* events, const CancellationToken& cancel) {
    Cycle cycle{request, events, cancel, Response{}};
    if (cycle.request.model.empty()) {
        cycle.request.model = m_settings.generation.default_model;
    }
    cycle.request.history = recent_history(request.history, m_settings.max_history_messages);
    cycle.response.model = cycle.request.model;

    status(cycle, "analyzing", "Analyzing request");
    const Routing routing = m_analyzer.route(cycle.request);

    if (routing.tool) {
        return retrieve_and_synthesize(cycle, *routing.tool);
    }
    if (routing.fresh) {
        log::info("Orchestrator", "recency markers in prompt, extracting a search query");
        return retrieve_and_synthesize(cycle, extract_query(cycle));
    }
    return direct_answer(cycle);
}

Response Orchestrator::direct_answer(Cycle& cycle) {
    const Request& request = cycle.request;
    std::string system_prompt;
    if (!request.system_prompt.empty()) {
        system_prompt = request.system_prompt;
        if (!request.user_memory.empty()) {
            system_prompt += "\n\nWhat you know about the user:\n" + request.user_memory;
        }
    } else {
        system_prompt = prompts::direct(m_analyzer.is_small_model(request.model), request.user_memory);
    }

    const ContextPlan plan = m_tokens.fit(request.model, system_prompt, request.history, request.prompt, 0);
    const bool can_reroute = cycle.response.cutoff_reroutes < m_settings.max_cutoff_reroutes;

    SanitizerOptions options;
    options.hold_first_line = true;
    options.cutoff = can_reroute ? CutoffMode::Abort : CutoffMode::Observe;
    options.allow_tool_calls = true;

    status(cycle, "generating", "Generating answer");
    Generation generation = generate(cycle, plan, options);

    if (generation.tool) {
        log::info("Orchestrator", "model asked for " + std::string(tool_name(generation.tool->kind)) + ": "
                                      + generation.tool->query);
        return retrieve_and_synthesize(cycle, *generation.tool);
    }

    if (generation.cutoff && can_reroute) {
        ++cycle.response.cutoff_reroutes;
        log::info("Orchestrator", "knowledge cutoff in direct answer, re-routing to search");
        status(cycle, "rerouting", "Looking up current information");
        return retrieve_and_synthesize(cycle, extract_query(cycle));
    }
    if (generation.cutoff) {
        log::info("Orchestrator", "knowledge cutoff with no re-route budget left, answering as is");
        cycle.response.retrieval_suppressed = true;
    }

    const SearchDecision decision = SearchDecision::none();
    log::info("Orchestrator", "decision " + decision.describe() + " for " + request.model);
    Response response = std::move(cycle.response);
    response.record(decision);
    response.text = std::move(generation.text);
    response.context_messages_count = plan.history.size();
    response.token_usage = m_tokens.usage(plan);
    return response;
}

Response Orchestrator::retrieve_and_synthesize(Cycle& cycle, ToolCall call) {
    const Request& request = cycle.request;

    if (call.kind == ToolKind::Recall) {
        if (auto recalled = try_recall(cycle, call.query)) {
            return std::move(*recalled);
        }
        status(cycle, "recall_failed", "Earlier result " + call.query + " is no longer available");
        call = extract_query(cycle);
    }

    const ToolSpec& spec = tool_spec(call.kind);
    // Size the history before fetching so the content reservation is known up front.
    ContextPlan plan = m_tokens.fit(request.model, prompts::synthesis(std::string(), request.user_memory),
                                    request.history, request.prompt, TokenManager::reserve_for(spec.size_class));

    bool populated = false;
    const Resolution resolution = m_cache->resolve(
        CacheKey::query(call.kind, call.query), ttl_for(call.kind, m_settings.cache), [&]() {
            populated = true;
            return gather(cycle, call);
        });
    check_cancel(cycle.cancel);

    const SearchDecision decision = resolution.entry && resolution.hit && !populated
                                        ? SearchDecision::cache_hit(call.kind, call.query)
                                        : SearchDecision::use_tool(call.kind, call.query);
    log::info("Orchestrator", "decision " + decision.describe() + " '" + call.query + "'");
    Response& response = cycle.response;
    response.record(decision);

    std::string content;
    if (resolution.entry) {
        const CacheEntry& entry = *resolution.entry;
        response.search_id = entry.search_id;
        if (!entry.payload.source_urls.empty()) {
            response.source_url = entry.payload.source_urls.front();
            response.source = net::host_of(response.source_url);
        }
        if (response.cache_hit) {
            status(cycle, "cache_hit", "Using cached " + response.search_type + " result");
        }
        content = entry.payload.content;
    } else {
        response.no_data = true;
        log::warn("Orchestrator", "no data retrieved for " + response.search_type + " '" + call.query + "'");
        content = prompts::no_data(response.search_type, call.query);
    }

    return synthesize(cycle, std::move(plan), content);
}

std::optional<Response> Orchestrator::try_recall(Cycle& cycle, const std::string& id) {
    std::uint64_t search_id = 0;
    try {
        search_id = std::stoull(id);
    } catch (const std::exception&) {
        log::warn("Orchestrator", "recall id '" + id + "' is not a number");
        return std::nullopt;
    }
    auto entry = m_cache->find_by_search_id(search_id);
    if (!entry) {
        log::info("Orchestrator", "search_id " + id + " not in cache");
        return std::nullopt;
    }

    const Request& request = cycle.request;
    const SearchDecision decision = SearchDecision::cache_hit(ToolKind::Recall, entry->payload.query);
    log::info("Orchestrator", "decision " + decision.describe() + " search_id " + id);
    status(cycle, "recalling", "Recalling earlier result " + id);

    ContextPlan plan = m_tokens.fit(request.model, prompts::synthesis(std::string(), request.user_memory),
                                    request.history, request.prompt,
                                    TokenManager::reserve_for(tool_spec(ToolKind::Recall).size_class));

    Response& response = cycle.response;
    response.record(decision);
    response.search_id = entry->search_id;
    if (!entry->payload.source_urls.empty()) {
        response.source_url = entry->payload.source_urls.front();
        response.source = net::host_of(response.source_url);
    }
    return synthesize(cycle, std::move(plan), entry->payload.content);
}

ToolCall Orchestrator::extract_query(Cycle& cycle) {
    const Request& request = cycle.request;
    status(cycle, "extracting_query", "Working out what to search for");
    const ContextPlan plan = m_tokens.fit(request.model, prompts::extraction(),
                                          m_analyzer.extraction_messages(request), request.prompt, 0);
    check_cancel(cycle.cancel);
    const std::string reply = m_backend->complete(request.model, to_messages(plan));
    check_cancel(cycle.cancel);
    ToolCall call = m_analyzer.parse_extraction(reply, request.prompt);
    log::info("Orchestrator", "extracted " + std::string(tool_name(call.kind)) + " query '" + call.query + "'");
    return call;
}

std::optional<CachePayload> Orchestrator::gather(Cycle& cycle, const ToolCall& call) {
    const ToolSpec& spec = tool_spec(call.kind);
    if (!spec.candidates) {
        return std::nullopt;
    }
    try {
        status(cycle, "searching", "Searching " + std::string(tool_name(call.kind)) + " for " + call.query);
        const ToolContext ctx{*m_search, m_settings, cycle.cancel};
        const CandidatePlan plan = spec.candidates(ctx, call.query);

        std::vector<FetchTask> tasks;
        for (const auto& chain : plan.chains) {
            tasks.push_back(FetchTask::from_candidates(call.kind, chain));
        }
        if (!tasks.empty()) {
            status(cycle, "reading_content", "Reading " + std::to_string(tasks.size()) + " source(s)");
            m_fetcher.run(tasks, cycle.cancel);
        }
        if (cycle.cancel.cancelled()) {
            return std::nullopt;
        }

        std::vector<Section> sections;
        CachePayload payload;
        payload.tool = call.kind;
        payload.query = call.query;
        for (const auto& task : tasks) {
            if (const Attempt* winner = task.winner()) {
                sections.push_back(Section{winner->candidate.url, winner->candidate.title, winner->content});
                payload.source_urls.push_back(winner->candidate.url);
            }
        }
        if (payload.source_urls.empty() && !plan.listing.empty()) {
            payload.source_urls.push_back(plan.listing.front().url);
        }
        payload.content = assemble_content(call.kind, sections, plan, section_chars(cycle.request.model));
        if (payload.content.empty()) {
            log::warn("Orchestrator", "nothing usable for " + std::string(tool_name(call.kind)) + " '" + call.query
                                          + "' (" + std::to_string(tasks.size()) + " fetch tasks)");
            return std::nullopt;
        }
        return payload;
    } catch (const net::CancelledError&) {
        return std::nullopt;
    } catch (const std::exception& ex) {
        log::warn("Orchestrator", std::string(tool_name(call.kind)) + " retrieval failed: " + ex.what());
        return std::nullopt;
    }
}

Response Orchestrator::synthesize(Cycle& cycle, ContextPlan plan, const std::string& content) {
    const Request& request = cycle.request;
    const std::string fitted = m_tokens.accommodate(plan, request.model, content);
    plan.system_prompt = prompts::synthesis(fitted, request.user_memory);

    SanitizerOptions options;
    options.hold_first_line = false;
    options.cutoff = CutoffMode::Observe;
    options.allow_tool_calls = false;

    status(cycle, "synthesizing", "Writing the answer");
    Generation generation = generate(cycle, plan, options);
    if (generation.cutoff) {
        log::info("Orchestrator", "cutoff phrase in synthesized answer, not searching again");
        cycle.response.retrieval_suppressed = true;
    }

    Response response = std::move(cycle.response);
    response.text = std::move(generation.text);
    response.context_messages_count = plan.history.size();
    response.token_usage = m_tokens.usage(plan);
    return response;
}

Orchestrator::Generation Orchestrator::generate(Cycle& cycle, const ContextPlan& plan, SanitizerOptions options) {
    const std::string& model = cycle.request.model;
    const std::vector<chat::Message> messages = to_messages(plan);
    check_cancel(cycle.cancel);

    Generation generation;
    if (!cycle.events) {
        const std::string reply = m_backend->complete(model, messages);
        check_cancel(cycle.cancel);
        if (options.allow_tool_calls) {
            generation.tool = m_analyzer.parse_marker(reply);
        }
        if (!generation.tool && options.cutoff != CutoffMode::Off) {
            generation.cutoff = m_analyzer.detect_cutoff(reply);
        }
        generation.text = m_analyzer.clean_response(reply);
        return generation;
    }

    StreamSanitizer sanitizer(m_analyzer, options);
    std::optional<SanitizerSignal> signal;
    bool delivered = true;
    auto forward = [&](const SanitizerOutput& out) {
        if (!out.text.empty() && !cycle.events->token(out.text)) {
            delivered = false;
        }
        if (out.signal) {
            signal = out.signal;
        }
        return delivered && !signal;
    };

    const bool completed = m_backend->stream(
        model, messages,
        [&](std::string_view token) { return forward(sanitizer.feed(token)) && !cycle.cancel.cancelled(); },
        cycle.cancel);
    if (delivered && !signal) {
        forward(sanitizer.finish());
    }
    check_cancel(cycle.cancel);
    if (!completed && !signal) {
        log::debug("Orchestrator", "generation stream stopped early");
    }

    if (signal && signal->kind == SanitizerSignal::Kind::ToolCall) {
        generation.tool = signal->tool;
    } else if (signal || sanitizer.cutoff_seen()) {
        generation.cutoff = true;
    }
    generation.text = trim(sanitizer.emitted());
    return generation;
}

void Orchestrator::status(Cycle& cycle, std::string_view stage, std::string_view message) const {
    log::debug("Orchestrator", std::string(stage) + ": " + std::string(message));
    if (cycle.events) {
        cycle.events->status(stage, message);
    }
}

std::size_t Orchestrator::section_chars(const std::string& model) const {
    const std::size_t base = m_settings.fetch.max_content_chars;
    if (const auto size = QueryAnalyzer::parameter_size(model); size && *size >= kLargeModelBillions) {
        return base * 2;
    }
    return base;
}

} // namespace lookout
