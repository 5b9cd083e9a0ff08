#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "../include/lookout/analyzer.hpp"
#include "../include/lookout/cache.hpp"
#include "../include/lookout/chat/backend.hpp"
#include "../include/lookout/config.hpp"
#include "../include/lookout/events.hpp"
#include "../include/lookout/extract.hpp"
#include "../include/lookout/fetcher.hpp"
#include "../include/lookout/json.hpp"
#include "../include/lookout/log.hpp"
#include "../include/lookout/net/http.hpp"
#include "../include/lookout/orchestrator.hpp"
#include "../include/lookout/sanitizer.hpp"
#include "../include/lookout/search.hpp"
#include "../include/lookout/serve.hpp"
#include "../include/lookout/similarity.hpp"
#include "../include/lookout/token_budget.hpp"
#include "../include/lookout/types.hpp"

namespace fs = std::filesystem;
using namespace lookout;
using namespace std::chrono_literals;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAIL: " << message << "\n";
        std::exit(1);
    }
}

void run_test(const std::string& name, void (*fn)()) {
    std::cout << "  " << name << "...";
    fn();
    std::cout << " PASSED\n";
    g_tests_run++;
    g_tests_passed++;
}

// ============================================================================
// Fixtures
// ============================================================================

const char* kWttrParis =
    R"({"current_condition":[{"temp_C":"18","FeelsLikeC":"17","humidity":"60","windspeedKmph":"11",)"
    R"("weatherDesc":[{"value":"Partly cloudy"}]}],)"
    R"("nearest_area":[{"areaName":[{"value":"Paris"}],"country":[{"value":"France"}]}]})";

const char* kWttrUrl = "https://wttr.in/Paris?format=j1";

std::string words(const std::string& word, int count) {
    std::string text;
    for (int i = 0; i < count; ++i) {
        if (i > 0) {
            text += ' ';
        }
        text += word;
    }
    return text;
}

std::string html_page(const std::string& body) {
    return "<html><head><title>t</title></head><body><article><p>" + body + "</p></article></body></html>";
}

fs::path scratch_dir(const std::string& name) {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path dir = fs::temp_directory_path() / ("lookout_" + name + "_" + std::to_string(stamp));
    fs::create_directories(dir);
    return dir;
}

Settings test_settings() {
    Settings settings;
    settings.cache.persist = false;
    settings.cache.directory = fs::temp_directory_path() / "lookout_unused";
    settings.providers.reader_prefix.clear();
    settings.providers.openweather_api_key.clear();
    settings.providers.wttr_url = "https://wttr.in/";
    settings.generation.probe_context_length = false;
    settings.generation.default_model = "test-model";
    settings.fetch.cancel_grace = 200ms;
    return settings;
}

std::shared_ptr<SimilarityCache> make_cache(const Settings& settings,
                                            SimilarityCache::ClockFn clock = &CacheClock::now) {
    return std::make_shared<SimilarityCache>(settings.cache, SimilarityModel(settings.similarity, Thesaurus::builtin()),
                                             std::move(clock));
}

// Replays scripted replies in order; streams them word by word.
class FakeBackend final : public chat::Backend {
public:
    explicit FakeBackend(std::vector<std::string> replies) : m_replies(std::move(replies)) {}

    std::string complete(const std::string& model, const std::vector<chat::Message>& messages) override {
        (void)model;
        return next(messages);
    }

    bool stream(const std::string& model,
                const std::vector<chat::Message>& messages,
                const chat::TokenCallback& on_token,
                const CancellationToken& cancel) override {
        (void)model;
        const std::string reply = next(messages);
        std::string piece;
        auto flush = [&]() {
            if (piece.empty()) {
                return true;
            }
            if (cancel.cancelled()) {
                throw net::CancelledError("stream cancelled");
            }
            const bool keep_going = on_token(piece);
            piece.clear();
            return keep_going;
        };
        for (char c : reply) {
            if ((c == ' ' || c == '\n') && !flush()) {
                return false;
            }
            piece.push_back(c);
        }
        return flush();
    }

    std::size_t calls() const {
        std::scoped_lock lock(m_mutex);
        return m_calls.size();
    }

    std::vector<chat::Message> call(std::size_t index) const {
        std::scoped_lock lock(m_mutex);
        return m_calls.at(index);
    }

    std::string system_of(std::size_t index) const {
        const auto messages = call(index);
        return !messages.empty() && messages.front().role == "system" ? messages.front().text : std::string();
    }

private:
    std::string next(const std::vector<chat::Message>& messages) {
        std::scoped_lock lock(m_mutex);
        m_calls.push_back(messages);
        if (m_next >= m_replies.size()) {
            throw chat::GenerationError("no scripted reply left");
        }
        return m_replies[m_next++];
    }

    std::vector<std::string> m_replies;
    std::size_t m_next = 0;
    std::vector<std::vector<chat::Message>> m_calls;
    mutable std::mutex m_mutex;
};

class FakeSearchProvider final : public SearchProvider {
public:
    void set(ToolKind kind, SearchResults results) { m_results[kind] = std::move(results); }

    SearchResults search(ToolKind kind, const std::string& query, const CancellationToken& cancel) override {
        (void)cancel;
        queries.emplace_back(kind, query);
        if (auto it = m_results.find(kind); it != m_results.end()) {
            return it->second;
        }
        return SearchResults{};
    }

    std::vector<std::pair<ToolKind, std::string>> queries;

private:
    std::map<ToolKind, SearchResults> m_results;
};

class FakePageSource final : public PageSource {
public:
    void set(const std::string& url, long status, std::string body) {
        m_pages[url] = Page{status, std::move(body), "text/html"};
    }

    Page fetch(const std::string& url, std::chrono::milliseconds timeout, const CancellationToken& cancel) override {
        (void)timeout;
        (void)cancel;
        {
            std::scoped_lock lock(m_mutex);
            m_log.push_back(url);
        }
        if (auto it = m_pages.find(url); it != m_pages.end()) {
            return it->second;
        }
        return Page{404, std::string(), "text/html"};
    }

    std::vector<std::string> fetched() const {
        std::scoped_lock lock(m_mutex);
        return m_log;
    }

    bool was_fetched(const std::string& url) const {
        const auto log = fetched();
        return std::find(log.begin(), log.end(), url) != log.end();
    }

private:
    std::map<std::string, Page> m_pages;
    mutable std::mutex m_mutex;
    std::vector<std::string> m_log;
};

struct Harness {
    Settings settings = test_settings();
    std::shared_ptr<FakeBackend> backend;
    std::shared_ptr<FakeSearchProvider> search = std::make_shared<FakeSearchProvider>();
    std::shared_ptr<FakePageSource> pages = std::make_shared<FakePageSource>();
    std::shared_ptr<SimilarityCache> cache;
    std::unique_ptr<Orchestrator> orchestrator;

    Harness(std::vector<std::string> replies,
            SimilarityCache::ClockFn clock = &CacheClock::now,
            void (*tweak)(Settings&) = nullptr) {
        if (tweak) {
            tweak(settings);
        }
        backend = std::make_shared<FakeBackend>(std::move(replies));
        cache = make_cache(settings, std::move(clock));
        orchestrator = std::make_unique<Orchestrator>(settings, backend, cache, search, pages);
    }
};

Request prompt_only(const std::string& prompt) {
    Request request;
    request.prompt = prompt;
    return request;
}

struct Recorder {
    std::vector<StreamEvent> events;

    EventSink sink() {
        return [this](const StreamEvent& event) {
            events.push_back(event);
            return true;
        };
    }

    std::string tokens() const {
        std::string text;
        for (const auto& event : events) {
            if (event.kind == EventKind::Token) {
                text += event.payload.at("content").as_string();
            }
        }
        return text;
    }

    bool has_stage(const std::string& stage) const {
        return std::any_of(events.begin(), events.end(), [&](const StreamEvent& event) {
            return event.kind == EventKind::Status && event.payload.at("stage").as_string() == stage;
        });
    }

    std::size_t terminals() const {
        return static_cast<std::size_t>(std::count_if(events.begin(), events.end(), [](const StreamEvent& event) {
            return event.terminal();
        }));
    }
};

void expect_well_formed(const Recorder& recorder, const std::string& what) {
    expect(!recorder.events.empty(), what + ": no events");
    for (std::size_t i = 0; i < recorder.events.size(); ++i) {
        expect(recorder.events[i].seq == i + 1, what + ": sequence numbers are consecutive from 1");
    }
    expect(recorder.terminals() == 1, what + ": exactly one terminal event");
    expect(recorder.events.back().terminal(), what + ": terminal event is last");
}

// ============================================================================
// Phase 1: JSON and text normalization
// ============================================================================

void test_json_parse_and_dump() {
    const auto doc = Json::try_parse(R"({"b":[1,2.5,"x\u00e9"],"a":null,"c":true})");
    expect(doc.has_value() && doc->is_object(), "object parses");
    const Json* items = doc->find("b");
    expect(items && items->is_array() && items->as_array().size() == 3, "array member");
    expect(items->as_array()[1].as_number() == 2.5, "fractional number");
    expect(items->as_array()[2].as_string() == "x\xC3\xA9", "unicode escape decodes to UTF-8");
    expect(doc->find("a")->is_null(), "null member");
    expect(doc->bool_or("c", false), "bool member");
    expect(Json(3).dump() == "3", "integral numbers dump without a fraction");

    JsonObject obj;
    obj["b"] = Json(1);
    obj["a"] = Json("x");
    expect(Json(obj).dump() == R"({"a":"x","b":1})", "object keys dump in order");
    expect(!Json::try_parse("{bad").has_value(), "malformed text is rejected");
}

void test_normalize_and_tokenize() {
    const std::string normalized = normalize_text("What's the WEATHER in Paris? site:example.com");
    expect(normalized == "whats the weather in paris", "normalize: " + normalized);
    const auto terms = tokenize(normalized);
    expect(terms.size() == 2 && terms[0] == "weather" && terms[1] == "paris", "stop words removed");
}

void test_similarity_scores() {
    SimilarityModel model(SimilaritySettings{}, Thesaurus::builtin());
    const auto a = model.signature("latest news on apple stock");
    const auto b = model.signature("apple stock latest news");
    const auto score = model.score(a, b);
    expect(score.jaccard == 1.0, "same term set");
    expect(score.distance == 0, "same simhash");
    expect(model.qualifies(score), "reordered query qualifies");

    const auto unrelated = model.score(model.signature("weather paris"), model.signature("python tutorial"));
    expect(!model.qualifies(unrelated), "unrelated queries do not qualify");
}

// ============================================================================
// Phase 2: Similarity cache
// ============================================================================

void test_cache_similar_lookup() {
    const Settings settings = test_settings();
    auto cache = make_cache(settings);
    CachePayload payload;
    payload.content = "Apple shares rose.";
    payload.source_urls = {"https://news.example/a"};
    const CacheEntry admitted = cache->admit(CacheKey::query(ToolKind::Web, "latest news on apple stock"), payload, 1h);
    expect(admitted.search_id > 0, "query entries get a search id");

    const auto found = cache->lookup(CacheKey::query(ToolKind::Web, "apple stock latest news"));
    expect(found.has_value(), "similar query hits");
    expect(!found->exact, "hit is by similarity");
    expect(found->entry.payload.content == "Apple shares rose.", "payload returned");
    expect(found->entry.hits == 1, "hit counted");

    expect(!cache->lookup(CacheKey::query(ToolKind::Reddit, "apple stock latest news")).has_value(),
           "other tool kinds never match");
    expect(!cache->lookup(CacheKey::url("https://news.example/a/b")).has_value(), "url namespace is exact");
}

CachePayload content_payload(const std::string& content) {
    CachePayload payload;
    payload.content = content;
    return payload;
}

void test_cache_best_candidate_wins() {
    auto now = std::make_shared<CacheClock::time_point>(CacheClock::now());
    Settings settings = test_settings();
    settings.similarity.composite_threshold = 0.3;
    const SimilarityModel model(settings.similarity, Thesaurus::builtin());
    const std::string incoming = "quantum river lantern falcon";
    const std::string close = "quantum river lantern falcon meadow";
    const std::string distant = "quantum river orchid velvet";
    expect(model.qualifies(model.score(model.signature(incoming), model.signature(distant))),
           "weaker candidate still qualifies");

    auto cache = make_cache(settings, [now]() { return *now; });
    cache->admit(CacheKey::query(ToolKind::Web, close), content_payload("close"), 1h);
    *now += 1s;
    cache->admit(CacheKey::query(ToolKind::Web, distant), content_payload("distant"), 1h);
    const auto found = cache->lookup(CacheKey::query(ToolKind::Web, incoming));
    expect(found && found->entry.payload.content == "close", "highest score wins over recency");

    // Same terms in a different order: distinct fingerprints, identical scores.
    auto tied = make_cache(settings, [now]() { return *now; });
    const std::string first = "falcon lantern river meadow";
    const std::string second = "meadow river lantern falcon";
    tied->admit(CacheKey::query(ToolKind::Web, first), content_payload("first"), 1h);
    *now += 1s;
    tied->admit(CacheKey::query(ToolKind::Web, second), content_payload("second"), 1h);
    *now += 1s;
    const auto newest = tied->lookup(CacheKey::query(ToolKind::Web, incoming));
    expect(newest && newest->entry.payload.content == "second", "tie goes to the most recent access");

    *now += 1s;
    expect(tied->lookup(CacheKey::query(ToolKind::Web, first)).has_value(), "exact lookup touches the older entry");
    *now += 1s;
    const auto touched = tied->lookup(CacheKey::query(ToolKind::Web, incoming));
    expect(touched && touched->entry.payload.content == "first", "refreshed entry now wins the tie");
}

void test_cache_ttl_expiry() {
    auto now = std::make_shared<CacheClock::time_point>(CacheClock::now());
    const Settings settings = test_settings();
    auto cache = make_cache(settings, [now]() { return *now; });
    CachePayload payload;
    payload.content = "18C";
    cache->admit(CacheKey::query(ToolKind::Weather, "Paris"), payload, 30min);

    *now += 29min;
    expect(cache->lookup(CacheKey::query(ToolKind::Weather, "Paris")).has_value(), "live before expiry");
    *now += 2min;
    expect(!cache->lookup(CacheKey::query(ToolKind::Weather, "Paris")).has_value(), "expired entry misses");
    expect(!cache->peek(CacheKey::query(ToolKind::Weather, "Paris")).has_value(), "peek ignores expired entries");
    expect(cache->purge_expired() == 1, "purge removes the expired entry");
}

void test_cache_lru_eviction() {
    auto now = std::make_shared<CacheClock::time_point>(CacheClock::now());
    Settings settings = test_settings();
    settings.cache.capacity = 2;
    auto cache = make_cache(settings, [now]() { return *now; });
    CachePayload payload;
    payload.content = "x";

    const auto a = CacheKey::query(ToolKind::Web, "alpha query one");
    const auto b = CacheKey::query(ToolKind::Web, "bravo topic two");
    const auto c = CacheKey::query(ToolKind::Web, "charlie thing three");
    cache->admit(a, payload, 1h);
    *now += 1s;
    cache->admit(b, payload, 1h);
    *now += 1s;
    expect(cache->lookup(a).has_value(), "a is live");
    *now += 1s;
    cache->admit(c, payload, 1h);

    expect(cache->peek(a).has_value(), "recently used entry survives");
    expect(!cache->peek(b).has_value(), "least recently used entry evicted");
    expect(cache->peek(c).has_value(), "new entry admitted");
    expect(cache->stats().evictions == 1, "eviction counted");
}

void test_cache_single_flight() {
    const Settings settings = test_settings();
    auto cache = make_cache(settings);
    std::atomic<int> populations{0};
    const auto key = CacheKey::query(ToolKind::Web, "rust async runtimes");

    std::vector<std::string> contents(8);
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < contents.size(); ++i) {
        threads.emplace_back([&, i]() {
            const Resolution resolution = cache->resolve(key, 1h, [&]() -> std::optional<CachePayload> {
                ++populations;
                std::this_thread::sleep_for(50ms);
                CachePayload payload;
                payload.content = "Tokio is the most used runtime.";
                return payload;
            });
            contents[i] = resolution.entry ? resolution.entry->payload.content : std::string();
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    expect(populations.load() == 1, "one populate for concurrent callers");
    for (const auto& content : contents) {
        expect(content == "Tokio is the most used runtime.", "every caller sees the populated entry");
    }
    expect(cache->pending_locks() == 0, "key locks released");
}

void test_cache_failed_populate_not_admitted() {
    const Settings settings = test_settings();
    auto cache = make_cache(settings);
    const auto key = CacheKey::query(ToolKind::Reddit, "best mechanical keyboards");
    const Resolution first = cache->resolve(key, 1h, []() { return std::optional<CachePayload>(); });
    expect(!first.entry && !first.hit, "failed populate resolves empty");
    expect(cache->stats().query_entries == 0, "nothing admitted");
    expect(cache->pending_locks() == 0, "key lock released after failure");
}

void test_cache_persistence() {
    const fs::path dir = scratch_dir("persist");
    Settings settings = test_settings();
    settings.cache.persist = true;
    settings.cache.directory = dir;

    std::uint64_t id = 0;
    {
        auto cache = make_cache(settings);
        CachePayload payload;
        payload.content = "Rome is the capital of Italy.";
        payload.source_urls = {"https://en.wikipedia.org/wiki/Rome"};
        id = cache->admit(CacheKey::query(ToolKind::Wikipedia, "rome"), payload, 24h).search_id;
        CachePayload page;
        page.content = "Rome page text";
        cache->admit(CacheKey::url("https://en.wikipedia.org/wiki/Rome"), page, 24h);
    }
    expect(fs::exists(dir / "query_cache.json"), "query namespace file written");
    expect(fs::exists(dir / "url_cache.json"), "url namespace file written");

    auto reloaded = make_cache(settings);
    reloaded->load();
    const CacheStats stats = reloaded->stats();
    expect(stats.query_entries == 1 && stats.url_entries == 1, "both namespaces reloaded");
    const auto entry = reloaded->find_by_search_id(id);
    expect(entry && entry->payload.content == "Rome is the capital of Italy.", "search id survives restart");

    CachePayload next;
    next.content = "Paris";
    const auto later = reloaded->admit(CacheKey::query(ToolKind::Wikipedia, "paris"), next, 24h);
    expect(later.search_id > id, "search ids keep increasing after reload");
    fs::remove_all(dir);
}

void test_cache_corrupt_files() {
    const fs::path dir = scratch_dir("corrupt");
    {
        std::ofstream(dir / "query_cache.json") << "{not json";
        std::ofstream(dir / "url_cache.json") << R"({"version":1,"entries":[{"fingerprint":"x"},5]})";
    }
    Settings settings = test_settings();
    settings.cache.persist = true;
    settings.cache.directory = dir;
    auto cache = make_cache(settings);
    cache->load();
    expect(cache->stats().query_entries == 0 && cache->stats().url_entries == 0, "corrupt files load empty");

    CachePayload payload;
    payload.content = "still works";
    cache->admit(CacheKey::query(ToolKind::Web, "after corruption"), payload, 1h);
    expect(cache->peek(CacheKey::query(ToolKind::Web, "after corruption")).has_value(), "admits after bad load");
    fs::remove_all(dir);
}

void test_canonical_url() {
    expect(canonical_url("HTTPS://WWW.Example.com/path/?utm_source=x&b=2&a=1#frag")
               == "https://example.com/path?a=1&b=2",
           "canonical url");
    expect(canonical_url("http://example.com/") == "http://example.com", "root path dropped");
    expect(fingerprint(CacheKey::url("https://example.com/a?b=1&a=2"))
               == fingerprint(CacheKey::url("https://www.example.com/a/?a=2&b=1")),
           "equivalent urls share a fingerprint");
}

// ============================================================================
// Phase 3: Token budgets
// ============================================================================

TokenSettings token_settings(std::size_t context) {
    TokenSettings settings;
    settings.default_context = context;
    return settings;
}

std::vector<Turn> conversation(int turns) {
    std::vector<Turn> history;
    for (int i = 0; i < turns; ++i) {
        history.push_back(Turn{i % 2 == 0 ? "user" : "assistant", words("word", 60)});
    }
    return history;
}

void test_token_estimate() {
    expect(conservative_estimate("") == 0, "empty text is free");
    expect(conservative_estimate("abc") == 2, "short words round up");
    expect(TokenManager::reserve_for(SizeClass::Short) == 400, "short reserve");
    expect(TokenManager::reserve_for(SizeClass::Medium) == 2000, "medium reserve");
    expect(TokenManager::reserve_for(SizeClass::Long) == 4000, "long reserve");
}

void test_token_fit_keeps_newest_units() {
    TokenManager tokens(token_settings(1000));
    auto history = conversation(40);
    history.back().content = words("last", 60);
    const ContextPlan plan = tokens.fit("test-model", "You are helpful.", history, "question?", 0);
    expect(plan.budget.limit == 900, "safety buffer applied");
    expect(plan.history.size() == 2, "only the newest unit fits");
    expect(plan.history.front().role == "user", "kept history starts with a user turn");
    expect(plan.history.back().content == history.back().content, "newest turn kept");
    expect(plan.dropped_turns == 38, "older turns dropped");
    expect(plan.budget.fits(), "budget respected");
}

void test_token_fit_clips_when_reservation_is_large() {
    TokenManager tokens(token_settings(1000));
    const ContextPlan plan = tokens.fit("test-model", "You are helpful.", conversation(40), "question?", 2000);
    expect(plan.clipped_turn, "newest unit clipped");
    expect(plan.history.size() == 2, "newest unit kept");
    expect(plan.budget.consumed + plan.budget.reserved <= plan.budget.limit, "budget respected with reservation");
}

void test_token_fit_rejects_oversized_prompt() {
    TokenManager tokens(token_settings(1000));
    bool threw = false;
    try {
        (void)tokens.fit("test-model", "You are helpful.", {}, words("long", 1000), 0);
    } catch (const ContextLimitError& ex) {
        threw = true;
        expect(ex.limit() == 900, "limit reported");
        expect(ex.required() > 900, "required cost reported");
    }
    expect(threw, "oversized prompt rejected");
}

void test_token_accommodate_clips_content() {
    TokenManager tokens(token_settings(1000));
    ContextPlan plan = tokens.fit("test-model", "You are helpful.", conversation(4), "question?", 100);
    expect(plan.history.size() == 2, "one unit fits beside the reservation");
    const std::string content = words("data", 570);
    const std::string fitted = tokens.accommodate(plan, "test-model", content);
    expect(!fitted.empty() && fitted.size() < content.size(), "content clipped");
    expect(plan.history.size() == 2, "newest unit never dropped");
    expect(plan.budget.consumed <= plan.budget.limit, "clipped content fits");
}

void test_token_accommodate_drops_history_first() {
    TokenManager tokens(token_settings(2000));
    ContextPlan plan = tokens.fit("test-model", "You are helpful.", conversation(4), "question?", 500);
    expect(plan.history.size() == 4, "both units fit the reservation");
    const std::string content = words("data", 570);
    const std::string fitted = tokens.accommodate(plan, "test-model", content);
    expect(fitted == content, "content kept whole");
    expect(plan.history.size() == 2, "older unit dropped for content");
    expect(plan.budget.consumed <= plan.budget.limit, "budget respected");
}

void test_token_model_limits() {
    TokenSettings settings = token_settings(1000);
    settings.model_limits = parse_model_limits("llama3:8192, llama3.1:131072, broken");
    expect(settings.model_limits.size() == 2, "malformed limit skipped");
    TokenManager tokens(settings);
    expect(tokens.budget_for("llama3.1:8b").model_max == 131072, "longest prefix wins");
    expect(tokens.budget_for("llama3:latest").model_max == 8192, "prefix match");
    expect(tokens.budget_for("mistral").model_max == 1000, "default context");

    tokens.set_context_probe([](const std::string& model) -> std::optional<std::size_t> {
        if (model == "probed") {
            return 4096;
        }
        return std::nullopt;
    });
    expect(tokens.budget_for("probed").model_max == 4096, "probed length wins");
    expect(tokens.budget_for("llama3:latest").model_max == 8192, "configured limit when probe is silent");
}

void test_token_probe_runs_unlocked() {
    TokenManager tokens(token_settings(1000));
    int flaky_calls = 0;
    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    bool released_in_time = false;
    tokens.set_context_probe([&](const std::string& model) -> std::optional<std::size_t> {
        if (model == "flaky") {
            if (++flaky_calls == 1) {
                throw net::TimeoutError("probe timed out");
            }
            return 4096;
        }
        if (model == "slow") {
            entered.set_value();
            released_in_time = released.wait_for(5s) == std::future_status::ready;
            return 8192;
        }
        return 2048;
    });

    expect(tokens.budget_for("flaky").model_max == 1000, "failed probe falls back to the default");
    expect(tokens.budget_for("flaky").model_max == 4096, "failed probe is retried");
    expect(flaky_calls == 2, "failure not remembered");

    std::thread slow([&]() { (void)tokens.budget_for("slow"); });
    entered.get_future().wait();
    expect(tokens.budget_for("other").model_max == 2048, "other models resolve during a slow probe");
    release.set_value();
    slow.join();
    expect(released_in_time, "slow probe did not block other models");
    expect(tokens.budget_for("slow").model_max == 8192, "slow probe result cached");
}

// ============================================================================
// Phase 4: Query analysis and stream sanitizing
// ============================================================================

void test_analyzer_routing() {
    QueryAnalyzer analyzer;
    auto weather = analyzer.route(prompt_only("What's the weather in Paris?"));
    expect(weather.tool && weather.tool->kind == ToolKind::Weather && weather.tool->query == "Paris",
           "weather location extracted");
    auto weather_today = analyzer.route(prompt_only("what is the weather in New York today"));
    expect(weather_today.tool && weather_today.tool->query == "New York", "time words stripped from location");

    auto reddit = analyzer.route(prompt_only("What do people think about the new iPhone?"));
    expect(reddit.tool && reddit.tool->kind == ToolKind::Reddit, "reddit intent");
    auto wiki = analyzer.route(prompt_only("Tell me about Rome from wikipedia"));
    expect(wiki.tool && wiki.tool->kind == ToolKind::Wikipedia, "wikipedia intent");

    Request recall = prompt_only("Can you summarize that article again?");
    recall.history = {{"user", "news?"},
                      {"assistant", "Here it is [search_id: 3]"},
                      {"user", "and more?"},
                      {"assistant", "More [search_id: 7]"}};
    auto recalled = analyzer.route(recall);
    expect(recalled.tool && recalled.tool->kind == ToolKind::Recall && recalled.tool->query == "7",
           "recall uses newest search id");
    expect(!analyzer.route(prompt_only("Can you summarize that article again?")).tool,
           "recall needs an id in the history");

    auto plain = analyzer.route(prompt_only("Explain photosynthesis"));
    expect(!plain.tool && !plain.fresh, "plain question answered directly");
}

void test_analyzer_freshness() {
    QueryAnalyzer analyzer;
    expect(analyzer.needs_fresh_info("What is the latest iPhone?"), "latest");
    expect(analyzer.needs_fresh_info("Who won the election yesterday?"), "yesterday");
    expect(!analyzer.needs_fresh_info("Explain photosynthesis"), "timeless question");
    expect(!analyzer.needs_fresh_info("What was built in 1999?"), "old year");
}

void test_analyzer_cutoff_phrases() {
    QueryAnalyzer analyzer;
    expect(analyzer.detect_cutoff("As of my last update in 2023, nothing changed."), "last update");
    expect(analyzer.detect_cutoff("I don\xE2\x80\x99t have real-time access to news."), "curly apostrophe");
    expect(analyzer.detect_cutoff("MY TRAINING DATA ends early."), "case folded");
    expect(!analyzer.detect_cutoff("Paris is the capital of France."), "plain answer");
}

void test_analyzer_markers() {
    QueryAnalyzer analyzer;
    auto google = analyzer.parse_marker("GOOGLE: \"rtx 5080 price\"");
    expect(google && google->kind == ToolKind::Web && google->query == "rtx 5080 price", "quotes stripped");
    auto reddit = analyzer.parse_marker("Sure!\nREDDIT: best laptops 2025\n");
    expect(reddit && reddit->kind == ToolKind::Reddit && reddit->query == "best laptops 2025", "reddit marker");
    auto wiki = analyzer.parse_marker("WIKIPEDIA: Alan Turing");
    expect(wiki && wiki->kind == ToolKind::Wikipedia && wiki->query == "Alan Turing", "wikipedia marker");
    auto search = analyzer.parse_marker("SEARCH: tallest building?");
    expect(search && search->kind == ToolKind::Web && search->query == "tallest building", "generic marker");
    auto recall = analyzer.parse_marker("RECALL: [search_id: 12]");
    expect(recall && recall->kind == ToolKind::Recall && recall->query == "12", "recall marker");
    expect(!analyzer.parse_marker("nothing here").has_value(), "no marker");

    auto fallback = analyzer.parse_extraction("I think you should search", "orig prompt");
    expect(fallback.kind == ToolKind::Web && fallback.query == "orig prompt", "extraction falls back to prompt");

    expect(analyzer.clean_response("Answer here.\nGOOGLE: something\n[search_id: 4]") == "Answer here.",
           "markers and tags removed");
}

void test_analyzer_model_size() {
    QueryAnalyzer analyzer;
    expect(analyzer.is_small_model("llama3.2:1b"), "1b is small");
    expect(!analyzer.is_small_model("qwen2.5:14b"), "14b is not small");
    expect(analyzer.is_small_model("phi3:mini"), "mini is small");
    expect(!analyzer.is_small_model("llama3"), "unknown size is not small");
    const auto size = QueryAnalyzer::parameter_size("qwen2.5-0.5b");
    expect(size && *size == 0.5, "fractional size");
}

SanitizerOptions passthrough() {
    SanitizerOptions options;
    options.hold_first_line = false;
    options.cutoff = CutoffMode::Abort;
    return options;
}

void test_sanitizer_strips_tags() {
    QueryAnalyzer analyzer;
    StreamSanitizer sanitizer(analyzer, passthrough());
    const auto out = sanitizer.feed("Response text [search_id: 5]");
    expect(out.text == "Response text ", "tag removed: " + out.text);
    expect(!out.signal, "tags never signal");
    expect(sanitizer.finish().text.empty(), "nothing left");
    expect(sanitizer.state() == SanitizerState::Terminal, "terminal after finish");
}

void test_sanitizer_split_marker() {
    QueryAnalyzer analyzer;
    StreamSanitizer sanitizer(analyzer, passthrough());
    std::string visible;
    std::optional<SanitizerSignal> signal;
    for (const char* token : {"SEAR", "CH: query", " content", "\nOK"}) {
        auto out = sanitizer.feed(token);
        visible += out.text;
        if (out.signal) {
            signal = out.signal;
        }
    }
    expect(visible.empty(), "marker never reaches the client");
    expect(signal && signal->kind == SanitizerSignal::Kind::ToolCall, "tool call signalled");
    expect(signal->tool->kind == ToolKind::Web && signal->tool->query == "query content", "marker body parsed");
    expect(sanitizer.state() == SanitizerState::EmittingToolCall, "tool call state");
    expect(sanitizer.feed("more").text.empty(), "stream ignored after a signal");
}

void test_sanitizer_partial_prefix_flushed() {
    QueryAnalyzer analyzer;
    StreamSanitizer sanitizer(analyzer, passthrough());
    expect(sanitizer.feed("More text and SEA").text == "More text and ", "possible marker withheld");
    expect(sanitizer.finish().text == "SEA", "withheld text flushed at the end");
    expect(sanitizer.emitted() == "More text and SEA", "nothing lost");
}

void test_sanitizer_cutoff_in_first_line() {
    QueryAnalyzer analyzer;
    StreamSanitizer sanitizer(analyzer);
    expect(sanitizer.feed("I don't have ").text.empty(), "first line held");
    const auto out = sanitizer.feed("real-time access to weather.");
    expect(out.text.empty(), "cutoff text withheld");
    expect(out.signal && out.signal->kind == SanitizerSignal::Kind::Cutoff, "cutoff signalled");
    expect(sanitizer.state() == SanitizerState::CutoffDetected, "cutoff state");
    expect(sanitizer.emitted().empty(), "nothing emitted");
}

void test_sanitizer_releases_clean_first_line() {
    QueryAnalyzer analyzer;
    StreamSanitizer sanitizer(analyzer);
    const auto out = sanitizer.feed("Paris is lovely.\nIt has museums.");
    expect(out.text == "Paris is lovely.\nIt has museums.", "held line released at newline");
    expect(sanitizer.finish().text.empty(), "nothing left");
    expect(!sanitizer.cutoff_seen(), "no cutoff");
}

void test_sanitizer_strips_markers_when_tools_disabled() {
    QueryAnalyzer analyzer;
    SanitizerOptions options = passthrough();
    options.allow_tool_calls = false;
    StreamSanitizer sanitizer(analyzer, options);
    std::string visible = sanitizer.feed("Answer GOOGLE: hidden\nvisible").text;
    const auto tail = sanitizer.finish();
    visible += tail.text;
    expect(visible == "Answer visible", "marker line stripped: " + visible);
    expect(!tail.signal, "no signal");
}

void test_sanitizer_observe_mode() {
    QueryAnalyzer analyzer;
    SanitizerOptions options = passthrough();
    options.cutoff = CutoffMode::Observe;
    StreamSanitizer sanitizer(analyzer, options);
    expect(sanitizer.feed("My training data ends in 2023.").text == "My training data ends in 2023.", "passed");
    const auto out = sanitizer.finish();
    expect(!out.signal, "observe never signals");
    expect(sanitizer.cutoff_seen(), "cutoff recorded");
}

void test_sanitizer_markers_at_end() {
    QueryAnalyzer analyzer;
    StreamSanitizer weather(analyzer, passthrough());
    const auto out = weather.feed("WEATHER: Paris\n");
    expect(out.signal && out.signal->tool->kind == ToolKind::Weather && out.signal->tool->query == "Paris",
           "weather marker");

    StreamSanitizer recall(analyzer, passthrough());
    expect(!recall.feed("RECALL: 7").signal, "unterminated body buffered");
    const auto tail = recall.finish();
    expect(tail.signal && tail.signal->tool->kind == ToolKind::Recall && tail.signal->tool->query == "7",
           "marker completed at end of stream");
}

// ============================================================================
// Phase 5: Events, extraction and fetching
// ============================================================================

void test_event_emitter_closes_after_terminal() {
    Recorder recorder;
    CancellationToken cancel;
    EventEmitter events(recorder.sink(), cancel);
    expect(events.status("analyzing", "Analyzing request"), "status delivered");
    expect(events.token("Hello"), "token delivered");
    expect(events.token(""), "empty token is a no-op");
    Response response;
    response.text = "Hello";
    expect(events.done(response), "done delivered");
    expect(!events.token("late"), "closed after done");
    expect(!events.error("internal", "late"), "single terminal event");
    expect(recorder.events.size() == 3, "three events");
    expect_well_formed(recorder, "emitter");
    expect(recorder.events.back().to_json().string_or("event", "") == "done", "event name");
    expect(!cancel.cancelled(), "request not cancelled");
}

void test_event_emitter_sink_failure_cancels() {
    int delivered = 0;
    CancellationToken cancel;
    EventEmitter events(
        [&](const StreamEvent& event) {
            (void)event;
            return ++delivered < 2;
        },
        cancel);
    expect(events.status("analyzing", "a"), "first event delivered");
    expect(!events.token("b"), "failed delivery reported");
    expect(cancel.cancelled(), "consumer loss cancels the request");
    expect(!events.token("c"), "no further deliveries");
    expect(delivered == 2, "sink not called after failure");
}

void test_extract_weather_and_html() {
    const std::string weather = extract::weather(kWttrParis);
    expect(weather.rfind("Current Weather in Paris, France:", 0) == 0, "wttr header: " + weather);
    expect(weather.find("Partly cloudy") != std::string::npos, "conditions");
    expect(weather.find("18") != std::string::npos, "temperature");
    expect(extract::weather("not json").empty(), "unparseable weather is empty");

    const std::string text = extract::html_to_text("<p>Hello &amp; welcome</p><script>x()</script>");
    expect(text.find("Hello & welcome") != std::string::npos, "entities decoded: " + text);
    expect(text.find("x()") == std::string::npos, "scripts dropped");
}

void test_extract_html_keeps_visible_text() {
    expect(extract::html_to_text("<p>If 1 < 2 and 3 > 2 then the sky is blue.</p>")
               == "If 1 < 2 and 3 > 2 then the sky is blue.",
           "bare angle brackets are text");
    const std::string link = extract::html_to_text("<p><a title=\"a>b\" href=\"/x\">Paris</a> is the capital.</p>");
    expect(link == "Paris is the capital.", "attributes never leak: " + link);
    expect(extract::html_to_text("<p>a&nbsp;b</p><p>c</p>") == "a b\nc", "paragraphs become lines");

    const std::string page = "<html><body><nav>Main menu</nav>"
                             "<div id=\"mw-content-text\"><p>Paris is the capital of France.<sup>[1]</sup></p>"
                             "<h2 id=\"References\">References</h2><p>Cited work</p></div></body></html>";
    const std::string body = extract::article(page);
    expect(body == "Paris is the capital of France.", "article body isolated: " + body);
}

std::vector<Candidate> five_candidates() {
    std::vector<Candidate> candidates;
    for (int i = 1; i <= 5; ++i) {
        const std::string url = "https://site" + std::to_string(i) + ".example/page";
        candidates.push_back(Candidate{url, "Result " + std::to_string(i), std::string(), std::string()});
    }
    return candidates;
}

void test_fetcher_falls_back_in_order() {
    const Settings settings = test_settings();
    auto cache = make_cache(settings);
    auto pages = std::make_shared<FakePageSource>();
    const auto candidates = five_candidates();
    pages->set(candidates[0].url, 500, "");
    pages->set(candidates[1].url, 200, "");
    pages->set(candidates[2].url, 200, html_page("The third source has the actual answer."));
    pages->set(candidates[3].url, 200, html_page("Never read."));
    pages->set(candidates[4].url, 200, html_page("Never read either."));

    Fetcher fetcher(pages, cache, settings);
    FetchTask task = FetchTask::from_candidates(ToolKind::Web, candidates);
    fetcher.run(task, CancellationToken());

    expect(task.outcome == TaskOutcome::Extracted, "task extracted");
    expect(task.winner() && task.winner()->candidate.url == candidates[2].url, "first usable candidate wins");
    expect(task.attempts[0].state == AttemptState::Failed, "HTTP error fails the attempt");
    expect(task.attempts[1].state == AttemptState::Empty, "empty page");
    expect(task.attempts[3].state == AttemptState::Pending && task.attempts[4].state == AttemptState::Pending,
           "later candidates untouched");
    expect(task.attempted() == 3, "three attempts");
    expect(!pages->was_fetched(candidates[3].url) && !pages->was_fetched(candidates[4].url),
           "later candidates never fetched");
    expect(task.winner()->content.find("actual answer") != std::string::npos, "extracted text");

    FetchTask again = FetchTask::from_candidates(ToolKind::Web, candidates);
    fetcher.run(again, CancellationToken());
    expect(again.winner() && again.winner()->from_cache, "extracted page served from the url cache");
    const auto log = pages->fetched();
    expect(std::count(log.begin(), log.end(), candidates[2].url) == 1, "winner fetched once");
}

void test_fetcher_runs_tasks_concurrently() {
    const Settings settings = test_settings();
    auto cache = make_cache(settings);
    auto pages = std::make_shared<FakePageSource>();
    std::vector<FetchTask> tasks;
    for (int i = 0; i < 3; ++i) {
        const std::string url = "https://chain" + std::to_string(i) + ".example/";
        pages->set(url, 200, html_page("Chain " + std::to_string(i) + " content."));
        tasks.push_back(FetchTask::from_candidates(ToolKind::Web, {Candidate{url, "", "", ""}}));
    }
    tasks.push_back(FetchTask::from_candidates(ToolKind::Web, {}));
    Fetcher fetcher(pages, cache, settings);
    fetcher.run(tasks, CancellationToken());
    for (int i = 0; i < 3; ++i) {
        expect(tasks[static_cast<std::size_t>(i)].outcome == TaskOutcome::Extracted, "every chain extracted");
    }
    expect(tasks[3].outcome == TaskOutcome::FailedOverall, "empty chain fails");
}

void test_fetcher_cancelled_before_start() {
    const Settings settings = test_settings();
    auto cache = make_cache(settings);
    auto pages = std::make_shared<FakePageSource>();
    std::vector<FetchTask> tasks = {FetchTask::from_candidates(ToolKind::Web, five_candidates()),
                                    FetchTask::from_candidates(ToolKind::Web, five_candidates())};
    CancellationToken cancel;
    cancel.cancel();
    Fetcher(pages, cache, settings).run(tasks, cancel);
    expect(tasks[0].outcome == TaskOutcome::FailedOverall && tasks[1].outcome == TaskOutcome::FailedOverall,
           "cancelled tasks fail");
    expect(pages->fetched().empty(), "nothing fetched after cancellation");
}

// ============================================================================
// Phase 6: Orchestration
// ============================================================================

void test_weather_scenario() {
    Harness h({"It is 18 degrees and partly cloudy in Paris."});
    h.pages->set(kWttrUrl, 200, kWttrParis);
    const Response response = h.orchestrator->run(prompt_only("What's the weather in Paris?"));

    expect(response.search_performed, "search performed");
    expect(response.search_type == "weather" && response.search_query == "Paris", "weather tool");
    expect(!response.cache_hit, "first lookup misses");
    expect(response.source == "wttr.in" && response.source_url == kWttrUrl, "source reported");
    expect(response.search_id.has_value(), "search id assigned");
    expect(response.text == "It is 18 degrees and partly cloudy in Paris.", "answer text");
    expect(h.backend->calls() == 1, "one generation");
    expect(h.backend->system_of(0).find("Current Weather in Paris, France") != std::string::npos,
           "weather injected into the system prompt");
    expect(h.search->queries.empty(), "weather needs no search provider");

    const auto entry = h.cache->peek(CacheKey::query(ToolKind::Weather, "Paris"));
    expect(entry && entry->ttl == h.settings.cache.weather_ttl, "weather ttl");
    expect(h.cache->stats().url_entries == 1, "page cached by url");
}

void test_cache_hit_scenario() {
    auto now = std::make_shared<CacheClock::time_point>(CacheClock::now());
    Harness h({"First answer.", "Second answer."}, [now]() { return *now; });
    h.pages->set(kWttrUrl, 200, kWttrParis);
    const Response first = h.orchestrator->run(prompt_only("What's the weather in Paris?"));
    *now += 60s;
    const Response second = h.orchestrator->run(prompt_only("What's the weather in Paris?"));

    expect(second.cache_hit, "second request hits");
    expect(second.search_id == first.search_id, "same entry");
    expect(second.source_url == first.source_url, "same source");
    expect(h.pages->fetched().size() == 1, "no second fetch");
    expect(second.text == "Second answer.", "answer regenerated");
    const auto entry = h.cache->peek(CacheKey::query(ToolKind::Weather, "Paris"));
    expect(entry && entry->last_access == *now, "last access refreshed");
    expect(entry->hits >= 1, "hit recorded");
}

void setup_ceo_search(Harness& h) {
    SearchResults results;
    results.candidates.push_back(
        Candidate{"https://news.example.com/ceo", "CEO news", "Leadership change announced.", "news.example.com"});
    h.search->set(ToolKind::Web, results);
    h.pages->set("https://news.example.com/ceo", 200,
                 html_page("The company named a new chief executive in the spring."));
}

const char* kCutoffReply = "I'm sorry, I don't have real-time access to that information.";
const char* kSuppressedReply = "As of my last update, I am not aware of a change.";

void test_cutoff_reroute_scenario() {
    Harness h({kCutoffReply, "GOOGLE: Twitter CEO", kSuppressedReply});
    setup_ceo_search(h);
    const Response response = h.orchestrator->run(prompt_only("Who is the CEO of Twitter?"));

    expect(response.cutoff_reroutes == 1, "one re-route");
    expect(response.search_type == "web" && response.search_query == "Twitter CEO", "extracted query used");
    expect(response.retrieval_suppressed, "second cutoff suppressed");
    expect(response.text == kSuppressedReply, "synthesized answer returned");
    expect(h.backend->calls() == 3, "answer, extraction, synthesis");
    expect(h.backend->system_of(2).find("chief executive") != std::string::npos, "page content injected");
    expect(h.search->queries.size() == 1 && h.search->queries[0].second == "Twitter CEO", "one search");
    expect(response.source == "news.example.com", "source host");
}

void test_search_fields_follow_decision() {
    Harness h({kCutoffReply, "GOOGLE: Twitter CEO", "First answer.", kCutoffReply, "GOOGLE: Twitter CEO",
               "Second answer.", "Paris is the capital of France."});
    setup_ceo_search(h);
    const Response fetched = h.orchestrator->run(prompt_only("Who is the CEO of Twitter?"));
    expect(fetched.search_performed && !fetched.cache_hit, "re-routed search fetches");
    expect(fetched.search_type == "web" && fetched.search_query == "Twitter CEO", "tool decision reported");

    const Response cached = h.orchestrator->run(prompt_only("Who is the CEO of Twitter?"));
    expect(cached.cutoff_reroutes == 1, "re-routed again");
    expect(cached.search_performed && cached.cache_hit, "re-routed search served from cache");
    expect(cached.search_type == "web" && cached.search_query == "Twitter CEO", "cache-hit decision reported");
    expect(cached.search_id == fetched.search_id, "same entry");
    expect(h.search->queries.size() == 1, "one search overall");

    const Response direct = h.orchestrator->run(prompt_only("What is the capital of France?"));
    expect(!direct.search_performed && !direct.cache_hit, "direct answer searches nothing");
    expect(direct.search_type.empty() && direct.search_query.empty(), "no search fields on a direct answer");
}

void no_reroutes(Settings& settings) {
    settings.max_cutoff_reroutes = 0;
}

void test_cutoff_without_reroute_budget() {
    Harness h({kCutoffReply}, &CacheClock::now, &no_reroutes);
    const Response response = h.orchestrator->run(prompt_only("Who is the CEO of Twitter?"));
    expect(response.cutoff_reroutes == 0, "no re-route");
    expect(!response.search_performed, "no search");
    expect(response.retrieval_suppressed, "cutoff flagged");
    expect(response.text == kCutoffReply, "answer returned as is");
}

void test_cutoff_reroute_streaming() {
    Harness h({kCutoffReply, "GOOGLE: Twitter CEO", kSuppressedReply});
    setup_ceo_search(h);
    Recorder recorder;
    h.orchestrator->stream(prompt_only("Who is the CEO of Twitter?"), recorder.sink());

    expect_well_formed(recorder, "cutoff stream");
    const StreamEvent& done = recorder.events.back();
    expect(done.kind == EventKind::Done, "stream completed");
    expect(recorder.tokens() == kSuppressedReply, "only the synthesized answer streamed: " + recorder.tokens());
    expect(recorder.has_stage("rerouting") && recorder.has_stage("extracting_query"), "re-route visible");
    expect(done.payload.at("cutoff_reroutes").as_number() == 1, "re-route counted");
    expect(done.payload.at("retrieval_suppressed").as_bool(), "suppression reported");
    expect(done.payload.at("response").as_string() == kSuppressedReply, "final text");
}

void test_tool_marker_in_stream() {
    Harness h({"Let me check.\nGOOGLE: Twitter CEO\n", "A new chief executive took over."});
    setup_ceo_search(h);
    Recorder recorder;
    h.orchestrator->stream(prompt_only("Who is the CEO of Twitter?"), recorder.sink());
    expect_well_formed(recorder, "marker stream");
    expect(recorder.events.back().kind == EventKind::Done, "completed");
    expect(recorder.tokens().find("GOOGLE:") == std::string::npos, "marker never streamed");
    expect(recorder.events.back().payload.at("search_query").as_string() == "Twitter CEO", "marker query used");
    expect(h.backend->calls() == 2, "no extraction call needed");
}

void test_no_data_scenario() {
    Harness h({"Nothing turned up for that question."});
    const Response response = h.orchestrator->run(prompt_only("What do people think about foo bars?"));
    expect(response.search_type == "reddit", "reddit tool");
    expect(response.no_data, "no data flagged");
    expect(!response.search_id.has_value(), "nothing cached");
    expect(h.cache->stats().query_entries == 0, "failed retrieval not admitted");
    expect(h.backend->system_of(0).find("no data retrieved") != std::string::npos, "model told about the failure");
}

void test_recall_scenario() {
    Harness h({"Tokio leads."});
    CachePayload payload;
    payload.content = "Tokio is the most used runtime.";
    payload.source_urls = {"https://blog.example.org/runtimes"};
    const auto entry = h.cache->admit(CacheKey::query(ToolKind::Web, "rust async runtimes"), payload, 1h);

    Request request = prompt_only("Summarize that article for me");
    request.history = {{"user", "Which async runtime should I use?"},
                       {"assistant", "Tokio. [search_id: " + std::to_string(entry.search_id) + "]"}};
    const Response response = h.orchestrator->run(request);
    expect(response.search_type == "recall", "recall tool");
    expect(response.search_id == entry.search_id, "same search id");
    expect(response.cache_hit, "served from cache");
    expect(response.source == "blog.example.org", "source preserved");
    expect(h.backend->system_of(0).find("Tokio is the most used runtime.") != std::string::npos, "content injected");
    expect(h.pages->fetched().empty(), "nothing fetched");
}

void test_recall_of_evicted_entry() {
    Harness h({"GOOGLE: rust async runtimes", "I could only answer from memory."});
    Request request = prompt_only("Summarize that article for me");
    request.history = {{"user", "q"}, {"assistant", "a [search_id: 999]"}};
    Recorder recorder;
    h.orchestrator->stream(request, recorder.sink());
    expect_well_formed(recorder, "recall failure stream");
    expect(recorder.has_stage("recall_failed"), "recall failure reported");
    const StreamEvent& done = recorder.events.back();
    expect(done.kind == EventKind::Done, "completed");
    expect(done.payload.at("search_type").as_string() == "web", "fell back to a web search");
    expect(done.payload.at("no_data").as_bool(), "empty search reported");
}

void test_cancelled_request() {
    Harness h({"never used"});
    CancellationToken cancel;
    cancel.cancel();
    bool threw = false;
    try {
        (void)h.orchestrator->run(prompt_only("Explain gravity"), cancel);
    } catch (const net::CancelledError&) {
        threw = true;
    }
    expect(threw, "cancelled run throws");

    Recorder recorder;
    h.orchestrator->stream(prompt_only("Explain gravity"), recorder.sink(), cancel);
    expect_well_formed(recorder, "cancelled stream");
    expect(recorder.events.back().kind == EventKind::Error, "error event");
    expect(recorder.events.back().payload.at("kind").as_string() == "cancelled", "cancelled kind");
    expect(h.backend->calls() == 0, "backend never called");
}

void test_consumer_disconnect_cancels() {
    Harness h({"Gravity pulls masses together.\nMore text here."});
    CancellationToken cancel;
    std::vector<StreamEvent> seen;
    h.orchestrator->stream(
        prompt_only("Explain gravity"),
        [&](const StreamEvent& event) {
            seen.push_back(event);
            return event.kind != EventKind::Token;
        },
        cancel);
    expect(cancel.cancelled(), "request cancelled when the consumer leaves");
    expect(!seen.empty() && seen.back().kind == EventKind::Token, "nothing delivered after the failed token");
}

void small_context(Settings& settings) {
    settings.tokens.default_context = 500;
}

void test_context_limit_reported() {
    Harness h({"never used"}, &CacheClock::now, &small_context);
    bool threw = false;
    try {
        (void)h.orchestrator->run(prompt_only("Explain gravity"));
    } catch (const ContextLimitError&) {
        threw = true;
    }
    expect(threw, "context limit thrown");

    Recorder recorder;
    h.orchestrator->stream(prompt_only("Explain gravity"), recorder.sink());
    expect_well_formed(recorder, "context limit stream");
    expect(recorder.events.back().payload.at("kind").as_string() == "context_limit_exceeded", "kind reported");
    expect(h.backend->calls() == 0, "backend never called");
}

void test_generation_error_reported() {
    Harness h(std::vector<std::string>{});
    Recorder recorder;
    h.orchestrator->stream(prompt_only("Explain gravity"), recorder.sink());
    expect_well_formed(recorder, "generation error stream");
    expect(recorder.events.back().kind == EventKind::Error, "error event");
    expect(recorder.events.back().payload.at("kind").as_string() == "generation_error", "generation error kind");
}

void test_error_kinds() {
    expect(error_kind_of(ContextLimitError("x", 2, 1)) == "context_limit_exceeded", "context limit");
    expect(error_kind_of(chat::GenerationError("x", true)) == "generation_timeout", "timeout");
    expect(error_kind_of(chat::GenerationError("x")) == "generation_error", "generation");
    expect(error_kind_of(net::CancelledError("x")) == "cancelled", "cancelled");
    expect(error_kind_of(std::runtime_error("x")) == "internal", "internal");
}

// ============================================================================
// Phase 7: Service loop
// ============================================================================

std::vector<Json> lines_for(const std::string& output, const std::string& id) {
    std::vector<Json> lines;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        auto doc = Json::try_parse(line);
        expect(doc && doc->is_object(), "output line is JSON: " + line);
        if (doc->string_or("id", "") == id) {
            lines.push_back(*doc);
        }
    }
    return lines;
}

void test_service_loop() {
    Harness h({"Plants turn light into sugar.", "Gravity pulls masses together."});
    Service service(*h.orchestrator, h.cache);
    std::istringstream in(
        "{\"id\":1,\"method\":\"cache.stats\"}\n"
        "not json\n"
        "\n"
        "{\"id\":\"b\",\"method\":\"nope\"}\n"
        "{\"id\":\"c\",\"method\":\"chat\",\"params\":{\"prompt\":\"Explain photosynthesis\"}}\n"
        "{\"id\":\"d\",\"method\":\"chat.stream\",\"params\":{\"prompt\":\"Explain gravity\"}}\n"
        "{\"id\":\"e\",\"method\":\"cache.recent\",\"params\":{\"limit\":5}}\n"
        "{\"id\":\"f\",\"method\":\"chat\",\"params\":{}}\n");
    std::ostringstream out;
    service.run(in, out);
    const std::string output = out.str();

    const auto stats = lines_for(output, "1");
    expect(stats.size() == 1 && stats[0].find("result")->find("query_entries"), "stats result");

    const auto unknown = lines_for(output, "b");
    expect(unknown.size() == 1, "one reply to unknown method");
    expect(unknown[0].find("error")->string_or("message", "").find("unknown method") != std::string::npos,
           "unknown method error");

    const auto chat = lines_for(output, "c");
    expect(chat.size() == 1 && chat[0].find("result")->string_or("response", "") == "Plants turn light into sugar.",
           "chat result");

    const auto streamed = lines_for(output, "d");
    expect(streamed.size() >= 3, "events then result");
    for (std::size_t i = 0; i + 1 < streamed.size(); ++i) {
        expect(streamed[i].find("event") != nullptr, "event lines precede the result");
    }
    expect(streamed.back().find("result")->string_or("response", "") == "Gravity pulls masses together.",
           "stream result");

    const auto recent = lines_for(output, "e");
    expect(recent.size() == 1 && recent[0].find("result")->find("entries")->as_array().empty(), "recent entries");

    const auto invalid = lines_for(output, "f");
    expect(invalid.size() == 1 && invalid[0].find("error"), "missing prompt rejected");

    std::size_t parse_errors = 0;
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.find("request is not a JSON object") != std::string::npos) {
            ++parse_errors;
        }
    }
    expect(parse_errors == 1, "malformed line answered once");
}

} // namespace

int main() {
    log::set_level(log::Level::Error);
    std::cout << "=== lookout tests ===\n";

    std::cout << "\n[Phase 1] JSON and text normalization\n";
    run_test("JSON parse and dump", test_json_parse_and_dump);
    run_test("normalize and tokenize", test_normalize_and_tokenize);
    run_test("similarity scores", test_similarity_scores);

    std::cout << "\n[Phase 2] Similarity cache\n";
    run_test("similar query lookup", test_cache_similar_lookup);
    run_test("best candidate wins", test_cache_best_candidate_wins);
    run_test("TTL expiry", test_cache_ttl_expiry);
    run_test("LRU eviction", test_cache_lru_eviction);
    run_test("single flight populate", test_cache_single_flight);
    run_test("failed populate not admitted", test_cache_failed_populate_not_admitted);
    run_test("persistence across restarts", test_cache_persistence);
    run_test("corrupt files load empty", test_cache_corrupt_files);
    run_test("canonical url", test_canonical_url);

    std::cout << "\n[Phase 3] Token budgets\n";
    run_test("token estimate", test_token_estimate);
    run_test("fit keeps newest units", test_token_fit_keeps_newest_units);
    run_test("fit clips under a large reservation", test_token_fit_clips_when_reservation_is_large);
    run_test("fit rejects oversized prompt", test_token_fit_rejects_oversized_prompt);
    run_test("accommodate clips content", test_token_accommodate_clips_content);
    run_test("accommodate drops history first", test_token_accommodate_drops_history_first);
    run_test("model limits and probe", test_token_model_limits);
    run_test("context probe runs unlocked", test_token_probe_runs_unlocked);

    std::cout << "\n[Phase 4] Query analysis and stream sanitizing\n";
    run_test("routing", test_analyzer_routing);
    run_test("freshness", test_analyzer_freshness);
    run_test("cutoff phrases", test_analyzer_cutoff_phrases);
    run_test("marker parsing", test_analyzer_markers);
    run_test("model size", test_analyzer_model_size);
    run_test("sanitizer strips tags", test_sanitizer_strips_tags);
    run_test("sanitizer split marker", test_sanitizer_split_marker);
    run_test("sanitizer flushes partial prefix", test_sanitizer_partial_prefix_flushed);
    run_test("sanitizer cutoff in first line", test_sanitizer_cutoff_in_first_line);
    run_test("sanitizer releases clean first line", test_sanitizer_releases_clean_first_line);
    run_test("sanitizer strips markers without tools", test_sanitizer_strips_markers_when_tools_disabled);
    run_test("sanitizer observe mode", test_sanitizer_observe_mode);
    run_test("sanitizer markers at end", test_sanitizer_markers_at_end);

    std::cout << "\n[Phase 5] Events, extraction and fetching\n";
    run_test("emitter closes after terminal", test_event_emitter_closes_after_terminal);
    run_test("sink failure cancels", test_event_emitter_sink_failure_cancels);
    run_test("weather and html extraction", test_extract_weather_and_html);
    run_test("html keeps visible text", test_extract_html_keeps_visible_text);
    run_test("fetcher falls back in order", test_fetcher_falls_back_in_order);
    run_test("fetcher runs tasks concurrently", test_fetcher_runs_tasks_concurrently);
    run_test("fetcher cancelled before start", test_fetcher_cancelled_before_start);

    std::cout << "\n[Phase 6] Orchestration\n";
    run_test("weather lookup", test_weather_scenario);
    run_test("cache hit on repeat", test_cache_hit_scenario);
    run_test("cutoff re-route", test_cutoff_reroute_scenario);
    run_test("cutoff without re-route budget", test_cutoff_without_reroute_budget);
    run_test("search fields follow the decision", test_search_fields_follow_decision);
    run_test("cutoff re-route streaming", test_cutoff_reroute_streaming);
    run_test("tool marker in stream", test_tool_marker_in_stream);
    run_test("no data retrieved", test_no_data_scenario);
    run_test("recall", test_recall_scenario);
    run_test("recall of evicted entry", test_recall_of_evicted_entry);
    run_test("cancelled request", test_cancelled_request);
    run_test("consumer disconnect cancels", test_consumer_disconnect_cancels);
    run_test("context limit reported", test_context_limit_reported);
    run_test("generation error reported", test_generation_error_reported);
    run_test("error kinds", test_error_kinds);

    std::cout << "\n[Phase 7] Service loop\n";
    run_test("request loop", test_service_loop);

    std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
    return g_tests_passed == g_tests_run ? 0 : 1;
}
