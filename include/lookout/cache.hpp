#pragma once

#include "config.hpp"
#include "json.hpp"
#include "similarity.hpp"
#include "types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace lookout {

enum class Namespace { Query, Url };

std::string_view namespace_name(Namespace ns);

struct CacheKey {
    Namespace ns = Namespace::Query;
    ToolKind tool = ToolKind::Web;
    std::string text;

    static CacheKey query(ToolKind tool, std::string text) { return CacheKey{Namespace::Query, tool, std::move(text)}; }
    static CacheKey url(std::string text, ToolKind tool = ToolKind::Web) { return CacheKey{Namespace::Url, tool, std::move(text)}; }
};

// Lowercase scheme and host, no "www.", no fragment, no tracking parameters, sorted query, no trailing slash.
std::string canonical_url(std::string_view url);

// Query keys hash the normalized text per tool kind; URL keys are the canonical URL.
std::string fingerprint(const CacheKey& key);

struct CachePayload {
    std::string content;
    std::vector<std::string> source_urls;
    ToolKind tool = ToolKind::Web;
    std::string query;
};

using CacheClock = std::chrono::system_clock;

struct CacheEntry {
    std::string fingerprint;
    Signature signature;
    CachePayload payload;
    std::uint64_t search_id = 0;
    CacheClock::time_point created;
    CacheClock::time_point last_access;
    std::uint64_t hits = 0;
    std::chrono::seconds ttl{0};

    bool expired(CacheClock::time_point now) const { return now - created >= ttl; }
};

struct CacheLookup {
    CacheEntry entry;
    bool exact = false;
    double score = 1.0;
};

struct Resolution {
    std::optional<CacheEntry> entry;
    bool hit = false;
    bool waited = false;
};

struct CacheStats {
    std::size_t query_entries = 0;
    std::size_t url_entries = 0;
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t admissions = 0;
    std::uint64_t evictions = 0;
    std::uint64_t populations = 0;

    Json to_json() const;
};

class SimilarityCache {
public:
    using Populate = std::function<std::optional<CachePayload>()>;
    using ClockFn = std::function<CacheClock::time_point()>;

    SimilarityCache(CacheSettings settings, SimilarityModel model, ClockFn clock = &CacheClock::now);
    ~SimilarityCache();

    SimilarityCache(const SimilarityCache&) = delete;
    SimilarityCache& operator=(const SimilarityCache&) = delete;

    // Reads both namespace files. Corrupted files or entries are dropped with a warning.
    void load();
    // Writes both namespace files atomically.
    void flush();

    // Exact fingerprint first, then similarity against live entries of the same tool kind
    // (query namespace only). A hit bumps the hit counter and last-access time.
    std::optional<CacheLookup> lookup(const CacheKey& key);
    // Same as lookup without touching hit bookkeeping or statistics.
    std::optional<CacheEntry> peek(const CacheKey& key) const;

    CacheEntry admit(const CacheKey& key, CachePayload payload, std::chrono::seconds ttl);
    bool invalidate(const CacheKey& key);

    // At most one concurrent populate per fingerprint; other callers wait and read its result.
    Resolution resolve(const CacheKey& key, std::chrono::seconds ttl, const Populate& populate);

    std::optional<CacheEntry> find_by_search_id(std::uint64_t search_id);
    std::vector<CacheEntry> recent(std::size_t limit) const;

    std::size_t purge_expired();
    void clear();

    CacheStats stats() const;
    std::size_t pending_locks() const;

private:
    struct KeyLock {
        std::mutex mutex;
        std::size_t users = 0;
    };

    class KeyLockGuard;

    using Table = std::unordered_map<std::string, CacheEntry>;

    Table& table(Namespace ns) { return ns == Namespace::Query ? m_queries : m_urls; }
    const Table& table(Namespace ns) const { return ns == Namespace::Query ? m_queries : m_urls; }

    std::optional<CacheLookup> find_locked(const CacheKey& key, const std::string& fp,
                                           CacheClock::time_point now) const;
    std::size_t evict_locked(Table& entries, CacheClock::time_point now);
    std::shared_ptr<KeyLock> acquire_key_lock(const std::string& fp);
    void release_key_lock(const std::string& fp);

    std::filesystem::path file_for(Namespace ns) const;
    void load_namespace(Namespace ns);
    Json snapshot(Namespace ns) const;
    void persist(Namespace ns);

    CacheSettings m_settings;
    SimilarityModel m_model;
    ClockFn m_clock;

    mutable std::shared_mutex m_mutex;
    Table m_queries;
    Table m_urls;
    std::uint64_t m_next_search_id = 1;

    mutable std::mutex m_locks_mutex;
    std::unordered_map<std::string, std::shared_ptr<KeyLock>> m_key_locks;

    std::mutex m_file_mutex;

    std::atomic<std::uint64_t> m_hits{0};
    std::atomic<std::uint64_t> m_misses{0};
    std::atomic<std::uint64_t> m_admissions{0};
    std::atomic<std::uint64_t> m_evictions{0};
    std::atomic<std::uint64_t> m_populations{0};
};

} // namespace lookout
