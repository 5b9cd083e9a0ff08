#include "../include/lookout/cache.hpp"

#include "../include/lookout/log.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace lookout {

namespace {

constexpr int kFileVersion = 1;

std::int64_t to_millis(CacheClock::time_point point) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(point.time_since_epoch()).count();
}

CacheClock::time_point from_millis(double millis) {
    return CacheClock::time_point(
        std::chrono::duration_cast<CacheClock::duration>(std::chrono::milliseconds(static_cast<std::int64_t>(millis))));
}

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

bool is_tracking_parameter(std::string_view name) {
    const std::string lowered = lowercase(name);
    return lowered.rfind("utm_", 0) == 0 || lowered == "fbclid" || lowered == "gclid" || lowered == "ref"
           || lowered == "ref_src" || lowered == "mc_cid" || lowered == "mc_eid";
}

Json entry_to_json(const CacheEntry& entry) {
    JsonArray sources;
    for (const auto& url : entry.payload.source_urls) {
        sources.emplace_back(Json(url));
    }
    JsonObject obj;
    obj["fingerprint"] = Json(entry.fingerprint);
    obj["tool"] = Json(std::string(tool_name(entry.payload.tool)));
    obj["query"] = Json(entry.payload.query);
    obj["content"] = Json(entry.payload.content);
    obj["source_urls"] = Json(std::move(sources));
    obj["search_id"] = Json(entry.search_id);
    obj["created_ms"] = Json(static_cast<long long>(to_millis(entry.created)));
    obj["last_access_ms"] = Json(static_cast<long long>(to_millis(entry.last_access)));
    obj["hits"] = Json(entry.hits);
    obj["ttl_s"] = Json(static_cast<long long>(entry.ttl.count()));
    obj["signature"] = entry.signature.to_json();
    return Json(std::move(obj));
}

} // namespace

std::string_view namespace_name(Namespace ns) {
    return ns == Namespace::Query ? "query" : "url";
}

std::string canonical_url(std::string_view url) {
    std::string text(url);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.pop_back();
    }
    if (const auto hash = text.find('#'); hash != std::string::npos) {
        text.erase(hash);
    }

    std::string scheme = "https";
    std::size_t rest_start = 0;
    if (const auto sep = text.find("://"); sep != std::string::npos) {
        scheme = lowercase(text.substr(0, sep));
        rest_start = sep + 3;
    }
    const std::size_t path_start = text.find_first_of("/?", rest_start);
    std::string host = lowercase(text.substr(rest_start, path_start == std::string::npos ? std::string::npos
                                                                                          : path_start - rest_start));
    if (host.rfind("www.", 0) == 0) {
        host.erase(0, 4);
    }
    if ((scheme == "https" && host.size() > 4 && host.compare(host.size() - 4, 4, ":443") == 0)
        || (scheme == "http" && host.size() > 3 && host.compare(host.size() - 3, 3, ":80") == 0)) {
        host.erase(host.rfind(':'));
    }

    std::string path;
    std::string query;
    if (path_start != std::string::npos) {
        const std::string tail = text.substr(path_start);
        const auto question = tail.find('?');
        path = tail.substr(0, question);
        if (question != std::string::npos) {
            query = tail.substr(question + 1);
        }
    }
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    if (path == "/") {
        path.clear();
    }

    std::vector<std::string> params;
    std::istringstream stream(query);
    std::string param;
    while (std::getline(stream, param, '&')) {
        if (param.empty()) {
            continue;
        }
        const std::string name = param.substr(0, param.find('='));
        if (!is_tracking_parameter(name)) {
            params.push_back(param);
        }
    }
    std::sort(params.begin(), params.end());

    std::string canonical = scheme + "://" + host + path;
    for (std::size_t i = 0; i < params.size(); ++i) {
        canonical += (i == 0 ? '?' : '&');
        canonical += params[i];
    }
    return canonical;
}

std::string fingerprint(const CacheKey& key) {
    if (key.ns == Namespace::Url) {
        return canonical_url(key.text);
    }
    std::ostringstream oss;
    oss << tool_name(key.tool) << ':' << std::hex << std::setw(16) << std::setfill('0')
        << fnv1a_64(normalize_text(key.text));
    return oss.str();
}

Json CacheStats::to_json() const {
    JsonObject obj;
    obj["query_entries"] = Json(query_entries);
    obj["url_entries"] = Json(url_entries);
    obj["hits"] = Json(hits);
    obj["misses"] = Json(misses);
    obj["admissions"] = Json(admissions);
    obj["evictions"] = Json(evictions);
    obj["populations"] = Json(populations);
    return Json(std::move(obj));
}

class SimilarityCache::KeyLockGuard {
public:
    KeyLockGuard(SimilarityCache& cache, std::string fp)
        : m_cache(cache), m_fp(std::move(fp)), m_lock(cache.acquire_key_lock(m_fp)) {
        m_waited = !m_lock->mutex.try_lock();
        if (m_waited) {
            m_lock->mutex.lock();
        }
    }

    ~KeyLockGuard() {
        m_lock->mutex.unlock();
        m_cache.release_key_lock(m_fp);
    }

    KeyLockGuard(const KeyLockGuard&) = delete;
    KeyLockGuard& operator=(const KeyLockGuard&) = delete;

    bool waited() const noexcept { return m_waited; }

private:
    SimilarityCache& m_cache;
    std::string m_fp;
    std::shared_ptr<KeyLock> m_lock;
    bool m_waited = false;
};

SimilarityCache::SimilarityCache(CacheSettings settings, SimilarityModel model, ClockFn clock)
    : m_settings(std::move(settings)), m_model(std::move(model)), m_clock(std::move(clock)) {}

SimilarityCache::~SimilarityCache() = default;

std::filesystem::path SimilarityCache::file_for(Namespace ns) const {
    return m_settings.directory / (ns == Namespace::Query ? "query_cache.json" : "url_cache.json");
}

void SimilarityCache::load() {
    if (!m_settings.persist) {
        return;
    }
    load_namespace(Namespace::Query);
    load_namespace(Namespace::Url);
    const CacheStats loaded = stats();
    log::info("Cache", "loaded " + std::to_string(loaded.query_entries) + " query and "
                           + std::to_string(loaded.url_entries) + " url entries from "
                           + m_settings.directory.string());
}

void SimilarityCache::load_namespace(Namespace ns) {
    const auto path = file_for(ns);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        log::warn("Cache", "cannot read " + path.string() + ", starting empty");
        return;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    const auto doc = Json::try_parse(buffer.str());
    const Json* entries = doc ? doc->find("entries") : nullptr;
    if (!entries || !entries->is_array()) {
        log::warn("Cache", std::string(namespace_name(ns)) + " cache file " + path.string()
                               + " is corrupted, starting empty");
        return;
    }

    const auto now = m_clock();
    std::size_t skipped = 0;
    std::size_t expired = 0;
    std::unique_lock lock(m_mutex);
    auto& target = table(ns);
    std::uint64_t next_id = static_cast<std::uint64_t>(doc->number_or("next_search_id", 1.0));

    for (const auto& item : entries->as_array()) {
        if (!item.is_object()) {
            ++skipped;
            continue;
        }
        const auto tool = parse_tool(item.string_or("tool", std::string()));
        const std::string fp = item.string_or("fingerprint", std::string());
        const Json* sources = item.find("source_urls");
        const Json* signature = item.find("signature");
        if (!tool || fp.empty() || !sources || !sources->is_array() || !item.find("created_ms")
            || !item.find("ttl_s")) {
            ++skipped;
            continue;
        }

        CacheEntry entry;
        entry.fingerprint = fp;
        entry.payload.tool = *tool;
        entry.payload.query = item.string_or("query", std::string());
        entry.payload.content = item.string_or("content", std::string());
        for (const auto& url : sources->as_array()) {
            if (url.is_string()) {
                entry.payload.source_urls.push_back(url.as_string());
            }
        }
        entry.search_id = static_cast<std::uint64_t>(item.number_or("search_id", 0.0));
        entry.created = from_millis(item.number_or("created_ms", 0.0));
        entry.last_access = from_millis(item.number_or("last_access_ms", item.number_or("created_ms", 0.0)));
        entry.hits = static_cast<std::uint64_t>(item.number_or("hits", 0.0));
        entry.ttl = std::chrono::seconds(static_cast<long long>(item.number_or("ttl_s", 0.0)));

        if (ns == Namespace::Query) {
            auto restored = signature ? m_model.restore(*signature) : std::nullopt;
            if (!restored || fp != fingerprint(CacheKey::query(*tool, entry.payload.query))) {
                ++skipped;
                continue;
            }
            entry.signature = std::move(*restored);
        } else if (fp != canonical_url(fp)) {
            ++skipped;
            continue;
        }

        if (entry.expired(now)) {
            ++expired;
            continue;
        }
        next_id = std::max(next_id, entry.search_id + 1);
        target.insert_or_assign(fp, std::move(entry));
    }
    m_next_search_id = std::max(m_next_search_id, next_id);
    evict_locked(target, now);

    if (skipped > 0) {
        log::warn("Cache", "dropped " + std::to_string(skipped) + " malformed " + std::string(namespace_name(ns))
                               + " cache entries");
    }
    if (expired > 0) {
        log::debug("Cache", "evicted " + std::to_string(expired) + " expired " + std::string(namespace_name(ns))
                                + " cache entries on load");
    }
}

Json SimilarityCache::snapshot(Namespace ns) const {
    JsonArray entries;
    std::uint64_t next_id = 0;
    {
        std::shared_lock lock(m_mutex);
        for (const auto& [fp, entry] : table(ns)) {
            entries.emplace_back(entry_to_json(entry));
        }
        next_id = m_next_search_id;
    }
    JsonObject doc;
    doc["version"] = Json(kFileVersion);
    doc["namespace"] = Json(std::string(namespace_name(ns)));
    doc["next_search_id"] = Json(next_id);
    doc["entries"] = Json(std::move(entries));
    return Json(std::move(doc));
}

void SimilarityCache::persist(Namespace ns) {
    if (!m_settings.persist) {
        return;
    }
    std::scoped_lock file_lock(m_file_mutex);
    const std::string text = snapshot(ns).dump();
    const auto path = file_for(ns);
    auto temp = path;
    temp += ".tmp";

    std::error_code ec;
    std::filesystem::create_directories(m_settings.directory, ec);
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            log::error("Cache", "cannot write " + temp.string());
            return;
        }
        out << text;
        if (!out.flush()) {
            log::error("Cache", "short write to " + temp.string());
            return;
        }
    }
    std::filesystem::rename(temp, path, ec);
    if (ec) {
        log::error("Cache", "cannot replace " + path.string() + ": " + ec.message());
    }
}

void SimilarityCache::flush() {
    persist(Namespace::Query);
    persist(Namespace::Url);
}

std::optional<CacheLookup> SimilarityCache::find_locked(const CacheKey& key, const std::string& fp,
                                                        CacheClock::time_point now) const {
    const auto& entries = table(key.ns);
    if (auto it = entries.find(fp); it != entries.end() && !it->second.expired(now)) {
        return CacheLookup{it->second, true, 1.0};
    }
    if (key.ns == Namespace::Url) {
        return std::nullopt;
    }

    const Signature incoming = m_model.signature(key.text);
    const CacheEntry* best = nullptr;
    double best_score = 0.0;
    for (const auto& [candidate_fp, entry] : entries) {
        if (entry.payload.tool != key.tool || entry.expired(now)) {
            continue;
        }
        const SimilarityScore score = m_model.score(incoming, entry.signature);
        if (!m_model.qualifies(score)) {
            continue;
        }
        const bool better = !best || score.composite > best_score + 1e-9
                            || (score.composite > best_score - 1e-9 && entry.last_access > best->last_access);
        if (better) {
            best = &entry;
            best_score = score.composite;
        }
    }
    if (!best) {
        return std::nullopt;
    }
    return CacheLookup{*best, false, best_score};
}

std::optional<CacheLookup> SimilarityCache::lookup(const CacheKey& key) {
    const std::string fp = fingerprint(key);
    const auto now = m_clock();
    std::optional<CacheLookup> found;
    {
        std::shared_lock lock(m_mutex);
        found = find_locked(key, fp, now);
    }
    if (!found) {
        ++m_misses;
        return std::nullopt;
    }

    std::unique_lock lock(m_mutex);
    auto& entries = table(key.ns);
    auto it = entries.find(found->entry.fingerprint);
    if (it == entries.end() || it->second.expired(now)) {
        ++m_misses;
        return std::nullopt;
    }
    ++it->second.hits;
    it->second.last_access = now;
    found->entry = it->second;
    ++m_hits;
    return found;
}

std::optional<CacheEntry> SimilarityCache::peek(const CacheKey& key) const {
    std::shared_lock lock(m_mutex);
    if (auto found = find_locked(key, fingerprint(key), m_clock())) {
        return found->entry;
    }
    return std::nullopt;
}

CacheEntry SimilarityCache::admit(const CacheKey& key, CachePayload payload, std::chrono::seconds ttl) {
    const auto now = m_clock();
    CacheEntry entry;
    entry.fingerprint = fingerprint(key);
    if (key.ns == Namespace::Query) {
        entry.signature = m_model.signature(key.text);
    }
    payload.tool = key.tool;
    if (payload.query.empty()) {
        payload.query = key.text;
    }
    entry.payload = std::move(payload);
    entry.created = now;
    entry.last_access = now;
    entry.ttl = ttl;

    std::size_t evicted = 0;
    {
        std::unique_lock lock(m_mutex);
        if (key.ns == Namespace::Query) {
            entry.search_id = m_next_search_id++;
        }
        auto& entries = table(key.ns);
        entries.insert_or_assign(entry.fingerprint, entry);
        evicted = evict_locked(entries, now);
    }
    ++m_admissions;
    m_evictions += evicted;
    log::debug("Cache", "admitted " + std::string(namespace_name(key.ns)) + " entry " + entry.fingerprint);
    persist(key.ns);
    return entry;
}

bool SimilarityCache::invalidate(const CacheKey& key) {
    bool removed = false;
    {
        std::unique_lock lock(m_mutex);
        removed = table(key.ns).erase(fingerprint(key)) > 0;
    }
    if (removed) {
        persist(key.ns);
    }
    return removed;
}

std::size_t SimilarityCache::evict_locked(Table& entries, CacheClock::time_point now) {
    std::size_t evicted = 0;
    for (auto it = entries.begin(); it != entries.end();) {
        if (it->second.expired(now)) {
            it = entries.erase(it);
            ++evicted;
        } else {
            ++it;
        }
    }
    while (entries.size() > m_settings.capacity) {
        auto oldest = std::min_element(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
            return a.second.last_access < b.second.last_access;
        });
        entries.erase(oldest);
        ++evicted;
    }
    return evicted;
}

std::shared_ptr<SimilarityCache::KeyLock> SimilarityCache::acquire_key_lock(const std::string& fp) {
    std::scoped_lock lock(m_locks_mutex);
    auto& slot = m_key_locks[fp];
    if (!slot) {
        slot = std::make_shared<KeyLock>();
    }
    ++slot->users;
    return slot;
}

void SimilarityCache::release_key_lock(const std::string& fp) {
    std::scoped_lock lock(m_locks_mutex);
    if (auto it = m_key_locks.find(fp); it != m_key_locks.end() && --it->second->users == 0) {
        m_key_locks.erase(it);
    }
}

Resolution SimilarityCache::resolve(const CacheKey& key, std::chrono::seconds ttl, const Populate& populate) {
    if (auto found = lookup(key)) {
        return Resolution{found->entry, true, false};
    }

    KeyLockGuard guard(*this, fingerprint(key));
    // Whoever held the lock before us may have admitted the entry already.
    if (auto found = lookup(key)) {
        return Resolution{found->entry, true, guard.waited()};
    }

    ++m_populations;
    std::optional<CachePayload> payload = populate();
    if (!payload) {
        return Resolution{std::nullopt, false, guard.waited()};
    }
    return Resolution{admit(key, std::move(*payload), ttl), false, guard.waited()};
}

std::optional<CacheEntry> SimilarityCache::find_by_search_id(std::uint64_t search_id) {
    const auto now = m_clock();
    std::unique_lock lock(m_mutex);
    for (auto& [fp, entry] : m_queries) {
        if (entry.search_id == search_id && !entry.expired(now)) {
            ++entry.hits;
            entry.last_access = now;
            ++m_hits;
            return entry;
        }
    }
    ++m_misses;
    return std::nullopt;
}

std::vector<CacheEntry> SimilarityCache::recent(std::size_t limit) const {
    const auto now = m_clock();
    std::vector<CacheEntry> result;
    {
        std::shared_lock lock(m_mutex);
        for (const auto& [fp, entry] : m_queries) {
            if (!entry.expired(now)) {
                result.push_back(entry);
            }
        }
    }
    std::sort(result.begin(), result.end(), [](const CacheEntry& a, const CacheEntry& b) {
        return a.created > b.created || (a.created == b.created && a.search_id > b.search_id);
    });
    if (result.size() > limit) {
        result.resize(limit);
    }
    return result;
}

std::size_t SimilarityCache::purge_expired() {
    const auto now = m_clock();
    std::size_t removed = 0;
    {
        std::unique_lock lock(m_mutex);
        for (Table* entries : {&m_queries, &m_urls}) {
            for (auto it = entries->begin(); it != entries->end();) {
                if (it->second.expired(now)) {
                    it = entries->erase(it);
                    ++removed;
                } else {
                    ++it;
                }
            }
        }
    }
    if (removed > 0) {
        m_evictions += removed;
        flush();
    }
    return removed;
}

void SimilarityCache::clear() {
    {
        std::unique_lock lock(m_mutex);
        m_queries.clear();
        m_urls.clear();
    }
    log::info("Cache", "cleared");
    flush();
}

CacheStats SimilarityCache::stats() const {
    CacheStats stats;
    {
        std::shared_lock lock(m_mutex);
        stats.query_entries = m_queries.size();
        stats.url_entries = m_urls.size();
    }
    stats.hits = m_hits.load();
    stats.misses = m_misses.load();
    stats.admissions = m_admissions.load();
    stats.evictions = m_evictions.load();
    stats.populations = m_populations.load();
    return stats;
}

std::size_t SimilarityCache::pending_locks() const {
    std::scoped_lock lock(m_locks_mutex);
    return m_key_locks.size();
}

} // namespace lookout
