#include "../include/lookout/config.hpp"

#include "../include/lookout/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <string>

namespace lookout {

namespace {

std::optional<std::size_t> parse_size_env(const char* name) {
    if (auto value = read_env(name)) {
        try {
            return static_cast<std::size_t>(std::stoull(*value));
        } catch (const std::exception&) {
            log::warn("Config", std::string("ignoring non-numeric ") + name + "=" + *value);
        }
    }
    return std::nullopt;
}

std::optional<double> parse_double_env(const char* name) {
    if (auto value = read_env(name)) {
        try {
            return std::stod(*value);
        } catch (const std::exception&) {
            log::warn("Config", std::string("ignoring non-numeric ") + name + "=" + *value);
        }
    }
    return std::nullopt;
}

std::optional<bool> parse_bool_env(const char* name) {
    if (auto value = read_env(name)) {
        std::string lowered = *value;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
            return true;
        }
        if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
            return false;
        }
        log::warn("Config", std::string("ignoring non-boolean ") + name + "=" + *value);
    }
    return std::nullopt;
}

void assign_string(std::string& target, const char* name) {
    if (auto value = read_env(name); value && !value->empty()) {
        target = *value;
    }
}

void assign_seconds(std::chrono::seconds& target, const char* name) {
    if (auto value = parse_size_env(name)) {
        target = std::chrono::seconds(static_cast<long long>(*value));
    }
}

void assign_millis(std::chrono::milliseconds& target, const char* name) {
    if (auto value = parse_size_env(name)) {
        target = std::chrono::milliseconds(static_cast<long long>(*value));
    }
}

std::string trim(std::string_view text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return std::string(text.substr(begin, end - begin));
}

} // namespace

std::optional<std::string> read_env(const char* name) {
#ifdef _WIN32
    size_t required = 0;
    char* buffer = nullptr;
    if (_dupenv_s(&buffer, &required, name) != 0) {
        return std::nullopt;
    }
    std::unique_ptr<char, decltype(&std::free)> holder(buffer, &std::free);
    if (!buffer) {
        return std::nullopt;
    }
    return std::string(buffer);
#else
    if (const char* value = std::getenv(name)) {
        return std::string(value);
    }
    return std::nullopt;
#endif
}

std::vector<std::pair<std::string, std::size_t>> parse_model_limits(std::string_view text) {
    std::vector<std::pair<std::string, std::size_t>> limits;
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t comma = text.find(',', start);
        if (comma == std::string_view::npos) {
            comma = text.size();
        }
        const std::string item = trim(text.substr(start, comma - start));
        start = comma + 1;
        const std::size_t colon = item.rfind(':');
        if (item.empty() || colon == std::string::npos || colon == 0) {
            continue;
        }
        try {
            const std::size_t value = static_cast<std::size_t>(std::stoull(item.substr(colon + 1)));
            if (value > 0) {
                limits.emplace_back(trim(item.substr(0, colon)), value);
            }
        } catch (const std::exception&) {
            log::warn("Config", "skipping malformed model limit '" + item + "'");
        }
    }
    return limits;
}

Settings resolve_settings() {
    Settings settings;

    assign_string(settings.generation.backend, "LOOKOUT_BACKEND");
    assign_string(settings.generation.endpoint, "LOOKOUT_ENDPOINT");
    assign_string(settings.generation.api_key, "LOOKOUT_API_KEY");
    assign_string(settings.generation.default_model, "LOOKOUT_MODEL");
    assign_millis(settings.generation.timeout, "LOOKOUT_GENERATION_TIMEOUT_MS");
    if (auto probe = parse_bool_env("LOOKOUT_PROBE_CONTEXT")) {
        settings.generation.probe_context_length = *probe;
    }

    assign_string(settings.providers.brave_api_key, "BRAVE_SEARCH_API_KEY");
    assign_string(settings.providers.brave_api_key, "LOOKOUT_BRAVE_API_KEY");
    assign_string(settings.providers.brave_url, "LOOKOUT_BRAVE_URL");
    assign_string(settings.providers.openweather_api_key, "OPENWEATHER_API_KEY");
    assign_string(settings.providers.openweather_api_key, "LOOKOUT_OPENWEATHER_API_KEY");
    assign_string(settings.providers.openweather_url, "LOOKOUT_OPENWEATHER_URL");
    assign_string(settings.providers.wttr_url, "LOOKOUT_WTTR_URL");
    assign_string(settings.providers.reader_prefix, "LOOKOUT_READER_PREFIX");

    if (auto threshold = parse_double_env("LOOKOUT_SIMILARITY_THRESHOLD")) {
        settings.similarity.composite_threshold = std::clamp(*threshold, 0.0, 1.0);
    }
    if (auto threshold = parse_double_env("LOOKOUT_JACCARD_THRESHOLD")) {
        settings.similarity.jaccard_threshold = std::clamp(*threshold, 0.0, 1.0);
    }
    if (auto distance = parse_size_env("LOOKOUT_SIMHASH_DISTANCE")) {
        settings.similarity.simhash_distance = static_cast<int>(std::min<std::size_t>(*distance, 64));
    }
    if (auto synonyms = parse_bool_env("LOOKOUT_USE_SYNONYMS")) {
        settings.similarity.use_synonyms = *synonyms;
    }
    if (auto max_synonyms = parse_size_env("LOOKOUT_MAX_SYNONYMS")) {
        settings.similarity.max_synonyms = *max_synonyms;
    }
    if (auto path = read_env("LOOKOUT_SYNONYMS_FILE"); path && !path->empty()) {
        settings.similarity.synonyms_path = *path;
    }

    if (auto dir = read_env("LOOKOUT_CACHE_DIR"); dir && !dir->empty()) {
        settings.cache.directory = *dir;
    }
    if (auto persist = parse_bool_env("LOOKOUT_CACHE_PERSIST")) {
        settings.cache.persist = *persist;
    }
    if (auto capacity = parse_size_env("LOOKOUT_CACHE_CAPACITY"); capacity && *capacity > 0) {
        settings.cache.capacity = *capacity;
    }
    assign_seconds(settings.cache.weather_ttl, "LOOKOUT_TTL_WEATHER_S");
    assign_seconds(settings.cache.web_ttl, "LOOKOUT_TTL_WEB_S");
    assign_seconds(settings.cache.reddit_ttl, "LOOKOUT_TTL_REDDIT_S");
    assign_seconds(settings.cache.wikipedia_ttl, "LOOKOUT_TTL_WIKIPEDIA_S");
    assign_seconds(settings.cache.default_ttl, "LOOKOUT_TTL_DEFAULT_S");

    if (auto concurrency = parse_size_env("LOOKOUT_FETCH_CONCURRENCY"); concurrency && *concurrency > 0) {
        settings.fetch.concurrency = *concurrency;
    }
    assign_millis(settings.fetch.fetch_timeout, "LOOKOUT_FETCH_TIMEOUT_MS");
    assign_millis(settings.fetch.search_timeout, "LOOKOUT_SEARCH_TIMEOUT_MS");
    assign_millis(settings.fetch.cancel_grace, "LOOKOUT_CANCEL_GRACE_MS");
    if (auto count = parse_size_env("LOOKOUT_RESULT_COUNT"); count && *count > 0) {
        settings.fetch.result_count = *count;
    }
    if (auto count = parse_size_env("LOOKOUT_SCRAPE_COUNT"); count && *count > 0) {
        settings.fetch.scrape_count = *count;
    }
    if (auto chars = parse_size_env("LOOKOUT_MAX_CONTENT_CHARS"); chars && *chars > 0) {
        settings.fetch.max_content_chars = *chars;
    }

    if (auto buffer = parse_double_env("LOOKOUT_SAFETY_BUFFER"); buffer && *buffer > 0.0 && *buffer <= 1.0) {
        settings.tokens.safety_buffer = *buffer;
    }
    if (auto context = parse_size_env("LOOKOUT_DEFAULT_CONTEXT"); context && *context > 0) {
        settings.tokens.default_context = *context;
    }
    if (auto reserve = parse_size_env("LOOKOUT_RESPONSE_RESERVE")) {
        settings.tokens.response_reserve = *reserve;
    }
    if (auto limits = read_env("LOOKOUT_MODEL_LIMITS")) {
        settings.tokens.model_limits = parse_model_limits(*limits);
    }

    if (auto history = parse_size_env("LOOKOUT_MAX_HISTORY")) {
        settings.max_history_messages = *history;
    }
    if (auto reroutes = parse_size_env("LOOKOUT_MAX_CUTOFF_REROUTES")) {
        settings.max_cutoff_reroutes = static_cast<int>(std::min<std::size_t>(*reroutes, 4));
    }
    if (auto threshold = parse_double_env("LOOKOUT_SMALL_MODEL_THRESHOLD")) {
        settings.small_model_threshold = *threshold;
    }
    assign_string(settings.log_level, "LOOKOUT_LOG_LEVEL");

    return settings;
}

} // namespace lookout
