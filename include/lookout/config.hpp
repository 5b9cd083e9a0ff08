#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lookout {

struct GenerationSettings {
    std::string backend = "ollama";
    std::string endpoint = "http://localhost:11434";
    std::string api_key;
    std::string default_model = "llama3.2";
    std::chrono::milliseconds timeout{120000};
    bool probe_context_length = true;
};

struct ProviderSettings {
    std::string brave_api_key;
    std::string brave_url = "https://api.search.brave.com/res/v1/web/search";
    std::string openweather_api_key;
    std::string openweather_url = "https://api.openweathermap.org/data/2.5/weather";
    std::string wttr_url = "https://wttr.in/";
    std::string reader_prefix = "https://r.jina.ai/";
};

struct SimilaritySettings {
    double composite_threshold = 0.82;
    double jaccard_threshold = 0.7;
    int simhash_distance = 6;
    bool use_synonyms = true;
    std::size_t max_synonyms = 3;
    std::filesystem::path synonyms_path;
};

struct CacheSettings {
    std::filesystem::path directory = "data/cache";
    bool persist = true;
    std::size_t capacity = 500;
    std::chrono::seconds weather_ttl{30 * 60};
    std::chrono::seconds web_ttl{15 * 3600};
    std::chrono::seconds reddit_ttl{8 * 3600};
    std::chrono::seconds wikipedia_ttl{5 * 24 * 3600};
    std::chrono::seconds default_ttl{2 * 3600};
};

struct FetchSettings {
    std::size_t concurrency = 4;
    std::chrono::milliseconds fetch_timeout{10000};
    std::chrono::milliseconds search_timeout{15000};
    std::chrono::milliseconds cancel_grace{2000};
    std::size_t result_count = 5;
    std::size_t scrape_count = 3;
    std::size_t min_content_chars = 200;
    std::size_t max_content_chars = 4000;
};

struct TokenSettings {
    double safety_buffer = 0.9;
    std::size_t default_context = 8192;
    std::size_t response_reserve = 500;
    // Ordered (model prefix, context length) pairs; the longest matching prefix wins.
    std::vector<std::pair<std::string, std::size_t>> model_limits;
};

struct Settings {
    GenerationSettings generation;
    ProviderSettings providers;
    SimilaritySettings similarity;
    CacheSettings cache;
    FetchSettings fetch;
    TokenSettings tokens;
    std::size_t max_history_messages = 30;
    int max_cutoff_reroutes = 1;
    double small_model_threshold = 4.0;
    std::string log_level = "info";
};

// Reads LOOKOUT_* environment variables on top of the defaults above.
Settings resolve_settings();

// "llama3:8192,qwen2.5:32768" -> {{"llama3", 8192}, {"qwen2.5", 32768}}. Malformed items are skipped.
std::vector<std::pair<std::string, std::size_t>> parse_model_limits(std::string_view text);

std::optional<std::string> read_env(const char* name);

} // namespace lookout
