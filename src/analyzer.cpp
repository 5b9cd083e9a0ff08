#include "../include/lookout/analyzer.hpp"

#include "../include/lookout/log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <regex>

namespace lookout {

namespace {

constexpr std::size_t kExtractionTurns = 4;

std::string lowercase(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}

// Curly apostrophes are common in model output; the phrase table uses ASCII ones.
std::string fold_apostrophes(std::string text) {
    static const std::string curly = "\xE2\x80\x99";
    for (auto pos = text.find(curly); pos != std::string::npos; pos = text.find(curly, pos + 1)) {
        text.replace(pos, curly.size(), "'");
    }
    return text;
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

// Drops wrapping quotes or backticks and trailing sentence punctuation.
std::string clean_marker_body(std::string_view body) {
    std::string cleaned = trim(body);
    auto is_quote = [](char c) { return c == '"' || c == '\'' || c == '`'; };
    while (!cleaned.empty() && is_quote(cleaned.front())) {
        cleaned.erase(cleaned.begin());
    }
    while (!cleaned.empty() && (is_quote(cleaned.back()) || cleaned.back() == '.' || cleaned.back() == '?'
                                || cleaned.back() == '!')) {
        cleaned.pop_back();
    }
    return trim(cleaned);
}

const std::regex& typed_marker_regex() {
    static const std::regex pattern(R"((WEATHER|GOOGLE|WEB|REDDIT|WIKIPEDIA|WIKI):\s*(.+?)(?:\n|$))");
    return pattern;
}

const std::regex& search_marker_regex() {
    static const std::regex pattern(R"(SEARCH:\s*(.+?)(?:\n|$))");
    return pattern;
}

const std::regex& recall_marker_regex() {
    static const std::regex pattern(R"(RECALL:\s*\[?(?:search_id:\s*)?(\d+))");
    return pattern;
}

const std::regex& marker_line_regex() {
    static const std::regex pattern(R"((WEATHER|GOOGLE|WEB|REDDIT|WIKIPEDIA|WIKI|SEARCH|RECALL):[ \t]*[^\n]*\n?)");
    return pattern;
}

const std::regex& search_id_regex() {
    static const std::regex pattern(R"(\[search_id:\s*(\d+)\])");
    return pattern;
}

const std::regex& recall_reference_regex() {
    static const std::regex pattern(
        R"(\b(?:that|those|your|the (?:previous|earlier|last|same)|(?:previous|earlier|last))\s+(?:search|searches|result|results|article|source|sources|link|links|page|lookup)\b|\bfrom before\b|\byou (?:found|searched|looked up)\b)",
        std::regex::icase);
    return pattern;
}

const std::regex& weather_regex() {
    static const std::regex pattern(
        R"(\b(?:weather|forecast|temperature)\b.*?\b(?:in|for|at)\s+([a-z][a-z .'-]*[a-z]))",
        std::regex::icase);
    return pattern;
}

const std::regex& reddit_regex() {
    static const std::regex pattern(
        R"(reddit|people think|people saying about|\bopinions?\b|\breviews?\b)", std::regex::icase);
    return pattern;
}

const std::regex& wiki_regex() {
    static const std::regex pattern(R"(\bwiki(?:pedia)?\b)", std::regex::icase);
    return pattern;
}

const std::regex& temporal_regex() {
    static const std::regex pattern(
        R"(\b(?:latest|recent|recently|current|currently|today|tonight|yesterday|this (?:week|month|year)|last (?:week|month)|now|right now|breaking)\b)",
        std::regex::icase);
    return pattern;
}

const std::regex& year_regex() {
    static const std::regex pattern(R"(\b(20\d\d)\b)");
    return pattern;
}

const std::regex& parameter_size_regex() {
    static const std::regex pattern(R"((?:^|[^a-z0-9.])(\d+(?:\.\d+)?)b\b)");
    return pattern;
}

const std::regex& small_name_regex() {
    static const std::regex pattern(R"((?:^|[^a-z])(?:tiny|mini|small))");
    return pattern;
}

const std::vector<std::regex>& cutoff_patterns() {
    static const std::vector<std::regex> patterns = [] {
        const char* phrases[] = {
            R"(knowledge cutoff)",
            R"(knowledge cut-off)",
            R"(don't have information on.*after)",
            R"(don't have.*up-to-date)",
            R"(can't provide.*current)",
            R"(information may be outdated)",
            R"(don't know.*after)",
            R"(real-time access)",
            R"(access to real-time)",
            R"(as of my last update)",
            R"(no specific)",
            R"(no such thing)",
            R"(couldn't find)",
            R"(not officially)",
            R"(not aware of)",
            R"(no official)",
            R"(available yet)",
            R"(don't have information)",
            R"(occurred after my)",
            R"(my training data)",
            R"(don't have.*recent)",
        };
        std::vector<std::regex> compiled;
        for (const char* phrase : phrases) {
            compiled.emplace_back(phrase);
        }
        return compiled;
    }();
    return patterns;
}

int current_year() {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm {};
#if defined(_WIN32)
    localtime_s(&tm, &now);
#else
    localtime_r(&now, &tm);
#endif
    return tm.tm_year + 1900;
}

std::string strip_time_words(std::string place) {
    static const char* suffixes[] = {" right now", " today", " tonight", " tomorrow", " now", " this week",
                                     " this weekend", " currently"};
    bool changed = true;
    while (changed) {
        changed = false;
        const std::string lowered = lowercase(place);
        for (const char* suffix : suffixes) {
            const std::string s(suffix);
            if (lowered.size() > s.size() && lowered.compare(lowered.size() - s.size(), s.size(), s) == 0) {
                place.erase(place.size() - s.size());
                changed = true;
                break;
            }
        }
    }
    return trim(place);
}

} // namespace

QueryAnalyzer::QueryAnalyzer(double small_model_threshold) : m_small_model_threshold(small_model_threshold) {}

Routing QueryAnalyzer::route(const Request& request) const {
    Routing routing;
    const std::string& prompt = request.prompt;

    if (std::regex_search(prompt, recall_reference_regex())) {
        if (const auto id = latest_search_id(request.history)) {
            routing.tool = ToolCall{ToolKind::Recall, std::to_string(*id)};
            log::info("Analyzer", "recall reference to search_id " + std::to_string(*id));
            return routing;
        }
    }

    if (std::smatch match; std::regex_search(prompt, match, weather_regex())) {
        std::string place = strip_time_words(match[1].str());
        if (!place.empty()) {
            routing.tool = ToolCall{ToolKind::Weather, std::move(place)};
            routing.fresh = true;
            return routing;
        }
    }

    if (std::regex_search(prompt, reddit_regex())) {
        routing.tool = ToolCall{ToolKind::Reddit, prompt};
    } else if (std::regex_search(prompt, wiki_regex())) {
        routing.tool = ToolCall{ToolKind::Wikipedia, prompt};
    }
    routing.fresh = needs_fresh_info(prompt);
    return routing;
}

bool QueryAnalyzer::needs_fresh_info(std::string_view prompt) const {
    const std::string text(prompt);
    if (std::regex_search(text, temporal_regex())) {
        return true;
    }
    // Years from last year onward read as a request for recent information.
    const int year = current_year();
    for (std::sregex_iterator it(text.begin(), text.end(), year_regex()), end; it != end; ++it) {
        const int mentioned = std::stoi((*it)[1].str());
        if (mentioned >= year - 1) {
            return true;
        }
    }
    return false;
}

std::vector<Turn> QueryAnalyzer::extraction_messages(const Request& request) const {
    std::vector<Turn> window;
    for (const auto& turn : request.history) {
        if (turn.role != "system") {
            window.push_back(turn);
        }
    }
    if (window.size() > kExtractionTurns) {
        window.erase(window.begin(), window.end() - static_cast<std::ptrdiff_t>(kExtractionTurns));
    }
    return window;
}

ToolCall QueryAnalyzer::parse_extraction(std::string_view text, const std::string& prompt) const {
    if (auto call = parse_marker(text); call && call->kind != ToolKind::Recall && !call->query.empty()) {
        return *call;
    }
    log::warn("Analyzer", "query extraction returned no marker, searching the prompt as is");
    return ToolCall{ToolKind::Web, prompt};
}

std::optional<ToolCall> QueryAnalyzer::parse_marker(std::string_view text) const {
    const std::string input(text);
    std::smatch match;
    if (std::regex_search(input, match, typed_marker_regex())) {
        std::string body = clean_marker_body(match[2].str());
        if (!body.empty()) {
            const auto kind = parse_tool(match[1].str());
            return ToolCall{kind.value_or(ToolKind::Web), std::move(body)};
        }
    }
    if (std::regex_search(input, match, search_marker_regex())) {
        std::string body = clean_marker_body(match[1].str());
        if (!body.empty()) {
            return ToolCall{ToolKind::Web, std::move(body)};
        }
    }
    if (std::regex_search(input, match, recall_marker_regex())) {
        return ToolCall{ToolKind::Recall, match[1].str()};
    }
    return std::nullopt;
}

bool QueryAnalyzer::detect_cutoff(std::string_view text) const {
    const std::string lowered = fold_apostrophes(lowercase(text));
    for (const auto& pattern : cutoff_patterns()) {
        if (std::regex_search(lowered, pattern)) {
            return true;
        }
    }
    return false;
}

std::string QueryAnalyzer::clean_response(std::string_view text) const {
    std::string cleaned = std::regex_replace(std::string(text), marker_line_regex(), "");
    cleaned = std::regex_replace(cleaned, search_id_regex(), "");
    cleaned = trim(cleaned);
    return cleaned.empty() ? trim(text) : cleaned;
}

bool QueryAnalyzer::is_small_model(const std::string& model) const {
    const std::string lowered = lowercase(model);
    if (std::regex_search(lowered, small_name_regex())) {
        return true;
    }
    if (const auto size = parameter_size(lowered)) {
        return *size < m_small_model_threshold;
    }
    return false;
}

std::optional<double> QueryAnalyzer::parameter_size(const std::string& model) {
    const std::string lowered = lowercase(model);
    std::smatch match;
    if (!std::regex_search(lowered, match, parameter_size_regex())) {
        return std::nullopt;
    }
    try {
        return std::stod(match[1].str());
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<std::uint64_t> QueryAnalyzer::latest_search_id(const std::vector<Turn>& history) {
    for (auto it = history.rbegin(); it != history.rend(); ++it) {
        std::optional<std::uint64_t> newest;
        const std::string& content = it->content;
        for (std::sregex_iterator m(content.begin(), content.end(), search_id_regex()), end; m != end; ++m) {
            try {
                newest = std::stoull((*m)[1].str());
            } catch (const std::exception&) {
                continue;
            }
        }
        if (newest) {
            return newest;
        }
    }
    return std::nullopt;
}

} // namespace lookout
