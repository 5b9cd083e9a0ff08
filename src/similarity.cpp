#include "../include/lookout/similarity.hpp"

#include "../include/lookout/log.hpp"

#include <algorithm>
#include <bitset>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <regex>
#include <sstream>

namespace lookout {

namespace {

const std::regex& site_operator_regex() {
    static const std::regex pattern(R"(site:\S+\s*)", std::regex::icase);
    return pattern;
}

const std::set<std::string>& stop_words() {
    static const std::set<std::string> words = {
        "a", "an", "the", "is", "are", "was", "were", "be", "been", "am", "what", "whats", "how",
        "hows", "who", "whos", "of", "in", "on", "at", "for", "to", "and", "or", "me", "tell", "about",
        "please", "do", "does", "did", "can", "could", "you", "i", "my", "it", "its", "with", "by",
        "from", "s", "like", "right", "there", "this", "that", "any", "some", "give"};
    return words;
}

std::string trim_copy(std::string_view text) {
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

std::string to_hex(std::uint64_t value) {
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << value;
    return oss.str();
}

std::optional<std::uint64_t> from_hex(const std::string& text) {
    if (text.empty() || text.size() > 16) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    for (char c : text) {
        value <<= 4;
        if (c >= '0' && c <= '9') {
            value |= static_cast<std::uint64_t>(c - '0');
        } else if (c >= 'a' && c <= 'f') {
            value |= static_cast<std::uint64_t>(c - 'a' + 10);
        } else {
            return std::nullopt;
        }
    }
    return value;
}

} // namespace

std::string normalize_text(std::string_view text) {
    const std::string without_site = std::regex_replace(std::string(text), site_operator_regex(), "");
    std::string normalized;
    normalized.reserve(without_site.size());
    bool pending_space = false;
    for (unsigned char c : without_site) {
        if (c == '\'') {
            continue;
        }
        if (std::isalnum(c) || c >= 0x80) {
            if (pending_space && !normalized.empty()) {
                normalized.push_back(' ');
            }
            pending_space = false;
            normalized.push_back(static_cast<char>(std::tolower(c)));
        } else {
            pending_space = true;
        }
    }
    return normalized;
}

std::vector<std::string> tokenize(std::string_view normalized) {
    std::vector<std::string> terms;
    std::istringstream stream{std::string(normalized)};
    std::string word;
    const auto& stops = stop_words();
    while (stream >> word) {
        if (stops.count(word) == 0) {
            terms.push_back(word);
        }
    }
    return terms;
}

std::uint64_t fnv1a_64(std::string_view text) {
    std::uint64_t hash = 1469598103934665603ULL;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

std::uint64_t simhash64(const std::vector<std::string>& terms) {
    if (terms.empty()) {
        return 0;
    }
    int accum[64] = {};
    for (const auto& term : terms) {
        const std::uint64_t h = fnv1a_64(term);
        for (int bit = 0; bit < 64; ++bit) {
            accum[bit] += ((h >> bit) & 1ULL) ? 1 : -1;
        }
    }
    std::uint64_t digest = 0;
    for (int bit = 0; bit < 64; ++bit) {
        if (accum[bit] > 0) {
            digest |= (1ULL << bit);
        }
    }
    return digest;
}

int hamming_distance(std::uint64_t a, std::uint64_t b) {
    return static_cast<int>(std::bitset<64>(a ^ b).count());
}

double jaccard(const std::set<std::string>& a, const std::set<std::string>& b) {
    if (a.empty() || b.empty()) {
        return 0.0;
    }
    std::size_t shared = 0;
    for (const auto& item : a) {
        shared += b.count(item);
    }
    const std::size_t combined = a.size() + b.size() - shared;
    return combined == 0 ? 0.0 : static_cast<double>(shared) / static_cast<double>(combined);
}

double cosine(const std::map<std::string, double>& a, const std::map<std::string, double>& b) {
    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;
    for (const auto& [term, weight] : a) {
        norm_a += weight * weight;
        if (auto it = b.find(term); it != b.end()) {
            dot += weight * it->second;
        }
    }
    for (const auto& [term, weight] : b) {
        norm_b += weight * weight;
    }
    if (norm_a <= 0.0 || norm_b <= 0.0) {
        return 0.0;
    }
    return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

Thesaurus Thesaurus::builtin() {
    Thesaurus thesaurus;
    thesaurus.add_group({"weather", "forecast", "temperature", "conditions"});
    thesaurus.add_group({"latest", "recent", "newest", "current"});
    thesaurus.add_group({"news", "headlines", "updates"});
    thesaurus.add_group({"price", "cost", "pricing"});
    thesaurus.add_group({"movie", "film", "movies", "films"});
    thesaurus.add_group({"car", "automobile", "vehicle", "cars"});
    thesaurus.add_group({"buy", "purchase"});
    thesaurus.add_group({"review", "reviews", "opinion", "opinions"});
    thesaurus.add_group({"phone", "smartphone", "mobile"});
    thesaurus.add_group({"laptop", "notebook"});
    thesaurus.add_group({"election", "vote", "poll", "polls"});
    thesaurus.add_group({"stock", "stocks", "shares", "equity"});
    thesaurus.add_group({"score", "result", "results"});
    thesaurus.add_group({"died", "dead", "death", "passed"});
    thesaurus.add_group({"release", "launch", "released", "launched"});
    thesaurus.add_group({"best", "top", "greatest"});
    thesaurus.add_group({"cheap", "affordable", "inexpensive"});
    thesaurus.add_group({"big", "large", "huge"});
    thesaurus.add_group({"fast", "quick", "rapid"});
    return thesaurus;
}

bool Thesaurus::load(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        log::warn("Similarity", "cannot open synonyms file " + path.string());
        return false;
    }
    std::string line;
    std::size_t groups = 0;
    while (std::getline(in, line)) {
        if (const auto hash = line.find('#'); hash != std::string::npos) {
            line.erase(hash);
        }
        std::vector<std::string> words;
        std::istringstream items(line);
        std::string item;
        while (std::getline(items, item, ',')) {
            std::string word = normalize_text(trim_copy(item));
            if (!word.empty()) {
                words.push_back(std::move(word));
            }
        }
        if (words.size() >= 2) {
            add_group(words);
            ++groups;
        }
    }
    log::info("Similarity", "loaded " + std::to_string(groups) + " synonym groups from " + path.string());
    return true;
}

void Thesaurus::add_group(const std::vector<std::string>& words) {
    const std::size_t id = m_groups.size();
    m_groups.push_back(words);
    for (const auto& word : words) {
        m_index.insert_or_assign(word, id);
    }
}

std::vector<std::string> Thesaurus::synonyms(const std::string& word, std::size_t limit) const {
    std::vector<std::string> result;
    auto it = m_index.find(word);
    if (it == m_index.end()) {
        return result;
    }
    for (const auto& candidate : m_groups[it->second]) {
        if (result.size() >= limit) {
            break;
        }
        if (candidate != word) {
            result.push_back(candidate);
        }
    }
    return result;
}

Json Signature::to_json() const {
    JsonArray term_array;
    for (const auto& term : terms) {
        term_array.emplace_back(Json(term));
    }
    JsonObject obj;
    obj["terms"] = Json(std::move(term_array));
    obj["simhash"] = Json(to_hex(simhash));
    return Json(std::move(obj));
}

SimilarityModel::SimilarityModel(SimilaritySettings settings, Thesaurus thesaurus)
    : m_settings(std::move(settings)), m_thesaurus(std::move(thesaurus)) {}

Signature SimilarityModel::signature(std::string_view text) const {
    return from_terms(tokenize(normalize_text(text)));
}

Signature SimilarityModel::from_terms(std::vector<std::string> terms) const {
    Signature sig;
    sig.terms = std::move(terms);
    for (const auto& term : sig.terms) {
        sig.term_set.insert(term);
        sig.weights[term] += 1.0;
        sig.expanded.insert(term);
        if (m_settings.use_synonyms) {
            for (auto& synonym : m_thesaurus.synonyms(term, m_settings.max_synonyms)) {
                sig.expanded.insert(std::move(synonym));
            }
        }
    }
    sig.simhash = simhash64(sig.terms);
    return sig;
}

std::optional<Signature> SimilarityModel::restore(const Json& json) const {
    const Json* terms = json.find("terms");
    if (!terms || !terms->is_array()) {
        return std::nullopt;
    }
    std::vector<std::string> words;
    for (const auto& term : terms->as_array()) {
        if (!term.is_string()) {
            return std::nullopt;
        }
        words.push_back(term.as_string());
    }
    Signature sig = from_terms(std::move(words));
    const auto stored = from_hex(json.string_or("simhash", std::string()));
    if (!stored || *stored != sig.simhash) {
        return std::nullopt;
    }
    return sig;
}

SimilarityScore SimilarityModel::score(const Signature& a, const Signature& b) const {
    SimilarityScore score;
    if (a.term_set.empty() || b.term_set.empty()) {
        return score;
    }
    score.jaccard = jaccard(a.term_set, b.term_set);
    score.cosine = cosine(a.weights, b.weights);
    score.distance = hamming_distance(a.simhash, b.simhash);
    score.simhash = 1.0 - static_cast<double>(score.distance) / 64.0;
    score.synonym = m_settings.use_synonyms ? jaccard(a.expanded, b.expanded) : score.jaccard;
    score.composite = 0.35 * score.jaccard + 0.35 * score.cosine + 0.15 * score.simhash + 0.15 * score.synonym;
    return score;
}

bool SimilarityModel::qualifies(const SimilarityScore& score) const {
    const bool near_duplicate = score.jaccard >= m_settings.jaccard_threshold
                                && score.distance <= m_settings.simhash_distance;
    return near_duplicate || score.composite >= m_settings.composite_threshold;
}

} // namespace lookout
