#pragma once

#include "config.hpp"
#include "json.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace lookout {

// Lowercases, drops "site:" operators and punctuation, collapses whitespace.
std::string normalize_text(std::string_view text);

// Splits normalized text into terms with stop words removed.
std::vector<std::string> tokenize(std::string_view normalized);

std::uint64_t fnv1a_64(std::string_view text);
std::uint64_t simhash64(const std::vector<std::string>& terms);
int hamming_distance(std::uint64_t a, std::uint64_t b);

double jaccard(const std::set<std::string>& a, const std::set<std::string>& b);
double cosine(const std::map<std::string, double>& a, const std::map<std::string, double>& b);

class Thesaurus {
public:
    static Thesaurus builtin();

    // One comma separated group per line, '#' starts a comment. Returns false if the file can't be read.
    bool load(const std::filesystem::path& path);
    void add_group(const std::vector<std::string>& words);

    std::vector<std::string> synonyms(const std::string& word, std::size_t limit) const;
    std::size_t size() const noexcept { return m_groups.size(); }

private:
    std::vector<std::vector<std::string>> m_groups;
    std::unordered_map<std::string, std::size_t> m_index;
};

struct Signature {
    std::vector<std::string> terms;
    std::set<std::string> term_set;
    std::map<std::string, double> weights;
    std::set<std::string> expanded;
    std::uint64_t simhash = 0;

    Json to_json() const;
};

struct SimilarityScore {
    double jaccard = 0.0;
    double cosine = 0.0;
    double simhash = 0.0;
    double synonym = 0.0;
    double composite = 0.0;
    int distance = 64;
};

class SimilarityModel {
public:
    SimilarityModel(SimilaritySettings settings, Thesaurus thesaurus);

    Signature signature(std::string_view text) const;
    Signature from_terms(std::vector<std::string> terms) const;
    // Rebuilds a persisted signature; std::nullopt if the stored digest does not match its terms.
    std::optional<Signature> restore(const Json& json) const;

    SimilarityScore score(const Signature& a, const Signature& b) const;
    bool qualifies(const SimilarityScore& score) const;

    const SimilaritySettings& settings() const noexcept { return m_settings; }

private:
    SimilaritySettings m_settings;
    Thesaurus m_thesaurus;
};

} // namespace lookout
