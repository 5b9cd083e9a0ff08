#include "../include/lookout/tools.hpp"

#include "../include/lookout/extract.hpp"
#include "../include/lookout/net/http.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace lookout {

namespace {

// Spreads ranked results over `width` chains so each chain falls back to lower ranked results.
std::vector<std::vector<Candidate>> interleave(const std::vector<Candidate>& ranked, std::size_t width) {
    width = std::min(width, ranked.size());
    std::vector<std::vector<Candidate>> chains(width);
    for (std::size_t i = 0; i < ranked.size() && width > 0; ++i) {
        chains[i % width].push_back(ranked[i]);
    }
    return chains;
}

CandidatePlan searched(const ToolContext& ctx, const std::string& query, ToolKind kind, std::size_t width) {
    SearchResults results = ctx.search.search(kind, query, ctx.cancel);
    CandidatePlan plan;
    plan.chains = interleave(results.candidates, width);
    plan.listing = std::move(results.candidates);
    plan.quick_answer = std::move(results.quick_answer);
    return plan;
}

CandidatePlan web_candidates(const ToolContext& ctx, const std::string& query) {
    return searched(ctx, query, ToolKind::Web, ctx.settings.fetch.scrape_count);
}

CandidatePlan reddit_candidates(const ToolContext& ctx, const std::string& query) {
    return searched(ctx, query, ToolKind::Reddit, ctx.settings.fetch.scrape_count);
}

CandidatePlan wikipedia_candidates(const ToolContext& ctx, const std::string& query) {
    return searched(ctx, query, ToolKind::Wikipedia, 1);
}

CandidatePlan weather_candidates(const ToolContext& ctx, const std::string& query) {
    const auto& providers = ctx.settings.providers;
    std::vector<Candidate> chain;
    if (!providers.openweather_api_key.empty()) {
        chain.push_back(Candidate{providers.openweather_url + "?q=" + net::url_encode(query) + "&appid="
                                      + net::url_encode(providers.openweather_api_key) + "&units=metric",
                                  "Current weather for " + query, std::string(), "openweathermap.org"});
    }
    if (!providers.wttr_url.empty()) {
        chain.push_back(Candidate{providers.wttr_url + net::url_encode(query) + "?format=j1",
                                  "Current weather for " + query, std::string(), "wttr.in"});
    }
    CandidatePlan plan;
    if (!chain.empty()) {
        plan.chains.push_back(std::move(chain));
    }
    return plan;
}

std::string extract_page(std::string_view body) {
    return extract::html_to_text(body);
}

std::string extract_article(std::string_view body) {
    return extract::article(body);
}

std::string extract_discussion(std::string_view body) {
    return extract::discussion(body);
}

std::string extract_weather(std::string_view body) {
    return extract::weather(body);
}

const ToolSpec kToolTable[] = {
    {ToolKind::Web, SizeClass::Medium, &web_candidates, &extract_page, true},
    {ToolKind::Reddit, SizeClass::Medium, &reddit_candidates, &extract_discussion, true},
    {ToolKind::Wikipedia, SizeClass::Long, &wikipedia_candidates, &extract_article, true},
    {ToolKind::Weather, SizeClass::Short, &weather_candidates, &extract_weather, false},
    {ToolKind::Recall, SizeClass::Long, nullptr, nullptr, false},
};

} // namespace

const ToolSpec& tool_spec(ToolKind kind) {
    for (const auto& spec : kToolTable) {
        if (spec.kind == kind) {
            return spec;
        }
    }
    throw std::logic_error("no tool table row for " + std::string(tool_name(kind)));
}

std::chrono::seconds ttl_for(ToolKind kind, const CacheSettings& settings) {
    switch (kind) {
    case ToolKind::Weather: return settings.weather_ttl;
    case ToolKind::Web: return settings.web_ttl;
    case ToolKind::Reddit: return settings.reddit_ttl;
    case ToolKind::Wikipedia: return settings.wikipedia_ttl;
    case ToolKind::Recall: return settings.default_ttl;
    }
    return settings.default_ttl;
}

std::string assemble_content(ToolKind kind,
                             const std::vector<Section>& sections,
                             const CandidatePlan& plan,
                             std::size_t max_chars) {
    if (kind == ToolKind::Weather) {
        for (const auto& section : sections) {
            if (!section.content.empty()) {
                return section.content + "\nSource: " + section.url;
            }
        }
        return {};
    }

    std::ostringstream oss;
    if (!plan.quick_answer.empty()) {
        oss << "Quick Answer: " << plan.quick_answer << "\n\n";
    }
    for (const auto& section : sections) {
        if (section.content.empty()) {
            continue;
        }
        oss << "=== Content from: " << (section.title.empty() ? section.url : section.title) << " ===\n"
            << "Source: " << section.url << "\n"
            << extract::clip_at_sentence(section.content, max_chars) << "\n\n";
    }
    std::vector<const Candidate*> summaries;
    for (const auto& candidate : plan.listing) {
        const bool scraped = std::any_of(sections.begin(), sections.end(), [&](const Section& section) {
            return section.url == candidate.url && !section.content.empty();
        });
        if (!scraped && !candidate.snippet.empty()) {
            summaries.push_back(&candidate);
        }
    }
    if (!summaries.empty()) {
        oss << "Additional Search Results:\n";
        for (std::size_t i = 0; i < summaries.size(); ++i) {
            oss << (i + 1) << ". " << summaries[i]->title << "\n   " << summaries[i]->snippet << "\n   URL: "
                << summaries[i]->url << "\n";
        }
    }
    std::string content = oss.str();
    while (!content.empty() && (content.back() == '\n' || content.back() == ' ')) {
        content.pop_back();
    }
    return content;
}

} // namespace lookout
