#include "../include/lookout/search.hpp"

#include "../include/lookout/extract.hpp"
#include "../include/lookout/json.hpp"
#include "../include/lookout/log.hpp"
#include "../include/lookout/net/http.hpp"

#include <algorithm>
#include <cctype>

namespace lookout {

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

bool host_matches(const std::string& url, const std::string& domain) {
    const std::string host = net::host_of(url);
    return host == domain || (host.size() > domain.size()
                              && host.compare(host.size() - domain.size() - 1, domain.size() + 1, "." + domain) == 0);
}

bool accepts(ToolKind kind, const std::string& url) {
    switch (kind) {
    case ToolKind::Reddit: return host_matches(url, "reddit.com");
    case ToolKind::Wikipedia: return host_matches(url, "wikipedia.org");
    default: return true;
    }
}

} // namespace

std::string shape_query(ToolKind kind, const std::string& query) {
    const std::string lowered = lowercase(query);
    if (kind == ToolKind::Reddit && lowered.find("reddit") == std::string::npos) {
        return "reddit " + query;
    }
    if (kind == ToolKind::Wikipedia && lowered.find("wikipedia") == std::string::npos) {
        return "wikipedia " + query;
    }
    return query;
}

BraveSearchProvider::BraveSearchProvider(ProviderSettings providers, FetchSettings fetch)
    : m_providers(std::move(providers)), m_fetch(std::move(fetch)) {}

SearchResults BraveSearchProvider::search(ToolKind kind, const std::string& query, const CancellationToken& cancel) {
    SearchResults results;
    if (m_providers.brave_api_key.empty()) {
        log::warn("Search", "no search API key configured, skipping " + std::string(tool_name(kind)) + " search");
        return results;
    }

    std::size_t count = m_fetch.result_count;
    std::string url = m_providers.brave_url + "?q=" + net::url_encode(shape_query(kind, query));
    if (kind == ToolKind::Wikipedia) {
        count = 3;
        url += "&search_lang=en";
    } else if (kind == ToolKind::Reddit) {
        count = 8;
        url += "&freshness=pw";
    }
    url += "&count=" + std::to_string(count);

    const net::Headers headers = {{"Accept", "application/json"},
                                  {"X-Subscription-Token", m_providers.brave_api_key}};
    const net::Response response = net::get(url, headers, m_fetch.search_timeout, &cancel);
    if (response.status != 200) {
        throw net::HttpError("[search] " + std::string(tool_name(kind)) + " search failed with status "
                                 + std::to_string(response.status),
                             response.status);
    }

    const Json doc = Json::parse(response.body);
    if (const Json* infobox = doc.find("infobox")) {
        if (const Json* items = infobox->find("results"); items && items->is_array() && !items->as_array().empty()) {
            const Json& first = items->as_array().front();
            results.quick_answer = first.string_or("long_desc", first.string_or("description", std::string()));
        }
    }
    const Json* web = doc.find("web");
    const Json* items = web ? web->find("results") : nullptr;
    if (!items || !items->is_array()) {
        return results;
    }
    for (const auto& item : items->as_array()) {
        Candidate candidate;
        candidate.url = item.string_or("url", std::string());
        if (candidate.url.empty() || !accepts(kind, candidate.url)) {
            continue;
        }
        candidate.title = extract::html_to_text(item.string_or("title", std::string()));
        candidate.snippet = extract::html_to_text(item.string_or("description", std::string()));
        if (const Json* profile = item.find("profile")) {
            candidate.source = profile->string_or("name", std::string());
        }
        if (candidate.source.empty()) {
            candidate.source = net::host_of(candidate.url);
        }
        results.candidates.push_back(std::move(candidate));
    }
    log::debug("Search", std::to_string(results.candidates.size()) + " " + std::string(tool_name(kind))
                             + " candidates for '" + query + "'");
    return results;
}

Page HttpPageSource::fetch(const std::string& url, std::chrono::milliseconds timeout, const CancellationToken& cancel) {
    const net::Response response = net::get(url, {{"Accept", "text/html,application/json;q=0.9,*/*;q=0.8"}},
                                             timeout, &cancel);
    return Page{response.status, response.body, response.content_type};
}

} // namespace lookout
