#pragma once

#include "cancel.hpp"
#include "config.hpp"
#include "types.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace lookout {

struct Candidate {
    std::string url;
    std::string title;
    std::string snippet;
    std::string source;
};

struct SearchResults {
    std::vector<Candidate> candidates;
    std::string quick_answer;
};

// Query -> ordered candidate URLs for one tool kind.
struct SearchProvider {
    virtual ~SearchProvider() = default;
    virtual SearchResults search(ToolKind kind, const std::string& query, const CancellationToken& cancel) = 0;
};

struct Page {
    long status = 0;
    std::string body;
    std::string content_type;
};

// URL -> raw document. Transport failures and timeouts are thrown.
struct PageSource {
    virtual ~PageSource() = default;
    virtual Page fetch(const std::string& url, std::chrono::milliseconds timeout, const CancellationToken& cancel) = 0;
};

class BraveSearchProvider final : public SearchProvider {
public:
    BraveSearchProvider(ProviderSettings providers, FetchSettings fetch);

    SearchResults search(ToolKind kind, const std::string& query, const CancellationToken& cancel) override;

private:
    ProviderSettings m_providers;
    FetchSettings m_fetch;
};

class HttpPageSource final : public PageSource {
public:
    Page fetch(const std::string& url, std::chrono::milliseconds timeout, const CancellationToken& cancel) override;
};

// Search phrasing per tool kind: "reddit ..." and "wikipedia ..." steer a general web index.
std::string shape_query(ToolKind kind, const std::string& query);

} // namespace lookout
