#pragma once

#include "cache.hpp"
#include "cancel.hpp"
#include "config.hpp"
#include "search.hpp"
#include "types.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace lookout {

enum class AttemptState { Pending, Fetching, Extracted, Empty, Failed };

std::string_view attempt_state_name(AttemptState state);

struct Attempt {
    Candidate candidate;
    AttemptState state = AttemptState::Pending;
    std::string content;
    std::string error;
    bool from_cache = false;
    bool via_reader = false;
};

enum class TaskOutcome { Pending, Extracted, FailedOverall };

// Ordered candidates; attempts run in declared order and stop at the first extracted one.
struct FetchTask {
    ToolKind kind = ToolKind::Web;
    std::vector<Attempt> attempts;
    std::size_t cursor = 0;
    TaskOutcome outcome = TaskOutcome::Pending;

    static FetchTask from_candidates(ToolKind kind, const std::vector<Candidate>& candidates);

    bool terminal() const noexcept { return outcome != TaskOutcome::Pending; }
    const Attempt* winner() const;
    std::size_t attempted() const;
};

struct FetchContext {
    std::shared_ptr<PageSource> pages;
    std::shared_ptr<SimilarityCache> cache;
    FetchSettings fetch;
    ProviderSettings providers;
    CacheSettings cache_settings;
};

class Fetcher {
public:
    Fetcher(std::shared_ptr<PageSource> pages,
            std::shared_ptr<SimilarityCache> cache,
            const Settings& settings);

    // Attempts the candidate under the cursor. Returns true once the task is terminal.
    bool step(FetchTask& task, const CancellationToken& cancel) const;
    void run(FetchTask& task, const CancellationToken& cancel) const;

    // Runs tasks concurrently on at most fetch.concurrency workers. After cancellation, workers
    // still busy when the grace period ends are abandoned and their tasks reported failed.
    void run(std::vector<FetchTask>& tasks, const CancellationToken& cancel) const;

private:
    std::shared_ptr<const FetchContext> m_ctx;
};

} // namespace lookout
