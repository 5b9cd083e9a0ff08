#include "../include/lookout/fetcher.hpp"

#include "../include/lookout/extract.hpp"
#include "../include/lookout/log.hpp"
#include "../include/lookout/net/http.hpp"
#include "../include/lookout/tools.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace lookout {

namespace {

bool usable(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") != std::string::npos;
}

// Fetches one URL and runs the tool's extraction, falling back to the reader service for thin pages.
std::optional<CachePayload> fetch_and_extract(const FetchContext& ctx,
                                              ToolKind kind,
                                              Attempt& attempt,
                                              const CancellationToken& cancel) {
    const ToolSpec& spec = tool_spec(kind);
    const std::string& url = attempt.candidate.url;

    std::string text;
    try {
        const Page page = ctx.pages->fetch(url, ctx.fetch.fetch_timeout, cancel);
        if (page.status >= 400) {
            attempt.state = AttemptState::Failed;
            attempt.error = "HTTP " + std::to_string(page.status);
        } else if (spec.extract) {
            text = spec.extract(page.body);
        }
    } catch (const net::TimeoutError& ex) {
        attempt.state = AttemptState::Empty;
        attempt.error = ex.what();
    } catch (const net::CancelledError& ex) {
        attempt.state = AttemptState::Failed;
        attempt.error = ex.what();
        return std::nullopt;
    } catch (const std::exception& ex) {
        attempt.state = AttemptState::Failed;
        attempt.error = ex.what();
    }

    if (spec.reader_fallback && text.size() < ctx.fetch.min_content_chars && !ctx.providers.reader_prefix.empty()
        && !cancel.cancelled()) {
        try {
            const Page page = ctx.pages->fetch(ctx.providers.reader_prefix + url, ctx.fetch.fetch_timeout, cancel);
            if (page.status < 400) {
                std::string rendered = extract::reader_text(page.body);
                if (rendered.size() > text.size()) {
                    text = std::move(rendered);
                    attempt.via_reader = true;
                }
            }
        } catch (const std::exception& ex) {
            log::debug("Fetcher", "reader fallback for " + url + " failed: " + ex.what());
        }
    }

    if (!usable(text)) {
        if (attempt.state == AttemptState::Fetching) {
            attempt.state = AttemptState::Empty;
        }
        return std::nullopt;
    }
    CachePayload payload;
    payload.content = extract::clip_at_sentence(std::move(text), ctx.fetch.max_content_chars);
    payload.source_urls.push_back(url);
    payload.tool = kind;
    payload.query = url;
    return payload;
}

bool advance(const FetchContext& ctx, FetchTask& task, const CancellationToken& cancel) {
    if (task.terminal()) {
        return true;
    }
    if (task.cursor >= task.attempts.size()) {
        task.outcome = TaskOutcome::FailedOverall;
        return true;
    }

    Attempt& attempt = task.attempts[task.cursor];
    attempt.state = AttemptState::Fetching;
    const CacheKey key = CacheKey::url(attempt.candidate.url, task.kind);
    const Resolution resolution = ctx.cache->resolve(key, ttl_for(task.kind, ctx.cache_settings), [&]() {
        return fetch_and_extract(ctx, task.kind, attempt, cancel);
    });

    if (resolution.entry) {
        attempt.state = AttemptState::Extracted;
        attempt.content = resolution.entry->payload.content;
        attempt.from_cache = resolution.hit;
        attempt.error.clear();
    } else if (attempt.state == AttemptState::Fetching) {
        attempt.state = AttemptState::Empty;
    }
    log::debug("Fetcher", attempt.candidate.url + " -> " + std::string(attempt_state_name(attempt.state))
                              + (attempt.from_cache ? " (cached)" : "")
                              + (attempt.error.empty() ? "" : ": " + attempt.error));

    if (attempt.state == AttemptState::Extracted) {
        task.outcome = TaskOutcome::Extracted;
        return true;
    }
    ++task.cursor;
    if (task.cursor >= task.attempts.size()) {
        task.outcome = TaskOutcome::FailedOverall;
        return true;
    }
    return false;
}

void drive(const FetchContext& ctx, FetchTask& task, const CancellationToken& cancel) {
    while (!task.terminal()) {
        if (cancel.cancelled()) {
            task.outcome = TaskOutcome::FailedOverall;
            return;
        }
        advance(ctx, task, cancel);
    }
}

struct Batch {
    std::mutex mutex;
    std::condition_variable done;
    std::vector<FetchTask> tasks;
    std::vector<bool> finished;
    std::size_t next = 0;
    std::size_t running = 0;
};

} // namespace

std::string_view attempt_state_name(AttemptState state) {
    switch (state) {
    case AttemptState::Pending: return "pending";
    case AttemptState::Fetching: return "fetching";
    case AttemptState::Extracted: return "extracted";
    case AttemptState::Empty: return "empty";
    case AttemptState::Failed: return "failed";
    }
    return "pending";
}

FetchTask FetchTask::from_candidates(ToolKind kind, const std::vector<Candidate>& candidates) {
    FetchTask task;
    task.kind = kind;
    for (const auto& candidate : candidates) {
        Attempt attempt;
        attempt.candidate = candidate;
        task.attempts.push_back(std::move(attempt));
    }
    if (task.attempts.empty()) {
        task.outcome = TaskOutcome::FailedOverall;
    }
    return task;
}

const Attempt* FetchTask::winner() const {
    if (outcome != TaskOutcome::Extracted || cursor >= attempts.size()) {
        return nullptr;
    }
    return &attempts[cursor];
}

std::size_t FetchTask::attempted() const {
    return static_cast<std::size_t>(std::count_if(attempts.begin(), attempts.end(), [](const Attempt& attempt) {
        return attempt.state != AttemptState::Pending;
    }));
}

Fetcher::Fetcher(std::shared_ptr<PageSource> pages,
                 std::shared_ptr<SimilarityCache> cache,
                 const Settings& settings)
    : m_ctx(std::make_shared<FetchContext>(
          FetchContext{std::move(pages), std::move(cache), settings.fetch, settings.providers, settings.cache})) {}

bool Fetcher::step(FetchTask& task, const CancellationToken& cancel) const {
    return advance(*m_ctx, task, cancel);
}

void Fetcher::run(FetchTask& task, const CancellationToken& cancel) const {
    drive(*m_ctx, task, cancel);
}

void Fetcher::run(std::vector<FetchTask>& tasks, const CancellationToken& cancel) const {
    if (tasks.empty()) {
        return;
    }

    auto batch = std::make_shared<Batch>();
    batch->tasks = tasks;
    batch->finished.assign(tasks.size(), false);
    const std::size_t workers = std::max<std::size_t>(1, std::min(m_ctx->fetch.concurrency, tasks.size()));
    batch->running = workers;

    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (std::size_t w = 0; w < workers; ++w) {
        threads.emplace_back([batch, ctx = m_ctx, cancel]() {
            while (true) {
                std::size_t index = 0;
                FetchTask task;
                {
                    std::scoped_lock lock(batch->mutex);
                    if (batch->next >= batch->tasks.size()) {
                        break;
                    }
                    index = batch->next++;
                    task = batch->tasks[index];
                }
                try {
                    drive(*ctx, task, cancel);
                } catch (const std::exception& ex) {
                    log::error("Fetcher", std::string("fetch task aborted: ") + ex.what());
                    task.outcome = TaskOutcome::FailedOverall;
                }
                std::scoped_lock lock(batch->mutex);
                batch->tasks[index] = std::move(task);
                batch->finished[index] = true;
            }
            {
                std::scoped_lock lock(batch->mutex);
                --batch->running;
            }
            batch->done.notify_all();
        });
    }

    bool all_done = false;
    {
        std::unique_lock lock(batch->mutex);
        const auto idle = [&]() { return batch->running == 0; };
        while (!idle()) {
            if (cancel.cancelled()) {
                batch->done.wait_for(lock, m_ctx->fetch.cancel_grace, idle);
                break;
            }
            batch->done.wait_for(lock, std::chrono::milliseconds(50), idle);
        }
        all_done = idle();
    }

    for (auto& thread : threads) {
        if (all_done) {
            thread.join();
        } else {
            thread.detach();
        }
    }
    if (!all_done) {
        log::warn("Fetcher", "abandoning fetch workers still running after cancellation");
    }

    std::scoped_lock lock(batch->mutex);
    for (std::size_t i = 0; i < tasks.size(); ++i) {
        if (batch->finished[i]) {
            tasks[i] = batch->tasks[i];
        } else {
            tasks[i].outcome = TaskOutcome::FailedOverall;
        }
    }
}

} // namespace lookout
