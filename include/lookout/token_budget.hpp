#pragma once

#include "config.hpp"
#include "types.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace lookout {

class ContextLimitError : public std::runtime_error {
public:
    ContextLimitError(const std::string& what, std::size_t required, std::size_t limit)
        : std::runtime_error(what), m_required(required), m_limit(limit) {}

    std::size_t required() const noexcept { return m_required; }
    std::size_t limit() const noexcept { return m_limit; }

private:
    std::size_t m_required;
    std::size_t m_limit;
};

enum class SizeClass { Short, Medium, Long };

struct TokenBudget {
    std::size_t limit = 0;
    std::size_t model_max = 0;
    std::size_t consumed = 0;
    std::size_t reserved = 0;

    bool fits() const noexcept { return consumed + reserved <= limit; }
    std::size_t available() const noexcept { return consumed + reserved >= limit ? 0 : limit - consumed - reserved; }
};

// Result of fitting a request into a budget. The history is in chronological order.
struct ContextPlan {
    TokenBudget budget;
    std::string system_prompt;
    std::string prompt;
    std::vector<Turn> history;
    std::size_t fixed_cost = 0;
    std::size_t history_cost = 0;
    std::size_t content_cost = 0;
    std::size_t dropped_turns = 0;
    bool clipped_turn = false;
};

class TokenManager {
public:
    using Counter = std::function<std::size_t(std::string_view)>;
    using ContextProbe = std::function<std::optional<std::size_t>(const std::string& model)>;

    explicit TokenManager(TokenSettings settings);

    // Model families are matched by longest prefix of the model name.
    void register_counter(std::string model_prefix, Counter counter);
    void set_context_probe(ContextProbe probe);

    std::size_t count(std::string_view text, const std::string& model) const;
    std::size_t count_message(std::string_view text, const std::string& model) const;
    std::size_t count_turns(const std::vector<Turn>& turns, const std::string& model) const;

    std::size_t model_max(const std::string& model) const;
    TokenBudget budget_for(const std::string& model) const;

    static std::size_t reserve_for(SizeClass size_class);

    // Keeps system prompt and prompt, retains the newest turn units that fit after reserving
    // reserve_hint for injected content. Throws ContextLimitError when the fixed cost alone overflows.
    ContextPlan fit(const std::string& model,
                    const std::string& system_prompt,
                    const std::vector<Turn>& history,
                    const std::string& prompt,
                    std::size_t reserve_hint) const;

    // Replaces the reservation with the actual content cost, dropping further history if needed.
    // Content is clipped only when it does not fit beside the newest unit; the clipped text is returned.
    std::string accommodate(ContextPlan& plan, const std::string& model, std::string content) const;

    TokenUsage usage(const ContextPlan& plan) const;

    const TokenSettings& settings() const noexcept { return m_settings; }

private:
    const Counter* counter_for(const std::string& model) const;
    std::optional<std::size_t> probed_length(const std::string& model) const;
    std::string clip_to(std::string_view text, std::size_t units, const std::string& model) const;

    TokenSettings m_settings;
    std::vector<std::pair<std::string, Counter>> m_counters;
    ContextProbe m_probe;
    mutable std::mutex m_probe_mutex;
    mutable std::unordered_map<std::string, std::optional<std::size_t>> m_probe_cache;
};

// Upper bound on tokens for typical BPE vocabularies: never less than bytes / 3 or words * 4 / 3.
std::size_t conservative_estimate(std::string_view text);

} // namespace lookout
