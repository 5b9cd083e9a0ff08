#include "../include/lookout/token_budget.hpp"

#include "../include/lookout/log.hpp"

#include <algorithm>
#include <cctype>
#include <exception>

namespace lookout {

namespace {

constexpr std::size_t kMessageOverhead = 4;
// Content is embedded inside the system prompt, where the estimate is not strictly additive.
constexpr std::size_t kFramingSlack = 8;

struct Unit {
    std::size_t begin = 0;
    std::size_t end = 0;
    std::size_t cost = 0;
};

// A unit is a user turn plus the assistant turns answering it; stray leading turns form their own units.
std::vector<Unit> group_units(const std::vector<Turn>& history) {
    std::vector<Unit> units;
    for (std::size_t i = 0; i < history.size(); ++i) {
        const bool starts_unit = units.empty() || history[i].role != "assistant";
        if (starts_unit) {
            units.push_back(Unit{i, i + 1, 0});
        } else {
            units.back().end = i + 1;
        }
    }
    return units;
}

bool starts_utf8_char(unsigned char c) {
    return (c & 0xC0) != 0x80;
}

} // namespace

std::size_t conservative_estimate(std::string_view text) {
    std::size_t words = 0;
    bool in_word = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            ++words;
        }
    }
    const std::size_t by_bytes = (text.size() + 2) / 3;
    const std::size_t by_words = (words * 4 + 2) / 3;
    return std::max(by_bytes, by_words);
}

TokenManager::TokenManager(TokenSettings settings) : m_settings(std::move(settings)) {}

void TokenManager::register_counter(std::string model_prefix, Counter counter) {
    m_counters.emplace_back(std::move(model_prefix), std::move(counter));
}

void TokenManager::set_context_probe(ContextProbe probe) {
    std::scoped_lock lock(m_probe_mutex);
    m_probe = std::move(probe);
    m_probe_cache.clear();
}

const TokenManager::Counter* TokenManager::counter_for(const std::string& model) const {
    const Counter* best = nullptr;
    std::size_t best_length = 0;
    for (const auto& [prefix, counter] : m_counters) {
        if (model.rfind(prefix, 0) == 0 && (!best || prefix.size() > best_length)) {
            best = &counter;
            best_length = prefix.size();
        }
    }
    return best;
}

std::size_t TokenManager::count(std::string_view text, const std::string& model) const {
    if (const Counter* counter = counter_for(model)) {
        return (*counter)(text);
    }
    return conservative_estimate(text);
}

std::size_t TokenManager::count_message(std::string_view text, const std::string& model) const {
    return count(text, model) + kMessageOverhead;
}

std::size_t TokenManager::count_turns(const std::vector<Turn>& turns, const std::string& model) const {
    std::size_t total = 0;
    for (const auto& turn : turns) {
        total += count_message(turn.content, model);
    }
    return total;
}

std::optional<std::size_t> TokenManager::probed_length(const std::string& model) const {
    ContextProbe probe;
    {
        std::scoped_lock lock(m_probe_mutex);
        if (!m_probe) {
            return std::nullopt;
        }
        if (auto it = m_probe_cache.find(model); it != m_probe_cache.end()) {
            return it->second;
        }
        probe = m_probe;
    }

    // Runs unlocked; concurrent first requests for a model may each probe once.
    std::optional<std::size_t> length;
    try {
        length = probe(model);
    } catch (const std::exception& ex) {
        log::warn("Tokens", "context length probe for " + model + " failed: " + ex.what());
        return std::nullopt;
    }

    std::scoped_lock lock(m_probe_mutex);
    const auto [it, inserted] = m_probe_cache.emplace(model, length);
    if (inserted && length) {
        log::info("Tokens", "context length for " + model + " is " + std::to_string(*length));
    }
    return it->second;
}

std::size_t TokenManager::model_max(const std::string& model) const {
    if (const auto probed = probed_length(model); probed && *probed > 0) {
        return *probed;
    }

    std::size_t best = 0;
    std::size_t best_length = 0;
    for (const auto& [prefix, limit] : m_settings.model_limits) {
        if (model.rfind(prefix, 0) == 0 && (best == 0 || prefix.size() > best_length)) {
            best = limit;
            best_length = prefix.size();
        }
    }
    return best > 0 ? best : m_settings.default_context;
}

TokenBudget TokenManager::budget_for(const std::string& model) const {
    TokenBudget budget;
    budget.model_max = model_max(model);
    budget.limit = static_cast<std::size_t>(static_cast<double>(budget.model_max) * m_settings.safety_buffer);
    return budget;
}

std::size_t TokenManager::reserve_for(SizeClass size_class) {
    switch (size_class) {
    case SizeClass::Short: return 400;
    case SizeClass::Medium: return 2000;
    case SizeClass::Long: return 4000;
    }
    return 2000;
}

std::string TokenManager::clip_to(std::string_view text, std::size_t units, const std::string& model) const {
    if (count(text, model) <= units) {
        return std::string(text);
    }
    std::size_t low = 0;
    std::size_t high = text.size();
    while (low < high) {
        const std::size_t mid = (low + high + 1) / 2;
        if (count(text.substr(0, mid), model) <= units) {
            low = mid;
        } else {
            high = mid - 1;
        }
    }
    while (low > 0 && !starts_utf8_char(static_cast<unsigned char>(text[low]))) {
        --low;
    }
    std::string clipped(text.substr(0, low));
    if (const auto space = clipped.find_last_of(" \n\t"); space != std::string::npos && space > clipped.size() / 2) {
        clipped.erase(space);
    }
    return clipped;
}

ContextPlan TokenManager::fit(const std::string& model,
                              const std::string& system_prompt,
                              const std::vector<Turn>& history,
                              const std::string& prompt,
                              std::size_t reserve_hint) const {
    ContextPlan plan;
    plan.budget = budget_for(model);
    plan.system_prompt = system_prompt;
    plan.prompt = prompt;
    plan.fixed_cost = count_message(system_prompt, model) + count_message(prompt, model) + m_settings.response_reserve;

    const std::size_t limit = plan.budget.limit;
    if (plan.fixed_cost > limit) {
        throw ContextLimitError("prompt needs " + std::to_string(plan.fixed_cost) + " tokens but " + model
                                    + " allows " + std::to_string(limit),
                                plan.fixed_cost, limit);
    }

    std::vector<Unit> units = group_units(history);
    for (auto& unit : units) {
        for (std::size_t i = unit.begin; i < unit.end; ++i) {
            unit.cost += count_message(history[i].content, model);
        }
    }

    std::size_t reserve = std::min(reserve_hint, limit - plan.fixed_cost);
    std::size_t space = limit - plan.fixed_cost - reserve;

    // Newest unit first; stop at the first one that does not fit so the kept history stays contiguous.
    std::size_t kept_from = units.size();
    std::size_t history_cost = 0;
    for (std::size_t u = units.size(); u-- > 0;) {
        if (history_cost + units[u].cost > space) {
            break;
        }
        history_cost += units[u].cost;
        kept_from = u;
    }

    std::vector<Turn> kept;
    if (kept_from == units.size() && !units.empty()) {
        // The newest unit alone overflows: keep it with clipped contents, shrinking the reservation if needed.
        const Unit& newest = units.back();
        const std::size_t turns = newest.end - newest.begin;
        const std::size_t framing = turns * kMessageOverhead;
        if (framing > space) {
            const std::size_t shortfall = framing - space;
            const std::size_t give = std::min(shortfall, reserve);
            reserve -= give;
            space += give;
        }
        if (framing <= space) {
            const std::size_t per_turn = (space - framing) / turns;
            for (std::size_t i = newest.begin; i < newest.end; ++i) {
                Turn turn = history[i];
                turn.content = clip_to(turn.content, per_turn, model);
                history_cost += count_message(turn.content, model);
                kept.push_back(std::move(turn));
            }
            plan.clipped_turn = true;
            kept_from = units.size() - 1;
        }
    } else if (kept_from < units.size()) {
        kept.assign(history.begin() + static_cast<std::ptrdiff_t>(units[kept_from].begin), history.end());
    }

    plan.history = std::move(kept);
    plan.history_cost = history_cost;
    plan.dropped_turns = history.size() - plan.history.size();
    plan.budget.consumed = plan.fixed_cost + history_cost;
    plan.budget.reserved = reserve;

    if (plan.dropped_turns > 0 || plan.clipped_turn) {
        log::debug("Tokens", "fit " + model + ": dropped " + std::to_string(plan.dropped_turns) + " turns, "
                                 + std::to_string(plan.budget.consumed) + "+" + std::to_string(reserve) + "/"
                                 + std::to_string(limit));
    }
    return plan;
}

std::string TokenManager::accommodate(ContextPlan& plan, const std::string& model, std::string content) const {
    const std::size_t limit = plan.budget.limit;
    std::size_t content_cost = content.empty() ? 0 : count(content, model) + kFramingSlack;

    // Space available to content once the current history is kept.
    auto room = [&]() {
        const std::size_t used = plan.fixed_cost + plan.history_cost;
        return used >= limit ? std::size_t{0} : limit - used;
    };

    if (content_cost > room()) {
        std::vector<Unit> units = group_units(plan.history);
        std::size_t drop_units = 0;
        std::size_t freed = 0;
        std::vector<std::size_t> costs;
        for (const auto& unit : units) {
            std::size_t cost = 0;
            for (std::size_t i = unit.begin; i < unit.end; ++i) {
                cost += count_message(plan.history[i].content, model);
            }
            costs.push_back(cost);
        }
        while (units.size() - drop_units > 1 && content_cost > room() + freed) {
            freed += costs[drop_units];
            ++drop_units;
        }
        if (drop_units > 0) {
            const std::size_t first_kept = units[drop_units].begin;
            plan.history.erase(plan.history.begin(), plan.history.begin() + static_cast<std::ptrdiff_t>(first_kept));
            plan.history_cost -= freed;
            plan.dropped_turns += first_kept;
        }
    }

    if (content_cost > room()) {
        const std::size_t space = room();
        content = clip_to(content, space > kFramingSlack ? space - kFramingSlack : 0, model);
        content_cost = content.empty() ? 0 : count(content, model) + kFramingSlack;
        log::warn("Tokens", "retrieved content clipped to " + std::to_string(content_cost) + " tokens for " + model);
    }

    plan.content_cost = content_cost;
    plan.budget.consumed = plan.fixed_cost + plan.history_cost + content_cost;
    plan.budget.reserved = 0;
    return content;
}

TokenUsage TokenManager::usage(const ContextPlan& plan) const {
    TokenUsage usage;
    const std::size_t reserve = std::min(m_settings.response_reserve, plan.budget.consumed);
    usage.used = plan.budget.consumed - reserve;
    usage.limit = plan.budget.limit;
    usage.model_max = plan.budget.model_max;
    usage.usage_percent = usage.limit == 0 ? 0.0
                                           : static_cast<double>(usage.used) * 100.0 / static_cast<double>(usage.limit);
    return usage;
}

} // namespace lookout
