#include "../include/lookout/types.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace lookout {

std::string_view tool_name(ToolKind kind) {
    switch (kind) {
    case ToolKind::Web: return "web";
    case ToolKind::Reddit: return "reddit";
    case ToolKind::Wikipedia: return "wikipedia";
    case ToolKind::Weather: return "weather";
    case ToolKind::Recall: return "recall";
    }
    return "web";
}

std::optional<ToolKind> parse_tool(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "web" || lowered == "google" || lowered == "search") return ToolKind::Web;
    if (lowered == "reddit") return ToolKind::Reddit;
    if (lowered == "wikipedia" || lowered == "wiki") return ToolKind::Wikipedia;
    if (lowered == "weather") return ToolKind::Weather;
    if (lowered == "recall") return ToolKind::Recall;
    return std::nullopt;
}

Request Request::from_json(const Json& params, const std::string& default_model) {
    if (!params.is_object()) {
        throw std::runtime_error("params must be an object");
    }
    Request request;
    const Json* prompt = params.find("prompt");
    if (!prompt || !prompt->is_string() || prompt->as_string().empty()) {
        throw std::runtime_error("missing prompt");
    }
    request.prompt = prompt->as_string();
    request.model = params.string_or("model", default_model);
    request.user_memory = params.string_or("user_memory", std::string());
    request.system_prompt = params.string_or("system_prompt", std::string());

    if (const Json* history = params.find("history"); history && !history->is_null()) {
        if (!history->is_array()) {
            throw std::runtime_error("history must be an array");
        }
        for (const auto& item : history->as_array()) {
            if (!item.is_object()) {
                throw std::runtime_error("history entries must be objects");
            }
            Turn turn;
            turn.role = item.string_or("role", std::string());
            turn.content = item.string_or("content", std::string());
            if (turn.role != "user" && turn.role != "assistant" && turn.role != "system") {
                throw std::runtime_error("history entry has invalid role '" + turn.role + "'");
            }
            request.history.push_back(std::move(turn));
        }
    }
    return request;
}

std::string SearchDecision::describe() const {
    switch (m_kind) {
    case Kind::None: return "none";
    case Kind::CacheHit: return "cache-hit:" + std::string(tool_name(m_tool));
    case Kind::Tool: return "tool:" + std::string(tool_name(m_tool));
    }
    return "none";
}

void Response::record(const SearchDecision& decision) {
    search_performed = decision.searches();
    search_type = search_performed ? std::string(tool_name(decision.tool())) : std::string();
    search_query = decision.query();
    cache_hit = decision.kind() == SearchDecision::Kind::CacheHit;
}

Json TokenUsage::to_json() const {
    JsonObject obj;
    obj["used"] = Json(used);
    obj["limit"] = Json(limit);
    obj["model_max"] = Json(model_max);
    obj["usage_percent"] = Json(std::round(usage_percent * 10.0) / 10.0);
    return Json(std::move(obj));
}

Json Response::to_json() const {
    JsonObject obj;
    obj["response"] = Json(text);
    obj["model"] = Json(model);
    obj["search_performed"] = Json(search_performed);
    obj["search_type"] = search_type.empty() ? Json(nullptr) : Json(search_type);
    obj["search_query"] = search_query.empty() ? Json(nullptr) : Json(search_query);
    obj["source"] = source.empty() ? Json(nullptr) : Json(source);
    obj["source_url"] = source_url.empty() ? Json(nullptr) : Json(source_url);
    obj["search_id"] = search_id ? Json(*search_id) : Json(nullptr);
    obj["cache_hit"] = Json(cache_hit);
    obj["cutoff_reroutes"] = Json(cutoff_reroutes);
    obj["retrieval_suppressed"] = Json(retrieval_suppressed);
    obj["no_data"] = Json(no_data);
    obj["context_messages_count"] = Json(context_messages_count);
    obj["token_usage"] = token_usage.to_json();
    return Json(std::move(obj));
}

} // namespace lookout
