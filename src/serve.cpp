#include "../include/lookout/serve.hpp"

#include "../include/lookout/log.hpp"

#include <algorithm>
#include <chrono>
#include <optional>
#include <stdexcept>

namespace lookout {

namespace {

Json entry_to_json(const CacheEntry& entry) {
    JsonObject obj;
    obj["search_id"] = Json(entry.search_id);
    obj["tool"] = Json(std::string(tool_name(entry.payload.tool)));
    obj["query"] = Json(entry.payload.query);
    JsonArray urls;
    for (const auto& url : entry.payload.source_urls) {
        urls.emplace_back(Json(url));
    }
    obj["source_urls"] = Json(std::move(urls));
    obj["hits"] = Json(entry.hits);
    obj["created"] = Json(static_cast<long long>(
        std::chrono::duration_cast<std::chrono::seconds>(entry.created.time_since_epoch()).count()));
    obj["ttl_seconds"] = Json(static_cast<long long>(entry.ttl.count()));
    obj["content_chars"] = Json(entry.payload.content.size());
    return Json(std::move(obj));
}

std::size_t limit_param(const Json& params, std::size_t fallback) {
    const double raw = params.number_or("limit", static_cast<double>(fallback));
    if (raw < 1.0) {
        return 1;
    }
    return static_cast<std::size_t>(std::min(raw, 1000.0));
}

} // namespace

Service::Service(Orchestrator& orchestrator, std::shared_ptr<SimilarityCache> cache, Bridge bridge)
    : m_orchestrator(&orchestrator), m_cache(std::move(cache)), m_bridge(bridge) {}

void Service::run(std::istream& in, std::ostream& out) {
    while (auto request = m_bridge.read_request(in)) {
        if (!request->error.empty()) {
            log::warn("Service", request->error);
            m_bridge.send_error(out, request->id, request->error);
            out.flush();
            continue;
        }
        try {
            if (request->method == "chat.stream") {
                handle_chat_stream(*request, out);
            } else {
                const Json result = handle_request(*request);
                m_bridge.send_response(out, request->id, result);
            }
            out.flush();
        } catch (const std::exception& ex) {
            log::warn("Service", request->method + " failed: " + ex.what());
            m_bridge.send_error(out, request->id, ex.what(), std::string(error_kind_of(ex)));
            out.flush();
        }
    }
    out.flush();
}

Json Service::handle_request(const Bridge::Request& request) {
    if (request.method == "chat") {
        const Request chat = Request::from_json(request.params, m_orchestrator->settings().generation.default_model);
        return m_orchestrator->run(chat).to_json();
    }
    if (request.method == "cache.stats") {
        return m_cache->stats().to_json();
    }
    if (request.method == "cache.recent") {
        JsonArray entries;
        for (const auto& entry : m_cache->recent(limit_param(request.params, 10))) {
            entries.push_back(entry_to_json(entry));
        }
        JsonObject payload;
        payload["entries"] = Json(std::move(entries));
        return Json(std::move(payload));
    }
    if (request.method == "cache.clear") {
        m_cache->clear();
        JsonObject payload;
        payload["cleared"] = Json(true);
        return Json(std::move(payload));
    }
    if (request.method == "cache.purge") {
        JsonObject payload;
        payload["purged"] = Json(m_cache->purge_expired());
        return Json(std::move(payload));
    }
    throw std::runtime_error("unknown method: " + request.method);
}

void Service::handle_chat_stream(const Bridge::Request& request, std::ostream& out) {
    const Request chat = Request::from_json(request.params, m_orchestrator->settings().generation.default_model);

    std::optional<StreamEvent> terminal;
    m_orchestrator->stream(chat, [&](const StreamEvent& event) {
        if (event.terminal()) {
            terminal = event;
            return true;
        }
        m_bridge.send_event(out, request.id, event.to_json());
        out.flush();
        return static_cast<bool>(out);
    });

    if (!terminal) {
        m_bridge.send_error(out, request.id, "stream ended without a result", "internal");
        return;
    }
    if (terminal->kind == EventKind::Done) {
        m_bridge.send_event(out, request.id, terminal->to_json());
        m_bridge.send_response(out, request.id, Json(terminal->payload));
    } else {
        m_bridge.send_event(out, request.id, terminal->to_json());
        auto field = [&](const char* key) {
            auto it = terminal->payload.find(key);
            return it != terminal->payload.end() && it->second.is_string() ? it->second.as_string() : std::string();
        };
        m_bridge.send_error(out, request.id, field("message"), field("kind"));
    }
}

} // namespace lookout
