#include "../include/lookout/events.hpp"

#include "../include/lookout/log.hpp"

#include <utility>

namespace lookout {

std::string_view event_kind_name(EventKind kind) {
    switch (kind) {
    case EventKind::Status: return "status";
    case EventKind::Token: return "token";
    case EventKind::Done: return "done";
    case EventKind::Error: return "error";
    }
    return "status";
}

Json StreamEvent::to_json() const {
    JsonObject obj = payload;
    obj["seq"] = Json(seq);
    obj["event"] = Json(std::string(event_kind_name(kind)));
    return Json(std::move(obj));
}

EventEmitter::EventEmitter(EventSink sink, CancellationToken cancel)
    : m_sink(std::move(sink)), m_cancel(std::move(cancel)) {}

bool EventEmitter::status(std::string_view stage, std::string_view message) {
    JsonObject payload;
    payload["stage"] = Json(std::string(stage));
    payload["message"] = Json(std::string(message));
    return send(EventKind::Status, std::move(payload));
}

bool EventEmitter::token(std::string_view text) {
    if (text.empty()) {
        return !closed();
    }
    JsonObject payload;
    payload["content"] = Json(std::string(text));
    return send(EventKind::Token, std::move(payload));
}

bool EventEmitter::done(const Response& response) {
    Json body = response.to_json();
    return send(EventKind::Done, std::move(body.as_object()));
}

bool EventEmitter::error(std::string_view kind, std::string_view message) {
    JsonObject payload;
    payload["kind"] = Json(std::string(kind));
    payload["message"] = Json(std::string(message));
    return send(EventKind::Error, std::move(payload));
}

bool EventEmitter::closed() const {
    std::scoped_lock lock(m_mutex);
    return m_closed;
}

std::uint64_t EventEmitter::sent() const {
    std::scoped_lock lock(m_mutex);
    return m_next_seq - 1;
}

bool EventEmitter::send(EventKind kind, JsonObject payload) {
    std::scoped_lock lock(m_mutex);
    if (m_closed) {
        return false;
    }
    StreamEvent event;
    event.seq = m_next_seq++;
    event.kind = kind;
    event.payload = std::move(payload);
    if (event.terminal()) {
        m_closed = true;
    }
    if (m_sink_failed) {
        return false;
    }
    bool delivered = false;
    try {
        delivered = m_sink(event);
    } catch (const std::exception& ex) {
        log::warn("Events", std::string("sink threw: ") + ex.what());
    }
    if (!delivered) {
        m_sink_failed = true;
        m_cancel.cancel();
        log::info("Events", "consumer went away, cancelling request");
        return false;
    }
    return true;
}

} // namespace lookout
