#pragma once

#include "cancel.hpp"
#include "json.hpp"
#include "types.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace lookout {

enum class EventKind { Status, Token, Done, Error };

std::string_view event_kind_name(EventKind kind);

struct StreamEvent {
    std::uint64_t seq = 0;
    EventKind kind = EventKind::Status;
    // Event-specific fields; "seq" and "event" are added by to_json.
    JsonObject payload;

    bool terminal() const noexcept { return kind == EventKind::Done || kind == EventKind::Error; }
    Json to_json() const;
};

// Returns false when the consumer has gone away.
using EventSink = std::function<bool(const StreamEvent&)>;

// Stamps sequence numbers and closes the stream after the first terminal event.
class EventEmitter {
public:
    EventEmitter(EventSink sink, CancellationToken cancel);

    bool status(std::string_view stage, std::string_view message);
    bool token(std::string_view text);
    bool done(const Response& response);
    bool error(std::string_view kind, std::string_view message);

    bool closed() const;
    std::uint64_t sent() const;

private:
    bool send(EventKind kind, JsonObject payload);

    EventSink m_sink;
    CancellationToken m_cancel;
    mutable std::mutex m_mutex;
    std::uint64_t m_next_seq = 1;
    bool m_closed = false;
    bool m_sink_failed = false;
};

} // namespace lookout
