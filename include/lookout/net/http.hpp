#pragma once

#include "../cancel.hpp"

#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lookout::net {

using Headers = std::vector<std::pair<std::string, std::string>>;

struct Response {
    long status = 0;
    std::string body;
    std::string content_type;
    std::string effective_url;
};

class HttpError : public std::runtime_error {
public:
    HttpError(const std::string& what, long status) : std::runtime_error(what), m_status(status) {}
    long status() const noexcept { return m_status; }

private:
    long m_status;
};

class TimeoutError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class CancelledError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Returns the response for any HTTP status; throws TimeoutError, CancelledError or
// std::runtime_error for transport failures.
Response get(const std::string& url,
             const Headers& headers,
             std::chrono::milliseconds timeout,
             const CancellationToken* cancel = nullptr);

// Throws HttpError for non-2xx statuses.
std::string post_json(const std::string& url,
                      const std::string& body,
                      const Headers& headers,
                      long timeout_ms = -1);

// Receives body chunks as they arrive. Returning false from the callback stops the transfer.
using ChunkCallback = std::function<bool(std::string_view)>;

// Returns false when the callback stopped the transfer early.
bool post_stream(const std::string& url,
                 const std::string& body,
                 const Headers& headers,
                 const ChunkCallback& on_chunk,
                 std::chrono::milliseconds timeout,
                 const CancellationToken* cancel = nullptr);

std::string url_encode(std::string_view text);

// "https://www.example.com/a?b" -> "www.example.com"
std::string host_of(std::string_view url);

} // namespace lookout::net
