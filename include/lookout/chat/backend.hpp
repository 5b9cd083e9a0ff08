#pragma once

#include "../cancel.hpp"
#include "../json.hpp"
#include "../net/http.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace lookout::chat {

struct Message {
    std::string role;
    std::string text;
};

// Receives generated text fragments in order. Returning false stops the generation.
using TokenCallback = std::function<bool(std::string_view)>;

class GenerationError : public std::runtime_error {
public:
    explicit GenerationError(const std::string& what, bool timeout = false)
        : std::runtime_error(what), m_timeout(timeout) {}

    bool timeout() const noexcept { return m_timeout; }

private:
    bool m_timeout;
};

// Failures surface as GenerationError; cancellation surfaces as net::CancelledError.
struct Backend {
    virtual ~Backend() = default;
    virtual std::string complete(const std::string& model, const std::vector<Message>& messages) = 0;
    // Returns false when the callback stopped the stream.
    virtual bool stream(const std::string& model,
                        const std::vector<Message>& messages,
                        const TokenCallback& on_token,
                        const CancellationToken& cancel) = 0;
    // Maximum context length reported by the service, when it exposes one. Transport failures throw.
    virtual std::optional<std::size_t> context_length(const std::string& model) {
        (void)model;
        return std::nullopt;
    }
};

using BackendPtr = std::shared_ptr<Backend>;

enum class Kind {
    Ollama,
    OpenAICompat
};

BackendPtr make_backend(Kind kind, std::string endpoint, std::string api_key, std::chrono::milliseconds timeout);

Kind parse_kind(const std::string& name);
std::string kind_to_string(Kind kind);

} // namespace lookout::chat
