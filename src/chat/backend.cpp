#include "../../include/lookout/chat/backend.hpp"

#include "../../include/lookout/log.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace {

using lookout::Json;
using lookout::JsonArray;
using lookout::JsonObject;
using lookout::chat::GenerationError;
using lookout::chat::Message;

JsonArray serialize_chat_messages(const std::vector<Message>& messages) {
    JsonArray array;
    for (const auto& msg : messages) {
        JsonObject entry;
        entry["role"] = Json(msg.role);
        entry["content"] = Json(msg.text);
        array.emplace_back(Json(entry));
    }
    return array;
}

std::string strip(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
    auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
    if (begin >= end) {
        return std::string();
    }
    return std::string(begin, end);
}

std::string trim_endpoint(std::string endpoint) {
    while (!endpoint.empty() && endpoint.back() == '/') {
        endpoint.pop_back();
    }
    return endpoint;
}

// Maps transport failures onto the generation error taxonomy. Cancellation passes through.
template <typename Fn>
auto translate_errors(const std::string& backend, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const lookout::net::CancelledError&) {
        throw;
    } catch (const GenerationError&) {
        throw;
    } catch (const lookout::net::TimeoutError& ex) {
        throw GenerationError(backend + " timed out: " + ex.what(), true);
    } catch (const std::exception& ex) {
        throw GenerationError(backend + ": " + ex.what());
    }
}

// Splits a byte stream into complete lines; the trailing partial line is kept for the next chunk.
class LineBuffer {
public:
    template <typename OnLine>
    bool feed(std::string_view chunk, OnLine&& on_line) {
        m_pending.append(chunk);
        std::size_t start = 0;
        for (auto pos = m_pending.find('\n'); pos != std::string::npos; pos = m_pending.find('\n', start)) {
            std::string line = m_pending.substr(start, pos - start);
            start = pos + 1;
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (!line.empty() && !on_line(line)) {
                m_pending.erase(0, start);
                return false;
            }
        }
        m_pending.erase(0, start);
        return true;
    }

    std::string take_rest() {
        std::string rest = std::move(m_pending);
        m_pending.clear();
        return rest;
    }

private:
    std::string m_pending;
};

} // namespace

namespace lookout::chat {

namespace {

class OllamaBackend final : public Backend {
public:
    OllamaBackend(std::string endpoint, std::chrono::milliseconds timeout)
        : m_endpoint(trim_endpoint(std::move(endpoint))), m_timeout(timeout) {}

    std::string complete(const std::string& model, const std::vector<Message>& messages) override {
        return translate_errors("ollama", [&] {
            JsonObject payload;
            payload["model"] = Json(model);
            payload["messages"] = Json(serialize_chat_messages(messages));
            payload["stream"] = Json(false);

            const std::string response = net::post_json(m_endpoint + "/api/chat", Json(payload).dump(), {},
                                                         static_cast<long>(m_timeout.count()));
            Json parsed = Json::parse(response);
            if (const Json* error = parsed.find("error"); error && error->is_string()) {
                throw GenerationError("ollama: " + error->as_string());
            }
            if (const Json* message = parsed.find("message")) {
                return strip(message->string_or("content", std::string()));
            }
            return std::string();
        });
    }

    bool stream(const std::string& model,
                const std::vector<Message>& messages,
                const TokenCallback& on_token,
                const CancellationToken& cancel) override {
        return translate_errors("ollama", [&] {
            JsonObject payload;
            payload["model"] = Json(model);
            payload["messages"] = Json(serialize_chat_messages(messages));
            payload["stream"] = Json(true);

            LineBuffer lines;
            bool finished = false;
            auto handle_line = [&](const std::string& line) {
                auto parsed = Json::try_parse(line);
                if (!parsed) {
                    log::warn("Ollama", "skipping malformed stream line");
                    return true;
                }
                if (const Json* error = parsed->find("error"); error && error->is_string()) {
                    throw GenerationError("ollama: " + error->as_string());
                }
                if (const Json* message = parsed->find("message")) {
                    const std::string content = message->string_or("content", std::string());
                    if (!content.empty() && !on_token(content)) {
                        return false;
                    }
                }
                if (parsed->bool_or("done", false)) {
                    finished = true;
                }
                return true;
            };

            const bool completed = net::post_stream(
                m_endpoint + "/api/chat", Json(payload).dump(), {},
                [&](std::string_view chunk) { return lines.feed(chunk, handle_line); }, m_timeout, &cancel);
            if (!completed) {
                return false;
            }
            if (const std::string rest = strip(lines.take_rest()); !rest.empty() && !handle_line(rest)) {
                return false;
            }
            if (!finished) {
                log::warn("Ollama", "stream ended without a done marker");
            }
            return true;
        });
    }

    std::optional<std::size_t> context_length(const std::string& model) override {
        JsonObject payload;
        payload["model"] = Json(model);
        const std::string response = net::post_json(m_endpoint + "/api/show", Json(payload).dump(), {}, 10000);
        const auto parsed = Json::try_parse(response);
        const Json* info = parsed ? parsed->find("model_info") : nullptr;
        if (!info || !info->is_object()) {
            return std::nullopt;
        }
        const std::string suffix = ".context_length";
        for (const auto& [key, value] : info->as_object()) {
            if (key.size() > suffix.size() && key.compare(key.size() - suffix.size(), suffix.size(), suffix) == 0
                && value.is_number() && value.as_number() > 0) {
                return static_cast<std::size_t>(value.as_number());
            }
        }
        return std::nullopt;
    }

private:
    std::string m_endpoint;
    std::chrono::milliseconds m_timeout;
};

class OpenAIBackend final : public Backend {
public:
    OpenAIBackend(std::string endpoint, std::string api_key, std::chrono::milliseconds timeout)
        : m_endpoint(trim_endpoint(std::move(endpoint))),
          m_api_key(std::move(api_key)),
          m_timeout(timeout) {}

    std::string complete(const std::string& model, const std::vector<Message>& messages) override {
        if (messages.empty()) {
            throw GenerationError("openai backend requires at least one message");
        }
        return translate_errors("openai", [&] {
            const std::string response = net::post_json(completions_url(), build_payload(model, messages, false),
                                                        headers(), static_cast<long>(m_timeout.count()));
            Json parsed = Json::parse(response);
            if (parsed.is_object()) {
                const auto& obj = parsed.as_object();
                if (auto choices_it = obj.find("choices"); choices_it != obj.end() && choices_it->second.is_array()) {
                    const auto& choices = choices_it->second.as_array();
                    if (!choices.empty() && choices.front().is_object()) {
                        const auto& choice = choices.front();
                        if (const Json* message = choice.find("message")) {
                            return strip(message->string_or("content", std::string()));
                        }
                        return strip(choice.string_or("text", std::string()));
                    }
                }
            }
            return std::string();
        });
    }

    bool stream(const std::string& model,
                const std::vector<Message>& messages,
                const TokenCallback& on_token,
                const CancellationToken& cancel) override {
        if (messages.empty()) {
            throw GenerationError("openai backend requires at least one message");
        }
        return translate_errors("openai", [&] {
            LineBuffer lines;
            bool finished = false;
            auto handle_line = [&](const std::string& line) {
                if (finished || line.rfind("data:", 0) != 0) {
                    return true;
                }
                const std::string data = strip(line.substr(5));
                if (data == "[DONE]") {
                    finished = true;
                    return true;
                }
                auto parsed = Json::try_parse(data);
                if (!parsed) {
                    log::warn("OpenAI", "skipping malformed event");
                    return true;
                }
                if (const Json* error = parsed->find("error"); error && error->is_object()) {
                    throw GenerationError("openai: " + error->string_or("message", "stream error"));
                }
                const Json* choices = parsed->find("choices");
                if (!choices || !choices->is_array() || choices->as_array().empty()) {
                    return true;
                }
                if (const Json* delta = choices->as_array().front().find("delta")) {
                    const Json* content = delta->find("content");
                    if (content && content->is_string() && !content->as_string().empty()) {
                        return on_token(content->as_string());
                    }
                }
                return true;
            };

            return net::post_stream(
                completions_url(), build_payload(model, messages, true), headers(),
                [&](std::string_view chunk) { return lines.feed(chunk, handle_line); }, m_timeout, &cancel);
        });
    }

private:
    std::string completions_url() const {
        const std::string suffix = "/chat/completions";
        if (m_endpoint.size() >= suffix.size()
            && m_endpoint.compare(m_endpoint.size() - suffix.size(), suffix.size(), suffix) == 0) {
            return m_endpoint;
        }
        return m_endpoint + "/v1/chat/completions";
    }

    std::string build_payload(const std::string& model, const std::vector<Message>& messages, bool stream) const {
        JsonObject payload;
        payload["model"] = Json(model);
        payload["messages"] = Json(serialize_chat_messages(messages));
        payload["stream"] = Json(stream);
        return Json(payload).dump();
    }

    net::Headers headers() const {
        net::Headers list;
        if (!m_api_key.empty()) {
            list.emplace_back("Authorization", "Bearer " + m_api_key);
        }
        return list;
    }

    std::string m_endpoint;
    std::string m_api_key;
    std::chrono::milliseconds m_timeout;
};

} // namespace

BackendPtr make_backend(Kind kind, std::string endpoint, std::string api_key, std::chrono::milliseconds timeout) {
    if (endpoint.empty()) {
        throw std::runtime_error(kind_to_string(kind) + " backend requires endpoint");
    }
    switch (kind) {
    case Kind::Ollama:
        return std::make_shared<OllamaBackend>(std::move(endpoint), timeout);
    case Kind::OpenAICompat:
        return std::make_shared<OpenAIBackend>(std::move(endpoint), std::move(api_key), timeout);
    }
    throw std::runtime_error("unknown chat backend kind");
}

Kind parse_kind(const std::string& name) {
    std::string lowered;
    lowered.reserve(name.size());
    std::transform(name.begin(), name.end(), std::back_inserter(lowered), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lowered == "ollama") return Kind::Ollama;
    if (lowered == "openai" || lowered == "openai_compat" || lowered == "vllm" || lowered == "llamacpp") {
        return Kind::OpenAICompat;
    }
    throw std::runtime_error("unknown chat backend kind: " + name);
}

std::string kind_to_string(Kind kind) {
    switch (kind) {
    case Kind::Ollama: return "ollama";
    case Kind::OpenAICompat: return "openai";
    }
    return "unknown";
}

} // namespace lookout::chat
