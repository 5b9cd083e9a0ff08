#include "../include/lookout/bridge.hpp"

namespace lookout {

std::optional<Bridge::Request> Bridge::read_request(std::istream& in) const {
    std::string line;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        Request request;
        auto parsed = Json::try_parse(line);
        if (!parsed || !parsed->is_object()) {
            request.error = "request is not a JSON object";
            return request;
        }
        if (const Json* id = parsed->find("id")) {
            if (id->is_string()) {
                request.id = id->as_string();
            } else if (id->is_number()) {
                request.id = id->dump();
            }
        }
        request.method = parsed->string_or("method", std::string());
        if (const Json* params = parsed->find("params")) {
            request.params = *params;
        }
        return request;
    }
    return std::nullopt;
}

void Bridge::send_response(std::ostream& out, const std::string& id, const Json& result) const {
    JsonObject obj;
    obj["jsonrpc"] = Json("2.0");
    obj["id"] = Json(id);
    obj["result"] = result;
    out << Json(obj).dump() << '\n';
}

void Bridge::send_event(std::ostream& out, const std::string& id, const Json& event) const {
    JsonObject obj;
    obj["jsonrpc"] = Json("2.0");
    obj["id"] = Json(id);
    obj["event"] = event;
    out << Json(obj).dump() << '\n';
}

void Bridge::send_error(std::ostream& out, const std::string& id, const std::string& message,
                        const std::string& kind) const {
    JsonObject err;
    err["code"] = Json(-1);
    err["message"] = Json(message);
    if (!kind.empty()) {
        err["kind"] = Json(kind);
    }
    JsonObject obj;
    obj["jsonrpc"] = Json("2.0");
    obj["id"] = Json(id);
    obj["error"] = Json(err);
    out << Json(obj).dump() << '\n';
}

} // namespace lookout
