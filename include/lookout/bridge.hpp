#pragma once

#include "json.hpp"

#include <istream>
#include <optional>
#include <ostream>
#include <string>

namespace lookout {

// One JSON object per line in each direction.
class Bridge {
public:
    struct Request {
        std::string id;
        std::string method;
        Json params;
        // Set when the line could not be parsed; the request carries nothing else.
        std::string error;
    };

    // Skips blank lines. std::nullopt at end of input.
    std::optional<Request> read_request(std::istream& in) const;
    void send_response(std::ostream& out, const std::string& id, const Json& result) const;
    void send_event(std::ostream& out, const std::string& id, const Json& event) const;
    void send_error(std::ostream& out, const std::string& id, const std::string& message,
                    const std::string& kind = std::string()) const;
};

} // namespace lookout
