#pragma once

#include "bridge.hpp"
#include "cache.hpp"
#include "orchestrator.hpp"

#include <istream>
#include <memory>
#include <ostream>

namespace lookout {

// Request loop over a line-oriented stream. Methods: chat, chat.stream, cache.stats,
// cache.recent, cache.clear and cache.purge.
class Service {
public:
    Service(Orchestrator& orchestrator, std::shared_ptr<SimilarityCache> cache, Bridge bridge = Bridge());

    void run(std::istream& in, std::ostream& out);

private:
    Orchestrator* m_orchestrator;
    std::shared_ptr<SimilarityCache> m_cache;
    Bridge m_bridge;

    Json handle_request(const Bridge::Request& request);
    void handle_chat_stream(const Bridge::Request& request, std::ostream& out);
};

} // namespace lookout
