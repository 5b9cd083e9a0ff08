#include "../include/lookout/cache.hpp"
#include "../include/lookout/chat/backend.hpp"
#include "../include/lookout/config.hpp"
#include "../include/lookout/log.hpp"
#include "../include/lookout/orchestrator.hpp"
#include "../include/lookout/search.hpp"
#include "../include/lookout/serve.hpp"
#include "../include/lookout/similarity.hpp"

#include <exception>
#include <iostream>
#include <memory>

int main() {
    using namespace lookout;

    try {
        Settings settings = resolve_settings();
        log::set_level(log::parse_level(settings.log_level));

        Thesaurus thesaurus = Thesaurus::builtin();
        if (!settings.similarity.synonyms_path.empty()) {
            thesaurus.load(settings.similarity.synonyms_path);
        }

        auto cache = std::make_shared<SimilarityCache>(settings.cache,
                                                       SimilarityModel(settings.similarity, std::move(thesaurus)));
        cache->load();

        const chat::Kind kind = chat::parse_kind(settings.generation.backend);
        chat::BackendPtr backend = chat::make_backend(kind, settings.generation.endpoint, settings.generation.api_key,
                                                      settings.generation.timeout);
        auto search = std::make_shared<BraveSearchProvider>(settings.providers, settings.fetch);
        auto pages = std::make_shared<HttpPageSource>();

        log::info("Main", "backend " + chat::kind_to_string(kind) + " at " + settings.generation.endpoint
                              + ", default model " + settings.generation.default_model);

        Orchestrator orchestrator(settings, backend, cache, search, pages);
        Service service(orchestrator, cache);
        service.run(std::cin, std::cout);

        cache->flush();
    } catch (const std::exception& ex) {
        log::error("Main", std::string("fatal: ") + ex.what());
        return 1;
    }
    return 0;
}
