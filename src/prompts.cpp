#include "../include/lookout/prompts.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace lookout::prompts {

namespace {

std::string memory_section(std::string_view user_memory) {
    if (user_memory.empty()) {
        return {};
    }
    return "\n\nWhat you know about the user:\n" + std::string(user_memory);
}

} // namespace

std::string today() {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm {};
#if defined(_WIN32)
    localtime_s(&tm, &now);
#else
    localtime_r(&now, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%A, %B %d, %Y");
    return oss.str();
}

std::string direct(bool small_model, std::string_view user_memory) {
    std::ostringstream oss;
    if (small_model) {
        oss << "You are a helpful assistant. Today is " << today() << ".\n"
            << "Answer clearly and briefly. If the question needs current information, reply with only:\n"
            << "SEARCH: <short search query>";
    } else {
        oss << "You are a helpful assistant with access to live tools. Today is " << today() << ".\n\n"
            << "Answer from your own knowledge when you can. When the question needs information you may "
            << "not have, reply with exactly one line and nothing else:\n"
            << "WEATHER: <city>              current weather for a place\n"
            << "REDDIT: <query>              opinions, experiences and discussions\n"
            << "WIKI: <topic>                encyclopedic background\n"
            << "GOOGLE: <query>              news, recent events, anything else\n"
            << "RECALL: <search_id>          reuse an earlier result marked [search_id: N] in this conversation\n\n"
            << "Never mention these commands to the user.";
    }
    oss << memory_section(user_memory);
    return oss.str();
}

std::string extraction() {
    std::ostringstream oss;
    oss << "You turn the user's latest message into one web search. Today is " << today() << ".\n"
        << "Reply with exactly one line in the form KIND: query where KIND is one of\n"
        << "WEATHER (query is the place), REDDIT (opinions and discussions), WIKI (background topics), "
        << "GOOGLE (news, recent events, everything else).\n"
        << "Use the conversation to resolve pronouns. Keep the query short. Do not answer the question.";
    return oss.str();
}

std::string synthesis(std::string_view content, std::string_view user_memory) {
    std::ostringstream oss;
    oss << "You are a helpful assistant. Today is " << today() << ".\n"
        << "The following data was retrieved from the web just now:\n---\n"
        << content << "\n---\n"
        << "INSTRUCTIONS:\n"
        << "- Answer the user's question using the data above; it is more recent than your training data.\n"
        << "- If the data does not answer the question, say so and give your best answer.\n"
        << "- Mention the source when it helps.\n"
        << "- Do not emit search commands.";
    oss << memory_section(user_memory);
    return oss.str();
}

std::string no_data(std::string_view kind, std::string_view query) {
    std::ostringstream oss;
    oss << "[no data retrieved: the " << kind << " search for \"" << query
        << "\" returned nothing usable. Tell the user the lookup failed and answer only from what you know, "
        << "noting that it may be out of date.]";
    return oss.str();
}

} // namespace lookout::prompts
