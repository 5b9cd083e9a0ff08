#pragma once

#include <string>
#include <string_view>

namespace lookout::prompts {

// "Monday, October 19, 2026"
std::string today();

// Direct-answer system prompt. Small models get the short variant without tool instructions.
std::string direct(bool small_model, std::string_view user_memory);

// First-call prompt that asks the model for a single "KIND: query" line.
std::string extraction();

// Final-call prompt wrapping retrieved content.
std::string synthesis(std::string_view content, std::string_view user_memory);

// Stands in for content when retrieval produced nothing.
std::string no_data(std::string_view kind, std::string_view query);

} // namespace lookout::prompts
