#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace lookout::extract {

// Visible text of an HTML document; script, style and page chrome are dropped, block elements become lines.
std::string html_to_text(std::string_view html);

// Body text of an encyclopedia article page, without citation markers or edit links.
std::string article(std::string_view html);

// Post and top comments of a discussion thread, from the listing JSON or the thread page.
std::string discussion(std::string_view body);

// Current conditions from an OpenWeather or wttr.in JSON response. Empty when the body is neither.
std::string weather(std::string_view body);

// Text returned by the render-aware reader service, without its metadata header.
std::string reader_text(std::string_view body);

// Cuts at max_chars, preferring the last sentence end in the final 30 percent.
std::string clip_at_sentence(std::string text, std::size_t max_chars);

} // namespace lookout::extract
