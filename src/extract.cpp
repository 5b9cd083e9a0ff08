#include "../include/lookout/extract.hpp"

#include "../include/lookout/json.hpp"

#include <gumbo.h>

#include <cctype>
#include <cmath>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <vector>

namespace lookout::extract {

namespace {

// Owns one parse tree; gumbo decodes entities and repairs malformed markup.
class Document {
public:
    explicit Document(std::string_view html)
        : m_output(gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size())) {}
    ~Document() {
        if (m_output) {
            gumbo_destroy_output(&kGumboDefaultOptions, m_output);
        }
    }
    Document(const Document&) = delete;
    Document& operator=(const Document&) = delete;

    const GumboNode* root() const { return m_output ? m_output->root : nullptr; }

private:
    GumboOutput* m_output;
};

bool is_skipped(GumboTag tag) {
    switch (tag) {
    case GUMBO_TAG_SCRIPT:
    case GUMBO_TAG_STYLE:
    case GUMBO_TAG_NOSCRIPT:
    case GUMBO_TAG_SVG:
    case GUMBO_TAG_NAV:
    case GUMBO_TAG_HEADER:
    case GUMBO_TAG_FOOTER:
    case GUMBO_TAG_ASIDE:
    case GUMBO_TAG_FORM:
    case GUMBO_TAG_IFRAME:
    case GUMBO_TAG_TEMPLATE:
    case GUMBO_TAG_HEAD:
        return true;
    default:
        return false;
    }
}

bool is_block(GumboTag tag) {
    switch (tag) {
    case GUMBO_TAG_P:
    case GUMBO_TAG_DIV:
    case GUMBO_TAG_BR:
    case GUMBO_TAG_LI:
    case GUMBO_TAG_UL:
    case GUMBO_TAG_OL:
    case GUMBO_TAG_TR:
    case GUMBO_TAG_TABLE:
    case GUMBO_TAG_SECTION:
    case GUMBO_TAG_ARTICLE:
    case GUMBO_TAG_MAIN:
    case GUMBO_TAG_BLOCKQUOTE:
    case GUMBO_TAG_PRE:
    case GUMBO_TAG_H1:
    case GUMBO_TAG_H2:
    case GUMBO_TAG_H3:
    case GUMBO_TAG_H4:
    case GUMBO_TAG_H5:
    case GUMBO_TAG_H6:
    case GUMBO_TAG_DD:
    case GUMBO_TAG_DT:
        return true;
    default:
        return false;
    }
}

bool has_id(const GumboNode* node, const char* id) {
    const GumboAttribute* attr = gumbo_get_attribute(&node->v.element.attributes, "id");
    return attr != nullptr && std::strcmp(attr->value, id) == 0;
}

template <typename Match>
const GumboNode* find_element(const GumboNode* node, const Match& match) {
    if (!node || node->type != GUMBO_NODE_ELEMENT) {
        return nullptr;
    }
    if (match(node)) {
        return node;
    }
    const GumboVector& children = node->v.element.children;
    for (unsigned int i = 0; i < children.length; ++i) {
        if (const GumboNode* found = find_element(static_cast<const GumboNode*>(children.data[i]), match)) {
            return found;
        }
    }
    return nullptr;
}

// Depth-first text collection. Stops for good at the element carrying stop_id.
struct TextCollector {
    const char* stop_id = nullptr;
    bool stopped = false;
    std::string out;

    void append(const char* text) {
        for (std::string_view rest(text); !rest.empty();) {
            // U+00A0 reads as a plain space.
            if (rest.substr(0, 2) == "\xC2\xA0") {
                out.push_back(' ');
                rest.remove_prefix(2);
            } else {
                out.push_back(rest.front());
                rest.remove_prefix(1);
            }
        }
    }

    void walk(const GumboNode* node) {
        if (stopped || !node) {
            return;
        }
        switch (node->type) {
        case GUMBO_NODE_TEXT:
        case GUMBO_NODE_WHITESPACE:
        case GUMBO_NODE_CDATA:
            append(node->v.text.text);
            return;
        case GUMBO_NODE_ELEMENT:
            break;
        default:
            return;
        }
        const GumboTag tag = node->v.element.tag;
        if (stop_id && has_id(node, stop_id)) {
            stopped = true;
            return;
        }
        if (is_skipped(tag)) {
            return;
        }
        const bool block = is_block(tag);
        if (block) {
            out.push_back('\n');
        } else if (tag == GUMBO_TAG_TD || tag == GUMBO_TAG_TH) {
            out.push_back(' ');
        }
        const GumboVector& children = node->v.element.children;
        for (unsigned int i = 0; i < children.length; ++i) {
            walk(static_cast<const GumboNode*>(children.data[i]));
        }
        if (block) {
            out.push_back('\n');
        }
    }
};

// Collapses runs of spaces inside lines and drops blank lines.
std::string tidy_lines(std::string_view text) {
    std::string out;
    std::string line;
    auto flush_line = [&]() {
        while (!line.empty() && line.back() == ' ') {
            line.pop_back();
        }
        if (!line.empty()) {
            if (!out.empty()) {
                out.push_back('\n');
            }
            out += line;
        }
        line.clear();
    };
    for (char c : text) {
        if (c == '\n') {
            flush_line();
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (!line.empty() && line.back() != ' ') {
                line.push_back(' ');
            }
        } else {
            line.push_back(c);
        }
    }
    flush_line();
    return out;
}

std::string strip_citations(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '[') {
            std::size_t j = i + 1;
            while (j < text.size() && std::isdigit(static_cast<unsigned char>(text[j]))) {
                ++j;
            }
            if (j > i + 1 && j < text.size() && text[j] == ']') {
                i = j;
                continue;
            }
            if (text.substr(i, 6) == "[edit]") {
                i += 5;
                continue;
            }
        }
        out.push_back(text[i]);
    }
    return out;
}

std::string format_number(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

std::string json_text(const Json& value) {
    if (value.is_string()) {
        return value.as_string();
    }
    if (value.is_number()) {
        const double number = value.as_number();
        return format_number(number, std::floor(number) == number ? 0 : 1);
    }
    return {};
}

const Json* first_in(const Json& parent, const std::string& key) {
    const Json* array = parent.find(key);
    if (!array || !array->is_array() || array->as_array().empty()) {
        return nullptr;
    }
    return &array->as_array().front();
}

std::string openweather(const Json& doc) {
    const Json* main = doc.find("main");
    if (!main || !main->is_object()) {
        return {};
    }
    std::string place = doc.string_or("name", std::string());
    if (const Json* sys = doc.find("sys")) {
        const std::string country = sys->string_or("country", std::string());
        if (!country.empty()) {
            place += ", " + country;
        }
    }
    std::string conditions = "unknown";
    if (const Json* first = first_in(doc, "weather")) {
        conditions = first->string_or("description", conditions);
    }
    std::ostringstream oss;
    oss << "Current Weather in " << place << ":\n"
        << "- Conditions: " << conditions << "\n"
        << "- Temperature: " << format_number(main->number_or("temp", 0.0), 1) << "°C (feels like "
        << format_number(main->number_or("feels_like", 0.0), 1) << "°C)\n"
        << "- Humidity: " << format_number(main->number_or("humidity", 0.0), 0) << "%";
    if (const Json* wind = doc.find("wind")) {
        oss << "\n- Wind Speed: " << format_number(wind->number_or("speed", 0.0) * 3.6, 1) << " km/h";
    }
    return oss.str();
}

std::string wttr(const Json& doc) {
    const Json* current = first_in(doc, "current_condition");
    if (!current) {
        return {};
    }
    std::string place;
    if (const Json* area = first_in(doc, "nearest_area")) {
        if (const Json* name = first_in(*area, "areaName")) {
            place = name->string_or("value", std::string());
        }
        if (const Json* country = first_in(*area, "country")) {
            const std::string value = country->string_or("value", std::string());
            if (!value.empty()) {
                place += (place.empty() ? "" : ", ") + value;
            }
        }
    }
    std::string conditions = "unknown";
    if (const Json* desc = first_in(*current, "weatherDesc")) {
        conditions = desc->string_or("value", conditions);
    }
    auto field = [&](const char* key) {
        const Json* value = current->find(key);
        return value ? json_text(*value) : std::string("?");
    };
    std::ostringstream oss;
    oss << "Current Weather in " << (place.empty() ? "requested location" : place) << ":\n"
        << "- Conditions: " << conditions << "\n"
        << "- Temperature: " << field("temp_C") << "°C (feels like " << field("FeelsLikeC") << "°C)\n"
        << "- Humidity: " << field("humidity") << "%\n"
        << "- Wind Speed: " << field("windspeedKmph") << " km/h";
    return oss.str();
}

void collect_comments(const Json& listing, std::vector<std::string>& out, std::size_t limit) {
    const Json* data = listing.find("data");
    const Json* children = data ? data->find("children") : nullptr;
    if (!children || !children->is_array()) {
        return;
    }
    for (const auto& child : children->as_array()) {
        if (out.size() >= limit) {
            return;
        }
        if (child.string_or("kind", std::string()) != "t1") {
            continue;
        }
        if (const Json* comment = child.find("data")) {
            const std::string body = comment->string_or("body", std::string());
            if (!body.empty() && body != "[deleted]" && body != "[removed]") {
                out.push_back(body);
            }
        }
    }
}

} // namespace

std::string html_to_text(std::string_view html) {
    const Document doc(html);
    TextCollector collector;
    collector.walk(doc.root());
    return tidy_lines(collector.out);
}

std::string article(std::string_view html) {
    const Document doc(html);
    const GumboNode* region = find_element(doc.root(), [](const GumboNode* node) {
        return has_id(node, "mw-content-text");
    });
    for (const GumboTag tag : {GUMBO_TAG_ARTICLE, GUMBO_TAG_MAIN}) {
        if (!region) {
            region = find_element(doc.root(), [tag](const GumboNode* node) { return node->v.element.tag == tag; });
        }
    }
    TextCollector collector;
    // Reference lists and navigation boxes follow the article body.
    collector.stop_id = "References";
    collector.walk(region ? region : doc.root());
    return strip_citations(tidy_lines(collector.out));
}

std::string discussion(std::string_view body) {
    const std::size_t first = body.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    if (body[first] != '[' && body[first] != '{') {
        return html_to_text(body);
    }
    const auto doc = Json::try_parse(body);
    if (!doc) {
        return {};
    }
    const Json* post_listing = doc->is_array() && !doc->as_array().empty() ? &doc->as_array().front() : &*doc;
    std::ostringstream oss;
    const Json* post_data = post_listing->find("data");
    if (post_data) {
        if (const Json* post = first_in(*post_data, "children")) {
            if (const Json* data = post->find("data")) {
                oss << data->string_or("title", std::string()) << "\n";
                const std::string selftext = data->string_or("selftext", std::string());
                if (!selftext.empty()) {
                    oss << selftext << "\n";
                }
            }
        }
    }
    std::vector<std::string> comments;
    if (doc->is_array() && doc->as_array().size() > 1) {
        collect_comments(doc->as_array()[1], comments, 10);
    }
    for (std::size_t i = 0; i < comments.size(); ++i) {
        oss << "\nComment " << (i + 1) << ": " << comments[i];
    }
    return tidy_lines(oss.str());
}

std::string weather(std::string_view body) {
    const auto doc = Json::try_parse(body);
    if (!doc || !doc->is_object()) {
        return {};
    }
    if (std::string text = openweather(*doc); !text.empty()) {
        return text;
    }
    return wttr(*doc);
}

std::string reader_text(std::string_view body) {
    std::string_view text = body;
    if (const std::size_t marker = text.find("Markdown Content:"); marker != std::string_view::npos) {
        text = text.substr(marker + 17);
    }
    return tidy_lines(text);
}

std::string clip_at_sentence(std::string text, std::size_t max_chars) {
    if (text.size() <= max_chars) {
        return text;
    }
    text.resize(max_chars);
    while (!text.empty() && (static_cast<unsigned char>(text.back()) & 0xC0) == 0x80) {
        text.pop_back();
    }
    if (!text.empty() && (static_cast<unsigned char>(text.back()) & 0x80) != 0) {
        text.pop_back();
    }
    const std::size_t period = text.rfind('.');
    if (period != std::string::npos && period > max_chars * 7 / 10) {
        text.resize(period + 1);
    } else {
        text += "...";
    }
    return text;
}

} // namespace lookout::extract
