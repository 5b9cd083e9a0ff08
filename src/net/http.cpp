#include "../../include/lookout/net/http.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

constexpr std::size_t kMaxBodyBytes = 8 * 1024 * 1024;
constexpr const char* kUserAgent = "Mozilla/5.0 (compatible; lookout/1.0)";

class CurlGlobal {
public:
    CurlGlobal() {
        const CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (code != CURLE_OK) {
            throw std::runtime_error("curl_global_init failed");
        }
    }

    ~CurlGlobal() {
        curl_global_cleanup();
    }

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

void ensure_curl_global() {
    static CurlGlobal global_guard;
}

struct EasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

EasyHandle make_handle() {
    ensure_curl_global();
    EasyHandle handle(curl_easy_init());
    if (!handle) {
        throw std::runtime_error("curl_easy_init failed");
    }
    return handle;
}

HeaderList make_headers(const lookout::net::Headers& headers, bool json_body) {
    curl_slist* list = nullptr;
    if (json_body) {
        list = curl_slist_append(list, "Content-Type: application/json");
    }
    for (const auto& header : headers) {
        const std::string line = header.first + ": " + header.second;
        list = curl_slist_append(list, line.c_str());
    }
    return HeaderList(list);
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* buffer = static_cast<std::string*>(userdata);
    if (buffer->size() < kMaxBodyBytes) {
        buffer->append(ptr, std::min(total, kMaxBodyBytes - buffer->size()));
    }
    return total;
}

struct StreamContext {
    CURL* handle = nullptr;
    const lookout::net::ChunkCallback* on_chunk = nullptr;
    long status = 0;
    bool stopped = false;
    std::string error_body;
    // Exceptions cannot cross libcurl; the callback's exception is rethrown after the transfer.
    std::exception_ptr failure;
};

size_t stream_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* ctx = static_cast<StreamContext*>(userdata);
    if (ctx->status == 0) {
        curl_easy_getinfo(ctx->handle, CURLINFO_RESPONSE_CODE, &ctx->status);
    }
    if (ctx->status >= 400) {
        if (ctx->error_body.size() < 4096) {
            ctx->error_body.append(ptr, total);
        }
        return total;
    }
    try {
        if (!(*ctx->on_chunk)(std::string_view(ptr, total))) {
            ctx->stopped = true;
            return 0;
        }
    } catch (...) {
        ctx->failure = std::current_exception();
        return 0;
    }
    return total;
}

int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* cancel = static_cast<const lookout::CancellationToken*>(clientp);
    return (cancel && cancel->cancelled()) ? 1 : 0;
}

void apply_cancel(CURL* handle, const lookout::CancellationToken* cancel) {
    if (!cancel) {
        return;
    }
    curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(handle, CURLOPT_XFERINFODATA, const_cast<lookout::CancellationToken*>(cancel));
    curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
}

long resolve_timeout(long timeout_ms) {
    if (timeout_ms > 0) {
        return timeout_ms;
    }

    long resolved = 60000;
    if (const char* raw = std::getenv("LOOKOUT_HTTP_TIMEOUT_MS")) {
        char* end = nullptr;
        const long candidate = std::strtol(raw, &end, 10);
        if (end != raw && candidate > 0) {
            resolved = candidate;
        }
    }
    return resolved;
}

[[noreturn]] void throw_transport(const char* verb, const std::string& url, CURLcode code) {
    std::ostringstream oss;
    oss << "[http] " << verb << ' ' << url << " failed " << curl_easy_strerror(code);
    if (code == CURLE_OPERATION_TIMEDOUT) {
        throw lookout::net::TimeoutError(oss.str());
    }
    if (code == CURLE_ABORTED_BY_CALLBACK) {
        throw lookout::net::CancelledError(oss.str());
    }
    throw std::runtime_error(oss.str());
}

} // namespace

namespace lookout::net {

Response get(const std::string& url,
             const Headers& headers,
             std::chrono::milliseconds timeout,
             const CancellationToken* cancel) {
    EasyHandle handle = make_handle();
    HeaderList header_list = make_headers(headers, false);
    const long resolved_timeout = resolve_timeout(static_cast<long>(timeout.count()));

    Response response;
    curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(handle.get(), CURLOPT_USERAGENT, kUserAgent);
    curl_easy_setopt(handle.get(), CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, resolved_timeout);
    curl_easy_setopt(handle.get(), CURLOPT_CONNECTTIMEOUT_MS, resolved_timeout);
    curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, header_list.get());
    apply_cancel(handle.get(), cancel);

    const CURLcode code = curl_easy_perform(handle.get());
    if (code != CURLE_OK) {
        throw_transport("GET", url, code);
    }

    curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &response.status);
    char* content_type = nullptr;
    if (curl_easy_getinfo(handle.get(), CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK && content_type) {
        response.content_type = content_type;
    }
    char* effective = nullptr;
    if (curl_easy_getinfo(handle.get(), CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective) {
        response.effective_url = effective;
    }
    return response;
}

std::string post_json(const std::string& url,
                      const std::string& body,
                      const Headers& headers,
                      long timeout_ms) {
    EasyHandle handle = make_handle();
    HeaderList header_list = make_headers(headers, true);
    const long resolved_timeout = resolve_timeout(timeout_ms);

    std::string response;
    curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, resolved_timeout);
    curl_easy_setopt(handle.get(), CURLOPT_CONNECTTIMEOUT_MS, resolved_timeout);
    curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, header_list.get());

    const CURLcode code = curl_easy_perform(handle.get());
    if (code != CURLE_OK) {
        throw_transport("POST", url, code);
    }

    long status = 0;
    curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        std::ostringstream oss;
        oss << "[http] POST " << url << " failed " << status;
        throw HttpError(oss.str(), status);
    }
    return response;
}

bool post_stream(const std::string& url,
                 const std::string& body,
                 const Headers& headers,
                 const ChunkCallback& on_chunk,
                 std::chrono::milliseconds timeout,
                 const CancellationToken* cancel) {
    EasyHandle handle = make_handle();
    HeaderList header_list = make_headers(headers, true);
    const long resolved_timeout = resolve_timeout(static_cast<long>(timeout.count()));

    StreamContext ctx;
    ctx.handle = handle.get();
    ctx.on_chunk = &on_chunk;

    curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, stream_write_callback);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, resolved_timeout);
    curl_easy_setopt(handle.get(), CURLOPT_CONNECTTIMEOUT_MS, resolved_timeout);
    curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, header_list.get());
    apply_cancel(handle.get(), cancel);

    const CURLcode code = curl_easy_perform(handle.get());
    if (ctx.failure) {
        std::rethrow_exception(ctx.failure);
    }
    if (code == CURLE_WRITE_ERROR && ctx.stopped) {
        return false;
    }
    if (code != CURLE_OK) {
        throw_transport("POST", url, code);
    }

    long status = ctx.status;
    if (status == 0) {
        curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &status);
    }
    if (status < 200 || status >= 300) {
        std::ostringstream oss;
        oss << "[http] POST " << url << " failed " << status;
        if (!ctx.error_body.empty()) {
            oss << ": " << ctx.error_body.substr(0, 256);
        }
        throw HttpError(oss.str(), status);
    }
    return true;
}

std::string url_encode(std::string_view text) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase;
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else if (c == ' ') {
            oss << "%20";
        } else {
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

std::string host_of(std::string_view url) {
    std::size_t start = url.find("://");
    start = (start == std::string_view::npos) ? 0 : start + 3;
    std::size_t end = url.find_first_of("/?#", start);
    if (end == std::string_view::npos) {
        end = url.size();
    }
    std::string host(url.substr(start, end - start));
    if (const auto at = host.rfind('@'); at != std::string::npos) {
        host.erase(0, at + 1);
    }
    if (const auto colon = host.rfind(':'); colon != std::string::npos) {
        host.erase(colon);
    }
    for (auto& c : host) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return host;
}

} // namespace lookout::net
