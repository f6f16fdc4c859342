#include "CurlTransport.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <memory>
#include <stdexcept>
#include <string>
#include "../core/Errors.hpp"
#include "../utils/Logger.hpp"

namespace Anime1Relay {

// A CURLSH handle with its own set of locks.
struct ShareHandle {
    CURLSH* share = nullptr;
    std::array<std::mutex, CURL_LOCK_DATA_LAST> locks;

    explicit ShareHandle(bool with_cookies) {
        share = curl_share_init();
        if (!share) {
            throw std::runtime_error("Failed to initialize cURL share handle");
        }
        curl_share_setopt(share, CURLSHOPT_LOCKFUNC, &ShareHandle::Lock);
        curl_share_setopt(share, CURLSHOPT_UNLOCKFUNC, &ShareHandle::Unlock);
        curl_share_setopt(share, CURLSHOPT_USERDATA, this);
        if (with_cookies) curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_COOKIE);
        curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
        curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
        curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
    }

    ~ShareHandle() {
        // Every easy handle using the share is gone once the last owner lets go.
        if (share) curl_share_cleanup(share);
    }

    ShareHandle(const ShareHandle&) = delete;
    ShareHandle& operator=(const ShareHandle&) = delete;

    static void Lock(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
        static_cast<ShareHandle*>(userptr)->locks[static_cast<size_t>(data)].lock();
    }

    static void Unlock(CURL*, curl_lock_data data, void* userptr) {
        static_cast<ShareHandle*>(userptr)->locks[static_cast<size_t>(data)].unlock();
    }
};

struct CurlTransport::SessionContext {
    // Requests with use_cookie_jar share the jar; the others only reuse DNS,
    // TLS sessions and connections and send nothing but their own cookies.
    ShareHandle with_jar{true};
    ShareHandle without_jar{false};
};

}

namespace {

using Anime1Relay::Config;
using Anime1Relay::CookieMap;
using Anime1Relay::HeaderMap;
using Anime1Relay::HttpRequest;

struct EasyHandle {
    CURL* ptr = nullptr;
    explicit EasyHandle(CURL* c) : ptr(c) {}
    ~EasyHandle() { if (ptr) curl_easy_cleanup(ptr); }
    EasyHandle(const EasyHandle&) = delete;
    EasyHandle& operator=(const EasyHandle&) = delete;
};

struct CurlHeaderList {
    curl_slist* list = nullptr;
    ~CurlHeaderList() { if (list) curl_slist_free_all(list); }
    void Append(const std::string& line) {
        curl_slist* next = curl_slist_append(list, line.c_str());
        if (!next) throw std::runtime_error("Failed to allocate cURL header list");
        list = next;
    }
};

// Status line, headers and cookies of the response currently being received.
struct ResponseHead {
    long status_code = 0;
    std::string reason;
    HeaderMap headers;
    CookieMap cookies;
};

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string Trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

void ParseSetCookie(const std::string& value, CookieMap& cookies) {
    std::string pair = value.substr(0, value.find(';'));
    auto eq = pair.find('=');
    if (eq == std::string::npos) return;
    std::string name = Trim(pair.substr(0, eq));
    if (name.empty()) return;
    cookies[name] = Trim(pair.substr(eq + 1));
}

size_t HeaderCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    auto* head = static_cast<ResponseHead*>(userdata);
    if (!head) return total;

    std::string line(buffer, total);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();

    if (line.rfind("HTTP/", 0) == 0) {
        // New status line: a redirect hop or a 1xx interim response.
        head->headers.clear();
        auto sp1 = line.find(' ');
        if (sp1 != std::string::npos) {
            auto sp2 = line.find(' ', sp1 + 1);
            head->status_code = std::strtol(line.c_str() + sp1 + 1, nullptr, 10);
            head->reason = sp2 == std::string::npos ? std::string() : line.substr(sp2 + 1);
        }
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string::npos) return total;
    std::string name = ToLower(Trim(line.substr(0, colon)));
    std::string value = Trim(line.substr(colon + 1));
    if (name == "set-cookie") {
        ParseSetCookie(value, head->cookies);
    } else {
        head->headers[name] = value;
    }
    return total;
}

struct BodyBuffer {
    std::string data;
    size_t max_bytes = 0;
    bool truncated = false;
};

size_t BodyCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t chunk = size * nmemb;
    auto* body = static_cast<BodyBuffer*>(userp);
    if (!body) return 0;

    if (chunk > body->max_bytes - body->data.size()) {
        body->truncated = true;
        return 0; // aborts the transfer
    }
    body->data.append(static_cast<char*>(contents), chunk);
    return chunk;
}

std::string CookieHeader(const CookieMap& cookies) {
    std::string out;
    for (const auto& cookie : cookies) {
        if (!out.empty()) out += "; ";
        out += cookie.first + "=" + cookie.second;
    }
    return out;
}

// Options shared by page, API and stream requests.
void ConfigureEasy(CURL* curl, const HttpRequest& request, const Config& config,
                   Anime1Relay::CurlTransport::SessionContext& context,
                   CurlHeaderList& headers, ResponseHead* head, char* error_buffer) {
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    if (request.use_cookie_jar) {
        curl_easy_setopt(curl, CURLOPT_SHARE, context.with_jar.share);
        curl_easy_setopt(curl, CURLOPT_COOKIEFILE, ""); // enable the cookie engine
    } else {
        curl_easy_setopt(curl, CURLOPT_SHARE, context.without_jar.share);
    }
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, config.http_connect_timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, HeaderCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, head);

    long allowed_protocols = CURLPROTO_HTTP | CURLPROTO_HTTPS;
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS, allowed_protocols);
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS, allowed_protocols);

    for (const auto& header : request.headers) {
        if (request.decode_content && ToLower(header.first) == "accept-encoding") {
            // curl sends the header itself and inflates the body.
            curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, header.second.c_str());
            continue;
        }
        headers.Append(header.first + ": " + header.second);
    }
    if (headers.list) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.list);

    if (!request.cookies.empty()) {
        std::string cookie = CookieHeader(request.cookies);
        curl_easy_setopt(curl, CURLOPT_COOKIE, cookie.c_str()); // copied by libcurl
    }

    if (!request.form_body.empty()) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.form_body.size()));
        curl_easy_setopt(curl, CURLOPT_COPYPOSTFIELDS, request.form_body.c_str());
    }
}

std::string DescribeFailure(CURLcode code, const char* error_buffer) {
    std::string error = error_buffer ? error_buffer : "";
    if (error.empty()) error = curl_easy_strerror(code);
    return error;
}

[[noreturn]] void ThrowStatus(const ResponseHead& head, const std::string& url) {
    std::string message = head.reason.empty() ? ("HTTP " + std::to_string(head.status_code)) : head.reason;
    Anime1Relay::Logger::Log(Anime1Relay::LogLevel::Warn, "Upstream returned " + std::to_string(head.status_code) + " for " + url);
    throw Anime1Relay::UpstreamError(head.status_code, message);
}

// Pull-based response body on its own multi handle. Data is only moved while
// the reader asks for it; the transfer pauses when a chunk is waiting.
class CurlStream : public Anime1Relay::IHttpStream {
public:
    CurlStream(std::shared_ptr<Anime1Relay::CurlTransport::SessionContext> context,
               const HttpRequest& request, const Config& config)
        : context_(std::move(context)), chunk_bytes_(config.stream_chunk_bytes), url_(request.url) {
        multi_ = curl_multi_init();
        easy_ = curl_easy_init();
        if (!multi_ || !easy_) {
            Release();
            throw std::runtime_error("Failed to initialize cURL handles for stream");
        }
        try {
            ConfigureEasy(easy_, request, config, *context_, headers_, &head_, error_buffer_);
        } catch (const std::exception&) {
            Release();
            throw;
        }
        curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, &CurlStream::WriteCallback);
        curl_easy_setopt(easy_, CURLOPT_WRITEDATA, this);
        curl_easy_setopt(easy_, CURLOPT_BUFFERSIZE, static_cast<long>(std::min<size_t>(chunk_bytes_, CURL_MAX_READ_SIZE)));
        curl_easy_setopt(easy_, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(easy_, CURLOPT_LOW_SPEED_TIME, config.stream_stall_timeout_sec);
        CURLMcode mc = curl_multi_add_handle(multi_, easy_);
        if (mc != CURLM_OK) {
            Release();
            throw std::runtime_error(std::string("curl_multi_add_handle: ") + curl_multi_strerror(mc));
        }
        attached_ = true;
    }

    ~CurlStream() override {
        Release();
    }

    CurlStream(const CurlStream&) = delete;
    CurlStream& operator=(const CurlStream&) = delete;

    // Drives the transfer until the final response's body starts or it ends.
    void WaitForHead() {
        while (!body_started_ && !done_) Pump();
        if (done_ && result_ != CURLE_OK) {
            throw Anime1Relay::UpstreamUnavailable(DescribeFailure(result_, error_buffer_));
        }
        long code = 0;
        curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &code);
        status_code_ = code;
        if (status_code_ >= 400) ThrowStatus(head_, url_);
    }

    long StatusCode() const override { return status_code_; }
    const HeaderMap& Headers() const override { return head_.headers; }

    bool ReadChunk(std::string& chunk) override {
        chunk.clear();
        while (pending_.empty() && !done_) Pump();
        if (!pending_.empty()) {
            chunk.swap(pending_);
            if (paused_) {
                paused_ = false;
                curl_easy_pause(easy_, CURLPAUSE_CONT);
            }
            return true;
        }
        if (result_ != CURLE_OK) {
            throw Anime1Relay::UpstreamUnavailable(DescribeFailure(result_, error_buffer_));
        }
        return false;
    }

private:
    static size_t WriteCallback(char* ptr, size_t size, size_t nmemb, void* userp) {
        auto* self = static_cast<CurlStream*>(userp);
        const size_t n = size * nmemb;
        if (self->pending_.size() >= self->chunk_bytes_) {
            self->paused_ = true;
            return CURL_WRITEFUNC_PAUSE;
        }
        self->pending_.append(ptr, n);
        self->body_started_ = true;
        return n;
    }

    void Pump() {
        int still_running = 0;
        CURLMcode mc = curl_multi_perform(multi_, &still_running);
        if (mc != CURLM_OK) {
            throw Anime1Relay::UpstreamUnavailable(std::string("curl_multi_perform: ") + curl_multi_strerror(mc));
        }

        int msgs_in_queue = 0;
        CURLMsg* msg;
        while ((msg = curl_multi_info_read(multi_, &msgs_in_queue))) {
            if (msg->msg == CURLMSG_DONE && msg->easy_handle == easy_) {
                done_ = true;
                result_ = msg->data.result;
            }
        }

        if (!done_ && pending_.empty() && still_running > 0) {
            curl_multi_wait(multi_, nullptr, 0, 1000, nullptr);
        }
    }

    void Release() {
        if (multi_ && easy_ && attached_) curl_multi_remove_handle(multi_, easy_);
        attached_ = false;
        if (easy_) curl_easy_cleanup(easy_);
        easy_ = nullptr;
        if (multi_) curl_multi_cleanup(multi_);
        multi_ = nullptr;
    }

    // Declared first so the share outlives the easy handle.
    std::shared_ptr<Anime1Relay::CurlTransport::SessionContext> context_;
    CURLM* multi_ = nullptr;
    CURL* easy_ = nullptr;
    bool attached_ = false;
    CurlHeaderList headers_;
    ResponseHead head_;
    char error_buffer_[CURL_ERROR_SIZE] = {0};
    size_t chunk_bytes_;
    std::string url_;
    std::string pending_;
    bool body_started_ = false;
    bool paused_ = false;
    bool done_ = false;
    CURLcode result_ = CURLE_OK;
    long status_code_ = 0;
};

} // anonymous namespace

namespace Anime1Relay {

CurlTransport::CurlTransport(const Config& config) : config_(config) {}

CurlTransport::~CurlTransport() = default;

std::shared_ptr<CurlTransport::SessionContext> CurlTransport::AcquireContext() {
    std::lock_guard<std::mutex> lock(context_mutex_);
    if (!context_) {
        context_ = std::make_shared<SessionContext>();
        Logger::Log(LogLevel::Debug, "Created upstream session context.");
    }
    return context_;
}

void CurlTransport::Preheat() {
    AcquireContext();
}

void CurlTransport::Reset() {
    std::shared_ptr<SessionContext> old;
    {
        std::lock_guard<std::mutex> lock(context_mutex_);
        old.swap(context_);
    }
    // Requests still running hold their own reference; the share is freed after the last one.
    Logger::Log(LogLevel::Info, std::string("Upstream session context reset") + (old && old.use_count() > 1 ? " (in-flight requests finish on the old one)." : "."));
}

HttpResponse CurlTransport::Perform(const HttpRequest& request) {
    auto context = AcquireContext();
    EasyHandle curl(curl_easy_init());
    if (!curl.ptr) {
        throw std::runtime_error("Failed to create cURL easy handle for: " + request.url);
    }

    CurlHeaderList headers;
    ResponseHead head;
    BodyBuffer body;
    body.max_bytes = config_.max_page_bytes;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    ConfigureEasy(curl.ptr, request, config_, *context, headers, &head, error_buffer);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, BodyCallback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.ptr, CURLOPT_TIMEOUT_MS, config_.http_timeout_ms);

    Logger::Log(LogLevel::Debug, std::string(request.form_body.empty() ? "GET " : "POST ") + request.url);
    CURLcode result = curl_easy_perform(curl.ptr);
    if (body.truncated) {
        if (head.status_code >= 400) ThrowStatus(head, request.url);
        Logger::Log(LogLevel::Warn, "Response body exceeds " + std::to_string(config_.max_page_bytes) + " bytes: " + request.url);
        throw MalformedPage("Upstream response exceeds " + std::to_string(config_.max_page_bytes) + " bytes");
    }
    if (result != CURLE_OK) {
        std::string error = DescribeFailure(result, error_buffer);
        Logger::Log(LogLevel::Warn, "Upstream request failed for " + request.url + ": " + error);
        throw UpstreamUnavailable(error);
    }

    HttpResponse response;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &response.status_code);
    head.status_code = response.status_code;
    if (response.status_code >= 400) ThrowStatus(head, request.url);

    response.headers = std::move(head.headers);
    response.cookies = std::move(head.cookies);
    response.body = std::move(body.data);
    return response;
}

std::unique_ptr<IHttpStream> CurlTransport::OpenStream(const HttpRequest& request) {
    auto stream = std::make_unique<CurlStream>(AcquireContext(), request, config_);
    Logger::Log(LogLevel::Debug, "Opening stream " + request.url);
    stream->WaitForHead();
    return stream;
}

}
