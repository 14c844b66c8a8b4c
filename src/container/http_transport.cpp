/**
 * @file http_transport.cpp
 * @brief HttpTransport implementation on libcurl (easy + multi interfaces).
 */

#include "container/http_transport.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <climits>
#include <string_view>

namespace sandbox_orchestrator {

// ─────────────────────────────────────────────
// CurlTransfer
// ─────────────────────────────────────────────

struct CurlTransfer {
    struct EasyDeleter {
        void operator()(CURL* easy) const noexcept { curl_easy_cleanup(easy); }
    };
    struct MultiDeleter {
        void operator()(CURLM* multi) const noexcept { curl_multi_cleanup(multi); }
    };
    struct SlistDeleter {
        void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
    };

    std::unique_ptr<CURL, EasyDeleter> easy;
    std::unique_ptr<curl_slist, SlistDeleter> headers;
    std::unique_ptr<CURLM, MultiDeleter> multi;         ///< Streaming transfers only

    std::string description;                            ///< "GET /v1.41/_ping"
    std::string received;                               ///< Body bytes not yet consumed
    std::array<char, CURL_ERROR_SIZE> error_buffer{};
    int status{0};
    bool done{false};
    CURLcode result{CURLE_OK};

    ~CurlTransfer() {
        if (multi && easy) curl_multi_remove_handle(multi.get(), easy.get());
    }
};

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::string_view kBaseUrl = "http://localhost";

Error unavailable(std::string message) {
    return Error{ErrorCode::RuntimeUnavailable, std::move(message)};
}

Error transfer_error(const CurlTransfer& transfer, CURLcode code) {
    std::string detail = transfer.error_buffer[0] != '\0' ? std::string{transfer.error_buffer.data()}
                                                          : std::string{curl_easy_strerror(code)};
    auto kind = (code == CURLE_WEIRD_SERVER_REPLY || code == CURLE_BAD_CONTENT_ENCODING)
        ? ErrorCode::ProtocolError
        : ErrorCode::RuntimeUnavailable;
    return Error{kind, transfer.description + ": " + detail};
}

/// curl_global_init is not thread-safe; the static makes it run once.
Result<void> global_init() {
    static const CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (code != CURLE_OK) {
        return unavailable(std::string{"libcurl initialisation failed: "} + curl_easy_strerror(code));
    }
    return Result<void>{};
}

size_t on_body(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* transfer = static_cast<CurlTransfer*>(userdata);
    transfer->received.append(data, size * nmemb);
    return size * nmemb;
}

/// The blank line ends a header block; 1xx blocks are skipped.
size_t on_header(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* transfer = static_cast<CurlTransfer*>(userdata);
    std::string_view line{data, size * nmemb};
    if (line == "\r\n" || line == "\n") {
        long code = 0;
        if (curl_easy_getinfo(transfer->easy.get(), CURLINFO_RESPONSE_CODE, &code) == CURLE_OK && code >= 200) {
            transfer->status = static_cast<int>(code);
        }
    }
    return size * nmemb;
}

/// Applies options in order and keeps the first failure.
class OptionSetter {
public:
    explicit OptionSetter(CURL* easy) : easy_(easy) {}

    template <typename T>
    OptionSetter& set(CURLoption option, T value) {
        if (code_ == CURLE_OK) code_ = curl_easy_setopt(easy_, option, value);
        return *this;
    }

    [[nodiscard]] CURLcode code() const noexcept { return code_; }

private:
    CURL* easy_;
    CURLcode code_{CURLE_OK};
};

bool append_header(CurlTransfer& transfer, const std::string& header) {
    curl_slist* list = curl_slist_append(transfer.headers.get(), header.c_str());
    if (!list) return false;
    (void)transfer.headers.release();
    transfer.headers.reset(list);
    return true;
}

Duration time_left(Clock::time_point deadline) {
    return std::max(Duration::zero(), std::chrono::ceil<Duration>(deadline - Clock::now()));
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// HttpStream
// ─────────────────────────────────────────────

HttpStream::HttpStream(std::unique_ptr<CurlTransfer> transfer)
    : transfer_(std::move(transfer)) {}

HttpStream::~HttpStream() = default;

int HttpStream::status() const noexcept {
    return transfer_ ? transfer_->status : 0;
}

Result<void> HttpStream::pump(Duration wait) {
    CURLM* multi = transfer_->multi.get();

    int running = 0;
    CURLMcode mc = curl_multi_perform(multi, &running);
    if (mc != CURLM_OK) {
        return unavailable(transfer_->description + ": " + curl_multi_strerror(mc));
    }

    int queued = 0;
    while (CURLMsg* msg = curl_multi_info_read(multi, &queued)) {
        if (msg->msg == CURLMSG_DONE) {
            transfer_->done = true;
            transfer_->result = msg->data.result;
        }
    }
    if (transfer_->done) {
        if (transfer_->result != CURLE_OK) return transfer_error(*transfer_, transfer_->result);
        return Result<void>{};
    }
    if (!transfer_->received.empty() || wait <= Duration::zero()) return Result<void>{};

    auto wait_ms = static_cast<int>(std::min<Duration::rep>(wait.count(), INT_MAX));
    mc = curl_multi_poll(multi, nullptr, 0, wait_ms, nullptr);
    if (mc != CURLM_OK) {
        return unavailable(transfer_->description + ": " + curl_multi_strerror(mc));
    }
    return Result<void>{};
}

Result<void> HttpStream::await_head(Duration timeout) {
    auto deadline = Clock::now() + timeout;
    while (status() == 0) {
        if (!transfer_ || transfer_->done) {
            return unavailable((transfer_ ? transfer_->description : std::string{"stream"})
                               + ": connection closed before response head");
        }
        auto left = time_left(deadline);
        if (left <= Duration::zero()) {
            return unavailable(transfer_->description + " timed out waiting for response");
        }
        auto pumped = pump(left);
        if (!pumped) return pumped.error();
    }
    return Result<void>{};
}

Result<std::optional<std::string>> HttpStream::read(Duration timeout) {
    auto deadline = Clock::now() + timeout;

    while (true) {
        if (transfer_ && !transfer_->received.empty()) {
            std::string out = std::move(transfer_->received);
            transfer_->received.clear();
            return std::optional<std::string>{std::move(out)};
        }
        if (eof_ || !transfer_) {
            eof_ = true;
            return std::optional<std::string>{std::string{}};
        }
        if (transfer_->done) {
            eof_ = true;
            continue;
        }

        auto pumped = pump(time_left(deadline));
        if (!pumped) return pumped.error();
        if (transfer_->received.empty() && !transfer_->done && Clock::now() >= deadline) {
            return std::optional<std::string>{};
        }
    }
}

Result<std::string> HttpStream::read_all(Duration timeout) {
    auto deadline = Clock::now() + timeout;
    std::string body;

    while (!eof_) {
        auto left = time_left(deadline);
        if (left <= Duration::zero()) {
            return Error{ErrorCode::Timeout, "timed out reading response body"};
        }
        auto chunk = read(left);
        if (!chunk) return chunk.error();
        if (*chunk) body += **chunk;
    }
    return body;
}

void HttpStream::close() noexcept {
    transfer_.reset();
    eof_ = true;
}

// ─────────────────────────────────────────────
// HttpTransport
// ─────────────────────────────────────────────

HttpTransport::HttpTransport(std::string socket_path, uint32_t timeout_ms)
    : socket_path_(std::move(socket_path))
    , timeout_ms_(timeout_ms) {}

Result<std::unique_ptr<CurlTransfer>> HttpTransport::prepare(const HttpRequest& request,
                                                             std::optional<uint32_t> total_timeout_ms) const {
    if (auto init = global_init(); !init) return init.error();

    auto transfer = std::make_unique<CurlTransfer>();
    transfer->easy.reset(curl_easy_init());
    if (!transfer->easy) return unavailable("curl_easy_init failed");
    transfer->description = request.method + " " + request.path;
    CURL* easy = transfer->easy.get();

    std::string url{kBaseUrl};
    url += request.path;
    char separator = '?';
    for (const auto& [key, value] : request.query) {
        char* escaped = curl_easy_escape(easy, value.data(), static_cast<int>(value.size()));
        if (!escaped) {
            return Error{ErrorCode::ProtocolError, "cannot encode query parameter " + key};
        }
        url.push_back(separator);
        url.append(key).append("=").append(escaped);
        curl_free(escaped);
        separator = '&';
    }

    bool headers_ok = append_header(*transfer, "Expect:");
    if (!request.body.empty()) {
        headers_ok = headers_ok && append_header(*transfer, "Content-Type: " + request.content_type);
    }
    if (!headers_ok) return unavailable(transfer->description + ": cannot allocate request headers");

    OptionSetter options(easy);
    options.set(CURLOPT_URL, url.c_str())
        .set(CURLOPT_UNIX_SOCKET_PATH, socket_path_.c_str())
        .set(CURLOPT_NOSIGNAL, 1L)
        .set(CURLOPT_USERAGENT, "sandbox-orchestrator")
        .set(CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_ms_))
        .set(CURLOPT_HTTPHEADER, transfer->headers.get())
        .set(CURLOPT_ERRORBUFFER, transfer->error_buffer.data())
        .set(CURLOPT_WRITEFUNCTION, &on_body)
        .set(CURLOPT_WRITEDATA, static_cast<void*>(transfer.get()))
        .set(CURLOPT_HEADERFUNCTION, &on_header)
        .set(CURLOPT_HEADERDATA, static_cast<void*>(transfer.get()));
    if (total_timeout_ms) {
        options.set(CURLOPT_TIMEOUT_MS, static_cast<long>(*total_timeout_ms));
    }

    if (request.method == "GET") {
        options.set(CURLOPT_HTTPGET, 1L);
    } else {
        if (request.method != "POST") options.set(CURLOPT_CUSTOMREQUEST, request.method.c_str());
        // POST always carries a body, even an empty one (Content-Length: 0).
        if (!request.body.empty() || request.method == "POST") {
            options.set(CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()))
                .set(CURLOPT_COPYPOSTFIELDS, request.body.c_str());
        }
    }
    if (options.code() != CURLE_OK) {
        return Error{ErrorCode::ProtocolError,
                     transfer->description + ": " + curl_easy_strerror(options.code())};
    }
    return Result<std::unique_ptr<CurlTransfer>>{std::move(transfer)};
}

Result<HttpResponse> HttpTransport::send(const HttpRequest& request) const {
    return send(request, timeout_ms_);
}

Result<HttpResponse> HttpTransport::send(const HttpRequest& request, uint32_t timeout_ms) const {
    auto transfer = prepare(request, timeout_ms);
    if (!transfer) return transfer.error();
    auto& t = **transfer;

    CURLcode code = curl_easy_perform(t.easy.get());
    if (code != CURLE_OK) return transfer_error(t, code);

    long status = 0;
    code = curl_easy_getinfo(t.easy.get(), CURLINFO_RESPONSE_CODE, &status);
    if (code != CURLE_OK) return transfer_error(t, code);

    return HttpResponse{static_cast<int>(status), std::move(t.received)};
}

Result<std::unique_ptr<HttpStream>> HttpTransport::open(const HttpRequest& request) const {
    auto transfer = prepare(request, std::nullopt);
    if (!transfer) return transfer.error();
    auto& t = **transfer;

    t.multi.reset(curl_multi_init());
    if (!t.multi) return unavailable(t.description + ": curl_multi_init failed");
    if (CURLMcode mc = curl_multi_add_handle(t.multi.get(), t.easy.get()); mc != CURLM_OK) {
        return unavailable(t.description + ": " + curl_multi_strerror(mc));
    }

    auto stream = std::make_unique<HttpStream>(std::move(*transfer));
    if (auto head = stream->await_head(Duration{timeout_ms_}); !head) return head.error();
    return Result<std::unique_ptr<HttpStream>>{std::move(stream)};
}

}  // namespace sandbox_orchestrator
