/**
 * @file http_transport.hpp
 * @brief HTTP client for the Docker Engine API over a UNIX domain socket,
 *        built on libcurl.
 *
 * Every request gets its own easy handle, so a single HttpTransport can be
 * shared by any number of threads. Streaming responses are driven through
 * a multi handle so the caller can wait for body bytes with a timeout.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sandbox_orchestrator {

struct HttpRequest {
    std::string method;
    std::string path;                   ///< e.g. "/v1.41/containers/create"
    std::vector<std::pair<std::string, std::string>> query;   ///< Values are percent-encoded on send
    std::string body;
    std::string content_type = "application/json";
};

struct HttpResponse {
    int status{0};
    std::string body;
};

/// One libcurl transfer; defined in http_transport.cpp.
struct CurlTransfer;

/**
 * @brief An open response whose body is read incrementally.
 */
class HttpStream {
public:
    explicit HttpStream(std::unique_ptr<CurlTransfer> transfer);
    ~HttpStream();

    HttpStream(const HttpStream&) = delete;
    HttpStream& operator=(const HttpStream&) = delete;

    /// 0 until the response head has arrived.
    [[nodiscard]] int status() const noexcept;

    /**
     * @brief Wait up to `timeout` for body bytes.
     *
     * @return nullopt if nothing arrived in time; an empty string once the
     *         body is finished (eof() is then true).
     */
    Result<std::optional<std::string>> read(Duration timeout);

    /// Read the rest of the body within `timeout`.
    Result<std::string> read_all(Duration timeout);

    /// Drive the transfer until the response head arrives.
    Result<void> await_head(Duration timeout);

    [[nodiscard]] bool eof() const noexcept { return eof_; }
    void close() noexcept;

private:
    /// Run the transfer once, waiting up to `wait` for socket activity.
    Result<void> pump(Duration wait);

    std::unique_ptr<CurlTransfer> transfer_;
    bool eof_{false};
};

class HttpTransport {
public:
    HttpTransport(std::string socket_path, uint32_t timeout_ms);

    /// Send a request and read the whole response.
    Result<HttpResponse> send(const HttpRequest& request) const;
    Result<HttpResponse> send(const HttpRequest& request, uint32_t timeout_ms) const;

    /// Send a request and return once the response head has arrived.
    /// The body has no overall time limit.
    Result<std::unique_ptr<HttpStream>> open(const HttpRequest& request) const;

    [[nodiscard]] const std::string& socket_path() const noexcept { return socket_path_; }

private:
    Result<std::unique_ptr<CurlTransfer>> prepare(const HttpRequest& request,
                                                  std::optional<uint32_t> total_timeout_ms) const;

    std::string socket_path_;
    uint32_t timeout_ms_;
};

}  // namespace sandbox_orchestrator
