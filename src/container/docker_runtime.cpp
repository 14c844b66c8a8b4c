/**
 * @file docker_runtime.cpp
 * @brief DockerRuntime implementation.
 */

#include "container/docker_runtime.hpp"
#include "container/docker_protocol.hpp"

#include <deque>

namespace sandbox_orchestrator {

namespace {

/**
 * @brief Follow-mode log stream over an open HTTP response.
 */
class DockerLogStream : public ILogStream {
public:
    explicit DockerLogStream(std::unique_ptr<HttpStream> stream)
        : stream_(std::move(stream)) {}

    Result<LogRead> next(Duration timeout) override {
        auto deadline = std::chrono::steady_clock::now() + timeout;

        while (true) {
            if (!frames_.empty()) {
                LogRead read{ReadStatus::Data, std::move(frames_.front())};
                frames_.pop_front();
                return read;
            }
            if (!stream_ || stream_->eof()) {
                return LogRead{ReadStatus::Closed, {}};
            }

            auto left = std::chrono::duration_cast<Duration>(deadline - std::chrono::steady_clock::now());
            if (left < Duration::zero()) left = Duration::zero();

            auto bytes = stream_->read(left);
            if (!bytes) return bytes.error();
            if (!*bytes) return LogRead{ReadStatus::Timeout, {}};

            decoder_.feed(**bytes);
            while (true) {
                auto frame = decoder_.pop();
                if (!frame) return frame.error();
                if (!*frame) break;
                frames_.push_back(std::move(**frame));
            }

            if (frames_.empty() && !stream_->eof() && std::chrono::steady_clock::now() >= deadline) {
                return LogRead{ReadStatus::Timeout, {}};
            }
        }
    }

    void close() override {
        if (stream_) stream_->close();
        frames_.clear();
    }

private:
    std::unique_ptr<HttpStream> stream_;
    docker::FrameDecoder decoder_;
    std::deque<LogFrame> frames_;
};

bool is_success(int status) {
    return status >= 200 && status < 300;
}

}  // anonymous namespace

DockerRuntime::DockerRuntime(const DockerConfig& config)
    : transport_(config.socket_path, config.call_timeout_ms)
    , api_prefix_(config.api_version.empty() ? std::string{} : "/" + config.api_version)
    , call_timeout_ms_(config.call_timeout_ms)
    , pull_timeout_ms_(config.pull_timeout_ms) {}

std::string DockerRuntime::endpoint(std::string_view path) const {
    return api_prefix_ + std::string{path};
}

Result<void> DockerRuntime::ping() {
    auto response = transport_.send({.method = "GET", .path = endpoint("/_ping")});
    if (!response) return response.error();
    if (!is_success(response->status)) {
        return docker::error_from_status(response->status, response->body, ErrorCode::RuntimeUnavailable);
    }
    return Result<void>{};
}

Result<ContainerId> DockerRuntime::create(const ContainerSpec& spec) {
    HttpRequest request{
        .method = "POST",
        .path = endpoint("/containers/create"),
        .body = docker::build_create_body(spec),
    };
    if (!spec.name.empty()) request.query.emplace_back("name", spec.name);

    auto response = transport_.send(request);
    if (!response) return response.error();

    if (response->status == 404) {
        // For create, 404 means the image is not present locally.
        auto err = docker::error_from_status(404, response->body, ErrorCode::ContainerCreateError);
        return Error{ErrorCode::ImageNotFound, err.message};
    }
    if (!is_success(response->status)) {
        return docker::error_from_status(response->status, response->body, ErrorCode::ContainerCreateError);
    }
    return docker::parse_create_response(response->body);
}

Result<void> DockerRuntime::start(const ContainerId& id) {
    auto response = transport_.send({
        .method = "POST",
        .path = endpoint("/containers/" + id + "/start"),
    });
    if (!response) return response.error();

    // 304: already started.
    if (is_success(response->status) || response->status == 304) return Result<void>{};
    return docker::error_from_status(response->status, response->body, ErrorCode::ContainerStartError);
}

Result<ContainerState> DockerRuntime::inspect(const std::string& id_or_name) {
    auto response = transport_.send({
        .method = "GET",
        .path = endpoint("/containers/" + id_or_name + "/json"),
    });
    if (!response) return response.error();
    if (!is_success(response->status)) {
        return docker::error_from_status(response->status, response->body, ErrorCode::RuntimeUnavailable);
    }
    return docker::parse_inspect(response->body);
}

Result<void> DockerRuntime::stop(const ContainerId& id, std::chrono::seconds grace) {
    // The engine answers only after the container is gone or killed.
    auto timeout = call_timeout_ms_ + static_cast<uint32_t>(grace.count()) * 1000;
    auto response = transport_.send({
        .method = "POST",
        .path = endpoint("/containers/" + id + "/stop"),
        .query = {{"t", std::to_string(grace.count())}},
    }, timeout);
    if (!response) return response.error();

    // 304: already stopped.
    if (is_success(response->status) || response->status == 304) return Result<void>{};
    return docker::error_from_status(response->status, response->body, ErrorCode::RuntimeUnavailable);
}

Result<void> DockerRuntime::remove(const ContainerId& id, bool force) {
    auto response = transport_.send({
        .method = "DELETE",
        .path = endpoint("/containers/" + id),
        .query = {{"v", "1"}, {"force", force ? "1" : "0"}},
    });
    if (!response) return response.error();
    if (is_success(response->status)) return Result<void>{};
    return docker::error_from_status(response->status, response->body, ErrorCode::RuntimeUnavailable);
}

Result<std::unique_ptr<ILogStream>> DockerRuntime::logs(const ContainerId& id, bool follow) {
    auto stream = transport_.open({
        .method = "GET",
        .path = endpoint("/containers/" + id + "/logs"),
        .query = {{"stdout", "1"}, {"stderr", "1"}, {"follow", follow ? "1" : "0"}},
    });
    if (!stream) return stream.error();

    if (!is_success((*stream)->status())) {
        auto body = (*stream)->read_all(std::chrono::milliseconds{call_timeout_ms_});
        return docker::error_from_status((*stream)->status(), body ? *body : std::string{},
                                         ErrorCode::RuntimeUnavailable);
    }
    return std::unique_ptr<ILogStream>{std::make_unique<DockerLogStream>(std::move(*stream))};
}

Result<std::vector<ContainerSummary>> DockerRuntime::list(
    const std::map<std::string, std::string>& labels) {
    HttpRequest request{
        .method = "GET",
        .path = endpoint("/containers/json"),
        .query = {{"all", "1"}},
    };
    if (!labels.empty()) request.query.emplace_back("filters", docker::build_label_filter(labels));

    auto response = transport_.send(request);
    if (!response) return response.error();
    if (!is_success(response->status)) {
        return docker::error_from_status(response->status, response->body, ErrorCode::RuntimeUnavailable);
    }
    return docker::parse_container_list(response->body);
}

Result<void> DockerRuntime::pull(const std::string& image) {
    auto [repository, tag] = docker::split_image_reference(image);
    auto response = transport_.send({
        .method = "POST",
        .path = endpoint("/images/create"),
        .query = {{"fromImage", repository}, {"tag", tag}},
    }, pull_timeout_ms_);
    if (!response) return response.error();

    if (response->status == 404) {
        auto err = docker::error_from_status(404, response->body, ErrorCode::ContainerCreateError);
        return Error{ErrorCode::ImageNotFound, err.message};
    }
    if (!is_success(response->status)) {
        return docker::error_from_status(response->status, response->body, ErrorCode::ContainerCreateError);
    }
    // Progress is streamed; failures mid-pull arrive as {"error": ...} lines.
    if (auto failure = docker::find_pull_error(response->body)) {
        return Error{ErrorCode::ImageNotFound, *failure};
    }
    return Result<void>{};
}

}  // namespace sandbox_orchestrator
