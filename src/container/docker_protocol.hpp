/**
 * @file docker_protocol.hpp
 * @brief Docker Engine API wire helpers: the multiplexed log stream
 *        and request/response JSON.
 *
 * Pure functions and incremental decoders with no I/O, so they can be
 * tested against captured engine output.
 */

#pragma once

#include "container/container_runtime.hpp"
#include "core/result.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sandbox_orchestrator::docker {

// ─────────────────────────────────────────────
// Byte Helpers
// ─────────────────────────────────────────────

/// Encode a uint32_t in big-endian (network byte order).
void encode_u32(uint8_t* buf, uint32_t val);

/// Decode a uint32_t from big-endian.
[[nodiscard]] uint32_t decode_u32(const uint8_t* buf);

// ─────────────────────────────────────────────
// Multiplexed Log Stream
// ─────────────────────────────────────────────

/**
 * @brief Splits the engine's multiplexed stdout/stderr stream.
 *
 * Frame layout: [stream:1][0:3][size:4 big-endian][payload:size].
 * Stream 0 (stdin) is reported as stdout; anything above 2 is rejected.
 */
class FrameDecoder {
public:
    static constexpr size_t HEADER_SIZE = 8;

    void feed(std::string_view bytes);

    /// Next complete frame, nullopt when more bytes are needed.
    Result<std::optional<LogFrame>> pop();

    [[nodiscard]] size_t buffered() const noexcept { return buffer_.size(); }

private:
    std::string buffer_;
};

/// Build one frame; used by tests and by the mock engine.
[[nodiscard]] std::string encode_frame(StreamType stream, std::string_view payload);

// ─────────────────────────────────────────────
// Engine JSON
// ─────────────────────────────────────────────

/// Body of `POST /containers/create`.
[[nodiscard]] std::string build_create_body(const ContainerSpec& spec);

/// `filters` query value selecting containers by label.
[[nodiscard]] std::string build_label_filter(const std::map<std::string, std::string>& labels);

/// Split "repo/name:tag" into {"repo/name", "tag"}; tag defaults to "latest".
[[nodiscard]] std::pair<std::string, std::string> split_image_reference(std::string_view image);

[[nodiscard]] Result<ContainerId> parse_create_response(std::string_view body);
[[nodiscard]] Result<ContainerState> parse_inspect(std::string_view body);
[[nodiscard]] Result<std::vector<ContainerSummary>> parse_container_list(std::string_view body);

/// First `{"error": ...}` line of a streamed image pull, if any.
[[nodiscard]] std::optional<std::string> find_pull_error(std::string_view body);

/**
 * @brief Map a non-success engine status to an Error.
 *
 * 404 → ContainerNotFound, 409 → ContainerConflict, 5xx and others →
 * `fallback`. The engine's `{"message": ...}` is used when present.
 */
[[nodiscard]] Error error_from_status(int status, std::string_view body, ErrorCode fallback);

}  // namespace sandbox_orchestrator::docker
