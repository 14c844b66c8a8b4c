/**
 * @file docker_protocol.cpp
 * @brief Docker Engine API wire helpers.
 */

#include "container/docker_protocol.hpp"

#include <nlohmann/json.hpp>

#include <charconv>

namespace sandbox_orchestrator::docker {

namespace {

constexpr uint32_t kMaxFrameSize = 64 * 1024 * 1024;

std::string_view trim(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) text.remove_suffix(1);
    return text;
}

Error protocol_error(std::string message) {
    return Error{ErrorCode::ProtocolError, std::move(message)};
}

/// "/sandbox-abc" -> "sandbox-abc"
std::string strip_slash(std::string name) {
    if (!name.empty() && name.front() == '/') name.erase(0, 1);
    return name;
}

std::vector<PortBinding> parse_ports(const nlohmann::json& ports) {
    std::vector<PortBinding> out;
    if (!ports.is_object()) return out;

    for (const auto& [key, bindings] : ports.items()) {
        // Keys look like "80/tcp".
        uint16_t container_port = 0;
        auto slash = key.find('/');
        auto number = key.substr(0, slash);
        std::from_chars(number.data(), number.data() + number.size(), container_port);
        if (container_port == 0) continue;

        if (!bindings.is_array() || bindings.empty()) {
            out.push_back({container_port, 0});
            continue;
        }
        for (const auto& binding : bindings) {
            uint16_t host_port = 0;
            auto host = binding.value("HostPort", std::string{});
            std::from_chars(host.data(), host.data() + host.size(), host_port);
            out.push_back({container_port, host_port});
        }
    }
    return out;
}

}  // namespace

// ─────────────────────────────────────────────
// Byte Helpers
// ─────────────────────────────────────────────

void encode_u32(uint8_t* buf, uint32_t val) {
    buf[0] = static_cast<uint8_t>((val >> 24) & 0xFF);
    buf[1] = static_cast<uint8_t>((val >> 16) & 0xFF);
    buf[2] = static_cast<uint8_t>((val >> 8) & 0xFF);
    buf[3] = static_cast<uint8_t>(val & 0xFF);
}

uint32_t decode_u32(const uint8_t* buf) {
    return (static_cast<uint32_t>(buf[0]) << 24)
         | (static_cast<uint32_t>(buf[1]) << 16)
         | (static_cast<uint32_t>(buf[2]) << 8)
         | static_cast<uint32_t>(buf[3]);
}

// ─────────────────────────────────────────────
// Multiplexed Log Stream
// ─────────────────────────────────────────────

void FrameDecoder::feed(std::string_view bytes) {
    buffer_.append(bytes);
}

Result<std::optional<LogFrame>> FrameDecoder::pop() {
    if (buffer_.size() < HEADER_SIZE) return std::optional<LogFrame>{};

    const auto* header = reinterpret_cast<const uint8_t*>(buffer_.data());
    if (header[0] > 2 || header[1] != 0 || header[2] != 0 || header[3] != 0) {
        return protocol_error("invalid log frame header");
    }

    uint32_t size = decode_u32(header + 4);
    if (size > kMaxFrameSize) {
        return protocol_error("log frame too large: " + std::to_string(size) + " bytes");
    }
    if (buffer_.size() < HEADER_SIZE + size) return std::optional<LogFrame>{};

    LogFrame frame;
    frame.stream = header[0] == 2 ? StreamType::Stderr : StreamType::Stdout;
    frame.text = buffer_.substr(HEADER_SIZE, size);
    buffer_.erase(0, HEADER_SIZE + size);
    return std::optional<LogFrame>{std::move(frame)};
}

std::string encode_frame(StreamType stream, std::string_view payload) {
    std::string out(FrameDecoder::HEADER_SIZE, '\0');
    out[0] = stream == StreamType::Stderr ? '\2' : '\1';
    encode_u32(reinterpret_cast<uint8_t*>(out.data()) + 4, static_cast<uint32_t>(payload.size()));
    out.append(payload);
    return out;
}

// ─────────────────────────────────────────────
// Engine JSON
// ─────────────────────────────────────────────

std::string build_create_body(const ContainerSpec& spec) {
    nlohmann::json env = nlohmann::json::array();
    for (const auto& [key, value] : spec.env) {
        env.push_back(key + "=" + value);
    }

    nlohmann::json binds = nlohmann::json::array();
    for (const auto& volume : spec.volumes) {
        binds.push_back(volume.host_path + ":" + volume.container_path
                        + (volume.read_only ? ":ro" : ":rw"));
    }

    nlohmann::json exposed = nlohmann::json::object();
    nlohmann::json port_bindings = nlohmann::json::object();
    for (auto port : spec.exposed_ports) {
        auto key = std::to_string(port) + "/tcp";
        exposed[key] = nlohmann::json::object();
        nlohmann::json ephemeral = nlohmann::json::object();
        ephemeral["HostPort"] = "";
        port_bindings[key] = nlohmann::json::array({ephemeral});
    }

    nlohmann::json host_config = {
        {"Memory", spec.limits.memory_bytes},
        {"MemorySwap", spec.limits.memory_bytes},
        {"CpuShares", spec.limits.cpu_shares},
        {"Binds", binds},
        {"PortBindings", port_bindings},
    };
    if (spec.limits.nano_cpus > 0) host_config["NanoCpus"] = spec.limits.nano_cpus;
    if (spec.limits.pids_limit > 0) host_config["PidsLimit"] = spec.limits.pids_limit;
    if (!spec.network_mode.empty()) host_config["NetworkMode"] = spec.network_mode;

    nlohmann::json body = {
        {"Image", spec.image},
        {"Cmd", spec.command},
        {"Env", env},
        {"Labels", spec.labels},
        {"ExposedPorts", exposed},
        {"AttachStdout", true},
        {"AttachStderr", true},
        {"Tty", false},
        {"OpenStdin", false},
        {"HostConfig", host_config},
    };
    if (!spec.workdir.empty()) body["WorkingDir"] = spec.workdir;

    return body.dump();
}

std::string build_label_filter(const std::map<std::string, std::string>& labels) {
    nlohmann::json selectors = nlohmann::json::array();
    for (const auto& [key, value] : labels) {
        selectors.push_back(value.empty() ? key : key + "=" + value);
    }
    return nlohmann::json{{"label", selectors}}.dump();
}

std::pair<std::string, std::string> split_image_reference(std::string_view image) {
    auto at = image.find('@');
    if (at != std::string_view::npos) {
        return {std::string{image.substr(0, at)}, std::string{image.substr(at + 1)}};
    }
    auto slash = image.rfind('/');
    auto colon = image.rfind(':');
    if (colon != std::string_view::npos && (slash == std::string_view::npos || colon > slash)) {
        return {std::string{image.substr(0, colon)}, std::string{image.substr(colon + 1)}};
    }
    return {std::string{image}, "latest"};
}

Result<ContainerId> parse_create_response(std::string_view body) {
    try {
        auto doc = nlohmann::json::parse(body);
        auto id = doc.value("Id", std::string{});
        if (id.empty()) return protocol_error("create response without Id");
        return id;
    } catch (const nlohmann::json::exception& e) {
        return protocol_error(std::string{"create response: "} + e.what());
    }
}

Result<ContainerState> parse_inspect(std::string_view body) {
    try {
        auto doc = nlohmann::json::parse(body);
        ContainerState state;
        state.id = doc.value("Id", std::string{});
        state.name = strip_slash(doc.value("Name", std::string{}));

        const auto& st = doc.at("State");
        state.status = st.value("Status", std::string{});
        state.running = st.value("Running", false) || st.value("Restarting", false);
        if (!state.running && (state.status == "exited" || state.status == "dead")) {
            state.exit_code = st.value("ExitCode", -1);
        }

        if (auto net = doc.find("NetworkSettings"); net != doc.end() && net->is_object()) {
            if (auto ports = net->find("Ports"); ports != net->end()) {
                state.ports = parse_ports(*ports);
            }
        }
        return state;
    } catch (const nlohmann::json::exception& e) {
        return protocol_error(std::string{"inspect response: "} + e.what());
    }
}

Result<std::vector<ContainerSummary>> parse_container_list(std::string_view body) {
    try {
        auto doc = nlohmann::json::parse(body);
        if (!doc.is_array()) return protocol_error("container list is not an array");

        std::vector<ContainerSummary> out;
        out.reserve(doc.size());
        for (const auto& item : doc) {
            ContainerSummary summary;
            summary.id = item.value("Id", std::string{});
            if (auto names = item.find("Names"); names != item.end() && names->is_array() && !names->empty()) {
                summary.name = strip_slash(names->front().get<std::string>());
            }
            summary.image = item.value("Image", std::string{});
            summary.state = item.value("State", std::string{});
            if (auto labels = item.find("Labels"); labels != item.end() && labels->is_object()) {
                summary.labels = labels->get<std::map<std::string, std::string>>();
            }
            summary.created_at = Timestamp{std::chrono::seconds{item.value("Created", int64_t{0})}};
            out.push_back(std::move(summary));
        }
        return out;
    } catch (const nlohmann::json::exception& e) {
        return protocol_error(std::string{"container list: "} + e.what());
    }
}

std::optional<std::string> find_pull_error(std::string_view body) {
    while (!body.empty()) {
        auto nl = body.find('\n');
        auto line = trim(body.substr(0, nl));
        body = nl == std::string_view::npos ? std::string_view{} : body.substr(nl + 1);
        if (line.empty()) continue;

        auto doc = nlohmann::json::parse(line, nullptr, false);
        if (doc.is_object() && doc.contains("error") && doc["error"].is_string()) {
            return doc["error"].get<std::string>();
        }
    }
    return std::nullopt;
}

Error error_from_status(int status, std::string_view body, ErrorCode fallback) {
    std::string message;
    auto doc = nlohmann::json::parse(body, nullptr, false);
    if (doc.is_object() && doc.contains("message") && doc["message"].is_string()) {
        message = doc["message"].get<std::string>();
    } else {
        message = std::string{trim(body)};
    }
    if (message.empty()) message = "engine returned HTTP " + std::to_string(status);

    ErrorCode code = fallback;
    if (status == 404) code = ErrorCode::ContainerNotFound;
    else if (status == 409) code = ErrorCode::ContainerConflict;
    return Error{code, std::move(message)};
}

}  // namespace sandbox_orchestrator::docker
