/**
 * @file test_docker_protocol.cpp
 * @brief Unit tests for the Docker Engine API wire helpers.
 */

#include "container/docker_protocol.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace sandbox_orchestrator;
using namespace sandbox_orchestrator::docker;

// ── Byte helpers ─────────────────────────────

TEST(ByteHelpersTest, U32BigEndian) {
    uint8_t buf[4];
    encode_u32(buf, 0x01020304);
    EXPECT_EQ(buf[0], 0x01);
    EXPECT_EQ(buf[3], 0x04);
    EXPECT_EQ(decode_u32(buf), 0x01020304u);
}

// ── Log frames ───────────────────────────────

TEST(FrameDecoderTest, SplitsInterleavedStreams) {
    std::string wire = encode_frame(StreamType::Stdout, "hello\n")
                     + encode_frame(StreamType::Stderr, "oops\n")
                     + encode_frame(StreamType::Stdout, "bye\n");

    FrameDecoder decoder;
    std::vector<LogFrame> frames;
    // Byte-at-a-time feed exercises partial headers and payloads.
    for (char c : wire) {
        decoder.feed(std::string_view{&c, 1});
        while (true) {
            auto frame = decoder.pop();
            ASSERT_TRUE(frame.has_value());
            if (!frame->has_value()) break;
            frames.push_back(std::move(**frame));
        }
    }

    ASSERT_EQ(frames.size(), 3u);
    EXPECT_EQ(frames[0].stream, StreamType::Stdout);
    EXPECT_EQ(frames[0].text, "hello\n");
    EXPECT_EQ(frames[1].stream, StreamType::Stderr);
    EXPECT_EQ(frames[1].text, "oops\n");
    EXPECT_EQ(frames[2].text, "bye\n");
    EXPECT_EQ(decoder.buffered(), 0u);
}

TEST(FrameDecoderTest, RejectsInvalidHeader) {
    FrameDecoder decoder;
    decoder.feed(std::string("\x07\x00\x00\x00\x00\x00\x00\x01x", 9));
    auto frame = decoder.pop();
    ASSERT_FALSE(frame.has_value());
    EXPECT_EQ(frame.error().code, ErrorCode::ProtocolError);
}

TEST(FrameDecoderTest, EmptyPayload) {
    FrameDecoder decoder;
    decoder.feed(encode_frame(StreamType::Stderr, ""));
    auto frame = decoder.pop();
    ASSERT_TRUE(frame.has_value());
    ASSERT_TRUE(frame->has_value());
    EXPECT_EQ((*frame)->stream, StreamType::Stderr);
    EXPECT_TRUE((*frame)->text.empty());
}

// ── Engine JSON ──────────────────────────────

TEST(CreateBodyTest, CarriesLimitsMountsAndIsolation) {
    ContainerSpec spec;
    spec.name = "sandbox-abc";
    spec.image = "python:3.10-slim";
    spec.command = {"/bin/sh", "-c", "python main.py"};
    spec.workdir = "/app";
    spec.volumes = {VolumeMount{"/srv/projects/demo", "/app", true}};
    spec.env = {{"MODE", "test"}};
    spec.labels = {{"sandbox.managed", "true"}};
    spec.network_mode = "none";
    spec.limits = ResourceLimits{.memory_bytes = 256ULL * 1024 * 1024, .cpu_shares = 512,
                                 .timeout = std::chrono::seconds{30}, .nano_cpus = 1'000'000'000,
                                 .pids_limit = 64};

    auto body = nlohmann::json::parse(build_create_body(spec));
    EXPECT_EQ(body["Image"], "python:3.10-slim");
    EXPECT_EQ(body["Cmd"].size(), 3u);
    EXPECT_EQ(body["Cmd"][2], "python main.py");
    EXPECT_EQ(body["WorkingDir"], "/app");
    EXPECT_EQ(body["Env"][0], "MODE=test");
    EXPECT_EQ(body["Labels"]["sandbox.managed"], "true");

    const auto& host = body["HostConfig"];
    EXPECT_EQ(host["Memory"], 256ULL * 1024 * 1024);
    EXPECT_EQ(host["MemorySwap"], host["Memory"]);
    EXPECT_EQ(host["CpuShares"], 512);
    EXPECT_EQ(host["NanoCpus"], 1'000'000'000);
    EXPECT_EQ(host["PidsLimit"], 64);
    EXPECT_EQ(host["NetworkMode"], "none");
    EXPECT_EQ(host["Binds"][0], "/srv/projects/demo:/app:ro");
    EXPECT_TRUE(body["ExposedPorts"].empty());
}

TEST(CreateBodyTest, PublishesPortsOnEphemeralHostPorts) {
    ContainerSpec spec;
    spec.image = "nginx:alpine";
    spec.exposed_ports = {80};
    spec.network_mode = "bridge";

    auto body = nlohmann::json::parse(build_create_body(spec));
    EXPECT_TRUE(body["ExposedPorts"].contains("80/tcp"));
    EXPECT_EQ(body["HostConfig"]["PortBindings"]["80/tcp"][0]["HostPort"], "");
    EXPECT_FALSE(body["HostConfig"].contains("NanoCpus"));
}

TEST(LabelFilterTest, Format) {
    auto filter = nlohmann::json::parse(build_label_filter({{"sandbox.managed", "true"}, {"flag", ""}}));
    ASSERT_TRUE(filter["label"].is_array());
    EXPECT_EQ(filter["label"].size(), 2u);
    EXPECT_EQ(filter["label"][0], "flag");
    EXPECT_EQ(filter["label"][1], "sandbox.managed=true");
}

TEST(ImageReferenceTest, Split) {
    EXPECT_EQ(split_image_reference("python:3.10-slim"), std::make_pair(std::string{"python"}, std::string{"3.10-slim"}));
    EXPECT_EQ(split_image_reference("nginx"), std::make_pair(std::string{"nginx"}, std::string{"latest"}));
    EXPECT_EQ(split_image_reference("localhost:5000/team/app"),
              std::make_pair(std::string{"localhost:5000/team/app"}, std::string{"latest"}));
    EXPECT_EQ(split_image_reference("registry:5000/app:v2"),
              std::make_pair(std::string{"registry:5000/app"}, std::string{"v2"}));
}

TEST(EngineJsonTest, ParseCreateResponse) {
    auto id = parse_create_response(R"({"Id":"e90e34656806","Warnings":[]})");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(*id, "e90e34656806");

    EXPECT_FALSE(parse_create_response(R"({"Warnings":[]})").has_value());
    EXPECT_FALSE(parse_create_response("not json").has_value());
}

TEST(EngineJsonTest, ParseInspectExited) {
    auto state = parse_inspect(R"({
        "Id": "abc123",
        "Name": "/sandbox-1",
        "State": {"Status": "exited", "Running": false, "ExitCode": 3},
        "NetworkSettings": {"Ports": {}}
    })");
    ASSERT_TRUE(state.has_value()) << state.error().message;
    EXPECT_EQ(state->id, "abc123");
    EXPECT_EQ(state->name, "sandbox-1");
    EXPECT_FALSE(state->running);
    ASSERT_TRUE(state->exit_code.has_value());
    EXPECT_EQ(*state->exit_code, 3);
}

TEST(EngineJsonTest, ParseInspectRunningWithPorts) {
    auto state = parse_inspect(R"({
        "Id": "abc123",
        "Name": "/sandbox-2",
        "State": {"Status": "running", "Running": true, "ExitCode": 0},
        "NetworkSettings": {"Ports": {"80/tcp": [{"HostIp": "0.0.0.0", "HostPort": "49153"}]}}
    })");
    ASSERT_TRUE(state.has_value());
    EXPECT_TRUE(state->running);
    EXPECT_FALSE(state->exit_code.has_value());
    ASSERT_EQ(state->ports.size(), 1u);
    EXPECT_EQ(state->ports[0], (PortBinding{80, 49153}));
}

TEST(EngineJsonTest, ParseInspectWithoutState) {
    auto state = parse_inspect(R"({"Id": "abc"})");
    ASSERT_FALSE(state.has_value());
    EXPECT_EQ(state.error().code, ErrorCode::ProtocolError);
}

TEST(EngineJsonTest, ParseContainerList) {
    auto list = parse_container_list(R"([
        {"Id": "c1", "Names": ["/sandbox-a"], "Image": "python:3.10-slim", "State": "exited",
         "Labels": {"sandbox.managed": "true", "sandbox.execution_id": "a"}, "Created": 1700000000}
    ])");
    ASSERT_TRUE(list.has_value()) << list.error().message;
    ASSERT_EQ(list->size(), 1u);
    const auto& c = (*list)[0];
    EXPECT_EQ(c.id, "c1");
    EXPECT_EQ(c.name, "sandbox-a");
    EXPECT_EQ(c.state, "exited");
    EXPECT_EQ(c.labels.at("sandbox.execution_id"), "a");
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::seconds>(c.created_at.time_since_epoch()).count(),
              1700000000);
}

TEST(EngineJsonTest, FindPullError) {
    std::string progress = "{\"status\":\"Pulling from library/python\"}\n"
                           "{\"status\":\"Downloading\",\"progress\":\"[=> ]\"}\n";
    EXPECT_FALSE(find_pull_error(progress).has_value());

    auto failed = progress + "{\"errorDetail\":{\"message\":\"manifest unknown\"},\"error\":\"manifest unknown\"}\n";
    EXPECT_EQ(find_pull_error(failed).value_or(""), "manifest unknown");
}

TEST(EngineJsonTest, ErrorFromStatus) {
    auto missing = error_from_status(404, R"({"message":"No such container: abc"})", ErrorCode::Internal);
    EXPECT_EQ(missing.code, ErrorCode::ContainerNotFound);
    EXPECT_EQ(missing.message, "No such container: abc");

    auto conflict = error_from_status(409, R"({"message":"name in use"})", ErrorCode::ContainerCreateError);
    EXPECT_EQ(conflict.code, ErrorCode::ContainerConflict);

    auto server = error_from_status(500, "", ErrorCode::ContainerStartError);
    EXPECT_EQ(server.code, ErrorCode::ContainerStartError);
    EXPECT_EQ(server.message, "engine returned HTTP 500");
}
