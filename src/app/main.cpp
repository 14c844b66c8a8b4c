/**
 * @file main.cpp
 * @brief sandbox_orchestrator command-line entry point.
 *
 * Wires the modules into a one-shot runner:
 *   Config → Logger → Runtime → Orchestrator → execute → follow → response
 */

#include "catalog/runtime_catalog.hpp"
#include "container/docker_runtime.hpp"
#include "container/mock_runtime.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/request.hpp"
#include "core/types.hpp"
#include "orchestrator/orchestrator.hpp"
#include "orchestrator/records.hpp"
#include "telemetry/json_sink.hpp"

#include <nlohmann/json.hpp>

#include <charconv>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

using namespace sandbox_orchestrator;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

constexpr Duration FOLLOW_POLL{200};

struct CLIArgs {
    std::optional<std::filesystem::path> config_path;
    std::optional<std::string> log_level;
    bool list_runtimes = false;
    bool run = false;
    bool sweep = false;
    bool mock = false;

    ExecutionRequest request;
    std::optional<std::filesystem::path> source_path;
};

void print_usage() {
    std::cout << "Usage: sandbox_orchestrator [OPTIONS]\n"
              << "  --config <path>      Configuration file (TOML)\n"
              << "  --runtimes           List the runtime catalog and exit\n"
              << "  --run                Run one execution and follow its output\n"
              << "    --project <id>     Project directory under orchestrator.projects_dir\n"
              << "    --language <name>  Runtime language (default: project metadata)\n"
              << "    --version <ver>    Runtime version\n"
              << "    --command <cmd>    Override the runtime's entry command\n"
              << "    --timeout <sec>    Wall-clock limit in seconds\n"
              << "    --memory <size>    Memory limit, e.g. 256m\n"
              << "    --env K=V          Environment variable (repeatable)\n"
              << "    --source <file>    Run this file instead of (or on top of) a project\n"
              << "  --sweep              Remove orphaned managed containers and exit\n"
              << "  --mock               Use the in-memory runtime instead of Docker\n"
              << "  --log-level <lvl>    debug, info, warn or error\n"
              << "  --help, -h           Show this help message\n";
}

std::optional<int64_t> parse_int(std::string_view text) {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

[[noreturn]] void usage_error(const std::string& message) {
    std::cerr << "sandbox_orchestrator: " << message << "\n";
    std::exit(2);
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    auto next_value = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) usage_error(flag + " requires a value");
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            args.config_path = next_value(i, arg);
        } else if (arg == "--runtimes") {
            args.list_runtimes = true;
        } else if (arg == "--run") {
            args.run = true;
        } else if (arg == "--project") {
            args.request.project_id = next_value(i, arg);
        } else if (arg == "--language") {
            args.request.language = next_value(i, arg);
        } else if (arg == "--version") {
            args.request.version = next_value(i, arg);
        } else if (arg == "--command") {
            args.request.command = next_value(i, arg);
        } else if (arg == "--timeout") {
            auto value = next_value(i, arg);
            auto seconds = parse_int(value);
            if (!seconds) usage_error("invalid --timeout: " + value);
            args.request.timeout_seconds = *seconds;
        } else if (arg == "--memory") {
            auto value = next_value(i, arg);
            auto bytes = parse_memory_size(value);
            if (!bytes) usage_error("invalid --memory: " + value);
            args.request.memory_bytes = static_cast<int64_t>(*bytes);
        } else if (arg == "--env") {
            auto value = next_value(i, arg);
            auto eq = value.find('=');
            if (eq == std::string::npos || eq == 0) usage_error("--env expects K=V, got: " + value);
            args.request.environment_vars[value.substr(0, eq)] = value.substr(eq + 1);
        } else if (arg == "--source") {
            args.source_path = next_value(i, arg);
        } else if (arg == "--sweep") {
            args.sweep = true;
        } else if (arg == "--mock") {
            args.mock = true;
        } else if (arg == "--log-level") {
            args.log_level = next_value(i, arg);
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            usage_error("unknown option: " + arg);
        }
    }
    return args;
}

void print_runtimes(const RuntimeCatalog& catalog) {
    std::cout << std::left
              << std::setw(16) << "ID" << std::setw(12) << "LANGUAGE" << std::setw(10) << "VERSION"
              << std::setw(24) << "IMAGE" << "COMMAND\n";
    for (const auto& env : catalog.environments()) {
        std::cout << std::setw(16) << env.id << std::setw(12) << env.language << std::setw(10) << env.version
                  << std::setw(24) << env.image << env.command << "\n";
    }
}

Result<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return Error{ErrorCode::ProjectNotFound, "Cannot read " + path.string()};
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

/**
 * @brief Stream output until the log closes, then wait for the final status.
 *
 * A signal cancels the execution once; output keeps flowing until the
 * container is stopped.
 */
Result<ExecutionResponse> follow_execution(Orchestrator& orchestrator, const ExecutionId& id, Logger& logger) {
    auto cursor = orchestrator.follow(id);
    if (!cursor) return cursor.error();

    bool cancel_sent = false;
    auto cancel_on_signal = [&] {
        if (!g_shutdown_requested || cancel_sent) return;
        cancel_sent = true;
        logger.info("interrupt received, cancelling", {{"execution", id}});
        if (auto cancelled = orchestrator.cancel(id); !cancelled) {
            logger.debug("cancel rejected", {{"execution", id}, {"error", cancelled.error().describe()}});
        }
    };

    LogChunk chunk;
    while (true) {
        auto read = cursor->next(chunk, FOLLOW_POLL);
        if (!read) return read.error();
        if (*read == ReadStatus::Closed) break;
        if (*read == ReadStatus::Data) {
            auto& out = chunk.stream == StreamType::Stderr ? std::cerr : std::cout;
            out << chunk.text << std::flush;
        }
        cancel_on_signal();
    }

    while (true) {
        auto response = orchestrator.wait(id, FOLLOW_POLL);
        if (response || response.error().code != ErrorCode::Timeout) return response;
        cancel_on_signal();
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);

    // ── Load Configuration ───────────────────
    Config config = default_config();
    if (args.config_path) {
        auto loaded = load_config(*args.config_path);
        if (!loaded) {
            std::cerr << "Failed to load config: " << loaded.error().describe() << "\n";
            return 2;
        }
        config = std::move(*loaded);
    }
    if (args.log_level) config.telemetry.log_level = *args.log_level;

    auto level = parse_log_level(config.telemetry.log_level);
    if (!level) {
        std::cerr << "Unknown log level: " << config.telemetry.log_level << "\n";
        return 2;
    }

    auto catalog = load_catalog(config);
    if (!catalog) {
        std::cerr << "Invalid runtime catalog: " << catalog.error().describe() << "\n";
        return 2;
    }

    if (args.list_runtimes) {
        print_runtimes(*catalog);
        return 0;
    }
    if (!args.run && !args.sweep) {
        print_usage();
        return 2;
    }

    // ── Inline source ────────────────────────
    if (args.source_path) {
        auto source = read_file(*args.source_path);
        if (!source) {
            std::cerr << source.error().describe() << "\n";
            return 1;
        }
        args.request.source = std::move(*source);

        if (!args.request.language && args.request.project_id.empty()) {
            if (auto env = catalog->match_extension(args.source_path->filename().string())) {
                args.request.language = env->language;
                if (!args.request.version) args.request.version = env->version;
            }
        }
    }

    // ── Initialize Telemetry ─────────────────
    std::unique_ptr<ILogSink> log_sink;
    std::unique_ptr<ILogSink> metrics_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "orchestrator",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
        if (config.telemetry.metrics) {
            metrics_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "metrics",
                                                          config.telemetry.max_file_size_mb,
                                                          config.telemetry.rotate_count);
        }
    } else {
        log_sink = std::make_unique<StderrSink>();
    }

    // ── Container Runtime ────────────────────
    // Declared before the orchestrator so it outlives it.
    std::unique_ptr<IContainerRuntime> runtime;
    if (args.mock) {
        runtime = std::make_unique<MockRuntime>();
    } else {
        runtime = std::make_unique<DockerRuntime>(config.docker);
    }

    Orchestrator orchestrator(*runtime, Orchestrator::Options{
        .config = config,
        .catalog = std::move(*catalog),
        .log_sink = std::move(log_sink),
        .log_level = *level,
        .metrics_sink = std::move(metrics_sink),
    });
    auto& logger = orchestrator.logger();

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Sweep shortcut ───────────────────────
    if (args.sweep && !args.run) {
        auto swept = orchestrator.sweep_orphans();
        if (!swept) {
            logger.error("sweep failed", {{"error", swept.error().describe()}});
            return 1;
        }
        std::cout << "Removed " << *swept << " orphaned container(s)\n";
        return 0;
    }

    auto started = orchestrator.start();
    if (!started) {
        logger.error("orchestrator failed to start", {{"error", started.error().describe()}});
        return 1;
    }

    // ── Run ──────────────────────────────────
    auto id = orchestrator.execute(args.request);
    if (!id) {
        logger.error("execution rejected", {{"error", id.error().describe()}});
        std::cout << nlohmann::json{{"error", id.error().describe()}}.dump(2) << std::endl;
        return 1;
    }

    auto response = follow_execution(orchestrator, *id, logger);
    if (!response) {
        logger.error("lost track of execution", {{"execution", *id}, {"error", response.error().describe()}});
        return 1;
    }

    std::cout << nlohmann::json(*response).dump(2) << std::endl;

    // ── Graceful Shutdown ────────────────────
    orchestrator.shutdown();
    return response->status == ExecutionStatus::Succeeded ? 0 : 1;
}
