/**
 * @file mock_runtime.cpp
 * @brief MockRuntime implementation.
 */

#include "container/mock_runtime.hpp"

#include <algorithm>
#include <charconv>
#include <cstdio>

namespace sandbox_orchestrator {

using Clock = std::chrono::steady_clock;

struct MockRuntime::Container {
    ContainerId id;
    ContainerSpec spec;
    Script script;
    Timestamp created_at;
    std::optional<SteadyTime> started_at;
    std::optional<SteadyTime> killed_at;
    bool removed{false};

    /// Moment the process ends, if already determined.
    [[nodiscard]] std::optional<SteadyTime> finished_at() const {
        std::optional<SteadyTime> natural;
        if (started_at && script.exit_code) natural = *started_at + script.run_time;
        if (killed_at && (!natural || *killed_at < *natural)) return killed_at;
        return natural;
    }

    [[nodiscard]] bool running(SteadyTime now) const {
        if (!started_at) return false;
        auto end = finished_at();
        return !end || now < *end;
    }

    [[nodiscard]] std::optional<int> exit_code(SteadyTime now) const {
        auto end = finished_at();
        if (!started_at || !end || now < *end) return std::nullopt;
        if (killed_at && *end == *killed_at) return KILLED_EXIT_CODE;
        return script.exit_code;
    }
};

struct MockRuntime::State {
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::map<ContainerId, std::shared_ptr<Container>> containers;
    std::map<Operation, std::pair<ErrorCode, uint32_t>> failures;
    std::array<uint32_t, static_cast<size_t>(Operation::Count_)> calls{};
    std::set<std::string> images;
    ScriptFn script;
    uint64_t next_id{1};
};

namespace {

/**
 * @brief Replays a container's script against the clock.
 */
class MockLogStream : public ILogStream {
public:
    MockLogStream(std::shared_ptr<MockRuntime::State> state,
                  std::shared_ptr<MockRuntime::Container> container,
                  bool follow)
        : state_(std::move(state)), container_(std::move(container)), follow_(follow) {}

    Result<LogRead> next(Duration timeout) override {
        auto deadline = Clock::now() + timeout;
        std::unique_lock lock(state_->mutex);

        while (true) {
            if (closed_ || container_->removed) return LogRead{ReadStatus::Closed, {}};

            auto now = Clock::now();
            const auto& output = container_->script.output;
            auto end = container_->finished_at();

            if (container_->started_at && next_ < output.size()) {
                auto due = *container_->started_at + output[next_].first;
                bool before_end = !end || due <= *end;
                if (before_end && due <= now) {
                    return LogRead{ReadStatus::Data, output[next_++].second};
                }
                if (!before_end) next_ = output.size();
            }

            bool finished = container_->started_at && end && now >= *end;
            if (finished || (!follow_ && next_ >= output.size())) {
                return LogRead{ReadStatus::Closed, {}};
            }
            if (now >= deadline) return LogRead{ReadStatus::Timeout, {}};

            // Sleep until the next frame, the exit, or the deadline.
            auto wake = deadline;
            if (container_->started_at && next_ < output.size()) {
                wake = std::min(wake, *container_->started_at + output[next_].first);
            }
            if (end) wake = std::min(wake, *end);
            state_->cv.wait_until(lock, wake);
        }
    }

    void close() override {
        std::lock_guard lock(state_->mutex);
        closed_ = true;
    }

private:
    std::shared_ptr<MockRuntime::State> state_;
    std::shared_ptr<MockRuntime::Container> container_;
    bool follow_;
    size_t next_{0};
    bool closed_{false};
};

/// Split on `;` and `&&` outside quotes. The bool marks a preceding `&&`.
std::vector<std::pair<std::string, bool>> split_statements(std::string_view command) {
    std::vector<std::pair<std::string, bool>> out;
    std::string current;
    bool chained = false;
    char quote = 0;

    for (size_t i = 0; i < command.size(); ++i) {
        char c = command[i];
        if (quote) {
            if (c == quote) quote = 0;
            current.push_back(c);
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
            current.push_back(c);
        } else if (c == ';' || c == '\n') {
            out.emplace_back(std::move(current), chained);
            current.clear();
            chained = false;
        } else if (c == '&' && i + 1 < command.size() && command[i + 1] == '&') {
            out.emplace_back(std::move(current), chained);
            current.clear();
            chained = true;
            ++i;
        } else {
            current.push_back(c);
        }
    }
    out.emplace_back(std::move(current), chained);
    return out;
}

std::vector<std::string> split_words(std::string_view statement) {
    std::vector<std::string> words;
    std::string current;
    bool in_word = false;
    char quote = 0;

    for (char c : statement) {
        if (quote) {
            if (c == quote) {
                quote = 0;
            } else {
                current.push_back(c);
            }
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
            in_word = true;
        } else if (c == ' ' || c == '\t') {
            if (in_word) {
                words.push_back(std::move(current));
                current.clear();
                in_word = false;
            }
        } else {
            current.push_back(c);
            in_word = true;
        }
    }
    if (in_word) words.push_back(std::move(current));
    return words;
}

}  // namespace

// ─────────────────────────────────────────────
// Construction / Scripting
// ─────────────────────────────────────────────

MockRuntime::MockRuntime() : state_(std::make_shared<State>()) {
    state_->script = [](const ContainerSpec& spec) {
        if (spec.command.size() == 3 && spec.command[1] == "-c") return interpret(spec.command[2]);
        std::string joined;
        for (const auto& arg : spec.command) {
            if (!joined.empty()) joined += ' ';
            joined += arg;
        }
        return interpret(joined);
    };
}

MockRuntime::~MockRuntime() {
    // Wake any stream still waiting so it observes removal.
    std::lock_guard lock(state_->mutex);
    for (auto& [id, container] : state_->containers) {
        container->removed = true;
    }
    state_->cv.notify_all();
}

MockRuntime::Script MockRuntime::interpret(std::string_view command) {
    Script script;
    Duration clock{0};
    int status = 0;

    for (const auto& [statement, chained] : split_statements(command)) {
        if (chained && status != 0) break;

        auto words = split_words(statement);
        if (words.empty()) continue;
        const auto& verb = words[0];

        if (verb == "echo") {
            StreamType stream = StreamType::Stdout;
            std::string text;
            for (size_t i = 1; i < words.size(); ++i) {
                if (words[i] == ">&2" || words[i] == "1>&2") {
                    stream = StreamType::Stderr;
                    continue;
                }
                if (!text.empty()) text += ' ';
                text += words[i];
            }
            script.output.push_back({clock, LogFrame{stream, text + "\n"}});
            status = 0;
        } else if (verb == "sleep" && words.size() > 1) {
            if (words[1] == "infinity") {
                script.exit_code.reset();
                return script;
            }
            double seconds = 0.0;
            std::sscanf(words[1].c_str(), "%lf", &seconds);
            clock += std::chrono::duration_cast<Duration>(std::chrono::duration<double>(seconds));
            status = 0;
        } else if (verb == "exit") {
            int code = 0;
            if (words.size() > 1) {
                std::from_chars(words[1].data(), words[1].data() + words[1].size(), code);
            }
            script.run_time = clock;
            script.exit_code = code;
            return script;
        } else if (verb == "false") {
            status = 1;
        } else {
            status = 0;
        }
    }

    script.run_time = clock;
    script.exit_code = status;
    return script;
}

void MockRuntime::set_script(ScriptFn fn) {
    std::lock_guard lock(state_->mutex);
    state_->script = std::move(fn);
}

void MockRuntime::fail_next(Operation op, ErrorCode code, uint32_t times) {
    std::lock_guard lock(state_->mutex);
    state_->failures[op] = {code, times};
}

void MockRuntime::set_available_images(std::set<std::string> images) {
    std::lock_guard lock(state_->mutex);
    state_->images = std::move(images);
}

void MockRuntime::vanish(const ContainerId& id) {
    std::lock_guard lock(state_->mutex);
    auto it = state_->containers.find(id);
    if (it == state_->containers.end()) return;
    it->second->removed = true;
    state_->containers.erase(it);
    state_->cv.notify_all();
}

uint32_t MockRuntime::calls(Operation op) const {
    std::lock_guard lock(state_->mutex);
    return state_->calls[static_cast<size_t>(op)];
}

size_t MockRuntime::live_containers() const {
    std::lock_guard lock(state_->mutex);
    return state_->containers.size();
}

bool MockRuntime::exists(const ContainerId& id) const {
    std::lock_guard lock(state_->mutex);
    return state_->containers.count(id) > 0;
}

std::optional<ContainerSpec> MockRuntime::spec_of(const ContainerId& id) const {
    std::lock_guard lock(state_->mutex);
    auto it = state_->containers.find(id);
    if (it == state_->containers.end()) return std::nullopt;
    return it->second->spec;
}

std::vector<ContainerId> MockRuntime::container_ids() const {
    std::lock_guard lock(state_->mutex);
    std::vector<ContainerId> ids;
    ids.reserve(state_->containers.size());
    for (const auto& [id, container] : state_->containers) ids.push_back(id);
    return ids;
}

/// Called with state_->mutex held.
std::optional<Error> MockRuntime::take_failure(Operation op) {
    ++state_->calls[static_cast<size_t>(op)];
    auto it = state_->failures.find(op);
    if (it == state_->failures.end() || it->second.second == 0) return std::nullopt;

    Error err{it->second.first, "injected failure"};
    if (--it->second.second == 0) state_->failures.erase(it);
    return err;
}

// ─────────────────────────────────────────────
// IContainerRuntime
// ─────────────────────────────────────────────

Result<void> MockRuntime::ping() {
    std::lock_guard lock(state_->mutex);
    if (auto err = take_failure(Operation::Ping)) return *err;
    return Result<void>{};
}

Result<ContainerId> MockRuntime::create(const ContainerSpec& spec) {
    ScriptFn script_fn;
    {
        std::lock_guard lock(state_->mutex);
        if (auto err = take_failure(Operation::Create)) return *err;

        if (!state_->images.empty() && state_->images.count(spec.image) == 0) {
            return Error{ErrorCode::ImageNotFound, "No such image: " + spec.image};
        }
        if (!spec.name.empty()) {
            for (const auto& [id, existing] : state_->containers) {
                if (existing->spec.name == spec.name) {
                    return Error{ErrorCode::ContainerConflict,
                                 "Conflict. The container name \"/" + spec.name + "\" is already in use"};
                }
            }
        }
        script_fn = state_->script;
    }

    // Scripts are user code; run them outside the lock.
    auto script = script_fn(spec);

    std::lock_guard lock(state_->mutex);
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "mock%012llx",
                  static_cast<unsigned long long>(state_->next_id++));

    auto container = std::make_shared<Container>();
    container->id = buffer;
    container->spec = spec;
    container->script = std::move(script);
    container->created_at = std::chrono::system_clock::now();
    state_->containers[container->id] = container;
    return container->id;
}

Result<void> MockRuntime::start(const ContainerId& id) {
    std::lock_guard lock(state_->mutex);
    if (auto err = take_failure(Operation::Start)) return *err;

    auto it = state_->containers.find(id);
    if (it == state_->containers.end()) {
        return Error{ErrorCode::ContainerNotFound, "No such container: " + id};
    }
    if (!it->second->started_at) {
        it->second->started_at = Clock::now();
        state_->cv.notify_all();
    }
    return Result<void>{};
}

Result<ContainerState> MockRuntime::inspect(const std::string& id_or_name) {
    std::lock_guard lock(state_->mutex);
    if (auto err = take_failure(Operation::Inspect)) return *err;

    std::shared_ptr<Container> container;
    if (auto it = state_->containers.find(id_or_name); it != state_->containers.end()) {
        container = it->second;
    } else {
        for (const auto& [id, candidate] : state_->containers) {
            if (candidate->spec.name == id_or_name) container = candidate;
        }
    }
    if (!container) {
        return Error{ErrorCode::ContainerNotFound, "No such container: " + id_or_name};
    }

    auto now = Clock::now();
    ContainerState state;
    state.id = container->id;
    state.name = container->spec.name;
    state.running = container->running(now);
    state.exit_code = container->exit_code(now);
    state.status = !container->started_at ? "created" : (state.running ? "running" : "exited");

    uint16_t host_port = 32768;
    for (auto port : container->spec.exposed_ports) {
        state.ports.push_back({port, state.running ? host_port++ : uint16_t{0}});
    }
    return state;
}

Result<void> MockRuntime::stop(const ContainerId& id, std::chrono::seconds /*grace*/) {
    std::lock_guard lock(state_->mutex);
    if (auto err = take_failure(Operation::Stop)) return *err;

    auto it = state_->containers.find(id);
    if (it == state_->containers.end()) {
        return Error{ErrorCode::ContainerNotFound, "No such container: " + id};
    }
    auto& container = *it->second;
    if (container.running(Clock::now())) {
        container.killed_at = Clock::now();
        state_->cv.notify_all();
    }
    return Result<void>{};
}

Result<void> MockRuntime::remove(const ContainerId& id, bool force) {
    std::lock_guard lock(state_->mutex);
    if (auto err = take_failure(Operation::Remove)) return *err;

    auto it = state_->containers.find(id);
    if (it == state_->containers.end()) {
        return Error{ErrorCode::ContainerNotFound, "No such container: " + id};
    }
    if (it->second->running(Clock::now()) && !force) {
        return Error{ErrorCode::ContainerConflict, "container is running: " + id};
    }
    it->second->removed = true;
    state_->containers.erase(it);
    state_->cv.notify_all();
    return Result<void>{};
}

Result<std::unique_ptr<ILogStream>> MockRuntime::logs(const ContainerId& id, bool follow) {
    std::lock_guard lock(state_->mutex);
    if (auto err = take_failure(Operation::Logs)) return *err;

    auto it = state_->containers.find(id);
    if (it == state_->containers.end()) {
        return Error{ErrorCode::ContainerNotFound, "No such container: " + id};
    }
    return std::unique_ptr<ILogStream>{std::make_unique<MockLogStream>(state_, it->second, follow)};
}

Result<std::vector<ContainerSummary>> MockRuntime::list(
    const std::map<std::string, std::string>& labels) {
    std::lock_guard lock(state_->mutex);
    if (auto err = take_failure(Operation::List)) return *err;

    auto now = Clock::now();
    std::vector<ContainerSummary> out;
    for (const auto& [id, container] : state_->containers) {
        bool matches = std::all_of(labels.begin(), labels.end(), [&](const auto& label) {
            auto found = container->spec.labels.find(label.first);
            return found != container->spec.labels.end()
                && (label.second.empty() || found->second == label.second);
        });
        if (!matches) continue;

        out.push_back({
            .id = id,
            .name = container->spec.name,
            .image = container->spec.image,
            .state = !container->started_at ? "created" : (container->running(now) ? "running" : "exited"),
            .labels = container->spec.labels,
            .created_at = container->created_at,
        });
    }
    return out;
}

Result<void> MockRuntime::pull(const std::string& image) {
    std::lock_guard lock(state_->mutex);
    if (auto err = take_failure(Operation::Pull)) return *err;
    if (!state_->images.empty()) state_->images.insert(image);
    return Result<void>{};
}

}  // namespace sandbox_orchestrator
