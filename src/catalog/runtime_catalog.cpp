/**
 * @file runtime_catalog.cpp
 * @brief RuntimeCatalog implementation and built-in environments.
 */

#include "catalog/runtime_catalog.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace sandbox_orchestrator {

namespace {

std::string lowercase(std::string_view text) {
    std::string out{text};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

constexpr std::array<std::pair<std::string_view, std::string_view>, 5> kAliases{{
    {"py", "python"},
    {"js", "javascript"},
    {"node", "javascript"},
    {"ts", "typescript"},
    {"web", "html"},
}};

RuntimeEnvironment from_entry(const RuntimeEntryConfig& entry, RuntimeEnvironment base) {
    base.id = entry.id;
    if (!entry.name.empty()) base.name = entry.name;
    if (!entry.language.empty()) base.language = canonical_language(entry.language);
    if (!entry.version.empty()) base.version = entry.version;
    if (!entry.image.empty()) base.image = entry.image;
    if (!entry.command.empty()) base.command = entry.command;
    if (!entry.inline_file.empty()) base.inline_file = entry.inline_file;
    if (!entry.extensions.empty()) base.extensions = entry.extensions;
    if (!entry.ports.empty()) base.ports = entry.ports;
    if (entry.timeout_s) base.default_timeout = std::chrono::seconds{*entry.timeout_s};
    if (base.name.empty()) base.name = base.id;
    return base;
}

}  // namespace

std::string canonical_language(std::string_view language) {
    auto lowered = lowercase(language);
    for (const auto& [alias, canonical] : kAliases) {
        if (lowered == alias) return std::string{canonical};
    }
    return lowered;
}

RuntimeCatalog::RuntimeCatalog(std::vector<RuntimeEnvironment> environments)
    : environments_(std::move(environments)) {}

RuntimeCatalog RuntimeCatalog::builtin() {
    return RuntimeCatalog{{
        {.id = "python-3.10", .name = "Python", .language = "python", .version = "3.10",
         .image = "python:3.10-slim", .command = "python main.py", .inline_file = "main.py",
         .extensions = {".py"}},
        {.id = "javascript-18", .name = "JavaScript", .language = "javascript", .version = "18",
         .image = "node:18-alpine", .command = "node index.js", .inline_file = "index.js",
         .extensions = {".js", ".mjs"}},
        {.id = "typescript-18", .name = "TypeScript", .language = "typescript", .version = "18",
         .image = "node:18-alpine", .command = "npx ts-node index.ts", .inline_file = "index.ts",
         .extensions = {".ts"}},
        {.id = "html-latest", .name = "HTML/CSS/JS", .language = "html", .version = "latest",
         .image = "nginx:alpine", .command = "nginx -g 'daemon off;'", .inline_file = "index.html",
         .extensions = {".html", ".htm", ".css"}, .ports = {80}},
        {.id = "java-17", .name = "Java", .language = "java", .version = "17",
         .image = "openjdk:17-slim", .command = "java Main.java",
         .inline_file = "Main.java", .extensions = {".java"}},
        {.id = "go-1.20", .name = "Go", .language = "go", .version = "1.20",
         .image = "golang:1.20-alpine", .command = "go run main.go", .inline_file = "main.go",
         .extensions = {".go"}},
    }};
}

Result<RuntimeEnvironment> RuntimeCatalog::resolve(std::string_view language,
                                                   std::optional<std::string_view> version) const {
    auto wanted = canonical_language(language);
    for (const auto& env : environments_) {
        if (env.language != wanted) continue;
        if (version && !version->empty() && env.version != *version) continue;
        return env;
    }

    std::string message = "Unsupported runtime: " + std::string{language};
    if (version && !version->empty()) message += " " + std::string{*version};
    return Error{ErrorCode::UnsupportedRuntime, std::move(message)};
}

std::optional<RuntimeEnvironment> RuntimeCatalog::find(std::string_view id) const {
    auto it = std::find_if(environments_.begin(), environments_.end(),
                           [&](const RuntimeEnvironment& env) { return env.id == id; });
    if (it == environments_.end()) return std::nullopt;
    return *it;
}

std::optional<RuntimeEnvironment> RuntimeCatalog::match_extension(std::string_view filename) const {
    auto dot = filename.rfind('.');
    if (dot == std::string_view::npos) return std::nullopt;
    auto ext = lowercase(filename.substr(dot));

    for (const auto& env : environments_) {
        if (std::find(env.extensions.begin(), env.extensions.end(), ext) != env.extensions.end()) {
            return env;
        }
    }
    return std::nullopt;
}

Result<RuntimeCatalog> load_catalog(const Config& config) {
    auto environments = RuntimeCatalog::builtin().environments();

    for (const auto& entry : config.runtimes) {
        auto existing = std::find_if(environments.begin(), environments.end(),
                                     [&](const RuntimeEnvironment& env) { return env.id == entry.id; });
        if (existing != environments.end()) {
            *existing = from_entry(entry, *existing);
            continue;
        }
        if (entry.language.empty() || entry.image.empty()) {
            return Error{ErrorCode::ConfigError,
                         "runtime " + entry.id + ": language and image are required"};
        }
        environments.push_back(from_entry(entry, RuntimeEnvironment{}));
    }

    return RuntimeCatalog{std::move(environments)};
}

}  // namespace sandbox_orchestrator
