/**
 * @file runtime_catalog.hpp
 * @brief Static mapping from language+version to a container image.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sandbox_orchestrator {

/**
 * @brief One supported language runtime. Immutable after load.
 */
struct RuntimeEnvironment {
    RuntimeId id;
    std::string name;
    std::string language;
    std::string version;
    std::string image;
    std::string command;                    ///< Default entry command, run via /bin/sh -c
    std::string inline_file;                ///< Inline sources are staged under this name, e.g. "main.py"
    std::vector<std::string> extensions;    ///< Including the leading dot
    std::vector<uint16_t> ports;            ///< Container ports to publish
    std::optional<std::chrono::seconds> default_timeout;
};

/**
 * @brief Read-only catalog of runtime environments.
 *
 * Lookups are case-insensitive on language. The common short names
 * ("py", "js", "ts", "web") are accepted as aliases.
 */
class RuntimeCatalog {
public:
    RuntimeCatalog() = default;
    explicit RuntimeCatalog(std::vector<RuntimeEnvironment> environments);

    /// The environments the service ships with.
    [[nodiscard]] static RuntimeCatalog builtin();

    /**
     * @brief Resolve a language and optional version.
     *
     * Without a version the first entry for the language wins.
     * Fails with ErrorCode::UnsupportedRuntime when nothing matches.
     */
    [[nodiscard]] Result<RuntimeEnvironment> resolve(std::string_view language,
                                                     std::optional<std::string_view> version = std::nullopt) const;

    [[nodiscard]] std::optional<RuntimeEnvironment> find(std::string_view id) const;

    /// Pick the environment that recognizes the extension of `filename`.
    [[nodiscard]] std::optional<RuntimeEnvironment> match_extension(std::string_view filename) const;

    [[nodiscard]] const std::vector<RuntimeEnvironment>& environments() const noexcept {
        return environments_;
    }

    [[nodiscard]] size_t size() const noexcept { return environments_.size(); }

private:
    std::vector<RuntimeEnvironment> environments_;
};

/**
 * @brief Build the catalog from `[[runtime]]` entries layered over the
 *        built-in defaults.
 *
 * An entry whose id matches a built-in overrides only the fields it sets;
 * new ids must provide language and image (ErrorCode::ConfigError).
 */
Result<RuntimeCatalog> load_catalog(const Config& config);

/// Lower-case a language name and map aliases to their canonical form.
std::string canonical_language(std::string_view language);

}  // namespace sandbox_orchestrator
