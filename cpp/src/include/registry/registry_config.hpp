#pragma once

/**
 * @file registry_config.hpp
 * @brief RegistryConfig: layered settings for the registry and the logger.
 *
 * ## Layers (priority low → high)
 *
 *  1. Built-in defaults
 *  2. A JSON document: `load(path)`, `from_json(j)`, or the file named by
 *     `COMPHUB_CONFIG_FILE` when `load_default()` is used
 *  3. Environment overrides, applied by `load`, `load_default` and `apply_environment`:
 *     - `COMPHUB_LOG_LEVEL`                  trace|debug|info|warning|error|system
 *     - `COMPHUB_LOG_FILE`                   path of the log file (empty = console)
 *     - `COMPHUB_EARLY_REFERENCE_POLICY`     retain_early|reject_mismatch
 *     - `COMPHUB_ALLOW_CIRCULAR_REFERENCES`  true|false|1|0
 *
 * ## Schema
 * @code{.json}
 * {
 *   "registry": { "early_reference_policy": "retain_early", "allow_circular_references": true },
 *   "logging":  { "level": "info", "file": "", "use_flock": false, "max_queue_size": 10000 }
 * }
 * @endcode
 * Unknown keys are ignored. Known keys with a wrong type or value are rejected.
 */

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "comphub_utils_export.h"
#include "registry/component_registry.hpp"
#include "utils/logger.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace comphub::registry
{

class COMPHUB_UTILS_EXPORT RegistryConfig
{
  public:
    static constexpr size_t DEFAULT_MAX_QUEUE_SIZE = 10000;

    /// Built-in defaults only.
    RegistryConfig();
    ~RegistryConfig();

    RegistryConfig(const RegistryConfig &other);
    RegistryConfig &operator=(const RegistryConfig &other);
    RegistryConfig(RegistryConfig &&) noexcept;
    RegistryConfig &operator=(RegistryConfig &&) noexcept;

    /**
     * @brief Defaults, then the JSON file at `path`, then the environment.
     * @throws std::runtime_error if the file is missing, unreadable, malformed
     *         or holds an invalid value.
     */
    static RegistryConfig load(const std::filesystem::path &path);

    /**
     * @brief Defaults, then `COMPHUB_CONFIG_FILE` if set, then the environment.
     * A file that cannot be used is logged and skipped; this never throws for it.
     */
    static RegistryConfig load_default();

    /**
     * @brief Defaults merged with `j`. The environment is not consulted.
     * @throws std::runtime_error if a known key holds an invalid value.
     */
    static RegistryConfig from_json(const nlohmann::json &j);

    /// Applies the `COMPHUB_*` overrides. Invalid values are logged and ignored.
    void apply_environment();

    // --- Resolved values ---

    [[nodiscard]] RegistryOptions registry_options() const;
    [[nodiscard]] utils::Logger::Level log_level() const noexcept;
    [[nodiscard]] const std::string &log_file() const noexcept;
    [[nodiscard]] bool use_flock() const noexcept;
    [[nodiscard]] size_t max_queue_size() const noexcept;

    /// Merged JSON view of every resolved value, in the schema above.
    [[nodiscard]] nlohmann::json to_json() const;

    /**
     * @brief Configures `Logger::instance()`: level, queue size, then the
     *        file sink (or the console when no file is set).
     * @return false if the sink could not be installed.
     */
    bool apply_logging() const;

    // --- String forms used by the file and environment layers ---

    static std::optional<utils::Logger::Level> parse_log_level(std::string_view text) noexcept;
    static std::optional<EarlyReferencePolicy> parse_early_reference_policy(std::string_view text) noexcept;
    static std::optional<bool> parse_bool(std::string_view text) noexcept;

  private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace comphub::registry

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
