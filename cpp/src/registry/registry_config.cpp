/**
 * @file registry_config.cpp
 * @brief RegistryConfig layered loading.
 *
 * Config loading strategy (priority low → high):
 *  1. Built-in defaults (Impl field initializers)
 *  2. JSON document: explicit file, COMPHUB_CONFIG_FILE, or an in-memory object
 *  3. COMPHUB_LOG_LEVEL / COMPHUB_LOG_FILE / COMPHUB_EARLY_REFERENCE_POLICY /
 *     COMPHUB_ALLOW_CIRCULAR_REFERENCES, applied after the file
 */
#include "cph_registry.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace comphub::registry
{

namespace fs = std::filesystem;
using utils::Logger;

namespace
{

std::string to_lower(std::string_view text)
{
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

const char *level_name(Logger::Level lvl) noexcept
{
    switch (lvl)
    {
    case Logger::Level::L_TRACE:
        return "trace";
    case Logger::Level::L_DEBUG:
        return "debug";
    case Logger::Level::L_INFO:
        return "info";
    case Logger::Level::L_WARNING:
        return "warning";
    case Logger::Level::L_ERROR:
        return "error";
    case Logger::Level::L_SYSTEM:
        return "system";
    }
    return "info";
}

/// Reads and parses a JSON file. Throws std::runtime_error naming the file.
nlohmann::json read_json_file(const fs::path &path)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        throw std::runtime_error(fmt::format("RegistryConfig: cannot open '{}'", path.string()));
    }
    try
    {
        nlohmann::json j;
        f >> j;
        return j;
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw std::runtime_error(
            fmt::format("RegistryConfig: '{}' is not valid JSON: {}", path.string(), e.what()));
    }
}

const char *getenv_nonempty(const char *name) noexcept
{
    const char *value = std::getenv(name);
    return (value != nullptr && *value != '\0') ? value : nullptr;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// RegistryConfig::Impl
// ---------------------------------------------------------------------------

struct RegistryConfig::Impl
{
    EarlyReferencePolicy early_reference_policy{EarlyReferencePolicy::RetainEarly};
    bool allow_circular_references{true};

    Logger::Level log_level{Logger::Level::L_INFO};
    std::string log_file{};
    bool use_flock{false};
    size_t max_queue_size{DEFAULT_MAX_QUEUE_SIZE};

    // ------------------------------------------------------------------
    // Extract every known field; a wrong type or value throws.
    // ------------------------------------------------------------------
    void apply_json(const nlohmann::json &j)
    {
        if (!j.is_object())
        {
            throw std::runtime_error("RegistryConfig: the configuration root must be a JSON object");
        }
        try
        {
            if (j.contains("registry"))
            {
                const auto &r = j.at("registry");
                if (r.contains("early_reference_policy"))
                {
                    const auto text = r.at("early_reference_policy").get<std::string>();
                    auto policy = parse_early_reference_policy(text);
                    if (!policy)
                    {
                        throw std::runtime_error(fmt::format(
                            "RegistryConfig: unknown registry.early_reference_policy '{}'", text));
                    }
                    early_reference_policy = *policy;
                }
                if (r.contains("allow_circular_references"))
                    allow_circular_references = r.at("allow_circular_references").get<bool>();
            }
            if (j.contains("logging"))
            {
                const auto &l = j.at("logging");
                if (l.contains("level"))
                {
                    const auto text = l.at("level").get<std::string>();
                    auto lvl = parse_log_level(text);
                    if (!lvl)
                    {
                        throw std::runtime_error(
                            fmt::format("RegistryConfig: unknown logging.level '{}'", text));
                    }
                    log_level = *lvl;
                }
                if (l.contains("file"))
                    log_file = l.at("file").is_null() ? std::string{} : l.at("file").get<std::string>();
                if (l.contains("use_flock"))
                    use_flock = l.at("use_flock").get<bool>();
                if (l.contains("max_queue_size"))
                {
                    const auto size = l.at("max_queue_size").get<int64_t>();
                    if (size <= 0)
                    {
                        throw std::runtime_error(
                            fmt::format("RegistryConfig: logging.max_queue_size must be positive, got {}", size));
                    }
                    max_queue_size = static_cast<size_t>(size);
                }
            }
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error(fmt::format("RegistryConfig: invalid value: {}", e.what()));
        }
    }

    void apply_environment()
    {
        if (const char *env = getenv_nonempty("COMPHUB_LOG_LEVEL"))
        {
            if (auto lvl = parse_log_level(env))
                log_level = *lvl;
            else
                LOGGER_WARN("RegistryConfig: ignoring COMPHUB_LOG_LEVEL='{}'", env);
        }
        if (const char *env = std::getenv("COMPHUB_LOG_FILE"))
            log_file = env;
        if (const char *env = getenv_nonempty("COMPHUB_EARLY_REFERENCE_POLICY"))
        {
            if (auto policy = parse_early_reference_policy(env))
                early_reference_policy = *policy;
            else
                LOGGER_WARN("RegistryConfig: ignoring COMPHUB_EARLY_REFERENCE_POLICY='{}'", env);
        }
        if (const char *env = getenv_nonempty("COMPHUB_ALLOW_CIRCULAR_REFERENCES"))
        {
            if (auto allow = parse_bool(env))
                allow_circular_references = *allow;
            else
                LOGGER_WARN("RegistryConfig: ignoring COMPHUB_ALLOW_CIRCULAR_REFERENCES='{}'", env);
        }
    }

    void log_resolved() const
    {
        LOGGER_DEBUG("RegistryConfig: early_reference_policy    = {}", to_string(early_reference_policy));
        LOGGER_DEBUG("RegistryConfig: allow_circular_references = {}", allow_circular_references);
        LOGGER_DEBUG("RegistryConfig: log_level                 = {}", level_name(log_level));
        LOGGER_DEBUG("RegistryConfig: log_file                  = {}", log_file.empty() ? "<console>" : log_file);
    }
};

// ---------------------------------------------------------------------------
// RegistryConfig public interface
// ---------------------------------------------------------------------------

RegistryConfig::RegistryConfig() : pImpl(std::make_unique<Impl>()) {}
RegistryConfig::~RegistryConfig() = default;

RegistryConfig::RegistryConfig(const RegistryConfig &other) : pImpl(std::make_unique<Impl>(*other.pImpl)) {}

RegistryConfig &RegistryConfig::operator=(const RegistryConfig &other)
{
    if (this != &other)
    {
        *pImpl = *other.pImpl;
    }
    return *this;
}

RegistryConfig::RegistryConfig(RegistryConfig &&) noexcept = default;
RegistryConfig &RegistryConfig::operator=(RegistryConfig &&) noexcept = default;

// static
RegistryConfig RegistryConfig::load(const fs::path &path)
{
    RegistryConfig cfg;
    cfg.pImpl->apply_json(read_json_file(path));
    LOGGER_INFO("RegistryConfig: loaded '{}'", path.string());
    cfg.pImpl->apply_environment();
    cfg.pImpl->log_resolved();
    return cfg;
}

// static
RegistryConfig RegistryConfig::load_default()
{
    RegistryConfig cfg;
    if (const char *env = getenv_nonempty("COMPHUB_CONFIG_FILE"))
    {
        // Validate into a scratch copy so a half-applied file never leaks through.
        Impl candidate;
        try
        {
            candidate.apply_json(read_json_file(env));
            *cfg.pImpl = candidate;
            LOGGER_INFO("RegistryConfig: loaded COMPHUB_CONFIG_FILE '{}'", env);
        }
        catch (const std::runtime_error &e)
        {
            LOGGER_WARN("RegistryConfig: {}; using defaults", e.what());
        }
    }
    cfg.pImpl->apply_environment();
    cfg.pImpl->log_resolved();
    return cfg;
}

// static
RegistryConfig RegistryConfig::from_json(const nlohmann::json &j)
{
    RegistryConfig cfg;
    cfg.pImpl->apply_json(j);
    return cfg;
}

void RegistryConfig::apply_environment()
{
    pImpl->apply_environment();
}

RegistryOptions RegistryConfig::registry_options() const
{
    RegistryOptions options;
    options.early_reference_policy = pImpl->early_reference_policy;
    options.allow_circular_references = pImpl->allow_circular_references;
    return options;
}

Logger::Level RegistryConfig::log_level() const noexcept
{
    return pImpl->log_level;
}

const std::string &RegistryConfig::log_file() const noexcept
{
    return pImpl->log_file;
}

bool RegistryConfig::use_flock() const noexcept
{
    return pImpl->use_flock;
}

size_t RegistryConfig::max_queue_size() const noexcept
{
    return pImpl->max_queue_size;
}

nlohmann::json RegistryConfig::to_json() const
{
    return nlohmann::json{
        {"registry",
         {{"early_reference_policy", to_string(pImpl->early_reference_policy)},
          {"allow_circular_references", pImpl->allow_circular_references}}},
        {"logging",
         {{"level", level_name(pImpl->log_level)},
          {"file", pImpl->log_file},
          {"use_flock", pImpl->use_flock},
          {"max_queue_size", pImpl->max_queue_size}}},
    };
}

bool RegistryConfig::apply_logging() const
{
    auto &logger = Logger::instance();
    logger.set_level(pImpl->log_level);
    logger.set_max_queue_size(pImpl->max_queue_size);
    if (pImpl->log_file.empty())
    {
        return logger.set_console();
    }
    return logger.set_logfile(pImpl->log_file, pImpl->use_flock);
}

// static
std::optional<Logger::Level> RegistryConfig::parse_log_level(std::string_view text) noexcept
{
    try
    {
        const std::string t = to_lower(text);
        if (t == "trace")
            return Logger::Level::L_TRACE;
        if (t == "debug")
            return Logger::Level::L_DEBUG;
        if (t == "info")
            return Logger::Level::L_INFO;
        if (t == "warning" || t == "warn")
            return Logger::Level::L_WARNING;
        if (t == "error")
            return Logger::Level::L_ERROR;
        if (t == "system")
            return Logger::Level::L_SYSTEM;
    }
    catch (const std::bad_alloc &)
    {
        return std::nullopt;
    }
    return std::nullopt;
}

// static
std::optional<EarlyReferencePolicy> RegistryConfig::parse_early_reference_policy(std::string_view text) noexcept
{
    if (text == to_string(EarlyReferencePolicy::RetainEarly))
        return EarlyReferencePolicy::RetainEarly;
    if (text == to_string(EarlyReferencePolicy::RejectMismatch))
        return EarlyReferencePolicy::RejectMismatch;
    return std::nullopt;
}

// static
std::optional<bool> RegistryConfig::parse_bool(std::string_view text) noexcept
{
    if (text == "true" || text == "1")
        return true;
    if (text == "false" || text == "0")
        return false;
    return std::nullopt;
}

} // namespace comphub::registry
