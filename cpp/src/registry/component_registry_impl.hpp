#pragma once
/**
 * @file component_registry_impl.hpp
 * @brief Private state of ComponentRegistry, shared by the registry sources.
 *
 * Every field below `m_mutex` is guarded by it. Functions with a `_locked`
 * suffix expect the caller to hold the lock; those taking the
 * `std::unique_lock` may release it temporarily and always return with it held.
 */

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "cph_registry.hpp"
#include "registry/detail/ordered_name_set.hpp"

namespace comphub::registry
{

/// Throws std::invalid_argument (empty) or std::length_error (too long).
void validate_component_name(std::string_view name, const char *param_name);

struct ComponentRegistry::Impl
{
    // The thread that owns one running construction.
    struct CreationMark
    {
        std::thread::id owner;
    };

    // A registered early factory that has not produced its object yet.
    struct EarlySlot
    {
        EarlyFactory factory;
        bool producing{false};
        std::thread::id producer;
    };

    struct SuppressedBag
    {
        std::vector<std::exception_ptr> errors;
        size_t dropped{0};
    };

    enum class ProducePhase
    {
        Producing,
        PostProcessing,
    };

    struct ProduceMark
    {
        std::thread::id owner;
        ProducePhase phase;
    };

    explicit Impl(RegistryOptions options) : m_options(options) {}

    struct PendingLog
    {
        RegistryLogLevel level;
        std::string message;
    };

    const RegistryOptions m_options;
    AliasRegistry m_aliases;
    std::atomic<std::shared_ptr<RegistryLogSink>> m_log_sink{nullptr};

    // Lines logged under m_mutex wait here until the logging call leaves the lock.
    mutable std::mutex m_log_mutex;
    mutable std::vector<PendingLog> m_pending_logs;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;

    // --- singleton cache ---
    std::unordered_map<std::string, Instance> m_built;
    std::vector<std::string> m_registered_order;

    // --- creation tracking ---
    std::unordered_map<std::string, CreationMark> m_in_creation;
    std::unordered_set<std::string> m_excluded;
    std::unordered_map<std::string, SuppressedBag> m_suppressed;
    std::unordered_map<std::thread::id, std::thread::id> m_waiting_for;

    // --- early references ---
    std::unordered_map<std::string, EarlySlot> m_early_factories;
    std::unordered_map<std::string, Instance> m_early_objects;

    // --- dependency graph ---
    std::unordered_map<std::string, detail::OrderedNameSet> m_dependents;
    std::unordered_map<std::string, detail::OrderedNameSet> m_dependencies;
    std::unordered_map<std::string, detail::OrderedNameSet> m_contains;

    // --- teardown ---
    std::vector<std::string> m_teardown_order;
    std::unordered_map<std::string, TeardownCallback> m_teardowns;
    bool m_in_destruction{false};
    std::thread::id m_destruction_owner;

    // --- produced objects ---
    std::unordered_map<std::string, Instance> m_produced;
    std::unordered_map<std::string, Instance> m_deferred; // produced, post-processing pending
    std::unordered_map<std::string, ProduceMark> m_producing;

    // ========================================================================
    // Logging
    // ========================================================================

    /// Queues a line; it reaches the sink at the next deliver_logs().
    void log(RegistryLogLevel level, std::string msg) const;

    /// Hands every queued line to the sink. Never called with m_mutex held.
    void deliver_logs() const;

    /**
     * Guard that runs deliver_logs() when it leaves scope. Public entry points
     * that log declare it before taking m_mutex, so it fires after the unlock.
     */
    [[nodiscard]] auto deliver_logs_on_exit() const
    {
        return comphub::basics::make_scope_guard([this] { deliver_logs(); });
    }

    template <typename... Args>
    void logf(RegistryLogLevel level, fmt::format_string<Args...> fmt_str, Args &&...args) const
    {
        log(level, fmt::format(fmt_str, std::forward<Args>(args)...));
    }

    // ========================================================================
    // Creation helpers (creation_coordinator.cpp)
    // ========================================================================

    /// In creation and not excluded.
    [[nodiscard]] bool is_tracked_in_creation_locked(const std::string &name) const;

    void commit_locked(const std::string &name, Instance instance);

    /// Drops the in-creation mark, early state and suppressed bag of `name`.
    void clear_creation_state_locked(const std::string &name, bool failed);

    /// Appends to the bag of a running construction. False if none is running.
    bool add_suppressed_locked(const std::string &name, std::exception_ptr error);

    /// Moves the suppressed errors of `bag` onto a RegistryError.
    static void attach_suppressed(RegistryError &error, const SuppressedBag &bag);

    /// True if `owner` is, directly or through other waiters, waiting for `self`.
    [[nodiscard]] bool would_deadlock_locked(std::thread::id self, std::thread::id owner) const;

    /**
     * Waits on the condition variable until `done()` holds, publishing that the
     * calling thread waits for `owner`.
     * @throws UnresolvableCycleError naming `name` if the wait would deadlock.
     */
    template <typename Pred>
    void wait_for_owner(std::unique_lock<std::mutex> &lock, const std::string &name, std::thread::id owner,
                        Pred done)
    {
        const auto self = std::this_thread::get_id();
        if (would_deadlock_locked(self, owner))
        {
            throw UnresolvableCycleError(name, "Waiting for it would deadlock with another thread.");
        }
        m_waiting_for[self] = owner;
        auto clear_wait = comphub::basics::make_scope_guard([&] { m_waiting_for.erase(self); });
        m_cv.wait(lock, done);
    }

    // ========================================================================
    // Early reference helpers (early_references.cpp)
    // ========================================================================

    /// Blocks while another thread runs the early factory of `name`.
    void await_early_production(std::unique_lock<std::mutex> &lock, const std::string &name);

    // ========================================================================
    // Teardown helpers (dependency_graph.cpp)
    // ========================================================================

    void destroy_locked(std::unique_lock<std::mutex> &lock, const std::string &name, TeardownSummary &summary);
};

} // namespace comphub::registry
