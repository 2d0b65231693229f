#ifndef SIMPILOT_ORCHESTRATOR_STATE_HPP
#define SIMPILOT_ORCHESTRATOR_STATE_HPP

// Process-wide orchestration state, owned by whoever owns the orchestrator
// (the server keeps one; every test case builds a fresh one).
//
// Holds the single trackable task (id + cancel flag), the single active
// external command slot, and the TTL caches. Boot state is never cached.

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "config/config.hpp"
#include "simctl/simulator_types.hpp"
#include "xcode/xcode_types.hpp"

namespace orchestrator_state {

constexpr std::chrono::milliseconds DEVICE_LIST_CACHE_TTL{800};
constexpr std::chrono::milliseconds CONTAINER_CACHE_TTL{10 * 60 * 1000};
constexpr std::chrono::milliseconds SCHEME_CACHE_TTL{10 * 60 * 1000};
constexpr std::chrono::milliseconds PROJECT_HINT_CACHE_TTL{10 * 60 * 1000};

template <typename Value>
struct CacheEntry {
    std::chrono::steady_clock::time_point timestamp;
    Value value;
};

// Keyed cache where staleness is decided purely by age at read time.
template <typename Value>
class TtlCache {
public:
    explicit TtlCache(std::chrono::milliseconds ttl) : ttl_(ttl) {}

    bool lookup(const std::string &key, Value &output) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = entries_.find(key);
        if (found == entries_.end()) {
            return false;
        }
        if (std::chrono::steady_clock::now() - found->second.timestamp >= ttl_) {
            return false;
        }
        output = found->second.value;
        return true;
    }

    void store(const std::string &key, const Value &value) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[key] = CacheEntry<Value>{std::chrono::steady_clock::now(), value};
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

private:
    std::chrono::milliseconds ttl_;
    mutable std::mutex mutex_;
    std::map<std::string, CacheEntry<Value>> entries_;
};

// The one in-flight external process eligible for kill-on-cancel.
struct ActiveCommand {
    uint64_t serial = 0; // identity of the registration
    int process_id = -1;
    uint64_t task_id = 0;
    bool cancelled = false;
};

class OrchestratorState {
public:
    explicit OrchestratorState(config::Config configuration);

    OrchestratorState(const OrchestratorState &) = delete;
    OrchestratorState &operator=(const OrchestratorState &) = delete;

    const config::Config &config() const { return configuration_; }

    // Become the sole active task. Resets the cancel flag.
    uint64_t start_task();

    // Clears the active task, but only if task_id is still the active one.
    void finish_task(uint64_t task_id);

    // Sets the cancel flag and kills the registered command, if any.
    // Returns true when a command or a task was active.
    bool cancel();

    bool is_active_task(uint64_t task_id) const;
    bool is_cancel_requested(uint64_t task_id) const;
    bool has_active_task() const;

    // Registers a spawned process as the active command (replacing any
    // previous registration). Returns the registration serial. If a cancel
    // already arrived for task_id, the registration is born cancelled and
    // the caller must kill the process.
    uint64_t register_command(uint64_t task_id, int process_id, bool &already_cancelled);

    // True if the registration was cancelled by cancel().
    bool is_command_cancelled(uint64_t serial) const;

    // Drops the registration if it is still current; returns its cancelled flag.
    bool unregister_command(uint64_t serial);

    TtlCache<simulator_types::DeviceListResult> device_list_cache{DEVICE_LIST_CACHE_TTL};
    // Root path -> discovered container (nullopt cached too).
    TtlCache<std::optional<xcode_types::Container>> container_cache{CONTAINER_CACHE_TTL};
    // "type:path" -> successful scheme listing.
    TtlCache<xcode_types::SchemeListResult> scheme_cache{SCHEME_CACHE_TTL};
    // project.pbxproj path -> has iOS build settings.
    TtlCache<bool> project_hint_cache{PROJECT_HINT_CACHE_TTL};

private:
    config::Config configuration_;

    mutable std::mutex task_mutex_;
    std::optional<uint64_t> active_task_id_;
    bool cancel_requested_ = false;
    std::optional<ActiveCommand> active_command_;
    uint64_t next_command_serial_ = 1;
};

} // namespace orchestrator_state

#endif // SIMPILOT_ORCHESTRATOR_STATE_HPP
