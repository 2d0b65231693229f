#include "core/orchestrator_state.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <random>
#include <utility>

namespace orchestrator_state {

OrchestratorState::OrchestratorState(config::Config configuration)
    : configuration_(std::move(configuration)) {}

// Time-based id with random low bits so two tasks started within the same
// millisecond still differ.
static uint64_t mint_task_id() {
    static std::mt19937_64 generator{std::random_device{}()};
    uint64_t milliseconds = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    return (milliseconds << 16) | (generator() & 0xFFFFu);
}

uint64_t OrchestratorState::start_task() {
    std::lock_guard<std::mutex> lock(task_mutex_);
    cancel_requested_ = false;
    uint64_t task_id = mint_task_id();
    active_task_id_ = task_id;
    debug_log::log("task started: " + std::to_string(task_id));
    return task_id;
}

void OrchestratorState::finish_task(uint64_t task_id) {
    std::lock_guard<std::mutex> lock(task_mutex_);
    if (!active_task_id_ || *active_task_id_ != task_id) {
        return;
    }
    active_task_id_.reset();
    cancel_requested_ = false;
    debug_log::log("task finished: " + std::to_string(task_id));
}

bool OrchestratorState::cancel() {
    std::lock_guard<std::mutex> lock(task_mutex_);
    cancel_requested_ = true;
    if (active_command_) {
        active_command_->cancelled = true;
        debug_log::log("cancel: killing pid " + std::to_string(active_command_->process_id));
        platform::kill_process(active_command_->process_id);
        return true;
    }
    return active_task_id_.has_value();
}

bool OrchestratorState::is_active_task(uint64_t task_id) const {
    std::lock_guard<std::mutex> lock(task_mutex_);
    return active_task_id_ && *active_task_id_ == task_id;
}

bool OrchestratorState::is_cancel_requested(uint64_t task_id) const {
    std::lock_guard<std::mutex> lock(task_mutex_);
    return cancel_requested_ && active_task_id_ && *active_task_id_ == task_id;
}

bool OrchestratorState::has_active_task() const {
    std::lock_guard<std::mutex> lock(task_mutex_);
    return active_task_id_.has_value();
}

uint64_t OrchestratorState::register_command(uint64_t task_id, int process_id, bool &already_cancelled) {
    std::lock_guard<std::mutex> lock(task_mutex_);
    ActiveCommand command;
    command.serial = next_command_serial_++;
    command.process_id = process_id;
    command.task_id = task_id;
    command.cancelled = cancel_requested_ && active_task_id_ && *active_task_id_ == task_id;
    already_cancelled = command.cancelled;
    active_command_ = command;
    return command.serial;
}

bool OrchestratorState::is_command_cancelled(uint64_t serial) const {
    std::lock_guard<std::mutex> lock(task_mutex_);
    return active_command_ && active_command_->serial == serial && active_command_->cancelled;
}

bool OrchestratorState::unregister_command(uint64_t serial) {
    std::lock_guard<std::mutex> lock(task_mutex_);
    if (!active_command_ || active_command_->serial != serial) {
        return false;
    }
    bool cancelled = active_command_->cancelled;
    active_command_.reset();
    return cancelled;
}

} // namespace orchestrator_state
