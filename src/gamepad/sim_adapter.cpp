#include "gamepad/sim_adapter.hpp"
#include "gamepad/gamepad_error.hpp"
#include "utils/logging.hpp"

SimAdapter::SimAdapter() : next_handle_(1), pending_failures_(0) {
    Logger::info("Virtual gamepad backend: simulation (reports stay in memory)");
}

SimAdapter::~SimAdapter() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!targets_.empty()) {
        Logger::warn("Simulation backend destroyed with " + std::to_string(targets_.size()) +
                     " targets still attached");
    }
}

TargetHandle SimAdapter::attach() {
    std::lock_guard<std::mutex> lock(mutex_);
    TargetHandle handle = next_handle_++;
    targets_[handle] = Target();
    Logger::debug("Sim target " + std::to_string(handle) + " attached");
    return handle;
}

void SimAdapter::submit(TargetHandle handle, const DS4Report& report) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = targets_.find(handle);
    if (it == targets_.end()) {
        throw GamepadError::controller_disconnected();
    }
    if (pending_failures_ > 0) {
        pending_failures_--;
        throw GamepadError::controller_update_failure(failure_reason_);
    }
    it->second.last_report = report;
    it->second.submits++;
}

void SimAdapter::detach(TargetHandle handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (targets_.erase(handle) > 0) {
        Logger::debug("Sim target " + std::to_string(handle) + " detached");
    }
}

void SimAdapter::fail_next_submits(size_t count, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_failures_ = count;
    failure_reason_ = reason;
}

std::optional<DS4Report> SimAdapter::last_report(TargetHandle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = targets_.find(handle);
    if (it == targets_.end()) return {};
    return it->second.last_report;
}

uint64_t SimAdapter::submit_count(TargetHandle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = targets_.find(handle);
    return it == targets_.end() ? 0 : it->second.submits;
}

size_t SimAdapter::attached_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return targets_.size();
}

bool SimAdapter::is_attached(TargetHandle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return targets_.count(handle) > 0;
}
