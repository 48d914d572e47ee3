#pragma once
#include "gamepad/gamepad_adapter.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>

// In-memory adapter. Records the last report per target; used on platforms
// without a virtual bus and by the tests.
class SimAdapter : public GamepadAdapter {
public:
    SimAdapter();
    ~SimAdapter() override;

    TargetHandle attach() override;
    void submit(TargetHandle handle, const DS4Report& report) override;
    void detach(TargetHandle handle) override;
    const char* name() const override { return "sim"; }

    // The next `count` submits throw ControllerUpdateFailure(reason).
    void fail_next_submits(size_t count, const std::string& reason);

    std::optional<DS4Report> last_report(TargetHandle handle) const;
    uint64_t submit_count(TargetHandle handle) const;
    size_t attached_count() const;
    bool is_attached(TargetHandle handle) const;

private:
    struct Target {
        std::optional<DS4Report> last_report;
        uint64_t submits = 0;
    };

    mutable std::mutex mutex_;
    std::map<TargetHandle, Target> targets_;
    TargetHandle next_handle_;
    size_t pending_failures_;
    std::string failure_reason_;
};
