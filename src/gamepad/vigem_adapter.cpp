#include "gamepad/vigem_adapter.hpp"
#include "gamepad/gamepad_error.hpp"
#include "gamepad/vigem_status.hpp"
#include "config/constants.hpp"
#include "utils/logging.hpp"
#include <vector>

ViGEmAdapter::ViGEmAdapter(const std::string& library_path)
    : module_(nullptr)
    , client_(nullptr)
    , vigem_alloc_(nullptr)
    , vigem_free_(nullptr)
    , vigem_connect_(nullptr)
    , vigem_disconnect_(nullptr)
    , vigem_target_alloc_(nullptr)
    , vigem_target_free_(nullptr)
    , vigem_target_add_(nullptr)
    , vigem_target_remove_(nullptr)
    , vigem_target_ds4_update_(nullptr)
    , next_handle_(1) {

    Logger::info("Loading " + library_path + "...");
    module_ = LoadLibraryA(library_path.c_str());
    if (!module_) {
        throw GamepadError::driver_not_installed(Constants::VIGEM_DRIVER_NAME, Constants::VIGEM_RELEASE_URL);
    }

    try {
        load_functions();

        client_ = vigem_alloc_();
        if (!client_) {
            throw GamepadError::driver_rpc_failure("vigem_alloc", 0);
        }

        uint32_t status = vigem_connect_(client_);
        if (!vigem_success(status)) {
            vigem_free_(client_);
            client_ = nullptr;
            throw GamepadError::driver_rpc_failure("vigem_connect", status, vigem_status_name(status));
        }
    } catch (const GamepadError&) {
        FreeLibrary(module_);
        module_ = nullptr;
        throw;
    }

    Logger::info("Connected to the ViGEm bus");
}

ViGEmAdapter::~ViGEmAdapter() {
    release();
}

void ViGEmAdapter::load_functions() {
    vigem_alloc_ = (PFN_vigem_alloc)GetProcAddress(module_, "vigem_alloc");
    vigem_free_ = (PFN_vigem_free)GetProcAddress(module_, "vigem_free");
    vigem_connect_ = (PFN_vigem_connect)GetProcAddress(module_, "vigem_connect");
    vigem_disconnect_ = (PFN_vigem_disconnect)GetProcAddress(module_, "vigem_disconnect");
    vigem_target_alloc_ = (PFN_vigem_target_alloc)GetProcAddress(module_, "vigem_target_alloc");
    vigem_target_free_ = (PFN_vigem_target_free)GetProcAddress(module_, "vigem_target_free");
    vigem_target_add_ = (PFN_vigem_target_add)GetProcAddress(module_, "vigem_target_add");
    vigem_target_remove_ = (PFN_vigem_target_remove)GetProcAddress(module_, "vigem_target_remove");
    vigem_target_ds4_update_ = (PFN_vigem_target_ds4_update)GetProcAddress(module_, "vigem_target_ds4_update");

    const struct {
        const char* name;
        bool present;
    } entries[] = {
        {"vigem_alloc", vigem_alloc_ != nullptr},
        {"vigem_free", vigem_free_ != nullptr},
        {"vigem_connect", vigem_connect_ != nullptr},
        {"vigem_disconnect", vigem_disconnect_ != nullptr},
        {"vigem_target_alloc", vigem_target_alloc_ != nullptr},
        {"vigem_target_free", vigem_target_free_ != nullptr},
        {"vigem_target_add", vigem_target_add_ != nullptr},
        {"vigem_target_remove", vigem_target_remove_ != nullptr},
        {"vigem_target_ds4_update", vigem_target_ds4_update_ != nullptr},
    };
    for (const auto& entry : entries) {
        if (!entry.present) {
            throw GamepadError::driver_rpc_failure(std::string("GetProcAddress(") + entry.name + ")",
                                                   static_cast<uint32_t>(GetLastError()));
        }
    }
}

// remove targets -> free targets -> disconnect -> free client -> unload
void ViGEmAdapter::release() {
    std::vector<PVIGEM_TARGET> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : targets_) {
            targets.push_back(entry.second);
        }
        targets_.clear();
    }

    if (!targets.empty()) {
        Logger::warn("Removing " + std::to_string(targets.size()) + " ViGEm targets still attached");
    }
    for (PVIGEM_TARGET target : targets) {
        uint32_t status = vigem_target_remove_(client_, target);
        if (!vigem_success(status)) {
            Logger::warn(std::string("vigem_target_remove failed: ") + vigem_status_name(status));
        }
    }
    for (PVIGEM_TARGET target : targets) {
        vigem_target_free_(target);
    }

    if (client_) {
        vigem_disconnect_(client_);
        vigem_free_(client_);
        client_ = nullptr;
    }
    if (module_) {
        FreeLibrary(module_);
        module_ = nullptr;
    }
    Logger::info("ViGEm client released");
}

TargetHandle ViGEmAdapter::attach() {
    PVIGEM_TARGET target = vigem_target_alloc_(Constants::VIGEM_TARGET_DS4);
    if (!target) {
        throw GamepadError::driver_rpc_failure("vigem_target_alloc", 0);
    }

    uint32_t status = vigem_target_add_(client_, target);
    if (!vigem_success(status)) {
        vigem_target_free_(target);
        throw GamepadError::driver_rpc_failure("vigem_target_add", status, vigem_status_name(status));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    TargetHandle handle = next_handle_++;
    targets_[handle] = target;
    return handle;
}

void ViGEmAdapter::submit(TargetHandle handle, const DS4Report& report) {
    PVIGEM_TARGET target;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = targets_.find(handle);
        if (it == targets_.end()) {
            throw GamepadError::controller_disconnected();
        }
        target = it->second;
    }

    uint32_t status = vigem_target_ds4_update_(client_, target, &report);
    if (!vigem_success(status)) {
        throw GamepadError::driver_rpc_failure("vigem_target_ds4_update", status, vigem_status_name(status));
    }
}

void ViGEmAdapter::detach(TargetHandle handle) {
    PVIGEM_TARGET target;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = targets_.find(handle);
        if (it == targets_.end()) return;
        target = it->second;
        targets_.erase(it);
    }

    uint32_t status = vigem_target_remove_(client_, target);
    if (!vigem_success(status)) {
        Logger::warn(std::string("vigem_target_remove failed: ") + vigem_status_name(status));
    }
    vigem_target_free_(target);
}
