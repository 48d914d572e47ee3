#pragma once
#include "gamepad/gamepad_adapter.hpp"
#include "utils/platform.hpp"
#include <map>
#include <mutex>
#include <string>

// ViGEm bus client. ViGEmClient.dll is loaded at run time so the program
// still starts on machines without the bus driver.
class ViGEmAdapter : public GamepadAdapter {
public:
    // Throws DriverNotInstalled if the DLL is missing, DriverRpcFailure if
    // an entry point is missing or the bus refuses the connection.
    explicit ViGEmAdapter(const std::string& library_path);
    ~ViGEmAdapter() override;

    ViGEmAdapter(const ViGEmAdapter&) = delete;
    ViGEmAdapter& operator=(const ViGEmAdapter&) = delete;

    TargetHandle attach() override;
    void submit(TargetHandle handle, const DS4Report& report) override;
    void detach(TargetHandle handle) override;
    const char* name() const override { return "vigem"; }

private:
    typedef void* PVIGEM_CLIENT;
    typedef void* PVIGEM_TARGET;

    typedef PVIGEM_CLIENT (*PFN_vigem_alloc)();
    typedef void (*PFN_vigem_free)(PVIGEM_CLIENT);
    typedef uint32_t (*PFN_vigem_connect)(PVIGEM_CLIENT);
    typedef void (*PFN_vigem_disconnect)(PVIGEM_CLIENT);
    typedef PVIGEM_TARGET (*PFN_vigem_target_alloc)(uint32_t);
    typedef void (*PFN_vigem_target_free)(PVIGEM_TARGET);
    typedef uint32_t (*PFN_vigem_target_add)(PVIGEM_CLIENT, PVIGEM_TARGET);
    typedef uint32_t (*PFN_vigem_target_remove)(PVIGEM_CLIENT, PVIGEM_TARGET);
    typedef uint32_t (*PFN_vigem_target_ds4_update)(PVIGEM_CLIENT, PVIGEM_TARGET, const DS4Report*);

    void load_functions();
    void release();

    HMODULE module_;
    PVIGEM_CLIENT client_;

    PFN_vigem_alloc vigem_alloc_;
    PFN_vigem_free vigem_free_;
    PFN_vigem_connect vigem_connect_;
    PFN_vigem_disconnect vigem_disconnect_;
    PFN_vigem_target_alloc vigem_target_alloc_;
    PFN_vigem_target_free vigem_target_free_;
    PFN_vigem_target_add vigem_target_add_;
    PFN_vigem_target_remove vigem_target_remove_;
    PFN_vigem_target_ds4_update vigem_target_ds4_update_;

    std::mutex mutex_;
    std::map<TargetHandle, PVIGEM_TARGET> targets_;
    TargetHandle next_handle_;
};
