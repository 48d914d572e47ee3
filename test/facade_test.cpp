#include "gamepad/vgamepad_client.hpp"
#include "gamepad/gamepad_error.hpp"
#include "gamepad/sim_adapter.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <vector>

namespace {

// Records the order targets are detached in.
class RecordingAdapter : public SimAdapter {
public:
    explicit RecordingAdapter(std::vector<TargetHandle>& detached) : detached_(detached) {}

    void detach(TargetHandle handle) override {
        detached_.push_back(handle);
        SimAdapter::detach(handle);
    }

private:
    std::vector<TargetHandle>& detached_;
};

}

TEST(FacadeTests, SimBackendCreatesControllers) {
    GamepadConfig config;
    config.backend = GamepadBackend::Sim;
    VGamepadClient client(config);
    EXPECT_STREQ(client.backend_name(), "sim");

    DS4Controller& first = client.create_dualshock4();
    DS4Controller& second = client.create_dualshock4();
    EXPECT_EQ(client.controller_count(), 2u);
    EXPECT_NE(first.handle(), second.handle());

    first.set_right_trigger(1.0f);
    auto& sim = static_cast<SimAdapter&>(client.adapter());
    EXPECT_EQ(sim.last_report(first.handle())->right_trigger, 255);
    EXPECT_FALSE(sim.last_report(second.handle()).has_value());
}

TEST(FacadeTests, DestroyDetaches) {
    VGamepadClient client(std::make_unique<SimAdapter>());
    auto& sim = static_cast<SimAdapter&>(client.adapter());

    DS4Controller& controller = client.create_dualshock4();
    TargetHandle handle = controller.handle();
    EXPECT_TRUE(sim.is_attached(handle));

    client.destroy(controller);
    EXPECT_EQ(client.controller_count(), 0u);
    EXPECT_FALSE(sim.is_attached(handle));
}

TEST(FacadeTests, DestroyForeignControllerFails) {
    VGamepadClient owner(std::make_unique<SimAdapter>());
    VGamepadClient other(std::make_unique<SimAdapter>());
    DS4Controller& controller = owner.create_dualshock4();

    try {
        other.destroy(controller);
        FAIL() << "expected ControllerDisconnected";
    } catch (const GamepadError& e) {
        EXPECT_EQ(e.kind(), GamepadError::Kind::ControllerDisconnected);
    }
    EXPECT_EQ(owner.controller_count(), 1u);
}

TEST(FacadeTests, ControllersDetachInReverseOrder) {
    std::vector<TargetHandle> detached;
    std::vector<TargetHandle> created;
    {
        VGamepadClient client(std::make_unique<RecordingAdapter>(detached));
        for (int i = 0; i < 3; i++) {
            created.push_back(client.create_dualshock4().handle());
        }
    }
    ASSERT_EQ(detached.size(), 3u);
    EXPECT_EQ(detached[0], created[2]);
    EXPECT_EQ(detached[1], created[1]);
    EXPECT_EQ(detached[2], created[0]);
}

TEST(FacadeTests, AutoBackendResolvesForPlatform) {
    std::unique_ptr<GamepadAdapter> adapter;
#if !defined(_WIN32) && !defined(__APPLE__)
    adapter = make_adapter(GamepadConfig());
    EXPECT_STREQ(adapter->name(), "sim");
#elif defined(__APPLE__)
    adapter = make_adapter(GamepadConfig());
    EXPECT_STREQ(adapter->name(), "mac-sim");
#else
    GTEST_SKIP() << "Auto needs the ViGEm bus on Windows";
#endif
}

#if !defined(_WIN32) && !defined(__APPLE__)
TEST(FacadeTests, ForeignBackendsAreUnsupported) {
    for (GamepadBackend backend : {GamepadBackend::ViGEm, GamepadBackend::MacIOKit,
                                   GamepadBackend::MacSimulation, GamepadBackend::MacDriverKit}) {
        GamepadConfig config;
        config.backend = backend;
        try {
            make_adapter(config);
            FAIL() << "expected UnsupportedPlatform for " << to_string(backend);
        } catch (const GamepadError& e) {
            EXPECT_EQ(e.kind(), GamepadError::Kind::UnsupportedPlatform);
            EXPECT_EQ(e.platform(), "Linux");
            EXPECT_EQ(e.feature(), std::string(to_string(backend)) + " backend");
        }
    }
}
#endif
