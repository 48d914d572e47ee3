#include "gamepad/sim_adapter.hpp"
#include "gamepad/gamepad_error.hpp"

#include <gtest/gtest.h>

TEST(SimAdapterTests, HandlesAreDistinct) {
    SimAdapter adapter;
    TargetHandle a = adapter.attach();
    TargetHandle b = adapter.attach();

    EXPECT_NE(a, b);
    EXPECT_EQ(adapter.attached_count(), 2u);
    EXPECT_TRUE(adapter.is_attached(a));
    EXPECT_STREQ(adapter.name(), "sim");

    adapter.detach(a);
    adapter.detach(b);
    EXPECT_EQ(adapter.attached_count(), 0u);
}

TEST(SimAdapterTests, RecordsLastReport) {
    SimAdapter adapter;
    TargetHandle handle = adapter.attach();
    EXPECT_FALSE(adapter.last_report(handle).has_value());

    DS4Report report;
    report.right_trigger = 200;
    adapter.submit(handle, report);
    report.right_trigger = 100;
    adapter.submit(handle, report);

    ASSERT_TRUE(adapter.last_report(handle).has_value());
    EXPECT_EQ(adapter.last_report(handle)->right_trigger, 100);
    EXPECT_EQ(adapter.submit_count(handle), 2u);
    adapter.detach(handle);
}

TEST(SimAdapterTests, SubmitToDetachedTargetFails) {
    SimAdapter adapter;
    TargetHandle handle = adapter.attach();
    adapter.detach(handle);

    try {
        adapter.submit(handle, DS4Report());
        FAIL() << "expected ControllerDisconnected";
    } catch (const GamepadError& e) {
        EXPECT_EQ(e.kind(), GamepadError::Kind::ControllerDisconnected);
    }

    // Detaching twice is harmless.
    adapter.detach(handle);
    EXPECT_FALSE(adapter.is_attached(handle));
}

TEST(SimAdapterTests, InjectedFailuresRunOut) {
    SimAdapter adapter;
    TargetHandle handle = adapter.attach();
    adapter.fail_next_submits(2, "injected");

    EXPECT_THROW(adapter.submit(handle, DS4Report()), GamepadError);
    EXPECT_THROW(adapter.submit(handle, DS4Report()), GamepadError);
    EXPECT_NO_THROW(adapter.submit(handle, DS4Report()));
    EXPECT_EQ(adapter.submit_count(handle), 1u);
    adapter.detach(handle);
}
