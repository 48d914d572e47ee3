#include "gamepad/hid_descriptor.hpp"

#include <gtest/gtest.h>

#include <vector>

TEST(HidDescriptorTests, DescriptorFraming) {
    const std::vector<uint8_t>& d = ds4_hid_descriptor();
    ASSERT_EQ(d.size(), 94u);

    const std::vector<uint8_t> head = {0x05, 0x01, 0x09, 0x05, 0xA1, 0x01, 0x85, 0x01};
    EXPECT_EQ(std::vector<uint8_t>(d.begin(), d.begin() + 8), head);

    const std::vector<uint8_t> tail = {0x26, 0xFF, 0x00, 0x75, 0x08, 0x95, 0x02, 0x81, 0x02, 0xC0};
    EXPECT_EQ(std::vector<uint8_t>(d.end() - 10, d.end()), tail);
}

TEST(HidDescriptorTests, DescriptorIsShared) {
    EXPECT_EQ(&ds4_hid_descriptor(), &ds4_hid_descriptor());
}

TEST(HidDescriptorTests, NeutralInputReport) {
    DS4Report report;
    auto bytes = ds4_hid_input_report(report);
    const std::array<uint8_t, 10> expected = {0x01, 128, 128, 128, 128, 0x00, 0x00, 0x08, 0, 0};
    EXPECT_EQ(bytes, expected);
}

TEST(HidDescriptorTests, InputReportPacksButtonsAndHat) {
    DS4Report report;
    report.left_thumb_x = 10;
    report.right_thumb_y = 250;
    report.buttons = DS4Button::Cross | DS4Button::Options;
    report.dpad = static_cast<uint8_t>(DS4DPad::West);
    report.left_trigger = 12;
    report.right_trigger = 255;

    auto bytes = ds4_hid_input_report(report);
    EXPECT_EQ(bytes[1], 10);
    EXPECT_EQ(bytes[4], 250);
    EXPECT_EQ(bytes[5], 0x10);
    EXPECT_EQ(bytes[6], 0x20);
    EXPECT_EQ(bytes[7], 6);
    EXPECT_EQ(bytes[8], 12);
    EXPECT_EQ(bytes[9], 255);
}

TEST(HidDescriptorTests, InputReportMasksFillerBits) {
    DS4Report report;
    report.buttons = 0xFFFF;
    report.dpad = 0xF8;

    auto bytes = ds4_hid_input_report(report);
    EXPECT_EQ(bytes[5], 0xFF);
    EXPECT_EQ(bytes[6], 0x3F);
    EXPECT_EQ(bytes[7], 0x08);
}
