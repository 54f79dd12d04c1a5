#include <gtest/gtest.h>
#include "ADL/Event.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using namespace ADL;

namespace {

// Shape of `ios-deploy --detect --json` output: pretty-printed objects back to back
const std::string kTwoDevices = R"({
  "Event" : "DeviceDetected",
  "Interface" : "USB",
  "Device" : {
    "DeviceIdentifier" : "00008030-001A2D3E1E08802E",
    "DeviceName" : "Ana's iPhone",
    "modelArch" : "arm64e",
    "modelName" : "iPhone 11",
    "modelSDK" : "iphoneos",
    "productVersion" : "17.1"
  }
}{
  "Event" : "DeviceDetected",
  "Interface" : "USB",
  "Device" : {
    "DeviceIdentifier" : "c0ffee",
    "DeviceName" : "Test {iPad}",
    "modelArch" : "arm64",
    "modelName" : "iPad Air"
  }
})";

} // anonymous namespace

TEST(EventTest, ParsesConcatenatedDocuments) {
    auto events = Event::parseList(kTwoDevices);
    ASSERT_EQ(events.size(), 2u);

    EXPECT_EQ(events[0].kind(), EventKind::DeviceDetected);
    ASSERT_TRUE(events[0].deviceInfo().has_value());
    EXPECT_EQ(*events[0].deviceInfo(),
              (DeviceInfo{"00008030-001A2D3E1E08802E", "Ana's iPhone", "arm64e", "iPhone 11"}));

    // Braces inside string values must not split the document
    ASSERT_TRUE(events[1].deviceInfo().has_value());
    EXPECT_EQ(events[1].deviceInfo()->deviceName, "Test {iPad}");
}

TEST(EventTest, NonDeviceEventsHaveNoDeviceInfo) {
    auto events = Event::parseList(R"({"Event":"BundleCopy","Percent":40,"Path":"a\"}b"}
{"Event":"Error","Status":"Timed out waiting for device"}
{"Event":"SomethingNew"})");
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].kind(), EventKind::BundleCopy);
    EXPECT_EQ(events[1].kind(), EventKind::Error);
    EXPECT_EQ(events[2].kind(), EventKind::Unknown);
    EXPECT_EQ(events[2].name(), "SomethingNew");
    for (const auto& event : events) {
        EXPECT_FALSE(event.deviceInfo().has_value());
    }
}

TEST(EventTest, SkipsMalformedDocumentsAndStrayText) {
    auto events = Event::parseList(
        "[....] Waiting for iOS device\n"
        "{\"Event\":\"DeviceDetected\",\"Device\":{\"DeviceIdentifier\":\"A1\",\"DeviceName\":\"n\",\"modelArch\":\"arm64\",\"modelName\":\"m\"}}"
        "{\"Event\": tru}"
        "{\"Event\":\"DeviceDetected\",\"Device\":{\"DeviceIdentifier\":\"A2\"");
    ASSERT_EQ(events.size(), 1u);
    ASSERT_TRUE(events[0].deviceInfo().has_value());
    EXPECT_EQ(events[0].deviceInfo()->deviceIdentifier, "A1");
}

TEST(EventTest, StrayOpeningBraceDoesNotHideLaterObjects) {
    auto events = Event::parseList(
        "[....] {waiting for device\n"
        "{\"Event\":\"DeviceDetected\",\"Device\":{\"DeviceIdentifier\":\"A1\",\"DeviceName\":\"n\",\"modelArch\":\"arm64\",\"modelName\":\"m\"}}"
        "{ not json {\"Event\":\"DeviceDetected\",\"Device\":{\"DeviceIdentifier\":\"B2\",\"DeviceName\":\"n\",\"modelArch\":\"arm64\",\"modelName\":\"m\"}} }");
    std::vector<std::string> ids;
    for (const auto& event : events) {
        if (event.deviceInfo()) {
            ids.push_back(event.deviceInfo()->deviceIdentifier);
        }
    }
    EXPECT_EQ(ids, (std::vector<std::string>{"A1", "B2"}));
}

TEST(EventTest, DeviceDetectedWithMissingFieldsYieldsNoDeviceInfo) {
    auto events = Event::parseList(
        R"({"Event":"DeviceDetected","Device":{"DeviceIdentifier":"A1","DeviceName":"n","modelName":"m"}})"
        R"({"Event":"DeviceDetected","Device":{"DeviceIdentifier":"A1","DeviceName":"n","modelArch":64,"modelName":"m"}})"
        R"({"Event":"DeviceDetected"})");
    ASSERT_EQ(events.size(), 3u);
    for (const auto& event : events) {
        EXPECT_EQ(event.kind(), EventKind::DeviceDetected);
        EXPECT_FALSE(event.deviceInfo().has_value());
    }
}

TEST(EventTest, EmptyAndWhitespaceOutputYieldNoEvents) {
    EXPECT_TRUE(Event::parseList("").empty());
    EXPECT_TRUE(Event::parseList(" \n\t\n").empty());
}

TEST(EventTest, FromJsonRejectsNonObjects) {
    EXPECT_FALSE(Event::fromJson(nlohmann::json::array({1, 2})).has_value());
    EXPECT_FALSE(Event::fromJson(nlohmann::json("DeviceDetected")).has_value());

    auto event = Event::fromJson(nlohmann::json::object());
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->kind(), EventKind::Unknown);
    EXPECT_TRUE(event->name().empty());
}

TEST(EventTest, KindNamesRoundTrip) {
    for (auto kind : {EventKind::DeviceDetected, EventKind::BundleCopy, EventKind::BundleInstall, EventKind::Error}) {
        EXPECT_EQ(eventKindFromString(eventKindToString(kind)), kind);
    }
    EXPECT_EQ(eventKindFromString("devicedetected"), EventKind::Unknown);
}
