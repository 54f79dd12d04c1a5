#include <gtest/gtest.h>
#include "ADL/Target.hpp"
#include <nlohmann/json.hpp>

using namespace ADL;

TEST(TargetTest, RegistryHasThreeTargets) {
    auto targets = Target::all();
    ASSERT_EQ(targets.size(), 3u);
    for (const auto& target : targets) {
        EXPECT_EQ(Target::forName(target.name), &target);
        EXPECT_EQ(Target::forArch(target.arch), &target);
    }
}

TEST(TargetTest, ForArchResolvesKnownArchitectures) {
    const Target* arm64 = Target::forArch("arm64");
    ASSERT_NE(arm64, nullptr);
    EXPECT_EQ(arm64->triple, "aarch64-apple-ios");
    EXPECT_EQ(arm64->sdk, "iphoneos");

    const Target* sim = Target::forArch("x86_64");
    ASSERT_NE(sim, nullptr);
    EXPECT_EQ(sim->triple, "x86_64-apple-ios");
}

TEST(TargetTest, Arm64eMapsToArm64) {
    EXPECT_EQ(Target::forArch("arm64e"), Target::forArch("arm64"));
}

TEST(TargetTest, UnknownArchitecturesMiss) {
    EXPECT_EQ(Target::forArch("mips-unsupported"), nullptr);
    EXPECT_EQ(Target::forArch("armv7"), nullptr);
    EXPECT_EQ(Target::forArch(""), nullptr);
    EXPECT_EQ(Target::forArch("ARM64"), nullptr);
    EXPECT_EQ(Target::forName("arm64"), nullptr);
}

TEST(TargetTest, OrderedByTriple) {
    const Target& arm64 = *Target::forName("aarch64");
    const Target& armSim = *Target::forName("aarch64-sim");
    const Target& x86 = *Target::forName("x86_64");
    EXPECT_LT(arm64, armSim);
    EXPECT_LT(armSim, x86);
    EXPECT_EQ(arm64, *Target::forArch("arm64e"));
}

TEST(TargetTest, ToJson) {
    auto j = Target::forName("aarch64-sim")->toJson();
    EXPECT_EQ(j["name"], "aarch64-sim");
    EXPECT_EQ(j["triple"], "aarch64-apple-ios-sim");
    EXPECT_EQ(j["arch"], "arm64-sim");
    EXPECT_EQ(j["sdk"], "iphonesimulator");
}
