#include "ADL/Target.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <string>

namespace ADL {

namespace {

constexpr std::array<Target, 3> kTargets = {{
    {"aarch64", "aarch64-apple-ios", "arm64", "iphoneos"},
    {"aarch64-sim", "aarch64-apple-ios-sim", "arm64-sim", "iphonesimulator"},
    {"x86_64", "x86_64-apple-ios", "x86_64", "iphonesimulator"},
}};

// A12 and later report arm64e but run arm64 code
constexpr std::string_view kArm64eArch = "arm64e";
constexpr std::string_view kArm64Arch = "arm64";

} // anonymous namespace

std::span<const Target> Target::all() {
    return kTargets;
}

const Target* Target::forArch(std::string_view arch) {
    if (arch == kArm64eArch) {
        arch = kArm64Arch;
    }
    auto it = std::find_if(kTargets.begin(), kTargets.end(),
                           [arch](const Target& target) { return target.arch == arch; });
    if (it == kTargets.end()) {
        spdlog::debug("Target: no target for arch '{}'", arch);
        return nullptr;
    }
    return &*it;
}

const Target* Target::forName(std::string_view name) {
    auto it = std::find_if(kTargets.begin(), kTargets.end(),
                           [name](const Target& target) { return target.name == name; });
    return it == kTargets.end() ? nullptr : &*it;
}

nlohmann::json Target::toJson() const {
    nlohmann::json j;
    j["name"] = std::string(name);
    j["triple"] = std::string(triple);
    j["arch"] = std::string(arch);
    j["sdk"] = std::string(sdk);
    return j;
}

} // namespace ADL
