// include/ADL/Target.hpp
#pragma once

#include <compare>
#include <span>
#include <string_view>
#include <nlohmann/json_fwd.hpp>

namespace ADL {

/**
 * @brief One supported iOS build target.
 *
 * Instances live only in the static registry returned by all(); callers hold
 * references or pointers into it and never construct their own.
 */
struct Target {
    std::string_view name;    ///< Short name, e.g. "aarch64"
    std::string_view triple;  ///< Compiler target triple, e.g. "aarch64-apple-ios"
    std::string_view arch;    ///< Architecture as reported by Xcode tooling, e.g. "arm64"
    std::string_view sdk;     ///< SDK the target builds against

    static std::span<const Target> all();

    /**
     * @brief Look up the target for an architecture string from device info.
     * @return Registry entry, or nullptr if the architecture is not supported
     *
     * "arm64e" resolves to the arm64 target.
     */
    static const Target* forArch(std::string_view arch);

    static const Target* forName(std::string_view name);

    nlohmann::json toJson() const;

    std::strong_ordering operator<=>(const Target& other) const { return triple <=> other.triple; }
    bool operator==(const Target& other) const { return triple == other.triple; }
};

} // namespace ADL
