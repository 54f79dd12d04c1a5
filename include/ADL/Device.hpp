// include/ADL/Device.hpp
#pragma once

#include "ADL/Target.hpp"
#include <compare>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace ADL {

/**
 * @brief A connected iOS device resolved to a supported target.
 *
 * Immutable after construction. Devices are ordered by
 * (identifier, name, modelName, target triple); two devices are equal only
 * when all four match, so a std::set<Device> drops exact duplicates and keeps
 * everything else.
 */
class Device {
public:
    Device(std::string identifier, std::string name, std::string modelName, const Target& target);

    const std::string& identifier() const { return identifier_; }
    const std::string& name() const { return name_; }
    const std::string& modelName() const { return modelName_; }
    const Target& target() const { return *target_; }

    /**
     * @brief "<name> (<modelName>)"
     */
    std::string toString() const;

    nlohmann::json toJson() const;

    std::strong_ordering operator<=>(const Device& other) const;
    bool operator==(const Device& other) const;

private:
    std::string identifier_;
    std::string name_;
    std::string modelName_;
    const Target* target_;  ///< Points into the static Target registry
};

} // namespace ADL
