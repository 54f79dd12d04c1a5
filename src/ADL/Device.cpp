#include "ADL/Device.hpp"
#include <nlohmann/json.hpp>
#include <tuple>
#include <utility>

namespace ADL {

Device::Device(std::string identifier, std::string name, std::string modelName, const Target& target)
    : identifier_(std::move(identifier))
    , name_(std::move(name))
    , modelName_(std::move(modelName))
    , target_(&target)
{
}

std::string Device::toString() const {
    return name_ + " (" + modelName_ + ")";
}

nlohmann::json Device::toJson() const {
    nlohmann::json j;
    j["identifier"] = identifier_;
    j["name"] = name_;
    j["modelName"] = modelName_;
    j["target"] = target_->toJson();
    return j;
}

// Compares target values, not registry addresses, so ordering is stable across runs
std::strong_ordering Device::operator<=>(const Device& other) const {
    return std::tie(identifier_, name_, modelName_, *target_)
       <=> std::tie(other.identifier_, other.name_, other.modelName_, *other.target_);
}

bool Device::operator==(const Device& other) const {
    return std::tie(identifier_, name_, modelName_, *target_)
        == std::tie(other.identifier_, other.name_, other.modelName_, *other.target_);
}

} // namespace ADL
