// include/ADL/Event.hpp
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace ADL {

/**
 * @brief One connected device as announced by ios-deploy.
 */
struct DeviceInfo {
    std::string deviceIdentifier;
    std::string deviceName;
    std::string modelArch;
    std::string modelName;

    bool operator==(const DeviceInfo&) const = default;
};

enum class EventKind {
    DeviceDetected,
    BundleCopy,
    BundleInstall,
    Error,
    Unknown
};

std::string eventKindToString(EventKind kind);
EventKind eventKindFromString(std::string_view name);

/**
 * @brief A single top-level JSON object from ios-deploy's --json output.
 */
class Event {
public:
    Event(EventKind kind, std::string name, std::optional<DeviceInfo> device = std::nullopt);

    /**
     * @brief Classify a parsed JSON document by its "Event" key.
     * @return The event, or nullopt if @p document is not a JSON object
     */
    static std::optional<Event> fromJson(const nlohmann::json& document);

    /**
     * @brief Split ios-deploy output into events.
     *
     * The output is a run of JSON objects that are neither wrapped in an array
     * nor comma separated. Text outside objects and objects that fail to parse
     * are skipped; a stray '{' in that text does not hide the objects after it.
     */
    static std::vector<Event> parseList(std::string_view text);

    EventKind kind() const { return kind_; }

    /**
     * @brief Raw value of the "Event" key, empty when absent.
     */
    const std::string& name() const { return name_; }

    /**
     * @brief The announced device, for a DeviceDetected event carrying all required fields.
     */
    const std::optional<DeviceInfo>& deviceInfo() const { return device_; }

private:
    EventKind kind_;
    std::string name_;
    std::optional<DeviceInfo> device_;
};

} // namespace ADL
