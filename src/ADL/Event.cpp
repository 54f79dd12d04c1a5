#include "ADL/Event.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <utility>

using json = nlohmann::json;

namespace ADL {

namespace {

bool hasNonWhitespace(std::string_view text) {
    return std::any_of(text.begin(), text.end(),
                       [](unsigned char c) { return !std::isspace(c); });
}

// One past the brace closing the object opened at @p start, or npos if the
// object is never closed. Braces inside string literals do not count.
std::size_t findDocumentEnd(std::string_view text, std::size_t start) {
    int depth = 0;
    bool inString = false;
    bool escaped = false;
    for (std::size_t i = start; i < text.size(); ++i) {
        const char c = text[i];
        if (inString) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                inString = false;
            }
            continue;
        }
        if (c == '"') {
            inString = true;
        } else if (c == '{' || c == '[') {
            ++depth;
        } else if (c == '}' || c == ']') {
            if (--depth == 0) {
                return i + 1;
            }
        }
    }
    return std::string_view::npos;
}

std::optional<std::string> stringField(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::optional<DeviceInfo> deviceInfoFromJson(const json& document) {
    auto deviceIt = document.find("Device");
    if (deviceIt == document.end() || !deviceIt->is_object()) {
        spdlog::warn("Event: DeviceDetected event has no Device object");
        return std::nullopt;
    }
    const json& device = *deviceIt;

    auto identifier = stringField(device, "DeviceIdentifier");
    auto name = stringField(device, "DeviceName");
    auto arch = stringField(device, "modelArch");
    auto model = stringField(device, "modelName");
    if (!identifier || !name || !arch || !model) {
        spdlog::warn("Event: DeviceDetected event is missing required fields (DeviceIdentifier={}, DeviceName={}, modelArch={}, modelName={})",
                     identifier.has_value(), name.has_value(), arch.has_value(), model.has_value());
        return std::nullopt;
    }
    return DeviceInfo{std::move(*identifier), std::move(*name), std::move(*arch), std::move(*model)};
}

} // anonymous namespace

std::string eventKindToString(EventKind kind) {
    switch (kind) {
        case EventKind::DeviceDetected: return "DeviceDetected";
        case EventKind::BundleCopy:     return "BundleCopy";
        case EventKind::BundleInstall:  return "BundleInstall";
        case EventKind::Error:          return "Error";
        default:                        return "Unknown";
    }
}

EventKind eventKindFromString(std::string_view name) {
    if (name == "DeviceDetected") return EventKind::DeviceDetected;
    if (name == "BundleCopy") return EventKind::BundleCopy;
    if (name == "BundleInstall") return EventKind::BundleInstall;
    if (name == "Error") return EventKind::Error;
    return EventKind::Unknown;
}

Event::Event(EventKind kind, std::string name, std::optional<DeviceInfo> device)
    : kind_(kind)
    , name_(std::move(name))
    , device_(std::move(device))
{
}

std::optional<Event> Event::fromJson(const json& document) {
    if (!document.is_object()) {
        return std::nullopt;
    }
    std::string name = stringField(document, "Event").value_or("");
    const EventKind kind = eventKindFromString(name);
    std::optional<DeviceInfo> device;
    if (kind == EventKind::DeviceDetected) {
        device = deviceInfoFromJson(document);
    }
    return Event(kind, std::move(name), std::move(device));
}

std::vector<Event> Event::parseList(std::string_view text) {
    std::vector<Event> events;
    std::size_t pos = 0;
    while (pos < text.size()) {
        const std::size_t start = text.find('{', pos);
        const std::string_view gap = text.substr(pos, start == std::string_view::npos ? std::string_view::npos : start - pos);
        if (hasNonWhitespace(gap)) {
            spdlog::warn("Event: skipping {} byte(s) of non-JSON output", gap.size());
        }
        if (start == std::string_view::npos) {
            break;
        }

        // A brace that does not open a parseable object is stray text; rescan
        // from the next byte so objects after it are still found.
        const std::size_t end = findDocumentEnd(text, start);
        if (end == std::string_view::npos) {
            spdlog::warn("Event: skipping unterminated '{{' at offset {}", start);
            pos = start + 1;
            continue;
        }
        const std::string_view chunk = text.substr(start, end - start);
        json document = json::parse(chunk.begin(), chunk.end(), nullptr, false);
        if (document.is_discarded()) {
            spdlog::warn("Event: skipping malformed JSON at offset {} ({} bytes)", start, chunk.size());
            pos = start + 1;
            continue;
        }
        if (auto event = fromJson(document)) {
            spdlog::trace("Event: parsed {} event", eventKindToString(event->kind()));
            events.push_back(std::move(*event));
        }
        pos = end;
    }
    spdlog::debug("Event: parsed {} event(s) from {} byte(s) of output", events.size(), text.size());
    return events;
}

} // namespace ADL
