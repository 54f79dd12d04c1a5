#include "ADL/DeviceList.hpp"
#include "ADL/Event.hpp"
#include "ADL/Target.hpp"
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace ADL {

namespace {

constexpr const char* kReportMessage = "Failed to detect connected iOS devices";

// Double-quoted, with quotes, backslashes and control characters escaped.
std::string quoted(const std::string& value) {
    std::ostringstream oss;
    oss << '"';
    for (unsigned char c : value) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            case '\0': oss << "\\0"; break;
            default:
                if (c < 0x20 || c == 0x7f) {
                    oss << "\\u{" << std::hex << static_cast<int>(c) << std::dec << '}';
                } else {
                    oss << static_cast<char>(c);
                }
        }
    }
    oss << '"';
    return oss.str();
}

} // anonymous namespace

std::string deviceListErrorKindToString(DeviceListError::Kind kind) {
    switch (kind) {
        case DeviceListError::Kind::DetectionFailed: return "DetectionFailed";
        case DeviceListError::Kind::InvalidUtf8:     return "InvalidUtf8";
        case DeviceListError::Kind::ArchInvalid:     return "ArchInvalid";
        default:                                     return "Unknown";
    }
}

Report DeviceListError::report() const {
    return std::visit([](const auto& error) -> Report {
        using T = std::decay_t<decltype(error)>;
        if constexpr (std::is_same_v<T, DetectionFailed>) {
            return Report::error(kReportMessage,
                                 "Failed to request device list from `ios-deploy`: " + error.error.message());
        } else if constexpr (std::is_same_v<T, InvalidUtf8>) {
            return Report::error(kReportMessage,
                                 "Device info contained invalid UTF-8: " + error.error.message());
        } else {
            return Report::error(kReportMessage,
                                 quoted(error.arch) + " isn't a valid target arch.");
        }
    }, value_);
}

std::expected<DeviceSet, DeviceListError> parseDeviceList(const Output& output) {
    auto text = output.stdoutStr();
    if (!text) {
        spdlog::error("DeviceList: ios-deploy output is not valid UTF-8: {}", text.error().message());
        return std::unexpected(DeviceListError::InvalidUtf8{text.error()});
    }

    DeviceSet devices;
    for (const auto& event : Event::parseList(*text)) {
        const auto& info = event.deviceInfo();
        if (!info) {
            continue;
        }
        const Target* target = Target::forArch(info->modelArch);
        if (!target) {
            spdlog::error("DeviceList: device {} reported unsupported arch '{}'", info->deviceIdentifier, info->modelArch);
            return std::unexpected(DeviceListError::ArchInvalid{info->modelArch});
        }
        auto [it, inserted] = devices.emplace(info->deviceIdentifier, info->deviceName, info->modelName, *target);
        if (!inserted) {
            spdlog::debug("DeviceList: dropping duplicate announcement for {}", it->identifier());
        }
    }

    spdlog::debug("DeviceList: {} device(s) detected", devices.size());
    return devices;
}

std::expected<DeviceSet, DeviceListError> deviceList(const ExplicitEnv& env, ICommandRunner& runner) {
    auto command = Command::pureParse(kDetectCommandLine);
    command.withEnvVars(env.explicitEnv());

    auto result = runner.runAndWaitForOutput(command);
    if (result) {
        return parseDeviceList(*result);
    }

    const auto& output = result.error().output();
    if (!output) {
        spdlog::critical("DeviceList: `{}` failed without collecting output ({})",
                         command.display(), processErrorKindToString(result.error().kind()));
        throw std::logic_error("developer error: `ios-deploy --detect` output wasn't collected");
    }

    // TODO: only treat the exit codes ios-deploy documents for "no device" as benign once they are known
    if (output->stdoutBytes.empty() && output->stderrBytes.empty()) {
        spdlog::info("DeviceList: detection exited non-zero with empty stdout and stderr; "
                     "treating it as a successful run with no devices connected");
        return DeviceSet{};
    }

    spdlog::error("DeviceList: {}", result.error().message());
    return std::unexpected(DeviceListError::DetectionFailed{std::move(result.error())});
}

std::expected<DeviceSet, DeviceListError> deviceList(const ExplicitEnv& env) {
    SubprocessRunner runner;
    return deviceList(env, runner);
}

} // namespace ADL
