// include/ADL/DeviceList.hpp
#pragma once

#include "ADL/Device.hpp"
#include "ADL/Env.hpp"
#include "ADL/Process.hpp"
#include "ADL/Report.hpp"
#include "ADL/Utf8.hpp"
#include <expected>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace ADL {

/// Single-shot USB detection with a one second timeout and JSON output.
inline constexpr std::string_view kDetectCommandLine = "ios-deploy --detect --timeout 1 --json --no-wifi";

using DeviceSet = std::set<Device>;

/**
 * @brief Why listing connected devices failed.
 *
 * A closed set: every failure is exactly one of the alternatives below, each
 * carrying its own payload.
 */
class DeviceListError : public Reportable {
public:
    /// ios-deploy exited non-zero and printed something
    struct DetectionFailed {
        ProcessError error;
    };

    /// ios-deploy's stdout was not valid UTF-8
    struct InvalidUtf8 {
        Utf8Error error;
    };

    /// A device reported an architecture with no matching Target
    struct ArchInvalid {
        std::string arch;
    };

    enum class Kind {
        DetectionFailed,
        InvalidUtf8,
        ArchInvalid
    };

    using Variant = std::variant<DetectionFailed, InvalidUtf8, ArchInvalid>;

    DeviceListError(DetectionFailed error) : value_(std::move(error)) {}
    DeviceListError(InvalidUtf8 error) : value_(std::move(error)) {}
    DeviceListError(ArchInvalid error) : value_(std::move(error)) {}

    Kind kind() const { return static_cast<Kind>(value_.index()); }
    const Variant& value() const { return value_; }

    template <typename T>
    const T* getIf() const { return std::get_if<T>(&value_); }

    Report report() const override;

private:
    Variant value_;
};

std::string deviceListErrorKindToString(DeviceListError::Kind kind);

/**
 * @brief Turn captured ios-deploy output into the set of connected devices.
 * @param output Output of a successful detection run
 * @return All announced devices, or the first data error; never a partial set
 */
std::expected<DeviceSet, DeviceListError> parseDeviceList(const Output& output);

/**
 * @brief Detect connected iOS devices.
 * @param env Supplies the only variables the ios-deploy child will see
 * @param runner Executes the detection command
 * @return The connected devices, or why detection failed
 *
 * A non-zero exit with empty stdout and stderr is how ios-deploy reports that
 * nothing is attached; it yields an empty set. Throws std::logic_error if the
 * runner reports a failure without any captured output.
 */
std::expected<DeviceSet, DeviceListError> deviceList(const ExplicitEnv& env, ICommandRunner& runner);

/**
 * @brief deviceList() using a SubprocessRunner.
 */
std::expected<DeviceSet, DeviceListError> deviceList(const ExplicitEnv& env);

} // namespace ADL
