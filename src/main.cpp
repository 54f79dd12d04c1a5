/**
 * @file main.cpp
 * @brief adl-devices: list the iOS devices connected over USB.
 */

#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>
#include "ADL/DeviceList.hpp"
#include "ADL/Env.hpp"

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitDetectionError = 1;
constexpr int kExitUsageError = 2;

struct Options {
    bool json = false;
    bool help = false;
    spdlog::level::level_enum level = spdlog::level::warn;
};

void printUsage(std::ostream& os) {
    os << "Usage: adl-devices [--json] [-v|--verbose] [-q|--quiet] [-h|--help]\n"
       << "\n"
       << "Lists iOS devices connected over USB, as reported by ios-deploy.\n"
       << "\n"
       << "  --json         print the devices as a JSON array\n"
       << "  -v, --verbose  debug logging on stderr\n"
       << "  -q, --quiet    only log errors\n"
       << "  -h, --help     show this help\n"
       << "\n"
       << "SPDLOG_LEVEL overrides the log level (e.g. SPDLOG_LEVEL=trace).\n";
}

bool parseArgs(int argc, char** argv, Options& options) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--json") {
            options.json = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.level = spdlog::level::debug;
        } else if (arg == "-q" || arg == "--quiet") {
            options.level = spdlog::level::err;
        } else if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else {
            std::cerr << "adl-devices: unknown argument '" << arg << "'\n";
            return false;
        }
    }
    return true;
}

void printDevices(const ADL::DeviceSet& devices, bool json) {
    if (json) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& device : devices) {
            arr.push_back(device.toJson());
        }
        std::cout << arr.dump(2) << std::endl;
        return;
    }
    if (devices.empty()) {
        std::cout << "No connected iOS devices detected." << std::endl;
        return;
    }
    for (const auto& device : devices) {
        std::cout << device.toString() << " [" << device.identifier() << "] " << device.target().triple << "\n";
    }
    std::cout.flush();
}

} // anonymous namespace

int main(int argc, char** argv) {
    Options options;
    if (!parseArgs(argc, argv, options)) {
        printUsage(std::cerr);
        return kExitUsageError;
    }
    if (options.help) {
        printUsage(std::cout);
        return kExitSuccess;
    }

    try {
        // Logs go to stderr so stdout stays parseable with --json
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto logger = std::make_shared<spdlog::logger>("adl", console_sink);
        spdlog::set_default_logger(logger);
        spdlog::set_level(options.level);
        spdlog::cfg::load_env_levels();

        auto env = ADL::Env::fromProcessEnvironment();
        if (!env) {
            std::cerr << env.error().report().render() << std::endl;
            return kExitUsageError;
        }

        auto devices = ADL::deviceList(*env);
        if (!devices) {
            std::cerr << devices.error().report().render() << std::endl;
            return kExitDetectionError;
        }

        printDevices(*devices, options.json);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        return kExitDetectionError;
    } catch (const std::exception& ex) {
        std::cerr << "An error occurred: " << ex.what() << std::endl;
        return kExitDetectionError;
    }

    spdlog::default_logger()->flush();
    return kExitSuccess;
}
