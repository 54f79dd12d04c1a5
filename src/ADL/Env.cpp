#include "ADL/Env.hpp"
#include <spdlog/spdlog.h>
#include <array>
#include <cstdlib>
#include <string_view>
#include <utility>

namespace ADL {

namespace {

constexpr std::array<std::string_view, 5> kForwardedVars = {
    "TERM",
    "SSH_AUTH_SOCK",
    "LANG",
    "LC_ALL",
    "DEVELOPER_DIR",
};

} // anonymous namespace

std::string EnvError::message() const {
    return "Environment variable `" + name_ + "` is not set";
}

Report EnvError::report() const {
    return Report::error("Failed to initialize environment", message());
}

Env::Env(std::string home, std::string path)
    : home_(std::move(home))
    , path_(std::move(path))
{
}

std::expected<Env, EnvError> Env::fromProcessEnvironment() {
    return fromLookup([](const std::string& name) -> std::optional<std::string> {
        if (const char* value = std::getenv(name.c_str())) {
            return std::string(value);
        }
        return std::nullopt;
    });
}

std::expected<Env, EnvError> Env::fromVars(const std::map<std::string, std::string>& vars) {
    return fromLookup([&vars](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) {
            return std::nullopt;
        }
        return it->second;
    });
}

std::expected<Env, EnvError> Env::fromLookup(const Lookup& lookup) {
    auto home = lookup("HOME");
    if (!home) {
        spdlog::error("Env: HOME is not set");
        return std::unexpected(EnvError("HOME"));
    }
    auto path = lookup("PATH");
    if (!path) {
        spdlog::error("Env: PATH is not set");
        return std::unexpected(EnvError("PATH"));
    }

    Env env(std::move(*home), std::move(*path));
    for (auto name : kForwardedVars) {
        std::string key(name);
        if (auto value = lookup(key)) {
            env.forwarded_.emplace(std::move(key), std::move(*value));
        }
    }
    spdlog::debug("Env: resolved HOME={}, {} optional variable(s) forwarded", env.home_, env.forwarded_.size());
    return env;
}

Env& Env::withVar(std::string name, std::string value) {
    extra_[std::move(name)] = std::move(value);
    return *this;
}

void Env::prependToPath(const std::string& dir) {
    if (path_.empty()) {
        path_ = dir;
    } else {
        path_ = dir + ":" + path_;
    }
}

std::map<std::string, std::string> Env::explicitEnv() const {
    std::map<std::string, std::string> vars = forwarded_;
    vars["HOME"] = home_;
    vars["PATH"] = path_;
    for (const auto& [name, value] : extra_) {
        vars[name] = value;
    }
    return vars;
}

} // namespace ADL
