// include/ADL/Env.hpp
#pragma once

#include "ADL/Report.hpp"
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace ADL {

/**
 * @brief Source of the exact variable set handed to child processes.
 *
 * Children never inherit the ambient environment; they receive only what
 * explicitEnv() returns, recomputed on every call.
 */
class ExplicitEnv {
public:
    virtual ~ExplicitEnv() = default;
    virtual std::map<std::string, std::string> explicitEnv() const = 0;
};

/**
 * @brief A required variable was missing while resolving the environment.
 */
class EnvError : public Reportable {
public:
    explicit EnvError(std::string name) : name_(std::move(name)) {}

    const std::string& name() const { return name_; }
    std::string message() const;
    Report report() const override;

private:
    std::string name_;
};

/**
 * @brief Allow-listed environment resolved from the calling process.
 *
 * HOME and PATH are required. TERM, SSH_AUTH_SOCK, LANG, LC_ALL and
 * DEVELOPER_DIR are forwarded when present. Anything else reaches a child
 * only through withVar().
 */
class Env : public ExplicitEnv {
public:
    using Lookup = std::function<std::optional<std::string>(const std::string&)>;

    /**
     * @brief Resolve from the current process environment (getenv).
     */
    static std::expected<Env, EnvError> fromProcessEnvironment();

    /**
     * @brief Resolve from an arbitrary lookup, applying the same allow-list.
     */
    static std::expected<Env, EnvError> fromLookup(const Lookup& lookup);

    /**
     * @brief Resolve from a fixed variable table.
     */
    static std::expected<Env, EnvError> fromVars(const std::map<std::string, std::string>& vars);

    const std::string& home() const { return home_; }
    const std::string& path() const { return path_; }

    /**
     * @brief Add or override one explicitly forwarded variable.
     * @return *this, for chaining
     */
    Env& withVar(std::string name, std::string value);

    /**
     * @brief Put @p dir in front of the forwarded PATH.
     */
    void prependToPath(const std::string& dir);

    std::map<std::string, std::string> explicitEnv() const override;

private:
    Env(std::string home, std::string path);

    std::string home_;
    std::string path_;
    std::map<std::string, std::string> forwarded_;  ///< Optional allow-listed variables that were set
    std::map<std::string, std::string> extra_;      ///< Variables added through withVar()
};

} // namespace ADL
