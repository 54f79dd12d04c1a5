// include/ADL/Report.hpp
#pragma once

#include <string>

namespace ADL {

/**
 * @brief User-facing description of an outcome, rendered by the CLI layer.
 */
class Report {
public:
    enum class Label {
        Error,
        ActionRequest
    };

    static Report error(std::string message, std::string details);
    static Report actionRequest(std::string message, std::string details);

    Label label() const { return label_; }
    const std::string& message() const { return message_; }
    const std::string& details() const { return details_; }

    /**
     * @brief Render as "<label>: <message>" followed by the indented details.
     */
    std::string render() const;

private:
    Report(Label label, std::string message, std::string details);

    Label label_;
    std::string message_;
    std::string details_;
};

std::string labelToString(Report::Label label);

/**
 * @brief Implemented by error types the CLI can present to a user.
 */
class Reportable {
public:
    virtual ~Reportable() = default;
    virtual Report report() const = 0;
};

} // namespace ADL
