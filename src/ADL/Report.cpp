#include "ADL/Report.hpp"
#include <sstream>
#include <utility>

namespace ADL {

Report::Report(Label label, std::string message, std::string details)
    : label_(label)
    , message_(std::move(message))
    , details_(std::move(details))
{
}

Report Report::error(std::string message, std::string details) {
    return Report(Label::Error, std::move(message), std::move(details));
}

Report Report::actionRequest(std::string message, std::string details) {
    return Report(Label::ActionRequest, std::move(message), std::move(details));
}

std::string labelToString(Report::Label label) {
    switch (label) {
        case Report::Label::Error:         return "error";
        case Report::Label::ActionRequest: return "action request";
        default:                           return "unknown";
    }
}

std::string Report::render() const {
    std::ostringstream oss;
    oss << labelToString(label_) << ": " << message_;
    if (!details_.empty()) {
        // Continuation lines of multi-line details keep the same indent
        std::istringstream lines(details_);
        std::string line;
        while (std::getline(lines, line)) {
            oss << "\n    " << line;
        }
    }
    return oss.str();
}

} // namespace ADL
