#include "Errors.h"

namespace ical {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedFold: return "malformed_fold";
        case ErrorKind::MalformedContentLine: return "malformed_content_line";
        case ErrorKind::UnbalancedBlock: return "unbalanced_block";
        case ErrorKind::UnterminatedBlock: return "unterminated_block";
        case ErrorKind::UnknownProperty: return "unknown_property";
        case ErrorKind::Internal: return "internal";
    }
    return "unknown";
}

static std::string decorate(const std::string& message, std::size_t line) {
    if (line == 0) return message;
    return "line " + std::to_string(line) + ": " + message;
}

IcalError::IcalError(ErrorKind kind, const std::string& message, std::size_t line, std::string property)
    : std::runtime_error(decorate(message, line)), kind_(kind), line_(line), property_(std::move(property)) {}

CoreError IcalError::to_core_error() const {
    CoreError e;
    e.kind = kind_;
    e.message = what();
    e.line = line_;
    e.property = property_;
    return e;
}

}
