#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace ical {

enum class ErrorKind {
    MalformedFold,
    MalformedContentLine,
    UnbalancedBlock,
    UnterminatedBlock,
    UnknownProperty,
    // not the document's fault, e.g. a failing OpenSSL call
    Internal
};

// Stable snake_case tag used in logs and metric labels.
const char* error_kind_name(ErrorKind kind);

struct CoreError {
    ErrorKind kind = ErrorKind::MalformedContentLine;
    std::string message;
    std::size_t line = 0;  // 1-based, 0 when not tied to an input line
    std::string property;  // set for UnknownProperty
};

class IcalError : public std::runtime_error {
public:
    IcalError(ErrorKind kind, const std::string& message, std::size_t line = 0, std::string property = std::string());

    ErrorKind kind() const noexcept { return kind_; }
    std::size_t line() const noexcept { return line_; }
    const std::string& property() const noexcept { return property_; }

    CoreError to_core_error() const;

private:
    ErrorKind kind_;
    std::size_t line_;
    std::string property_;
};

}
