#pragma once

#include <stdexcept>
#include <string>

namespace wsbridge {

/// Classification shared by synchronous outcomes and terminal task errors.
enum class ErrorKind {
    None,
    ConfigAbsent,     // an operation needs storage but the tenant has none
    Connection,       // bucket-not-found, access-denied, invalid-credentials, network
    Validation,       // path traversal, malformed identifiers, bad requests
    NotFound,         // unknown task token, missing object or path
    PartialFailure,   // recursive operation stopped after N of M items
    Timeout,          // task exceeded its maximum lifetime
    AlreadyTerminal,  // mutation attempted on a finished task
    Io,               // local filesystem failure
};

/// Stable lower-case name, e.g. "config-absent".
const char* error_kind_name(ErrorKind kind);

/// Exception carrying an ErrorKind. Thrown at validation boundaries only;
/// background failures are recorded into the task instead.
class BridgeError : public std::runtime_error {
public:
    BridgeError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class ValidationError : public BridgeError {
public:
    explicit ValidationError(const std::string& message)
        : BridgeError(ErrorKind::Validation, message) {}
};

}  // namespace wsbridge
