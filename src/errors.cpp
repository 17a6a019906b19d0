#include "wsbridge/errors.hpp"

namespace wsbridge {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::ConfigAbsent: return "config-absent";
        case ErrorKind::Connection: return "connection-error";
        case ErrorKind::Validation: return "validation-error";
        case ErrorKind::NotFound: return "not-found";
        case ErrorKind::PartialFailure: return "partial-failure";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::AlreadyTerminal: return "already-terminal";
        case ErrorKind::Io: return "io-error";
    }
    return "none";
}

}  // namespace wsbridge
