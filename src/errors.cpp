#include "layerpush/core/errors.hpp"

namespace layerpush {

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::InvalidInput: return "invalid_input";
        case ErrorKind::Transient: return "transient";
        case ErrorKind::Storage: return "storage";
        case ErrorKind::Integrity: return "integrity";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::Canceled: return "canceled";
    }
    return "storage";
}

ErrorKind error_kind_from_string(const std::string& name) {
    if (name == "none") return ErrorKind::None;
    if (name == "invalid_input") return ErrorKind::InvalidInput;
    if (name == "transient") return ErrorKind::Transient;
    if (name == "integrity") return ErrorKind::Integrity;
    if (name == "not_found") return ErrorKind::NotFound;
    if (name == "canceled") return ErrorKind::Canceled;
    return ErrorKind::Storage;
}

} // namespace layerpush
