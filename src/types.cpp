#include "intoto/types.hpp"

namespace intoto {

std::string ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::Encoding: return "Encoding";
        case ErrorKind::IllegalArgument: return "IllegalArgument";
        case ErrorKind::VerificationFailure: return "VerificationFailure";
        case ErrorKind::Crypto: return "Crypto";
        case ErrorKind::Io: return "Io";
        default: return "Unknown";
    }
}

std::string Error::String() const {
    if (ok()) {
        return "";
    }
    return ErrorKindToString(kind_) + ": " + message_;
}

} // namespace intoto
