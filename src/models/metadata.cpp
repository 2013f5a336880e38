#include "intoto/models/metadata.hpp"
#include "intoto/utils/logger.hpp"

namespace intoto {
namespace models {

std::string VerificationEventKindToString(VerificationEvent::Kind kind) {
    switch (kind) {
        case VerificationEvent::Kind::GoodSignature:
            return "good_signature";
        case VerificationEvent::Kind::BadSignature:
            return "bad_signature";
        case VerificationEvent::Kind::UnauthorizedKey:
            return "unauthorized_key";
    }
    return "unknown";
}

void LogVerificationEvent(const VerificationEvent& event) {
    utils::LogContext ctx = utils::LogContext()
        .With("keyid", event.keyId.ToString())
        .With("event", VerificationEventKindToString(event.kind));

    switch (event.kind) {
        case VerificationEvent::Kind::GoodSignature:
            utils::GetLogger().Debug("Good signature", ctx);
            break;
        case VerificationEvent::Kind::UnauthorizedKey:
            utils::GetLogger().Warn("Key was not authorized for this metadata", ctx);
            break;
        case VerificationEvent::Kind::BadSignature:
            utils::GetLogger().Warn("Bad signature", ctx.With("error", event.detail));
            break;
    }
}

} // namespace models
} // namespace intoto
