#include "hue_error.h"

namespace huesync {

QString errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None:
        return QStringLiteral("None");
    case ErrorKind::DiscoveryTimeout:
        return QStringLiteral("DiscoveryTimeout");
    case ErrorKind::AuthenticationTimeout:
        return QStringLiteral("AuthenticationTimeout");
    case ErrorKind::AuthenticationRejected:
        return QStringLiteral("AuthenticationRejected");
    case ErrorKind::Unauthorized:
        return QStringLiteral("Unauthorized");
    case ErrorKind::BridgeUnreachable:
        return QStringLiteral("BridgeUnreachable");
    case ErrorKind::BridgeError:
        return QStringLiteral("BridgeError");
    case ErrorKind::StreamDisconnected:
        return QStringLiteral("StreamDisconnected");
    case ErrorKind::MalformedEvent:
        return QStringLiteral("MalformedEvent");
    case ErrorKind::Cancelled:
        return QStringLiteral("Cancelled");
    case ErrorKind::InvalidArgument:
        return QStringLiteral("InvalidArgument");
    }
    return QStringLiteral("Unknown");
}

bool isTransient(ErrorKind kind)
{
    return kind == ErrorKind::BridgeUnreachable
        || kind == ErrorKind::StreamDisconnected;
}

} // namespace huesync
