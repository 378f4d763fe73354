#pragma once

#include <QMetaType>
#include <QString>

namespace huesync {

enum class ErrorKind {
    None,
    DiscoveryTimeout,
    AuthenticationTimeout,
    AuthenticationRejected,
    Unauthorized,
    BridgeUnreachable,
    BridgeError,
    StreamDisconnected,
    MalformedEvent,
    Cancelled,
    InvalidArgument
};

QString errorKindName(ErrorKind kind);

// Transient kinds are retried internally and only surface once a retry
// budget is exhausted.
bool isTransient(ErrorKind kind);

} // namespace huesync

Q_DECLARE_METATYPE(huesync::ErrorKind)
