#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>

namespace huesync {

// Tunables for discovery, pairing, the event stream and the cache. Every
// field carries its default; fromJson() only overrides what is present and
// clamps numeric values into sane ranges.
struct ClientConfig {
    // Bridge addressing. An empty host triggers DNS-SD discovery.
    QString host;
    int port = 0;
    bool useTls = true;
    QString appKey;
    QString bridgeId;

    // DNS-SD service type with its browse domain.
    QString discoveryServiceName = QStringLiteral("_hue._tcp.local");
    int discoveryTimeoutMs = 5000;
    int discoveryGraceMs = 750;

    QString applicationName = QStringLiteral("huesync");
    int authRetryIntervalMs = 1000;
    int authWindowMs = 30000;

    int requestTimeoutMs = 10000;

    int streamInactivityMs = 120000;
    int streamBackoffInitialMs = 1000;
    int streamBackoffMaxMs = 30000;

    QStringList snapshotResourceTypes = {
        QStringLiteral("light"),
        QStringLiteral("grouped_light"),
        QStringLiteral("room"),
        QStringLiteral("zone"),
        QStringLiteral("scene")
    };
    int snapshotRefreshDelayMs = 1000;
    int pendingEventLimit = 4096;

    bool autoSyncAfterCommand = true;

    int effectivePort() const { return port > 0 ? port : (useTls ? 443 : 80); }

    static ClientConfig fromJson(const QJsonObject &obj, QString *error = nullptr);
    QJsonObject toJson(bool includeSecrets = false) const;
};

} // namespace huesync
