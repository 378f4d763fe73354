#include "hue_config.h"

#include <algorithm>

#include <QJsonArray>

#include "hue_discovery.h"

namespace huesync {

namespace {

int readInt(const QJsonObject &obj, const QString &key, int fallback, int minValue, int maxValue)
{
    if (!obj.contains(key))
        return fallback;
    bool ok = false;
    const int value = obj.value(key).toVariant().toInt(&ok);
    if (!ok)
        return fallback;
    return std::clamp(value, minValue, maxValue);
}

QString readString(const QJsonObject &obj, const QString &key, const QString &fallback)
{
    if (!obj.contains(key))
        return fallback;
    return obj.value(key).toString(fallback).trimmed();
}

} // namespace

ClientConfig ClientConfig::fromJson(const QJsonObject &obj, QString *error)
{
    ClientConfig config;

    config.host = readString(obj, QStringLiteral("host"), config.host);
    if (config.host.isEmpty())
        config.host = readString(obj, QStringLiteral("ip"), config.host);
    config.port = readInt(obj, QStringLiteral("port"), config.port, 0, 65535);
    config.appKey = readString(obj, QStringLiteral("appKey"), config.appKey);
    config.bridgeId = readString(obj, QStringLiteral("bridgeId"), config.bridgeId).toLower();

    if (obj.contains(QStringLiteral("useTls"))) {
        config.useTls = obj.value(QStringLiteral("useTls")).toBool(true);
    } else if (config.port > 0) {
        config.useTls = (config.port == 443);
    }

    config.discoveryServiceName = readString(obj, QStringLiteral("discoveryServiceName"),
                                             config.discoveryServiceName);
    config.discoveryTimeoutMs = readInt(obj, QStringLiteral("discoveryTimeoutMs"),
                                        config.discoveryTimeoutMs, 100, 120000);
    config.discoveryGraceMs = readInt(obj, QStringLiteral("discoveryGraceMs"),
                                      config.discoveryGraceMs, 0, 10000);

    config.applicationName = readString(obj, QStringLiteral("applicationName"), config.applicationName);
    config.authRetryIntervalMs = readInt(obj, QStringLiteral("authRetryIntervalMs"),
                                         config.authRetryIntervalMs, 100, 10000);
    config.authWindowMs = readInt(obj, QStringLiteral("authWindowMs"), config.authWindowMs, 1000, 600000);

    config.requestTimeoutMs = readInt(obj, QStringLiteral("requestTimeoutMs"),
                                      config.requestTimeoutMs, 500, 120000);

    config.streamInactivityMs = readInt(obj, QStringLiteral("streamInactivityMs"),
                                        config.streamInactivityMs, 1000, 3600000);
    config.streamBackoffInitialMs = readInt(obj, QStringLiteral("streamBackoffInitialMs"),
                                            config.streamBackoffInitialMs, 100, 600000);
    config.streamBackoffMaxMs = readInt(obj, QStringLiteral("streamBackoffMaxMs"),
                                        config.streamBackoffMaxMs, 100, 600000);
    if (config.streamBackoffMaxMs < config.streamBackoffInitialMs)
        config.streamBackoffMaxMs = config.streamBackoffInitialMs;

    if (obj.contains(QStringLiteral("snapshotResourceTypes"))) {
        QStringList types;
        const QJsonArray arr = obj.value(QStringLiteral("snapshotResourceTypes")).toArray();
        for (const QJsonValue &value : arr) {
            const QString type = value.toString().trimmed();
            if (!type.isEmpty() && !types.contains(type))
                types.append(type);
        }
        if (!types.isEmpty())
            config.snapshotResourceTypes = types;
    }
    config.snapshotRefreshDelayMs = readInt(obj, QStringLiteral("snapshotRefreshDelayMs"),
                                            config.snapshotRefreshDelayMs, 0, 60000);
    config.pendingEventLimit = readInt(obj, QStringLiteral("pendingEventLimit"),
                                       config.pendingEventLimit, 16, 1000000);

    if (obj.contains(QStringLiteral("autoSyncAfterCommand")))
        config.autoSyncAfterCommand = obj.value(QStringLiteral("autoSyncAfterCommand")).toBool(true);

    QString validationError;
    if (!splitServiceName(config.discoveryServiceName, nullptr, nullptr)) {
        validationError = QStringLiteral("discoveryServiceName \"%1\" is not a DNS-SD service type")
                              .arg(config.discoveryServiceName);
        config.discoveryServiceName = ClientConfig().discoveryServiceName;
    }
    if (error)
        *error = validationError;

    return config;
}

QJsonObject ClientConfig::toJson(bool includeSecrets) const
{
    QJsonObject out;
    out.insert(QStringLiteral("host"), host);
    out.insert(QStringLiteral("port"), port);
    out.insert(QStringLiteral("useTls"), useTls);
    if (includeSecrets)
        out.insert(QStringLiteral("appKey"), appKey);
    out.insert(QStringLiteral("bridgeId"), bridgeId);
    out.insert(QStringLiteral("discoveryServiceName"), discoveryServiceName);
    out.insert(QStringLiteral("discoveryTimeoutMs"), discoveryTimeoutMs);
    out.insert(QStringLiteral("discoveryGraceMs"), discoveryGraceMs);
    out.insert(QStringLiteral("applicationName"), applicationName);
    out.insert(QStringLiteral("authRetryIntervalMs"), authRetryIntervalMs);
    out.insert(QStringLiteral("authWindowMs"), authWindowMs);
    out.insert(QStringLiteral("requestTimeoutMs"), requestTimeoutMs);
    out.insert(QStringLiteral("streamInactivityMs"), streamInactivityMs);
    out.insert(QStringLiteral("streamBackoffInitialMs"), streamBackoffInitialMs);
    out.insert(QStringLiteral("streamBackoffMaxMs"), streamBackoffMaxMs);
    out.insert(QStringLiteral("snapshotResourceTypes"), QJsonArray::fromStringList(snapshotResourceTypes));
    out.insert(QStringLiteral("snapshotRefreshDelayMs"), snapshotRefreshDelayMs);
    out.insert(QStringLiteral("pendingEventLimit"), pendingEventLimit);
    out.insert(QStringLiteral("autoSyncAfterCommand"), autoSyncAfterCommand);
    return out;
}

} // namespace huesync
