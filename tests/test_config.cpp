#include <gtest/gtest.h>

#include <QJsonArray>
#include <QJsonObject>

#include "hue_config.h"

using huesync::ClientConfig;

TEST(ClientConfigTest, DefaultsMatchBridgeConventions)
{
    const ClientConfig config;
    EXPECT_TRUE(config.host.isEmpty());
    EXPECT_EQ(config.effectivePort(), 443);
    EXPECT_EQ(config.discoveryServiceName, QStringLiteral("_hue._tcp.local"));
    EXPECT_EQ(config.discoveryTimeoutMs, 5000);
    EXPECT_EQ(config.authRetryIntervalMs, 1000);
    EXPECT_EQ(config.authWindowMs, 30000);
    EXPECT_EQ(config.streamInactivityMs, 120000);
    EXPECT_EQ(config.streamBackoffInitialMs, 1000);
    EXPECT_EQ(config.streamBackoffMaxMs, 30000);
    EXPECT_EQ(config.pendingEventLimit, 4096);
    EXPECT_TRUE(config.snapshotResourceTypes.contains(QStringLiteral("light")));
    EXPECT_TRUE(config.autoSyncAfterCommand);
}

TEST(ClientConfigTest, ReadsKnownFieldsAndClampsNumbers)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("host"), QStringLiteral(" 192.168.1.20 "));
    obj.insert(QStringLiteral("bridgeId"), QStringLiteral("001788FFFE123456"));
    obj.insert(QStringLiteral("discoveryTimeoutMs"), 5);
    obj.insert(QStringLiteral("authWindowMs"), 10000000);
    obj.insert(QStringLiteral("streamBackoffInitialMs"), 5000);
    obj.insert(QStringLiteral("streamBackoffMaxMs"), 2000);
    obj.insert(QStringLiteral("snapshotResourceTypes"),
               QJsonArray{QStringLiteral("light"), QStringLiteral(""), QStringLiteral("light"), QStringLiteral("scene")});
    obj.insert(QStringLiteral("autoSyncAfterCommand"), false);

    QString error;
    const ClientConfig config = ClientConfig::fromJson(obj, &error);
    EXPECT_TRUE(error.isEmpty());
    EXPECT_EQ(config.host, QStringLiteral("192.168.1.20"));
    EXPECT_EQ(config.bridgeId, QStringLiteral("001788fffe123456"));
    EXPECT_EQ(config.discoveryTimeoutMs, 100);
    EXPECT_EQ(config.authWindowMs, 600000);
    EXPECT_EQ(config.streamBackoffInitialMs, 5000);
    EXPECT_EQ(config.streamBackoffMaxMs, 5000);
    EXPECT_EQ(config.snapshotResourceTypes, (QStringList{QStringLiteral("light"), QStringLiteral("scene")}));
    EXPECT_FALSE(config.autoSyncAfterCommand);
}

TEST(ClientConfigTest, IpIsAcceptedForHostAndPortSelectsScheme)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("ip"), QStringLiteral("10.0.0.2"));
    obj.insert(QStringLiteral("port"), 80);

    const ClientConfig config = ClientConfig::fromJson(obj);
    EXPECT_EQ(config.host, QStringLiteral("10.0.0.2"));
    EXPECT_FALSE(config.useTls);
    EXPECT_EQ(config.effectivePort(), 80);
}

TEST(ClientConfigTest, InvalidServiceTypeFallsBackToDefault)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("discoveryServiceName"), QStringLiteral("hue-bridges"));

    QString error;
    const ClientConfig config = ClientConfig::fromJson(obj, &error);
    EXPECT_FALSE(error.isEmpty());
    EXPECT_EQ(config.discoveryServiceName, QStringLiteral("_hue._tcp.local"));
}

TEST(ClientConfigTest, SecretsOnlySerializedOnRequest)
{
    ClientConfig config;
    config.appKey = QStringLiteral("secret-key");

    EXPECT_FALSE(config.toJson().contains(QStringLiteral("appKey")));
    EXPECT_EQ(config.toJson(true).value(QStringLiteral("appKey")).toString(), QStringLiteral("secret-key"));

    const ClientConfig restored = ClientConfig::fromJson(config.toJson(true));
    EXPECT_EQ(restored.appKey, config.appKey);
    EXPECT_EQ(restored.streamInactivityMs, config.streamInactivityMs);
}
