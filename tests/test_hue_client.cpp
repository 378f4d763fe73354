#include <gtest/gtest.h>

#include <QJsonDocument>
#include <QSignalSpy>

#include "fake_transport.h"
#include "hue_client.h"

using namespace huesync;
using huesync::test::FakeEventStream;
using huesync::test::FakeTransport;
using huesync::test::RecordedRequest;
using huesync::test::pumpEvents;
using huesync::test::waitFor;

namespace {

const QByteArray kBridge = R"({"errors":[],"data":[{"id":"B1","type":"bridge"}]})";
const QByteArray kLights =
    R"({"errors":[],"data":[{"id":"L1","type":"light","on":{"on":true},"dimming":{"brightness":50.0}}]})";
const QByteArray kLightsWithL2 =
    R"({"errors":[],"data":[{"id":"L1","type":"light","on":{"on":true}},{"id":"L2","type":"light","on":{"on":false}}]})";
const QByteArray kRooms =
    R"({"errors":[],"data":[{"id":"R1","type":"room","metadata":{"name":"Kitchen"}}]})";

QByteArray eventFrame(const QString &kind, const QString &type, const QString &id, const QString &body)
{
    return QStringLiteral("id: 1\ndata: [{\"id\":\"e1\",\"type\":\"%1\",\"data\":[{\"id\":\"%3\",\"type\":\"%2\"%4}]}]\n\n")
        .arg(kind, type, id, body.isEmpty() ? QString() : QStringLiteral(",") + body)
        .toUtf8();
}

} // namespace

class HueClientTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        config.host = QStringLiteral("192.168.1.20");
        config.appKey = QStringLiteral("stored-key");
        config.snapshotResourceTypes = {QStringLiteral("light"), QStringLiteral("room")};
        config.snapshotRefreshDelayMs = 20;
        config.streamBackoffInitialMs = 20;
        config.streamBackoffMaxMs = 50;
        config.authRetryIntervalMs = 20;
        config.authWindowMs = 2000;

        auto fake = std::make_unique<FakeTransport>();
        transport = fake.get();
        transport->setAppKey(config.appKey);
        transport->onJson("GET", QStringLiteral("/clip/v2/resource/bridge"), kBridge);
        transport->on("GET", QStringLiteral("/clip/v2/resource/light"), [this](const RecordedRequest &) {
            opensAtFirstSnapshot = opensAtFirstSnapshot < 0 ? transport->openCount : opensAtFirstSnapshot;
            return FakeTransport::ok(lights);
        });
        transport->onJson("GET", QStringLiteral("/clip/v2/resource/room"), kRooms);
        pendingTransport = std::move(fake);
    }

    HueClient &makeClient()
    {
        client = std::make_unique<HueClient>(config, std::move(pendingTransport));
        return *client;
    }

    HueClient &startedClient()
    {
        HueClient &c = makeClient();
        EXPECT_TRUE(c.start());
        FakeEventStream *stream = transport->lastStream();
        if (stream)
            stream->open();
        return c;
    }

    ClientConfig config;
    FakeTransport *transport = nullptr;
    std::unique_ptr<FakeTransport> pendingTransport;
    std::unique_ptr<HueClient> client;
    QByteArray lights = kLights;
    int opensAtFirstSnapshot = -1;
};

TEST_F(HueClientTest, StartOpensStreamThenLoadsSnapshot)
{
    HueClient &c = makeClient();
    QSignalSpy started(&c, &HueClient::started);
    QSignalSpy loaded(&c, &HueClient::snapshotLoaded);

    ASSERT_TRUE(c.start());
    EXPECT_TRUE(c.isRunning());
    EXPECT_EQ(started.count(), 1);
    ASSERT_EQ(loaded.count(), 1);
    EXPECT_EQ(loaded.at(0).at(0).toInt(), 2);

    EXPECT_EQ(opensAtFirstSnapshot, 1);
    EXPECT_EQ(c.cache().size(), 2);
    EXPECT_TRUE(c.cache().isInitialized());
    EXPECT_EQ(c.cache().get(QStringLiteral("room"), QStringLiteral("R1"))->name(), QStringLiteral("Kitchen"));

    // Second start is a no-op.
    EXPECT_TRUE(c.start());
    EXPECT_EQ(transport->openCount, 1);
    EXPECT_EQ(started.count(), 1);
}

TEST_F(HueClientTest, StreamEventsUpdateCacheAndSubscribers)
{
    HueClient &c = startedClient();

    QStringList seen;
    c.cache().subscribe(SubscriptionFilter::forResource(QStringLiteral("light"), QStringLiteral("L1")),
                        [&](const ChangeEvent &event) { seen.append(changeKindName(event.kind)); });

    transport->lastStream()->push(
        eventFrame(QStringLiteral("update"), QStringLiteral("light"), QStringLiteral("L1"), R"("on":{"on":false})"));

    const auto light = c.cache().get(QStringLiteral("light"), QStringLiteral("L1"));
    ASSERT_TRUE(light.has_value());
    EXPECT_FALSE(*light->isOn());
    EXPECT_DOUBLE_EQ(*light->brightness(), 50.0);
    EXPECT_EQ(seen, QStringList{QStringLiteral("update")});
    EXPECT_TRUE(c.isStreaming());
}

TEST_F(HueClientTest, UpdateForUnknownResourceTriggersResync)
{
    HueClient &c = startedClient();
    lights = kLightsWithL2;

    transport->lastStream()->push(
        eventFrame(QStringLiteral("update"), QStringLiteral("light"), QStringLiteral("L2"), R"("on":{"on":true})"));
    EXPECT_FALSE(c.cache().get(QStringLiteral("light"), QStringLiteral("L2")).has_value());

    ASSERT_TRUE(waitFor([&] { return transport->count("GET", QStringLiteral("/clip/v2/resource/light")) == 2; }));
    const auto l2 = c.cache().get(QStringLiteral("light"), QStringLiteral("L2"));
    ASSERT_TRUE(l2.has_value());
    // The snapshot was fetched after the update arrived, so its value stands.
    EXPECT_FALSE(*l2->isOn());
    EXPECT_EQ(c.cache().pendingCount(), 0);
}

TEST_F(HueClientTest, ReconnectedStreamReloadsSnapshot)
{
    HueClient &c = startedClient();
    ASSERT_EQ(transport->count("GET", QStringLiteral("/clip/v2/resource/light")), 1);

    transport->lastStream()->close();
    EXPECT_FALSE(c.isStreaming());
    lights = R"({"errors":[],"data":[{"id":"L1","type":"light","on":{"on":false},"dimming":{"brightness":50.0}}]})";

    ASSERT_TRUE(waitFor([&] { return transport->openCount == 2; }));
    transport->lastStream()->open();
    EXPECT_TRUE(c.isStreaming());
    EXPECT_EQ(c.eventStream()->reconnectCount(), 1);
    EXPECT_TRUE(c.cache().isBuffering());

    // Arrives before the fresh snapshot and is replayed on top of it.
    transport->lastStream()->push(eventFrame(QStringLiteral("update"), QStringLiteral("light"), QStringLiteral("L1"),
                                             R"("dimming":{"brightness":80.0})"));

    ASSERT_TRUE(waitFor([&] { return transport->count("GET", QStringLiteral("/clip/v2/resource/light")) == 2; }));
    ASSERT_TRUE(waitFor([&] { return !c.cache().isBuffering(); }));
    const auto light = c.cache().get(QStringLiteral("light"), QStringLiteral("L1"));
    ASSERT_TRUE(light.has_value());
    EXPECT_FALSE(*light->isOn());
    EXPECT_DOUBLE_EQ(*light->brightness(), 80.0);
}

TEST_F(HueClientTest, ReauthenticationReloadsSnapshot)
{
    HueClient &c = startedClient();
    transport->onJson("POST", QStringLiteral("/api"), R"([{"success":{"username":"new-key"}}])");
    lights = kLightsWithL2;

    ASSERT_TRUE(c.reauthenticate());
    EXPECT_EQ(transport->appKey(), QStringLiteral("new-key"));
    ASSERT_TRUE(waitFor([&] { return transport->count("GET", QStringLiteral("/clip/v2/resource/light")) == 2; }));
    ASSERT_TRUE(waitFor([&] { return c.cache().get(QStringLiteral("light"), QStringLiteral("L2")).has_value(); }));
    EXPECT_EQ(transport->requests.constLast().appKey, QStringLiteral("new-key"));
}

TEST_F(HueClientTest, TopologyChangeTriggersSingleResync)
{
    HueClient &c = startedClient();

    transport->lastStream()->push(eventFrame(QStringLiteral("add"), QStringLiteral("room"), QStringLiteral("R2"),
                                             R"("metadata":{"name":"Hall"})"));
    transport->lastStream()->push(eventFrame(QStringLiteral("delete"), QStringLiteral("room"), QStringLiteral("R2"),
                                             QString()));
    EXPECT_TRUE(c.cache().isTombstoned(QStringLiteral("room"), QStringLiteral("R2")));

    ASSERT_TRUE(waitFor([&] { return transport->count("GET", QStringLiteral("/clip/v2/resource/room")) == 2; }));
    pumpEvents(100);
    EXPECT_EQ(transport->count("GET", QStringLiteral("/clip/v2/resource/room")), 2);
}

TEST_F(HueClientTest, CommandPutsPayloadAndResyncsResource)
{
    HueClient &c = startedClient();
    transport->on("PUT", QStringLiteral("/clip/v2/resource/light/L1"), [](const RecordedRequest &request) {
        EXPECT_EQ(request.appKey, QStringLiteral("stored-key"));
        return FakeTransport::ok(R"({"errors":[],"data":[{"rid":"L1","rtype":"light"}]})");
    });
    transport->onJson("GET", QStringLiteral("/clip/v2/resource/light/L1"),
                      R"({"errors":[],"data":[{"id":"L1","type":"light","on":{"on":false}}]})");

    const HttpResult result = c.setLightOn(QStringLiteral("L1"), false);
    ASSERT_TRUE(result.ok) << result.error.toStdString();

    const RecordedRequest &put = transport->requests.at(transport->requests.size() - 2);
    EXPECT_EQ(put.method, QByteArray("PUT"));
    const QJsonObject body = QJsonDocument::fromJson(put.payload).object();
    EXPECT_FALSE(body.value(QStringLiteral("on")).toObject().value(QStringLiteral("on")).toBool(true));

    const auto light = c.cache().get(QStringLiteral("light"), QStringLiteral("L1"));
    ASSERT_TRUE(light.has_value());
    EXPECT_FALSE(*light->isOn());
    // The refetched body replaces the cached one.
    EXPECT_FALSE(light->brightness().has_value());
    EXPECT_EQ(light->version, 1u);
}

TEST_F(HueClientTest, CommandWithoutIdIsRejectedLocally)
{
    HueClient &c = startedClient();
    const int before = transport->requests.size();
    const HttpResult result = c.recallScene(QString());
    EXPECT_EQ(result.errorKind, ErrorKind::InvalidArgument);
    EXPECT_EQ(transport->requests.size(), before);

    const HttpResult badAction = c.recallScene(QStringLiteral("S1"), QStringLiteral("sparkle"));
    EXPECT_EQ(badAction.errorKind, ErrorKind::InvalidArgument);
}

TEST_F(HueClientTest, RejectedKeyRaisesAuthorizationRequired)
{
    HueClient &c = startedClient();
    transport->on("PUT", QStringLiteral("/clip/v2/resource/grouped_light/G1"), [](const RecordedRequest &) {
        return FakeTransport::failure(ErrorKind::Unauthorized, 403, QStringLiteral("HTTP 403: unauthorized user"));
    });
    QSignalSpy authorization(&c, &HueClient::authorizationRequired);

    const HttpResult result = c.setGroupedLightOn(QStringLiteral("G1"), true);
    EXPECT_EQ(result.errorKind, ErrorKind::Unauthorized);
    EXPECT_EQ(authorization.count(), 1);

    transport->lastStream()->close(ErrorKind::Unauthorized, QStringLiteral("Event stream rejected"));
    EXPECT_EQ(authorization.count(), 2);
}

TEST_F(HueClientTest, SnapshotFailureAbortsStart)
{
    transport->on("GET", QStringLiteral("/clip/v2/resource/room"), [](const RecordedRequest &) {
        return FakeTransport::failure(ErrorKind::BridgeError, 500, QStringLiteral("HTTP 500"));
    });
    HueClient &c = makeClient();
    QSignalSpy errors(&c, &HueClient::errorOccurred);
    QSignalSpy started(&c, &HueClient::started);

    EXPECT_FALSE(c.start());
    EXPECT_FALSE(c.isRunning());
    EXPECT_EQ(started.count(), 0);
    ASSERT_GE(errors.count(), 1);
    EXPECT_EQ(errors.at(0).at(0).value<ErrorKind>(), ErrorKind::BridgeError);
    EXPECT_EQ(c.eventStream(), nullptr);
    ASSERT_NE(transport->lastStream(), nullptr);
    EXPECT_TRUE(transport->lastStream()->aborted);
}

TEST_F(HueClientTest, StopIsIdempotent)
{
    HueClient &c = startedClient();
    QSignalSpy stopped(&c, &HueClient::stopped);
    FakeEventStream *stream = transport->lastStream();

    c.stop();
    c.stop();
    EXPECT_EQ(stopped.count(), 1);
    EXPECT_FALSE(c.isRunning());
    EXPECT_TRUE(stream->aborted);

    const HttpResult result = c.setLightOn(QStringLiteral("L1"), true);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.errorKind, ErrorKind::BridgeUnreachable);

    pumpEvents(100);
    EXPECT_EQ(transport->openCount, 1);
}

TEST_F(HueClientTest, PairsWhenNoKeyIsStored)
{
    config.appKey.clear();
    transport->setAppKey(QString());
    transport->onJson("POST", QStringLiteral("/api"),
                      R"([{"success":{"username":"fresh-key","clientkey":"00FF"}}])");

    HueClient &c = makeClient();
    QSignalSpy acquired(&c, &HueClient::credentialAcquired);

    ASSERT_TRUE(c.start());
    ASSERT_EQ(acquired.count(), 1);
    EXPECT_EQ(acquired.at(0).at(0).value<Credential>().appKey, QStringLiteral("fresh-key"));
    EXPECT_EQ(c.credential().clientKey, QStringLiteral("00FF"));
    EXPECT_EQ(transport->appKey(), QStringLiteral("fresh-key"));
    EXPECT_EQ(transport->count("GET", QStringLiteral("/clip/v2/resource/bridge")), 0);

    const RecordedRequest &snapshot = transport->requests.constLast();
    EXPECT_EQ(snapshot.appKey, QStringLiteral("fresh-key"));
}

TEST_F(HueClientTest, StoredKeyIsValidatedWithoutPairing)
{
    HueClient &c = makeClient();
    QSignalSpy acquired(&c, &HueClient::credentialAcquired);

    ASSERT_TRUE(c.start());
    EXPECT_EQ(acquired.count(), 0);
    EXPECT_EQ(transport->count("GET", QStringLiteral("/clip/v2/resource/bridge")), 1);
    EXPECT_EQ(transport->count("POST", QStringLiteral("/api")), 0);
}
