#pragma once

#include <memory>

#include <QObject>
#include <QPointer>
#include <QTimer>

#include "hue_config.h"
#include "hue_credentials.h"
#include "hue_discovery.h"
#include "hue_error.h"
#include "hue_eventstream.h"
#include "hue_http.h"
#include "hue_state_cache.h"

class QNetworkAccessManager;

namespace huesync {

// Bootstraps a bridge connection (discovery, pairing, transport), keeps the
// event stream running and the state cache reconciled, and exposes resource
// commands. One instance per bridge; the caller owns it.
class HueClient : public QObject
{
    Q_OBJECT
public:
    explicit HueClient(const ClientConfig &config, QObject *parent = nullptr);
    // Uses the given transport instead of discovering the bridge and building
    // an HTTPS client.
    HueClient(const ClientConfig &config, std::unique_ptr<BridgeTransport> transport, QObject *parent = nullptr);
    ~HueClient() override;

    bool start();
    void stop();

    bool refreshSnapshot(QString *error = nullptr);
    void scheduleSnapshotRefresh(const QString &reason);

    HttpResult request(const QByteArray &method, const QString &path, const QByteArray &body = QByteArray());

    // Forgets the application key and pairs again (link button).
    bool reauthenticate();

    HttpResult setLightOn(const QString &lightId, bool on);
    HttpResult setLightBrightness(const QString &lightId, double brightnessPercent);
    HttpResult setLightColorXy(const QString &lightId, double x, double y);
    HttpResult setLightColorRgb(const QString &lightId, double r01, double g01, double b01);
    HttpResult setLightColorTemperature(const QString &lightId, int mirek);
    HttpResult setGroupedLightOn(const QString &groupedLightId, bool on);
    // action: "active", "inactive" or "dynamic_palette".
    HttpResult recallScene(const QString &sceneId, const QString &action = QStringLiteral("active"));

    // Refetches one resource and merges it into the cache.
    bool syncResource(const QString &type, const QString &id, QString *error = nullptr);

    // Seeds the credential used by the next start().
    void setCredential(const Credential &credential);

    StateCache &cache() { return m_cache; }
    const StateCache &cache() const { return m_cache; }
    Credential credential() const { return m_credential; }
    BridgeDescriptor bridge() const { return m_bridge; }
    const ClientConfig &config() const { return m_config; }
    bool isRunning() const { return m_running; }
    bool isStreaming() const;
    EventStreamConsumer *eventStream() const { return m_stream; }

public slots:
    void cancelPairing();

signals:
    void started();
    void stopped();
    void snapshotLoaded(int resourceCount);
    void credentialAcquired(const huesync::Credential &credential);
    void waitingForLinkButton(int remainingMs);
    void authorizationRequired();
    void errorOccurred(huesync::ErrorKind kind, const QString &message);
    void connectionStateChanged(bool streaming);

private:
    bool resolveBridge(QString *error, ErrorKind *kind);
    bool ensureTransport();
    bool acquireCredential(const Credential &existing);
    void startEventStream();
    void handleChangeEvents(const ChangeEventList &events);
    void handleStreamError(ErrorKind kind, const QString &message);
    void performScheduledRefresh();
    // Events missed while the stream was down are only visible in a fresh
    // snapshot; buffer live events until it lands.
    void resyncAfterReconnect(const QString &reason);
    HttpResult sendCommand(const QString &type, const QString &id, const QByteArray &payload);
    void fail(ErrorKind kind, const QString &message);

    ClientConfig m_config;
    QNetworkAccessManager *m_nam = nullptr;
    std::unique_ptr<BridgeTransport> m_transport;
    bool m_transportInjected = false;
    QPointer<CredentialManager> m_credentials;
    QPointer<EventStreamConsumer> m_stream;
    StateCache m_cache;
    Credential m_credential;
    BridgeDescriptor m_bridge;
    QTimer m_resyncTimer;
    QString m_pendingResyncReason;
    bool m_running = false;
    bool m_snapshotInFlight = false;
};

} // namespace huesync
