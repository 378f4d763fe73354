#include "hue_client.h"

#include <QLoggingCategory>
#include <QNetworkAccessManager>

#include <utility>

Q_LOGGING_CATEGORY(clientLog, "huesync.client");

namespace huesync {

namespace {

QString resourcePath(const QString &type, const QString &id = QString())
{
    QString path = QStringLiteral("/clip/v2/resource/") + type;
    if (!id.isEmpty())
        path += QLatin1Char('/') + id;
    return path;
}

bool isTopologyChange(const ChangeEvent &event)
{
    if (event.kind == ChangeKind::Update)
        return false;
    return event.type == QStringLiteral("room") || event.type == QStringLiteral("zone")
        || event.type == QStringLiteral("device");
}

} // namespace

HueClient::HueClient(const ClientConfig &config, QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_nam(new QNetworkAccessManager(this))
    , m_cache(config.pendingEventLimit)
{
    m_credential.appKey = config.appKey.trimmed();
    m_resyncTimer.setSingleShot(true);
    m_resyncTimer.setInterval(qMax(0, m_config.snapshotRefreshDelayMs));
    connect(&m_resyncTimer, &QTimer::timeout, this, &HueClient::performScheduledRefresh);
}

HueClient::HueClient(const ClientConfig &config, std::unique_ptr<BridgeTransport> transport, QObject *parent)
    : HueClient(config, parent)
{
    m_transport = std::move(transport);
    m_transportInjected = static_cast<bool>(m_transport);
    if (m_transport && !m_credential.isValid())
        m_credential.appKey = m_transport->appKey();
}

HueClient::~HueClient()
{
    stop();
}

void HueClient::setCredential(const Credential &credential)
{
    m_credential = credential;
}

bool HueClient::isStreaming() const
{
    return m_stream && m_stream->state() == EventStreamConsumer::State::Streaming;
}

void HueClient::fail(ErrorKind kind, const QString &message)
{
    qCWarning(clientLog).noquote() << errorKindName(kind) << message;
    if (kind == ErrorKind::Unauthorized)
        emit authorizationRequired();
    emit errorOccurred(kind, message);
}

bool HueClient::start()
{
    if (m_running)
        return true;

    m_cache.reset();
    m_running = true;

    // Built transports are bound to one bridge address; rebuild on every start.
    if (!m_transportInjected) {
        if (m_credentials) {
            m_credentials->deleteLater();
            m_credentials.clear();
        }
        m_transport.reset();
    }

    QString error;
    ErrorKind kind = ErrorKind::None;
    if (!resolveBridge(&error, &kind)) {
        m_running = false;
        fail(kind, error);
        return false;
    }
    if (!ensureTransport()) {
        m_running = false;
        fail(ErrorKind::InvalidArgument, QStringLiteral("No bridge address available"));
        return false;
    }
    if (!acquireCredential(m_credential)) {
        m_running = false;
        return false;
    }

    // The stream opens before the snapshot fetch so deltas that race the
    // fetch are buffered by the cache.
    startEventStream();

    if (!refreshSnapshot(&error)) {
        stop();
        return false;
    }

    qCInfo(clientLog) << "Client started for bridge" << m_bridge.address << m_bridge.bridgeId;
    emit started();
    return true;
}

void HueClient::stop()
{
    if (!m_running)
        return;
    m_running = false;

    m_resyncTimer.stop();
    m_pendingResyncReason.clear();
    if (m_credentials)
        m_credentials->cancel();
    if (m_stream) {
        m_stream->stop();
        m_stream->deleteLater();
        m_stream.clear();
    }

    qCInfo(clientLog) << "Client stopped";
    emit stopped();
}

bool HueClient::resolveBridge(QString *error, ErrorKind *kind)
{
    const QString host = m_config.host.trimmed();
    if (!host.isEmpty() || m_transportInjected) {
        m_bridge = BridgeDescriptor();
        m_bridge.address = host;
        m_bridge.port = m_config.effectivePort();
        m_bridge.bridgeId = m_config.bridgeId;
        return true;
    }

    DiscoveryOptions options;
    options.serviceName = m_config.discoveryServiceName;
    options.graceMs = m_config.discoveryGraceMs;

    BridgeLocator locator(options);
    const DiscoveryResult result = locator.discover(m_config.discoveryTimeoutMs);
    if (!result.ok) {
        *error = result.error;
        *kind = result.errorKind;
        return false;
    }

    m_bridge = result.bridges.constFirst();
    if (!m_config.bridgeId.isEmpty()) {
        bool matched = false;
        for (const BridgeDescriptor &candidate : result.bridges) {
            if (candidate.bridgeId.compare(m_config.bridgeId, Qt::CaseInsensitive) == 0) {
                m_bridge = candidate;
                matched = true;
                break;
            }
        }
        if (!matched) {
            *error = QStringLiteral("Bridge %1 not found among %2 discovered bridge(s)")
                         .arg(m_config.bridgeId)
                         .arg(result.bridges.size());
            *kind = ErrorKind::DiscoveryTimeout;
            return false;
        }
    }
    qCInfo(clientLog) << "Using discovered bridge" << m_bridge.serviceName << "at" << m_bridge.address;
    return true;
}

bool HueClient::ensureTransport()
{
    if (m_transport)
        return true;
    if (m_bridge.address.isEmpty())
        return false;

    ConnectionSettings settings;
    settings.host = m_bridge.address;
    settings.port = m_bridge.port;
    settings.useTls = m_config.useTls;
    settings.appKey = m_credential.appKey;
    settings.bridgeId = m_bridge.bridgeId.isEmpty() ? m_config.bridgeId : m_bridge.bridgeId;
    m_transport = std::make_unique<HttpClient>(m_nam, settings, m_config.requestTimeoutMs);
    return true;
}

bool HueClient::acquireCredential(const Credential &existing)
{
    if (!m_credentials) {
        PairingOptions options;
        options.applicationName = m_config.applicationName;
        options.retryIntervalMs = m_config.authRetryIntervalMs;
        options.windowMs = m_config.authWindowMs;
        options.requestTimeoutMs = m_config.requestTimeoutMs;
        m_credentials = new CredentialManager(m_transport.get(), options, this);
        connect(m_credentials, &CredentialManager::waitingForLinkButton,
                this, &HueClient::waitingForLinkButton);
    }

    const CredentialResult result = m_credentials->ensureCredential(m_bridge, existing);
    // A stop() from a nested event loop may have torn the transport down.
    if (!m_running || !m_transport)
        return false;
    if (!result.ok) {
        fail(result.errorKind, result.error);
        return false;
    }

    const bool changed = result.credential.appKey != existing.appKey;
    m_credential = result.credential;
    m_transport->setAppKey(m_credential.appKey);
    if (changed)
        emit credentialAcquired(m_credential);
    return true;
}

void HueClient::cancelPairing()
{
    if (m_credentials)
        m_credentials->cancel();
}

void HueClient::startEventStream()
{
    EventStreamConsumer::Options options;
    options.inactivityMs = m_config.streamInactivityMs;
    options.backoffInitialMs = m_config.streamBackoffInitialMs;
    options.backoffMaxMs = m_config.streamBackoffMaxMs;

    m_stream = new EventStreamConsumer(m_transport.get(), options, this);
    m_stream->setSink([this](const ChangeEventList &events) { handleChangeEvents(events); });
    connect(m_stream, &EventStreamConsumer::errorOccurred, this, &HueClient::handleStreamError);
    connect(m_stream, &EventStreamConsumer::stateChanged, this,
            [this](EventStreamConsumer::State state) {
                const bool streaming = state == EventStreamConsumer::State::Streaming;
                if (streaming && m_stream && m_stream->reconnectCount() > 0)
                    resyncAfterReconnect(QStringLiteral("stream reconnected"));
                emit connectionStateChanged(streaming);
            });

    m_cache.beginSnapshot();
    m_stream->start();
}

void HueClient::handleChangeEvents(const ChangeEventList &events)
{
    for (const ChangeEvent &event : events) {
        const ApplyResult result = m_cache.apply(event);
        // Buffered outside a snapshot load means the resource is unknown.
        if (result == ApplyResult::Buffered && !m_cache.isBuffering())
            scheduleSnapshotRefresh(QStringLiteral("update for unknown %1").arg(resourceKey(event.type, event.id)));
        if (result == ApplyResult::Applied && isTopologyChange(event))
            scheduleSnapshotRefresh(QStringLiteral("%1 %2").arg(changeKindName(event.kind), event.type));
    }
}

void HueClient::handleStreamError(ErrorKind kind, const QString &message)
{
    if (kind == ErrorKind::MalformedEvent) {
        emit errorOccurred(kind, message);
        return;
    }
    fail(kind, message);
}

bool HueClient::refreshSnapshot(QString *error)
{
    if (!m_running || !m_transport) {
        if (error)
            *error = QStringLiteral("Client is not started");
        return false;
    }

    m_snapshotInFlight = true;
    m_cache.beginSnapshot();

    ResourceList resources;
    for (const QString &type : std::as_const(m_config.snapshotResourceTypes)) {
        const HttpResult reply = m_transport->get(resourcePath(type));
        if (!m_running) {
            m_snapshotInFlight = false;
            if (error)
                *error = QStringLiteral("Client stopped during snapshot");
            return false;
        }
        QString parseError;
        if (!reply.ok || !parseResourceCollection(reply.payload, &resources, &parseError)) {
            const ErrorKind kind = reply.ok ? ErrorKind::BridgeError : reply.errorKind;
            const QString message = QStringLiteral("Snapshot of %1 failed: %2")
                                        .arg(type, reply.ok ? parseError : reply.error);
            m_snapshotInFlight = false;
            m_cache.abortSnapshot();
            if (error)
                *error = message;
            fail(kind, message);
            return false;
        }
    }

    const int count = m_cache.loadSnapshot(resources);
    m_snapshotInFlight = false;
    if (error)
        error->clear();
    emit snapshotLoaded(count);
    return true;
}

void HueClient::scheduleSnapshotRefresh(const QString &reason)
{
    if (!m_running)
        return;
    if (m_snapshotInFlight) {
        qCDebug(clientLog).noquote() << "Snapshot already in flight, ignoring" << reason;
        return;
    }
    if (m_resyncTimer.isActive()) {
        qCDebug(clientLog).noquote() << "Snapshot refresh already scheduled, ignoring" << reason;
        return;
    }
    m_pendingResyncReason = reason;
    qCInfo(clientLog).noquote() << "Scheduling snapshot refresh due to" << reason;
    m_resyncTimer.start();
}

void HueClient::performScheduledRefresh()
{
    if (!m_running)
        return;
    const QString reason = m_pendingResyncReason;
    m_pendingResyncReason.clear();
    qCInfo(clientLog).noquote() << "Running snapshot refresh due to" << reason;
    QString error;
    refreshSnapshot(&error);
}

void HueClient::resyncAfterReconnect(const QString &reason)
{
    if (!m_running)
        return;
    m_cache.beginSnapshot();
    scheduleSnapshotRefresh(reason);
}

HttpResult HueClient::request(const QByteArray &method, const QString &path, const QByteArray &body)
{
    if (!m_running || !m_transport) {
        HttpResult out;
        out.errorKind = ErrorKind::BridgeUnreachable;
        out.error = QStringLiteral("Client is not started");
        return out;
    }
    const HttpResult out = m_transport->request(method, path, body);
    if (out.errorKind == ErrorKind::Unauthorized) {
        qCWarning(clientLog) << "Bridge rejected the application key for" << path;
        emit authorizationRequired();
    }
    return out;
}

bool HueClient::reauthenticate()
{
    if (!m_running || !m_transport)
        return false;

    qCInfo(clientLog) << "Re-pairing with bridge" << m_bridge.address;
    m_transport->setAppKey(QString());
    m_credential = Credential();
    if (!acquireCredential(Credential()))
        return false;

    if (m_stream) {
        m_stream->stop();
        m_stream->start();
    }
    resyncAfterReconnect(QStringLiteral("reauthentication"));
    return true;
}

bool HueClient::syncResource(const QString &type, const QString &id, QString *error)
{
    const HttpResult reply = request(QByteArrayLiteral("GET"), resourcePath(type, id));
    if (!reply.ok) {
        if (error)
            *error = reply.error;
        return false;
    }
    ResourceList resources;
    if (!parseResourceCollection(reply.payload, &resources, error))
        return false;
    m_cache.mergeResources(resources);
    return true;
}

HttpResult HueClient::sendCommand(const QString &type, const QString &id, const QByteArray &payload)
{
    if (id.trimmed().isEmpty()) {
        HttpResult out;
        out.errorKind = ErrorKind::InvalidArgument;
        out.error = QStringLiteral("Missing %1 id").arg(type);
        return out;
    }

    const HttpResult out = request(QByteArrayLiteral("PUT"), resourcePath(type, id), payload);
    if (!out.ok) {
        qCWarning(clientLog) << "Command on" << resourceKey(type, id) << "failed:" << out.error;
        return out;
    }
    if (m_config.autoSyncAfterCommand) {
        QString error;
        if (!syncResource(type, id, &error))
            qCWarning(clientLog) << "Resync of" << resourceKey(type, id) << "failed:" << error;
    }
    return out;
}

HttpResult HueClient::setLightOn(const QString &lightId, bool on)
{
    return sendCommand(QStringLiteral("light"), lightId, buildOnPayload(on));
}

HttpResult HueClient::setLightBrightness(const QString &lightId, double brightnessPercent)
{
    return sendCommand(QStringLiteral("light"), lightId, buildBrightnessPayload(brightnessPercent));
}

HttpResult HueClient::setLightColorXy(const QString &lightId, double x, double y)
{
    return sendCommand(QStringLiteral("light"), lightId, buildColorXyPayload(x, y));
}

HttpResult HueClient::setLightColorRgb(const QString &lightId, double r01, double g01, double b01)
{
    double x = 0.0;
    double y = 0.0;
    rgbToXy(r01, g01, b01, &x, &y);
    return setLightColorXy(lightId, x, y);
}

HttpResult HueClient::setLightColorTemperature(const QString &lightId, int mirek)
{
    return sendCommand(QStringLiteral("light"), lightId, buildColorTemperaturePayload(mirek));
}

HttpResult HueClient::setGroupedLightOn(const QString &groupedLightId, bool on)
{
    return sendCommand(QStringLiteral("grouped_light"), groupedLightId, buildOnPayload(on));
}

HttpResult HueClient::recallScene(const QString &sceneId, const QString &action)
{
    QString error;
    const QByteArray payload = buildSceneRecallPayload(action, QString(), QStringLiteral("room"), &error);
    if (payload.isEmpty()) {
        HttpResult out;
        out.errorKind = ErrorKind::InvalidArgument;
        out.error = error;
        return out;
    }
    return sendCommand(QStringLiteral("scene"), sceneId, payload);
}

} // namespace huesync
