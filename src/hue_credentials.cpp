#include "hue_credentials.h"

#include <QElapsedTimer>
#include <QEventLoop>
#include <QHostInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QTimer>

#include "hue_discovery.h"
#include "hue_http.h"

Q_LOGGING_CATEGORY(authLog, "huesync.auth");

namespace huesync {

namespace {

constexpr int kLinkButtonNotPressed = 101;

QString maskedKey(const QString &appKey)
{
    if (appKey.size() <= 6)
        return QStringLiteral("***");
    return appKey.left(4) + QStringLiteral("...");
}

} // namespace

CreateUserOutcome parseCreateUserResponse(const QByteArray &payload,
                                          QString *appKey,
                                          QString *clientKey,
                                          QString *error)
{
    const QJsonDocument doc = QJsonDocument::fromJson(payload);
    if (!doc.isArray()) {
        if (error)
            *error = QStringLiteral("Unexpected response from Hue bridge");
        return CreateUserOutcome::Rejected;
    }

    const QJsonArray arr = doc.array();
    for (const QJsonValue &value : arr) {
        if (!value.isObject())
            continue;
        const QJsonObject entry = value.toObject();

        const QJsonObject errObj = entry.value(QStringLiteral("error")).toObject();
        if (!errObj.isEmpty()) {
            const int type = errObj.value(QStringLiteral("type")).toInt();
            const QString description = errObj.value(QStringLiteral("description")).toString();
            if (type == kLinkButtonNotPressed) {
                if (error)
                    *error = QStringLiteral("Press the link button on the Hue bridge.");
                return CreateUserOutcome::LinkButtonNotPressed;
            }
            if (error)
                *error = description.isEmpty() ? QStringLiteral("Hue bridge rejected the request") : description;
            return CreateUserOutcome::Rejected;
        }

        const QJsonObject successObj = entry.value(QStringLiteral("success")).toObject();
        if (successObj.isEmpty())
            continue;

        const QString username = successObj.value(QStringLiteral("username")).toString().trimmed();
        if (username.isEmpty()) {
            if (error)
                *error = QStringLiteral("Hue bridge returned an empty application key");
            return CreateUserOutcome::Rejected;
        }
        if (appKey)
            *appKey = username;
        if (clientKey)
            *clientKey = successObj.value(QStringLiteral("clientkey")).toString().trimmed();
        if (error)
            error->clear();
        return CreateUserOutcome::Granted;
    }

    if (error)
        *error = QStringLiteral("Hue bridge returned no success entry");
    return CreateUserOutcome::Rejected;
}

CredentialManager::CredentialManager(BridgeTransport *transport,
                                     const PairingOptions &options,
                                     QObject *parent)
    : QObject(parent)
    , m_transport(transport)
    , m_options(options)
{
}

ErrorKind CredentialManager::validate(const Credential &credential, QString *error)
{
    if (!m_transport) {
        if (error)
            *error = QStringLiteral("No transport available");
        return ErrorKind::BridgeUnreachable;
    }

    const HttpResult reply = m_transport->requestWithKey(QByteArrayLiteral("GET"),
                                                         QStringLiteral("/clip/v2/resource/bridge"),
                                                         credential.appKey,
                                                         QByteArray(),
                                                         m_options.requestTimeoutMs);
    if (reply.ok) {
        if (error)
            error->clear();
        return ErrorKind::None;
    }
    if (error)
        *error = reply.error;
    return reply.errorKind == ErrorKind::None ? ErrorKind::BridgeError : reply.errorKind;
}

CredentialResult CredentialManager::ensureCredential(const BridgeDescriptor &bridge, const Credential &existing)
{
    m_cancelRequested = false;

    if (!m_transport) {
        CredentialResult out;
        out.errorKind = ErrorKind::BridgeUnreachable;
        out.error = QStringLiteral("No transport available");
        return out;
    }

    if (existing.isValid()) {
        QString error;
        const ErrorKind kind = validate(existing, &error);
        if (kind == ErrorKind::None) {
            qCInfo(authLog) << "Stored application key" << maskedKey(existing.appKey) << "is valid";
            CredentialResult out;
            out.ok = true;
            out.credential = existing;
            if (out.credential.bridgeAddress.isEmpty())
                out.credential.bridgeAddress = bridge.address;
            return out;
        }
        if (kind != ErrorKind::Unauthorized) {
            qCWarning(authLog) << "Could not validate application key:" << error;
            CredentialResult out;
            out.errorKind = kind;
            out.error = error;
            return out;
        }
        qCWarning(authLog) << "Stored application key was rejected by the bridge; pairing again";
    }

    return acquire(bridge);
}

QByteArray CredentialManager::createUserPayload() const
{
    QString device = m_options.deviceName.trimmed();
    if (device.isEmpty())
        device = QHostInfo::localHostName().left(19);
    if (device.isEmpty())
        device = QStringLiteral("client");

    QJsonObject payload;
    payload.insert(QStringLiteral("devicetype"),
                   QStringLiteral("%1#%2").arg(m_options.applicationName.left(20), device));
    payload.insert(QStringLiteral("generateclientkey"), true);
    return QJsonDocument(payload).toJson(QJsonDocument::Compact);
}

CredentialResult CredentialManager::acquire(const BridgeDescriptor &bridge)
{
    CredentialResult out;
    const QByteArray payload = createUserPayload();

    QElapsedTimer window;
    window.start();

    qCInfo(authLog) << "Requesting a new application key from" << bridge.address
                    << "- press the link button on the bridge";

    while (true) {
        if (m_cancelRequested) {
            out.errorKind = ErrorKind::Cancelled;
            out.error = QStringLiteral("Pairing cancelled");
            return out;
        }

        ++out.attempts;
        qCDebug(authLog) << "Create-user attempt" << out.attempts;
        const HttpResult reply = m_transport->postJson(QStringLiteral("/api"),
                                                       payload,
                                                       false,
                                                       m_options.requestTimeoutMs);

        QString lastError;
        if (reply.ok) {
            QString appKey;
            QString clientKey;
            const CreateUserOutcome outcome = parseCreateUserResponse(reply.payload, &appKey, &clientKey, &lastError);
            if (outcome == CreateUserOutcome::Granted) {
                out.ok = true;
                out.credential.appKey = appKey;
                out.credential.clientKey = clientKey;
                out.credential.bridgeAddress = bridge.address;
                qCInfo(authLog) << "Pairing successful after" << out.attempts << "attempt(s), key"
                                << maskedKey(appKey);
                return out;
            }
            if (outcome == CreateUserOutcome::Rejected) {
                out.errorKind = ErrorKind::AuthenticationRejected;
                out.error = lastError;
                qCWarning(authLog) << "Bridge rejected pairing:" << lastError;
                return out;
            }
            const qint64 remaining = qMax<qint64>(0, m_options.windowMs - window.elapsed());
            emit waitingForLinkButton(static_cast<int>(remaining));
        } else if (!isTransient(reply.errorKind)) {
            out.errorKind = reply.errorKind == ErrorKind::InvalidArgument ? ErrorKind::InvalidArgument
                                                                          : ErrorKind::AuthenticationRejected;
            out.error = reply.error;
            qCWarning(authLog) << "Bridge rejected pairing request:" << reply.error;
            return out;
        } else {
            lastError = reply.error;
            qCDebug(authLog) << "Pairing request failed, retrying:" << reply.error;
        }

        const qint64 remaining = m_options.windowMs - window.elapsed();
        if (remaining <= 0) {
            out.errorKind = ErrorKind::AuthenticationTimeout;
            out.error = QStringLiteral("Link button was not pressed within %1 s").arg(m_options.windowMs / 1000);
            if (!lastError.isEmpty() && reply.errorKind != ErrorKind::None)
                out.error += QStringLiteral(" (last error: %1)").arg(lastError);
            qCWarning(authLog) << out.error;
            return out;
        }

        const int delay = static_cast<int>(qMin<qint64>(m_options.retryIntervalMs, remaining));
        if (!waitBeforeRetry(delay)) {
            out.errorKind = ErrorKind::Cancelled;
            out.error = QStringLiteral("Pairing cancelled");
            qCInfo(authLog) << "Pairing cancelled after" << out.attempts << "attempt(s)";
            return out;
        }
    }
}

bool CredentialManager::waitBeforeRetry(int delayMs)
{
    QEventLoop loop;
    m_waitLoop = &loop;
    QTimer::singleShot(delayMs, &loop, &QEventLoop::quit);
    loop.exec();
    m_waitLoop.clear();
    return !m_cancelRequested;
}

void CredentialManager::cancel()
{
    m_cancelRequested = true;
    if (m_waitLoop)
        m_waitLoop->quit();
}

} // namespace huesync
