#include "hue_http.h"

#include <QEventLoop>
#include <QJsonArray>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QPointer>
#include <QTimer>
#include <QUrl>
#if QT_CONFIG(ssl)
#include <QSslCertificate>
#include <QSslConfiguration>
#include <QSslSocket>
#endif

Q_LOGGING_CATEGORY(httpLog, "huesync.http");

namespace huesync {

namespace {

QByteArray userAgent()
{
    return QByteArrayLiteral("huesync/1.0");
}

QString payloadSnippet(const QByteArray &payload)
{
    QString snippet = QString::fromUtf8(payload.left(256));
    if (payload.size() > 256)
        snippet.append(QStringLiteral(" ..."));
    return snippet;
}

} // namespace

HttpResult BridgeTransport::get(const QString &path, bool includeAppKey, int timeoutMs)
{
    return request(QByteArrayLiteral("GET"), path, QByteArray(), includeAppKey, timeoutMs);
}

HttpResult BridgeTransport::postJson(const QString &path, const QByteArray &payload, bool includeAppKey, int timeoutMs)
{
    return request(QByteArrayLiteral("POST"), path, payload, includeAppKey, timeoutMs);
}

HttpResult BridgeTransport::putJson(const QString &path, const QByteArray &payload, bool includeAppKey, int timeoutMs)
{
    return request(QByteArrayLiteral("PUT"), path, payload, includeAppKey, timeoutMs);
}

HttpResult BridgeTransport::deleteResource(const QString &path, int timeoutMs)
{
    return request(QByteArrayLiteral("DELETE"), path, QByteArray(), true, timeoutMs);
}

HttpClient::HttpClient(QNetworkAccessManager *manager, const ConnectionSettings &settings, int defaultTimeoutMs)
    : m_manager(manager)
    , m_settings(settings)
    , m_defaultTimeoutMs(defaultTimeoutMs > 0 ? defaultTimeoutMs : 10000)
{
}

QString HttpClient::effectiveHost(const ConnectionSettings &settings)
{
    const QString host = settings.host.trimmed();
    if (!host.isEmpty())
        return host;
    return settings.ip.trimmed();
}

ErrorKind HttpClient::classifyStatus(int statusCode)
{
    if (statusCode >= 200 && statusCode < 300)
        return ErrorKind::None;
    if (statusCode == 401 || statusCode == 403)
        return ErrorKind::Unauthorized;
    if (statusCode <= 0)
        return ErrorKind::BridgeUnreachable;
    return ErrorKind::BridgeError;
}

bool HttpClient::buildRequest(const QString &path,
                              const QString &appKey,
                              const QByteArray &accept,
                              bool hasJsonBody,
                              QNetworkRequest *request,
                              QString *error) const
{
    if (!request) {
        if (error)
            *error = QStringLiteral("Request object is null");
        return false;
    }

    const QString host = effectiveHost(m_settings);
    if (host.isEmpty()) {
        if (error)
            *error = QStringLiteral("Bridge host is empty");
        return false;
    }

    const bool useTls = m_settings.useTls;
    const int defaultPort = useTls ? 443 : 80;
    const int port = m_settings.port > 0 ? m_settings.port : defaultPort;

    QUrl url;
    url.setScheme(useTls ? QStringLiteral("https") : QStringLiteral("http"));
    url.setHost(host);
    url.setPort(port);
    if (path.startsWith(QLatin1Char('/')))
        url.setPath(path);
    else
        url.setPath(QStringLiteral("/") + path);

    QNetworkRequest out(url);
    out.setRawHeader("Accept", accept);
    out.setRawHeader("User-Agent", userAgent());
    if (hasJsonBody)
        out.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    if (!appKey.isEmpty())
        out.setRawHeader("hue-application-key", appKey.toUtf8());

#if QT_CONFIG(ssl)
    if (useTls) {
        // Bridges present a self-signed certificate; identity is checked
        // against the bridge id once the handshake completes.
        QSslConfiguration ssl = QSslConfiguration::defaultConfiguration();
        ssl.setPeerVerifyMode(QSslSocket::VerifyNone);
        out.setSslConfiguration(ssl);
    }
#endif

    *request = out;
    if (error)
        error->clear();
    return true;
}

void HttpClient::attachBridgePinning(QNetworkReply *reply) const
{
#if QT_CONFIG(ssl)
    const QString expected = m_settings.bridgeId.trimmed().toLower();
    if (!reply || !m_settings.useTls || expected.isEmpty())
        return;

    QObject::connect(reply, &QNetworkReply::encrypted, reply, [reply, expected]() {
        const QSslCertificate peer = reply->sslConfiguration().peerCertificate();
        const QStringList names = peer.subjectInfo(QSslCertificate::CommonName);
        for (const QString &name : names) {
            if (name.trimmed().toLower() == expected)
                return;
        }
        qCWarning(httpLog) << "Bridge certificate" << names << "does not match bridge id" << expected;
        reply->setProperty("huesyncPinMismatch", true);
        reply->abort();
    });
#else
    Q_UNUSED(reply);
#endif
}

HttpResult HttpClient::request(const QByteArray &method,
                               const QString &path,
                               const QByteArray &payload,
                               bool includeAppKey,
                               int timeoutMs)
{
    return send(method, path, payload, includeAppKey ? m_settings.appKey : QString(), timeoutMs);
}

HttpResult HttpClient::requestWithKey(const QByteArray &method,
                                      const QString &path,
                                      const QString &appKey,
                                      const QByteArray &payload,
                                      int timeoutMs)
{
    return send(method, path, payload, appKey.trimmed(), timeoutMs);
}

HttpResult HttpClient::send(const QByteArray &method,
                            const QString &path,
                            const QByteArray &payload,
                            const QString &appKey,
                            int timeoutMs)
{
    HttpResult result;

    if (!m_manager) {
        result.errorKind = ErrorKind::BridgeUnreachable;
        result.error = QStringLiteral("Network manager unavailable");
        return result;
    }

    QNetworkRequest requestObj;
    if (!buildRequest(path,
                      appKey,
                      QByteArrayLiteral("application/json"),
                      !payload.isEmpty(),
                      &requestObj,
                      &result.error)) {
        result.errorKind = ErrorKind::InvalidArgument;
        return result;
    }

    QNetworkReply *reply = nullptr;
    if (method == QByteArrayLiteral("GET")) {
        reply = m_manager->get(requestObj);
    } else if (method == QByteArrayLiteral("POST")) {
        reply = m_manager->post(requestObj, payload);
    } else if (method == QByteArrayLiteral("PUT")) {
        reply = m_manager->put(requestObj, payload);
    } else {
        reply = m_manager->sendCustomRequest(requestObj, method, payload);
    }

    if (!reply) {
        result.errorKind = ErrorKind::BridgeUnreachable;
        result.error = QStringLiteral("Failed to create network request");
        return result;
    }
    attachBridgePinning(reply);

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    bool timedOut = false;

    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        loop.quit();
    });

    timer.start(timeoutMs > 0 ? timeoutMs : m_defaultTimeoutMs);
    loop.exec();

    if (timedOut) {
        reply->abort();
        reply->deleteLater();
        result.errorKind = ErrorKind::BridgeUnreachable;
        result.error = QStringLiteral("Request timed out");
        qCWarning(httpLog) << method << path << "timed out";
        return result;
    }

    result.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    result.payload = reply->readAll();
    const bool pinMismatch = reply->property("huesyncPinMismatch").toBool();

    if (pinMismatch) {
        result.errorKind = ErrorKind::BridgeUnreachable;
        result.error = QStringLiteral("Bridge certificate does not match bridge id");
    } else if (reply->error() != QNetworkReply::NoError && result.statusCode <= 0) {
        result.errorKind = ErrorKind::BridgeUnreachable;
        result.error = reply->errorString();
    } else {
        result.errorKind = classifyStatus(result.statusCode);
        if (result.errorKind == ErrorKind::None) {
            result.ok = true;
            if (!result.payload.isEmpty())
                result.document = QJsonDocument::fromJson(result.payload);
        } else {
            const QString bridgeError = extractBridgeError(result.payload);
            result.error = bridgeError.isEmpty()
                ? QStringLiteral("HTTP %1").arg(result.statusCode)
                : QStringLiteral("HTTP %1: %2").arg(result.statusCode).arg(bridgeError);
        }
    }

    if (!result.ok) {
        qCWarning(httpLog) << "Bridge request failed:" << method << path
                           << "status:" << result.statusCode
                           << "kind:" << errorKindName(result.errorKind)
                           << "error:" << result.error;
        if (!result.payload.isEmpty())
            qCDebug(httpLog).noquote() << "Bridge response payload:" << payloadSnippet(result.payload);
    }

    reply->deleteLater();
    return result;
}

EventStream *HttpClient::openEventStream(QObject *parent)
{
    if (!m_manager)
        return nullptr;

    QNetworkRequest req;
    QString error;
    if (!buildRequest(QStringLiteral("/eventstream/clip/v2"),
                      m_settings.appKey,
                      QByteArrayLiteral("text/event-stream"),
                      false,
                      &req,
                      &error)) {
        qCWarning(httpLog) << "Cannot open event stream:" << error;
        return nullptr;
    }
    if (m_settings.appKey.isEmpty()) {
        qCWarning(httpLog) << "Cannot open event stream: application key is empty";
        return nullptr;
    }

    // The stream stays open indefinitely; inactivity is policed by the consumer.
    req.setTransferTimeout(0);
    req.setAttribute(QNetworkRequest::Http2AllowedAttribute, false);
    req.setAttribute(QNetworkRequest::CacheLoadControlAttribute, QNetworkRequest::AlwaysNetwork);

    qCDebug(httpLog) << "Opening event stream" << req.url().toString();
    QNetworkReply *reply = m_manager->get(req);
    if (!reply)
        return nullptr;
    attachBridgePinning(reply);
    return new NetworkEventStream(reply, parent);
}

NetworkEventStream::NetworkEventStream(QNetworkReply *reply, QObject *parent)
    : EventStream(parent)
    , m_reply(reply)
{
    if (!m_reply)
        return;
    m_reply->setParent(this);
    connect(m_reply, &QNetworkReply::metaDataChanged, this, &NetworkEventStream::onMetaDataChanged);
    connect(m_reply, &QNetworkReply::readyRead, this, &NetworkEventStream::onReadyRead);
    connect(m_reply, &QNetworkReply::finished, this, &NetworkEventStream::onFinished);
}

NetworkEventStream::~NetworkEventStream()
{
    abort();
}

void NetworkEventStream::abort()
{
    if (!m_reply)
        return;
    disconnect(m_reply, nullptr, this, nullptr);
    m_reply->abort();
    m_reply->deleteLater();
    m_reply = nullptr;
}

void NetworkEventStream::onMetaDataChanged()
{
    if (!m_reply || m_opened)
        return;
    const int status = m_reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (status >= 200 && status < 300) {
        m_opened = true;
        emit opened();
    }
}

void NetworkEventStream::onReadyRead()
{
    if (!m_reply)
        return;
    const int status = m_reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (status >= 300)
        return;

    const QByteArray chunk = m_reply->readAll();
    if (chunk.isEmpty())
        return;
    if (!m_opened) {
        m_opened = true;
        emit opened();
    }
    emit dataReceived(chunk);
}

void NetworkEventStream::onFinished()
{
    if (!m_reply)
        return;

    QNetworkReply *reply = m_reply;
    m_reply = nullptr;
    disconnect(reply, nullptr, this, nullptr);

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    ErrorKind kind = ErrorKind::StreamDisconnected;
    QString error;
    if (reply->property("huesyncPinMismatch").toBool()) {
        kind = ErrorKind::BridgeUnreachable;
        error = QStringLiteral("Bridge certificate does not match bridge id");
    } else if (status == 401 || status == 403) {
        kind = ErrorKind::Unauthorized;
        error = QStringLiteral("Event stream rejected the application key (HTTP %1)").arg(status);
    } else if (status >= 300) {
        kind = ErrorKind::BridgeError;
        error = QStringLiteral("Event stream HTTP %1").arg(status);
    } else if (reply->error() != QNetworkReply::NoError) {
        error = reply->errorString();
    } else {
        error = QStringLiteral("Event stream closed by bridge");
    }

    reply->deleteLater();
    emit closed(kind, error);
}

QString extractBridgeError(const QByteArray &payload)
{
    const QJsonDocument doc = QJsonDocument::fromJson(payload);
    if (doc.isObject()) {
        const QJsonArray errors = doc.object().value(QStringLiteral("errors")).toArray();
        for (const QJsonValue &value : errors) {
            const QString description = value.toObject().value(QStringLiteral("description")).toString();
            if (!description.isEmpty())
                return description;
        }
        return QString();
    }

    if (doc.isArray()) {
        const QJsonArray arr = doc.array();
        for (const QJsonValue &value : arr) {
            const QJsonObject errObj = value.toObject().value(QStringLiteral("error")).toObject();
            const QString description = errObj.value(QStringLiteral("description")).toString();
            if (!description.isEmpty())
                return description;
        }
    }

    return QString();
}

} // namespace huesync
