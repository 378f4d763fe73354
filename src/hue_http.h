#pragma once

#include <QByteArray>
#include <QJsonDocument>
#include <QObject>
#include <QString>

#include "hue_error.h"

class QNetworkAccessManager;
class QNetworkReply;
class QNetworkRequest;

namespace huesync {

struct ConnectionSettings {
    QString host;
    QString ip;
    int port = 0;
    bool useTls = true;
    QString appKey;
    // When set, the bridge certificate's common name must match it.
    QString bridgeId;
};

struct HttpResult {
    bool ok = false;
    int statusCode = 0;
    QByteArray payload;
    QJsonDocument document;
    ErrorKind errorKind = ErrorKind::None;
    QString error;
};

// Long-lived byte stream handle used for the bridge event stream.
class EventStream : public QObject
{
    Q_OBJECT
public:
    explicit EventStream(QObject *parent = nullptr) : QObject(parent) {}
    ~EventStream() override = default;

    // Closes the connection without emitting closed().
    virtual void abort() = 0;

signals:
    void opened();
    void dataReceived(const QByteArray &chunk);
    void closed(huesync::ErrorKind kind, const QString &error);
};

// Authenticated request/response and streaming access to one bridge.
class BridgeTransport
{
public:
    virtual ~BridgeTransport() = default;

    virtual HttpResult request(const QByteArray &method,
                               const QString &path,
                               const QByteArray &payload = QByteArray(),
                               bool includeAppKey = true,
                               int timeoutMs = 0) = 0;

    // Sends with the given application key instead of appKey(), which is
    // left untouched.
    virtual HttpResult requestWithKey(const QByteArray &method,
                                      const QString &path,
                                      const QString &appKey,
                                      const QByteArray &payload = QByteArray(),
                                      int timeoutMs = 0) = 0;

    // Returns nullptr when the stream cannot even be requested; the caller
    // owns the returned object.
    virtual EventStream *openEventStream(QObject *parent = nullptr) = 0;

    virtual QString appKey() const = 0;
    virtual void setAppKey(const QString &appKey) = 0;

    HttpResult get(const QString &path, bool includeAppKey = true, int timeoutMs = 0);
    HttpResult postJson(const QString &path, const QByteArray &payload, bool includeAppKey, int timeoutMs = 0);
    HttpResult putJson(const QString &path, const QByteArray &payload, bool includeAppKey = true, int timeoutMs = 0);
    HttpResult deleteResource(const QString &path, int timeoutMs = 0);
};

class HttpClient final : public BridgeTransport
{
public:
    HttpClient(QNetworkAccessManager *manager, const ConnectionSettings &settings, int defaultTimeoutMs = 10000);

    HttpResult request(const QByteArray &method,
                       const QString &path,
                       const QByteArray &payload = QByteArray(),
                       bool includeAppKey = true,
                       int timeoutMs = 0) override;
    HttpResult requestWithKey(const QByteArray &method,
                              const QString &path,
                              const QString &appKey,
                              const QByteArray &payload = QByteArray(),
                              int timeoutMs = 0) override;

    EventStream *openEventStream(QObject *parent = nullptr) override;

    QString appKey() const override { return m_settings.appKey; }
    void setAppKey(const QString &appKey) override { m_settings.appKey = appKey.trimmed(); }

    const ConnectionSettings &settings() const { return m_settings; }
    void setSettings(const ConnectionSettings &settings) { m_settings = settings; }

    static QString effectiveHost(const ConnectionSettings &settings);
    static ErrorKind classifyStatus(int statusCode);

private:
    HttpResult send(const QByteArray &method,
                    const QString &path,
                    const QByteArray &payload,
                    const QString &appKey,
                    int timeoutMs);
    bool buildRequest(const QString &path,
                      const QString &appKey,
                      const QByteArray &accept,
                      bool hasJsonBody,
                      QNetworkRequest *request,
                      QString *error = nullptr) const;
    void attachBridgePinning(QNetworkReply *reply) const;

    QNetworkAccessManager *m_manager = nullptr;
    ConnectionSettings m_settings;
    int m_defaultTimeoutMs = 10000;
};

class NetworkEventStream final : public EventStream
{
    Q_OBJECT
public:
    explicit NetworkEventStream(QNetworkReply *reply, QObject *parent = nullptr);
    ~NetworkEventStream() override;

    void abort() override;

private:
    void onMetaDataChanged();
    void onReadyRead();
    void onFinished();

    QNetworkReply *m_reply = nullptr;
    bool m_opened = false;
};

// Human readable description from a bridge error body (v1 or v2 layout).
QString extractBridgeError(const QByteArray &payload);

} // namespace huesync
