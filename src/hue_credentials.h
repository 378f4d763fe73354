#pragma once

#include <QMetaType>
#include <QObject>
#include <QPointer>
#include <QString>

#include "hue_error.h"

class QEventLoop;

namespace huesync {

class BridgeTransport;
struct BridgeDescriptor;

struct Credential {
    QString appKey;
    QString clientKey;
    QString bridgeAddress;

    bool isValid() const { return !appKey.trimmed().isEmpty(); }
};

struct CredentialResult {
    bool ok = false;
    Credential credential;
    ErrorKind errorKind = ErrorKind::None;
    QString error;
    // Number of create-user requests sent to the bridge.
    int attempts = 0;
};

struct PairingOptions {
    QString applicationName = QStringLiteral("huesync");
    QString deviceName;
    int retryIntervalMs = 1000;
    int windowMs = 30000;
    int requestTimeoutMs = 5000;
};

// Validates an existing application key or runs the link button pairing
// handshake. The caller persists whatever credential comes back.
class CredentialManager : public QObject
{
    Q_OBJECT
public:
    explicit CredentialManager(BridgeTransport *transport,
                               const PairingOptions &options = PairingOptions(),
                               QObject *parent = nullptr);

    CredentialResult ensureCredential(const BridgeDescriptor &bridge,
                                      const Credential &existing = Credential());

    // Lightweight authenticated check: None, Unauthorized or a transport error.
    ErrorKind validate(const Credential &credential, QString *error = nullptr);

    bool isWaiting() const { return !m_waitLoop.isNull(); }

public slots:
    // Ends an in-progress pairing wait with ErrorKind::Cancelled.
    void cancel();

signals:
    void waitingForLinkButton(int remainingMs);

private:
    CredentialResult acquire(const BridgeDescriptor &bridge);
    bool waitBeforeRetry(int delayMs);
    QByteArray createUserPayload() const;

    BridgeTransport *m_transport = nullptr;
    PairingOptions m_options;
    QPointer<QEventLoop> m_waitLoop;
    bool m_cancelRequested = false;
};

enum class CreateUserOutcome {
    Granted,
    LinkButtonNotPressed,
    Rejected
};

// Parses the v1 style create-user reply ([{"success": ...}] / [{"error": ...}]).
CreateUserOutcome parseCreateUserResponse(const QByteArray &payload,
                                          QString *appKey,
                                          QString *clientKey,
                                          QString *error);

} // namespace huesync

Q_DECLARE_METATYPE(huesync::Credential)
