#pragma once

#include <functional>
#include <memory>

#include <QByteArray>
#include <QList>
#include <QObject>
#include <QString>

#include "hue_error.h"

struct AvahiClient;
struct AvahiServiceBrowser;
struct AvahiThreadedPoll;

namespace huesync {

struct BridgeDescriptor {
    QString address;
    int port = 443;
    // DNS-SD instance name, e.g. "hue bridge - 1a2b3c._hue._tcp.local".
    QString serviceName;
    QString hostName;
    QString bridgeId;
    QString modelId;

    bool isComplete() const { return !address.isEmpty(); }
};

struct DiscoveryResult {
    bool ok = false;
    QList<BridgeDescriptor> bridges;
    ErrorKind errorKind = ErrorKind::None;
    QString error;
};

struct DiscoveryOptions {
    QString serviceName = QStringLiteral("_hue._tcp.local");
    // Extra collection time after the first complete answer.
    int graceMs = 750;
};

// Splits "_hue._tcp.local" into the service type ("_hue._tcp") and the
// browse domain ("local"). A name without a domain browses "local".
bool splitServiceName(const QString &serviceName, QString *serviceType, QString *domain);

// Fills bridgeId and modelId from "key=value" TXT strings.
void applyTxtRecords(const QList<QByteArray> &entries, BridgeDescriptor *descriptor);

// Source of resolved DNS-SD instances for one service type. Results are
// delivered on the thread that owns the browser.
class ServiceBrowser : public QObject
{
    Q_OBJECT
public:
    explicit ServiceBrowser(QObject *parent = nullptr) : QObject(parent) {}
    ~ServiceBrowser() override = default;

    virtual bool start(const QString &serviceType, const QString &domain, QString *error) = 0;
    virtual void stop() = 0;

signals:
    void serviceResolved(const huesync::BridgeDescriptor &descriptor);
    void browseFailed(const QString &error);
};

// Browses through the system avahi daemon. Avahi runs its own poll thread;
// results are queued back to this object's thread.
class AvahiBridgeBrowser final : public ServiceBrowser
{
    Q_OBJECT
public:
    explicit AvahiBridgeBrowser(QObject *parent = nullptr);
    ~AvahiBridgeBrowser() override;

    bool start(const QString &serviceType, const QString &domain, QString *error) override;
    void stop() override;

private:
    // Safe to call from the avahi poll thread.
    void postResolved(const BridgeDescriptor &descriptor);
    void postFailure(const QString &error);

    AvahiThreadedPoll *m_poll = nullptr;
    AvahiClient *m_client = nullptr;
    AvahiServiceBrowser *m_browser = nullptr;

    friend struct AvahiCallbacks;
};

using ServiceBrowserFactory = std::function<std::unique_ptr<ServiceBrowser>()>;

// Finds bridges with a one-shot DNS-SD browse. Every call creates and
// destroys its own browser; nothing is kept between calls.
class BridgeLocator
{
public:
    explicit BridgeLocator(const DiscoveryOptions &options = DiscoveryOptions(),
                           ServiceBrowserFactory browserFactory = ServiceBrowserFactory());

    DiscoveryResult discover(int timeoutMs);

    const DiscoveryOptions &options() const { return m_options; }

private:
    DiscoveryOptions m_options;
    ServiceBrowserFactory m_browserFactory;
};

} // namespace huesync

Q_DECLARE_METATYPE(huesync::BridgeDescriptor)
