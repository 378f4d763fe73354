#include "hue_discovery.h"

#include <QElapsedTimer>
#include <QEventLoop>
#include <QHash>
#include <QHostAddress>
#include <QLoggingCategory>
#include <QMetaObject>
#include <QTimer>

#include <utility>

#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-common/address.h>
#include <avahi-common/error.h>
#include <avahi-common/strlst.h>
#include <avahi-common/thread-watch.h>

Q_LOGGING_CATEGORY(discoveryLog, "huesync.discovery");

namespace huesync {

bool splitServiceName(const QString &serviceName, QString *serviceType, QString *domain)
{
    const QString name = serviceName.trimmed().toLower();
    int end = name.indexOf(QLatin1String("._tcp"));
    if (end < 0)
        end = name.indexOf(QLatin1String("._udp"));
    if (end <= 1 || !name.startsWith(QLatin1Char('_')))
        return false;
    end += 5;

    QString rest = name.mid(end);
    if (!rest.isEmpty() && !rest.startsWith(QLatin1Char('.')))
        return false;
    rest = rest.mid(1);
    if (rest.endsWith(QLatin1Char('.')))
        rest.chop(1);

    if (serviceType)
        *serviceType = name.left(end);
    if (domain)
        *domain = rest.isEmpty() ? QStringLiteral("local") : rest;
    return true;
}

void applyTxtRecords(const QList<QByteArray> &entries, BridgeDescriptor *descriptor)
{
    if (!descriptor)
        return;
    for (const QByteArray &entry : entries) {
        const int eq = entry.indexOf('=');
        if (eq <= 0)
            continue;
        const QByteArray key = entry.left(eq).toLower();
        const QString value = QString::fromUtf8(entry.mid(eq + 1)).trimmed();
        if (key == "bridgeid")
            descriptor->bridgeId = value.toLower();
        else if (key == "modelid")
            descriptor->modelId = value;
    }
}

// Avahi invokes these on its poll thread with the poll lock held.
struct AvahiCallbacks {
    static void onClient(AvahiClient *client, AvahiClientState state, void *userdata)
    {
        auto *self = static_cast<AvahiBridgeBrowser *>(userdata);
        if (state == AVAHI_CLIENT_FAILURE)
            self->postFailure(QString::fromUtf8(avahi_strerror(avahi_client_errno(client))));
    }

    static void onBrowse(AvahiServiceBrowser *browser,
                         AvahiIfIndex interface,
                         AvahiProtocol protocol,
                         AvahiBrowserEvent event,
                         const char *name,
                         const char *type,
                         const char *domain,
                         AvahiLookupResultFlags,
                         void *userdata)
    {
        auto *self = static_cast<AvahiBridgeBrowser *>(userdata);
        AvahiClient *client = avahi_service_browser_get_client(browser);
        switch (event) {
        case AVAHI_BROWSER_NEW:
            qCDebug(discoveryLog) << "Browse found" << name << "on interface" << interface;
            if (!avahi_service_resolver_new(client, interface, protocol, name, type, domain,
                                            AVAHI_PROTO_UNSPEC, static_cast<AvahiLookupFlags>(0),
                                            &AvahiCallbacks::onResolve, self)) {
                qCWarning(discoveryLog) << "Cannot resolve" << name << ":"
                                        << avahi_strerror(avahi_client_errno(client));
            }
            break;
        case AVAHI_BROWSER_FAILURE:
            self->postFailure(QString::fromUtf8(avahi_strerror(avahi_client_errno(client))));
            break;
        case AVAHI_BROWSER_REMOVE:
        case AVAHI_BROWSER_CACHE_EXHAUSTED:
        case AVAHI_BROWSER_ALL_FOR_NOW:
            break;
        }
    }

    static void onResolve(AvahiServiceResolver *resolver,
                          AvahiIfIndex,
                          AvahiProtocol,
                          AvahiResolverEvent event,
                          const char *name,
                          const char *type,
                          const char *domain,
                          const char *hostName,
                          const AvahiAddress *address,
                          uint16_t port,
                          AvahiStringList *txt,
                          AvahiLookupResultFlags,
                          void *userdata)
    {
        auto *self = static_cast<AvahiBridgeBrowser *>(userdata);
        if (event == AVAHI_RESOLVER_FOUND && address) {
            char text[AVAHI_ADDRESS_STR_MAX] = {};
            avahi_address_snprint(text, sizeof(text), address);

            BridgeDescriptor descriptor;
            descriptor.address = QString::fromLatin1(text);
            descriptor.port = port > 0 ? port : 443;
            descriptor.hostName = QString::fromUtf8(hostName).toLower();
            descriptor.serviceName = QStringLiteral("%1.%2.%3")
                                         .arg(QString::fromUtf8(name), QString::fromUtf8(type),
                                              QString::fromUtf8(domain))
                                         .toLower();

            QList<QByteArray> entries;
            for (AvahiStringList *item = txt; item; item = avahi_string_list_get_next(item)) {
                entries.append(QByteArray(reinterpret_cast<const char *>(avahi_string_list_get_text(item)),
                                          static_cast<int>(avahi_string_list_get_size(item))));
            }
            applyTxtRecords(entries, &descriptor);
            self->postResolved(descriptor);
        } else {
            qCDebug(discoveryLog) << "Resolving" << name << "failed:"
                                  << avahi_strerror(avahi_client_errno(avahi_service_resolver_get_client(resolver)));
        }
        avahi_service_resolver_free(resolver);
    }
};

AvahiBridgeBrowser::AvahiBridgeBrowser(QObject *parent)
    : ServiceBrowser(parent)
{
}

AvahiBridgeBrowser::~AvahiBridgeBrowser()
{
    stop();
}

bool AvahiBridgeBrowser::start(const QString &serviceType, const QString &domain, QString *error)
{
    stop();

    m_poll = avahi_threaded_poll_new();
    if (!m_poll) {
        if (error)
            *error = QStringLiteral("Cannot create avahi poll loop");
        return false;
    }

    int clientError = 0;
    m_client = avahi_client_new(avahi_threaded_poll_get(m_poll), static_cast<AvahiClientFlags>(0),
                                &AvahiCallbacks::onClient, this, &clientError);
    if (!m_client) {
        if (error)
            *error = QStringLiteral("Cannot connect to the avahi daemon: %1")
                         .arg(QString::fromUtf8(avahi_strerror(clientError)));
        stop();
        return false;
    }

    const QByteArray type = serviceType.toUtf8();
    const QByteArray browseDomain = domain.toUtf8();
    m_browser = avahi_service_browser_new(m_client, AVAHI_IF_UNSPEC, AVAHI_PROTO_UNSPEC,
                                          type.constData(),
                                          browseDomain.isEmpty() ? nullptr : browseDomain.constData(),
                                          static_cast<AvahiLookupFlags>(0),
                                          &AvahiCallbacks::onBrowse, this);
    if (!m_browser) {
        if (error)
            *error = QStringLiteral("Cannot browse %1: %2")
                         .arg(serviceType, QString::fromUtf8(avahi_strerror(avahi_client_errno(m_client))));
        stop();
        return false;
    }

    if (avahi_threaded_poll_start(m_poll) < 0) {
        if (error)
            *error = QStringLiteral("Cannot start avahi poll thread");
        stop();
        return false;
    }

    qCDebug(discoveryLog) << "Browsing" << serviceType << "in" << domain;
    return true;
}

void AvahiBridgeBrowser::stop()
{
    if (m_poll)
        avahi_threaded_poll_stop(m_poll);
    // Freeing the client releases the browser and any pending resolvers.
    if (m_client) {
        avahi_client_free(m_client);
        m_client = nullptr;
        m_browser = nullptr;
    }
    if (m_poll) {
        avahi_threaded_poll_free(m_poll);
        m_poll = nullptr;
    }
}

void AvahiBridgeBrowser::postResolved(const BridgeDescriptor &descriptor)
{
    QMetaObject::invokeMethod(this, [this, descriptor]() { emit serviceResolved(descriptor); },
                              Qt::QueuedConnection);
}

void AvahiBridgeBrowser::postFailure(const QString &error)
{
    QMetaObject::invokeMethod(this, [this, error]() { emit browseFailed(error); }, Qt::QueuedConnection);
}

namespace {

bool isIPv4(const QString &address)
{
    return QHostAddress(address).protocol() == QAbstractSocket::IPv4Protocol;
}

} // namespace

BridgeLocator::BridgeLocator(const DiscoveryOptions &options, ServiceBrowserFactory browserFactory)
    : m_options(options)
    , m_browserFactory(std::move(browserFactory))
{
}

DiscoveryResult BridgeLocator::discover(int timeoutMs)
{
    DiscoveryResult result;
    const int timeout = timeoutMs > 0 ? timeoutMs : 5000;

    QString serviceType;
    QString domain;
    if (!splitServiceName(m_options.serviceName, &serviceType, &domain)) {
        result.errorKind = ErrorKind::InvalidArgument;
        result.error = QStringLiteral("Invalid service name %1").arg(m_options.serviceName);
        return result;
    }

    std::unique_ptr<ServiceBrowser> browser;
    if (m_browserFactory)
        browser = m_browserFactory();
    else
        browser = std::make_unique<AvahiBridgeBrowser>();
    if (!browser) {
        result.errorKind = ErrorKind::BridgeUnreachable;
        result.error = QStringLiteral("No service browser available");
        return result;
    }

    QEventLoop loop;
    QTimer deadline;
    deadline.setSingleShot(true);
    QTimer grace;
    grace.setSingleShot(true);
    QElapsedTimer elapsed;
    elapsed.start();

    QHash<QString, int> indexByService;
    QString browseError;

    QObject::connect(&deadline, &QTimer::timeout, &loop, &QEventLoop::quit);
    QObject::connect(&grace, &QTimer::timeout, &loop, &QEventLoop::quit);
    QObject::connect(browser.get(), &ServiceBrowser::browseFailed, &loop, [&](const QString &error) {
        qCWarning(discoveryLog) << "Service browse failed:" << error;
        browseError = error;
        loop.quit();
    });
    QObject::connect(browser.get(), &ServiceBrowser::serviceResolved, &loop,
                     [&](const BridgeDescriptor &descriptor) {
        if (!descriptor.isComplete())
            return;
        const auto it = indexByService.constFind(descriptor.serviceName);
        if (it != indexByService.constEnd()) {
            // One instance resolves once per interface and protocol; IPv4 wins.
            BridgeDescriptor &known = result.bridges[it.value()];
            if (!isIPv4(known.address) && isIPv4(descriptor.address))
                known = descriptor;
            return;
        }
        indexByService.insert(descriptor.serviceName, result.bridges.size());
        result.bridges.append(descriptor);
        qCInfo(discoveryLog) << "Found bridge" << descriptor.serviceName << "at" << descriptor.address
                             << "port" << descriptor.port << "id" << descriptor.bridgeId;

        if (!grace.isActive()) {
            const qint64 remaining = qMax<qint64>(0, timeout - elapsed.elapsed());
            grace.start(static_cast<int>(qBound<qint64>(0, m_options.graceMs, remaining)));
        }
    });

    QString startError;
    if (!browser->start(serviceType, domain, &startError)) {
        result.errorKind = ErrorKind::BridgeUnreachable;
        result.error = startError;
        qCWarning(discoveryLog) << "Cannot start discovery:" << startError;
        return result;
    }

    deadline.start(timeout);
    loop.exec();
    browser->stop();

    if (result.bridges.isEmpty()) {
        if (!browseError.isEmpty()) {
            result.errorKind = ErrorKind::BridgeUnreachable;
            result.error = browseError;
        } else {
            result.errorKind = ErrorKind::DiscoveryTimeout;
            result.error = QStringLiteral("No bridge answered within %1 ms").arg(timeout);
            qCWarning(discoveryLog) << result.error;
        }
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace huesync
