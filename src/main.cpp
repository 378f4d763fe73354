#include <atomic>
#include <csignal>

#include <QCoreApplication>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QTimer>

#include "hue_client.h"
#include "hue_config.h"
#include "hue_env_file.h"

Q_LOGGING_CATEGORY(monitorLog, "huesync.monitor");

namespace {

std::atomic_bool g_running{true};

void handleSignal(int)
{
    g_running.store(false);
}

bool loadConfigFile(const QString &path, huesync::ClientConfig *config, QString *error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        *error = QStringLiteral("Cannot open %1: %2").arg(path, file.errorString());
        return false;
    }
    QJsonParseError parseError {};
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        *error = QStringLiteral("Invalid JSON in %1: %2").arg(path, parseError.errorString());
        return false;
    }
    QString configError;
    *config = huesync::ClientConfig::fromJson(doc.object(), &configError);
    if (!configError.isEmpty())
        qCWarning(monitorLog).noquote() << "Config:" << configError;
    return true;
}

QString describeEvent(const huesync::ChangeEvent &event, const huesync::StateCache &cache)
{
    QString text = QStringLiteral("%1 %2").arg(huesync::changeKindName(event.kind),
                                                huesync::resourceKey(event.type, event.id));
    const std::optional<huesync::ResourceState> state = cache.get(event.type, event.id);
    if (!state)
        return text;
    if (!state->name().isEmpty())
        text += QStringLiteral(" \"%1\"").arg(state->name());
    if (const std::optional<bool> on = state->isOn())
        text += *on ? QStringLiteral(" on") : QStringLiteral(" off");
    if (const std::optional<double> brightness = state->brightness())
        text += QStringLiteral(" %1%").arg(*brightness, 0, 'f', 1);
    return text;
}

} // namespace

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("huesync-monitor"));

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    huesync::ClientConfig config;
    if (argc > 1) {
        QString error;
        if (!loadConfigFile(QString::fromLocal8Bit(argv[1]), &config, &error)) {
            qCCritical(monitorLog).noquote() << error;
            return 1;
        }
    }

    const QString envHost = qEnvironmentVariable("HUE_BRIDGE_HOST").trimmed();
    if (!envHost.isEmpty())
        config.host = envHost;

    huesync::EnvFile envFile(qEnvironmentVariable("HUE_ENV_FILE"));
    QString envError;
    if (!envFile.load(&envError))
        qCWarning(monitorLog).noquote() << envError;

    QString storedKey = qEnvironmentVariable("HUE_USER").trimmed();
    if (storedKey.isEmpty())
        storedKey = envFile.value(QStringLiteral("HUE_USER")).trimmed();
    if (!storedKey.isEmpty())
        config.appKey = storedKey;

    qCInfo(monitorLog) << "Starting; bridge"
                       << (config.host.isEmpty() ? QStringLiteral("(discover)") : config.host)
                       << "key file" << envFile.path();

    huesync::HueClient client(config);

    QObject::connect(&client, &huesync::HueClient::waitingForLinkButton, [](int remainingMs) {
        qCInfo(monitorLog) << "Press the link button on the bridge (" << remainingMs / 1000 << "s left)";
    });
    QObject::connect(&client, &huesync::HueClient::credentialAcquired,
                     [&envFile](const huesync::Credential &credential) {
                         envFile.setValue(QStringLiteral("HUE_USER"), credential.appKey);
                         if (!credential.clientKey.isEmpty())
                             envFile.setValue(QStringLiteral("HUE_CLIENT_KEY"), credential.clientKey);
                         QString error;
                         if (envFile.save(&error))
                             qCInfo(monitorLog) << "Application key saved to" << envFile.path();
                         else
                             qCWarning(monitorLog).noquote() << "Failed to save application key:" << error;
                     });
    QObject::connect(&client, &huesync::HueClient::errorOccurred,
                     [](huesync::ErrorKind kind, const QString &message) {
                         qCWarning(monitorLog).noquote() << huesync::errorKindName(kind) << message;
                     });
    QObject::connect(&client, &huesync::HueClient::connectionStateChanged, [](bool streaming) {
        qCInfo(monitorLog) << (streaming ? "Event stream connected" : "Event stream disconnected");
    });
    QObject::connect(&client, &huesync::HueClient::snapshotLoaded, [](int count) {
        qCInfo(monitorLog) << "Snapshot holds" << count << "resource(s)";
    });

    QTimer signalCheck;
    signalCheck.setInterval(250);
    QObject::connect(&signalCheck, &QTimer::timeout, &app, [&client]() {
        if (g_running.load())
            return;
        client.cancelPairing();
        client.stop();
        QCoreApplication::quit();
    });
    signalCheck.start();

    if (!client.start()) {
        qCCritical(monitorLog) << "Could not connect to the bridge";
        return g_running.load() ? 1 : 0;
    }

    const huesync::SubscriptionHandle handle = client.cache().subscribe(
        huesync::ChangePredicate(),
        [&client](const huesync::ChangeEvent &event) {
            qCInfo(monitorLog).noquote() << describeEvent(event, client.cache());
        });

    const int rc = QCoreApplication::exec();

    client.cache().unsubscribe(handle);
    client.stop();
    qCInfo(monitorLog) << "Stopped";
    return rc;
}
