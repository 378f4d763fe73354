#pragma once

#include <optional>

#include <QByteArray>
#include <QJsonObject>
#include <QList>
#include <QMetaType>
#include <QString>

namespace huesync {

enum class ChangeKind {
    Add,
    Update,
    Delete
};

QString changeKindName(ChangeKind kind);
std::optional<ChangeKind> changeKindFromString(const QString &value);

// One addressable bridge resource (CLIP v2 body). Identity is (type, id).
struct ResourceState {
    QString type;
    QString id;
    QJsonObject attributes;
    quint64 version = 0;

    bool isValid() const { return !type.isEmpty() && !id.isEmpty(); }

    QString name() const;
    std::optional<bool> isOn() const;
    std::optional<double> brightness() const;
    std::optional<int> colorTemperatureMirek() const;
    QString ownerId() const;
};

struct ChangeEvent {
    ChangeKind kind = ChangeKind::Update;
    QString type;
    QString id;
    // Changed attributes for updates, the full body for adds.
    QJsonObject attributes;
    QString eventId;
    QString creationTime;
    qint64 receivedAtMs = 0;
};

using ResourceList = QList<ResourceState>;
using ChangeEventList = QList<ChangeEvent>;

QString resourceKey(const QString &type, const QString &id);

bool resourceFromJson(const QJsonObject &obj, ResourceState *out, QString *error = nullptr);

// Parses a REST collection body ({"errors": [...], "data": [...]}).
bool parseResourceCollection(const QByteArray &payload, ResourceList *out, QString *error = nullptr);

// Recursively merges delta into target: nested objects merge, every other
// value replaces.
void mergeAttributes(QJsonObject &target, const QJsonObject &delta);

QByteArray buildOnPayload(bool on);
QByteArray buildBrightnessPayload(double brightnessPercent);
QByteArray buildColorXyPayload(double x, double y);
QByteArray buildColorTemperaturePayload(int mirek);
QByteArray buildSceneRecallPayload(const QString &action,
                                   const QString &targetId = QString(),
                                   const QString &targetType = QStringLiteral("room"),
                                   QString *error = nullptr);

void rgbToXy(double r01, double g01, double b01, double *x, double *y);

} // namespace huesync

Q_DECLARE_METATYPE(huesync::ChangeEvent)
Q_DECLARE_METATYPE(huesync::ResourceState)
