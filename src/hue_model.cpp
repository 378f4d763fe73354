#include "hue_model.h"

#include <algorithm>
#include <cmath>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonValue>

namespace huesync {

QString changeKindName(ChangeKind kind)
{
    switch (kind) {
    case ChangeKind::Add:
        return QStringLiteral("add");
    case ChangeKind::Update:
        return QStringLiteral("update");
    case ChangeKind::Delete:
        return QStringLiteral("delete");
    }
    return QString();
}

std::optional<ChangeKind> changeKindFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("add"))
        return ChangeKind::Add;
    if (normalized == QLatin1String("update"))
        return ChangeKind::Update;
    if (normalized == QLatin1String("delete"))
        return ChangeKind::Delete;
    return std::nullopt;
}

QString ResourceState::name() const
{
    return attributes.value(QStringLiteral("metadata")).toObject()
        .value(QStringLiteral("name")).toString();
}

std::optional<bool> ResourceState::isOn() const
{
    const QJsonObject onObj = attributes.value(QStringLiteral("on")).toObject();
    if (!onObj.contains(QStringLiteral("on")))
        return std::nullopt;
    return onObj.value(QStringLiteral("on")).toBool();
}

std::optional<double> ResourceState::brightness() const
{
    const QJsonObject dimObj = attributes.value(QStringLiteral("dimming")).toObject();
    if (!dimObj.contains(QStringLiteral("brightness")))
        return std::nullopt;
    return std::clamp(dimObj.value(QStringLiteral("brightness")).toDouble(), 0.0, 100.0);
}

std::optional<int> ResourceState::colorTemperatureMirek() const
{
    const QJsonObject ctObj = attributes.value(QStringLiteral("color_temperature")).toObject();
    const QJsonValue mirek = ctObj.value(QStringLiteral("mirek"));
    if (!mirek.isDouble())
        return std::nullopt;
    return mirek.toInt();
}

QString ResourceState::ownerId() const
{
    return attributes.value(QStringLiteral("owner")).toObject()
        .value(QStringLiteral("rid")).toString();
}

QString resourceKey(const QString &type, const QString &id)
{
    return type + QLatin1Char('/') + id;
}

bool resourceFromJson(const QJsonObject &obj, ResourceState *out, QString *error)
{
    const QString type = obj.value(QStringLiteral("type")).toString().trimmed();
    const QString id = obj.value(QStringLiteral("id")).toString().trimmed();
    if (type.isEmpty() || id.isEmpty()) {
        if (error)
            *error = QStringLiteral("Resource entry lacks type or id");
        return false;
    }

    if (out) {
        out->type = type;
        out->id = id;
        out->attributes = obj;
        out->version = 0;
    }
    if (error)
        error->clear();
    return true;
}

bool parseResourceCollection(const QByteArray &payload, ResourceList *out, QString *error)
{
    QJsonParseError parseError {};
    const QJsonDocument doc = QJsonDocument::fromJson(payload, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error)
            *error = QStringLiteral("Resource response is not a JSON object");
        return false;
    }

    const QJsonObject root = doc.object();
    const QJsonArray errors = root.value(QStringLiteral("errors")).toArray();
    const QJsonValue data = root.value(QStringLiteral("data"));
    if (!data.isArray()) {
        if (error) {
            const QString description = errors.isEmpty()
                ? QString()
                : errors.first().toObject().value(QStringLiteral("description")).toString();
            *error = description.isEmpty() ? QStringLiteral("Resource response has no data array") : description;
        }
        return false;
    }

    ResourceList resources;
    for (const QJsonValue &value : data.toArray()) {
        if (!value.isObject())
            continue;
        ResourceState state;
        if (resourceFromJson(value.toObject(), &state))
            resources.append(state);
    }

    if (out)
        *out = resources;
    if (error)
        error->clear();
    return true;
}

void mergeAttributes(QJsonObject &target, const QJsonObject &delta)
{
    for (auto it = delta.begin(); it != delta.end(); ++it) {
        const QJsonValue incoming = it.value();
        const QJsonValue existing = target.value(it.key());
        if (incoming.isObject() && existing.isObject()) {
            QJsonObject nested = existing.toObject();
            mergeAttributes(nested, incoming.toObject());
            target.insert(it.key(), nested);
        } else {
            target.insert(it.key(), incoming);
        }
    }
}

QByteArray buildOnPayload(bool on)
{
    QJsonObject onObj;
    onObj.insert(QStringLiteral("on"), on);
    QJsonObject body;
    body.insert(QStringLiteral("on"), onObj);
    return QJsonDocument(body).toJson(QJsonDocument::Compact);
}

QByteArray buildBrightnessPayload(double brightnessPercent)
{
    const double brightness = std::clamp(brightnessPercent, 0.0, 100.0);
    QJsonObject body;

    QJsonObject onObj;
    onObj.insert(QStringLiteral("on"), brightness > 0.0);
    body.insert(QStringLiteral("on"), onObj);

    QJsonObject dimObj;
    dimObj.insert(QStringLiteral("brightness"), brightness);
    body.insert(QStringLiteral("dimming"), dimObj);
    return QJsonDocument(body).toJson(QJsonDocument::Compact);
}

QByteArray buildColorXyPayload(double x, double y)
{
    QJsonObject xyObj;
    xyObj.insert(QStringLiteral("x"), std::clamp(x, 0.0, 1.0));
    xyObj.insert(QStringLiteral("y"), std::clamp(y, 0.0, 1.0));

    QJsonObject colorObj;
    colorObj.insert(QStringLiteral("xy"), xyObj);

    QJsonObject body;
    body.insert(QStringLiteral("color"), colorObj);
    return QJsonDocument(body).toJson(QJsonDocument::Compact);
}

QByteArray buildColorTemperaturePayload(int mirek)
{
    // Hue accepts 153..500 mirek; the bridge clamps per light beyond that.
    QJsonObject ctObj;
    ctObj.insert(QStringLiteral("mirek"), std::clamp(mirek, 153, 500));
    QJsonObject body;
    body.insert(QStringLiteral("color_temperature"), ctObj);
    return QJsonDocument(body).toJson(QJsonDocument::Compact);
}

QByteArray buildSceneRecallPayload(const QString &action,
                                   const QString &targetId,
                                   const QString &targetType,
                                   QString *error)
{
    const QString normalized = action.trimmed().toLower();
    QString recallAction;
    if (normalized.isEmpty() || normalized == QLatin1String("activate") || normalized == QLatin1String("active"))
        recallAction = QStringLiteral("active");
    else if (normalized == QLatin1String("deactivate") || normalized == QLatin1String("inactive"))
        recallAction = QStringLiteral("inactive");
    else if (normalized == QLatin1String("dynamic") || normalized == QLatin1String("dynamic_palette"))
        recallAction = QStringLiteral("dynamic_palette");

    if (recallAction.isEmpty()) {
        if (error)
            *error = QStringLiteral("Unsupported scene action %1").arg(action);
        return QByteArray();
    }

    QJsonObject recall;
    recall.insert(QStringLiteral("action"), recallAction);

    const QString trimmedTarget = targetId.trimmed();
    if (!trimmedTarget.isEmpty()) {
        QJsonObject target;
        target.insert(QStringLiteral("rid"), trimmedTarget);
        target.insert(QStringLiteral("rtype"), targetType);
        recall.insert(QStringLiteral("target"), target);
    }

    QJsonObject body;
    body.insert(QStringLiteral("recall"), recall);

    if (error)
        error->clear();
    return QJsonDocument(body).toJson(QJsonDocument::Compact);
}

void rgbToXy(double r01, double g01, double b01, double *x, double *y)
{
    auto gamma = [](double value) {
        if (value <= 0.04045)
            return value / 12.92;
        return std::pow((value + 0.055) / 1.055, 2.4);
    };

    const double r = gamma(std::clamp(r01, 0.0, 1.0));
    const double g = gamma(std::clamp(g01, 0.0, 1.0));
    const double b = gamma(std::clamp(b01, 0.0, 1.0));

    // Wide gamut D65 conversion.
    const double X = r * 0.664511 + g * 0.154324 + b * 0.162028;
    const double Y = r * 0.283881 + g * 0.668433 + b * 0.047685;
    const double Z = r * 0.000088 + g * 0.072310 + b * 0.986039;

    const double sum = X + Y + Z;
    if (sum <= 0.0) {
        *x = 0.0;
        *y = 0.0;
        return;
    }

    *x = std::clamp(X / sum, 0.0, 1.0);
    *y = std::clamp(Y / sum, 0.0, 1.0);
}

} // namespace huesync
