#include "hue_sse.h"

#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(streamLog)

namespace huesync {

QList<SseFrame> SseParser::feed(const QByteArray &chunk)
{
    QList<SseFrame> frames;
    m_buffer.append(chunk);

    int start = 0;
    while (true) {
        const int nl = m_buffer.indexOf('\n', start);
        if (nl < 0)
            break;
        int end = nl;
        if (end > start && m_buffer.at(end - 1) == '\r')
            --end;
        processLine(m_buffer.mid(start, end - start), &frames);
        start = nl + 1;
    }
    m_buffer.remove(0, start);
    return frames;
}

void SseParser::reset()
{
    m_buffer.clear();
    m_current = SseFrame();
    m_hasFields = false;
    m_hasData = false;
}

void SseParser::processLine(const QByteArray &line, QList<SseFrame> *frames)
{
    if (line.isEmpty()) {
        if (m_hasData)
            frames->append(m_current);
        m_current = SseFrame();
        m_hasFields = false;
        m_hasData = false;
        return;
    }

    if (line.startsWith(':')) {
        ++m_commentCount;
        return;
    }

    QByteArray field = line;
    QByteArray value;
    const int colon = line.indexOf(':');
    if (colon >= 0) {
        field = line.left(colon);
        value = line.mid(colon + 1);
        if (value.startsWith(' '))
            value.remove(0, 1);
    }

    m_hasFields = true;
    if (field == "data") {
        if (m_hasData)
            m_current.data.append('\n');
        m_current.data.append(value);
        m_hasData = true;
    } else if (field == "id") {
        m_current.id = QString::fromUtf8(value);
        m_lastEventId = m_current.id;
    } else if (field == "event") {
        m_current.event = QString::fromUtf8(value);
    }
    // "retry" and unknown fields are ignored.
}

namespace {

bool appendEnvelope(const QJsonObject &envelope, qint64 nowMs, ChangeEventList *out, QString *error)
{
    const QString type = envelope.value(QStringLiteral("type")).toString();
    if (type == QStringLiteral("error")) {
        qCWarning(streamLog).noquote() << "Bridge reported an event stream error"
                                       << envelope.value(QStringLiteral("id")).toString() << ":"
                                       << QJsonDocument(envelope.value(QStringLiteral("data")).toArray())
                                              .toJson(QJsonDocument::Compact);
        return true;
    }

    const std::optional<ChangeKind> kind = changeKindFromString(type);
    if (!kind) {
        if (error)
            *error = QStringLiteral("Unknown event type '%1'").arg(type);
        return false;
    }

    const QJsonValue dataValue = envelope.value(QStringLiteral("data"));
    if (!dataValue.isArray()) {
        if (error)
            *error = QStringLiteral("Event envelope without data array");
        return false;
    }

    const QString eventId = envelope.value(QStringLiteral("id")).toString();
    const QString creationTime = envelope.value(QStringLiteral("creationtime")).toString();

    const QJsonArray data = dataValue.toArray();
    for (const QJsonValue &value : data) {
        const QJsonObject body = value.toObject();
        const QString resourceType = body.value(QStringLiteral("type")).toString();
        const QString resourceId = body.value(QStringLiteral("id")).toString();
        if (resourceType.isEmpty() || resourceId.isEmpty()) {
            if (error)
                *error = QStringLiteral("Event entry without resource type or id");
            return false;
        }

        ChangeEvent event;
        event.kind = *kind;
        event.type = resourceType;
        event.id = resourceId;
        event.attributes = body;
        event.eventId = eventId;
        event.creationTime = creationTime;
        event.receivedAtMs = nowMs;
        out->append(event);
    }
    return true;
}

} // namespace

bool parseChangeEvents(const QByteArray &data, ChangeEventList *out, QString *error)
{
    QJsonParseError parseError {};
    const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (error)
            *error = QStringLiteral("Invalid JSON in event: %1").arg(parseError.errorString());
        return false;
    }

    const qint64 nowMs = QDateTime::currentMSecsSinceEpoch();
    ChangeEventList events;

    if (doc.isArray()) {
        const QJsonArray envelopes = doc.array();
        for (const QJsonValue &value : envelopes) {
            if (!value.isObject()) {
                if (error)
                    *error = QStringLiteral("Event envelope is not an object");
                return false;
            }
            if (!appendEnvelope(value.toObject(), nowMs, &events, error))
                return false;
        }
    } else if (doc.isObject()) {
        if (!appendEnvelope(doc.object(), nowMs, &events, error))
            return false;
    } else {
        if (error)
            *error = QStringLiteral("Event data is not a JSON array or object");
        return false;
    }

    if (out)
        out->append(events);
    if (error)
        error->clear();
    return true;
}

} // namespace huesync
