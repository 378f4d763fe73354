#pragma once

#include <QByteArray>
#include <QList>
#include <QString>

#include "hue_model.h"

namespace huesync {

struct SseFrame {
    QString id;
    QString event;
    QByteArray data;
};

// Incremental text/event-stream decoder. Lines end in "\n" or "\r\n"; a blank
// line completes a frame. Partial lines are held until the next feed().
class SseParser
{
public:
    QList<SseFrame> feed(const QByteArray &chunk);
    void reset();

    // Comment lines seen so far (":" prefixed, bridges send them as keep-alives).
    int commentCount() const { return m_commentCount; }
    QString lastEventId() const { return m_lastEventId; }
    bool hasPartialFrame() const { return !m_buffer.isEmpty() || m_hasFields; }

private:
    void processLine(const QByteArray &line, QList<SseFrame> *frames);

    QByteArray m_buffer;
    SseFrame m_current;
    bool m_hasFields = false;
    bool m_hasData = false;
    int m_commentCount = 0;
    QString m_lastEventId;
};

// Turns one frame's data into change events: one per entry of every
// envelope's "data" array. Envelopes of type "error" are skipped. Returns
// false (with *error set) when the data is not an event envelope.
bool parseChangeEvents(const QByteArray &data, ChangeEventList *out, QString *error = nullptr);

} // namespace huesync
