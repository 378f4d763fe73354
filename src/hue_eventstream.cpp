#include "hue_eventstream.h"

#include <QLoggingCategory>

#include "hue_http.h"

Q_LOGGING_CATEGORY(streamLog, "huesync.stream");

namespace huesync {

namespace {

QString truncatedPayload(const QByteArray &data)
{
    QString payload = QString::fromUtf8(data);
    if (payload.size() > 512) {
        payload.truncate(512);
        payload.append(QStringLiteral(" ..."));
    }
    return payload;
}

} // namespace

QString streamStateName(EventStreamConsumer::State state)
{
    switch (state) {
    case EventStreamConsumer::State::Disconnected:
        return QStringLiteral("disconnected");
    case EventStreamConsumer::State::Connecting:
        return QStringLiteral("connecting");
    case EventStreamConsumer::State::Streaming:
        return QStringLiteral("streaming");
    case EventStreamConsumer::State::Stopped:
        return QStringLiteral("stopped");
    }
    return QString();
}

EventStreamConsumer::EventStreamConsumer(BridgeTransport *transport, const Options &options, QObject *parent)
    : QObject(parent)
    , m_transport(transport)
    , m_options(options)
{
    m_options.backoffInitialMs = qMax(1, m_options.backoffInitialMs);
    m_options.backoffMaxMs = qMax(m_options.backoffInitialMs, m_options.backoffMaxMs);
    m_backoffMs = m_options.backoffInitialMs;

    m_inactivityTimer.setSingleShot(true);
    m_inactivityTimer.setInterval(qMax(1, m_options.inactivityMs));
    connect(&m_inactivityTimer, &QTimer::timeout, this, &EventStreamConsumer::onInactivity);

    m_reconnectTimer.setSingleShot(true);
    connect(&m_reconnectTimer, &QTimer::timeout, this, &EventStreamConsumer::onReconnectTimer);
}

EventStreamConsumer::~EventStreamConsumer()
{
    m_sink = nullptr;
    dropStream();
}

void EventStreamConsumer::start()
{
    if (m_running)
        return;
    if (!m_transport) {
        qCWarning(streamLog) << "Cannot start event stream without a transport";
        emit errorOccurred(ErrorKind::BridgeUnreachable, QStringLiteral("No transport available"));
        return;
    }

    m_running = true;
    m_backoffMs = m_options.backoffInitialMs;
    connectStream();
}

void EventStreamConsumer::stop()
{
    m_reconnectTimer.stop();
    m_inactivityTimer.stop();
    dropStream();
    if (m_state == State::Stopped)
        return;
    m_running = false;
    qCInfo(streamLog) << "Event stream stopped after" << m_reconnectCount << "reconnect(s)";
    setState(State::Stopped);
}

void EventStreamConsumer::connectStream()
{
    if (!m_running)
        return;

    dropStream();
    m_parser.reset();
    m_receivedData = false;
    setState(State::Connecting);

    EventStream *stream = m_transport->openEventStream(this);
    if (!stream) {
        qCWarning(streamLog) << "Could not open event stream";
        setState(State::Disconnected);
        scheduleReconnect();
        return;
    }

    m_stream = stream;
    connect(stream, &EventStream::opened, this, &EventStreamConsumer::onOpened);
    connect(stream, &EventStream::dataReceived, this, &EventStreamConsumer::onData);
    connect(stream, &EventStream::closed, this, &EventStreamConsumer::onClosed);
    m_inactivityTimer.start();
    qCDebug(streamLog) << "Connecting event stream";
}

void EventStreamConsumer::onOpened()
{
    if (!m_running)
        return;
    m_inactivityTimer.start();
    if (m_state != State::Streaming) {
        qCInfo(streamLog) << "Event stream is active";
        setState(State::Streaming);
    }
}

void EventStreamConsumer::onData(const QByteArray &chunk)
{
    if (!m_running)
        return;

    m_inactivityTimer.start();
    if (!m_receivedData) {
        m_receivedData = true;
        m_backoffMs = m_options.backoffInitialMs;
    }
    if (m_state != State::Streaming)
        setState(State::Streaming);

    ChangeEventList batch;
    const QList<SseFrame> frames = m_parser.feed(chunk);
    for (const SseFrame &frame : frames) {
        QString error;
        ChangeEventList events;
        if (!parseChangeEvents(frame.data, &events, &error)) {
            qCWarning(streamLog).noquote() << "Skipping malformed event frame" << frame.id << ":" << error
                                           << truncatedPayload(frame.data);
            QPointer<EventStreamConsumer> guard(this);
            emit errorOccurred(ErrorKind::MalformedEvent, error);
            if (!guard || !m_running)
                return;
            continue;
        }
        qCDebug(streamLog).noquote() << "Frame" << frame.id << "carried" << events.size() << "event(s)";
        batch.append(events);
    }

    if (batch.isEmpty())
        return;

    QPointer<EventStreamConsumer> guard(this);
    if (m_sink)
        m_sink(batch);
    if (!guard || !m_running)
        return;
    emit changeEvents(batch);
}

void EventStreamConsumer::onClosed(ErrorKind kind, const QString &error)
{
    if (m_stream) {
        m_stream->disconnect(this);
        m_stream->deleteLater();
        m_stream.clear();
    }
    m_inactivityTimer.stop();
    if (!m_running)
        return;

    if (kind == ErrorKind::Unauthorized) {
        qCWarning(streamLog) << "Event stream rejected the application key:" << error;
        QPointer<EventStreamConsumer> guard(this);
        emit errorOccurred(ErrorKind::Unauthorized, error);
        if (!guard || !m_running)
            return;
    } else {
        qCWarning(streamLog) << "Event stream closed (" << errorKindName(kind) << "):" << error;
    }

    setState(State::Disconnected);
    scheduleReconnect();
}

void EventStreamConsumer::onInactivity()
{
    if (!m_running)
        return;
    qCWarning(streamLog) << "No event stream traffic for" << m_options.inactivityMs
                         << "ms; reconnecting";
    dropStream();
    setState(State::Disconnected);
    ++m_reconnectCount;
    connectStream();
}

void EventStreamConsumer::onReconnectTimer()
{
    if (!m_running)
        return;
    ++m_reconnectCount;
    qCInfo(streamLog) << "Reconnecting event stream (attempt" << m_reconnectCount << ")";
    connectStream();
}

void EventStreamConsumer::scheduleReconnect()
{
    if (!m_running || m_reconnectTimer.isActive())
        return;
    const int delay = m_backoffMs;
    m_backoffMs = qMin(m_options.backoffMaxMs, m_backoffMs * 2);
    qCInfo(streamLog) << "Retrying event stream in" << delay << "ms";
    m_reconnectTimer.start(delay);
}

void EventStreamConsumer::dropStream()
{
    if (!m_stream)
        return;
    EventStream *stream = m_stream.data();
    m_stream.clear();
    stream->disconnect(this);
    stream->abort();
    stream->deleteLater();
}

void EventStreamConsumer::setState(State state)
{
    if (m_state == state)
        return;
    m_state = state;
    qCDebug(streamLog) << "State" << streamStateName(state);
    emit stateChanged(state);
}

} // namespace huesync
