#pragma once

#include <functional>

#include <QObject>
#include <QPointer>
#include <QTimer>

#include "hue_error.h"
#include "hue_model.h"
#include "hue_sse.h"

namespace huesync {

class BridgeTransport;
class EventStream;

// Keeps the bridge event stream open, reconnecting with exponential backoff,
// and turns received frames into change events.
class EventStreamConsumer : public QObject
{
    Q_OBJECT
public:
    enum class State {
        Disconnected,
        Connecting,
        Streaming,
        Stopped
    };
    Q_ENUM(State)

    struct Options {
        int inactivityMs = 120000;
        int backoffInitialMs = 1000;
        int backoffMaxMs = 30000;
    };

    using EventSink = std::function<void(const ChangeEventList &)>;

    explicit EventStreamConsumer(BridgeTransport *transport,
                                 const Options &options = Options(),
                                 QObject *parent = nullptr);
    ~EventStreamConsumer() override;

    // Called before changeEvents() is emitted.
    void setSink(EventSink sink) { m_sink = std::move(sink); }

    State state() const { return m_state; }
    bool isRunning() const { return m_running; }
    int reconnectCount() const { return m_reconnectCount; }
    int nextBackoffMs() const { return m_backoffMs; }
    const Options &options() const { return m_options; }

public slots:
    void start();
    void stop();

signals:
    void changeEvents(const huesync::ChangeEventList &events);
    void errorOccurred(huesync::ErrorKind kind, const QString &message);
    void stateChanged(huesync::EventStreamConsumer::State state);

private:
    void connectStream();
    void onOpened();
    void onData(const QByteArray &chunk);
    void onClosed(ErrorKind kind, const QString &error);
    void onInactivity();
    void onReconnectTimer();
    void scheduleReconnect();
    void dropStream();
    void setState(State state);

    BridgeTransport *m_transport = nullptr;
    Options m_options;
    QPointer<EventStream> m_stream;
    SseParser m_parser;
    QTimer m_inactivityTimer;
    QTimer m_reconnectTimer;
    EventSink m_sink;
    State m_state = State::Disconnected;
    bool m_running = false;
    bool m_receivedData = false;
    int m_backoffMs = 1000;
    int m_reconnectCount = 0;
};

QString streamStateName(EventStreamConsumer::State state);

} // namespace huesync
