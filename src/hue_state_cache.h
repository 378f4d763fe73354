#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>

#include <QHash>
#include <QList>
#include <QMutex>
#include <QSet>
#include <QString>
#include <QStringList>

#include "hue_model.h"

namespace huesync {

using SubscriptionHandle = quint64;
using ChangePredicate = std::function<bool(const ChangeEvent &)>;
using ChangeCallback = std::function<void(const ChangeEvent &)>;

// Declarative subscription predicate. An empty list matches everything for
// that dimension.
struct SubscriptionFilter {
    QList<ChangeKind> kinds;
    QStringList types;
    QStringList ids;

    bool matches(const ChangeEvent &event) const;

    static SubscriptionFilter forType(const QString &type);
    static SubscriptionFilter forResource(const QString &type, const QString &id);
};

enum class ApplyResult {
    Applied,
    // Held until the next snapshot load.
    Buffered,
    // Inconsistent with the cache (update or delete after a tombstone).
    Dropped,
    // Nothing to do (delete of an unknown resource).
    Ignored
};

// In-memory view of bridge resources reconciled from REST snapshots and
// streamed change events. All mutations go through one mutex; subscriber
// callbacks run on the mutating thread after the mutex is released.
class StateCache
{
public:
    explicit StateCache(int pendingEventLimit = 4096);

    // Buffers every apply() until the next loadSnapshot(). A fresh cache
    // starts in this mode.
    void beginSnapshot();
    // Leaves buffering mode without a snapshot (failed resync). Pending
    // events are replayed when the cache was already initialized.
    void abortSnapshot();

    // Replaces the content with resources, then replays buffered events.
    // An update held back for an unknown resource is superseded by the
    // snapshot when the snapshot contains that resource. Tombstones for
    // resources absent from the snapshot are released.
    // Returns the number of resources held afterwards.
    int loadSnapshot(const ResourceList &resources);
    void mergeResources(const ResourceList &resources);

    ApplyResult apply(const ChangeEvent &event);

    // Drops content, tombstones and buffered events; back to buffering mode.
    void reset();

    std::optional<ResourceState> get(const QString &type, const QString &id) const;
    ResourceList list(const QString &type = QString()) const;
    int size() const;
    bool isInitialized() const;
    bool isBuffering() const;
    int pendingCount() const;
    bool isTombstoned(const QString &type, const QString &id) const;
    int tombstoneCount() const;

    SubscriptionHandle subscribe(ChangePredicate predicate, ChangeCallback callback);
    SubscriptionHandle subscribe(const SubscriptionFilter &filter, ChangeCallback callback);
    bool unsubscribe(SubscriptionHandle handle);
    int subscriptionCount() const;

    int pendingEventLimit() const { return m_pendingEventLimit; }

private:
    struct Subscription {
        SubscriptionHandle handle = 0;
        ChangePredicate predicate;
        ChangeCallback callback;
        std::shared_ptr<std::atomic_bool> active;
    };

    struct PendingEvent {
        ChangeEvent event;
        // Held because the resource was unknown, not because a snapshot
        // was in flight.
        bool unknownResource = false;
    };

    ApplyResult applyLocked(const ChangeEvent &event, bool replaying, ChangeEventList *dispatch);
    void bufferLocked(const ChangeEvent &event, bool unknownResource);
    void discardUnknownPendingLocked(const QString &key);
    void dispatch(const ChangeEventList &events);

    mutable QMutex m_mutex;
    QHash<QString, ResourceState> m_resources;
    QSet<QString> m_tombstones;
    QList<PendingEvent> m_pending;
    QList<Subscription> m_subscriptions;
    SubscriptionHandle m_nextHandle = 1;
    int m_pendingEventLimit = 4096;
    bool m_initialized = false;
    bool m_buffering = true;
};

} // namespace huesync
