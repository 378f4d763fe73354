#include "hue_state_cache.h"

#include <QDateTime>
#include <QLoggingCategory>
#include <QMutexLocker>

Q_LOGGING_CATEGORY(cacheLog, "huesync.cache");

namespace huesync {

bool SubscriptionFilter::matches(const ChangeEvent &event) const
{
    if (!kinds.isEmpty() && !kinds.contains(event.kind))
        return false;
    if (!types.isEmpty() && !types.contains(event.type))
        return false;
    if (!ids.isEmpty() && !ids.contains(event.id))
        return false;
    return true;
}

SubscriptionFilter SubscriptionFilter::forType(const QString &type)
{
    SubscriptionFilter filter;
    filter.types.append(type);
    return filter;
}

SubscriptionFilter SubscriptionFilter::forResource(const QString &type, const QString &id)
{
    SubscriptionFilter filter;
    filter.types.append(type);
    filter.ids.append(id);
    return filter;
}

namespace {

ChangeEvent synthesizedEvent(ChangeKind kind, const ResourceState &resource, qint64 nowMs)
{
    ChangeEvent event;
    event.kind = kind;
    event.type = resource.type;
    event.id = resource.id;
    event.attributes = resource.attributes;
    event.receivedAtMs = nowMs;
    return event;
}

} // namespace

StateCache::StateCache(int pendingEventLimit)
    : m_pendingEventLimit(qMax(1, pendingEventLimit))
{
}

void StateCache::beginSnapshot()
{
    QMutexLocker locker(&m_mutex);
    m_buffering = true;
}

void StateCache::abortSnapshot()
{
    ChangeEventList toDispatch;
    {
        QMutexLocker locker(&m_mutex);
        if (!m_initialized || !m_buffering)
            return;
        m_buffering = false;
        const QList<PendingEvent> pending = m_pending;
        m_pending.clear();
        int replayed = 0;
        for (const PendingEvent &entry : pending) {
            // Unknown resources still wait for a snapshot.
            if (entry.unknownResource) {
                m_pending.append(entry);
                continue;
            }
            applyLocked(entry.event, true, &toDispatch);
            ++replayed;
        }
        qCInfo(cacheLog) << "Snapshot aborted; replayed" << replayed << "buffered event(s)";
    }
    dispatch(toDispatch);
}

int StateCache::loadSnapshot(const ResourceList &resources)
{
    ChangeEventList toDispatch;
    int count = 0;
    {
        QMutexLocker locker(&m_mutex);
        const qint64 nowMs = QDateTime::currentMSecsSinceEpoch();

        QHash<QString, ResourceState> next;
        next.reserve(resources.size());
        for (const ResourceState &resource : resources) {
            if (!resource.isValid())
                continue;
            const QString key = resourceKey(resource.type, resource.id);
            ResourceState entry = resource;
            const auto previous = m_resources.constFind(key);
            entry.version = previous != m_resources.constEnd() ? previous->version : 0;
            next.insert(key, entry);
            m_tombstones.remove(key);
        }

        for (auto it = next.cbegin(); it != next.cend(); ++it) {
            const auto previous = m_resources.constFind(it.key());
            if (previous == m_resources.constEnd())
                toDispatch.append(synthesizedEvent(ChangeKind::Add, it.value(), nowMs));
            else if (previous->attributes != it->attributes)
                toDispatch.append(synthesizedEvent(ChangeKind::Update, it.value(), nowMs));
        }
        for (auto it = m_resources.cbegin(); it != m_resources.cend(); ++it) {
            if (!next.contains(it.key()))
                toDispatch.append(synthesizedEvent(ChangeKind::Delete, it.value(), nowMs));
        }

        m_resources = next;
        m_initialized = true;
        m_buffering = false;

        const QList<PendingEvent> pending = m_pending;
        m_pending.clear();
        int replayed = 0;
        for (const PendingEvent &entry : pending) {
            if (entry.unknownResource && next.contains(resourceKey(entry.event.type, entry.event.id))) {
                qCDebug(cacheLog) << "Snapshot supersedes held update for"
                                  << resourceKey(entry.event.type, entry.event.id);
                continue;
            }
            applyLocked(entry.event, true, &toDispatch);
            ++replayed;
        }

        for (auto it = m_tombstones.begin(); it != m_tombstones.end();) {
            if (next.contains(*it))
                ++it;
            else
                it = m_tombstones.erase(it);
        }

        count = m_resources.size();
        qCInfo(cacheLog) << "Snapshot loaded:" << count << "resource(s),"
                         << replayed << "buffered event(s) replayed";
    }
    dispatch(toDispatch);
    return count;
}

void StateCache::mergeResources(const ResourceList &resources)
{
    ChangeEventList toDispatch;
    {
        QMutexLocker locker(&m_mutex);
        const qint64 nowMs = QDateTime::currentMSecsSinceEpoch();
        for (const ResourceState &resource : resources) {
            if (!resource.isValid())
                continue;
            const QString key = resourceKey(resource.type, resource.id);
            m_tombstones.remove(key);
            auto it = m_resources.find(key);
            if (it == m_resources.end()) {
                ResourceState entry = resource;
                entry.version = 0;
                m_resources.insert(key, entry);
                toDispatch.append(synthesizedEvent(ChangeKind::Add, entry, nowMs));
                continue;
            }
            if (it->attributes == resource.attributes)
                continue;
            it->attributes = resource.attributes;
            ++it->version;
            toDispatch.append(synthesizedEvent(ChangeKind::Update, it.value(), nowMs));
        }
    }
    dispatch(toDispatch);
}

ApplyResult StateCache::apply(const ChangeEvent &event)
{
    ChangeEventList toDispatch;
    ApplyResult result;
    {
        QMutexLocker locker(&m_mutex);
        result = applyLocked(event, false, &toDispatch);
    }
    dispatch(toDispatch);
    return result;
}

void StateCache::bufferLocked(const ChangeEvent &event, bool unknownResource)
{
    if (m_pending.size() >= m_pendingEventLimit) {
        const ChangeEvent dropped = m_pending.takeFirst().event;
        qCWarning(cacheLog) << "Pending event buffer full; dropping oldest"
                            << changeKindName(dropped.kind) << resourceKey(dropped.type, dropped.id);
    }
    PendingEvent entry;
    entry.event = event;
    entry.unknownResource = unknownResource;
    m_pending.append(entry);
}

void StateCache::discardUnknownPendingLocked(const QString &key)
{
    for (int i = m_pending.size() - 1; i >= 0; --i) {
        const PendingEvent &entry = m_pending.at(i);
        if (entry.unknownResource && resourceKey(entry.event.type, entry.event.id) == key) {
            qCDebug(cacheLog) << "Discarding held update for" << key << "superseded by a live event";
            m_pending.removeAt(i);
        }
    }
}

ApplyResult StateCache::applyLocked(const ChangeEvent &event, bool replaying, ChangeEventList *dispatch)
{
    if (event.type.isEmpty() || event.id.isEmpty())
        return ApplyResult::Ignored;

    if (m_buffering && !replaying) {
        bufferLocked(event, false);
        return ApplyResult::Buffered;
    }

    const QString key = resourceKey(event.type, event.id);
    auto it = m_resources.find(key);
    // A live event for a resource is newer than anything held for it.
    if (!replaying && (event.kind != ChangeKind::Update || it != m_resources.end()))
        discardUnknownPendingLocked(key);

    switch (event.kind) {
    case ChangeKind::Add: {
        m_tombstones.remove(key);
        if (it == m_resources.end()) {
            ResourceState entry;
            entry.type = event.type;
            entry.id = event.id;
            entry.attributes = event.attributes;
            m_resources.insert(key, entry);
        } else {
            it->attributes = event.attributes;
            ++it->version;
        }
        dispatch->append(event);
        return ApplyResult::Applied;
    }
    case ChangeKind::Update: {
        if (m_tombstones.contains(key)) {
            qCWarning(cacheLog) << "Dropping update for deleted resource" << key;
            return ApplyResult::Dropped;
        }
        if (it == m_resources.end()) {
            if (replaying) {
                qCWarning(cacheLog) << "Dropping buffered update for resource missing from snapshot" << key;
                return ApplyResult::Dropped;
            }
            qCDebug(cacheLog) << "Update for unknown resource" << key << "buffered until next snapshot";
            bufferLocked(event, true);
            return ApplyResult::Buffered;
        }
        mergeAttributes(it->attributes, event.attributes);
        ++it->version;
        dispatch->append(event);
        return ApplyResult::Applied;
    }
    case ChangeKind::Delete: {
        const bool alreadyDeleted = m_tombstones.contains(key);
        m_tombstones.insert(key);
        if (it == m_resources.end()) {
            if (alreadyDeleted)
                qCDebug(cacheLog) << "Repeated delete for" << key;
            return ApplyResult::Ignored;
        }
        ChangeEvent deleted = event;
        if (deleted.attributes.isEmpty())
            deleted.attributes = it->attributes;
        m_resources.erase(it);
        dispatch->append(deleted);
        return ApplyResult::Applied;
    }
    }
    return ApplyResult::Ignored;
}

void StateCache::reset()
{
    QMutexLocker locker(&m_mutex);
    m_resources.clear();
    m_tombstones.clear();
    m_pending.clear();
    m_initialized = false;
    m_buffering = true;
}

std::optional<ResourceState> StateCache::get(const QString &type, const QString &id) const
{
    QMutexLocker locker(&m_mutex);
    const auto it = m_resources.constFind(resourceKey(type, id));
    if (it == m_resources.constEnd())
        return std::nullopt;
    return it.value();
}

ResourceList StateCache::list(const QString &type) const
{
    QMutexLocker locker(&m_mutex);
    ResourceList out;
    for (auto it = m_resources.cbegin(); it != m_resources.cend(); ++it) {
        if (type.isEmpty() || it->type == type)
            out.append(it.value());
    }
    return out;
}

int StateCache::size() const
{
    QMutexLocker locker(&m_mutex);
    return m_resources.size();
}

bool StateCache::isInitialized() const
{
    QMutexLocker locker(&m_mutex);
    return m_initialized;
}

bool StateCache::isBuffering() const
{
    QMutexLocker locker(&m_mutex);
    return m_buffering;
}

int StateCache::pendingCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_pending.size();
}

bool StateCache::isTombstoned(const QString &type, const QString &id) const
{
    QMutexLocker locker(&m_mutex);
    return m_tombstones.contains(resourceKey(type, id));
}

int StateCache::tombstoneCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_tombstones.size();
}

SubscriptionHandle StateCache::subscribe(ChangePredicate predicate, ChangeCallback callback)
{
    if (!callback)
        return 0;
    QMutexLocker locker(&m_mutex);
    Subscription subscription;
    subscription.handle = m_nextHandle++;
    subscription.predicate = std::move(predicate);
    subscription.callback = std::move(callback);
    subscription.active = std::make_shared<std::atomic_bool>(true);
    m_subscriptions.append(subscription);
    return subscription.handle;
}

SubscriptionHandle StateCache::subscribe(const SubscriptionFilter &filter, ChangeCallback callback)
{
    return subscribe([filter](const ChangeEvent &event) { return filter.matches(event); },
                     std::move(callback));
}

bool StateCache::unsubscribe(SubscriptionHandle handle)
{
    QMutexLocker locker(&m_mutex);
    for (int i = 0; i < m_subscriptions.size(); ++i) {
        if (m_subscriptions.at(i).handle != handle)
            continue;
        m_subscriptions.at(i).active->store(false);
        m_subscriptions.removeAt(i);
        return true;
    }
    return false;
}

int StateCache::subscriptionCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_subscriptions.size();
}

void StateCache::dispatch(const ChangeEventList &events)
{
    if (events.isEmpty())
        return;

    QList<Subscription> subscriptions;
    {
        QMutexLocker locker(&m_mutex);
        subscriptions = m_subscriptions;
    }

    for (const ChangeEvent &event : events) {
        for (const Subscription &subscription : std::as_const(subscriptions)) {
            if (!subscription.active->load())
                continue;
            if (subscription.predicate && !subscription.predicate(event))
                continue;
            subscription.callback(event);
        }
    }
}

} // namespace huesync
