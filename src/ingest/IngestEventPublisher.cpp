#include "ingest/IngestEventPublisher.h"
#include "settings/RefreshSettingsManager.h"

#include <QDebug>
#include <QList>
#include <QPair>
#include <exception>

IngestEventPublisher::IngestEventPublisher()
    : IngestEventPublisher(RefreshSettingsManager::instance().loadEventDeliveryThreads())
{
}

IngestEventPublisher::IngestEventPublisher(int deliveryThreads)
{
    m_pool.setMaxThreadCount(qMax(1, deliveryThreads));
    m_pool.setObjectName(QStringLiteral("IngestEventDelivery"));
}

IngestEventPublisher::~IngestEventPublisher()
{
    {
        QMutexLocker locker(&m_mutex);
        m_subscribers.clear();
    }
    // Queued deliveries see no subscribers and return immediately
    m_pool.waitForDone();
}

IIngestEventSource::SubscriptionId IngestEventPublisher::subscribe(
    CaseTree::IngestModuleEvents interest, Handler handler)
{
    if (!interest) {
        qWarning() << "IngestEventPublisher: Rejecting subscription with empty interest set";
        return kInvalidSubscriptionId;
    }
    if (!handler) {
        qWarning() << "IngestEventPublisher: Rejecting subscription without handler";
        return kInvalidSubscriptionId;
    }

    QMutexLocker locker(&m_mutex);
    const SubscriptionId id = m_nextId++;
    m_subscribers.insert(id, Subscriber{interest, std::move(handler)});
    return id;
}

void IngestEventPublisher::unsubscribe(SubscriptionId id)
{
    QMutexLocker locker(&m_mutex);
    m_subscribers.remove(id);
}

int IngestEventPublisher::publish(const CaseTree::IngestEvent& event)
{
    // Snapshot matching handlers so they run outside the lock
    QList<QPair<SubscriptionId, Handler>> targets;
    {
        QMutexLocker locker(&m_mutex);
        for (auto it = m_subscribers.cbegin(); it != m_subscribers.cend(); ++it) {
            if (it.value().interest.testFlag(event.kind)) {
                targets.append(qMakePair(it.key(), it.value().handler));
            }
        }
    }

    for (const auto& target : targets) {
        const SubscriptionId id = target.first;
        const Handler handler = target.second;
        m_pool.start([this, id, handler, event]() {
            deliver(id, handler, event);
        });
    }

    return static_cast<int>(targets.size());
}

bool IngestEventPublisher::waitForDeliveries(int timeoutMs)
{
    return m_pool.waitForDone(timeoutMs);
}

int IngestEventPublisher::subscriberCount() const
{
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(m_subscribers.size());
}

void IngestEventPublisher::deliver(SubscriptionId id, const Handler& handler,
                                   const CaseTree::IngestEvent& event)
{
    if (!isSubscribed(id)) {
        return;
    }

    try {
        handler(event);
        ++m_deliveredCount;
    } catch (const std::exception& e) {
        ++m_failedCount;
        qWarning() << "IngestEventPublisher: Subscriber" << id << "failed handling" << event
                   << ":" << e.what();
    } catch (...) {
        ++m_failedCount;
        qWarning() << "IngestEventPublisher: Subscriber" << id << "failed handling" << event
                   << ": unknown exception";
    }
}

bool IngestEventPublisher::isSubscribed(SubscriptionId id) const
{
    QMutexLocker locker(&m_mutex);
    return m_subscribers.contains(id);
}
