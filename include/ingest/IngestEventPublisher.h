#ifndef INGESTEVENTPUBLISHER_H
#define INGESTEVENTPUBLISHER_H

#include <QHash>
#include <QMutex>
#include <QThreadPool>
#include <atomic>

#include "ingest/IIngestEventSource.h"

/**
 * @brief In-process ingest event bus
 *
 * Ingest modules publish events from their own threads; every matching
 * subscriber receives the event on the publisher's delivery pool.
 *
 * Thread safety:
 * - subscribe(), unsubscribe() and publish() may be called from any thread
 * - Deliveries for one event run independently; a slow or throwing handler
 *   does not hold back other subscribers
 * - A subscription removed before its queued delivery runs is skipped
 */
class IngestEventPublisher : public IIngestEventSource
{
public:
    /**
     * @brief Create a publisher with the configured number of delivery threads
     */
    IngestEventPublisher();

    explicit IngestEventPublisher(int deliveryThreads);
    ~IngestEventPublisher() override;

    IngestEventPublisher(const IngestEventPublisher&) = delete;
    IngestEventPublisher& operator=(const IngestEventPublisher&) = delete;

    SubscriptionId subscribe(CaseTree::IngestModuleEvents interest, Handler handler) override;
    void unsubscribe(SubscriptionId id) override;

    /**
     * @brief Queue delivery of an event to all interested subscribers
     * @return Number of subscribers the event was queued for
     */
    int publish(const CaseTree::IngestEvent& event);

    /**
     * @brief Block until all queued deliveries have run
     * @param timeoutMs -1 waits forever
     * @return false on timeout
     */
    bool waitForDeliveries(int timeoutMs = -1);

    int subscriberCount() const;
    int deliveryThreads() const { return m_pool.maxThreadCount(); }
    qint64 deliveredCount() const { return m_deliveredCount.load(); }
    qint64 failedDeliveryCount() const { return m_failedCount.load(); }

private:
    struct Subscriber {
        CaseTree::IngestModuleEvents interest;
        Handler handler;
    };

    void deliver(SubscriptionId id, const Handler& handler, const CaseTree::IngestEvent& event);
    bool isSubscribed(SubscriptionId id) const;

    mutable QMutex m_mutex;
    QHash<SubscriptionId, Subscriber> m_subscribers;
    SubscriptionId m_nextId = kInvalidSubscriptionId + 1;

    std::atomic<qint64> m_deliveredCount{0};
    std::atomic<qint64> m_failedCount{0};

    // Declared last so queued deliveries are drained before other members go away
    QThreadPool m_pool;
};

#endif // INGESTEVENTPUBLISHER_H
