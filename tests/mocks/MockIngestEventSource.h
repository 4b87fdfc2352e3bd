#ifndef MOCKINGESTEVENTSOURCE_H
#define MOCKINGESTEVENTSOURCE_H

#include "ingest/IIngestEventSource.h"

#include <QHash>
#include <QMutex>
#include <atomic>

/**
 * @brief Mock implementation of IIngestEventSource for testing
 *
 * Delivers events synchronously on the calling thread, so tests decide
 * exactly when and from which threads handlers run.
 */
class MockIngestEventSource : public IIngestEventSource
{
public:
    MockIngestEventSource() = default;
    ~MockIngestEventSource() override = default;

    // IIngestEventSource interface implementation
    SubscriptionId subscribe(CaseTree::IngestModuleEvents interest, Handler handler) override;
    void unsubscribe(SubscriptionId id) override;

    // ========== Mock Control Methods ==========

    /**
     * @brief Call every subscribed handler interested in the event's kind
     * @return Number of handlers called
     */
    int deliver(const CaseTree::IngestEvent& event);

    /**
     * @brief Call every subscribed handler, ignoring interest sets
     *
     * Simulates a source that does not filter on behalf of its subscribers.
     */
    int deliverUnfiltered(const CaseTree::IngestEvent& event);

    /**
     * @brief Control whether subscribe() succeeds
     */
    void setSubscribeSucceeds(bool succeeds) { m_subscribeSucceeds = succeeds; }

    // ========== Spy Methods ==========

    int subscribeCallCount() const { return m_subscribeCalls.load(); }
    int unsubscribeCallCount() const { return m_unsubscribeCalls.load(); }
    int activeSubscriptionCount() const;
    CaseTree::IngestModuleEvents lastInterest() const;

    /**
     * @brief Handler passed to the most recent subscribe(), kept after unsubscribe
     *
     * Lets tests simulate a delivery that was already in flight.
     */
    Handler lastHandler() const;

private:
    struct Subscription {
        CaseTree::IngestModuleEvents interest;
        Handler handler;
    };

    int deliverTo(const CaseTree::IngestEvent& event, bool filtered);

    mutable QMutex m_mutex;
    QHash<SubscriptionId, Subscription> m_subscriptions;
    SubscriptionId m_nextId = kInvalidSubscriptionId + 1;
    CaseTree::IngestModuleEvents m_lastInterest;
    Handler m_lastHandler;
    std::atomic<bool> m_subscribeSucceeds{true};

    // Call counters
    std::atomic<int> m_subscribeCalls{0};
    std::atomic<int> m_unsubscribeCalls{0};
};

#endif // MOCKINGESTEVENTSOURCE_H
