#ifndef REFRESHTHROTTLER_H
#define REFRESHTHROTTLER_H

#include <QMutex>
#include <functional>
#include <memory>

#include "Constants.h"
#include "ingest/IIngestEventSource.h"

class DelayedTaskScheduler;

/**
 * @brief RefreshThrottler reduces the number of expensive node refreshes
 * caused by bursts of ingest events.
 *
 * The first event of interest opens a refresh window and schedules one
 * refresh after the refresh delay. Events arriving while that refresh is
 * pending are dropped; the refresh is called with the event that opened
 * the window. Once the refresh has run, the next event opens a new window.
 *
 * The event handler may be called concurrently from any number of threads;
 * the refresher is called on the scheduler thread.
 */
class RefreshThrottler
{
public:
    /**
     * @brief Called when a refresh is due.
     * @param event The event that opened the refresh window
     */
    using Refresher = std::function<void(const CaseTree::IngestEvent&)>;

    /**
     * @param eventSource Source to subscribe to; must outlive the throttler
     * @param scheduler Shared refresh scheduler; must outlive the throttler
     * @param refresher Consumer invoked with the coalesced event
     * @param refreshDelayMs Minimum time between accepting an event and refreshing
     */
    RefreshThrottler(IIngestEventSource& eventSource,
                     DelayedTaskScheduler& scheduler,
                     Refresher refresher,
                     int refreshDelayMs = CaseTree::Timer::kNodeRefreshDelay);

    /**
     * @brief Unsubscribes and detaches the refresher.
     *
     * A refresh that has not started yet is skipped; one that is running
     * is waited for.
     */
    ~RefreshThrottler();

    RefreshThrottler(const RefreshThrottler&) = delete;
    RefreshThrottler& operator=(const RefreshThrottler&) = delete;

    /**
     * @brief Subscribe to the event source for the given kinds.
     * @return false if already listening, the interest set is empty, or the
     *         source rejected the subscription
     */
    bool startListening(CaseTree::IngestModuleEvents interest = defaultEventsOfInterest());

    /**
     * @brief Unsubscribe from the event source.
     *
     * An already scheduled refresh still runs. No-op when not listening.
     */
    void stopListening();

    bool isListening() const;
    bool isRefreshPending() const;
    CaseTree::IngestModuleEvents eventsOfInterest() const;
    int refreshDelayMs() const { return m_refreshDelayMs; }

    qint64 refreshCount() const;
    qint64 droppedEventCount() const;
    qint64 ignoredEventCount() const;

    static CaseTree::IngestModuleEvents defaultEventsOfInterest();

private:
    struct State;

    static void onIngestEvent(const std::shared_ptr<State>& state, const CaseTree::IngestEvent& event);
    static void dispatchRefresh(const std::shared_ptr<State>& state, const CaseTree::IngestEvent& event);

    IIngestEventSource& m_eventSource;
    const int m_refreshDelayMs;

    // Shared with the event handler and scheduled refreshes
    std::shared_ptr<State> m_state;

    mutable QMutex m_subscriptionMutex;
    IIngestEventSource::SubscriptionId m_subscriptionId = IIngestEventSource::kInvalidSubscriptionId;
};

#endif // REFRESHTHROTTLER_H
