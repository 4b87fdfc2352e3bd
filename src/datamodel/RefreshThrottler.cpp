#include "datamodel/RefreshThrottler.h"
#include "datamodel/DelayedTaskScheduler.h"

#include <QDebug>
#include <QScopeGuard>
#include <atomic>
#include <exception>

struct RefreshThrottler::State {
    DelayedTaskScheduler* scheduler = nullptr;
    int refreshDelayMs = 0;

    std::atomic<bool> listening{false};
    std::atomic<int> interest{0};

    // Set while a refresh is scheduled or running (at most one at a time)
    std::atomic<bool> refreshPending{false};

    std::atomic<qint64> refreshCount{0};
    std::atomic<qint64> droppedCount{0};
    std::atomic<qint64> ignoredCount{0};

    // Held while the refresher runs so the owner can detach it safely
    QMutex refresherMutex;
    Refresher refresher;
    bool detached = false;
};

RefreshThrottler::RefreshThrottler(IIngestEventSource& eventSource,
                                   DelayedTaskScheduler& scheduler,
                                   Refresher refresher,
                                   int refreshDelayMs)
    : m_eventSource(eventSource)
    , m_refreshDelayMs(qMax(0, refreshDelayMs))
    , m_state(std::make_shared<State>())
{
    if (!refresher) {
        qWarning() << "RefreshThrottler: Created without a refresher";
    }
    m_state->scheduler = &scheduler;
    m_state->refreshDelayMs = m_refreshDelayMs;
    m_state->refresher = std::move(refresher);
}

RefreshThrottler::~RefreshThrottler()
{
    stopListening();

    // Waits for a refresh running on the scheduler thread
    QMutexLocker locker(&m_state->refresherMutex);
    m_state->detached = true;
    m_state->refresher = nullptr;
}

bool RefreshThrottler::startListening(CaseTree::IngestModuleEvents interest)
{
    if (!interest) {
        qWarning() << "RefreshThrottler: Refusing to listen for an empty set of events";
        return false;
    }

    QMutexLocker locker(&m_subscriptionMutex);

    if (m_subscriptionId != IIngestEventSource::kInvalidSubscriptionId) {
        qWarning() << "RefreshThrottler: Already listening for ingest events, ignoring second registration";
        return false;
    }

    m_state->interest = interest.toInt();
    m_state->listening = true;

    std::shared_ptr<State> state = m_state;
    const auto id = m_eventSource.subscribe(interest, [state](const CaseTree::IngestEvent& event) {
        onIngestEvent(state, event);
    });

    if (id == IIngestEventSource::kInvalidSubscriptionId) {
        m_state->listening = false;
        qWarning() << "RefreshThrottler: Event source rejected the subscription";
        return false;
    }

    m_subscriptionId = id;
    return true;
}

void RefreshThrottler::stopListening()
{
    QMutexLocker locker(&m_subscriptionMutex);

    if (m_subscriptionId == IIngestEventSource::kInvalidSubscriptionId) {
        return;
    }

    // Deliveries still in flight from the source are ignored from here on
    m_state->listening = false;
    m_eventSource.unsubscribe(m_subscriptionId);
    m_subscriptionId = IIngestEventSource::kInvalidSubscriptionId;
}

bool RefreshThrottler::isListening() const
{
    QMutexLocker locker(&m_subscriptionMutex);
    return m_subscriptionId != IIngestEventSource::kInvalidSubscriptionId;
}

bool RefreshThrottler::isRefreshPending() const
{
    return m_state->refreshPending.load();
}

CaseTree::IngestModuleEvents RefreshThrottler::eventsOfInterest() const
{
    return CaseTree::IngestModuleEvents(QFlag(m_state->interest.load()));
}

qint64 RefreshThrottler::refreshCount() const
{
    return m_state->refreshCount.load();
}

qint64 RefreshThrottler::droppedEventCount() const
{
    return m_state->droppedCount.load();
}

qint64 RefreshThrottler::ignoredEventCount() const
{
    return m_state->ignoredCount.load();
}

CaseTree::IngestModuleEvents RefreshThrottler::defaultEventsOfInterest()
{
    return CaseTree::IngestModuleEvents(CaseTree::IngestModuleEvent::DataAdded);
}

void RefreshThrottler::onIngestEvent(const std::shared_ptr<State>& state,
                                     const CaseTree::IngestEvent& event)
{
    if (!state->listening.load()) {
        return;
    }

    if ((state->interest.load() & static_cast<int>(event.kind)) == 0) {
        ++state->ignoredCount;
        return;
    }

    // Only the event that wins this exchange gets a refresh scheduled
    bool expected = false;
    if (!state->refreshPending.compare_exchange_strong(expected, true)) {
        ++state->droppedCount;
        return;
    }

    // stopListening() may have returned while this delivery was in flight
    if (!state->listening.load()) {
        state->refreshPending = false;
        return;
    }

    const bool scheduled = state->scheduler->schedule(
        state->refreshDelayMs,
        [state, event]() { dispatchRefresh(state, event); },
        [state]() { state->refreshPending = false; });

    if (!scheduled) {
        state->refreshPending = false;
        qWarning() << "RefreshThrottler: Could not schedule refresh for" << event;
    }
}

void RefreshThrottler::dispatchRefresh(const std::shared_ptr<State>& state,
                                       const CaseTree::IngestEvent& event)
{
    // Reopen the window however the refresh ends
    auto clearPending = qScopeGuard([&state]() {
        state->refreshPending = false;
    });

    QMutexLocker locker(&state->refresherMutex);
    if (state->detached) {
        return;
    }

    try {
        state->refresher(event);
        ++state->refreshCount;
    } catch (const std::exception& e) {
        qWarning() << "RefreshThrottler: Refresh failed for" << event << ":" << e.what();
    } catch (...) {
        qWarning() << "RefreshThrottler: Refresh failed for" << event << ": unknown exception";
    }
}
