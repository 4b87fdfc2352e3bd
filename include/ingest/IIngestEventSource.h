#ifndef IINGESTEVENTSOURCE_H
#define IINGESTEVENTSOURCE_H

#include <QtGlobal>
#include <functional>

#include "ingest/IngestEventTypes.h"

/**
 * @brief Abstract interface for publishers of ingest module events
 *
 * Handlers are invoked asynchronously, possibly concurrently and on any
 * thread. Only events whose kind is part of the subscription's interest
 * set are delivered.
 */
class IIngestEventSource
{
public:
    using Handler = std::function<void(const CaseTree::IngestEvent&)>;
    using SubscriptionId = quint64;

    static constexpr SubscriptionId kInvalidSubscriptionId = 0;

    virtual ~IIngestEventSource() = default;

    /**
     * @brief Register a handler for a set of event kinds
     * @return Identifier for unsubscribe(), or kInvalidSubscriptionId if rejected
     */
    virtual SubscriptionId subscribe(CaseTree::IngestModuleEvents interest, Handler handler) = 0;

    /**
     * @brief Remove a subscription. Unknown identifiers are ignored.
     */
    virtual void unsubscribe(SubscriptionId id) = 0;
};

#endif // IINGESTEVENTSOURCE_H
