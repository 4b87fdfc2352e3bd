/**
 * @file IngestEventTypes.h
 * @brief Ingest module event vocabulary
 *
 * Defines the kinds of change notifications raised while data sources are
 * ingested into a case, and the event value delivered to subscribers.
 */

#pragma once

#include <QDebug>
#include <QFlags>
#include <QMetaType>
#include <QString>
#include <QVariant>

namespace CaseTree {

/**
 * @brief Kinds of ingest module events.
 *
 * Values are single bits so that a set of kinds fits in IngestModuleEvents.
 */
enum class IngestModuleEvent {
    DataAdded = 0x1,      ///< New results were posted to the case
    ContentChanged = 0x2, ///< Content derived from existing files was added
    FileDone = 0x4,       ///< A file finished going through the ingest pipeline
};

Q_DECLARE_FLAGS(IngestModuleEvents, IngestModuleEvent)

/**
 * @brief A change notification: its kind plus an opaque payload.
 *
 * The payload is never inspected by the event plumbing; it is handed to
 * consumers exactly as published.
 */
struct IngestEvent {
    IngestModuleEvent kind = IngestModuleEvent::DataAdded;
    QVariant payload;
};

/**
 * @brief Stable upper-case name of an event kind (e.g. "DATA_ADDED").
 */
QString ingestModuleEventName(IngestModuleEvent kind);

/**
 * @brief Parse a name produced by ingestModuleEventName().
 * @param name Event name, compared case-sensitively
 * @param ok Set to false if the name is unknown (optional)
 * @return The matching kind, or DataAdded if unknown
 */
IngestModuleEvent ingestModuleEventFromName(const QString& name, bool* ok = nullptr);

/**
 * @brief Every kind in the vocabulary.
 */
IngestModuleEvents allIngestModuleEvents();

} // namespace CaseTree

Q_DECLARE_OPERATORS_FOR_FLAGS(CaseTree::IngestModuleEvents)
Q_DECLARE_METATYPE(CaseTree::IngestEvent)

QDebug operator<<(QDebug debug, CaseTree::IngestModuleEvent kind);
QDebug operator<<(QDebug debug, const CaseTree::IngestEvent& event);
