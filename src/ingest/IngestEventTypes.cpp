#include "ingest/IngestEventTypes.h"

#include <QDebugStateSaver>

namespace CaseTree {

QString ingestModuleEventName(IngestModuleEvent kind)
{
    switch (kind) {
    case IngestModuleEvent::DataAdded:
        return QStringLiteral("DATA_ADDED");
    case IngestModuleEvent::ContentChanged:
        return QStringLiteral("CONTENT_CHANGED");
    case IngestModuleEvent::FileDone:
        return QStringLiteral("FILE_DONE");
    }
    return QStringLiteral("UNKNOWN");
}

IngestModuleEvent ingestModuleEventFromName(const QString& name, bool* ok)
{
    if (ok) {
        *ok = true;
    }
    if (name == QLatin1String("DATA_ADDED")) {
        return IngestModuleEvent::DataAdded;
    }
    if (name == QLatin1String("CONTENT_CHANGED")) {
        return IngestModuleEvent::ContentChanged;
    }
    if (name == QLatin1String("FILE_DONE")) {
        return IngestModuleEvent::FileDone;
    }

    if (ok) {
        *ok = false;
    }
    return IngestModuleEvent::DataAdded;
}

IngestModuleEvents allIngestModuleEvents()
{
    return IngestModuleEvents(IngestModuleEvent::DataAdded)
        | IngestModuleEvent::ContentChanged
        | IngestModuleEvent::FileDone;
}

} // namespace CaseTree

QDebug operator<<(QDebug debug, CaseTree::IngestModuleEvent kind)
{
    QDebugStateSaver saver(debug);
    debug.noquote() << CaseTree::ingestModuleEventName(kind);
    return debug;
}

QDebug operator<<(QDebug debug, const CaseTree::IngestEvent& event)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << "IngestEvent(" << event.kind << ", " << event.payload << ')';
    return debug;
}
