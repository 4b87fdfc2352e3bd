#include "datamodel/FileTypeCountNode.h"
#include "datamodel/FileTypesRoot.h"
#include "datamodel/ICaseDatabase.h"
#include "datamodel/RefreshThrottler.h"
#include "settings/RefreshSettingsManager.h"

#include <QDebug>
#include <QMetaObject>
#include <QtConcurrent>

FileTypeCountNode::FileTypeCountNode(FileTypesRoot& root,
                                     IIngestEventSource& eventSource,
                                     DelayedTaskScheduler& scheduler,
                                     const QString& displayNameBase,
                                     const QString& whereClause,
                                     QObject* parent)
    : FileTypeCountNode(root, eventSource, scheduler, displayNameBase, whereClause,
                        RefreshSettingsManager::instance().loadRefreshDelayMs(), parent)
{
}

FileTypeCountNode::FileTypeCountNode(FileTypesRoot& root,
                                     IIngestEventSource& eventSource,
                                     DelayedTaskScheduler& scheduler,
                                     const QString& displayNameBase,
                                     const QString& whereClause,
                                     int refreshDelayMs,
                                     QObject* parent)
    : QObject(parent)
    , m_root(root)
    , m_displayNameBase(displayNameBase)
    , m_whereClause(whereClause)
    , m_displayName(displayNameBase)
{
    connect(&m_countWatcher, &QFutureWatcher<CountResult>::finished,
            this, &FileTypeCountNode::onCountFinished);

    // Runs on the refresh thread; the display name is updated on ours
    m_refreshThrottler = std::make_unique<RefreshThrottler>(
        eventSource, scheduler,
        [this](const CaseTree::IngestEvent&) {
            m_root.updateShowCounts();
            QMetaObject::invokeMethod(this, &FileTypeCountNode::updateDisplayName, Qt::QueuedConnection);
        },
        refreshDelayMs);
}

FileTypeCountNode::~FileTypeCountNode()
{
    // Stop refreshes before anything they touch goes away
    m_refreshThrottler.reset();

    if (m_countWatcher.isRunning()) {
        disconnect(&m_countWatcher, nullptr, this, nullptr);
        m_countWatcher.waitForFinished();
    }
}

bool FileTypeCountNode::startAutoRefresh()
{
    return m_refreshThrottler->startListening(RefreshThrottler::defaultEventsOfInterest());
}

void FileTypeCountNode::stopAutoRefresh()
{
    m_refreshThrottler->stopListening();
}

bool FileTypeCountNode::isAutoRefreshing() const
{
    return m_refreshThrottler->isListening();
}

void FileTypeCountNode::updateDisplayName()
{
    if (!m_root.showCounts()) {
        setDisplayName(m_childCount < 0
                           ? m_displayNameBase
                           : QStringLiteral("%1 (%2+)").arg(m_displayNameBase).arg(m_childCount));
        return;
    }

    // Only show "(counting...)" the first time
    setDisplayName(m_childCount < 0
                       ? QStringLiteral("%1 (counting...)").arg(m_displayNameBase)
                       : QStringLiteral("%1 (%2)").arg(m_displayNameBase).arg(m_childCount));
    startCount();
}

void FileTypeCountNode::startCount()
{
    if (m_countWatcher.isRunning()) {
        m_recountRequested = true;
        return;
    }

    ICaseDatabase* caseDatabase = &m_root.caseDatabase();
    const QString whereClause = m_whereClause;
    m_countWatcher.setFuture(QtConcurrent::run([caseDatabase, whereClause]() {
        CountResult result;
        result.ok = caseDatabase->countFilesWhere(whereClause, &result.count, &result.errorMessage);
        return result;
    }));
}

void FileTypeCountNode::onCountFinished()
{
    const CountResult result = m_countWatcher.result();

    if (result.ok) {
        m_childCount = result.count;
        setDisplayName(QStringLiteral("%1 (%2)").arg(m_displayNameBase).arg(m_childCount));
    } else {
        setDisplayName(m_displayNameBase);
        qWarning() << "FileTypeCountNode: Failed to get count of files for" << m_displayNameBase
                   << ":" << result.errorMessage;
    }

    // Data changed while counting
    if (m_recountRequested) {
        m_recountRequested = false;
        updateDisplayName();
    }
}

void FileTypeCountNode::setDisplayName(const QString& name)
{
    if (name == m_displayName) {
        return;
    }
    m_displayName = name;
    emit displayNameChanged(m_displayName);
}
