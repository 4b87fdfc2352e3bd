#ifndef FILETYPECOUNTNODE_H
#define FILETYPECOUNTNODE_H

#include <QObject>
#include <QFutureWatcher>
#include <QString>
#include <memory>

class DelayedTaskScheduler;
class FileTypesRoot;
class IIngestEventSource;
class RefreshThrottler;

/**
 * @brief Tree node for one file type that shows how many files it matches.
 *
 * The count is computed in the background and appended to the display
 * name, e.g. "Images (42)". While ingest is adding data the node refreshes
 * itself through a RefreshThrottler, so a burst of DataAdded events costs
 * one count query per refresh window.
 *
 * Display name states:
 * - counts shown, no count yet: "Base (counting...)"
 * - counts shown: "Base (N)"
 * - count query failed: "Base"
 * - counts hidden (file table too large): "Base" or "Base (N+)"
 */
class FileTypeCountNode : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Create a node refreshing at the configured refresh delay
     * @param root Shared File Types state; must outlive the node
     * @param eventSource Ingest events to refresh on; must outlive the node
     * @param scheduler Shared refresh scheduler; must outlive the node
     * @param displayNameBase Name without the count, e.g. "Images"
     * @param whereClause Selects this node's files, see FileTypesRoot filters
     */
    FileTypeCountNode(FileTypesRoot& root,
                      IIngestEventSource& eventSource,
                      DelayedTaskScheduler& scheduler,
                      const QString& displayNameBase,
                      const QString& whereClause,
                      QObject* parent = nullptr);

    FileTypeCountNode(FileTypesRoot& root,
                      IIngestEventSource& eventSource,
                      DelayedTaskScheduler& scheduler,
                      const QString& displayNameBase,
                      const QString& whereClause,
                      int refreshDelayMs,
                      QObject* parent = nullptr);

    ~FileTypeCountNode() override;

    QString displayName() const { return m_displayName; }
    QString displayNameBase() const { return m_displayNameBase; }
    QString whereClause() const { return m_whereClause; }

    /**
     * @brief Last computed child count, or -1 if none yet
     */
    qint64 childCount() const { return m_childCount; }

    bool isCounting() const { return m_countWatcher.isRunning(); }

    /**
     * @brief Refresh on DataAdded events while the node is shown
     * @return false if already refreshing automatically
     */
    bool startAutoRefresh();
    void stopAutoRefresh();
    bool isAutoRefreshing() const;

    const RefreshThrottler& refreshThrottler() const { return *m_refreshThrottler; }

public slots:
    /**
     * @brief Update the display name and recount in the background if counts are shown
     */
    void updateDisplayName();

signals:
    void displayNameChanged(const QString& displayName);

private:
    struct CountResult {
        bool ok = false;
        qint64 count = 0;
        QString errorMessage;
    };

    void startCount();
    void onCountFinished();
    void setDisplayName(const QString& name);

    FileTypesRoot& m_root;
    const QString m_displayNameBase;
    const QString m_whereClause;
    QString m_displayName;
    qint64 m_childCount = -1;

    QFutureWatcher<CountResult> m_countWatcher;
    bool m_recountRequested = false;

    std::unique_ptr<RefreshThrottler> m_refreshThrottler;
};

#endif // FILETYPECOUNTNODE_H
