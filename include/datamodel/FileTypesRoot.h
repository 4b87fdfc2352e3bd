#ifndef FILETYPESROOT_H
#define FILETYPESROOT_H

#include <QString>
#include <QStringList>
#include <atomic>

class ICaseDatabase;

/**
 * @brief Shared state of the "File Types" branch of the case tree.
 *
 * Decides whether child nodes show file counts. Counting is expensive on
 * large cases, so once the file table grows past the threshold the counts
 * are hidden for the rest of the session.
 */
class FileTypesRoot
{
public:
    /**
     * @brief Use the configured node count threshold
     */
    explicit FileTypesRoot(ICaseDatabase& caseDatabase);
    FileTypesRoot(ICaseDatabase& caseDatabase, qint64 countThreshold);

    ICaseDatabase& caseDatabase() const { return m_caseDatabase; }
    qint64 countThreshold() const { return m_countThreshold; }

    bool showCounts() const { return m_showCounts.load(); }

    /**
     * @brief Query the total file count and hide counts if over the threshold.
     *
     * Does nothing once counts are hidden. Thread-safe.
     */
    void updateShowCounts();

    // Where clause builders for child nodes
    static QString extensionFilter(const QStringList& extensions);
    static QString mimeTypeFilter(const QString& mimeType);

private:
    ICaseDatabase& m_caseDatabase;
    const qint64 m_countThreshold;
    std::atomic<bool> m_showCounts{true};
};

#endif // FILETYPESROOT_H
