#include "datamodel/FileTypesRoot.h"
#include "datamodel/ICaseDatabase.h"
#include "settings/RefreshSettingsManager.h"

#include <QDebug>

namespace {

QString sqlQuoted(QString value)
{
    value.replace(QLatin1Char('\''), QLatin1String("''"));
    return QLatin1Char('\'') + value + QLatin1Char('\'');
}

} // namespace

FileTypesRoot::FileTypesRoot(ICaseDatabase& caseDatabase)
    : FileTypesRoot(caseDatabase, RefreshSettingsManager::instance().loadNodeCountThreshold())
{
}

FileTypesRoot::FileTypesRoot(ICaseDatabase& caseDatabase, qint64 countThreshold)
    : m_caseDatabase(caseDatabase)
    , m_countThreshold(countThreshold)
{
}

void FileTypesRoot::updateShowCounts()
{
    // Once past the threshold there is no need to keep counting rows
    if (!m_showCounts.load()) {
        return;
    }

    qint64 totalFiles = 0;
    QString errorMessage;
    if (!m_caseDatabase.countFilesWhere(QStringLiteral("1=1"), &totalFiles, &errorMessage)) {
        m_showCounts = false;
        qWarning() << "FileTypesRoot: Error counting files:" << errorMessage;
        return;
    }

    if (totalFiles > m_countThreshold) {
        m_showCounts = false;
        qDebug() << "FileTypesRoot: File table has" << totalFiles
                 << "rows, hiding node counts (threshold" << m_countThreshold << ")";
    }
}

QString FileTypesRoot::extensionFilter(const QStringList& extensions)
{
    QStringList quoted;
    quoted.reserve(extensions.size());
    for (const QString& extension : extensions) {
        QString normalized = extension.trimmed().toLower();
        if (normalized.startsWith(QLatin1Char('.'))) {
            normalized.remove(0, 1);
        }
        if (!normalized.isEmpty()) {
            quoted.append(sqlQuoted(normalized));
        }
    }

    if (quoted.isEmpty()) {
        return QStringLiteral("0=1");
    }
    return QStringLiteral("extension IN (%1)").arg(quoted.join(QStringLiteral(", ")));
}

QString FileTypesRoot::mimeTypeFilter(const QString& mimeType)
{
    return QStringLiteral("mime_type = %1").arg(sqlQuoted(mimeType.trimmed()));
}
