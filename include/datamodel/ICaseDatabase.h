#ifndef ICASEDATABASE_H
#define ICASEDATABASE_H

#include <QString>

/**
 * @brief Query interface onto the case database used by tree nodes
 *
 * Implementations must be callable from worker threads.
 */
class ICaseDatabase
{
public:
    virtual ~ICaseDatabase() = default;

    /**
     * @brief Count rows of the file table matching a SQL where clause
     * @param whereClause Condition without the WHERE keyword, e.g. "1=1"
     * @param count Receives the row count on success
     * @param errorMessage Receives a description on failure (optional)
     * @return true on success
     */
    virtual bool countFilesWhere(const QString& whereClause, qint64* count,
                                 QString* errorMessage = nullptr) = 0;
};

#endif // ICASEDATABASE_H
