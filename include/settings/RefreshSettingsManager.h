#ifndef REFRESHSETTINGSMANAGER_H
#define REFRESHSETTINGSMANAGER_H

#include <QtGlobal>

#include "Constants.h"

/**
 * @brief Singleton class for managing data-model refresh settings.
 *
 * Covers how often tree nodes may refresh on ingest events, when file
 * counts stop being queried, and how many threads deliver ingest events.
 */
class RefreshSettingsManager
{
public:
    static RefreshSettingsManager& instance();

    // Node refresh delay (100 - 60000 ms)
    int loadRefreshDelayMs() const;
    void saveRefreshDelayMs(int delayMs);

    // File table size above which child counts are hidden
    qint64 loadNodeCountThreshold() const;
    void saveNodeCountThreshold(qint64 threshold);

    // Ingest event delivery threads (1 - 16)
    int loadEventDeliveryThreads() const;
    void saveEventDeliveryThreads(int threads);

    // Default values
    static constexpr int kDefaultRefreshDelayMs = CaseTree::Timer::kNodeRefreshDelay;
    static constexpr qint64 kDefaultNodeCountThreshold = CaseTree::NodeCount::kFileTableThreshold;
    static constexpr int kDefaultEventDeliveryThreads = CaseTree::Ingest::kDefaultDeliveryThreads;

private:
    RefreshSettingsManager() = default;
    RefreshSettingsManager(const RefreshSettingsManager&) = delete;
    RefreshSettingsManager& operator=(const RefreshSettingsManager&) = delete;
};

#endif // REFRESHSETTINGSMANAGER_H
