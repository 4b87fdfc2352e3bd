#include "settings/RefreshSettingsManager.h"
#include "settings/Settings.h"

#include <QSettings>
#include <QtGlobal>

RefreshSettingsManager& RefreshSettingsManager::instance()
{
    static RefreshSettingsManager instance;
    return instance;
}

int RefreshSettingsManager::loadRefreshDelayMs() const
{
    auto settings = CaseTree::getSettings();
    int delayMs = settings.value(CaseTree::kSettingsKeyNodeRefreshDelayMs, kDefaultRefreshDelayMs).toInt();
    // Clamp to valid range
    return qBound(CaseTree::Timer::kMinNodeRefreshDelay, delayMs, CaseTree::Timer::kMaxNodeRefreshDelay);
}

void RefreshSettingsManager::saveRefreshDelayMs(int delayMs)
{
    auto settings = CaseTree::getSettings();
    settings.setValue(CaseTree::kSettingsKeyNodeRefreshDelayMs, delayMs);
}

qint64 RefreshSettingsManager::loadNodeCountThreshold() const
{
    auto settings = CaseTree::getSettings();
    qint64 threshold = settings.value(CaseTree::kSettingsKeyNodeCountThreshold, kDefaultNodeCountThreshold).toLongLong();
    if (threshold < CaseTree::NodeCount::kMinFileTableThreshold) threshold = CaseTree::NodeCount::kMinFileTableThreshold;
    if (threshold > CaseTree::NodeCount::kMaxFileTableThreshold) threshold = CaseTree::NodeCount::kMaxFileTableThreshold;
    return threshold;
}

void RefreshSettingsManager::saveNodeCountThreshold(qint64 threshold)
{
    auto settings = CaseTree::getSettings();
    settings.setValue(CaseTree::kSettingsKeyNodeCountThreshold, threshold);
}

int RefreshSettingsManager::loadEventDeliveryThreads() const
{
    auto settings = CaseTree::getSettings();
    int threads = settings.value(CaseTree::kSettingsKeyEventDeliveryThreads, kDefaultEventDeliveryThreads).toInt();
    return qBound(CaseTree::Ingest::kMinDeliveryThreads, threads, CaseTree::Ingest::kMaxDeliveryThreads);
}

void RefreshSettingsManager::saveEventDeliveryThreads(int threads)
{
    auto settings = CaseTree::getSettings();
    settings.setValue(CaseTree::kSettingsKeyEventDeliveryThreads, threads);
}
