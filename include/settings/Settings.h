#pragma once

#include <QSettings>
#include "version.h"

namespace CaseTree {

inline constexpr const char* kOrganizationName = "CaseTree";
inline constexpr const char* kApplicationName = CASETREE_APP_NAME;

// Refresh settings keys
inline constexpr const char* kSettingsKeyNodeRefreshDelayMs = "refresh/nodeRefreshDelayMs";
inline constexpr const char* kSettingsKeyNodeCountThreshold = "refresh/nodeCountFileTableThreshold";

// Ingest settings keys
inline constexpr const char* kSettingsKeyEventDeliveryThreads = "ingest/eventDeliveryThreads";

inline QSettings getSettings()
{
    return QSettings(kOrganizationName, kApplicationName);
}

} // namespace CaseTree
