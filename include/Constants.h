#ifndef CASETREE_CONSTANTS_H
#define CASETREE_CONSTANTS_H

#include <QtGlobal>

namespace CaseTree {

// ============================================================================
// TIMER (milliseconds)
// ============================================================================
namespace Timer {
constexpr int kNodeRefreshDelay = 5000;        // Min time between node refreshes
constexpr int kMinNodeRefreshDelay = 100;
constexpr int kMaxNodeRefreshDelay = 60000;
constexpr int kSchedulerShutdownTimeout = 5000; // Wait for refresh thread to stop
}  // namespace Timer

// ============================================================================
// NODE COUNTS
// ============================================================================
namespace NodeCount {
// Above this many rows in the file table, child counts are no longer queried
constexpr qint64 kFileTableThreshold = 1000000;
constexpr qint64 kMinFileTableThreshold = 1000;
constexpr qint64 kMaxFileTableThreshold = 1000000000;
}  // namespace NodeCount

// ============================================================================
// INGEST EVENT DELIVERY
// ============================================================================
namespace Ingest {
constexpr int kDefaultDeliveryThreads = 4;
constexpr int kMinDeliveryThreads = 1;
constexpr int kMaxDeliveryThreads = 16;
}  // namespace Ingest

inline constexpr const char* kNodeRefreshThreadName = "Node Refresh Thread";

}  // namespace CaseTree

#endif  // CASETREE_CONSTANTS_H
