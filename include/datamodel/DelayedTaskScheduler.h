#ifndef DELAYEDTASKSCHEDULER_H
#define DELAYEDTASKSCHEDULER_H

#include <QThread>
#include <QMutex>
#include <QWaitCondition>
#include <QDeadlineTimer>
#include <atomic>
#include <functional>
#include <map>

/**
 * @brief Single worker thread that runs tasks after a delay
 *
 * One scheduler is shared by every RefreshThrottler in the process. The
 * owner constructs it, calls start() once before first use and shutdown()
 * at teardown; throttlers only hold a reference.
 *
 * Tasks run one at a time on the scheduler thread, ordered by deadline.
 * A task never runs before its delay has elapsed.
 */
class DelayedTaskScheduler : public QThread
{
    Q_OBJECT

public:
    using Task = std::function<void()>;

    explicit DelayedTaskScheduler(QObject *parent = nullptr);
    ~DelayedTaskScheduler() override;

    /**
     * @brief Run a task once, no sooner than delayMs from now
     * @param onDiscard Called instead of the task if shutdown() drops it (optional)
     * @return false if the scheduler is not running or is shutting down
     */
    bool schedule(int delayMs, Task task, Task onDiscard = Task());

    /**
     * @brief Stop the thread and discard tasks that have not run yet
     *
     * Blocks until a task currently running has returned, then calls the
     * onDiscard callback of every dropped task on the calling thread.
     */
    void shutdown();

    /**
     * @brief Number of tasks waiting for their deadline
     */
    int pendingTaskCount() const;

    qint64 executedTaskCount() const { return m_executedCount.load(); }
    qint64 failedTaskCount() const { return m_failedCount.load(); }

protected:
    void run() override;

private:
    struct ScheduledTask {
        QDeadlineTimer deadline;
        Task task;
        Task onDiscard;
    };

    bool runTask(const Task& task);

    mutable QMutex m_mutex;
    QWaitCondition m_condition;

    // Keyed by deadline; equal deadlines keep submission order
    std::multimap<qint64, ScheduledTask> m_tasks;

    std::atomic<bool> m_stopRequested{false};
    std::atomic<qint64> m_executedCount{0};
    std::atomic<qint64> m_failedCount{0};
};

#endif // DELAYEDTASKSCHEDULER_H
