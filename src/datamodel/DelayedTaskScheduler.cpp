#include "datamodel/DelayedTaskScheduler.h"
#include "Constants.h"

#include <QDebug>
#include <exception>

DelayedTaskScheduler::DelayedTaskScheduler(QObject *parent)
    : QThread(parent)
{
    setObjectName(QString::fromLatin1(CaseTree::kNodeRefreshThreadName));
}

DelayedTaskScheduler::~DelayedTaskScheduler()
{
    shutdown();
}

bool DelayedTaskScheduler::schedule(int delayMs, Task task, Task onDiscard)
{
    if (!task) {
        qWarning() << "DelayedTaskScheduler: Ignoring empty task";
        return false;
    }

    QMutexLocker locker(&m_mutex);

    if (m_stopRequested.load() || !isRunning()) {
        qWarning() << "DelayedTaskScheduler: Not running, task rejected";
        return false;
    }

    QDeadlineTimer deadline(qMax(0, delayMs), Qt::PreciseTimer);
    const qint64 key = deadline.deadlineNSecs();
    m_tasks.emplace(key, ScheduledTask{deadline, std::move(task), std::move(onDiscard)});
    m_condition.wakeOne();
    return true;
}

void DelayedTaskScheduler::shutdown()
{
    {
        QMutexLocker locker(&m_mutex);
        m_stopRequested = true;
        m_condition.wakeAll();
    }

    if (isRunning() && !wait(CaseTree::Timer::kSchedulerShutdownTimeout)) {
        qWarning() << "DelayedTaskScheduler: Still running a task after timeout, waiting";
        wait();
    }

    std::multimap<qint64, ScheduledTask> discarded;
    {
        QMutexLocker locker(&m_mutex);
        discarded.swap(m_tasks);
    }
    if (discarded.empty()) {
        return;
    }

    qDebug() << "DelayedTaskScheduler: Discarding" << discarded.size() << "pending tasks";
    for (const auto& entry : discarded) {
        if (entry.second.onDiscard && !runTask(entry.second.onDiscard)) {
            ++m_failedCount;
        }
    }
}

int DelayedTaskScheduler::pendingTaskCount() const
{
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(m_tasks.size());
}

void DelayedTaskScheduler::run()
{
    qDebug() << "DelayedTaskScheduler: Started" << objectName();

    while (true) {
        Task task;
        {
            QMutexLocker locker(&m_mutex);

            // Wait for the earliest deadline, a new earlier task, or stop
            while (!m_stopRequested) {
                if (m_tasks.empty()) {
                    m_condition.wait(&m_mutex);
                    continue;
                }
                const ScheduledTask& next = m_tasks.begin()->second;
                if (next.deadline.hasExpired()) {
                    break;
                }
                m_condition.wait(&m_mutex, next.deadline);
            }

            if (m_stopRequested) {
                break;
            }

            auto next = m_tasks.begin();
            task = std::move(next->second.task);
            m_tasks.erase(next);
        }

        if (runTask(task)) {
            ++m_executedCount;
        } else {
            ++m_failedCount;
        }
    }

    qDebug() << "DelayedTaskScheduler: Stopped, tasks executed:" << m_executedCount.load()
             << "failed:" << m_failedCount.load();
}

bool DelayedTaskScheduler::runTask(const Task& task)
{
    try {
        task();
        return true;
    } catch (const std::exception& e) {
        qWarning() << "DelayedTaskScheduler: Task failed:" << e.what();
    } catch (...) {
        qWarning() << "DelayedTaskScheduler: Task failed: unknown exception";
    }
    return false;
}
