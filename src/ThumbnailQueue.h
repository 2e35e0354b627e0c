#pragma once

#include <queue>
#include <vector>

#include <QHash>
#include <QMutex>
#include <QWaitCondition>

#include "ThumbnailJob.h"

/**
 * @brief Blocking priority queue shared by thumbnail producers and workers.
 *
 * Jobs are served by ascending (priority, sequence). A key stays pending from
 * enqueue until its worker calls finish(), so duplicate requests are dropped
 * while the first one is queued or being generated.
 */
class ThumbnailQueue
{
public:
    enum class EnqueueResult {
        Queued,
        Duplicate,
        Invalid,
        Stopped
    };

    ThumbnailQueue() = default;

    EnqueueResult enqueue(const ThumbnailJob &job);
    bool dequeue(ThumbnailJob *job);
    void finish(const ThumbnailJob &job);
    void discardSource(const QString &path);
    bool isSuperseded(const ThumbnailJob &job) const;

    void stop();
    void restart();
    bool isStopped() const;

    int queuedCount() const;
    int pendingCount() const;

private:
    struct LaterFirst {
        bool operator()(const ThumbnailJob &left, const ThumbnailJob &right) const
        {
            if (left.priority() != right.priority()) {
                return static_cast<int>(left.priority()) > static_cast<int>(right.priority());
            }
            return left.sequence() > right.sequence();
        }
    };

    bool isSupersededLocked(const ThumbnailJob &job) const;
    void releaseLocked(const ThumbnailJob &job);

    mutable QMutex m_mutex;
    QWaitCondition m_notEmpty;
    std::priority_queue<ThumbnailJob, std::vector<ThumbnailJob>, LaterFirst> m_jobs;
    QHash<QString, quint64> m_pending;
    QHash<QString, quint64> m_removedBefore;
    quint64 m_nextSequence = 1;
    int m_inFlight = 0;
    bool m_stopped = false;
};
