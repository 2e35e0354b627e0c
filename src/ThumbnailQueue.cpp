/************************************************************************\

    Scanshelf - Scanned book ingestion and archive manager
    Copyright (C) 2026 Jango73

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.

\************************************************************************/

#include "ThumbnailQueue.h"

#include <QMutexLocker>

/**
 * @brief Adds a job unless its key is already pending; never blocks.
 * @param job Validated job; it receives the next sequence number.
 * @return Whether the job was queued, or why it was dropped.
 */
ThumbnailQueue::EnqueueResult ThumbnailQueue::enqueue(const ThumbnailJob &job)
{
    if (!job.isValid()) {
        return EnqueueResult::Invalid;
    }
    QMutexLocker locker(&m_mutex);
    if (m_stopped) {
        return EnqueueResult::Stopped;
    }
    const QString key = job.key();
    if (m_pending.contains(key)) {
        return EnqueueResult::Duplicate;
    }
    const quint64 sequence = m_nextSequence++;
    m_pending.insert(key, sequence);
    m_jobs.push(job.withSequence(sequence));
    m_notEmpty.wakeOne();
    return EnqueueResult::Queued;
}

/**
 * @brief Waits for the most urgent job whose source is still present.
 * @param job Output job.
 * @return True with a job, false once the queue is stopped.
 */
bool ThumbnailQueue::dequeue(ThumbnailJob *job)
{
    QMutexLocker locker(&m_mutex);
    while (true) {
        while (m_jobs.empty() && !m_stopped) {
            m_notEmpty.wait(&m_mutex);
        }
        if (m_stopped) {
            return false;
        }
        ThumbnailJob next = m_jobs.top();
        m_jobs.pop();
        if (isSupersededLocked(next)) {
            releaseLocked(next);
            continue;
        }
        m_inFlight += 1;
        if (job) {
            *job = next;
        }
        return true;
    }
}

/**
 * @brief Marks a dequeued job as done so its key can be requested again.
 * @param job Job returned by dequeue().
 */
void ThumbnailQueue::finish(const ThumbnailJob &job)
{
    QMutexLocker locker(&m_mutex);
    releaseLocked(job);
    if (m_inFlight > 0) {
        m_inFlight -= 1;
    }
    if (m_jobs.empty() && m_inFlight == 0) {
        m_removedBefore.clear();
    }
}

/**
 * @brief Supersedes every job of a source enqueued so far.
 *
 * Queued jobs are dropped at dequeue; jobs already being generated are
 * reported superseded so their result is discarded. New requests for the
 * same source are accepted immediately.
 *
 * @param path Normalized source path.
 */
void ThumbnailQueue::discardSource(const QString &path)
{
    QMutexLocker locker(&m_mutex);
    m_removedBefore.insert(path, m_nextSequence);
    for (auto it = m_pending.begin(); it != m_pending.end();) {
        if (it.key().startsWith(path) && it.key().size() > path.size()
            && it.key().at(path.size()) == QLatin1Char('#')) {
            it = m_pending.erase(it);
        } else {
            ++it;
        }
    }
}

bool ThumbnailQueue::isSuperseded(const ThumbnailJob &job) const
{
    QMutexLocker locker(&m_mutex);
    return isSupersededLocked(job);
}

/**
 * @brief Wakes every waiting worker and rejects further jobs.
 */
void ThumbnailQueue::stop()
{
    QMutexLocker locker(&m_mutex);
    m_stopped = true;
    m_notEmpty.wakeAll();
}

/**
 * @brief Clears all jobs and accepts requests again after stop().
 */
void ThumbnailQueue::restart()
{
    QMutexLocker locker(&m_mutex);
    m_jobs = decltype(m_jobs)();
    m_pending.clear();
    m_removedBefore.clear();
    m_inFlight = 0;
    m_stopped = false;
}

bool ThumbnailQueue::isStopped() const
{
    QMutexLocker locker(&m_mutex);
    return m_stopped;
}

int ThumbnailQueue::queuedCount() const
{
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(m_jobs.size());
}

int ThumbnailQueue::pendingCount() const
{
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(m_pending.size());
}

bool ThumbnailQueue::isSupersededLocked(const ThumbnailJob &job) const
{
    const auto it = m_removedBefore.constFind(job.sourcePath());
    return it != m_removedBefore.cend() && job.sequence() < it.value();
}

void ThumbnailQueue::releaseLocked(const ThumbnailJob &job)
{
    const auto it = m_pending.find(job.key());
    if (it != m_pending.end() && it.value() == job.sequence()) {
        m_pending.erase(it);
    }
}
