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

#include "ThumbnailPipeline.h"

#include <QThread>

#include "ImageCache.h"
#include "Logging.h"
#include "PlatformUtils.h"
#include "ThumbnailGenerator.h"

namespace {
struct ThumbnailPipelineConstants {
    static constexpr int minWorkers = 1;
    static constexpr int maxWorkers = 2;
    static constexpr int decodeAttempts = 3;
    static constexpr int decodeBackoffMs = 100;
};
} // namespace

/**
 * @brief Creates a stopped pipeline.
 * @param cache Preview cache shared with the owner; must outlive the pipeline.
 * @param settings Target footprint and worker count.
 * @param parent Parent QObject for ownership.
 */
ThumbnailPipeline::ThumbnailPipeline(ImageCache *cache, const ThumbnailSettings &settings, QObject *parent)
    : QObject(parent)
    , m_cache(cache)
    , m_settings(settings)
{
    m_settings.workerCount = qBound(ThumbnailPipelineConstants::minWorkers,
                                    m_settings.workerCount,
                                    ThumbnailPipelineConstants::maxWorkers);
}

ThumbnailPipeline::~ThumbnailPipeline()
{
    stop();
}

/**
 * @brief Schedules a preview, or answers at once from the cache or the placeholder.
 *
 * A key that is already queued or being generated is not scheduled twice;
 * the pending generation delivers it.
 *
 * @param job Preview request; callable from any thread.
 * @return True when a delivery is emitted now or will follow, false for rejected requests.
 */
bool ThumbnailPipeline::request(const ThumbnailJob &job)
{
    if (!job.isValid()) {
        qCWarning(lcThumbnails) << "Rejected invalid preview request";
        return false;
    }
    const QString key = job.key();
    if (job.kind() == ThumbnailJob::Kind::Disabled) {
        emit thumbnailReady(key, ThumbnailGenerator::placeholder(m_settings.targetSize));
        return true;
    }
    if (m_cache) {
        const CacheLookup lookup = m_cache->get(key);
        if (lookup.hit) {
            emit thumbnailReady(key, lookup.image);
            return true;
        }
    }

    switch (m_queue.enqueue(job)) {
    case ThumbnailQueue::EnqueueResult::Queued:
        qCDebug(lcThumbnails) << "Queued" << key << "priority" << static_cast<int>(job.priority());
        return true;
    case ThumbnailQueue::EnqueueResult::Duplicate:
        return true;
    case ThumbnailQueue::EnqueueResult::Invalid:
    case ThumbnailQueue::EnqueueResult::Stopped:
        break;
    }
    return false;
}

bool ThumbnailPipeline::isRunning() const
{
    return !m_workers.isEmpty();
}

int ThumbnailPipeline::workerCount() const
{
    return m_settings.workerCount;
}

int ThumbnailPipeline::queuedCount() const
{
    return m_queue.queuedCount();
}

/**
 * @brief Counts previews decoded from disk since construction.
 * @return Number of generations; cache hits and placeholders are not counted.
 */
quint64 ThumbnailPipeline::generatedCount() const
{
    return m_generated.loadAcquire();
}

QSize ThumbnailPipeline::targetSize() const
{
    return m_settings.targetSize;
}

/**
 * @brief Starts the worker threads; requests queued before start are kept.
 */
void ThumbnailPipeline::start()
{
    if (!m_workers.isEmpty()) {
        return;
    }
    if (m_queue.isStopped()) {
        m_queue.restart();
    }
    for (int i = 0; i < m_settings.workerCount; ++i) {
        QThread *worker = QThread::create([this]() { runWorker(); });
        worker->setObjectName(QStringLiteral("thumbnail-worker-%1").arg(i));
        m_workers.append(worker);
        worker->start(QThread::LowPriority);
    }
    qCInfo(lcThumbnails) << "Started" << m_workers.size() << "preview workers";
}

/**
 * @brief Stops the workers after their current job and drops queued requests.
 */
void ThumbnailPipeline::stop()
{
    if (m_workers.isEmpty()) {
        return;
    }
    m_queue.stop();
    for (QThread *worker : m_workers) {
        worker->wait();
        delete worker;
    }
    m_workers.clear();
    qCInfo(lcThumbnails) << "Stopped preview workers";
}

/**
 * @brief Drops cached, queued, and in-flight previews of a deleted source.
 * @param path Source path.
 */
void ThumbnailPipeline::sourceRemoved(const QString &path)
{
    const QString normalized = PlatformUtils::normalizePath(path);
    m_queue.discardSource(normalized);
    if (m_cache) {
        m_cache->invalidate(normalized);
    }
}

/**
 * @brief Moves cached previews to the new name of a renamed source.
 * @param oldPath Previous source path.
 * @param newPath New source path.
 */
void ThumbnailPipeline::sourceRenamed(const QString &oldPath, const QString &newPath)
{
    const QString normalizedOld = PlatformUtils::normalizePath(oldPath);
    m_queue.discardSource(normalizedOld);
    if (m_cache) {
        m_cache->rekey(normalizedOld, PlatformUtils::normalizePath(newPath));
    }
}

/**
 * @brief Forgets previews of a source edited in place.
 * @param path Source path.
 */
void ThumbnailPipeline::invalidate(const QString &path)
{
    sourceRemoved(path);
}

void ThumbnailPipeline::runWorker()
{
    ThumbnailJob job;
    while (m_queue.dequeue(&job)) {
        process(job);
        m_queue.finish(job);
    }
}

void ThumbnailPipeline::process(const ThumbnailJob &job)
{
    const QString key = job.key();
    if (m_cache) {
        const CacheLookup lookup = m_cache->get(key);
        if (lookup.hit) {
            emit thumbnailReady(key, lookup.image);
            return;
        }
    }

    const RetryPolicy retry{ThumbnailPipelineConstants::decodeAttempts, ThumbnailPipelineConstants::decodeBackoffMs};
    const ThumbnailGenerator::ThumbnailResult result =
        ThumbnailGenerator::generate(job, m_settings.targetSize, retry);
    m_generated.fetchAndAddRelease(1);

    if (m_queue.isSuperseded(job)) {
        qCDebug(lcThumbnails) << "Discarded preview of removed source" << key;
        return;
    }
    if (!result.ok) {
        qCWarning(lcThumbnails) << "Preview failed" << key << result.error;
        emit thumbnailFailed(key, result.error);
        return;
    }

    if (m_cache) {
        m_cache->put(key, result.image);
        if (m_queue.isSuperseded(job)) {
            m_cache->remove(key);
            return;
        }
    }
    emit thumbnailReady(key, result.image);
}
