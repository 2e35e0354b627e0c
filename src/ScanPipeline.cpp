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

#include "ScanPipeline.h"

#include <QFileInfo>
#include <QMutexLocker>
#include <QThread>

#include "ImageLoader.h"
#include "IngestionWatcher.h"
#include "Logging.h"
#include "PlatformUtils.h"
#include "ThumbnailPipeline.h"
#include "TransferWorker.h"

/**
 * @brief Builds every component from the settings; nothing runs until start().
 * @param settings Loaded application settings.
 * @param parent Parent QObject for ownership.
 */
ScanPipeline::ScanPipeline(const AppSettings &settings, QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_detector(settings.stability)
    , m_imageCache(settings.cache.imageBudgetBytes)
    , m_thumbnailCache(settings.cache.thumbnailBudgetBytes, settings.cache.thumbnailEntries)
    , m_transferLog(settings.paths.transferLog)
    , m_stager(settings.paths.stagingRoot, settings.transferRetry)
    , m_thumbnails(new ThumbnailPipeline(&m_thumbnailCache, settings.thumbnails, this))
    , m_imageLoader(new ImageLoader(&m_imageCache, this))
    , m_transferEngine(new TransferEngine(&m_transferLog, settings.transferRetry, this))
    , m_stats(new StatsAggregator(settings.paths.stagingRoot, settings.paths.transferLog, settings.stats, this))
{
    qRegisterMetaType<Batch>();
    qRegisterMetaType<BatchResult>();
    qRegisterMetaType<ScanStats>();
    qRegisterMetaType<TransferRecord>();
    qRegisterMetaType<QList<TransferRecord>>();
    qRegisterMetaType<TransferReport>();

    m_imageCache.setEnabled(settings.cache.enabled);
    m_thumbnailCache.setEnabled(settings.cache.enabled);

    connect(m_thumbnails, &ThumbnailPipeline::thumbnailReady, this, &ScanPipeline::thumbnailReady);
    connect(m_thumbnails, &ThumbnailPipeline::thumbnailFailed, this, &ScanPipeline::thumbnailFailed);
    connect(m_imageLoader, &ImageLoader::imageLoaded, this, &ScanPipeline::imageLoaded);
    connect(m_imageLoader, &ImageLoader::imageFailed, this, &ScanPipeline::imageFailed);
    connect(m_transferEngine, &TransferEngine::transferComplete, this, &ScanPipeline::transferComplete);
    connect(m_transferEngine, &TransferEngine::transferFailed, this, &ScanPipeline::transferFailed);
    connect(m_stats, &StatsAggregator::statsUpdated, this, &ScanPipeline::statsUpdated);

    m_stats->setPendingCounter([this]() {
        QMutexLocker locker(&m_watcherMutex);
        return m_watcher ? m_watcher->readyCount() : 0;
    });
}

ScanPipeline::~ScanPipeline()
{
    stop();
    if (m_batchThread) {
        m_batchWorker->cancel();
        m_batchThread->quit();
        m_batchThread->wait();
    }
    if (m_transferThread) {
        m_transferThread->quit();
        m_transferThread->wait();
    }
}

const AppSettings &ScanPipeline::settings() const
{
    return m_settings;
}

bool ScanPipeline::isRunning() const
{
    return m_running;
}

bool ScanPipeline::isBatchInProgress() const
{
    return m_batchThread != nullptr;
}

bool ScanPipeline::isTransferInProgress() const
{
    return m_transferThread != nullptr;
}

QStringList ScanPipeline::readyFiles() const
{
    return m_watcher ? m_watcher->readyFiles() : QStringList();
}

QList<Batch> ScanPipeline::stagedBatches() const
{
    return m_stager.stagedBatches();
}

TransferPlan ScanPipeline::prepareTransfer() const
{
    return m_transferEngine->prepareTransfer(m_settings.paths.stagingRoot, m_settings.routing);
}

ScanStats ScanPipeline::computeStats() const
{
    return m_stats->computeStats();
}

ImageCache &ScanPipeline::imageCache()
{
    return m_imageCache;
}

ImageCache &ScanPipeline::thumbnailCache()
{
    return m_thumbnailCache;
}

TransferEngine *ScanPipeline::transferEngine() const
{
    return m_transferEngine;
}

/**
 * @brief Starts the watcher thread, the preview workers, and the periodic statistics.
 */
void ScanPipeline::start()
{
    if (m_running) {
        return;
    }
    m_running = true;
    m_thumbnails->start();
    startWatcher();
    m_stats->start();
    qCInfo(lcWatcher) << "Pipeline started";
}

/**
 * @brief Stops watching and background work; running transfers and batch builds complete.
 */
void ScanPipeline::stop()
{
    if (!m_running) {
        return;
    }
    m_running = false;
    m_stats->stop();
    stopWatcher();
    m_thumbnails->stop();
    m_imageLoader->waitForIdle();
    qCInfo(lcWatcher) << "Pipeline stopped";
}

/**
 * @brief Requests a preview of a whole image or of a region.
 * @param path Source image.
 * @param priority Viewport proximity of the item.
 * @param variant Variant identifier; required for regions and disabled variants.
 * @param cropRegion Normalized region, or a null rectangle for the whole image.
 * @param enabled False when the operator turned the variant off.
 * @return True when a delivery follows.
 */
bool ScanPipeline::requestThumbnail(const QString &path,
                                    ThumbnailPriority priority,
                                    const QString &variant,
                                    const QRectF &cropRegion,
                                    bool enabled)
{
    QString error;
    ThumbnailJob job;
    if (!enabled) {
        job = ThumbnailJob::disabled(path, variant, &error);
    } else if (cropRegion.isNull()) {
        job = ThumbnailJob::whole(path, priority, variant, &error);
    } else {
        job = ThumbnailJob::region(path, priority, variant, cropRegion, &error);
    }
    if (!job.isValid()) {
        emit thumbnailFailed(thumbnailKey(path, variant), error);
        return false;
    }
    return m_thumbnails->request(job);
}

void ScanPipeline::requestImage(const QString &path, bool forceReload)
{
    m_imageLoader->requestImage(path, forceReload);
}

/**
 * @brief Forgets every cached image of a file edited in place.
 * @param path Edited file.
 */
void ScanPipeline::invalidateCache(const QString &path)
{
    m_imageLoader->invalidate(path);
    m_thumbnails->invalidate(path);
}

/**
 * @brief Deletes a scanned file, retrying while it is locked.
 * @param path File to delete.
 * @return True when the file is gone; fileDeleted or fileDeleteFailed reports the outcome.
 */
bool ScanPipeline::deleteFile(const QString &path)
{
    const QString normalized = PlatformUtils::normalizePath(path);
    QString error;
    const bool deleted = RetryUtils::runWithRetry(m_settings.transferRetry, [&]() {
        if (!QFileInfo::exists(normalized)) {
            return true;
        }
        return PlatformUtils::deletePermanently(normalized, &error);
    });
    if (!deleted) {
        qCWarning(lcWatcher) << "Cannot delete" << normalized << error;
        emit fileDeleteFailed(normalized, error);
        return false;
    }
    m_imageLoader->invalidate(normalized);
    m_thumbnails->sourceRemoved(normalized);
    qCInfo(lcWatcher) << "Deleted" << normalized;
    emit fileDeleted(normalized);
    return true;
}

/**
 * @brief Maps a view position to a thumbnail priority using the configured adjacency window.
 */
ThumbnailPriority ScanPipeline::priorityFor(int index, int firstVisible, int lastVisible) const
{
    return ThumbnailPriorityUtils::classify(index, firstVisible, lastVisible, m_settings.thumbnails.adjacentWindow);
}

void ScanPipeline::retryFile(const QString &path)
{
    if (!m_watcher) {
        return;
    }
    IngestionWatcher *watcher = m_watcher;
    QMetaObject::invokeMethod(watcher, [watcher, path]() { watcher->retry(path); }, Qt::QueuedConnection);
}

/**
 * @brief Moves loose files into a new staged batch on a worker thread.
 * @param name Batch name.
 * @param paths Files to include.
 */
void ScanPipeline::createBatch(const QString &name, const QStringList &paths)
{
    if (m_batchThread) {
        emit batchFailed(name, tr("Another batch is being created"));
        return;
    }

    auto *thread = new QThread(this);
    auto *worker = new BatchWorker(m_stager, name, paths);
    worker->moveToThread(thread);
    m_batchThread = thread;
    m_batchWorker = worker;

    connect(thread, &QThread::started, worker, &BatchWorker::start);
    connect(worker, &BatchWorker::progress, this, &ScanPipeline::batchProgress);
    connect(worker, &BatchWorker::finished, this, [this, thread](const BatchResult &result) {
        m_batchWorker = nullptr;
        m_batchThread = nullptr;
        thread->quit();
        if (result.ok) {
            emit batchCreated(result.batch);
        } else {
            emit batchFailed(result.name, result.error);
        }
    });
    connect(thread, &QThread::finished, worker, &QObject::deleteLater);
    connect(thread, &QThread::finished, thread, &QObject::deleteLater);
    thread->start();
}

void ScanPipeline::cancelBatch()
{
    if (m_batchWorker) {
        m_batchWorker->cancel();
    }
}

/**
 * @brief Archives every staged batch on a worker thread.
 */
void ScanPipeline::transferAll()
{
    if (m_transferThread) {
        const QString reason = tr("Transfer already in progress");
        emit transferFailed(QString(), reason);
        return;
    }

    auto *thread = new QThread(this);
    auto *worker = new TransferWorker(m_transferEngine, m_settings.paths.stagingRoot, m_settings.routing);
    worker->moveToThread(thread);
    m_transferThread = thread;

    connect(thread, &QThread::started, worker, &TransferWorker::start);
    connect(worker, &TransferWorker::finished, this, [this, thread](const TransferReport &report) {
        m_transferThread = nullptr;
        thread->quit();
        if (!report.ok) {
            emit transferFailed(QString(), report.error);
        }
        emit transferFinished(report);
        if (m_running) {
            m_stats->refresh();
        }
    });
    connect(thread, &QThread::finished, worker, &QObject::deleteLater);
    connect(thread, &QThread::finished, thread, &QObject::deleteLater);
    thread->start();
}

void ScanPipeline::startWatcher()
{
    m_watcherThread = new QThread(this);
    m_watcherThread->setObjectName(QStringLiteral("ingestion-watcher"));
    auto *watcher = new IngestionWatcher(m_settings.paths.scanRoot, &m_detector);
    watcher->moveToThread(m_watcherThread);
    {
        QMutexLocker locker(&m_watcherMutex);
        m_watcher = watcher;
    }

    connect(m_watcherThread, &QThread::started, m_watcher, &IngestionWatcher::start);
    connect(m_watcher, &IngestionWatcher::fileReady, this, &ScanPipeline::handleFileReady);
    connect(m_watcher, &IngestionWatcher::fileFailed, this, &ScanPipeline::fileFailed);
    connect(m_watcher, &IngestionWatcher::fileRemoved, this, &ScanPipeline::handleFileRemoved);
    connect(m_watcher, &IngestionWatcher::fileRenamed, this, &ScanPipeline::handleFileRenamed);
    connect(m_watcher, &IngestionWatcher::watchError, this, &ScanPipeline::watchError);
    m_watcherThread->start();
}

void ScanPipeline::stopWatcher()
{
    if (!m_watcherThread) {
        return;
    }
    m_detector.cancel();
    IngestionWatcher *watcher = m_watcher;
    QMetaObject::invokeMethod(watcher, [watcher]() { watcher->stop(); }, Qt::BlockingQueuedConnection);
    m_watcherThread->quit();
    m_watcherThread->wait();
    {
        QMutexLocker locker(&m_watcherMutex);
        m_watcher = nullptr;
    }
    delete watcher;
    delete m_watcherThread;
    m_watcherThread = nullptr;
}

void ScanPipeline::handleFileReady(const QString &path)
{
    m_stats->recordScan();
    m_thumbnails->request(ThumbnailJob::whole(path, ThumbnailPriority::Background));
    emit fileReady(path);
}

void ScanPipeline::handleFileRemoved(const QString &path)
{
    m_thumbnails->sourceRemoved(path);
    m_imageLoader->invalidate(path);
    emit fileRemoved(path);
}

void ScanPipeline::handleFileRenamed(const QString &oldPath, const QString &newPath)
{
    m_thumbnails->sourceRenamed(oldPath, newPath);
    m_imageLoader->rename(oldPath, newPath);
    emit fileRenamed(oldPath, newPath);
}
