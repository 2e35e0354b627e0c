#pragma once

#include <QImage>
#include <QMutex>
#include <QObject>
#include <QRectF>
#include <QStringList>

#include "AppSettings.h"
#include "BatchStager.h"
#include "BatchWorker.h"
#include "ImageCache.h"
#include "StabilityDetector.h"
#include "StatsAggregator.h"
#include "ThumbnailJob.h"
#include "TransferEngine.h"
#include "TransferLog.h"

class ImageLoader;
class IngestionWatcher;
class QThread;
class ThumbnailPipeline;

/**
 * @brief Owns the ingestion, cache, and archival components and wires them together.
 *
 * Commands are public slots; every outcome is reported through signals
 * delivered on the thread that owns the pipeline.
 */
class ScanPipeline : public QObject
{
    Q_OBJECT

public:
    explicit ScanPipeline(const AppSettings &settings, QObject *parent = nullptr);
    ~ScanPipeline() override;

    const AppSettings &settings() const;
    bool isRunning() const;
    bool isBatchInProgress() const;
    bool isTransferInProgress() const;

    QStringList readyFiles() const;
    QList<Batch> stagedBatches() const;
    TransferPlan prepareTransfer() const;
    ScanStats computeStats() const;
    ThumbnailPriority priorityFor(int index, int firstVisible, int lastVisible) const;

    ImageCache &imageCache();
    ImageCache &thumbnailCache();
    TransferEngine *transferEngine() const;

public slots:
    void start();
    void stop();
    bool requestThumbnail(const QString &path,
                          ThumbnailPriority priority,
                          const QString &variant = QString(),
                          const QRectF &cropRegion = QRectF(),
                          bool enabled = true);
    void requestImage(const QString &path, bool forceReload = false);
    void invalidateCache(const QString &path);
    void retryFile(const QString &path);
    bool deleteFile(const QString &path);
    void createBatch(const QString &name, const QStringList &paths);
    void cancelBatch();
    void transferAll();

signals:
    void fileReady(const QString &path);
    void fileFailed(const QString &path);
    void fileRemoved(const QString &path);
    void fileRenamed(const QString &oldPath, const QString &newPath);
    void watchError(const QString &message);
    void fileDeleted(const QString &path);
    void fileDeleteFailed(const QString &path, const QString &reason);
    void thumbnailReady(const QString &key, const QImage &image);
    void thumbnailFailed(const QString &key, const QString &reason);
    void imageLoaded(const QString &path, const QImage &image);
    void imageFailed(const QString &path, const QString &reason);
    void batchProgress(int completed, int total);
    void batchCreated(const Batch &batch);
    void batchFailed(const QString &name, const QString &reason);
    void transferComplete(const QList<TransferRecord> &records);
    void transferFailed(const QString &batchName, const QString &reason);
    void transferFinished(const TransferReport &report);
    void statsUpdated(const ScanStats &stats);

private:
    void startWatcher();
    void stopWatcher();
    void handleFileReady(const QString &path);
    void handleFileRemoved(const QString &path);
    void handleFileRenamed(const QString &oldPath, const QString &newPath);

    AppSettings m_settings;
    StabilityDetector m_detector;
    ImageCache m_imageCache;
    ImageCache m_thumbnailCache;
    TransferLog m_transferLog;
    BatchStager m_stager;

    mutable QMutex m_watcherMutex;
    IngestionWatcher *m_watcher = nullptr;
    QThread *m_watcherThread = nullptr;
    ThumbnailPipeline *m_thumbnails = nullptr;
    ImageLoader *m_imageLoader = nullptr;
    TransferEngine *m_transferEngine = nullptr;
    StatsAggregator *m_stats = nullptr;

    QThread *m_batchThread = nullptr;
    BatchWorker *m_batchWorker = nullptr;
    QThread *m_transferThread = nullptr;
    bool m_running = false;
};
