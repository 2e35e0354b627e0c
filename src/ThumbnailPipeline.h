#pragma once

#include <QAtomicInteger>
#include <QImage>
#include <QList>
#include <QObject>

#include "AppSettings.h"
#include "ThumbnailJob.h"
#include "ThumbnailQueue.h"

class ImageCache;
class QThread;

class ThumbnailPipeline : public QObject
{
    Q_OBJECT

public:
    explicit ThumbnailPipeline(ImageCache *cache,
                               const ThumbnailSettings &settings = ThumbnailSettings(),
                               QObject *parent = nullptr);
    ~ThumbnailPipeline() override;

    bool request(const ThumbnailJob &job);
    bool isRunning() const;
    int workerCount() const;
    int queuedCount() const;
    quint64 generatedCount() const;
    QSize targetSize() const;

public slots:
    void start();
    void stop();
    void sourceRemoved(const QString &path);
    void sourceRenamed(const QString &oldPath, const QString &newPath);
    void invalidate(const QString &path);

signals:
    void thumbnailReady(const QString &key, const QImage &image);
    void thumbnailFailed(const QString &key, const QString &reason);

private:
    void runWorker();
    void process(const ThumbnailJob &job);

    ImageCache *m_cache = nullptr;
    ThumbnailSettings m_settings;
    ThumbnailQueue m_queue;
    QList<QThread *> m_workers;
    QAtomicInteger<quint64> m_generated = 0;
};
