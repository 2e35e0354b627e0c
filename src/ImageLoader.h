#pragma once

#include <QHash>
#include <QImage>
#include <QObject>
#include <QThreadPool>

#include "RetryPolicy.h"

class ImageCache;

class ImageLoader : public QObject
{
    Q_OBJECT

public:
    explicit ImageLoader(ImageCache *cache, QObject *parent = nullptr);
    ~ImageLoader() override;

    void setRetryPolicy(const RetryPolicy &retry);
    bool isLoading(const QString &path) const;
    void waitForIdle();

public slots:
    void requestImage(const QString &path, bool forceReload = false);
    void invalidate(const QString &path);
    void rename(const QString &oldPath, const QString &newPath);

signals:
    void imageLoaded(const QString &path, const QImage &image);
    void imageFailed(const QString &path, const QString &reason);

private:
    ImageCache *m_cache = nullptr;
    RetryPolicy m_retry;
    QThreadPool m_pool;
    quint64 m_generationCounter = 0;
    QHash<QString, quint64> m_inFlight;
};
