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

#include "ImageLoader.h"

#include <QFutureWatcher>
#include <QtConcurrent>

#include "ImageCache.h"
#include "Logging.h"
#include "PlatformUtils.h"
#include "ScanImageUtils.h"

namespace {
struct ImageLoaderConstants {
    static constexpr int decodeAttempts = 5;
    static constexpr int decodeBackoffMs = 200;
    static constexpr int maxConcurrentLoads = 2;
};
} // namespace

/**
 * @brief Creates a loader serving full-resolution images through a cache.
 * @param cache Full-image cache shared with the owner; must outlive the loader.
 * @param parent Parent QObject for ownership.
 */
ImageLoader::ImageLoader(ImageCache *cache, QObject *parent)
    : QObject(parent)
    , m_cache(cache)
    , m_retry{ImageLoaderConstants::decodeAttempts, ImageLoaderConstants::decodeBackoffMs}
{
    m_pool.setMaxThreadCount(ImageLoaderConstants::maxConcurrentLoads);
}

ImageLoader::~ImageLoader()
{
    m_pool.waitForDone();
}

void ImageLoader::setRetryPolicy(const RetryPolicy &retry)
{
    m_retry = retry;
}

bool ImageLoader::isLoading(const QString &path) const
{
    return m_inFlight.contains(PlatformUtils::normalizePath(path));
}

void ImageLoader::waitForIdle()
{
    m_pool.waitForDone();
}

/**
 * @brief Delivers a decoded image, from the cache when possible.
 * @param path Image file path.
 * @param forceReload True to bypass the cache and decode again.
 */
void ImageLoader::requestImage(const QString &path, bool forceReload)
{
    const QString normalized = PlatformUtils::normalizePath(path);
    if (!forceReload && m_cache) {
        const CacheLookup lookup = m_cache->get(normalized);
        if (lookup.hit) {
            emit imageLoaded(normalized, lookup.image);
            return;
        }
    }
    if (!forceReload && m_inFlight.contains(normalized)) {
        return;
    }

    const quint64 generation = ++m_generationCounter;
    m_inFlight.insert(normalized, generation);

    const RetryPolicy retry = m_retry;
    auto future = QtConcurrent::run(&m_pool, [normalized, retry]() {
        return ScanImageUtils::decodeImage(normalized, retry);
    });
    auto *watcher = new QFutureWatcher<ScanImageUtils::DecodeResult>(this);
    connect(watcher, &QFutureWatcher<ScanImageUtils::DecodeResult>::finished, this, [this, watcher, normalized, generation]() {
        const ScanImageUtils::DecodeResult result = watcher->result();
        watcher->deleteLater();
        const auto it = m_inFlight.constFind(normalized);
        if (it == m_inFlight.cend() || it.value() != generation) {
            qCDebug(lcCache) << "Dropped stale decode" << normalized;
            return;
        }
        m_inFlight.remove(normalized);
        if (!result.ok) {
            qCWarning(lcCache) << "Cannot decode" << normalized << result.error;
            emit imageFailed(normalized, result.error);
            return;
        }
        if (m_cache) {
            m_cache->put(normalized, result.image);
        }
        emit imageLoaded(normalized, result.image);
    });
    watcher->setFuture(future);
}

/**
 * @brief Drops the cached image of an edited or deleted file and any decode in flight.
 * @param path Image file path.
 */
void ImageLoader::invalidate(const QString &path)
{
    const QString normalized = PlatformUtils::normalizePath(path);
    m_inFlight.remove(normalized);
    if (m_cache) {
        m_cache->invalidate(normalized);
    }
}

void ImageLoader::rename(const QString &oldPath, const QString &newPath)
{
    const QString normalizedOld = PlatformUtils::normalizePath(oldPath);
    m_inFlight.remove(normalizedOld);
    if (m_cache) {
        m_cache->rekey(normalizedOld, PlatformUtils::normalizePath(newPath));
    }
}
