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

#include "ImageCache.h"

#include <QMutexLocker>

#include "Logging.h"

namespace {
struct CacheConstants {
    static constexpr QChar variantSeparator = QLatin1Char('#');
};
} // namespace

/**
 * @brief Creates an empty cache.
 * @param budgetBytes Maximum total decoded size of the entries.
 * @param maxEntries Maximum number of entries, or zero for no count limit.
 */
ImageCache::ImageCache(qint64 budgetBytes, int maxEntries)
    : m_budgetBytes(budgetBytes > 0 ? budgetBytes : 0)
    , m_maxEntries(maxEntries > 0 ? maxEntries : 0)
{
}

/**
 * @brief Looks up an entry and marks it most recently used on a hit.
 * @param key Cache key.
 * @return Lookup result; the image is null on a miss.
 */
CacheLookup ImageCache::get(const QString &key)
{
    QMutexLocker locker(&m_mutex);
    CacheLookup lookup;
    const auto found = m_index.constFind(key);
    if (found == m_index.cend()) {
        m_misses += 1;
        return lookup;
    }
    EntryList::iterator it = found.value();
    m_entries.splice(m_entries.begin(), m_entries, it);
    it->lastAccess = ++m_accessCounter;
    m_hits += 1;
    lookup.hit = true;
    lookup.image = it->image;
    return lookup;
}

bool ImageCache::contains(const QString &key) const
{
    QMutexLocker locker(&m_mutex);
    return m_index.contains(key);
}

/**
 * @brief Stores an image, evicting least recently used entries to make room.
 *
 * An image larger than the whole budget is still admitted once the cache is
 * empty; it becomes the first eviction candidate of the next insertion.
 *
 * @param key Cache key.
 * @param image Decoded image; null images are ignored.
 */
void ImageCache::put(const QString &key, const QImage &image)
{
    if (key.isEmpty() || image.isNull()) {
        return;
    }
    QMutexLocker locker(&m_mutex);
    if (!m_enabled) {
        return;
    }

    const auto existing = m_index.constFind(key);
    if (existing != m_index.cend()) {
        eraseLocked(existing.value());
    }

    const qint64 byteSize = image.sizeInBytes();
    evictForLocked(byteSize);

    Entry entry;
    entry.key = key;
    entry.image = image;
    entry.byteSize = byteSize;
    entry.lastAccess = ++m_accessCounter;
    m_entries.push_front(entry);
    m_index.insert(key, m_entries.begin());
    m_totalBytes += byteSize;

    if (byteSize > m_budgetBytes) {
        qCDebug(lcCache) << "Admitted oversized entry" << key << byteSize << "bytes";
    }
}

void ImageCache::remove(const QString &key)
{
    QMutexLocker locker(&m_mutex);
    const auto found = m_index.constFind(key);
    if (found != m_index.cend()) {
        eraseLocked(found.value());
    }
}

/**
 * @brief Drops every entry derived from a source path.
 * @param path Source path; matches the full image and all of its variants.
 */
void ImageCache::invalidate(const QString &path)
{
    QMutexLocker locker(&m_mutex);
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (belongsToPath(it->key, path)) {
            const auto next = std::next(it);
            eraseLocked(it);
            it = next;
        } else {
            ++it;
        }
    }
}

/**
 * @brief Moves the entries of a renamed source to its new path.
 * @param oldPath Previous source path.
 * @param newPath New source path.
 */
void ImageCache::rekey(const QString &oldPath, const QString &newPath)
{
    if (oldPath == newPath) {
        return;
    }
    QMutexLocker locker(&m_mutex);
    for (auto it = m_entries.begin(); it != m_entries.end(); ++it) {
        if (!belongsToPath(it->key, oldPath)) {
            continue;
        }
        const QString renamed = newPath + it->key.mid(oldPath.size());
        const auto clash = m_index.constFind(renamed);
        if (clash != m_index.cend() && clash.value() != it) {
            eraseLocked(clash.value());
        }
        m_index.remove(it->key);
        it->key = renamed;
        m_index.insert(renamed, it);
    }
}

void ImageCache::clear()
{
    QMutexLocker locker(&m_mutex);
    m_entries.clear();
    m_index.clear();
    m_totalBytes = 0;
}

/**
 * @brief Enables or disables caching; disabling drops every entry.
 * @param enabled True to cache images, false to ignore puts.
 */
void ImageCache::setEnabled(bool enabled)
{
    QMutexLocker locker(&m_mutex);
    m_enabled = enabled;
    if (!enabled) {
        m_entries.clear();
        m_index.clear();
        m_totalBytes = 0;
    }
}

bool ImageCache::isEnabled() const
{
    QMutexLocker locker(&m_mutex);
    return m_enabled;
}

qint64 ImageCache::totalBytes() const
{
    QMutexLocker locker(&m_mutex);
    return m_totalBytes;
}

qint64 ImageCache::budgetBytes() const
{
    return m_budgetBytes;
}

int ImageCache::size() const
{
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(m_index.size());
}

CacheStats ImageCache::stats() const
{
    QMutexLocker locker(&m_mutex);
    CacheStats stats;
    stats.hits = m_hits;
    stats.misses = m_misses;
    stats.evictions = m_evictions;
    stats.totalBytes = m_totalBytes;
    stats.budgetBytes = m_budgetBytes;
    stats.entryCount = static_cast<int>(m_index.size());
    return stats;
}

/**
 * @brief Lists keys from most to least recently used.
 * @return Keys in recency order.
 */
QStringList ImageCache::keysByRecency() const
{
    QMutexLocker locker(&m_mutex);
    QStringList keys;
    keys.reserve(static_cast<int>(m_index.size()));
    for (const Entry &entry : m_entries) {
        keys.append(entry.key);
    }
    return keys;
}

/**
 * @brief Builds the key of a derived image.
 * @param path Source path.
 * @param variant Variant identifier.
 * @return Key in the form `path#variant`.
 */
QString ImageCache::variantKey(const QString &path, const QString &variant)
{
    return path + CacheConstants::variantSeparator + variant;
}

void ImageCache::evictForLocked(qint64 incomingBytes)
{
    while (!m_entries.empty()) {
        const bool overBudget = m_totalBytes + incomingBytes > m_budgetBytes;
        const bool overCount = m_maxEntries > 0 && static_cast<int>(m_index.size()) >= m_maxEntries;
        if (!overBudget && !overCount) {
            break;
        }
        auto oldest = std::prev(m_entries.end());
        qCDebug(lcCache) << "Evicting" << oldest->key << oldest->byteSize << "bytes";
        eraseLocked(oldest);
        m_evictions += 1;
    }
}

void ImageCache::eraseLocked(EntryList::iterator it)
{
    m_totalBytes -= it->byteSize;
    m_index.remove(it->key);
    m_entries.erase(it);
}

bool ImageCache::belongsToPath(const QString &key, const QString &path)
{
    if (!key.startsWith(path)) {
        return false;
    }
    return key.size() == path.size() || key.at(path.size()) == CacheConstants::variantSeparator;
}
