#pragma once

#include <list>

#include <QHash>
#include <QImage>
#include <QMutex>
#include <QString>
#include <QStringList>

struct CacheLookup {
    bool hit = false;
    QImage image;
};

struct CacheStats {
    qint64 hits = 0;
    qint64 misses = 0;
    qint64 evictions = 0;
    qint64 totalBytes = 0;
    qint64 budgetBytes = 0;
    int entryCount = 0;
};

/**
 * @brief Byte-budgeted least-recently-used image cache.
 *
 * Keys are normalized source paths for full images and `path#variant` for
 * derived images. All members are thread-safe.
 */
class ImageCache
{
public:
    explicit ImageCache(qint64 budgetBytes, int maxEntries = 0);

    CacheLookup get(const QString &key);
    bool contains(const QString &key) const;
    void put(const QString &key, const QImage &image);
    void remove(const QString &key);
    void invalidate(const QString &path);
    void rekey(const QString &oldPath, const QString &newPath);
    void clear();

    void setEnabled(bool enabled);
    bool isEnabled() const;

    qint64 totalBytes() const;
    qint64 budgetBytes() const;
    int size() const;
    CacheStats stats() const;
    QStringList keysByRecency() const;

    static QString variantKey(const QString &path, const QString &variant);

private:
    struct Entry {
        QString key;
        QImage image;
        qint64 byteSize = 0;
        qint64 lastAccess = 0;
    };
    using EntryList = std::list<Entry>;

    void evictForLocked(qint64 incomingBytes);
    void eraseLocked(EntryList::iterator it);
    static bool belongsToPath(const QString &key, const QString &path);

    mutable QMutex m_mutex;
    EntryList m_entries;
    QHash<QString, EntryList::iterator> m_index;
    qint64 m_budgetBytes = 0;
    int m_maxEntries = 0;
    qint64 m_totalBytes = 0;
    qint64 m_accessCounter = 0;
    bool m_enabled = true;
    qint64 m_hits = 0;
    qint64 m_misses = 0;
    qint64 m_evictions = 0;
};
