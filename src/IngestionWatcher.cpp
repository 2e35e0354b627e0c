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

#include "IngestionWatcher.h"

#include <QDir>
#include <QFileInfo>
#include <QFileSystemWatcher>
#include <QFutureWatcher>
#include <QMutexLocker>
#include <QSet>
#include <QTimer>
#include <QtConcurrent>

#include "Logging.h"
#include "PlatformUtils.h"
#include "ScanImageUtils.h"

namespace {
struct WatcherConstants {
    static constexpr int refreshDebounceMs = 150;
    static constexpr int maxConcurrentChecks = 8;
};
} // namespace

/**
 * @brief Creates a watcher for one scan folder.
 * @param scanRoot Folder receiving files from the scanner (not watched recursively).
 * @param detector Stability detector shared with the owner; must outlive the watcher.
 * @param parent Parent QObject for ownership.
 */
IngestionWatcher::IngestionWatcher(const QString &scanRoot, StabilityDetector *detector, QObject *parent)
    : QObject(parent)
    , m_scanRoot(PlatformUtils::normalizePath(scanRoot))
    , m_detector(detector)
    , m_watcher(new QFileSystemWatcher(this))
    , m_refreshTimer(new QTimer(this))
{
    m_stabilityPool.setMaxThreadCount(WatcherConstants::maxConcurrentChecks);

    m_refreshTimer->setSingleShot(true);
    m_refreshTimer->setInterval(WatcherConstants::refreshDebounceMs);
    connect(m_refreshTimer, &QTimer::timeout, this, &IngestionWatcher::rescan);

    connect(m_watcher, &QFileSystemWatcher::directoryChanged, this, [this](const QString &) {
        if (!QDir(m_scanRoot).exists()) {
            emit watchError(tr("Scan folder disappeared: %1").arg(m_scanRoot));
        }
        m_refreshTimer->start();
    });
}

IngestionWatcher::~IngestionWatcher()
{
    stop();
}

QString IngestionWatcher::scanRoot() const
{
    return m_scanRoot;
}

/**
 * @brief Returns the files confirmed ready, in natural order.
 * @return Snapshot of ready paths; safe to call from any thread.
 */
QStringList IngestionWatcher::readyFiles() const
{
    QStringList paths;
    {
        QMutexLocker locker(&m_trackedMutex);
        for (auto it = m_tracked.cbegin(); it != m_tracked.cend(); ++it) {
            if (it.value().state == SourceFile::State::Ready) {
                paths.append(it.key());
            }
        }
    }
    return ScanImageUtils::sortedNaturally(paths);
}

int IngestionWatcher::readyCount() const
{
    QMutexLocker locker(&m_trackedMutex);
    int count = 0;
    for (const SourceFile &file : m_tracked) {
        if (file.state == SourceFile::State::Ready) {
            count += 1;
        }
    }
    return count;
}

int IngestionWatcher::pendingCount() const
{
    QMutexLocker locker(&m_trackedMutex);
    int count = 0;
    for (const SourceFile &file : m_tracked) {
        if (file.state == SourceFile::State::Pending) {
            count += 1;
        }
    }
    return count;
}

bool IngestionWatcher::isReady(const QString &path) const
{
    QMutexLocker locker(&m_trackedMutex);
    const auto it = m_tracked.constFind(PlatformUtils::normalizePath(path));
    return it != m_tracked.cend() && it.value().state == SourceFile::State::Ready;
}

/**
 * @brief Starts watching and treats files already present as newly created.
 */
void IngestionWatcher::start()
{
    if (m_running) {
        return;
    }
    if (!QDir(m_scanRoot).exists()) {
        emit watchError(tr("Scan folder not found: %1").arg(m_scanRoot));
        return;
    }
    if (m_detector) {
        m_detector->reset();
    }
    m_running = true;
    m_watcher->addPath(m_scanRoot);
    qCInfo(lcWatcher) << "Watching" << m_scanRoot;
    rescan();
}

/**
 * @brief Stops watching and waits for running stability checks to return.
 */
void IngestionWatcher::stop()
{
    if (!m_running) {
        return;
    }
    m_running = false;
    m_refreshTimer->stop();
    const QStringList watched = m_watcher->directories();
    if (!watched.isEmpty()) {
        m_watcher->removePaths(watched);
    }
    if (m_detector) {
        m_detector->cancel();
    }
    m_stabilityPool.waitForDone();
    qCInfo(lcWatcher) << "Stopped watching" << m_scanRoot;
}

/**
 * @brief Re-runs the stability check for a file that previously failed.
 * @param path File to check again.
 */
void IngestionWatcher::retry(const QString &path)
{
    if (!m_running) {
        return;
    }
    const QString normalized = PlatformUtils::normalizePath(path);
    const QFileInfo info(normalized);
    if (!ScanImageUtils::isScanImageInfo(info)) {
        emit fileFailed(normalized);
        return;
    }
    {
        QMutexLocker locker(&m_trackedMutex);
        auto it = m_tracked.find(normalized);
        if (it != m_tracked.end() && it.value().state != SourceFile::State::Failed) {
            return;
        }
    }
    registerCandidate(normalized, EntryStamp{info.size(), info.lastModified().toMSecsSinceEpoch()});
}

/**
 * @brief Lists the scan folder and turns the difference with the last listing into events.
 */
void IngestionWatcher::rescan()
{
    if (!m_running) {
        return;
    }
    if (!m_watcher->directories().contains(m_scanRoot) && QDir(m_scanRoot).exists()) {
        m_watcher->addPath(m_scanRoot);
    }
    applySnapshot(listEntries());
}

QHash<QString, IngestionWatcher::EntryStamp> IngestionWatcher::listEntries() const
{
    QHash<QString, EntryStamp> entries;
    const QDir dir(m_scanRoot);
    const QFileInfoList infos = dir.entryInfoList(QDir::Files | QDir::NoDotAndDotDot, QDir::NoSort);
    entries.reserve(infos.size());
    for (const QFileInfo &info : infos) {
        if (!ScanImageUtils::isScanImageName(info.fileName())) {
            continue;
        }
        entries.insert(PlatformUtils::normalizePath(info.absoluteFilePath()),
                       EntryStamp{info.size(), info.lastModified().toMSecsSinceEpoch()});
    }
    return entries;
}

/**
 * @brief Resolves creations, deletions, and renames between two listings.
 *
 * A path that disappeared and a path that appeared with the same size and
 * modification time in the same listing are reported as one rename.
 *
 * @param entries Current listing of the scan folder.
 */
void IngestionWatcher::applySnapshot(const QHash<QString, EntryStamp> &entries)
{
    QStringList removed;
    QStringList added;
    for (auto it = m_snapshot.cbegin(); it != m_snapshot.cend(); ++it) {
        if (!entries.contains(it.key())) {
            removed.append(it.key());
        }
    }
    for (auto it = entries.cbegin(); it != entries.cend(); ++it) {
        if (!m_snapshot.contains(it.key())) {
            added.append(it.key());
        }
    }
    removed = ScanImageUtils::sortedNaturally(removed);
    added = ScanImageUtils::sortedNaturally(added);

    QSet<QString> consumed;
    for (const QString &oldPath : removed) {
        const EntryStamp oldStamp = m_snapshot.value(oldPath);
        QString newPath;
        for (const QString &candidate : added) {
            if (!consumed.contains(candidate) && entries.value(candidate) == oldStamp) {
                newPath = candidate;
                break;
            }
        }

        SourceFile::State oldState = SourceFile::State::Pending;
        bool wasTracked = false;
        bool wasAnnounced = false;
        {
            QMutexLocker locker(&m_trackedMutex);
            const auto it = m_tracked.constFind(oldPath);
            if (it != m_tracked.cend()) {
                wasTracked = true;
                oldState = it.value().state;
                wasAnnounced = it.value().announced;
            }
        }

        if (!newPath.isEmpty() && wasTracked && oldState == SourceFile::State::Ready) {
            consumed.insert(newPath);
            {
                QMutexLocker locker(&m_trackedMutex);
                SourceFile file = m_tracked.take(oldPath);
                file.path = newPath;
                m_tracked.insert(newPath, file);
            }
            qCInfo(lcWatcher) << "Renamed" << oldPath << "->" << newPath;
            emit fileRenamed(oldPath, newPath);
            continue;
        }

        forget(oldPath);
        if (wasAnnounced) {
            qCInfo(lcWatcher) << "Removed" << oldPath;
            emit fileRemoved(oldPath);
        } else if (wasTracked) {
            qCDebug(lcWatcher) << "Dropped before it was ready" << oldPath;
        }
    }

    for (const QString &path : added) {
        if (consumed.contains(path)) {
            continue;
        }
        registerCandidate(path, entries.value(path));
    }

    for (auto it = entries.cbegin(); it != entries.cend(); ++it) {
        if (!m_snapshot.contains(it.key()) || m_snapshot.value(it.key()) == it.value()) {
            continue;
        }
        bool rewrittenWhileReady = false;
        {
            QMutexLocker locker(&m_trackedMutex);
            const auto tracked = m_tracked.constFind(it.key());
            rewrittenWhileReady = tracked != m_tracked.cend() && tracked.value().state != SourceFile::State::Pending;
        }
        if (rewrittenWhileReady) {
            qCDebug(lcWatcher) << "Rewritten in place, checking again" << it.key();
            registerCandidate(it.key(), it.value());
        }
    }

    m_snapshot = entries;
}

/**
 * @brief Tracks a path as pending and schedules its stability check.
 * @param path Normalized file path.
 * @param stamp Size and modification time seen in the listing.
 */
void IngestionWatcher::registerCandidate(const QString &path, const EntryStamp &stamp)
{
    {
        QMutexLocker locker(&m_trackedMutex);
        SourceFile &file = m_tracked[path];
        if (file.path.isEmpty()) {
            file.path = path;
            file.discoveredAt = QDateTime::currentDateTime();
        }
        file.sizeBytes = stamp.size;
        file.modified = QDateTime::fromMSecsSinceEpoch(stamp.modifiedMs);
        file.state = SourceFile::State::Pending;
    }
    qCDebug(lcWatcher) << "Candidate" << path << "size" << stamp.size;
    startStabilityCheck(path);
}

void IngestionWatcher::startStabilityCheck(const QString &path)
{
    if (!m_detector) {
        finishStabilityCheck(path, 0, StabilityDetector::Outcome::Stable);
        return;
    }

    const quint64 generation = ++m_generationCounter;
    {
        QMutexLocker locker(&m_trackedMutex);
        auto it = m_tracked.find(path);
        if (it == m_tracked.end()) {
            return;
        }
        it.value().generation = generation;
    }

    StabilityDetector *detector = m_detector;
    const int timeoutMs = detector->defaultTimeoutMs();
    auto future = QtConcurrent::run(&m_stabilityPool, [detector, path, timeoutMs]() {
        return detector->check(path, timeoutMs);
    });

    auto *watcher = new QFutureWatcher<StabilityDetector::Outcome>(this);
    connect(watcher, &QFutureWatcher<StabilityDetector::Outcome>::finished, this, [this, watcher, path, generation]() {
        const StabilityDetector::Outcome outcome = watcher->result();
        watcher->deleteLater();
        finishStabilityCheck(path, generation, outcome);
    });
    watcher->setFuture(future);
}

/**
 * @brief Publishes the result of a stability check unless it became stale.
 * @param path File that was checked.
 * @param generation Check generation; zero accepts any generation.
 * @param outcome Result of the check.
 */
void IngestionWatcher::finishStabilityCheck(const QString &path,
                                            quint64 generation,
                                            StabilityDetector::Outcome outcome)
{
    if (!m_running || outcome == StabilityDetector::Outcome::Cancelled) {
        return;
    }
    bool announced = false;
    {
        QMutexLocker locker(&m_trackedMutex);
        auto it = m_tracked.find(path);
        if (it == m_tracked.end() || (generation != 0 && it.value().generation != generation)) {
            return;
        }
        announced = it.value().announced;
        switch (outcome) {
        case StabilityDetector::Outcome::Stable:
            it.value().state = SourceFile::State::Ready;
            it.value().announced = true;
            break;
        case StabilityDetector::Outcome::TimedOut:
            it.value().state = SourceFile::State::Failed;
            it.value().announced = true;
            break;
        case StabilityDetector::Outcome::Vanished:
        case StabilityDetector::Outcome::Cancelled:
            break;
        }
    }

    switch (outcome) {
    case StabilityDetector::Outcome::Stable:
        qCInfo(lcWatcher) << "Ready" << path;
        emit fileReady(path);
        break;
    case StabilityDetector::Outcome::TimedOut:
        qCWarning(lcWatcher) << "Not stable before timeout" << path;
        emit fileFailed(path);
        break;
    case StabilityDetector::Outcome::Vanished:
        forget(path);
        m_snapshot.remove(path);
        if (announced) {
            emit fileRemoved(path);
        }
        break;
    case StabilityDetector::Outcome::Cancelled:
        break;
    }
}

void IngestionWatcher::forget(const QString &path)
{
    QMutexLocker locker(&m_trackedMutex);
    m_tracked.remove(path);
}
