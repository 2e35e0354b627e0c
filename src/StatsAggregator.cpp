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

#include "StatsAggregator.h"

#include <QFileInfo>
#include <QFutureWatcher>
#include <QMutexLocker>
#include <QTimer>
#include <QtConcurrent>

#include "Logging.h"
#include "ScanImageUtils.h"

namespace {
struct StatsConstants {
    static constexpr int scanWindowSeconds = 20;
    static constexpr double secondsPerMinute = 60.0;
    static constexpr int minIntervalMs = 250;
};
} // namespace

/**
 * @brief Creates an idle aggregator.
 * @param stagingRoot Folder holding staged batches.
 * @param transferLogPath Durable log of archived batches.
 * @param settings Refresh interval.
 * @param parent Parent QObject for ownership.
 */
StatsAggregator::StatsAggregator(const QString &stagingRoot,
                                 const QString &transferLogPath,
                                 const StatsSettings &settings,
                                 QObject *parent)
    : QObject(parent)
    , m_stagingRoot(stagingRoot)
    , m_transferLogPath(transferLogPath)
    , m_settings(settings)
    , m_pendingCounter([]() { return 0; })
    , m_clock([]() { return QDateTime::currentDateTime(); })
    , m_timer(new QTimer(this))
{
    m_pool.setMaxThreadCount(1);
    m_timer->setInterval(qMax(StatsConstants::minIntervalMs, m_settings.intervalMs));
    connect(m_timer, &QTimer::timeout, this, &StatsAggregator::refresh);
}

StatsAggregator::~StatsAggregator()
{
    m_timer->stop();
    m_generation += 1;
    m_pool.waitForDone();
}

/**
 * @brief Sets the source of the pending count; it is called from a worker thread.
 * @param counter Thread-safe callable returning the number of ready loose files.
 */
void StatsAggregator::setPendingCounter(const PendingCounter &counter)
{
    m_pendingCounter = counter ? counter : PendingCounter([]() { return 0; });
}

void StatsAggregator::setClock(const Clock &clock)
{
    m_clock = clock ? clock : Clock([]() { return QDateTime::currentDateTime(); });
}

/**
 * @brief Recomputes every counter from disk.
 *
 * Blocks on file system reads; the periodic refresh runs it on a worker thread.
 *
 * @return Fresh statistics; an unreadable log counts as no transferred pages.
 */
ScanStats StatsAggregator::computeStats() const
{
    ScanStats stats;
    const QDateTime now = m_clock();
    stats.computedAt = now;
    stats.pending = m_pendingCounter();

    for (const QString &batchPath : ScanImageUtils::listBatchFolders(m_stagingRoot)) {
        const int pages = ScanImageUtils::countScanImages(batchPath);
        stats.stagedPagesByBatch.insert(QFileInfo(batchPath).fileName(), pages);
        stats.stagedBooks += 1;
        stats.stagedPages += pages;
    }

    TransferLog log(m_transferLogPath);
    QString logError;
    if (log.load(&logError)) {
        stats.recordsToday = log.recordsForDate(now.date());
        stats.transferredPagesToday = log.pagesForDate(now.date());
    } else {
        stats.logReadable = false;
        stats.logError = logError;
    }
    stats.totalPagesToday = stats.stagedPages + stats.transferredPagesToday;
    stats.scansPerMinute = scansPerMinuteAt(now);
    return stats;
}

/**
 * @brief Returns the result of the last periodic refresh.
 * @return Cached statistics; empty before the first refresh completes.
 */
ScanStats StatsAggregator::latest() const
{
    return m_latest;
}

double StatsAggregator::scansPerMinute() const
{
    return scansPerMinuteAt(m_clock());
}

bool StatsAggregator::isRunning() const
{
    return m_timer->isActive();
}

/**
 * @brief Starts periodic refreshes and runs one immediately.
 */
void StatsAggregator::start()
{
    if (m_timer->isActive()) {
        return;
    }
    m_timer->start();
    refresh();
}

/**
 * @brief Stops periodic refreshes and waits for a running computation to return.
 */
void StatsAggregator::stop()
{
    m_timer->stop();
    m_generation += 1;
    m_refreshQueued = false;
    m_pool.waitForDone();
}

/**
 * @brief Recomputes statistics off the calling thread and publishes them.
 *
 * While a computation runs, further requests collapse into one follow-up run
 * whose result replaces it. A result finishing after stop() is dropped.
 */
void StatsAggregator::refresh()
{
    if (m_refreshRunning) {
        m_refreshQueued = true;
        return;
    }
    m_refreshRunning = true;
    const int token = ++m_generation;
    auto future = QtConcurrent::run(&m_pool, [this]() {
        return computeStats();
    });
    auto *watcher = new QFutureWatcher<ScanStats>(this);
    connect(watcher, &QFutureWatcher<ScanStats>::finished, this, [this, watcher, token]() {
        const ScanStats stats = watcher->result();
        watcher->deleteLater();
        m_refreshRunning = false;
        if (m_refreshQueued) {
            m_refreshQueued = false;
            refresh();
        }
        if (token != m_generation) {
            return;
        }
        if (!stats.logReadable) {
            qCWarning(lcStats) << "Transfer log unreadable:" << stats.logError;
        }
        m_latest = stats;
        qCDebug(lcStats) << "pending" << stats.pending << "staged" << stats.stagedBooks << "books"
                         << stats.stagedPages << "pages, today" << stats.totalPagesToday;
        emit statsUpdated(stats);
    });
    watcher->setFuture(future);
}

/**
 * @brief Records that one file became ready now, for the scan rate.
 */
void StatsAggregator::recordScan()
{
    const QDateTime now = m_clock();
    const QDateTime windowStart = now.addSecs(-StatsConstants::scanWindowSeconds);
    QMutexLocker locker(&m_scanMutex);
    m_scanTimes.append(now);
    while (!m_scanTimes.isEmpty() && m_scanTimes.first() < windowStart) {
        m_scanTimes.removeFirst();
    }
}

double StatsAggregator::scansPerMinuteAt(const QDateTime &now) const
{
    const QDateTime windowStart = now.addSecs(-StatsConstants::scanWindowSeconds);
    QMutexLocker locker(&m_scanMutex);
    int count = 0;
    for (const QDateTime &time : m_scanTimes) {
        if (time >= windowStart && time <= now) {
            count += 1;
        }
    }
    return count * StatsConstants::secondsPerMinute / StatsConstants::scanWindowSeconds;
}
