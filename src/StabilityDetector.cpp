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

#include "StabilityDetector.h"

#include <QDateTime>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include "Logging.h"

namespace {
struct StabilityConstants {
    static constexpr int notCancelled = 0;
    static constexpr int cancelled = 1;
    static constexpr qint64 emptySize = 0;
};
} // namespace

/**
 * @brief Creates a detector with the given polling parameters.
 * @param settings Poll interval, required consecutive matches, probe size, and default timeout.
 */
StabilityDetector::StabilityDetector(const StabilitySettings &settings)
    : m_settings(settings)
{
}

/**
 * @brief Reports whether a file finished being written within the timeout.
 * @param path File to observe.
 * @param timeoutMs Maximum time to wait; a value of zero or less uses the configured default.
 * @return True when the file is stable, false when it is not ready yet.
 */
bool StabilityDetector::isStable(const QString &path, int timeoutMs) const
{
    return check(path, timeoutMs) == Outcome::Stable;
}

/**
 * @brief Polls size, modification time, and readability until they settle.
 *
 * A sample matches when size and modification time equal the previous sample
 * and the first bytes can be read. Any difference or probe failure resets the
 * run of matches; readiness requires the configured number of matches in a row.
 *
 * @param path File to observe.
 * @param timeoutMs Maximum time to wait; a value of zero or less uses the configured default.
 * @return Outcome of the observation.
 */
StabilityDetector::Outcome StabilityDetector::check(const QString &path, int timeoutMs) const
{
    const int budgetMs = timeoutMs > 0 ? timeoutMs : m_settings.timeoutMs;
    QElapsedTimer timer;
    timer.start();

    Sample previous;
    int matches = 0;
    while (true) {
        if (isCancelled()) {
            return Outcome::Cancelled;
        }
        const Sample current = sample(path);
        if (!current.exists) {
            qCDebug(lcWatcher) << "File vanished while waiting for stability" << path;
            return Outcome::Vanished;
        }

        const bool unchanged = previous.exists
            && current.size == previous.size
            && current.modifiedMs == previous.modifiedMs
            && current.size > StabilityConstants::emptySize;
        if (unchanged && probeRead(path)) {
            matches += 1;
        } else {
            matches = 0;
        }
        previous = current;

        if (matches >= m_settings.requiredMatches) {
            qCDebug(lcWatcher) << "File stable after" << timer.elapsed() << "ms" << path;
            return Outcome::Stable;
        }
        if (timer.elapsed() + m_settings.pollIntervalMs > budgetMs) {
            qCDebug(lcWatcher) << "Stability timeout for" << path << "size" << current.size;
            return Outcome::TimedOut;
        }
        QThread::msleep(static_cast<unsigned long>(m_settings.pollIntervalMs));
    }
}

int StabilityDetector::defaultTimeoutMs() const
{
    return m_settings.timeoutMs;
}

/**
 * @brief Makes every running and future check return Cancelled until reset.
 */
void StabilityDetector::cancel()
{
    m_cancelled.storeRelaxed(StabilityConstants::cancelled);
}

void StabilityDetector::reset()
{
    m_cancelled.storeRelaxed(StabilityConstants::notCancelled);
}

StabilityDetector::Sample StabilityDetector::sample(const QString &path) const
{
    Sample result;
    QFileInfo info(path);
    info.setCaching(false);
    if (!info.exists() || info.isDir()) {
        return result;
    }
    result.exists = true;
    result.size = info.size();
    result.modifiedMs = info.lastModified().toMSecsSinceEpoch();
    return result;
}

/**
 * @brief Opens the file and reads its first bytes to confirm the writer released it.
 * @param path File to probe.
 * @return True when the read succeeded.
 */
bool StabilityDetector::probeRead(const QString &path) const
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return false;
    }
    const QByteArray head = file.read(m_settings.probeBytes);
    const bool ok = !head.isEmpty() && file.error() == QFileDevice::NoError;
    file.close();
    return ok;
}

bool StabilityDetector::isCancelled() const
{
    return m_cancelled.loadRelaxed() != StabilityConstants::notCancelled;
}
