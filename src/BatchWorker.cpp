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

#include "BatchWorker.h"

namespace {
struct BatchWorkerConstants {
    static constexpr int notCancelled = 0;
    static constexpr int cancelled = 1;
};
} // namespace

/**
 * @brief Creates a worker building one batch.
 * @param stager Stager bound to the staging root.
 * @param name Batch name.
 * @param paths Files to move into the batch.
 * @param parent Parent QObject for ownership.
 */
BatchWorker::BatchWorker(const BatchStager &stager, const QString &name, const QStringList &paths, QObject *parent)
    : QObject(parent)
    , m_stager(stager)
    , m_name(name)
    , m_paths(paths)
{
}

/**
 * @brief Requests cancellation; files already moved are put back.
 */
void BatchWorker::cancel()
{
    m_cancelled.storeRelaxed(BatchWorkerConstants::cancelled);
}

bool BatchWorker::isCancelled() const
{
    return m_cancelled.loadRelaxed() != BatchWorkerConstants::notCancelled;
}

/**
 * @brief Builds the batch and emits progress and completion.
 */
void BatchWorker::start()
{
    BatchResult result;
    result.name = m_name;
    result.ok = m_stager.createBatch(m_name, m_paths, &result.batch, &result.error, &m_cancelled,
                                     [this](int completed, int total) {
                                         emit progress(completed, total);
                                     });
    result.cancelled = !result.ok && isCancelled();
    emit finished(result);
}
