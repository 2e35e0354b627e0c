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

#include "TransferWorker.h"

/**
 * @brief Creates a worker running one transfer on its own thread.
 * @param engine Engine shared with the owner; must outlive the worker.
 * @param stagingRoot Staging folder to drain.
 * @param routing Routing snapshot for this run.
 * @param parent Parent QObject for ownership.
 */
TransferWorker::TransferWorker(TransferEngine *engine,
                               const QString &stagingRoot,
                               const RoutingTable &routing,
                               QObject *parent)
    : QObject(parent)
    , m_engine(engine)
    , m_stagingRoot(stagingRoot)
    , m_routing(routing)
{
}

void TransferWorker::start()
{
    TransferReport report;
    if (!m_engine) {
        report.error = tr("No transfer engine");
        emit finished(report);
        return;
    }
    report = m_engine->transferAll(m_stagingRoot, m_routing);
    emit finished(report);
}
