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

#include "TransferEngine.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QMutexLocker>

#include "FileOperationUtils.h"
#include "Logging.h"
#include "PlatformUtils.h"
#include "ScanImageUtils.h"

namespace {
struct TransferConstants {
    static constexpr char datedFolderFormat[] = "dd-MM";
    static constexpr char transferredSuffix[] = ".transferred-";
};

QString transferError(const char *message)
{
    return QCoreApplication::translate("TransferEngine", message);
}
} // namespace

/**
 * @brief Creates an engine writing to the given log.
 * @param log Durable log shared with the owner; must outlive the engine.
 * @param retry Attempts and backoff for file system operations.
 * @param parent Parent QObject for ownership.
 */
TransferEngine::TransferEngine(TransferLog *log, const RetryPolicy &retry, QObject *parent)
    : QObject(parent)
    , m_log(log)
    , m_retry(retry)
    , m_clock([]() { return QDateTime::currentDateTime(); })
{
}

/**
 * @brief Archives every batch found in the staging root.
 *
 * The log is read before anything moves; an unreadable log aborts the run.
 * A second run on the same staging root while one is active is rejected.
 *
 * @param stagingRoot Folder holding one sub-folder per batch.
 * @param routing Identifier to destination root mapping.
 * @return Records of the archived batches and failures of the others.
 */
TransferReport TransferEngine::transferAll(const QString &stagingRoot, const RoutingTable &routing)
{
    TransferReport report;
    const QString root = PlatformUtils::normalizePath(stagingRoot);
    if (!beginRun(root)) {
        report.error = transferError("Transfer already in progress");
        qCWarning(lcTransfer) << "Rejected concurrent transfer of" << root;
        return report;
    }

    if (!QDir(root).exists()) {
        report.error = transferError("Staging folder not found: %1").arg(root);
        endRun(root);
        return report;
    }

    {
        QMutexLocker locker(&m_logMutex);
        QString loadError;
        if (!m_log || !m_log->load(&loadError)) {
            report.error = m_log ? loadError : transferError("No transfer log configured");
            qCWarning(lcTransfer) << "Transfer aborted:" << report.error;
            endRun(root);
            return report;
        }
    }

    const QDateTime now = m_clock();
    const QStringList batches = ScanImageUtils::listBatchFolders(root);
    qCInfo(lcTransfer) << "Transferring" << batches.size() << "batches from" << root;
    for (const QString &batchPath : batches) {
        const QString batchName = QFileInfo(batchPath).fileName();
        TransferPlanItem item;
        QString error;
        TransferRecord record;
        if (!planBatch(batchPath, routing, now.date(), &item, &error)
            || !transferBatch(item, now, &record, &error)) {
            qCWarning(lcTransfer) << "Batch" << batchName << "failed:" << error;
            report.failures.append(TransferFailure{batchName, error});
            emit transferFailed(batchName, error);
            continue;
        }
        report.records.append(record);
        emit batchTransferred(record);
    }

    report.ok = true;
    endRun(root);
    qCInfo(lcTransfer) << "Transfer finished:" << report.records.size() << "moved,"
                       << report.failures.size() << "failed";
    emit transferComplete(report.records);
    return report;
}

/**
 * @brief Lists the moves a transfer would perform without touching any file.
 * @param stagingRoot Folder holding one sub-folder per batch.
 * @param routing Identifier to destination root mapping.
 * @return Planned moves and the batches that would fail.
 */
TransferPlan TransferEngine::prepareTransfer(const QString &stagingRoot, const RoutingTable &routing) const
{
    TransferPlan plan;
    const QDate today = m_clock().date();
    for (const QString &batchPath : ScanImageUtils::listBatchFolders(PlatformUtils::normalizePath(stagingRoot))) {
        TransferPlanItem item;
        QString error;
        if (planBatch(batchPath, routing, today, &item, &error)) {
            plan.items.append(item);
        } else {
            plan.problems.append(TransferFailure{QFileInfo(batchPath).fileName(), error});
        }
    }
    return plan;
}

bool TransferEngine::isTransferring(const QString &stagingRoot) const
{
    QMutexLocker locker(&m_runMutex);
    return m_activeRoots.contains(PlatformUtils::normalizePath(stagingRoot));
}

/**
 * @brief Selects how batches reach their destination.
 * @param strategy Automatic renames on the same volume; AlwaysCopy forces the verified copy.
 */
void TransferEngine::setMoveStrategy(MoveStrategy strategy)
{
    m_strategy = strategy;
}

void TransferEngine::setClock(const Clock &clock)
{
    m_clock = clock ? clock : Clock([]() { return QDateTime::currentDateTime(); });
}

QString TransferEngine::datedFolderName(const QDate &date)
{
    return date.toString(QLatin1String(TransferConstants::datedFolderFormat));
}

bool TransferEngine::planBatch(const QString &batchPath,
                               const RoutingTable &routing,
                               const QDate &date,
                               TransferPlanItem *item,
                               QString *error) const
{
    const QString batchName = QFileInfo(batchPath).fileName();
    const QString identifier = RoutingTable::parseIdentifier(batchName);
    if (identifier.isEmpty()) {
        *error = transferError("No routing identifier in batch name");
        return false;
    }
    const QString destinationRoot = routing.destinationFor(identifier);
    if (destinationRoot.isEmpty()) {
        *error = transferError("No destination configured for identifier %1").arg(identifier);
        return false;
    }
    if (!QDir(destinationRoot).exists()) {
        *error = transferError("Destination folder not found: %1").arg(destinationRoot);
        return false;
    }
    const int pageCount = ScanImageUtils::countScanImages(batchPath);
    if (pageCount == 0) {
        *error = transferError("Batch has no pages");
        return false;
    }
    const QString datedFolder = QDir(destinationRoot).filePath(datedFolderName(date));
    const QString destinationPath = QDir(datedFolder).filePath(batchName);
    if (QFileInfo::exists(destinationPath)) {
        *error = transferError("Target already exists: %1").arg(destinationPath);
        return false;
    }

    item->batchName = batchName;
    item->sourcePath = batchPath;
    item->identifier = identifier;
    item->destinationPath = destinationPath;
    item->pageCount = pageCount;
    item->sameVolume = m_strategy == MoveStrategy::Automatic
        && PlatformUtils::isSameVolume(batchPath, destinationRoot);
    return true;
}

bool TransferEngine::transferBatch(const TransferPlanItem &item,
                                   const QDateTime &runTime,
                                   TransferRecord *record,
                                   QString *error)
{
    const QString datedFolder = QFileInfo(item.destinationPath).absolutePath();
    const bool created = RetryUtils::runWithRetry(m_retry, [&]() {
        return QDir().mkpath(datedFolder);
    });
    if (!created) {
        *error = transferError("Cannot create dated folder: %1").arg(datedFolder);
        return false;
    }

    record->batchName = item.batchName;
    record->pageCount = item.pageCount;
    record->destinationPath = item.destinationPath;
    record->timestamp = runTime;

    if (item.sameVolume) {
        return moveOnSameVolume(item, *record, error);
    }
    return moveAcrossVolumes(item, *record, error);
}

/**
 * @brief Renames the batch into place, then logs it; a failed log write renames it back.
 */
bool TransferEngine::moveOnSameVolume(const TransferPlanItem &item, const TransferRecord &record, QString *error)
{
    QString renameError;
    const bool moved = RetryUtils::runWithRetry(m_retry, [&]() {
        return PlatformUtils::renamePath(item.sourcePath, item.destinationPath, &renameError);
    });
    if (!moved) {
        *error = transferError("Cannot move batch: %1").arg(renameError);
        return false;
    }

    QString logError;
    if (appendRecord(record, &logError)) {
        qCInfo(lcTransfer) << "Moved" << item.batchName << "to" << item.destinationPath;
        return true;
    }

    QString restoreError;
    const bool restored = RetryUtils::runWithRetry(m_retry, [&]() {
        return PlatformUtils::renamePath(item.destinationPath, item.sourcePath, &restoreError);
    });
    if (!restored) {
        qCCritical(lcTransfer) << "Batch" << item.batchName << "moved but not logged, left at"
                               << item.destinationPath << ":" << restoreError;
        *error = transferError("Log write failed and batch could not be restored: %1").arg(logError);
        return false;
    }
    *error = logError;
    return false;
}

/**
 * @brief Copies the batch with verification, hides the staged original, logs, then deletes it.
 */
bool TransferEngine::moveAcrossVolumes(const TransferPlanItem &item, const TransferRecord &record, QString *error)
{
    QString copyError;
    if (!FileOperationUtils::copyFolderVerified(item.sourcePath, item.destinationPath, m_retry, &copyError)) {
        *error = transferError("Cannot copy batch: %1").arg(copyError);
        return false;
    }

    const QFileInfo sourceInfo(item.sourcePath);
    const QString hiddenPath = sourceInfo.dir().filePath(QLatin1Char('.') + sourceInfo.fileName()
                                                         + QLatin1String(TransferConstants::transferredSuffix)
                                                         + QString::number(record.timestamp.toMSecsSinceEpoch()));
    QString hideError;
    const bool hidden = RetryUtils::runWithRetry(m_retry, [&]() {
        return PlatformUtils::renamePath(item.sourcePath, hiddenPath, &hideError);
    });
    if (!hidden) {
        QString cleanupError;
        if (!PlatformUtils::deletePermanently(item.destinationPath, &cleanupError)) {
            qCWarning(lcTransfer) << "Cannot remove copy" << item.destinationPath << cleanupError;
        }
        *error = transferError("Cannot release staged batch: %1").arg(hideError);
        return false;
    }

    QString logError;
    if (!appendRecord(record, &logError)) {
        QString restoreError;
        const bool restored = RetryUtils::runWithRetry(m_retry, [&]() {
            return PlatformUtils::renamePath(hiddenPath, item.sourcePath, &restoreError);
        });
        if (!restored) {
            qCCritical(lcTransfer) << "Staged batch left hidden at" << hiddenPath << ":" << restoreError;
        }
        QString cleanupError;
        if (!PlatformUtils::deletePermanently(item.destinationPath, &cleanupError)) {
            qCWarning(lcTransfer) << "Cannot remove copy" << item.destinationPath << cleanupError;
        }
        *error = logError;
        return false;
    }

    QString deleteError;
    const bool deleted = RetryUtils::runWithRetry(m_retry, [&]() {
        return PlatformUtils::deletePermanently(hiddenPath, &deleteError);
    });
    if (!deleted) {
        qCWarning(lcTransfer) << "Archived batch still present in staging" << hiddenPath << deleteError;
    }
    qCInfo(lcTransfer) << "Copied" << item.batchName << "to" << item.destinationPath;
    return true;
}

/**
 * @brief Appends one record, retrying transient write failures.
 */
bool TransferEngine::appendRecord(const TransferRecord &record, QString *error)
{
    QMutexLocker locker(&m_logMutex);
    return RetryUtils::runWithRetry(m_retry, [&]() {
        return m_log->append(record, error);
    });
}

bool TransferEngine::beginRun(const QString &stagingRoot)
{
    QMutexLocker locker(&m_runMutex);
    if (m_activeRoots.contains(stagingRoot)) {
        return false;
    }
    m_activeRoots.insert(stagingRoot);
    return true;
}

void TransferEngine::endRun(const QString &stagingRoot)
{
    QMutexLocker locker(&m_runMutex);
    m_activeRoots.remove(stagingRoot);
}
