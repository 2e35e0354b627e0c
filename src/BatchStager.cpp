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

#include "BatchStager.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QSet>

#include "FileOperationUtils.h"
#include "Logging.h"
#include "PlatformUtils.h"
#include "ScanImageUtils.h"

namespace {
struct BatchStagerConstants {
    static constexpr char buildSuffix[] = ".partial";
    static constexpr int pageNumberWidth = 4;
    static constexpr int notCancelled = 0;
};

QString stagerError(const char *message)
{
    return QCoreApplication::translate("BatchStager", message);
}
} // namespace

BatchStager::BatchStager(const QString &stagingRoot, const RetryPolicy &retry)
    : m_stagingRoot(PlatformUtils::normalizePath(stagingRoot))
    , m_retry(retry)
{
}

QString BatchStager::stagingRoot() const
{
    return m_stagingRoot;
}

/**
 * @brief Moves scanned files into a new batch, numbering them in natural order.
 *
 * Any failure or cancellation moves the files already staged back to their
 * original paths and removes the hidden build folder.
 *
 * @param name Batch name, used as the folder name.
 * @param paths Files to move; each must be a scanned image.
 * @param batch Optional output description of the created batch.
 * @param error Optional output error message.
 * @param cancelled Optional flag polled between files.
 * @param progress Optional callback receiving moved and total file counts.
 * @return True when the batch folder exists with every file.
 */
bool BatchStager::createBatch(const QString &name,
                              const QStringList &paths,
                              Batch *batch,
                              QString *error,
                              const QAtomicInt *cancelled,
                              const ProgressCallback &progress) const
{
    if (!validateRequest(name, paths, error)) {
        return false;
    }
    if (!QDir().mkpath(m_stagingRoot)) {
        if (error) {
            *error = stagerError("Cannot create staging folder: %1").arg(m_stagingRoot);
        }
        return false;
    }

    const QDir stagingDir(m_stagingRoot);
    const QString finalPath = stagingDir.filePath(name);
    const QString buildPath = stagingDir.filePath(QLatin1Char('.') + name + QLatin1String(BatchStagerConstants::buildSuffix));
    if (QFileInfo::exists(finalPath)) {
        if (error) {
            *error = stagerError("Batch already exists: %1").arg(name);
        }
        return false;
    }
    if (QFileInfo::exists(buildPath)) {
        if (error) {
            *error = stagerError("An unfinished build of this batch is in the staging folder: %1").arg(buildPath);
        }
        return false;
    }
    if (!QDir().mkpath(buildPath)) {
        if (error) {
            *error = stagerError("Cannot create folder: %1").arg(buildPath);
        }
        return false;
    }

    const QStringList ordered = ScanImageUtils::sortedNaturally(paths);
    const int total = ordered.size();
    QList<MovedPage> moved;
    moved.reserve(total);
    if (progress) {
        progress(0, total);
    }

    QString failure;
    for (int i = 0; i < total; ++i) {
        if (cancelled && cancelled->loadRelaxed() != BatchStagerConstants::notCancelled) {
            failure = stagerError("Batch creation cancelled");
            break;
        }
        const QString sourcePath = PlatformUtils::normalizePath(ordered.at(i));
        const QString stagedPath = QDir(buildPath).filePath(pageFileName(i + 1, QFileInfo(sourcePath).suffix()));
        QString moveError;
        if (!FileOperationUtils::moveFile(sourcePath, stagedPath, m_retry, &moveError)) {
            failure = moveError;
            break;
        }
        moved.append(MovedPage{sourcePath, stagedPath});
        if (progress) {
            progress(moved.size(), total);
        }
    }

    if (failure.isEmpty()) {
        QString renameError;
        const bool renamed = RetryUtils::runWithRetry(m_retry, [&]() {
            return PlatformUtils::renamePath(buildPath, finalPath, &renameError);
        });
        if (!renamed) {
            failure = renameError;
        }
    }

    if (!failure.isEmpty()) {
        qCWarning(lcBatch) << "Batch" << name << "not created:" << failure;
        if (!rollback(moved, buildPath)) {
            failure = stagerError("%1; some files remain in %2").arg(failure, buildPath);
        }
        if (error) {
            *error = failure;
        }
        return false;
    }

    if (batch) {
        batch->name = name;
        batch->path = finalPath;
        batch->sourcePaths = ordered;
        batch->createdAt = QDateTime::currentDateTime();
        batch->pageCount = total;
        batch->status = Batch::Status::Staged;
    }
    qCInfo(lcBatch) << "Created batch" << name << "with" << total << "pages";
    return true;
}

/**
 * @brief Describes the batches currently waiting in the staging root.
 * @return Batches in natural order of their names.
 */
QList<Batch> BatchStager::stagedBatches() const
{
    QList<Batch> batches;
    for (const QString &path : ScanImageUtils::listBatchFolders(m_stagingRoot)) {
        const QFileInfo info(path);
        Batch batch;
        batch.name = info.fileName();
        batch.path = path;
        batch.sourcePaths = ScanImageUtils::listScanImages(path);
        batch.pageCount = batch.sourcePaths.size();
        batch.createdAt = info.lastModified();
        batches.append(batch);
    }
    return batches;
}

/**
 * @brief Builds the staged name of a page.
 * @param index One-based page number.
 * @param suffix Original file suffix.
 * @return Name such as `0001.jpg`.
 */
QString BatchStager::pageFileName(int index, const QString &suffix)
{
    const QString number = QStringLiteral("%1").arg(index, BatchStagerConstants::pageNumberWidth, 10, QLatin1Char('0'));
    if (suffix.isEmpty()) {
        return number;
    }
    return number + QLatin1Char('.') + suffix.toLower();
}

bool BatchStager::validateRequest(const QString &name, const QStringList &paths, QString *error) const
{
    if (!PlatformUtils::validateEntryName(name, error)) {
        return false;
    }
    if (paths.isEmpty()) {
        if (error) {
            *error = stagerError("No files selected");
        }
        return false;
    }
    QSet<QString> seen;
    for (const QString &path : paths) {
        const QString normalized = PlatformUtils::normalizePath(path);
        if (seen.contains(normalized)) {
            if (error) {
                *error = stagerError("File selected twice: %1").arg(QFileInfo(path).fileName());
            }
            return false;
        }
        seen.insert(normalized);
        if (!ScanImageUtils::isScanImageInfo(QFileInfo(normalized))) {
            if (error) {
                *error = stagerError("Not a scanned image: %1").arg(path);
            }
            return false;
        }
    }
    return true;
}

/**
 * @brief Returns staged files to their original paths and removes the build folder.
 * @param moved Files already moved, in move order.
 * @param buildPath Hidden build folder.
 * @return True when every file was restored and the folder removed.
 */
bool BatchStager::rollback(const QList<MovedPage> &moved, const QString &buildPath) const
{
    bool restored = true;
    for (auto it = moved.crbegin(); it != moved.crend(); ++it) {
        QString moveError;
        if (!FileOperationUtils::moveFile(it->stagedPath, it->sourcePath, m_retry, &moveError)) {
            qCCritical(lcBatch) << "Cannot restore" << it->sourcePath << ":" << moveError;
            restored = false;
        }
    }
    if (!restored) {
        return false;
    }
    if (!QDir().rmdir(buildPath)) {
        qCWarning(lcBatch) << "Cannot remove build folder" << buildPath;
        return false;
    }
    return true;
}
