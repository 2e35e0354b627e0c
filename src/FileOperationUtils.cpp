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

#include "FileOperationUtils.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QIODevice>
#include <QRandomGenerator>

#include "Logging.h"
#include "PlatformUtils.h"

namespace {

struct FileOperationConstants {
    static constexpr char partialSuffix[] = ".partial-";
};

void discardTemporary(const QString &path)
{
    if (!QFileInfo::exists(path)) {
        return;
    }
    QString error;
    if (!PlatformUtils::deletePermanently(path, &error)) {
        qCWarning(lcFiles) << "Cannot remove temporary copy" << path << error;
    }
}

} // namespace

namespace FileOperationUtils {

void applyFileTimes(const QFileInfo &sourceInfo, const QString &targetPath)
{
    QFile targetFile(targetPath);
    if (!targetFile.open(QIODevice::ReadWrite)) {
        return;
    }
    targetFile.setFileTime(sourceInfo.lastModified(), QFileDevice::FileModificationTime);
    const QDateTime birthTime = sourceInfo.birthTime();
    if (birthTime.isValid()) {
        targetFile.setFileTime(birthTime, QFileDevice::FileBirthTime);
    }
    targetFile.close();
}

bool copyFolderRecursive(const QString &sourcePath,
                         const QString &targetPath,
                         const char *context,
                         const RetryPolicy &retry,
                         QString *error)
{
    const QDir sourceDir(sourcePath);
    if (!sourceDir.exists()) {
        if (error) {
            *error = QCoreApplication::translate(context, "Source not found");
        }
        return false;
    }
    if (QFileInfo::exists(targetPath)) {
        if (error) {
            *error = QCoreApplication::translate(context, "Target already exists");
        }
        return false;
    }
    if (!QDir().mkpath(targetPath)) {
        if (error) {
            *error = QCoreApplication::translate(context, "Cannot create target folder");
        }
        return false;
    }

    const QFileInfoList entries = sourceDir.entryInfoList(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden,
                                                          QDir::NoSort);
    for (const QFileInfo &entry : entries) {
        const QString entryPath = entry.absoluteFilePath();
        const QString targetEntryPath = QDir(targetPath).filePath(entry.fileName());
        if (entry.isDir()) {
            if (!copyFolderRecursive(entryPath, targetEntryPath, context, retry, error)) {
                return false;
            }
        } else {
            if (QFileInfo::exists(targetEntryPath)) {
                if (error) {
                    *error = QCoreApplication::translate(context, "Target already exists");
                }
                return false;
            }
            const bool copied = RetryUtils::runWithRetry(retry, [&]() {
                if (QFile::copy(entryPath, targetEntryPath)) {
                    return true;
                }
                QFile::remove(targetEntryPath);
                return false;
            });
            if (!copied) {
                if (error) {
                    *error = QCoreApplication::translate(context, "Copy failed: %1").arg(entry.fileName());
                }
                return false;
            }
            applyFileTimes(entry, targetEntryPath);
        }
    }
    return true;
}

/**
 * @brief Compares two trees file by file on byte size.
 * @param sourcePath Reference folder.
 * @param targetPath Copied folder to verify.
 * @param error Optional output error message naming the first mismatch.
 * @return True when every source file exists in the target with the same size.
 */
bool verifyTreeSizes(const QString &sourcePath, const QString &targetPath, QString *error)
{
    const QDir sourceDir(sourcePath);
    const QFileInfoList entries = sourceDir.entryInfoList(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden,
                                                          QDir::NoSort);
    for (const QFileInfo &entry : entries) {
        const QString targetEntryPath = QDir(targetPath).filePath(entry.fileName());
        const QFileInfo targetInfo(targetEntryPath);
        if (entry.isDir()) {
            if (!targetInfo.isDir() || !verifyTreeSizes(entry.absoluteFilePath(), targetEntryPath, error)) {
                if (error && error->isEmpty()) {
                    *error = QCoreApplication::translate("FileOperationUtils", "Missing folder in copy: %1")
                        .arg(entry.fileName());
                }
                return false;
            }
            continue;
        }
        if (!targetInfo.exists() || targetInfo.size() != entry.size()) {
            if (error) {
                *error = QCoreApplication::translate("FileOperationUtils", "Size mismatch after copy: %1")
                    .arg(entry.fileName());
            }
            return false;
        }
    }
    return true;
}

/**
 * @brief Builds a hidden, unique sibling path used while a copy is in progress.
 * @param targetPath Final path the copy will be renamed to.
 * @return Path in the same folder as the target, starting with a dot.
 */
QString temporarySiblingPath(const QString &targetPath)
{
    const QFileInfo info(targetPath);
    const QString suffix = QString::number(QRandomGenerator::global()->generate(), 16);
    return info.dir().filePath(QLatin1Char('.') + info.fileName()
                               + QLatin1String(FileOperationConstants::partialSuffix) + suffix);
}

/**
 * @brief Copies a folder to another volume through a verified temporary sibling.
 *
 * The copy is written to a hidden sibling of the target, verified on size, and
 * only then renamed into place. The source is never modified; any failure
 * removes the temporary copy.
 *
 * @param sourcePath Folder to copy.
 * @param targetPath Final folder path on the destination volume.
 * @param retry Retry policy for each file copy and the final rename.
 * @param error Optional output error message.
 * @return True when the target is complete.
 */
bool copyFolderVerified(const QString &sourcePath,
                        const QString &targetPath,
                        const RetryPolicy &retry,
                        QString *error)
{
    const QString temporaryPath = temporarySiblingPath(targetPath);
    QString copyError;
    if (!copyFolderRecursive(sourcePath, temporaryPath, "FileOperationUtils", retry, &copyError)) {
        discardTemporary(temporaryPath);
        if (error) {
            *error = copyError;
        }
        return false;
    }
    QString verifyError;
    if (!verifyTreeSizes(sourcePath, temporaryPath, &verifyError)) {
        discardTemporary(temporaryPath);
        if (error) {
            *error = verifyError;
        }
        return false;
    }

    QString renameError;
    const bool renamed = RetryUtils::runWithRetry(retry, [&]() {
        return PlatformUtils::renamePath(temporaryPath, targetPath, &renameError);
    });
    if (!renamed) {
        discardTemporary(temporaryPath);
        if (error) {
            *error = renameError;
        }
        return false;
    }
    return true;
}

/**
 * @brief Moves one file, renaming on the same volume and copying with verification otherwise.
 * @param sourcePath Existing file.
 * @param targetPath Target file path that must not exist yet.
 * @param retry Retry policy for transient failures.
 * @param error Optional output error message.
 * @return True when the file exists only at the target path.
 */
bool moveFile(const QString &sourcePath, const QString &targetPath, const RetryPolicy &retry, QString *error)
{
    const QFileInfo sourceInfo(sourcePath);
    if (!sourceInfo.exists()) {
        if (error) {
            *error = QCoreApplication::translate("FileOperationUtils", "Source not found: %1").arg(sourcePath);
        }
        return false;
    }
    if (QFileInfo::exists(targetPath)) {
        if (error) {
            *error = QCoreApplication::translate("FileOperationUtils", "Target already exists: %1").arg(targetPath);
        }
        return false;
    }

    const QString targetDir = QFileInfo(targetPath).absolutePath();
    if (PlatformUtils::isSameVolume(sourcePath, targetDir)) {
        QString renameError;
        const bool renamed = RetryUtils::runWithRetry(retry, [&]() {
            return PlatformUtils::renamePath(sourcePath, targetPath, &renameError);
        });
        if (!renamed && error) {
            *error = renameError;
        }
        return renamed;
    }

    const QString temporaryPath = temporarySiblingPath(targetPath);
    const bool copied = RetryUtils::runWithRetry(retry, [&]() {
        QFile::remove(temporaryPath);
        return QFile::copy(sourcePath, temporaryPath);
    });
    if (!copied || QFileInfo(temporaryPath).size() != sourceInfo.size()) {
        discardTemporary(temporaryPath);
        if (error) {
            *error = QCoreApplication::translate("FileOperationUtils", "Copy failed: %1").arg(sourceInfo.fileName());
        }
        return false;
    }
    applyFileTimes(sourceInfo, temporaryPath);
    if (!QFile::rename(temporaryPath, targetPath)) {
        discardTemporary(temporaryPath);
        if (error) {
            *error = QCoreApplication::translate("FileOperationUtils", "Rename failed: %1").arg(targetPath);
        }
        return false;
    }
    const bool removed = RetryUtils::runWithRetry(retry, [&]() {
        return QFile::remove(sourcePath);
    });
    if (!removed) {
        discardTemporary(targetPath);
        if (error) {
            *error = QCoreApplication::translate("FileOperationUtils", "Cannot remove source: %1").arg(sourcePath);
        }
        return false;
    }
    return true;
}

} // namespace FileOperationUtils
