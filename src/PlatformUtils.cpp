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

#include "PlatformUtils.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStorageInfo>

namespace PlatformUtils {

/**
 * @brief Normalizes a path for consistent comparisons across platforms.
 * @param path Input path to normalize.
 * @return Normalized absolute path using forward slashes.
 */
QString normalizePath(const QString &path)
{
    if (path.trimmed().isEmpty()) {
        return QString();
    }
    QString normalized = QDir::fromNativeSeparators(path.trimmed());
    normalized = QDir::cleanPath(QDir(normalized).absolutePath());
#ifdef Q_OS_WIN
    normalized = normalized.toLower();
#endif
    return normalized;
}

/**
 * @brief Reports whether a rename from source into target folder stays on one volume.
 * @param sourcePath Existing file or folder path.
 * @param targetDir Existing destination folder.
 * @return True when both paths live on the same mounted device.
 */
bool isSameVolume(const QString &sourcePath, const QString &targetDir)
{
    const QStorageInfo sourceVolume(sourcePath);
    const QStorageInfo targetVolume(targetDir);
    if (!sourceVolume.isValid() || !targetVolume.isValid()) {
        return false;
    }
    return sourceVolume.device() == targetVolume.device()
        && sourceVolume.rootPath() == targetVolume.rootPath();
}

/**
 * @brief Checks that a name can be used as a single folder or file entry.
 * @param name Candidate entry name.
 * @param error Optional output error message.
 * @return True if the name is usable, false otherwise.
 */
bool validateEntryName(const QString &name, QString *error)
{
    const QString trimmedName = name.trimmed();
    if (trimmedName.isEmpty()) {
        if (error) {
            *error = QCoreApplication::translate("PlatformUtils", "Name cannot be empty");
        }
        return false;
    }
    if (trimmedName != name) {
        if (error) {
            *error = QCoreApplication::translate("PlatformUtils", "Name cannot start or end with spaces");
        }
        return false;
    }

    const QChar forwardSlash = QLatin1Char('/');
    const QChar backSlash = QLatin1Char('\\');
    if (trimmedName.contains(forwardSlash) || trimmedName.contains(backSlash)) {
        if (error) {
            *error = QCoreApplication::translate("PlatformUtils", "Name cannot contain path separators");
        }
        return false;
    }
    if (trimmedName.startsWith(QLatin1Char('.'))) {
        if (error) {
            *error = QCoreApplication::translate("PlatformUtils", "Name cannot start with a dot");
        }
        return false;
    }
    return true;
}

/**
 * @brief Deletes a file or folder tree without going through the trash.
 * @param path File or folder path to remove.
 * @param error Optional output error message.
 * @return True if the path no longer exists, false otherwise.
 */
bool deletePermanently(const QString &path, QString *error)
{
    if (path.isEmpty()) {
        if (error) {
            *error = QCoreApplication::translate("PlatformUtils", "Path is empty");
        }
        return false;
    }
    const QFileInfo info(path);
    if (!info.exists()) {
        return true;
    }
    bool ok = false;
    if (info.isDir()) {
        QDir dir(path);
        ok = dir.removeRecursively();
    } else {
        ok = QFile::remove(path);
    }
    if (!ok && error) {
        *error = QCoreApplication::translate("PlatformUtils", "Failed to delete %1").arg(path);
    }
    return ok;
}

/**
 * @brief Renames a file or folder to a target path that must not exist yet.
 * @param sourcePath Existing file or folder path.
 * @param targetPath Full target path.
 * @param error Optional output error message.
 * @return True if rename succeeds, false otherwise.
 */
bool renamePath(const QString &sourcePath, const QString &targetPath, QString *error)
{
    const QFileInfo info(sourcePath);
    if (!info.exists()) {
        if (error) {
            *error = QCoreApplication::translate("PlatformUtils", "Source not found");
        }
        return false;
    }
    if (QFileInfo::exists(targetPath)) {
        if (error) {
            *error = QCoreApplication::translate("PlatformUtils", "Target already exists");
        }
        return false;
    }
    const bool ok = info.isDir()
        ? QDir().rename(sourcePath, targetPath)
        : QFile::rename(sourcePath, targetPath);
    if (!ok && error) {
        *error = QCoreApplication::translate("PlatformUtils", "Rename failed");
    }
    return ok;
}

} // namespace PlatformUtils
