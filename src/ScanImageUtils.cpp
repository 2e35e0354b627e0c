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

#include "ScanImageUtils.h"

#include <QCollator>
#include <QCoreApplication>
#include <QDir>
#include <QImageReader>
#include <QSet>

#include <algorithm>

namespace {

/**
 * @brief Returns the set of lowercase file suffixes accepted as scanned pages.
 * @return Set of suffixes without the leading dot.
 */
const QSet<QString> &scanImageSuffixSet()
{
    static const QSet<QString> suffixes = []() {
        QSet<QString> set;
        for (const QString &suffix : ScanImageUtils::scanImageSuffixes()) {
            set.insert(suffix);
        }
        return set;
    }();
    return suffixes;
}

QCollator makeNaturalCollator()
{
    QCollator collator;
    collator.setNumericMode(true);
    collator.setCaseSensitivity(Qt::CaseInsensitive);
    return collator;
}

} // namespace

namespace ScanImageUtils {

const QStringList &scanImageSuffixes()
{
    static const QStringList suffixes = {
        QStringLiteral("png"),
        QStringLiteral("jpg"),
        QStringLiteral("jpeg"),
        QStringLiteral("bmp"),
        QStringLiteral("gif"),
        QStringLiteral("tif"),
        QStringLiteral("tiff")
    };
    return suffixes;
}

/**
 * @brief Checks whether a file name has a scanned page suffix.
 * @param fileName File name or path to inspect.
 * @return True for hidden-free names with an accepted image suffix.
 */
bool isScanImageName(const QString &fileName)
{
    const QFileInfo info(fileName);
    if (info.fileName().startsWith(QLatin1Char('.'))) {
        return false;
    }
    return scanImageSuffixSet().contains(info.suffix().toLower());
}

bool isScanImageInfo(const QFileInfo &info)
{
    if (!info.exists() || info.isDir()) {
        return false;
    }
    return isScanImageName(info.fileName());
}

/**
 * @brief Orders names the way an operator reads them, so page2 sorts before page10.
 * @param left First name.
 * @param right Second name.
 * @return True if left sorts before right.
 */
bool naturalLess(const QString &left, const QString &right)
{
    static thread_local const QCollator collator = makeNaturalCollator();
    const int result = collator.compare(left, right);
    if (result != 0) {
        return result < 0;
    }
    return left < right;
}

QStringList sortedNaturally(const QStringList &paths)
{
    QStringList sorted = paths;
    std::stable_sort(sorted.begin(), sorted.end(), [](const QString &left, const QString &right) {
        return naturalLess(QFileInfo(left).fileName(), QFileInfo(right).fileName());
    });
    return sorted;
}

/**
 * @brief Lists scanned pages directly inside a folder, in natural order.
 * @param folderPath Folder to list (not recursive).
 * @return Absolute paths of accepted image files.
 */
QStringList listScanImages(const QString &folderPath)
{
    QStringList paths;
    const QDir dir(folderPath);
    if (!dir.exists()) {
        return paths;
    }
    const QFileInfoList entries = dir.entryInfoList(QDir::Files | QDir::NoDotAndDotDot, QDir::NoSort);
    paths.reserve(entries.size());
    for (const QFileInfo &entry : entries) {
        if (isScanImageName(entry.fileName())) {
            paths.append(entry.absoluteFilePath());
        }
    }
    return sortedNaturally(paths);
}

int countScanImages(const QString &folderPath)
{
    int count = 0;
    const QDir dir(folderPath);
    if (!dir.exists()) {
        return count;
    }
    const QFileInfoList entries = dir.entryInfoList(QDir::Files | QDir::NoDotAndDotDot, QDir::NoSort);
    for (const QFileInfo &entry : entries) {
        if (isScanImageName(entry.fileName())) {
            count += 1;
        }
    }
    return count;
}

/**
 * @brief Lists batch folders in a staging root, skipping hidden ones still being built.
 * @param stagingRoot Staging folder.
 * @return Absolute batch paths in natural order.
 */
QStringList listBatchFolders(const QString &stagingRoot)
{
    QStringList paths;
    const QDir dir(stagingRoot);
    if (!dir.exists()) {
        return paths;
    }
    const QFileInfoList entries = dir.entryInfoList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::NoSort);
    for (const QFileInfo &entry : entries) {
        if (!entry.fileName().startsWith(QLatin1Char('.'))) {
            paths.append(QDir::cleanPath(entry.absoluteFilePath()));
        }
    }
    return sortedNaturally(paths);
}

/**
 * @brief Decodes an image, retrying while the file is locked or partially readable.
 * @param path Image file path.
 * @param retry Attempt count and delay between attempts.
 * @return Decoded image applying its orientation tag, or the last reader error.
 */
DecodeResult decodeImage(const QString &path, const RetryPolicy &retry)
{
    DecodeResult result;
    if (!QFileInfo::exists(path)) {
        result.error = QCoreApplication::translate("ScanImageUtils", "File not found");
        return result;
    }
    QString lastError;
    const bool decoded = RetryUtils::runWithRetry(retry, [&]() {
        QImageReader reader(path);
        reader.setAutoTransform(true);
        QImage image = reader.read();
        if (image.isNull()) {
            lastError = reader.errorString();
            return false;
        }
        result.image = image;
        return true;
    });
    result.ok = decoded;
    if (!decoded) {
        result.error = lastError;
    }
    return result;
}

} // namespace ScanImageUtils
