#pragma once

#include <QFileInfo>
#include <QImage>
#include <QString>
#include <QStringList>

#include "RetryPolicy.h"

namespace ScanImageUtils {

struct DecodeResult {
    bool ok = false;
    QImage image;
    QString error;
};

const QStringList &scanImageSuffixes();
bool isScanImageName(const QString &fileName);
bool isScanImageInfo(const QFileInfo &info);
bool naturalLess(const QString &left, const QString &right);
QStringList sortedNaturally(const QStringList &paths);
QStringList listScanImages(const QString &folderPath);
int countScanImages(const QString &folderPath);
QStringList listBatchFolders(const QString &stagingRoot);
DecodeResult decodeImage(const QString &path, const RetryPolicy &retry);

} // namespace ScanImageUtils
