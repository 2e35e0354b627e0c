#pragma once

#include <QString>

#include "RetryPolicy.h"

class QFileInfo;

namespace FileOperationUtils {

void applyFileTimes(const QFileInfo &sourceInfo, const QString &targetPath);
bool copyFolderRecursive(const QString &sourcePath,
                         const QString &targetPath,
                         const char *context,
                         const RetryPolicy &retry,
                         QString *error);
bool verifyTreeSizes(const QString &sourcePath, const QString &targetPath, QString *error);
bool copyFolderVerified(const QString &sourcePath,
                        const QString &targetPath,
                        const RetryPolicy &retry,
                        QString *error);
bool moveFile(const QString &sourcePath, const QString &targetPath, const RetryPolicy &retry, QString *error);
QString temporarySiblingPath(const QString &targetPath);

} // namespace FileOperationUtils
