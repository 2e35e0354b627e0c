#pragma once

#include <QString>

namespace PlatformUtils {

QString normalizePath(const QString &path);
bool isSameVolume(const QString &sourcePath, const QString &targetDir);
bool validateEntryName(const QString &name, QString *error);
bool deletePermanently(const QString &path, QString *error);
bool renamePath(const QString &sourcePath, const QString &targetPath, QString *error);

} // namespace PlatformUtils
