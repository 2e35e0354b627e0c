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

#include "Logging.h"

#include <QCoreApplication>
#include <QFile>
#include <QMutex>
#include <QMutexLocker>
#include <QTextStream>

#include <memory>

Q_LOGGING_CATEGORY(lcFiles, "scanshelf.files", QtInfoMsg)
Q_LOGGING_CATEGORY(lcWatcher, "scanshelf.watcher", QtInfoMsg)
Q_LOGGING_CATEGORY(lcCache, "scanshelf.cache", QtInfoMsg)
Q_LOGGING_CATEGORY(lcThumbnails, "scanshelf.thumbnails", QtInfoMsg)
Q_LOGGING_CATEGORY(lcTransfer, "scanshelf.transfer", QtInfoMsg)
Q_LOGGING_CATEGORY(lcBatch, "scanshelf.batch", QtInfoMsg)
Q_LOGGING_CATEGORY(lcStats, "scanshelf.stats", QtInfoMsg)
Q_LOGGING_CATEGORY(lcConfig, "scanshelf.config", QtInfoMsg)

namespace {

struct LoggingConstants {
    static constexpr char messagePattern[] =
        "%{time yyyy-MM-dd hh:mm:ss.zzz} [%{type}] %{category}: %{message}";
    static constexpr char verboseRules[] = "scanshelf.*.debug=true";
};

QMutex logFileMutex;
std::unique_ptr<QFile> logFile;
QtMessageHandler previousHandler = nullptr;
bool handlerInstalled = false;

void mirrorToFile(QtMsgType type, const QMessageLogContext &context, const QString &message)
{
    {
        QMutexLocker locker(&logFileMutex);
        if (logFile && logFile->isOpen()) {
            QTextStream stream(logFile.get());
            stream << qFormatLogMessage(type, context, message) << '\n';
            stream.flush();
        }
    }
    if (previousHandler) {
        previousHandler(type, context, message);
    }
}

} // namespace

namespace Logging {

/**
 * @brief Configures the message pattern, verbosity, and optional file mirror.
 * @param logFilePath File receiving a copy of every message, or empty for console only.
 * @param verbose True to enable debug output for all scanshelf categories.
 * @param error Optional output error message.
 * @return True when logging is configured, false when the log file cannot be opened.
 */
bool initialize(const QString &logFilePath, bool verbose, QString *error)
{
    qSetMessagePattern(QString::fromLatin1(LoggingConstants::messagePattern));
    if (verbose) {
        QLoggingCategory::setFilterRules(QString::fromLatin1(LoggingConstants::verboseRules));
    }
    if (logFilePath.isEmpty()) {
        return true;
    }

    auto file = std::make_unique<QFile>(logFilePath);
    if (!file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        if (error) {
            *error = QCoreApplication::translate("Logging", "Cannot open log file: %1").arg(logFilePath);
        }
        return false;
    }

    QMutexLocker locker(&logFileMutex);
    logFile = std::move(file);
    if (!handlerInstalled) {
        previousHandler = qInstallMessageHandler(mirrorToFile);
        handlerInstalled = true;
    }
    return true;
}

/**
 * @brief Restores the default message handler and closes the log file.
 */
void shutdown()
{
    if (handlerInstalled) {
        qInstallMessageHandler(previousHandler);
        previousHandler = nullptr;
        handlerInstalled = false;
    }
    QMutexLocker locker(&logFileMutex);
    logFile.reset();
}

} // namespace Logging
