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

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QTextStream>

#include "AppSettings.h"
#include "BatchStager.h"
#include "Logging.h"
#include "ScanImageUtils.h"
#include "ScanPipeline.h"
#include "StatsAggregator.h"
#include "TransferEngine.h"
#include "TransferLog.h"

namespace {

struct ExitCodes {
    static constexpr int success = 0;
    static constexpr int failure = 1;
};

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

bool requirePath(const QString &path, const char *name)
{
    if (!path.isEmpty()) {
        return true;
    }
    err() << QCoreApplication::translate("main", "Missing setting: %1").arg(QLatin1String(name)) << Qt::endl;
    return false;
}

int runWatch(const AppSettings &settings, QCoreApplication &app)
{
    if (!requirePath(settings.paths.scanRoot, "paths/scan_root")
        || !requirePath(settings.paths.stagingRoot, "paths/staging_root")) {
        return ExitCodes::failure;
    }
    ScanPipeline pipeline(settings);
    QObject::connect(&pipeline, &ScanPipeline::fileReady, &app, [](const QString &path) {
        out() << "ready " << QDir::toNativeSeparators(path) << Qt::endl;
    });
    QObject::connect(&pipeline, &ScanPipeline::fileFailed, &app, [](const QString &path) {
        out() << "failed " << QDir::toNativeSeparators(path) << Qt::endl;
    });
    QObject::connect(&pipeline, &ScanPipeline::fileRemoved, &app, [](const QString &path) {
        out() << "removed " << QDir::toNativeSeparators(path) << Qt::endl;
    });
    QObject::connect(&pipeline, &ScanPipeline::fileRenamed, &app, [](const QString &oldPath, const QString &newPath) {
        out() << "renamed " << QDir::toNativeSeparators(oldPath) << " -> " << QDir::toNativeSeparators(newPath) << Qt::endl;
    });
    QObject::connect(&pipeline, &ScanPipeline::watchError, &app, [](const QString &message) {
        err() << message << Qt::endl;
    });
    QObject::connect(&pipeline, &ScanPipeline::statsUpdated, &app, [](const ScanStats &stats) {
        out() << "stats pending=" << stats.pending << " staged=" << stats.stagedBooks << '/' << stats.stagedPages
              << " today=" << stats.totalPagesToday << " rate=" << stats.scansPerMinute << "/min" << Qt::endl;
    });
    pipeline.start();
    const int code = app.exec();
    pipeline.stop();
    return code;
}

int runCreateBatch(const AppSettings &settings, const QStringList &arguments)
{
    if (!requirePath(settings.paths.stagingRoot, "paths/staging_root")) {
        return ExitCodes::failure;
    }
    if (arguments.size() < 2) {
        err() << QCoreApplication::translate("main", "Usage: create-batch NAME FILE...") << Qt::endl;
        return ExitCodes::failure;
    }
    const BatchStager stager(settings.paths.stagingRoot, settings.transferRetry);
    Batch batch;
    QString error;
    if (!stager.createBatch(arguments.first(), arguments.mid(1), &batch, &error)) {
        err() << error << Qt::endl;
        return ExitCodes::failure;
    }
    out() << "created " << batch.name << " (" << batch.pageCount << " pages) "
          << QDir::toNativeSeparators(batch.path) << Qt::endl;
    return ExitCodes::success;
}

int runPreview(const AppSettings &settings)
{
    if (!requirePath(settings.paths.stagingRoot, "paths/staging_root")) {
        return ExitCodes::failure;
    }
    TransferLog log(settings.paths.transferLog);
    const TransferEngine engine(&log, settings.transferRetry);
    const TransferPlan plan = engine.prepareTransfer(settings.paths.stagingRoot, settings.routing);
    for (const TransferPlanItem &item : plan.items) {
        out() << item.batchName << " -> " << QDir::toNativeSeparators(item.destinationPath)
              << " (" << item.pageCount << " pages, " << (item.sameVolume ? "rename" : "copy") << ')' << Qt::endl;
    }
    for (const TransferFailure &problem : plan.problems) {
        out() << "blocked " << problem.batchName << ": " << problem.reason << Qt::endl;
    }
    return plan.problems.isEmpty() ? ExitCodes::success : ExitCodes::failure;
}

int runTransfer(const AppSettings &settings)
{
    if (!requirePath(settings.paths.stagingRoot, "paths/staging_root")) {
        return ExitCodes::failure;
    }
    TransferLog log(settings.paths.transferLog);
    TransferEngine engine(&log, settings.transferRetry);
    const TransferReport report = engine.transferAll(settings.paths.stagingRoot, settings.routing);
    if (!report.ok) {
        err() << report.error << Qt::endl;
        return ExitCodes::failure;
    }
    for (const TransferRecord &record : report.records) {
        out() << "moved " << record.batchName << " (" << record.pageCount << " pages) -> "
              << QDir::toNativeSeparators(record.destinationPath) << Qt::endl;
    }
    for (const TransferFailure &failure : report.failures) {
        err() << "failed " << failure.batchName << ": " << failure.reason << Qt::endl;
    }
    return report.failures.isEmpty() ? ExitCodes::success : ExitCodes::failure;
}

int runStats(const AppSettings &settings)
{
    StatsAggregator aggregator(settings.paths.stagingRoot, settings.paths.transferLog, settings.stats);
    const QString scanRoot = settings.paths.scanRoot;
    aggregator.setPendingCounter([scanRoot]() {
        return ScanImageUtils::countScanImages(scanRoot);
    });
    const ScanStats stats = aggregator.computeStats();
    out() << "pending " << stats.pending << Qt::endl;
    out() << "staged books " << stats.stagedBooks << Qt::endl;
    out() << "staged pages " << stats.stagedPages << Qt::endl;
    out() << "transferred pages today " << stats.transferredPagesToday << Qt::endl;
    out() << "total pages today " << stats.totalPagesToday << Qt::endl;
    if (!stats.logReadable) {
        err() << stats.logError << Qt::endl;
        return ExitCodes::failure;
    }
    return ExitCodes::success;
}

int runClearLog(const AppSettings &settings, bool confirmed)
{
    if (!confirmed) {
        err() << QCoreApplication::translate("main", "Refusing to clear the transfer log without --yes") << Qt::endl;
        return ExitCodes::failure;
    }
    TransferLog log(settings.paths.transferLog);
    QString error;
    if (!log.clear(&error)) {
        err() << error << Qt::endl;
        return ExitCodes::failure;
    }
    out() << "cleared " << QDir::toNativeSeparators(log.path()) << Qt::endl;
    return ExitCodes::success;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("Scanshelf"));
    QCoreApplication::setApplicationName(QStringLiteral("Scanshelf"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Scanned book ingestion and archive manager"));
    parser.addHelpOption();
    const QCommandLineOption configOption(QStringList{QStringLiteral("c"), QStringLiteral("config")},
                                          QStringLiteral("Settings file."),
                                          QStringLiteral("file"));
    const QCommandLineOption verboseOption(QStringList{QStringLiteral("v"), QStringLiteral("verbose")},
                                           QStringLiteral("Print debug messages."));
    const QCommandLineOption yesOption(QStringLiteral("yes"), QStringLiteral("Confirm a destructive command."));
    parser.addOption(configOption);
    parser.addOption(verboseOption);
    parser.addOption(yesOption);
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("watch, create-batch, preview, transfer, stats or clear-log."));
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(ExitCodes::failure);
    }

    QStringList warnings;
    const AppSettings settings = parser.isSet(configOption)
        ? AppSettings::loadFile(parser.value(configOption), &warnings)
        : AppSettings::loadUserDefault(&warnings);

    QString logError;
    if (!Logging::initialize(settings.logging.file, settings.logging.verbose || parser.isSet(verboseOption), &logError)) {
        err() << logError << Qt::endl;
    }

    const QString command = positional.first();
    int code = ExitCodes::failure;
    if (command == QLatin1String("watch")) {
        code = runWatch(settings, app);
    } else if (command == QLatin1String("create-batch")) {
        code = runCreateBatch(settings, positional.mid(1));
    } else if (command == QLatin1String("preview")) {
        code = runPreview(settings);
    } else if (command == QLatin1String("transfer")) {
        code = runTransfer(settings);
    } else if (command == QLatin1String("stats")) {
        code = runStats(settings);
    } else if (command == QLatin1String("clear-log")) {
        code = runClearLog(settings, parser.isSet(yesOption));
    } else {
        err() << QCoreApplication::translate("main", "Unknown command: %1").arg(command) << Qt::endl;
    }

    Logging::shutdown();
    return code;
}
