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

#include "AppSettings.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>

#include "Logging.h"
#include "PlatformUtils.h"

namespace {

struct SettingsKeys {
    static constexpr char scanRoot[] = "paths/scan_root";
    static constexpr char stagingRoot[] = "paths/staging_root";
    static constexpr char transferLog[] = "paths/transfer_log";
    static constexpr char cacheEnabled[] = "cache/enabled";
    static constexpr char cacheBudgetMb[] = "cache/budget_mb";
    static constexpr char thumbnailEntries[] = "cache/thumbnail_entries";
    static constexpr char thumbnailBudgetMb[] = "cache/thumbnail_budget_mb";
    static constexpr char thumbnailWidth[] = "thumbnails/width";
    static constexpr char thumbnailHeight[] = "thumbnails/height";
    static constexpr char thumbnailWorkers[] = "thumbnails/workers";
    static constexpr char adjacentWindow[] = "thumbnails/adjacent_window";
    static constexpr char pollMs[] = "stability/poll_ms";
    static constexpr char matches[] = "stability/matches";
    static constexpr char probeBytes[] = "stability/probe_bytes";
    static constexpr char timeoutMs[] = "stability/timeout_ms";
    static constexpr char retries[] = "transfer/retries";
    static constexpr char backoffMs[] = "transfer/backoff_ms";
    static constexpr char statsIntervalMs[] = "stats/interval_ms";
    static constexpr char logFile[] = "logging/file";
    static constexpr char verbose[] = "logging/verbose";
};

struct SettingsLimits {
    static constexpr qint64 bytesPerMb = 1024ll * 1024;
    static constexpr int minBudgetMb = 1;
    static constexpr int maxBudgetMb = 64 * 1024;
    static constexpr int minThumbnailEntries = 1;
    static constexpr int maxThumbnailEntries = 100000;
    static constexpr int minThumbnailSide = 8;
    static constexpr int maxThumbnailSide = 2048;
    static constexpr int minWorkers = 1;
    static constexpr int maxWorkers = 2;
    static constexpr int minAdjacentWindow = 0;
    static constexpr int maxAdjacentWindow = 1000;
    static constexpr int minPollMs = 10;
    static constexpr int maxPollMs = 10000;
    static constexpr int minMatches = 1;
    static constexpr int maxMatches = 20;
    static constexpr int minProbeBytes = 1;
    static constexpr int maxProbeBytes = 1024 * 1024;
    static constexpr int minTimeoutMs = 100;
    static constexpr int maxTimeoutMs = 600000;
    static constexpr int minRetries = 1;
    static constexpr int maxRetries = 50;
    static constexpr int minBackoffMs = 0;
    static constexpr int maxBackoffMs = 10000;
    static constexpr int minStatsIntervalMs = 100;
    static constexpr int maxStatsIntervalMs = 3600000;
};

constexpr char logFileName[] = "books_complete_log.json";

/**
 * @brief Reads an integer setting and clamps it, recording a warning when out of range.
 * @param settings Settings to read from.
 * @param key Settings key.
 * @param fallback Value used when the key is missing or not a number.
 * @param minimum Lowest accepted value.
 * @param maximum Highest accepted value.
 * @param warnings Optional warning list.
 * @return Clamped value.
 */
int readBoundedInt(QSettings &settings,
                   const char *key,
                   int fallback,
                   int minimum,
                   int maximum,
                   QStringList *warnings)
{
    const QString keyName = QLatin1String(key);
    if (!settings.contains(keyName)) {
        return fallback;
    }
    bool ok = false;
    const int value = settings.value(keyName).toInt(&ok);
    if (!ok) {
        if (warnings) {
            warnings->append(QCoreApplication::translate("AppSettings", "%1 is not a number, using %2")
                                 .arg(keyName)
                                 .arg(fallback));
        }
        return fallback;
    }
    if (value < minimum || value > maximum) {
        const int clamped = qBound(minimum, value, maximum);
        if (warnings) {
            warnings->append(QCoreApplication::translate("AppSettings", "%1 out of range, using %2")
                                 .arg(keyName)
                                 .arg(clamped));
        }
        return clamped;
    }
    return value;
}

QString readPath(QSettings &settings, const char *key)
{
    const QString value = settings.value(QLatin1String(key)).toString();
    return PlatformUtils::normalizePath(value);
}

} // namespace

/**
 * @brief Builds application settings from an opened settings store.
 * @param settings Settings store to read.
 * @param warnings Optional list receiving non-fatal problems.
 * @return Settings with defaults applied for missing keys.
 */
AppSettings AppSettings::load(QSettings &settings, QStringList *warnings)
{
    AppSettings result;
    QStringList problems;
    const AppSettings defaults;

    result.paths.scanRoot = readPath(settings, SettingsKeys::scanRoot);
    result.paths.stagingRoot = readPath(settings, SettingsKeys::stagingRoot);
    result.paths.transferLog = readPath(settings, SettingsKeys::transferLog);
    if (result.paths.transferLog.isEmpty()) {
        result.paths.transferLog = defaultTransferLogPath();
    }

    result.routing = RoutingTable::fromSettings(settings, &problems);

    result.cache.enabled = settings.value(QLatin1String(SettingsKeys::cacheEnabled), defaults.cache.enabled).toBool();
    const int budgetMb = readBoundedInt(settings,
                                        SettingsKeys::cacheBudgetMb,
                                        static_cast<int>(defaults.cache.imageBudgetBytes / SettingsLimits::bytesPerMb),
                                        SettingsLimits::minBudgetMb,
                                        SettingsLimits::maxBudgetMb,
                                        &problems);
    result.cache.imageBudgetBytes = budgetMb * SettingsLimits::bytesPerMb;
    result.cache.thumbnailEntries = readBoundedInt(settings,
                                                   SettingsKeys::thumbnailEntries,
                                                   defaults.cache.thumbnailEntries,
                                                   SettingsLimits::minThumbnailEntries,
                                                   SettingsLimits::maxThumbnailEntries,
                                                   &problems);
    const int thumbnailBudgetMb = readBoundedInt(settings,
                                                 SettingsKeys::thumbnailBudgetMb,
                                                 static_cast<int>(defaults.cache.thumbnailBudgetBytes / SettingsLimits::bytesPerMb),
                                                 SettingsLimits::minBudgetMb,
                                                 SettingsLimits::maxBudgetMb,
                                                 &problems);
    result.cache.thumbnailBudgetBytes = thumbnailBudgetMb * SettingsLimits::bytesPerMb;

    const int width = readBoundedInt(settings,
                                     SettingsKeys::thumbnailWidth,
                                     defaults.thumbnails.targetSize.width(),
                                     SettingsLimits::minThumbnailSide,
                                     SettingsLimits::maxThumbnailSide,
                                     &problems);
    const int height = readBoundedInt(settings,
                                      SettingsKeys::thumbnailHeight,
                                      defaults.thumbnails.targetSize.height(),
                                      SettingsLimits::minThumbnailSide,
                                      SettingsLimits::maxThumbnailSide,
                                      &problems);
    result.thumbnails.targetSize = QSize(width, height);
    result.thumbnails.workerCount = readBoundedInt(settings,
                                                   SettingsKeys::thumbnailWorkers,
                                                   defaults.thumbnails.workerCount,
                                                   SettingsLimits::minWorkers,
                                                   SettingsLimits::maxWorkers,
                                                   &problems);
    result.thumbnails.adjacentWindow = readBoundedInt(settings,
                                                      SettingsKeys::adjacentWindow,
                                                      defaults.thumbnails.adjacentWindow,
                                                      SettingsLimits::minAdjacentWindow,
                                                      SettingsLimits::maxAdjacentWindow,
                                                      &problems);

    result.stability.pollIntervalMs = readBoundedInt(settings,
                                                     SettingsKeys::pollMs,
                                                     defaults.stability.pollIntervalMs,
                                                     SettingsLimits::minPollMs,
                                                     SettingsLimits::maxPollMs,
                                                     &problems);
    result.stability.requiredMatches = readBoundedInt(settings,
                                                      SettingsKeys::matches,
                                                      defaults.stability.requiredMatches,
                                                      SettingsLimits::minMatches,
                                                      SettingsLimits::maxMatches,
                                                      &problems);
    result.stability.probeBytes = readBoundedInt(settings,
                                                 SettingsKeys::probeBytes,
                                                 defaults.stability.probeBytes,
                                                 SettingsLimits::minProbeBytes,
                                                 SettingsLimits::maxProbeBytes,
                                                 &problems);
    result.stability.timeoutMs = readBoundedInt(settings,
                                                SettingsKeys::timeoutMs,
                                                defaults.stability.timeoutMs,
                                                SettingsLimits::minTimeoutMs,
                                                SettingsLimits::maxTimeoutMs,
                                                &problems);

    result.transferRetry.attempts = readBoundedInt(settings,
                                                   SettingsKeys::retries,
                                                   defaults.transferRetry.attempts,
                                                   SettingsLimits::minRetries,
                                                   SettingsLimits::maxRetries,
                                                   &problems);
    result.transferRetry.backoffMs = readBoundedInt(settings,
                                                    SettingsKeys::backoffMs,
                                                    defaults.transferRetry.backoffMs,
                                                    SettingsLimits::minBackoffMs,
                                                    SettingsLimits::maxBackoffMs,
                                                    &problems);

    result.stats.intervalMs = readBoundedInt(settings,
                                             SettingsKeys::statsIntervalMs,
                                             defaults.stats.intervalMs,
                                             SettingsLimits::minStatsIntervalMs,
                                             SettingsLimits::maxStatsIntervalMs,
                                             &problems);

    result.logging.file = readPath(settings, SettingsKeys::logFile);
    result.logging.verbose = settings.value(QLatin1String(SettingsKeys::verbose), defaults.logging.verbose).toBool();

    for (const QString &problem : problems) {
        qCWarning(lcConfig).noquote() << problem;
    }
    if (warnings) {
        warnings->append(problems);
    }
    return result;
}

/**
 * @brief Loads settings from an INI file.
 * @param path INI file path.
 * @param warnings Optional list receiving non-fatal problems.
 * @return Loaded settings; defaults when the file is missing.
 */
AppSettings AppSettings::loadFile(const QString &path, QStringList *warnings)
{
    if (!QFileInfo::exists(path) && warnings) {
        warnings->append(QCoreApplication::translate("AppSettings", "Settings file not found: %1").arg(path));
    }
    QSettings settings(path, QSettings::IniFormat);
    return load(settings, warnings);
}

AppSettings AppSettings::loadUserDefault(QStringList *warnings)
{
    QSettings settings(QSettings::IniFormat, QSettings::UserScope, "Scanshelf", "Scanshelf");
    return load(settings, warnings);
}

/**
 * @brief Returns the transfer log location used when none is configured.
 * @return Path inside the per-user application data folder.
 */
QString AppSettings::defaultTransferLogPath()
{
    QString base = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (base.isEmpty()) {
        base = QDir::home().filePath(QStringLiteral(".scanshelf"));
    }
    return QDir(base).filePath(QLatin1String(logFileName));
}

bool AppSettings::save(QSettings &settings) const
{
    settings.setValue(QLatin1String(SettingsKeys::scanRoot), paths.scanRoot);
    settings.setValue(QLatin1String(SettingsKeys::stagingRoot), paths.stagingRoot);
    settings.setValue(QLatin1String(SettingsKeys::transferLog), paths.transferLog);

    settings.beginGroup(QStringLiteral("routing"));
    settings.remove(QLatin1String(""));
    const QMap<QString, QString> routes = routing.entries();
    for (auto it = routes.cbegin(); it != routes.cend(); ++it) {
        settings.setValue(it.key(), it.value());
    }
    settings.endGroup();

    settings.setValue(QLatin1String(SettingsKeys::cacheEnabled), cache.enabled);
    settings.setValue(QLatin1String(SettingsKeys::cacheBudgetMb), cache.imageBudgetBytes / SettingsLimits::bytesPerMb);
    settings.setValue(QLatin1String(SettingsKeys::thumbnailEntries), cache.thumbnailEntries);
    settings.setValue(QLatin1String(SettingsKeys::thumbnailBudgetMb), cache.thumbnailBudgetBytes / SettingsLimits::bytesPerMb);
    settings.setValue(QLatin1String(SettingsKeys::thumbnailWidth), thumbnails.targetSize.width());
    settings.setValue(QLatin1String(SettingsKeys::thumbnailHeight), thumbnails.targetSize.height());
    settings.setValue(QLatin1String(SettingsKeys::thumbnailWorkers), thumbnails.workerCount);
    settings.setValue(QLatin1String(SettingsKeys::adjacentWindow), thumbnails.adjacentWindow);
    settings.setValue(QLatin1String(SettingsKeys::pollMs), stability.pollIntervalMs);
    settings.setValue(QLatin1String(SettingsKeys::matches), stability.requiredMatches);
    settings.setValue(QLatin1String(SettingsKeys::probeBytes), stability.probeBytes);
    settings.setValue(QLatin1String(SettingsKeys::timeoutMs), stability.timeoutMs);
    settings.setValue(QLatin1String(SettingsKeys::retries), transferRetry.attempts);
    settings.setValue(QLatin1String(SettingsKeys::backoffMs), transferRetry.backoffMs);
    settings.setValue(QLatin1String(SettingsKeys::statsIntervalMs), stats.intervalMs);
    settings.setValue(QLatin1String(SettingsKeys::logFile), logging.file);
    settings.setValue(QLatin1String(SettingsKeys::verbose), logging.verbose);
    settings.sync();
    return settings.status() == QSettings::NoError;
}
