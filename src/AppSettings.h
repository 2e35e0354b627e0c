#pragma once

#include <QSize>
#include <QString>
#include <QStringList>

#include "RetryPolicy.h"
#include "RoutingTable.h"

class QSettings;

struct PathSettings {
    QString scanRoot;
    QString stagingRoot;
    QString transferLog;
};

struct StabilitySettings {
    int pollIntervalMs = 150;
    int requiredMatches = 3;
    int probeBytes = 1024;
    int timeoutMs = 10000;
};

struct CacheSettings {
    bool enabled = true;
    qint64 imageBudgetBytes = 500ll * 1024 * 1024;
    int thumbnailEntries = 200;
    qint64 thumbnailBudgetBytes = 64ll * 1024 * 1024;
};

struct ThumbnailSettings {
    QSize targetSize = QSize(90, 110);
    int workerCount = 1;
    int adjacentWindow = 6;
};

struct StatsSettings {
    int intervalMs = 2000;
};

struct LoggingSettings {
    QString file;
    bool verbose = false;
};

struct AppSettings {
    PathSettings paths;
    RoutingTable routing;
    StabilitySettings stability;
    CacheSettings cache;
    ThumbnailSettings thumbnails;
    RetryPolicy transferRetry;
    StatsSettings stats;
    LoggingSettings logging;

    static AppSettings load(QSettings &settings, QStringList *warnings);
    static AppSettings loadFile(const QString &path, QStringList *warnings);
    static AppSettings loadUserDefault(QStringList *warnings);
    static QString defaultTransferLogPath();

    bool save(QSettings &settings) const;
};
