#pragma once

#include <functional>

#include <QDateTime>
#include <QList>
#include <QMap>
#include <QMetaType>
#include <QMutex>
#include <QObject>
#include <QThreadPool>

#include "AppSettings.h"
#include "TransferLog.h"

class QTimer;

struct ScanStats {
    int pending = 0;
    int stagedBooks = 0;
    int stagedPages = 0;
    int transferredPagesToday = 0;
    int totalPagesToday = 0;
    double scansPerMinute = 0.0;
    QMap<QString, int> stagedPagesByBatch;
    QList<TransferRecord> recordsToday;
    bool logReadable = true;
    QString logError;
    QDateTime computedAt;
};

Q_DECLARE_METATYPE(ScanStats)

class StatsAggregator : public QObject
{
    Q_OBJECT

public:
    using PendingCounter = std::function<int()>;
    using Clock = std::function<QDateTime()>;

    explicit StatsAggregator(const QString &stagingRoot,
                             const QString &transferLogPath,
                             const StatsSettings &settings = StatsSettings(),
                             QObject *parent = nullptr);
    ~StatsAggregator() override;

    void setPendingCounter(const PendingCounter &counter);
    void setClock(const Clock &clock);

    ScanStats computeStats() const;
    ScanStats latest() const;
    double scansPerMinute() const;
    bool isRunning() const;

public slots:
    void start();
    void stop();
    void refresh();
    void recordScan();

signals:
    void statsUpdated(const ScanStats &stats);

private:
    double scansPerMinuteAt(const QDateTime &now) const;

    QString m_stagingRoot;
    QString m_transferLogPath;
    StatsSettings m_settings;
    PendingCounter m_pendingCounter;
    Clock m_clock;
    QTimer *m_timer = nullptr;
    QThreadPool m_pool;
    int m_generation = 0;
    bool m_refreshRunning = false;
    bool m_refreshQueued = false;
    ScanStats m_latest;

    mutable QMutex m_scanMutex;
    QList<QDateTime> m_scanTimes;
};
