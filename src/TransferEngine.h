#pragma once

#include <functional>

#include <QDateTime>
#include <QList>
#include <QMetaType>
#include <QMutex>
#include <QObject>
#include <QSet>
#include <QString>

#include "RetryPolicy.h"
#include "RoutingTable.h"
#include "TransferLog.h"

struct TransferFailure {
    QString batchName;
    QString reason;
};

struct TransferPlanItem {
    QString batchName;
    QString sourcePath;
    QString identifier;
    QString destinationPath;
    int pageCount = 0;
    bool sameVolume = false;
};

struct TransferPlan {
    QList<TransferPlanItem> items;
    QList<TransferFailure> problems;
};

struct TransferReport {
    bool ok = false;
    QString error;
    QList<TransferRecord> records;
    QList<TransferFailure> failures;
};

Q_DECLARE_METATYPE(TransferReport)

/**
 * @brief Moves staged batches into dated folders of their destination roots.
 *
 * Each batch is handled on its own: it is either moved and logged, or left
 * in the staging root with a reported failure.
 */
class TransferEngine : public QObject
{
    Q_OBJECT

public:
    enum class MoveStrategy {
        Automatic,
        AlwaysCopy
    };

    using Clock = std::function<QDateTime()>;

    explicit TransferEngine(TransferLog *log,
                            const RetryPolicy &retry = RetryPolicy(),
                            QObject *parent = nullptr);

    TransferReport transferAll(const QString &stagingRoot, const RoutingTable &routing);
    TransferPlan prepareTransfer(const QString &stagingRoot, const RoutingTable &routing) const;
    bool isTransferring(const QString &stagingRoot) const;

    void setMoveStrategy(MoveStrategy strategy);
    void setClock(const Clock &clock);

    static QString datedFolderName(const QDate &date);

signals:
    void batchTransferred(const TransferRecord &record);
    void transferComplete(const QList<TransferRecord> &records);
    void transferFailed(const QString &batchName, const QString &reason);

private:
    bool planBatch(const QString &batchPath,
                   const RoutingTable &routing,
                   const QDate &date,
                   TransferPlanItem *item,
                   QString *error) const;
    bool transferBatch(const TransferPlanItem &item,
                       const QDateTime &runTime,
                       TransferRecord *record,
                       QString *error);
    bool moveOnSameVolume(const TransferPlanItem &item, const TransferRecord &record, QString *error);
    bool moveAcrossVolumes(const TransferPlanItem &item, const TransferRecord &record, QString *error);
    bool appendRecord(const TransferRecord &record, QString *error);
    bool beginRun(const QString &stagingRoot);
    void endRun(const QString &stagingRoot);

    TransferLog *m_log = nullptr;
    RetryPolicy m_retry;
    MoveStrategy m_strategy = MoveStrategy::Automatic;
    Clock m_clock;

    mutable QMutex m_runMutex;
    QSet<QString> m_activeRoots;
    QMutex m_logMutex;
};
