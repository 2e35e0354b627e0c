#pragma once

#include <QObject>
#include <QString>

#include "RoutingTable.h"
#include "TransferEngine.h"

class TransferWorker : public QObject
{
    Q_OBJECT

public:
    explicit TransferWorker(TransferEngine *engine,
                            const QString &stagingRoot,
                            const RoutingTable &routing,
                            QObject *parent = nullptr);

public slots:
    void start();

signals:
    void finished(const TransferReport &report);

private:
    TransferEngine *m_engine = nullptr;
    QString m_stagingRoot;
    RoutingTable m_routing;
};
