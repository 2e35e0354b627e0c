#pragma once

#include <QAtomicInt>
#include <QMetaType>
#include <QObject>
#include <QStringList>

#include "BatchStager.h"

struct BatchResult {
    bool ok = false;
    bool cancelled = false;
    QString name;
    QString error;
    Batch batch;
};

Q_DECLARE_METATYPE(BatchResult)

class BatchWorker : public QObject
{
    Q_OBJECT

public:
    explicit BatchWorker(const BatchStager &stager,
                         const QString &name,
                         const QStringList &paths,
                         QObject *parent = nullptr);

public slots:
    void start();
    void cancel();

signals:
    void progress(int completed, int total);
    void finished(const BatchResult &result);

private:
    bool isCancelled() const;

    BatchStager m_stager;
    QString m_name;
    QStringList m_paths;
    QAtomicInt m_cancelled = 0;
};
