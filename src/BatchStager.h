#pragma once

#include <functional>

#include <QAtomicInt>
#include <QDateTime>
#include <QList>
#include <QMetaType>
#include <QString>
#include <QStringList>

#include "RetryPolicy.h"

struct Batch {
    enum class Status {
        Staged,
        Transferred
    };

    QString name;
    QString path;
    QStringList sourcePaths;
    QDateTime createdAt;
    int pageCount = 0;
    Status status = Status::Staged;
};

Q_DECLARE_METATYPE(Batch)

/**
 * @brief Commits loose scanned files into a named batch of the staging root.
 *
 * The batch is assembled in a hidden sibling folder and renamed into place
 * once complete, so observers of the staging root never see it half built.
 */
class BatchStager
{
public:
    using ProgressCallback = std::function<void(int completed, int total)>;

    explicit BatchStager(const QString &stagingRoot, const RetryPolicy &retry = RetryPolicy());

    QString stagingRoot() const;

    bool createBatch(const QString &name,
                     const QStringList &paths,
                     Batch *batch,
                     QString *error,
                     const QAtomicInt *cancelled = nullptr,
                     const ProgressCallback &progress = ProgressCallback()) const;
    QList<Batch> stagedBatches() const;

    static QString pageFileName(int index, const QString &suffix);

private:
    struct MovedPage {
        QString sourcePath;
        QString stagedPath;
    };

    bool validateRequest(const QString &name, const QStringList &paths, QString *error) const;
    bool rollback(const QList<MovedPage> &moved, const QString &buildPath) const;

    QString m_stagingRoot;
    RetryPolicy m_retry;
};
