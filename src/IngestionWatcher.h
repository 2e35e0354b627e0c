#pragma once

#include <QDateTime>
#include <QHash>
#include <QMutex>
#include <QObject>
#include <QStringList>
#include <QThreadPool>

#include "StabilityDetector.h"

class QFileSystemWatcher;
class QTimer;

struct SourceFile {
    enum class State {
        Pending,
        Ready,
        Failed
    };

    QString path;
    qint64 sizeBytes = 0;
    QDateTime modified;
    QDateTime discoveredAt;
    State state = State::Pending;
    quint64 generation = 0;
    bool announced = false;
};

class IngestionWatcher : public QObject
{
    Q_OBJECT

public:
    explicit IngestionWatcher(const QString &scanRoot,
                              StabilityDetector *detector,
                              QObject *parent = nullptr);
    ~IngestionWatcher() override;

    QString scanRoot() const;
    QStringList readyFiles() const;
    int readyCount() const;
    int pendingCount() const;
    bool isReady(const QString &path) const;

public slots:
    void start();
    void stop();
    void retry(const QString &path);
    void rescan();

signals:
    void fileReady(const QString &path);
    void fileFailed(const QString &path);
    void fileRemoved(const QString &path);
    void fileRenamed(const QString &oldPath, const QString &newPath);
    void watchError(const QString &message);

private:
    struct EntryStamp {
        qint64 size = -1;
        qint64 modifiedMs = -1;

        bool operator==(const EntryStamp &other) const
        {
            return size == other.size && modifiedMs == other.modifiedMs;
        }
    };

    QHash<QString, EntryStamp> listEntries() const;
    void applySnapshot(const QHash<QString, EntryStamp> &entries);
    void registerCandidate(const QString &path, const EntryStamp &stamp);
    void startStabilityCheck(const QString &path);
    void finishStabilityCheck(const QString &path, quint64 generation, StabilityDetector::Outcome outcome);
    void forget(const QString &path);

    QString m_scanRoot;
    StabilityDetector *m_detector = nullptr;
    QFileSystemWatcher *m_watcher = nullptr;
    QTimer *m_refreshTimer = nullptr;
    QThreadPool m_stabilityPool;
    bool m_running = false;
    quint64 m_generationCounter = 0;
    QHash<QString, EntryStamp> m_snapshot;

    mutable QMutex m_trackedMutex;
    QHash<QString, SourceFile> m_tracked;
};
