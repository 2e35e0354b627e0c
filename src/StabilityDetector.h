#pragma once

#include <QAtomicInt>
#include <QString>

#include "AppSettings.h"

class StabilityDetector
{
public:
    enum class Outcome {
        Stable,
        TimedOut,
        Vanished,
        Cancelled
    };

    explicit StabilityDetector(const StabilitySettings &settings = StabilitySettings());

    bool isStable(const QString &path, int timeoutMs) const;
    Outcome check(const QString &path, int timeoutMs) const;
    int defaultTimeoutMs() const;

    void cancel();
    void reset();

private:
    struct Sample {
        bool exists = false;
        qint64 size = -1;
        qint64 modifiedMs = -1;
    };

    Sample sample(const QString &path) const;
    bool probeRead(const QString &path) const;
    bool isCancelled() const;

    StabilitySettings m_settings;
    QAtomicInt m_cancelled = 0;
};
