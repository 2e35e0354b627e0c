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

#include <gtest/gtest.h>

#include <QTemporaryDir>

#include "PlatformUtils.h"
#include "StatsAggregator.h"
#include "TestSupport.h"

class StatsAggregatorTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(dir.isValid());
        const QString root = PlatformUtils::normalizePath(dir.path());
        staging = root + "/staging";
        logPath = root + "/books_complete_log.json";
        ASSERT_TRUE(QDir().mkpath(staging));
    }

    void stage(const QString &batch, int pages)
    {
        for (int i = 1; i <= pages; ++i) {
            ASSERT_TRUE(TestSupport::writeFile(QStringLiteral("%1/%2/%3.jpg").arg(staging, batch).arg(i), "page"));
        }
    }

    void logTransfer(const QString &batch, int pages, const QDateTime &when)
    {
        TransferLog log(logPath);
        ASSERT_TRUE(log.load(nullptr));
        ASSERT_TRUE(log.append(TransferRecord{batch, pages, "/archive/" + batch, when}, nullptr));
    }

    QTemporaryDir dir;
    QString staging;
    QString logPath;
    QDateTime now{QDate(2026, 10, 19), QTime(15, 30)};
};

TEST_F(StatsAggregatorTest, CountsStagedAndTransferredPages) {
    stage("BOOK-123-A", 3);
    stage("BOOK-456-B", 2);
    ASSERT_TRUE(QDir().mkpath(staging + "/.BOOK-789-C.partial"));
    logTransfer("BOOK-111-A", 10, now.addSecs(-3600));
    logTransfer("BOOK-222-A", 4, now.addDays(-1));

    StatsAggregator aggregator(staging, logPath);
    aggregator.setClock([this]() { return now; });
    aggregator.setPendingCounter([]() { return 7; });

    const ScanStats stats = aggregator.computeStats();
    EXPECT_EQ(stats.pending, 7);
    EXPECT_EQ(stats.stagedBooks, 2);
    EXPECT_EQ(stats.stagedPages, 5);
    EXPECT_EQ(stats.stagedPagesByBatch.value("BOOK-123-A"), 3);
    EXPECT_EQ(stats.stagedPagesByBatch.value("BOOK-456-B"), 2);
    EXPECT_EQ(stats.transferredPagesToday, 10);
    EXPECT_EQ(stats.totalPagesToday, 15);
    ASSERT_EQ(stats.recordsToday.size(), 1);
    EXPECT_EQ(stats.recordsToday.first().batchName, "BOOK-111-A");
    EXPECT_TRUE(stats.logReadable);
    EXPECT_EQ(stats.computedAt, now);
}

TEST_F(StatsAggregatorTest, MissingLogCountsAsNothingTransferred) {
    stage("BOOK-123-A", 2);
    StatsAggregator aggregator(staging, logPath);
    aggregator.setClock([this]() { return now; });

    const ScanStats stats = aggregator.computeStats();
    EXPECT_TRUE(stats.logReadable);
    EXPECT_EQ(stats.transferredPagesToday, 0);
    EXPECT_EQ(stats.totalPagesToday, 2);
}

TEST_F(StatsAggregatorTest, UnreadableLogIsReportedWithoutFailing) {
    stage("BOOK-123-A", 2);
    ASSERT_TRUE(TestSupport::writeFile(logPath, "{ broken"));
    StatsAggregator aggregator(staging, logPath);
    aggregator.setClock([this]() { return now; });

    const ScanStats stats = aggregator.computeStats();
    EXPECT_FALSE(stats.logReadable);
    EXPECT_FALSE(stats.logError.isEmpty());
    EXPECT_EQ(stats.stagedPages, 2);
    EXPECT_EQ(stats.transferredPagesToday, 0);
}

TEST_F(StatsAggregatorTest, ScanRateUsesRecentWindow) {
    StatsAggregator aggregator(staging, logPath);
    aggregator.setClock([this]() { return now; });
    EXPECT_DOUBLE_EQ(aggregator.scansPerMinute(), 0.0);

    aggregator.recordScan();
    aggregator.recordScan();
    EXPECT_DOUBLE_EQ(aggregator.scansPerMinute(), 6.0);

    now = now.addSecs(30);
    EXPECT_DOUBLE_EQ(aggregator.scansPerMinute(), 0.0);
    aggregator.recordScan();
    EXPECT_DOUBLE_EQ(aggregator.scansPerMinute(), 3.0);
}

TEST_F(StatsAggregatorTest, RefreshPublishesUpdate) {
    stage("BOOK-123-A", 4);
    StatsAggregator aggregator(staging, logPath);
    aggregator.setClock([this]() { return now; });
    QList<ScanStats> published;
    QObject::connect(&aggregator, &StatsAggregator::statsUpdated, [&](const ScanStats &stats) {
        published.append(stats);
    });

    aggregator.refresh();
    ASSERT_TRUE(TestSupport::waitUntil([&]() { return !published.isEmpty(); }));
    EXPECT_EQ(published.first().stagedPages, 4);
    EXPECT_EQ(aggregator.latest().stagedPages, 4);
}

TEST_F(StatsAggregatorTest, StartRefreshesImmediatelyAndStopHalts) {
    StatsSettings settings;
    settings.intervalMs = 250;
    StatsAggregator aggregator(staging, logPath, settings);
    int updates = 0;
    QObject::connect(&aggregator, &StatsAggregator::statsUpdated, [&]() { updates += 1; });

    aggregator.start();
    EXPECT_TRUE(aggregator.isRunning());
    ASSERT_TRUE(TestSupport::waitUntil([&]() { return updates >= 2; }));

    aggregator.stop();
    EXPECT_FALSE(aggregator.isRunning());
    TestSupport::spin(100);
    const int settled = updates;
    TestSupport::spin(400);
    EXPECT_EQ(updates, settled);
}

TEST_F(StatsAggregatorTest, BurstOfRefreshesCollapsesToLatestResult) {
    stage("BOOK-123-A", 2);
    StatsAggregator aggregator(staging, logPath);
    aggregator.setClock([this]() { return now; });
    QList<ScanStats> published;
    QObject::connect(&aggregator, &StatsAggregator::statsUpdated, [&](const ScanStats &stats) {
        published.append(stats);
    });

    aggregator.refresh();
    stage("BOOK-456-B", 3);
    for (int i = 0; i < 10; ++i) {
        aggregator.refresh();
    }
    ASSERT_TRUE(TestSupport::waitUntil([&]() { return !published.isEmpty(); }));
    TestSupport::spin(300);

    EXPECT_LE(published.size(), 2);
    EXPECT_EQ(published.last().stagedPages, 5);
    EXPECT_EQ(aggregator.latest().stagedPages, 5);
}

TEST_F(StatsAggregatorTest, StopDropsRefreshInFlight) {
    stage("BOOK-123-A", 2);
    StatsAggregator aggregator(staging, logPath);
    int calls = 0;
    aggregator.setPendingCounter([&calls]() {
        QThread::msleep(100);
        return ++calls;
    });
    int updates = 0;
    QObject::connect(&aggregator, &StatsAggregator::statsUpdated, [&]() { updates += 1; });

    aggregator.refresh();
    aggregator.refresh();
    aggregator.stop();
    const int callsAtStop = calls;
    TestSupport::spin(400);

    EXPECT_EQ(updates, 0);
    EXPECT_EQ(calls, callsAtStop);
    EXPECT_EQ(aggregator.latest().stagedPages, 0);
}
