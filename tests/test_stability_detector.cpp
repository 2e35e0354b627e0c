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

#include <QAtomicInt>
#include <QElapsedTimer>
#include <QFile>
#include <QTemporaryDir>
#include <QThread>

#include "StabilityDetector.h"
#include "TestSupport.h"

class StabilityDetectorTest : public ::testing::Test {
protected:
    QTemporaryDir dir;
    StabilityDetector detector{TestSupport::fastStability()};

    QString path(const QString &name) const
    {
        return dir.filePath(name);
    }
};

TEST_F(StabilityDetectorTest, FinishedFileIsStableAfterConsecutiveMatches) {
    ASSERT_TRUE(TestSupport::writeFile(path("page.png"), QByteArray(4096, 'x')));

    QElapsedTimer timer;
    timer.start();
    EXPECT_TRUE(detector.isStable(path("page.png"), 2000));
    // three matches need three poll intervals after the first sample
    EXPECT_GE(timer.elapsed(), 3 * 20);
}

TEST_F(StabilityDetectorTest, GrowingFileNeverBecomesStable) {
    const QString growing = path("growing.png");
    ASSERT_TRUE(TestSupport::writeFile(growing, QByteArray(16, 'x')));

    QAtomicInt stop = 0;
    QThread *writer = QThread::create([&]() {
        QFile file(growing);
        if (!file.open(QIODevice::Append)) {
            return;
        }
        while (stop.loadRelaxed() == 0) {
            file.write(QByteArray(64, 'y'));
            file.flush();
            QThread::msleep(5);
        }
    });
    writer->start();

    EXPECT_EQ(detector.check(growing, 500), StabilityDetector::Outcome::TimedOut);

    stop.storeRelaxed(1);
    writer->wait();
    delete writer;
}

TEST_F(StabilityDetectorTest, EmptyFileIsNotStable) {
    ASSERT_TRUE(TestSupport::writeFile(path("empty.png"), QByteArray()));
    EXPECT_EQ(detector.check(path("empty.png"), 300), StabilityDetector::Outcome::TimedOut);
}

TEST_F(StabilityDetectorTest, MissingFileReportsVanished) {
    EXPECT_EQ(detector.check(path("missing.png"), 300), StabilityDetector::Outcome::Vanished);
    EXPECT_FALSE(detector.isStable(path("missing.png"), 300));
}

TEST_F(StabilityDetectorTest, UnreadableFileIsNotStable) {
    const QString locked = path("locked.png");
    ASSERT_TRUE(TestSupport::writeFile(locked, QByteArray(128, 'x')));
    QFile::setPermissions(locked, QFileDevice::WriteOwner);
    QFile reader(locked);
    if (reader.open(QIODevice::ReadOnly)) {
        GTEST_SKIP() << "file permissions are not enforced for this user";
    }

    EXPECT_EQ(detector.check(locked, 300), StabilityDetector::Outcome::TimedOut);
    QFile::setPermissions(locked, QFileDevice::ReadOwner | QFileDevice::WriteOwner);
}

TEST_F(StabilityDetectorTest, FileBecomesStableOnceWriterStops) {
    const QString late = path("late.png");
    ASSERT_TRUE(TestSupport::writeFile(late, QByteArray(16, 'x')));

    QThread *writer = QThread::create([late]() {
        QFile file(late);
        if (!file.open(QIODevice::Append)) {
            return;
        }
        for (int i = 0; i < 20; ++i) {
            file.write(QByteArray(64, 'y'));
            file.flush();
            QThread::msleep(10);
        }
    });
    writer->start();

    EXPECT_EQ(detector.check(late, 3000), StabilityDetector::Outcome::Stable);
    writer->wait();
    delete writer;
    EXPECT_EQ(QFileInfo(late).size(), 16 + 20 * 64);
}

TEST_F(StabilityDetectorTest, CancelAbortsAndResetRearms) {
    ASSERT_TRUE(TestSupport::writeFile(path("page.png"), QByteArray(512, 'x')));
    detector.cancel();
    EXPECT_EQ(detector.check(path("page.png"), 1000), StabilityDetector::Outcome::Cancelled);

    detector.reset();
    EXPECT_EQ(detector.check(path("page.png"), 1000), StabilityDetector::Outcome::Stable);
}

TEST_F(StabilityDetectorTest, NonPositiveTimeoutUsesConfiguredDefault) {
    EXPECT_EQ(detector.defaultTimeoutMs(), 3000);
    ASSERT_TRUE(TestSupport::writeFile(path("page.png"), QByteArray(512, 'x')));
    EXPECT_TRUE(detector.isStable(path("page.png"), 0));
}
