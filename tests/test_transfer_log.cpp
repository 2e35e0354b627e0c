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

#include <QSaveFile>
#include <QTemporaryDir>

#include "TestSupport.h"
#include "TransferLog.h"

namespace {

class CrashingTransferLog : public TransferLog
{
public:
    using TransferLog::TransferLog;

protected:
    bool commit(QSaveFile &file) override
    {
        // the process dies after the temporary file was written, before the rename
        file.cancelWriting();
        return file.commit();
    }
};

TransferRecord makeRecord(const QString &name, int pages, const QDateTime &when)
{
    TransferRecord record;
    record.batchName = name;
    record.pageCount = pages;
    record.destinationPath = QStringLiteral("/archive/123/19-10/") + name;
    record.timestamp = when;
    return record;
}

const QDateTime morning(QDate(2026, 10, 19), QTime(9, 30));

} // namespace

class TransferLogTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(dir.isValid());
        logPath = dir.filePath("books_complete_log.json");
    }

    QTemporaryDir dir;
    QString logPath;
};

TEST_F(TransferLogTest, MissingFileIsAnEmptyLog) {
    TransferLog log(logPath);
    QString error;
    ASSERT_TRUE(log.load(&error)) << error.toStdString();
    EXPECT_EQ(log.recordCount(), 0);
    EXPECT_FALSE(QFileInfo::exists(logPath));
}

TEST_F(TransferLogTest, AppendIsVisibleToAFreshReader) {
    TransferLog writer(logPath);
    ASSERT_TRUE(writer.load(nullptr));
    ASSERT_TRUE(writer.append(makeRecord("BOOK-123-A", 3, morning), nullptr));
    ASSERT_TRUE(writer.append(makeRecord("BOOK-123-B", 5, morning.addSecs(60)), nullptr));

    TransferLog reader(logPath);
    ASSERT_TRUE(reader.load(nullptr));
    const QList<TransferRecord> records = reader.recordsForDate(morning.date());
    ASSERT_EQ(records.size(), 2);
    EXPECT_EQ(records.at(0).batchName, "BOOK-123-A");
    EXPECT_EQ(records.at(0).pageCount, 3);
    EXPECT_EQ(records.at(0).destinationPath, "/archive/123/19-10/BOOK-123-A");
    EXPECT_EQ(records.at(0).timestamp, morning);
    EXPECT_EQ(records.at(1).batchName, "BOOK-123-B");
    EXPECT_EQ(reader.pagesForDate(morning.date()), 8);
    EXPECT_EQ(reader.pagesForDate(morning.date().addDays(-1)), 0);
}

TEST_F(TransferLogTest, RecordsAreGroupedByLocalDate) {
    TransferLog log(logPath);
    ASSERT_TRUE(log.load(nullptr));
    ASSERT_TRUE(log.append(makeRecord("BOOK-123-A", 3, morning.addDays(-1)), nullptr));
    ASSERT_TRUE(log.append(makeRecord("BOOK-123-B", 4, morning), nullptr));

    const QByteArray json = TestSupport::readFile(logPath);
    EXPECT_TRUE(json.contains("\"2026-10-18\""));
    EXPECT_TRUE(json.contains("\"2026-10-19\""));
    EXPECT_EQ(log.pagesForDate(morning.date()), 4);
}

TEST_F(TransferLogTest, CorruptedFileFailsToLoad) {
    ASSERT_TRUE(TestSupport::writeFile(logPath, "{\"2026-10-19\": [ {\"name\": "));
    TransferLog log(logPath);
    QString error;
    EXPECT_FALSE(log.load(&error));
    EXPECT_FALSE(error.isEmpty());
    EXPECT_FALSE(log.append(makeRecord("BOOK-123-A", 3, morning), &error));
}

TEST_F(TransferLogTest, LegacyEntriesAreSkippedAndPreserved) {
    ASSERT_TRUE(TestSupport::writeFile(logPath,
                                       "{\"2026-10-19\": [\"legacy line\", "
                                       "{\"name\": \"OLD-123\", \"pages\": 2, \"path\": \"/archive/old\", "
                                       "\"timestamp\": \"2026-10-19T08:00:00\"}], \"comment\": \"kept\"}"));
    TransferLog log(logPath);
    ASSERT_TRUE(log.load(nullptr));
    EXPECT_EQ(log.recordsForDate(morning.date()).size(), 1);

    ASSERT_TRUE(log.append(makeRecord("BOOK-123-A", 3, morning), nullptr));
    const QByteArray json = TestSupport::readFile(logPath);
    EXPECT_TRUE(json.contains("legacy line"));
    EXPECT_TRUE(json.contains("\"comment\""));
    EXPECT_EQ(log.pagesForDate(morning.date()), 5);
}

TEST_F(TransferLogTest, CrashBeforeRenameLeavesPreviousVersionIntact) {
    {
        TransferLog log(logPath);
        ASSERT_TRUE(log.load(nullptr));
        ASSERT_TRUE(log.append(makeRecord("BOOK-123-A", 3, morning), nullptr));
    }
    const QByteArray before = TestSupport::readFile(logPath);

    CrashingTransferLog crashing(logPath);
    ASSERT_TRUE(crashing.load(nullptr));
    QString error;
    EXPECT_FALSE(crashing.append(makeRecord("BOOK-123-B", 4, morning), &error));
    EXPECT_FALSE(error.isEmpty());

    EXPECT_EQ(TestSupport::readFile(logPath), before);
    EXPECT_EQ(TestSupport::entryNames(dir.path()), QStringList({"books_complete_log.json"}));
    EXPECT_EQ(crashing.recordsForDate(morning.date()).size(), 1);
}

TEST_F(TransferLogTest, ClearEmptiesTheWholeLog) {
    TransferLog log(logPath);
    ASSERT_TRUE(log.load(nullptr));
    ASSERT_TRUE(log.append(makeRecord("BOOK-123-A", 3, morning), nullptr));
    ASSERT_TRUE(log.clear(nullptr));

    TransferLog reader(logPath);
    ASSERT_TRUE(reader.load(nullptr));
    EXPECT_EQ(reader.recordCount(), 0);
}

TEST_F(TransferLogTest, AppendRequiresLoad) {
    TransferLog log(logPath);
    QString error;
    EXPECT_FALSE(log.append(makeRecord("BOOK-123-A", 3, morning), &error));
    EXPECT_FALSE(QFileInfo::exists(logPath));
}
