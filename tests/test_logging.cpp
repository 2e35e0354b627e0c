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

#include "Logging.h"
#include "TestSupport.h"

TEST(LoggingTest, MirrorsCategoryMessagesToFile) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString logPath = dir.filePath("scanshelf.log");

    QString error;
    ASSERT_TRUE(Logging::initialize(logPath, false, &error)) << error.toStdString();
    qCWarning(lcConfig) << "mirrored warning";
    Logging::shutdown();
    qCWarning(lcConfig) << "after shutdown";

    const QString contents = QString::fromUtf8(TestSupport::readFile(logPath));
    EXPECT_TRUE(contents.contains("scanshelf.config"));
    EXPECT_TRUE(contents.contains("mirrored warning"));
    EXPECT_FALSE(contents.contains("after shutdown"));
}

TEST(LoggingTest, UnwritableLogPathIsReported) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    QString error;
    EXPECT_FALSE(Logging::initialize(dir.path(), false, &error));
    EXPECT_TRUE(error.contains(dir.path()));
    Logging::shutdown();
}

TEST(LoggingTest, ConsoleOnlyNeedsNoFile) {
    QString error;
    EXPECT_TRUE(Logging::initialize(QString(), false, &error));
    EXPECT_TRUE(error.isEmpty());
    Logging::shutdown();
}
