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

#include <QSettings>
#include <QTemporaryDir>

#include "RoutingTable.h"

TEST(RoutingTableTest, ParsesStandaloneThreeDigitToken) {
    EXPECT_EQ(RoutingTable::parseIdentifier("BOOK-123-A"), "123");
    EXPECT_EQ(RoutingTable::parseIdentifier("123"), "123");
    EXPECT_EQ(RoutingTable::parseIdentifier("A-12-345-678"), "345");
    EXPECT_EQ(RoutingTable::parseIdentifier("1234-X"), "");
    EXPECT_EQ(RoutingTable::parseIdentifier("BOOK-XYZ"), "");
    EXPECT_EQ(RoutingTable::parseIdentifier(""), "");
}

TEST(RoutingTableTest, InsertValidatesIdentifierAndDestination) {
    RoutingTable table;
    QString error;
    EXPECT_FALSE(table.insert("12", "/archive", &error));
    EXPECT_FALSE(error.isEmpty());
    EXPECT_FALSE(table.insert("12a", "/archive", &error));
    EXPECT_FALSE(table.insert("123", "relative/path", &error));
    EXPECT_FALSE(table.insert("123", "  ", &error));
    EXPECT_TRUE(table.isEmpty());

    EXPECT_TRUE(table.insert("123", "/archive/one/", &error));
    EXPECT_TRUE(table.contains("123"));
    EXPECT_EQ(table.destinationFor("123"), "/archive/one");
    EXPECT_EQ(table.destinationFor("456"), "");

    EXPECT_TRUE(table.insert("123", "/archive/two", nullptr));
    EXPECT_EQ(table.size(), 1);
    EXPECT_EQ(table.destinationFor("123"), "/archive/two");
}

TEST(RoutingTableTest, ReadsRoutingGroupAndSkipsInvalidEntries) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("scanshelf.ini");
    {
        QSettings writer(path, QSettings::IniFormat);
        writer.beginGroup("routing");
        writer.setValue("123", "/archive/a");
        writer.setValue("456", "/archive/b");
        writer.setValue("78", "/archive/c");
        writer.setValue("999", "not/absolute");
        writer.endGroup();
        writer.setValue("paths/scan_root", "/scans");
        writer.sync();
    }

    QSettings reader(path, QSettings::IniFormat);
    QStringList warnings;
    const RoutingTable table = RoutingTable::fromSettings(reader, &warnings);
    EXPECT_EQ(table.size(), 2);
    EXPECT_EQ(table.destinationFor("123"), "/archive/a");
    EXPECT_EQ(table.destinationFor("456"), "/archive/b");
    EXPECT_FALSE(table.contains("999"));
    EXPECT_EQ(warnings.size(), 2);
}
