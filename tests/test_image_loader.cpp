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

#include "ImageCache.h"
#include "ImageLoader.h"
#include "PlatformUtils.h"
#include "TestSupport.h"

class ImageLoaderTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(dir.isValid());
        root = PlatformUtils::normalizePath(dir.path());
        loader.setRetryPolicy(TestSupport::fastRetry());
        QObject::connect(&loader, &ImageLoader::imageLoaded, &receiver, [this](const QString &path, const QImage &image) {
            loaded.append(path);
            images.insert(path, image);
        });
        QObject::connect(&loader, &ImageLoader::imageFailed, &receiver, [this](const QString &path, const QString &) {
            failed.append(path);
        });
    }

    void TearDown() override
    {
        loader.waitForIdle();
        QCoreApplication::processEvents();
    }

    QString image(const QString &name, const QColor &color)
    {
        const QString path = root + QLatin1Char('/') + name;
        EXPECT_TRUE(TestSupport::writeImage(path, QSize(40, 30), color));
        return path;
    }

    QTemporaryDir dir;
    QString root;
    ImageCache cache{16 * 1024 * 1024};
    ImageLoader loader{&cache};
    QObject receiver;
    QStringList loaded;
    QStringList failed;
    QHash<QString, QImage> images;
};

TEST_F(ImageLoaderTest, DecodesAndCachesOnMiss) {
    const QString path = image("page.png", Qt::green);

    loader.requestImage(path);
    EXPECT_TRUE(loader.isLoading(path));
    ASSERT_TRUE(TestSupport::waitUntil([this]() { return !loaded.isEmpty(); }));

    EXPECT_EQ(loaded, QStringList({path}));
    EXPECT_EQ(images.value(path).size(), QSize(40, 30));
    EXPECT_TRUE(cache.contains(path));
    EXPECT_FALSE(loader.isLoading(path));
}

TEST_F(ImageLoaderTest, CacheHitIsDeliveredWithoutDecoding) {
    const QString path = root + "/not-on-disk.png";
    QImage cached(10, 10, QImage::Format_RGB32);
    cached.fill(Qt::red);
    cache.put(path, cached);

    loader.requestImage(path);
    ASSERT_EQ(loaded, QStringList({path}));
    EXPECT_FALSE(loader.isLoading(path));
    EXPECT_EQ(images.value(path).pixelColor(0, 0), QColor(Qt::red));
    EXPECT_TRUE(failed.isEmpty());
}

TEST_F(ImageLoaderTest, ConcurrentRequestsShareOneDecode) {
    const QString path = image("page.png", Qt::green);

    loader.requestImage(path);
    loader.requestImage(path);
    loader.requestImage(path);
    ASSERT_TRUE(TestSupport::waitUntil([this]() { return !loaded.isEmpty(); }));
    TestSupport::spin(100);

    EXPECT_EQ(loaded.size(), 1);
    EXPECT_EQ(cache.stats().entryCount, 1);
}

TEST_F(ImageLoaderTest, DecodeInvalidatedWhileRunningIsDropped) {
    const QString path = image("edited.png", Qt::green);

    loader.requestImage(path);
    loader.invalidate(path);
    loader.waitForIdle();
    TestSupport::spin(100);

    EXPECT_TRUE(loaded.isEmpty());
    EXPECT_FALSE(cache.contains(path));
    EXPECT_FALSE(loader.isLoading(path));
}

TEST_F(ImageLoaderTest, ForceReloadReplacesCachedPixels) {
    const QString path = image("page.png", Qt::green);
    QImage stale(40, 30, QImage::Format_RGB32);
    stale.fill(Qt::red);
    cache.put(path, stale);

    loader.requestImage(path, true);
    ASSERT_TRUE(TestSupport::waitUntil([this]() { return !loaded.isEmpty(); }));

    EXPECT_EQ(images.value(path).pixelColor(5, 5), QColor(Qt::green));
    const CacheLookup lookup = cache.get(path);
    ASSERT_TRUE(lookup.hit);
    EXPECT_EQ(lookup.image.pixelColor(5, 5), QColor(Qt::green));
}

TEST_F(ImageLoaderTest, RenameMovesCachedImage) {
    const QString path = image("page.png", Qt::green);
    loader.requestImage(path);
    ASSERT_TRUE(TestSupport::waitUntil([this]() { return !loaded.isEmpty(); }));

    const QString renamed = root + "/renamed.png";
    ASSERT_TRUE(QFile::rename(path, renamed));
    loader.rename(path, renamed);

    EXPECT_FALSE(cache.contains(path));
    EXPECT_TRUE(cache.contains(renamed));
    loaded.clear();
    loader.requestImage(renamed);
    EXPECT_EQ(loaded, QStringList({renamed}));
}

TEST_F(ImageLoaderTest, MissingFileFails) {
    loader.requestImage(root + "/missing.png");
    ASSERT_TRUE(TestSupport::waitUntil([this]() { return !failed.isEmpty(); }));
    EXPECT_TRUE(loaded.isEmpty());
    EXPECT_EQ(cache.size(), 0);
}
