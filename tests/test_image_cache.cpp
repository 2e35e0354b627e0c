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

#include <QImage>

#include "ImageCache.h"

namespace {

QImage makeImage(int width, int height)
{
    QImage image(width, height, QImage::Format_ARGB32);
    image.fill(Qt::white);
    return image;
}

// 100x100 ARGB32
constexpr qint64 tileBytes = 100 * 100 * 4;

} // namespace

class ImageCacheTest : public ::testing::Test {
protected:
    ImageCache cache{3 * tileBytes};
};

TEST_F(ImageCacheTest, NeverExceedsBudget) {
    for (int i = 0; i < 20; ++i) {
        cache.put(QStringLiteral("/scan/%1.png").arg(i), makeImage(100, 100));
        EXPECT_LE(cache.totalBytes(), cache.budgetBytes());
    }
    EXPECT_EQ(cache.size(), 3);
    EXPECT_EQ(cache.stats().evictions, 17);
}

TEST_F(ImageCacheTest, MixedSizesStayWithinBudget) {
    const int sides[] = {10, 150, 40, 90, 120, 5, 170, 60};
    for (int i = 0; i < 8; ++i) {
        cache.put(QStringLiteral("/scan/%1.png").arg(i), makeImage(sides[i], sides[i]));
        EXPECT_LE(cache.totalBytes(), cache.budgetBytes());
    }
}

TEST_F(ImageCacheTest, EvictsLeastRecentlyAccessedFirst) {
    cache.put("A", makeImage(100, 100));
    cache.put("B", makeImage(100, 100));
    cache.put("C", makeImage(100, 100));
    EXPECT_TRUE(cache.get("A").hit);

    cache.put("D", makeImage(100, 100));
    EXPECT_FALSE(cache.contains("B"));
    EXPECT_TRUE(cache.contains("C"));
    EXPECT_TRUE(cache.contains("A"));

    cache.put("E", makeImage(100, 100));
    EXPECT_FALSE(cache.contains("C"));
    EXPECT_TRUE(cache.contains("A"));
    EXPECT_EQ(cache.keysByRecency(), QStringList({"E", "D", "A"}));
}

TEST_F(ImageCacheTest, OversizedEntryIsAdmittedAloneAndEvictedNext) {
    cache.put("small", makeImage(10, 10));
    cache.put("huge", makeImage(400, 400));
    EXPECT_EQ(cache.size(), 1);
    EXPECT_TRUE(cache.contains("huge"));
    EXPECT_GT(cache.totalBytes(), cache.budgetBytes());

    cache.put("next", makeImage(10, 10));
    EXPECT_FALSE(cache.contains("huge"));
    EXPECT_TRUE(cache.contains("next"));
    EXPECT_LE(cache.totalBytes(), cache.budgetBytes());
}

TEST_F(ImageCacheTest, ReplacingKeyDoesNotDoubleCount) {
    cache.put("A", makeImage(100, 100));
    cache.put("A", makeImage(50, 50));
    EXPECT_EQ(cache.size(), 1);
    EXPECT_EQ(cache.totalBytes(), 50 * 50 * 4);
}

TEST_F(ImageCacheTest, MissReturnsNullImage) {
    const CacheLookup lookup = cache.get("absent");
    EXPECT_FALSE(lookup.hit);
    EXPECT_TRUE(lookup.image.isNull());
    EXPECT_EQ(cache.stats().misses, 1);
}

TEST_F(ImageCacheTest, NullImageIsIgnored) {
    cache.put("A", QImage());
    EXPECT_EQ(cache.size(), 0);
}

TEST_F(ImageCacheTest, InvalidateDropsImageAndVariants) {
    cache.put("/scan/a.png", makeImage(10, 10));
    cache.put(ImageCache::variantKey("/scan/a.png", "thumb"), makeImage(10, 10));
    cache.put(ImageCache::variantKey("/scan/a.png", "left"), makeImage(10, 10));
    cache.put("/scan/a.png.bak", makeImage(10, 10));
    cache.put("/scan/ab.png", makeImage(10, 10));

    cache.invalidate("/scan/a.png");

    EXPECT_EQ(cache.size(), 2);
    EXPECT_TRUE(cache.contains("/scan/a.png.bak"));
    EXPECT_TRUE(cache.contains("/scan/ab.png"));
    EXPECT_EQ(cache.totalBytes(), 2 * 10 * 10 * 4);
}

TEST_F(ImageCacheTest, RekeyKeepsEntriesUnderNewPath) {
    cache.put("/scan/a.png", makeImage(10, 10));
    cache.put(ImageCache::variantKey("/scan/a.png", "thumb"), makeImage(10, 10));

    cache.rekey("/scan/a.png", "/scan/b.png");

    EXPECT_FALSE(cache.contains("/scan/a.png"));
    EXPECT_TRUE(cache.get("/scan/b.png").hit);
    EXPECT_TRUE(cache.get(ImageCache::variantKey("/scan/b.png", "thumb")).hit);
    EXPECT_EQ(cache.size(), 2);
}

TEST_F(ImageCacheTest, DisablingDropsEntriesAndIgnoresPuts) {
    cache.put("A", makeImage(10, 10));
    cache.setEnabled(false);
    EXPECT_EQ(cache.size(), 0);
    cache.put("B", makeImage(10, 10));
    EXPECT_FALSE(cache.contains("B"));

    cache.setEnabled(true);
    cache.put("B", makeImage(10, 10));
    EXPECT_TRUE(cache.contains("B"));
}

TEST(ImageCacheEntryLimitTest, EvictsByCountWhenBudgetAllows) {
    ImageCache cache(64 * 1024 * 1024, 2);
    cache.put("A", makeImage(10, 10));
    cache.put("B", makeImage(10, 10));
    cache.put("C", makeImage(10, 10));
    EXPECT_EQ(cache.size(), 2);
    EXPECT_FALSE(cache.contains("A"));
}
