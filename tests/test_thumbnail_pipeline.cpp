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

#include <QObject>
#include <QTemporaryDir>

#include "ImageCache.h"
#include "PlatformUtils.h"
#include "TestSupport.h"
#include "ThumbnailPipeline.h"

class ThumbnailPipelineTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(dir.isValid());
        QObject::connect(&pipeline, &ThumbnailPipeline::thumbnailReady, &receiver,
                         [this](const QString &key, const QImage &image) {
                             delivered.append(key);
                             images.insert(key, image);
                         });
        QObject::connect(&pipeline, &ThumbnailPipeline::thumbnailFailed, &receiver,
                         [this](const QString &key, const QString &) {
                             failures.append(key);
                         });
    }

    void TearDown() override
    {
        pipeline.stop();
    }

    QString image(const QString &name, const QSize &size, const QColor &color = QColor(Qt::darkGray))
    {
        const QString path = PlatformUtils::normalizePath(dir.filePath(name));
        EXPECT_TRUE(TestSupport::writeImage(path, size, color));
        return path;
    }

    QTemporaryDir dir;
    ImageCache cache{64 * 1024 * 1024, 200};
    ThumbnailPipeline pipeline{&cache};
    QObject receiver;
    QStringList delivered;
    QStringList failures;
    QHash<QString, QImage> images;
};

TEST_F(ThumbnailPipelineTest, ScalesIntoFootprintKeepingAspectRatio) {
    const QString source = image("wide.png", QSize(400, 200));
    pipeline.start();
    const ThumbnailJob job = ThumbnailJob::whole(source, ThumbnailPriority::Visible);
    ASSERT_TRUE(pipeline.request(job));

    ASSERT_TRUE(TestSupport::waitUntil([&]() { return delivered.contains(job.key()); }));
    EXPECT_EQ(images.value(job.key()).size(), QSize(90, 45));
    EXPECT_TRUE(cache.contains(job.key()));
}

TEST_F(ThumbnailPipelineTest, CropsRegionBeforeScaling) {
    const QString source = PlatformUtils::normalizePath(dir.filePath("spread.png"));
    QImage spread(200, 200, QImage::Format_RGB32);
    spread.fill(Qt::red);
    for (int y = 0; y < 200; ++y) {
        for (int x = 100; x < 200; ++x) {
            spread.setPixelColor(x, y, Qt::blue);
        }
    }
    ASSERT_TRUE(spread.save(source, "PNG"));

    pipeline.start();
    const ThumbnailJob right = ThumbnailJob::region(source, ThumbnailPriority::Visible, "right",
                                                    QRectF(0.5, 0.0, 0.5, 1.0));
    ASSERT_TRUE(pipeline.request(right));
    ASSERT_TRUE(TestSupport::waitUntil([&]() { return delivered.contains(right.key()); }));

    const QImage preview = images.value(right.key());
    EXPECT_EQ(preview.size(), QSize(55, 110));
    EXPECT_EQ(preview.pixelColor(preview.width() / 2, preview.height() / 2), QColor(Qt::blue));
}

TEST_F(ThumbnailPipelineTest, DuplicateRequestsGenerateOnce) {
    const QString source = image("page.png", QSize(120, 160));
    const ThumbnailJob job = ThumbnailJob::whole(source, ThumbnailPriority::Visible);
    ASSERT_TRUE(pipeline.request(job));
    ASSERT_TRUE(pipeline.request(job));
    EXPECT_EQ(pipeline.queuedCount(), 1);

    pipeline.start();
    ASSERT_TRUE(TestSupport::waitUntil([&]() { return delivered.contains(job.key()); }));
    TestSupport::spin(100);
    EXPECT_EQ(pipeline.generatedCount(), 1u);

    ASSERT_TRUE(pipeline.request(job));
    EXPECT_EQ(delivered.count(job.key()), 2);
    EXPECT_EQ(pipeline.generatedCount(), 1u);
}

TEST_F(ThumbnailPipelineTest, ServesByPriorityThenRequestOrder) {
    const ThumbnailJob first = ThumbnailJob::whole(image("a.png", QSize(50, 50)), ThumbnailPriority::Background);
    const ThumbnailJob second = ThumbnailJob::whole(image("b.png", QSize(50, 50)), ThumbnailPriority::Background);
    const ThumbnailJob urgent = ThumbnailJob::whole(image("c.png", QSize(50, 50)), ThumbnailPriority::Visible);
    pipeline.request(first);
    pipeline.request(second);
    pipeline.request(urgent);

    pipeline.start();
    ASSERT_TRUE(TestSupport::waitUntil([&]() { return delivered.size() == 3; }));
    EXPECT_EQ(delivered, QStringList({urgent.key(), first.key(), second.key()}));
}

TEST_F(ThumbnailPipelineTest, DisabledVariantUsesPlaceholderWithoutSource) {
    const ThumbnailJob job = ThumbnailJob::disabled(dir.filePath("missing.png"), "left");
    ASSERT_TRUE(job.isValid());
    ASSERT_TRUE(pipeline.request(job));

    ASSERT_EQ(delivered, QStringList({job.key()}));
    EXPECT_EQ(images.value(job.key()).size(), QSize(90, 110));
    EXPECT_EQ(pipeline.generatedCount(), 0u);
}

TEST_F(ThumbnailPipelineTest, RemovedSourceIsNeverPublished) {
    const ThumbnailJob removed = ThumbnailJob::whole(image("gone.png", QSize(50, 50)), ThumbnailPriority::Visible);
    const ThumbnailJob kept = ThumbnailJob::whole(image("kept.png", QSize(50, 50)), ThumbnailPriority::Background);
    pipeline.request(removed);
    pipeline.request(kept);
    pipeline.sourceRemoved(removed.sourcePath());

    pipeline.start();
    ASSERT_TRUE(TestSupport::waitUntil([&]() { return delivered.contains(kept.key()); }));
    TestSupport::spin(100);
    EXPECT_FALSE(delivered.contains(removed.key()));
    EXPECT_EQ(pipeline.generatedCount(), 1u);
}

TEST_F(ThumbnailPipelineTest, InvalidateForcesRegeneration) {
    const QString source = image("edited.png", QSize(60, 60), Qt::red);
    const ThumbnailJob job = ThumbnailJob::whole(source, ThumbnailPriority::Visible);
    pipeline.start();
    pipeline.request(job);
    ASSERT_TRUE(TestSupport::waitUntil([&]() { return delivered.size() == 1; }));

    ASSERT_TRUE(TestSupport::writeImage(source, QSize(60, 60), Qt::green));
    pipeline.invalidate(source);
    EXPECT_FALSE(cache.contains(job.key()));

    pipeline.request(job);
    ASSERT_TRUE(TestSupport::waitUntil([&]() { return delivered.size() == 2; }));
    EXPECT_EQ(pipeline.generatedCount(), 2u);
    EXPECT_EQ(images.value(job.key()).pixelColor(10, 10), QColor(Qt::green));
}

TEST_F(ThumbnailPipelineTest, UndecodableSourceReportsFailure) {
    const QString source = PlatformUtils::normalizePath(dir.filePath("broken.png"));
    ASSERT_TRUE(TestSupport::writeFile(source, "not an image"));
    const ThumbnailJob job = ThumbnailJob::whole(source, ThumbnailPriority::Visible);
    pipeline.start();
    pipeline.request(job);

    ASSERT_TRUE(TestSupport::waitUntil([&]() { return failures.contains(job.key()); }));
    EXPECT_FALSE(cache.contains(job.key()));
}
