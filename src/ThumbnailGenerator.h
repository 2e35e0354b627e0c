#pragma once

#include <QImage>
#include <QRect>
#include <QRectF>
#include <QSize>
#include <QString>

#include "RetryPolicy.h"
#include "ThumbnailJob.h"

namespace ThumbnailGenerator {

struct ThumbnailResult {
    bool ok = false;
    QImage image;
    QString error;
};

QRect cropRect(const QRectF &normalizedRegion, const QSize &imageSize);
QImage placeholder(const QSize &targetSize);
ThumbnailResult generate(const ThumbnailJob &job, const QSize &targetSize, const RetryPolicy &retry);

} // namespace ThumbnailGenerator
