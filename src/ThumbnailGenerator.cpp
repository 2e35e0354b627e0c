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

#include "ThumbnailGenerator.h"

#include <QCoreApplication>

#include "ScanImageUtils.h"

namespace {
struct ThumbnailGeneratorConstants {
    static constexpr QRgb placeholderColor = 0xffd0d0d0;
};
} // namespace

namespace ThumbnailGenerator {

/**
 * @brief Converts a region expressed in fractions into pixels.
 * @param normalizedRegion Region as fractions of width and height.
 * @param imageSize Size of the decoded image.
 * @return Pixel rectangle clipped to the image.
 */
QRect cropRect(const QRectF &normalizedRegion, const QSize &imageSize)
{
    const int x = qRound(normalizedRegion.x() * imageSize.width());
    const int y = qRound(normalizedRegion.y() * imageSize.height());
    const int width = qRound(normalizedRegion.width() * imageSize.width());
    const int height = qRound(normalizedRegion.height() * imageSize.height());
    return QRect(x, y, width, height).intersected(QRect(QPoint(0, 0), imageSize));
}

/**
 * @brief Returns the constant image shown for disabled variants.
 * @param targetSize Preview footprint.
 * @return Uniform image of the target size.
 */
QImage placeholder(const QSize &targetSize)
{
    QImage image(targetSize, QImage::Format_RGB32);
    image.fill(ThumbnailGeneratorConstants::placeholderColor);
    return image;
}

/**
 * @brief Decodes the source, crops the requested region, and scales it to the footprint.
 * @param job Preview request.
 * @param targetSize Bounding box of the preview; the aspect ratio is kept.
 * @param retry Decode attempts for files still locked by the scanner.
 * @return Preview image, or the reason it could not be produced.
 */
ThumbnailResult generate(const ThumbnailJob &job, const QSize &targetSize, const RetryPolicy &retry)
{
    ThumbnailResult result;
    if (!job.isValid()) {
        result.error = QCoreApplication::translate("ThumbnailGenerator", "Invalid preview request");
        return result;
    }
    if (job.kind() == ThumbnailJob::Kind::Disabled) {
        result.ok = true;
        result.image = placeholder(targetSize);
        return result;
    }

    const ScanImageUtils::DecodeResult decoded = ScanImageUtils::decodeImage(job.sourcePath(), retry);
    if (!decoded.ok) {
        result.error = decoded.error;
        return result;
    }

    QImage image = decoded.image;
    if (job.kind() == ThumbnailJob::Kind::Region) {
        const QRect rect = cropRect(job.cropRegion(), image.size());
        if (rect.isEmpty()) {
            result.error = QCoreApplication::translate("ThumbnailGenerator", "Crop region is empty");
            return result;
        }
        image = image.copy(rect);
    }

    result.image = image.scaled(targetSize, Qt::KeepAspectRatio, Qt::SmoothTransformation);
    result.ok = !result.image.isNull();
    if (!result.ok) {
        result.error = QCoreApplication::translate("ThumbnailGenerator", "Cannot scale image");
    }
    return result;
}

} // namespace ThumbnailGenerator
