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

#include "ThumbnailJob.h"

#include <QCoreApplication>

#include "ImageCache.h"
#include "PlatformUtils.h"

namespace {
struct ThumbnailJobConstants {
    static constexpr char wholeVariant[] = "thumb";
};

QString jobError(const char *message)
{
    return QCoreApplication::translate("ThumbnailJob", message);
}
} // namespace

namespace ThumbnailPriorityUtils {

/**
 * @brief Maps the distance of an item to the visible range onto a priority.
 * @param index Item index in the list.
 * @param firstVisible First visible index.
 * @param lastVisible Last visible index.
 * @param adjacentWindow Number of items on each side counted as adjacent.
 * @return Visible inside the range, Adjacent within the window, Background otherwise.
 */
ThumbnailPriority classify(int index, int firstVisible, int lastVisible, int adjacentWindow)
{
    if (firstVisible > lastVisible) {
        return ThumbnailPriority::Background;
    }
    if (index >= firstVisible && index <= lastVisible) {
        return ThumbnailPriority::Visible;
    }
    const int window = adjacentWindow > 0 ? adjacentWindow : 0;
    const int distance = index < firstVisible ? firstVisible - index : index - lastVisible;
    return distance <= window ? ThumbnailPriority::Adjacent : ThumbnailPriority::Background;
}

} // namespace ThumbnailPriorityUtils

/**
 * @brief Builds the cache key of a preview.
 * @param sourcePath Source image path.
 * @param variant Variant identifier; empty selects the whole-image variant.
 * @return Composite key.
 */
QString thumbnailKey(const QString &sourcePath, const QString &variant)
{
    const QString effectiveVariant = variant.isEmpty()
        ? QString::fromLatin1(ThumbnailJobConstants::wholeVariant)
        : variant;
    return ImageCache::variantKey(PlatformUtils::normalizePath(sourcePath), effectiveVariant);
}

/**
 * @brief Creates a request for a preview of the whole image.
 * @param sourcePath Source image path.
 * @param priority Scheduling priority.
 * @param variant Variant identifier; empty selects the default whole-image variant.
 * @param error Optional output error message.
 * @return The job, invalid when the source path is empty.
 */
ThumbnailJob ThumbnailJob::whole(const QString &sourcePath,
                                 ThumbnailPriority priority,
                                 const QString &variant,
                                 QString *error)
{
    ThumbnailJob job;
    if (!validateSource(sourcePath, error)) {
        return job;
    }
    job.m_kind = Kind::Whole;
    job.m_priority = priority;
    job.m_sourcePath = PlatformUtils::normalizePath(sourcePath);
    job.m_variant = variant.isEmpty() ? QString::fromLatin1(ThumbnailJobConstants::wholeVariant) : variant;
    job.m_valid = true;
    return job;
}

/**
 * @brief Creates a request for a preview of a cropped region.
 * @param sourcePath Source image path.
 * @param priority Scheduling priority.
 * @param variant Variant identifier, such as the side of a double page.
 * @param normalizedRegion Region as fractions of the image width and height.
 * @param error Optional output error message.
 * @return The job, invalid when the variant is empty or the region lies outside the unit square.
 */
ThumbnailJob ThumbnailJob::region(const QString &sourcePath,
                                  ThumbnailPriority priority,
                                  const QString &variant,
                                  const QRectF &normalizedRegion,
                                  QString *error)
{
    ThumbnailJob job;
    if (!validateSource(sourcePath, error)) {
        return job;
    }
    if (variant.isEmpty()) {
        if (error) {
            *error = jobError("Region preview needs a variant name");
        }
        return job;
    }
    if (normalizedRegion.isEmpty()
        || normalizedRegion.left() < 0.0 || normalizedRegion.top() < 0.0
        || normalizedRegion.right() > 1.0 || normalizedRegion.bottom() > 1.0) {
        if (error) {
            *error = jobError("Crop region out of range");
        }
        return job;
    }
    job.m_kind = Kind::Region;
    job.m_priority = priority;
    job.m_sourcePath = PlatformUtils::normalizePath(sourcePath);
    job.m_variant = variant;
    job.m_cropRegion = normalizedRegion;
    job.m_valid = true;
    return job;
}

/**
 * @brief Creates a request for a variant the operator turned off.
 * @param sourcePath Source image path.
 * @param variant Variant identifier.
 * @param error Optional output error message.
 * @return The job; it resolves to the placeholder without reading the source.
 */
ThumbnailJob ThumbnailJob::disabled(const QString &sourcePath, const QString &variant, QString *error)
{
    ThumbnailJob job;
    if (!validateSource(sourcePath, error)) {
        return job;
    }
    if (variant.isEmpty()) {
        if (error) {
            *error = jobError("Disabled preview needs a variant name");
        }
        return job;
    }
    job.m_kind = Kind::Disabled;
    job.m_priority = ThumbnailPriority::Visible;
    job.m_sourcePath = PlatformUtils::normalizePath(sourcePath);
    job.m_variant = variant;
    job.m_valid = true;
    return job;
}

bool ThumbnailJob::isValid() const
{
    return m_valid;
}

ThumbnailJob::Kind ThumbnailJob::kind() const
{
    return m_kind;
}

ThumbnailPriority ThumbnailJob::priority() const
{
    return m_priority;
}

QString ThumbnailJob::sourcePath() const
{
    return m_sourcePath;
}

QString ThumbnailJob::variant() const
{
    return m_variant;
}

QRectF ThumbnailJob::cropRegion() const
{
    return m_cropRegion;
}

QString ThumbnailJob::key() const
{
    return ImageCache::variantKey(m_sourcePath, m_variant);
}

quint64 ThumbnailJob::sequence() const
{
    return m_sequence;
}

/**
 * @brief Returns a copy stamped with its enqueue sequence number.
 * @param sequence Monotonic counter value assigned by the queue.
 * @return Stamped copy.
 */
ThumbnailJob ThumbnailJob::withSequence(quint64 sequence) const
{
    ThumbnailJob copy(*this);
    copy.m_sequence = sequence;
    return copy;
}

bool ThumbnailJob::validateSource(const QString &sourcePath, QString *error)
{
    if (sourcePath.trimmed().isEmpty()) {
        if (error) {
            *error = jobError("Source path is empty");
        }
        return false;
    }
    return true;
}
