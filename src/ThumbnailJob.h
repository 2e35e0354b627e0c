#pragma once

#include <QRectF>
#include <QString>

enum class ThumbnailPriority {
    Visible = 0,
    Adjacent = 1,
    Background = 2
};

namespace ThumbnailPriorityUtils {

ThumbnailPriority classify(int index, int firstVisible, int lastVisible, int adjacentWindow = 6);

} // namespace ThumbnailPriorityUtils

/**
 * @brief Immutable request for one derived preview image.
 *
 * Instances are built through the factory functions, which validate the
 * request; an invalid request has `isValid() == false`.
 */
class ThumbnailJob
{
public:
    enum class Kind {
        Whole,
        Region,
        Disabled
    };

    ThumbnailJob() = default;

    static ThumbnailJob whole(const QString &sourcePath,
                              ThumbnailPriority priority,
                              const QString &variant = QString(),
                              QString *error = nullptr);
    static ThumbnailJob region(const QString &sourcePath,
                               ThumbnailPriority priority,
                               const QString &variant,
                               const QRectF &normalizedRegion,
                               QString *error = nullptr);
    static ThumbnailJob disabled(const QString &sourcePath,
                                 const QString &variant,
                                 QString *error = nullptr);

    bool isValid() const;
    Kind kind() const;
    ThumbnailPriority priority() const;
    QString sourcePath() const;
    QString variant() const;
    QRectF cropRegion() const;
    QString key() const;

    quint64 sequence() const;
    ThumbnailJob withSequence(quint64 sequence) const;

private:
    static bool validateSource(const QString &sourcePath, QString *error);

    Kind m_kind = Kind::Whole;
    ThumbnailPriority m_priority = ThumbnailPriority::Background;
    QString m_sourcePath;
    QString m_variant;
    QRectF m_cropRegion;
    quint64 m_sequence = 0;
    bool m_valid = false;
};

QString thumbnailKey(const QString &sourcePath, const QString &variant);
