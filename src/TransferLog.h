#pragma once

#include <QDate>
#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QMetaType>
#include <QString>

class QSaveFile;

struct TransferRecord {
    QString batchName;
    int pageCount = 0;
    QString destinationPath;
    QDateTime timestamp;
};

Q_DECLARE_METATYPE(TransferRecord)

/**
 * @brief Append-only record of archived batches, keyed by local date.
 *
 * Every change rewrites the whole file through a temporary file renamed over
 * the original, so an interrupted write leaves the previous version intact.
 */
class TransferLog
{
public:
    explicit TransferLog(const QString &path);
    virtual ~TransferLog();

    QString path() const;
    bool isLoaded() const;

    bool load(QString *error);
    bool append(const TransferRecord &record, QString *error);
    bool clear(QString *error);

    QList<TransferRecord> recordsForDate(const QDate &date) const;
    int pagesForDate(const QDate &date) const;
    int recordCount() const;

    static QString dateKey(const QDate &date);

protected:
    virtual bool commit(QSaveFile &file);

private:
    bool writeDocument(const QJsonObject &root, QString *error);

    QString m_path;
    QJsonObject m_root;
    bool m_loaded = false;
};
