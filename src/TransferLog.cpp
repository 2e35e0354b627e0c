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

#include "TransferLog.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>

#include "Logging.h"

namespace {
struct TransferLogConstants {
    static constexpr char dateFormat[] = "yyyy-MM-dd";
    static constexpr char nameKey[] = "name";
    static constexpr char pagesKey[] = "pages";
    static constexpr char pathKey[] = "path";
    static constexpr char timestampKey[] = "timestamp";
};

QString logError(const char *message)
{
    return QCoreApplication::translate("TransferLog", message);
}

QJsonObject recordToJson(const TransferRecord &record)
{
    QJsonObject object;
    object.insert(QLatin1String(TransferLogConstants::nameKey), record.batchName);
    object.insert(QLatin1String(TransferLogConstants::pagesKey), record.pageCount);
    object.insert(QLatin1String(TransferLogConstants::pathKey), QDir::toNativeSeparators(record.destinationPath));
    object.insert(QLatin1String(TransferLogConstants::timestampKey), record.timestamp.toString(Qt::ISODate));
    return object;
}

TransferRecord recordFromJson(const QJsonObject &object)
{
    TransferRecord record;
    record.batchName = object.value(QLatin1String(TransferLogConstants::nameKey)).toString();
    record.pageCount = object.value(QLatin1String(TransferLogConstants::pagesKey)).toInt();
    record.destinationPath = QDir::fromNativeSeparators(object.value(QLatin1String(TransferLogConstants::pathKey)).toString());
    record.timestamp = QDateTime::fromString(object.value(QLatin1String(TransferLogConstants::timestampKey)).toString(),
                                             Qt::ISODate);
    return record;
}
} // namespace

TransferLog::TransferLog(const QString &path)
    : m_path(path)
{
}

TransferLog::~TransferLog() = default;

QString TransferLog::path() const
{
    return m_path;
}

bool TransferLog::isLoaded() const
{
    return m_loaded;
}

/**
 * @brief Reads the log from disk; a missing file is an empty log.
 * @param error Optional output error message.
 * @return False when the file cannot be read or is not a JSON object.
 */
bool TransferLog::load(QString *error)
{
    m_loaded = false;
    m_root = QJsonObject();
    QFile file(m_path);
    if (!file.exists()) {
        m_loaded = true;
        return true;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) {
            *error = logError("Cannot read transfer log: %1").arg(file.errorString());
        }
        return false;
    }
    const QByteArray data = file.readAll();
    if (data.trimmed().isEmpty()) {
        m_loaded = true;
        return true;
    }
    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        if (error) {
            *error = logError("Transfer log is corrupted: %1").arg(m_path);
        }
        qCWarning(lcTransfer) << "Corrupted transfer log" << m_path << parseError.errorString();
        return false;
    }
    m_root = document.object();
    m_loaded = true;
    return true;
}

/**
 * @brief Adds one record and atomically rewrites the file.
 * @param record Record to add under the local date of its timestamp.
 * @param error Optional output error message.
 * @return True when the new version is on disk; on failure the log is unchanged in memory and on disk.
 */
bool TransferLog::append(const TransferRecord &record, QString *error)
{
    if (!m_loaded) {
        if (error) {
            *error = logError("Transfer log not loaded");
        }
        return false;
    }
    const QString key = dateKey(record.timestamp.date());
    QJsonObject root = m_root;
    const QJsonValue existing = root.value(key);
    QJsonArray records;
    if (existing.isArray()) {
        records = existing.toArray();
    } else if (!existing.isUndefined() && !existing.isNull()) {
        records.append(existing);
    }
    records.append(recordToJson(record));
    root.insert(key, records);

    if (!writeDocument(root, error)) {
        return false;
    }
    m_root = root;
    qCInfo(lcTransfer) << "Logged" << record.batchName << record.pageCount << "pages";
    return true;
}

/**
 * @brief Empties the whole log; reserved for an explicit operator request.
 * @param error Optional output error message.
 * @return True when the empty log is on disk.
 */
bool TransferLog::clear(QString *error)
{
    if (!writeDocument(QJsonObject(), error)) {
        return false;
    }
    m_root = QJsonObject();
    m_loaded = true;
    qCWarning(lcTransfer) << "Transfer log cleared" << m_path;
    return true;
}

/**
 * @brief Returns the records of one day in write order.
 * @param date Local date.
 * @return Records; entries that are not objects are skipped.
 */
QList<TransferRecord> TransferLog::recordsForDate(const QDate &date) const
{
    QList<TransferRecord> records;
    const QJsonValue value = m_root.value(dateKey(date));
    if (!value.isArray()) {
        return records;
    }
    const QJsonArray array = value.toArray();
    for (const QJsonValue &entry : array) {
        if (entry.isObject()) {
            records.append(recordFromJson(entry.toObject()));
        }
    }
    return records;
}

int TransferLog::pagesForDate(const QDate &date) const
{
    int pages = 0;
    for (const TransferRecord &record : recordsForDate(date)) {
        pages += record.pageCount;
    }
    return pages;
}

int TransferLog::recordCount() const
{
    int count = 0;
    for (auto it = m_root.constBegin(); it != m_root.constEnd(); ++it) {
        if (!it.value().isArray()) {
            continue;
        }
        const QJsonArray array = it.value().toArray();
        for (const QJsonValue &entry : array) {
            if (entry.isObject()) {
                count += 1;
            }
        }
    }
    return count;
}

QString TransferLog::dateKey(const QDate &date)
{
    return date.toString(QLatin1String(TransferLogConstants::dateFormat));
}

/**
 * @brief Publishes the temporary file over the log.
 * @param file Saved file holding the complete new version.
 * @return True when the rename succeeded.
 */
bool TransferLog::commit(QSaveFile &file)
{
    return file.commit();
}

bool TransferLog::writeDocument(const QJsonObject &root, QString *error)
{
    const QFileInfo info(m_path);
    if (!QDir().mkpath(info.absolutePath())) {
        if (error) {
            *error = logError("Cannot create folder for transfer log");
        }
        return false;
    }

    QSaveFile file(m_path);
    if (!file.open(QIODevice::WriteOnly)) {
        if (error) {
            *error = logError("Cannot write transfer log: %1").arg(file.errorString());
        }
        return false;
    }
    const QByteArray data = QJsonDocument(root).toJson(QJsonDocument::Indented);
    if (file.write(data) != data.size()) {
        file.cancelWriting();
        if (error) {
            *error = logError("Cannot write transfer log: %1").arg(file.errorString());
        }
        return false;
    }
    if (!commit(file)) {
        if (error) {
            *error = logError("Cannot save transfer log: %1").arg(file.errorString());
        }
        qCWarning(lcTransfer) << "Transfer log not saved" << m_path;
        return false;
    }
    return true;
}
