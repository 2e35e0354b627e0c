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

#include "RoutingTable.h"

#include <QCoreApplication>
#include <QDir>
#include <QRegularExpression>
#include <QSettings>

#include "PlatformUtils.h"

namespace {
constexpr char routingGroup[] = "routing";

struct RoutingConstants {
    static constexpr int identifierWidth = 3;
};

const QRegularExpression &identifierPattern()
{
    static const QRegularExpression pattern(QStringLiteral("(?<!\\d)(\\d{3})(?!\\d)"));
    return pattern;
}
} // namespace

/**
 * @brief Reads the routing group of a settings file.
 * @param settings Settings positioned at the root group.
 * @param warnings Optional list receiving one message per skipped entry.
 * @return Table holding every valid identifier mapping.
 */
RoutingTable RoutingTable::fromSettings(QSettings &settings, QStringList *warnings)
{
    RoutingTable table;
    settings.beginGroup(QLatin1String(routingGroup));
    const QStringList keys = settings.childKeys();
    for (const QString &key : keys) {
        QString error;
        if (!table.insert(key, settings.value(key).toString(), &error)) {
            if (warnings) {
                const QString message = QCoreApplication::translate("RoutingTable", "Skipping route %1: %2").arg(key, error);
                warnings->append(message);
            }
        }
    }
    settings.endGroup();
    return table;
}

/**
 * @brief Extracts the routing identifier from a batch name.
 * @param batchName Batch folder name, such as "BOOK-123-A".
 * @return First stand-alone three digit token, or an empty string.
 */
QString RoutingTable::parseIdentifier(const QString &batchName)
{
    const QRegularExpressionMatch match = identifierPattern().match(batchName);
    if (!match.hasMatch()) {
        return QString();
    }
    return match.captured(1);
}

bool RoutingTable::isValidIdentifier(const QString &identifier)
{
    if (identifier.size() != RoutingConstants::identifierWidth) {
        return false;
    }
    for (const QChar ch : identifier) {
        if (!ch.isDigit()) {
            return false;
        }
    }
    return true;
}

/**
 * @brief Adds or replaces a mapping.
 * @param identifier Three digit identifier.
 * @param destinationRoot Absolute destination folder.
 * @param error Optional output error message.
 * @return True if the mapping was stored.
 */
bool RoutingTable::insert(const QString &identifier, const QString &destinationRoot, QString *error)
{
    if (!isValidIdentifier(identifier)) {
        if (error) {
            *error = QCoreApplication::translate("RoutingTable", "Identifier must be three digits");
        }
        return false;
    }
    const QString trimmed = destinationRoot.trimmed();
    if (trimmed.isEmpty() || !QDir::isAbsolutePath(QDir::fromNativeSeparators(trimmed))) {
        if (error) {
            *error = QCoreApplication::translate("RoutingTable", "Destination must be an absolute path");
        }
        return false;
    }
    m_destinations.insert(identifier, PlatformUtils::normalizePath(trimmed));
    return true;
}

QString RoutingTable::destinationFor(const QString &identifier) const
{
    return m_destinations.value(identifier);
}

bool RoutingTable::contains(const QString &identifier) const
{
    return m_destinations.contains(identifier);
}

bool RoutingTable::isEmpty() const
{
    return m_destinations.isEmpty();
}

int RoutingTable::size() const
{
    return m_destinations.size();
}

QMap<QString, QString> RoutingTable::entries() const
{
    return m_destinations;
}
