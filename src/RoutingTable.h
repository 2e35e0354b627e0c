#pragma once

#include <QMap>
#include <QString>
#include <QStringList>

class QSettings;

class RoutingTable
{
public:
    RoutingTable() = default;

    static RoutingTable fromSettings(QSettings &settings, QStringList *warnings);
    static QString parseIdentifier(const QString &batchName);
    static bool isValidIdentifier(const QString &identifier);

    bool insert(const QString &identifier, const QString &destinationRoot, QString *error);
    QString destinationFor(const QString &identifier) const;
    bool contains(const QString &identifier) const;
    bool isEmpty() const;
    int size() const;
    QMap<QString, QString> entries() const;

private:
    QMap<QString, QString> m_destinations;
};
