#include "ProcessTable.h"
#include "logging/LogManager.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QLockFile>
#include <QSaveFile>

ProcessTable::ProcessTable(const QString &path)
    : filePath(path)
{
}

QMap<QString, ProcessRecord> ProcessTable::read() const
{
    QMap<QString, ProcessRecord> records;

    QFile file(filePath);
    if (!file.exists()) {
        return records;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        LogManager::log(QString("Cannot read process table '%1': %2").arg(filePath, file.errorString()),
                        LogManager::Error);
        return records;
    }

    QJsonParseError parseError{};
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LogManager::log(QString("Process table '%1' is corrupt, treating it as empty").arg(filePath),
                        LogManager::Warning);
        return records;
    }

    const QJsonObject root = doc.object();
    for (auto it = root.constBegin(); it != root.constEnd(); ++it) {
        const QJsonObject entry = it.value().toObject();

        ProcessRecord record;
        record.botId = it.key();
        record.pid = entry.value("pid").toInteger();
        record.command = entry.value("command").toString();
        record.timestamp = entry.value("timestamp").toInteger();

        if (record.pid <= 0) {
            LogManager::log(QString("Skipping process record for '%1' without a valid pid").arg(record.botId),
                            LogManager::Warning);
            continue;
        }
        records.insert(record.botId, record);
    }
    return records;
}

bool ProcessTable::write(const QMap<QString, ProcessRecord> &records) const
{
    QJsonObject root;
    for (const ProcessRecord &record : records) {
        QJsonObject entry;
        entry["pid"] = record.pid;
        entry["command"] = record.command;
        entry["timestamp"] = record.timestamp;
        root[record.botId] = entry;
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        LogManager::log(QString("Cannot write process table '%1': %2").arg(filePath, file.errorString()),
                        LogManager::Error);
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        LogManager::log(QString("Cannot commit process table '%1': %2").arg(filePath, file.errorString()),
                        LogManager::Error);
        return false;
    }
    return true;
}

bool ProcessTable::modify(const std::function<bool(QMap<QString, ProcessRecord>&)> &change)
{
    QDir().mkpath(QFileInfo(filePath).absolutePath());

    QLockFile lock(filePath + ".lock");
    if (!lock.tryLock(5000)) {
        LogManager::log(QString("Process table '%1' is locked by another manager").arg(filePath),
                        LogManager::Error);
        return false;
    }

    QMap<QString, ProcessRecord> records = read();
    if (!change(records)) {
        return true;
    }
    return write(records);
}

QMap<QString, ProcessRecord> ProcessTable::records() const
{
    return read();
}

std::optional<ProcessRecord> ProcessTable::value(const QString &botId) const
{
    QMap<QString, ProcessRecord> records = read();
    auto it = records.constFind(botId);
    if (it == records.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

QStringList ProcessTable::botIds() const
{
    return read().keys();
}

bool ProcessTable::insert(const ProcessRecord &record)
{
    return modify([&record](QMap<QString, ProcessRecord> &records) {
        records.insert(record.botId, record);
        return true;
    });
}

bool ProcessTable::remove(const QString &botId)
{
    return modify([&botId](QMap<QString, ProcessRecord> &records) {
        return records.remove(botId) > 0;
    });
}
