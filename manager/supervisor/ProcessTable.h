#ifndef PROCESSTABLE_H
#define PROCESSTABLE_H

#include <QString>
#include <QMap>
#include <functional>
#include <optional>

struct ProcessRecord {
    QString botId;
    qint64 pid = 0;
    QString command;
    qint64 timestamp = 0;   // epoch seconds
};

// bot_id -> ProcessRecord, persisted as a JSON object. Every mutation re-reads
// the file under a lock file and replaces it atomically.
class ProcessTable
{
public:
    explicit ProcessTable(const QString &path);

    QString path() const { return filePath; }

    QMap<QString, ProcessRecord> records() const;
    std::optional<ProcessRecord> value(const QString &botId) const;
    QStringList botIds() const;

    bool insert(const ProcessRecord &record);
    bool remove(const QString &botId);

private:
    QMap<QString, ProcessRecord> read() const;
    bool write(const QMap<QString, ProcessRecord> &records) const;
    bool modify(const std::function<bool(QMap<QString, ProcessRecord>&)> &change);

    QString filePath;
};

#endif // PROCESSTABLE_H
