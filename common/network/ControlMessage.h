#ifndef CONTROLMESSAGE_H
#define CONTROLMESSAGE_H

#include <QString>
#include <QByteArray>
#include <QJsonValue>
#include <QJsonObject>
#include <QMetaType>
#include <optional>

class ControlMessage
{
public:
    enum class Kind { Connected, Stop, Ack, Custom };

    ControlMessage() = default;

    static ControlMessage connected(const QString &botId);
    static ControlMessage stop(const QString &botId = QString());
    static ControlMessage ack(const QString &botId, quint32 seq);
    static ControlMessage custom(const QString &botId, const QJsonValue &payload);

    Kind kind() const { return messageKind; }
    const QString& botId() const { return messageBotId; }
    const QJsonValue& payload() const { return messagePayload; }
    bool hasPayload() const { return !messagePayload.isUndefined(); }
    quint32 seq() const { return messageSeq; }

    // Every kind except ack is confirmed by the receiving channel
    bool requiresAck() const { return messageKind != Kind::Ack; }

    ControlMessage withSeq(quint32 seq) const;

    QJsonObject toJson() const;
    QByteArray toJsonBytes() const;
    static std::optional<ControlMessage> fromJson(const QByteArray &json, QString *errorString = nullptr);

    // u32 big-endian length followed by the UTF-8 JSON body
    QByteArray encodeFrame() const;

    static QString kindName(Kind kind);
    static std::optional<Kind> kindFromName(const QString &name);

    bool operator==(const ControlMessage &other) const;
    bool operator!=(const ControlMessage &other) const { return !(*this == other); }

private:
    ControlMessage(Kind kind, const QString &botId, const QJsonValue &payload, quint32 seq);

    Kind messageKind = Kind::Custom;
    QString messageBotId;
    QJsonValue messagePayload = QJsonValue(QJsonValue::Undefined);
    quint32 messageSeq = 0;
};

Q_DECLARE_METATYPE(ControlMessage)

// Reassembles frames from arbitrarily split stream chunks
class FrameReader
{
public:
    enum Status { NeedMoreData, FrameReady, Malformed };

    static constexpr quint32 MaxFrameLength = 1024 * 1024;

    void append(const QByteArray &data);
    Status next(ControlMessage *message, QString *errorString = nullptr);

    bool hasPartialFrame() const { return !buffer.isEmpty(); }
    qsizetype bufferedBytes() const { return buffer.size(); }
    void clear() { buffer.clear(); }

private:
    QByteArray buffer;
};

#endif // CONTROLMESSAGE_H
