#include "ControlMessage.h"

#include <QDataStream>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QtEndian>
#include <cmath>

ControlMessage::ControlMessage(Kind kind, const QString &botId, const QJsonValue &payload, quint32 seq)
    : messageKind(kind)
    , messageBotId(botId)
    , messagePayload(payload)
    , messageSeq(seq)
{
}

ControlMessage ControlMessage::connected(const QString &botId)
{
    return ControlMessage(Kind::Connected, botId, QJsonValue(QJsonValue::Undefined), 0);
}

ControlMessage ControlMessage::stop(const QString &botId)
{
    return ControlMessage(Kind::Stop, botId, QJsonValue(QJsonValue::Undefined), 0);
}

ControlMessage ControlMessage::ack(const QString &botId, quint32 seq)
{
    return ControlMessage(Kind::Ack, botId, QJsonValue(QJsonValue::Undefined), seq);
}

ControlMessage ControlMessage::custom(const QString &botId, const QJsonValue &payload)
{
    return ControlMessage(Kind::Custom, botId, payload, 0);
}

ControlMessage ControlMessage::withSeq(quint32 seq) const
{
    ControlMessage copy = *this;
    copy.messageSeq = seq;
    return copy;
}

QString ControlMessage::kindName(Kind kind)
{
    switch (kind) {
        case Kind::Connected:
            return "connected";
        case Kind::Stop:
            return "stop";
        case Kind::Ack:
            return "ack";
        case Kind::Custom:
            return "custom";
    }
    return "custom";
}

std::optional<ControlMessage::Kind> ControlMessage::kindFromName(const QString &name)
{
    if (name == "connected") return Kind::Connected;
    if (name == "stop") return Kind::Stop;
    if (name == "ack") return Kind::Ack;
    if (name == "custom") return Kind::Custom;
    return std::nullopt;
}

QJsonObject ControlMessage::toJson() const
{
    QJsonObject object;
    object["kind"] = kindName(messageKind);
    object["bot_id"] = messageBotId;
    if (!messagePayload.isUndefined()) {
        object["payload"] = messagePayload;
    }
    if (messageSeq != 0) {
        object["seq"] = static_cast<qint64>(messageSeq);
    }
    return object;
}

QByteArray ControlMessage::toJsonBytes() const
{
    return QJsonDocument(toJson()).toJson(QJsonDocument::Compact);
}

std::optional<ControlMessage> ControlMessage::fromJson(const QByteArray &json, QString *errorString)
{
    auto fail = [errorString](const QString &reason) -> std::optional<ControlMessage> {
        if (errorString) {
            *errorString = reason;
        }
        return std::nullopt;
    };

    QJsonParseError parseError{};
    QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return fail(QString("Invalid JSON at offset %1: %2")
                        .arg(parseError.offset)
                        .arg(parseError.errorString()));
    }
    if (!doc.isObject()) {
        return fail("Message body is not a JSON object");
    }

    const QJsonObject object = doc.object();

    const QJsonValue kindValue = object.value("kind");
    if (!kindValue.isString()) {
        return fail("Missing or non-string 'kind'");
    }
    std::optional<Kind> kind = kindFromName(kindValue.toString());
    if (!kind) {
        return fail(QString("Unknown message kind '%1'").arg(kindValue.toString()));
    }

    const QJsonValue botIdValue = object.value("bot_id");
    if (!botIdValue.isString()) {
        return fail("Missing or non-string 'bot_id'");
    }

    quint32 seq = 0;
    if (object.contains("seq")) {
        const QJsonValue seqValue = object.value("seq");
        const double raw = seqValue.toDouble(-1.0);
        if (!seqValue.isDouble() || raw < 0.0 || raw > 4294967295.0 || std::floor(raw) != raw) {
            return fail("'seq' must be an unsigned 32-bit integer");
        }
        seq = static_cast<quint32>(raw);
    }

    QJsonValue payload(QJsonValue::Undefined);
    if (object.contains("payload")) {
        payload = object.value("payload");
    }

    return ControlMessage(*kind, botIdValue.toString(), payload, seq);
}

QByteArray ControlMessage::encodeFrame() const
{
    QByteArray body = toJsonBytes();

    // Wrap with length prefix
    QByteArray frame;
    QDataStream stream(&frame, QIODevice::WriteOnly);
    stream.setByteOrder(QDataStream::BigEndian);
    stream << static_cast<quint32>(body.size());
    frame.append(body);
    return frame;
}

bool ControlMessage::operator==(const ControlMessage &other) const
{
    return messageKind == other.messageKind
        && messageBotId == other.messageBotId
        && messagePayload == other.messagePayload
        && messageSeq == other.messageSeq;
}

void FrameReader::append(const QByteArray &data)
{
    buffer.append(data);
}

FrameReader::Status FrameReader::next(ControlMessage *message, QString *errorString)
{
    if (buffer.size() < 4) {
        return NeedMoreData;
    }

    const quint32 length = qFromBigEndian<quint32>(reinterpret_cast<const uchar*>(buffer.constData()));
    if (length == 0 || length > MaxFrameLength) {
        if (errorString) {
            *errorString = QString("Malformed frame length %1").arg(length);
        }
        return Malformed;
    }

    if (static_cast<quint64>(buffer.size()) < static_cast<quint64>(length) + 4) {
        // Not enough data yet - wait for the rest of the body
        return NeedMoreData;
    }

    QByteArray body = buffer.mid(4, length);
    buffer.remove(0, static_cast<qsizetype>(length) + 4);

    std::optional<ControlMessage> decoded = ControlMessage::fromJson(body, errorString);
    if (!decoded) {
        return Malformed;
    }

    if (message) {
        *message = *decoded;
    }
    return FrameReady;
}
