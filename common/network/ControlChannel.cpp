#include "ControlChannel.h"
#include "logging/LogManager.h"

#include <QDeadlineTimer>
#include <QHostAddress>

ControlChannel::ControlChannel(const QString &name, int queueCapacity)
    : QObject(nullptr)
    , queueCapacity(queueCapacity > 0 ? queueCapacity : DefaultQueueCapacity)
    , channelName(name)
{
    ioThread.setObjectName(QString("channel:%1").arg(name));
    moveToThread(&ioThread);
    ioThread.start();
}

ControlChannel::~ControlChannel()
{
    close();
    ioThread.quit();
    ioThread.wait();
}

void ControlChannel::runInIoThread(const std::function<void()> &function)
{
    if (QThread::currentThread() == &ioThread || !ioThread.isRunning()) {
        function();
        return;
    }
    QMetaObject::invokeMethod(this, function, Qt::BlockingQueuedConnection);
}

bool ControlChannel::attach(qintptr socketDescriptor, QString *errorString)
{
    bool ok = false;
    runInIoThread([&]() {
        ok = setupSocket(socketDescriptor, QString(), 0, 0, errorString);
    });
    return ok;
}

bool ControlChannel::connectToPeer(const QString &host, quint16 port, int timeoutMs, QString *errorString)
{
    bool ok = false;
    runInIoThread([&]() {
        ok = setupSocket(-1, host, port, timeoutMs, errorString);
    });
    return ok;
}

bool ControlChannel::setupSocket(qintptr socketDescriptor, const QString &host, quint16 port,
                                 int timeoutMs, QString *errorString)
{
    if (socket) {
        if (errorString) {
            *errorString = "Channel already has a socket";
        }
        return false;
    }

    QTcpSocket *newSocket = new QTcpSocket();

    if (socketDescriptor >= 0) {
        if (!newSocket->setSocketDescriptor(socketDescriptor)) {
            if (errorString) {
                *errorString = newSocket->errorString();
            }
            delete newSocket;
            return false;
        }
    } else {
        newSocket->connectToHost(host, port);
        if (!newSocket->waitForConnected(timeoutMs)) {
            if (errorString) {
                *errorString = QString("Cannot reach %1:%2: %3")
                                   .arg(host)
                                   .arg(port)
                                   .arg(newSocket->errorString());
            }
            newSocket->abort();
            delete newSocket;
            return false;
        }
    }

    socket = newSocket;
    socket->setSocketOption(QAbstractSocket::LowDelayOption, 1);
    socket->setReadBufferSize(64 * 1024);

    connect(socket, &QTcpSocket::readyRead, this, &ControlChannel::handleReadyRead);
    connect(socket, &QTcpSocket::disconnected, this, &ControlChannel::handleDisconnected);
    connect(socket, &QTcpSocket::errorOccurred, this, &ControlChannel::handleSocketError);

    {
        QMutexLocker locker(&stateMutex);
        connectionOpen = true;
        peer = QString("%1:%2").arg(socket->peerAddress().toString()).arg(socket->peerPort());
        touchActivityLocked();
    }

    LogManager::log(QString("Channel '%1' open (peer %2)").arg(name(), peerAddress()), LogManager::Debug);

    if (socket->bytesAvailable() > 0) {
        handleReadyRead();
    }
    return true;
}

void ControlChannel::handleReadyRead()
{
    if (!socket) {
        return;
    }

    {
        QMutexLocker locker(&stateMutex);
        if (readPaused) {
            // Consumer is behind; leave the bytes in the socket until it drains
            return;
        }
    }

    reader.append(socket->readAll());
    processBuffer();
}

void ControlChannel::processBuffer()
{
    while (socket) {
        {
            QMutexLocker locker(&stateMutex);
            if (inbox.size() >= queueCapacity) {
                readPaused = true;
                return;
            }
        }

        ControlMessage message;
        QString error;
        FrameReader::Status status = reader.next(&message, &error);

        if (status == FrameReader::NeedMoreData) {
            return;
        }

        if (status == FrameReader::Malformed) {
            LogManager::log(QString("Protocol error on channel '%1': %2").arg(name(), error),
                            LogManager::Warning);
            teardown(QString("Protocol error: %1").arg(error));
            return;
        }

        if (message.kind() == ControlMessage::Kind::Ack) {
            QMutexLocker locker(&stateMutex);
            touchActivityLocked();
            if (pendingSeq != 0 && message.seq() == pendingSeq) {
                ackReceived = true;
                ackCondition.wakeAll();
            } else {
                LogManager::log(QString("Channel '%1' ignored stale ack (seq %2)")
                                    .arg(channelName).arg(message.seq()),
                                LogManager::Debug);
            }
            continue;
        }

        {
            QMutexLocker locker(&stateMutex);
            touchActivityLocked();
            inbox.enqueue(message);
            queueCondition.wakeAll();
        }

        writeFrame(ControlMessage::ack(message.botId(), message.seq()).encodeFrame());
        emit messageReady();
    }
}

bool ControlChannel::writeFrame(const QByteArray &frame)
{
    if (!socket || socket->state() != QAbstractSocket::ConnectedState) {
        return false;
    }

    if (socket->write(frame) != frame.size()) {
        LogManager::log(QString("Write failed on channel '%1': %2").arg(name(), socket->errorString()),
                        LogManager::Warning);
        return false;
    }

    QMutexLocker locker(&stateMutex);
    touchActivityLocked();
    return true;
}

ControlError ControlChannel::send(const ControlMessage &message, int ackTimeoutMs)
{
    QMutexLocker sendLocker(&sendMutex);

    quint32 seq = 0;
    {
        QMutexLocker locker(&stateMutex);
        if (!connectionOpen) {
            return ControlError::ChannelClosed;
        }
        seq = ++nextSeq;
        if (seq == 0) {
            seq = ++nextSeq;
        }
    }

    // The peer would drop the whole connection on an oversized frame
    const QByteArray frame = message.withSeq(seq).encodeFrame();
    if (frame.size() - 4 > static_cast<qsizetype>(FrameReader::MaxFrameLength)) {
        LogManager::log(QString("Channel '%1' refused to send %2 byte frame (limit %3)")
                            .arg(name()).arg(frame.size() - 4).arg(FrameReader::MaxFrameLength),
                        LogManager::Error);
        return ControlError::ProtocolError;
    }

    if (message.requiresAck()) {
        QMutexLocker locker(&stateMutex);
        pendingSeq = seq;
        ackReceived = false;
    }

    QMetaObject::invokeMethod(this, [this, frame]() { writeFrame(frame); }, Qt::QueuedConnection);

    if (!message.requiresAck()) {
        return ControlError::None;
    }

    QMutexLocker locker(&stateMutex);
    QDeadlineTimer deadline(ackTimeoutMs);
    while (!ackReceived && connectionOpen) {
        if (!ackCondition.wait(&stateMutex, deadline)) {
            break;
        }
    }

    ControlError result = ControlError::None;
    if (!ackReceived) {
        result = connectionOpen ? ControlError::AckTimeout : ControlError::ChannelClosed;
    }
    pendingSeq = 0;
    ackReceived = false;
    return result;
}

std::optional<ControlMessage> ControlChannel::receive(int timeoutMs)
{
    QMutexLocker locker(&stateMutex);
    QDeadlineTimer deadline(timeoutMs);
    while (inbox.isEmpty() && connectionOpen) {
        if (!queueCondition.wait(&stateMutex, deadline)) {
            break;
        }
    }

    if (inbox.isEmpty()) {
        return std::nullopt;
    }

    ControlMessage message = inbox.dequeue();
    resumeIfPausedLocked();
    return message;
}

std::optional<ControlMessage> ControlChannel::tryReceive()
{
    QMutexLocker locker(&stateMutex);
    if (inbox.isEmpty()) {
        return std::nullopt;
    }

    ControlMessage message = inbox.dequeue();
    resumeIfPausedLocked();
    return message;
}

int ControlChannel::pendingMessages() const
{
    QMutexLocker locker(&stateMutex);
    return inbox.size();
}

void ControlChannel::resumeIfPausedLocked()
{
    if (readPaused && connectionOpen) {
        readPaused = false;
        QMetaObject::invokeMethod(this, [this]() { resumeReading(); }, Qt::QueuedConnection);
    }
}

void ControlChannel::resumeReading()
{
    processBuffer();
    if (socket && socket->bytesAvailable() > 0) {
        handleReadyRead();
    }
}

void ControlChannel::handleDisconnected()
{
    if (reader.hasPartialFrame()) {
        LogManager::log(QString("Channel '%1' closed mid-frame (%2 bytes discarded)")
                            .arg(name()).arg(reader.bufferedBytes()),
                        LogManager::Warning);
        teardown("Protocol error: stream ended inside a frame");
        return;
    }
    teardown("Peer disconnected");
}

void ControlChannel::handleSocketError(QAbstractSocket::SocketError error)
{
    if (error == QAbstractSocket::RemoteHostClosedError) {
        // disconnected() follows
        return;
    }
    teardown(socket ? socket->errorString() : QString("Socket error %1").arg(int(error)));
}

void ControlChannel::teardown(const QString &reason)
{
    bool wasOpen = false;
    {
        QMutexLocker locker(&stateMutex);
        wasOpen = connectionOpen;
        connectionOpen = false;
        readPaused = false;
        ackCondition.wakeAll();
        queueCondition.wakeAll();
    }

    if (socket) {
        QTcpSocket *closingSocket = socket;
        socket = nullptr;
        closingSocket->disconnect(this);
        if (closingSocket->state() == QAbstractSocket::ConnectedState) {
            closingSocket->flush();
            closingSocket->disconnectFromHost();
            if (closingSocket->state() != QAbstractSocket::UnconnectedState) {
                closingSocket->waitForDisconnected(200);
            }
        }
        closingSocket->deleteLater();
    }
    reader.clear();

    if (wasOpen) {
        LogManager::log(QString("Channel '%1' closed: %2").arg(name(), reason), LogManager::Debug);
        emit closed(reason);
    }
}

void ControlChannel::close()
{
    runInIoThread([this]() { teardown("Closed locally"); });
}

bool ControlChannel::isOpen() const
{
    QMutexLocker locker(&stateMutex);
    return connectionOpen;
}

QString ControlChannel::name() const
{
    QMutexLocker locker(&stateMutex);
    return channelName;
}

void ControlChannel::setName(const QString &name)
{
    QMutexLocker locker(&stateMutex);
    channelName = name;
}

QString ControlChannel::peerAddress() const
{
    QMutexLocker locker(&stateMutex);
    return peer;
}

QDateTime ControlChannel::lastActivity() const
{
    QMutexLocker locker(&stateMutex);
    return lastActivityTime;
}

void ControlChannel::touchActivityLocked()
{
    lastActivityTime = QDateTime::currentDateTimeUtc();
}
