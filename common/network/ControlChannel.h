#ifndef CONTROLCHANNEL_H
#define CONTROLCHANNEL_H

#include <QObject>
#include <QThread>
#include <QTcpSocket>
#include <QMutex>
#include <QWaitCondition>
#include <QQueue>
#include <QDateTime>
#include <functional>
#include <optional>
#include "ControlMessage.h"
#include "ControlError.h"

// One TCP connection carrying acknowledged control messages.
// The socket lives on the channel's own I/O thread; the public API is
// thread-safe, but send() must not be called from that I/O thread and the
// channel must not be destroyed from it.
class ControlChannel : public QObject
{
    Q_OBJECT

public:
    static constexpr int DefaultAckTimeoutMs = 5000;
    static constexpr int DefaultQueueCapacity = 256;

    explicit ControlChannel(const QString &name = QString(), int queueCapacity = DefaultQueueCapacity);
    ~ControlChannel() override;

    // Delete copy constructor and assignment operator
    ControlChannel(const ControlChannel&) = delete;
    ControlChannel& operator=(const ControlChannel&) = delete;

    bool attach(qintptr socketDescriptor, QString *errorString = nullptr);
    bool connectToPeer(const QString &host, quint16 port, int timeoutMs, QString *errorString = nullptr);

    ControlError send(const ControlMessage &message, int ackTimeoutMs = DefaultAckTimeoutMs);

    std::optional<ControlMessage> receive(int timeoutMs);
    std::optional<ControlMessage> tryReceive();
    int pendingMessages() const;

    void close();
    bool isOpen() const;

    QString name() const;
    void setName(const QString &name);
    QString peerAddress() const;
    QDateTime lastActivity() const;

signals:
    void messageReady();
    void closed(const QString &reason);

private:
    bool setupSocket(qintptr socketDescriptor, const QString &host, quint16 port,
                     int timeoutMs, QString *errorString);
    void handleReadyRead();
    void handleDisconnected();
    void handleSocketError(QAbstractSocket::SocketError error);
    void processBuffer();
    bool writeFrame(const QByteArray &frame);
    void teardown(const QString &reason);
    void resumeReading();
    void resumeIfPausedLocked();
    void touchActivityLocked();
    void runInIoThread(const std::function<void()> &function);

    QThread ioThread;
    QTcpSocket *socket = nullptr;
    FrameReader reader;

    mutable QMutex stateMutex;
    QWaitCondition ackCondition;
    QWaitCondition queueCondition;
    QQueue<ControlMessage> inbox;
    int queueCapacity;
    bool connectionOpen = false;
    bool readPaused = false;
    quint32 nextSeq = 0;
    quint32 pendingSeq = 0;
    bool ackReceived = false;
    QDateTime lastActivityTime;
    QString channelName;
    QString peer;

    // Serializes send-and-confirm calls, one outstanding ack per channel
    QMutex sendMutex;
};

#endif // CONTROLCHANNEL_H
