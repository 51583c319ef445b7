#ifndef CONTROLERROR_H
#define CONTROLERROR_H

#include <QString>

enum class ControlError {
    None,
    DialError,
    ProtocolError,
    AckTimeout,
    ChannelClosed,
    RegistryConflict,
    NotConnected,
    ProcessAlreadyRunning,
    ProcessTimeout,
    UnknownBot,
    LaunchFailed,
    NotRunning
};

QString controlErrorName(ControlError error);

// Outcome of an operator-surface call, reason is meant for display
struct SupervisorResult {
    ControlError error = ControlError::None;
    QString reason;

    bool ok() const { return error == ControlError::None; }

    static SupervisorResult success(const QString &reason = QString())
    {
        return SupervisorResult{ControlError::None, reason};
    }
    static SupervisorResult failure(ControlError error, const QString &reason)
    {
        return SupervisorResult{error, reason};
    }
};

#endif // CONTROLERROR_H
