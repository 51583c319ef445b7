#include "ControlError.h"

QString controlErrorName(ControlError error)
{
    switch (error) {
        case ControlError::None:
            return "None";
        case ControlError::DialError:
            return "DialError";
        case ControlError::ProtocolError:
            return "ProtocolError";
        case ControlError::AckTimeout:
            return "AckTimeout";
        case ControlError::ChannelClosed:
            return "ChannelClosed";
        case ControlError::RegistryConflict:
            return "RegistryConflict";
        case ControlError::NotConnected:
            return "NotConnected";
        case ControlError::ProcessAlreadyRunning:
            return "ProcessAlreadyRunning";
        case ControlError::ProcessTimeout:
            return "ProcessTimeout";
        case ControlError::UnknownBot:
            return "UnknownBot";
        case ControlError::LaunchFailed:
            return "LaunchFailed";
        case ControlError::NotRunning:
            return "NotRunning";
    }
    return "Unknown";
}
