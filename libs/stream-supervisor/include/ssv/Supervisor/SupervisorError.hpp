#pragma once

#include <QString>

namespace ssv {

enum class SupervisorError {
    None,
    MissingExecutable,
    DeviceInUse,
    DuplicateChannel,
    ChannelBusy,
    UnknownChannel,
    InvalidConfig,
    DependentServiceUnavailable,
    ProcessLaunchFailure,
    IOFailure
};

/// Outcome of a Supervisor operation. `detail` carries the cause text;
/// for DeviceInUse, `owner` names the channel holding the device.
struct SupervisorResult {
    SupervisorError error = SupervisorError::None;
    QString detail;
    QString owner;

    bool ok() const { return error == SupervisorError::None; }

    static SupervisorResult success() { return {}; }
    static SupervisorResult failure(SupervisorError e, const QString& detail = {},
                                    const QString& owner = {})
    {
        return {e, detail, owner};
    }
};

/// Stable snake_case identifier, used on the control socket.
QString errorCode(SupervisorError e);

} // namespace ssv
