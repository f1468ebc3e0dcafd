#include <ssv/Supervisor/SupervisorError.hpp>

namespace ssv {

QString errorCode(SupervisorError e)
{
    switch (e) {
    case SupervisorError::MissingExecutable:           return QStringLiteral("missing_executable");
    case SupervisorError::DeviceInUse:                 return QStringLiteral("device_in_use");
    case SupervisorError::DuplicateChannel:            return QStringLiteral("duplicate_channel");
    case SupervisorError::ChannelBusy:                 return QStringLiteral("channel_busy");
    case SupervisorError::UnknownChannel:              return QStringLiteral("unknown_channel");
    case SupervisorError::InvalidConfig:               return QStringLiteral("invalid_config");
    case SupervisorError::DependentServiceUnavailable: return QStringLiteral("dependent_service_unavailable");
    case SupervisorError::ProcessLaunchFailure:        return QStringLiteral("process_launch_failure");
    case SupervisorError::IOFailure:                   return QStringLiteral("io_failure");
    case SupervisorError::None:
    default:                                           return QStringLiteral("none");
    }
}

} // namespace ssv
