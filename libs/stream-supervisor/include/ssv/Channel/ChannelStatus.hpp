#pragma once

#include <QString>

namespace ssv {

enum class ChannelStatus {
    Idle,
    Starting,
    Running,
    Stopping,
    Failed
};

/// Why an encoder process ended.
enum class ExitReason {
    Natural,       // exited on its own
    Requested,     // exited after stop() asked it to
    Killed,        // stop() escalated to a forced kill
    LaunchFailed   // never started
};

/// Starting and Running channels own their video device.
inline bool isActive(ChannelStatus s)
{
    return s == ChannelStatus::Starting || s == ChannelStatus::Running;
}

QString statusName(ChannelStatus s);
QString exitReasonName(ExitReason r);

} // namespace ssv
