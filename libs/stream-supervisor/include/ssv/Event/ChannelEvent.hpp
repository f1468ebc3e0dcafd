#pragma once

#include <ssv/Channel/ChannelStatus.hpp>
#include <QDateTime>
#include <QMetaType>
#include <QString>

namespace ssv {

enum class LogLevel {
    Info,
    Warning,
    Error
};

enum class EventKind {
    Log,     // one line of encoder output or a supervisor message
    Status   // channel or service status transition
};

// EventBus topics the Supervisor publishes on. Payload is a ChannelEvent.
inline constexpr const char* TOPIC_CHANNEL_LOG = "channel/log";
inline constexpr const char* TOPIC_CHANNEL_STATUS = "channel/status";
inline constexpr const char* TOPIC_SERVICE_STATUS = "service/status";

struct ChannelEvent {
    QString channel;  // empty for service events
    EventKind kind = EventKind::Log;
    LogLevel level = LogLevel::Info;
    QString text;
    ChannelStatus status = ChannelStatus::Idle;
    int exitCode = 0;
    QDateTime timestamp;

    static ChannelEvent log(const QString& channel, LogLevel level, const QString& text);
    static ChannelEvent statusChange(const QString& channel, ChannelStatus status,
                                     int exitCode, const QString& text);
};

/// Severity of a raw encoder output line, judged by its wording.
LogLevel classifyLine(const QString& line);

QString levelName(LogLevel level);

} // namespace ssv

Q_DECLARE_METATYPE(ssv::ChannelEvent)
