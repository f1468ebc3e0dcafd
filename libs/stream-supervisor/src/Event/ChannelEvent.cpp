#include <ssv/Event/ChannelEvent.hpp>

namespace ssv {

ChannelEvent ChannelEvent::log(const QString& channel, LogLevel level, const QString& text)
{
    ChannelEvent event;
    event.channel = channel;
    event.kind = EventKind::Log;
    event.level = level;
    event.text = text;
    event.timestamp = QDateTime::currentDateTime();
    return event;
}

ChannelEvent ChannelEvent::statusChange(const QString& channel, ChannelStatus status,
                                        int exitCode, const QString& text)
{
    ChannelEvent event;
    event.channel = channel;
    event.kind = EventKind::Status;
    event.level = (status == ChannelStatus::Failed) ? LogLevel::Error : LogLevel::Info;
    event.text = text;
    event.status = status;
    event.exitCode = exitCode;
    event.timestamp = QDateTime::currentDateTime();
    return event;
}

LogLevel classifyLine(const QString& line)
{
    static const QLatin1String errorWords[] = {
        QLatin1String("error"), QLatin1String("failed"),
        QLatin1String("could not"), QLatin1String("invalid"),
    };
    static const QLatin1String warningWords[] = {
        QLatin1String("warning"), QLatin1String("deprecated"),
    };

    for (const auto& word : errorWords) {
        if (line.contains(word, Qt::CaseInsensitive))
            return LogLevel::Error;
    }
    for (const auto& word : warningWords) {
        if (line.contains(word, Qt::CaseInsensitive))
            return LogLevel::Warning;
    }
    return LogLevel::Info;
}

QString levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Warning: return QStringLiteral("warning");
    case LogLevel::Error:   return QStringLiteral("error");
    case LogLevel::Info:
    default:                return QStringLiteral("info");
    }
}

} // namespace ssv
