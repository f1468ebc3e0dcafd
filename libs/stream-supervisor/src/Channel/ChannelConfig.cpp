#include <ssv/Channel/ChannelConfig.hpp>
#include <ssv/Channel/ChannelStatus.hpp>
#include <QRegularExpression>

namespace ssv {

QString channelSlug(const QString& channelName)
{
    QString slug = channelName;
    slug.remove(QLatin1Char(' '));
    return slug.toLower();
}

QString ChannelConfig::slug() const
{
    return channelSlug(channelName);
}

bool ChannelConfig::validate(QString* reason) const
{
    auto fail = [reason](const QString& why) {
        if (reason)
            *reason = why;
        return false;
    };

    if (channelName.trimmed().isEmpty() || slug().isEmpty())
        return fail(QStringLiteral("channel name must not be empty"));
    if (framerate <= 0)
        return fail(QStringLiteral("framerate must be positive"));
    if (videoBitrateKbps <= 0)
        return fail(QStringLiteral("video bitrate must be positive"));
    if (audioBitrateKbps <= 0)
        return fail(QStringLiteral("audio bitrate must be positive"));

    static const QRegularExpression sizePattern(QStringLiteral("^\\d+x\\d+$"));
    if (!frameSize.isEmpty() && !sizePattern.match(frameSize).hasMatch())
        return fail(QStringLiteral("frame size '%1' is not WxH").arg(frameSize));

    return true;
}

bool ChannelConfig::operator==(const ChannelConfig& other) const
{
    return channelName == other.channelName
        && videoDeviceId == other.videoDeviceId
        && audioDeviceId == other.audioDeviceId
        && videoDeviceLabel == other.videoDeviceLabel
        && audioDeviceLabel == other.audioDeviceLabel
        && frameSize == other.frameSize
        && framerate == other.framerate
        && videoBitrateKbps == other.videoBitrateKbps
        && audioBitrateKbps == other.audioBitrateKbps
        && autoStart == other.autoStart;
}

QString statusName(ChannelStatus s)
{
    switch (s) {
    case ChannelStatus::Starting: return QStringLiteral("starting");
    case ChannelStatus::Running:  return QStringLiteral("running");
    case ChannelStatus::Stopping: return QStringLiteral("stopping");
    case ChannelStatus::Failed:   return QStringLiteral("failed");
    case ChannelStatus::Idle:
    default:                      return QStringLiteral("idle");
    }
}

QString exitReasonName(ExitReason r)
{
    switch (r) {
    case ExitReason::Requested:    return QStringLiteral("requested");
    case ExitReason::Killed:       return QStringLiteral("killed");
    case ExitReason::LaunchFailed: return QStringLiteral("launch_failed");
    case ExitReason::Natural:
    default:                       return QStringLiteral("natural");
    }
}

} // namespace ssv
