#pragma once

#include <ssv/Channel/ChannelConfig.hpp>
#include <ssv/Supervisor/SupervisorError.hpp>
#include <QString>
#include <QStringList>

namespace ssv {

struct CommandSpec {
    QString program;
    QStringList arguments;
};

struct CommandResult {
    SupervisorError error = SupervisorError::None;  // MissingExecutable or InvalidConfig
    QString detail;
    CommandSpec command;

    bool ok() const { return error == SupervisorError::None; }
};

/// Derives the HLS encoder invocation for a channel.
///
/// Output is deterministic for a given config: 2 s segments, a 6-segment
/// playlist window, keyframes every 2 * framerate frames (-g and
/// -keyint_min both, so every segment starts on a keyframe) and a rate
/// control buffer of twice the video bitrate. Audio is always 44.1 kHz.
class CommandBuilder {
public:
    static CommandResult build(const ChannelConfig& config,
                               const QString& encoderExecutable,
                               const QString& outputDir,
                               const QString& inputFormat = QStringLiteral("dshow"));

    static QString playlistPath(const QString& outputDir);
    static QString segmentPattern(const QString& outputDir);
};

} // namespace ssv
