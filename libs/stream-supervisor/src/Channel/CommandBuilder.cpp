#include <ssv/Channel/CommandBuilder.hpp>
#include <ssv/Version.hpp>
#include <QDir>
#include <QFileInfo>

namespace ssv {

namespace {

QString kbps(int value)
{
    return QString::number(value) + QLatin1Char('k');
}

} // namespace

QString CommandBuilder::playlistPath(const QString& outputDir)
{
    return QDir(outputDir).filePath(QStringLiteral("index.m3u8"));
}

QString CommandBuilder::segmentPattern(const QString& outputDir)
{
    return QDir(outputDir).filePath(QStringLiteral("segment_%d.ts"));
}

CommandResult CommandBuilder::build(const ChannelConfig& config,
                                    const QString& encoderExecutable,
                                    const QString& outputDir,
                                    const QString& inputFormat)
{
    CommandResult result;

    QFileInfo exe(encoderExecutable);
    if (encoderExecutable.isEmpty() || !exe.exists() || !exe.isExecutable()) {
        result.error = SupervisorError::MissingExecutable;
        result.detail = QStringLiteral("Encoder executable not found at: %1").arg(encoderExecutable);
        return result;
    }

    const bool hasVideo = !config.videoDeviceId.isEmpty();
    const bool hasAudio = !config.audioDeviceId.isEmpty();
    if (!hasVideo && !hasAudio) {
        result.error = SupervisorError::InvalidConfig;
        result.detail = QStringLiteral("Channel '%1' has no capture device selected").arg(config.channelName);
        return result;
    }

    QString reason;
    if (!config.validate(&reason)) {
        result.error = SupervisorError::InvalidConfig;
        result.detail = reason;
        return result;
    }

    QStringList input;
    if (hasVideo)
        input << QStringLiteral("video=%1").arg(config.videoDeviceId);
    if (hasAudio)
        input << QStringLiteral("audio=%1").arg(config.audioDeviceId);

    QStringList args{
        QStringLiteral("-hide_banner"), QStringLiteral("-loglevel"), QStringLiteral("info"),
        QStringLiteral("-f"), inputFormat,
        QStringLiteral("-rtbufsize"), QStringLiteral("512M"),
    };

    if (hasVideo)
        args << QStringLiteral("-framerate") << QString::number(config.framerate);

    args << QStringLiteral("-thread_queue_size") << QStringLiteral("1024")
         << QStringLiteral("-i") << input.join(QLatin1Char(':'));

    if (hasVideo)
        args << QStringLiteral("-map") << QStringLiteral("0:v:0");
    if (hasAudio)
        args << QStringLiteral("-map") << QStringLiteral("0:a:0");

    if (hasVideo) {
        const int gop = 2 * config.framerate;
        const QString bitrate = kbps(config.videoBitrateKbps);

        args << QStringLiteral("-c:v") << QStringLiteral("libx264")
             << QStringLiteral("-preset") << QStringLiteral("superfast")
             << QStringLiteral("-tune") << QStringLiteral("zerolatency")
             << QStringLiteral("-profile:v") << QStringLiteral("baseline")
             << QStringLiteral("-level") << QStringLiteral("3.1")
             << QStringLiteral("-pix_fmt") << QStringLiteral("yuv420p")
             << QStringLiteral("-fps_mode") << QStringLiteral("cfr");

        if (!config.frameSize.isEmpty())
            args << QStringLiteral("-vf") << QStringLiteral("scale=%1:flags=lanczos").arg(config.frameSize);

        args << QStringLiteral("-b:v") << bitrate
             << QStringLiteral("-maxrate") << bitrate
             << QStringLiteral("-bufsize") << kbps(2 * config.videoBitrateKbps)
             << QStringLiteral("-g") << QString::number(gop)
             << QStringLiteral("-keyint_min") << QString::number(gop);
    }

    if (hasAudio) {
        args << QStringLiteral("-c:a") << QStringLiteral("aac")
             << QStringLiteral("-b:a") << kbps(config.audioBitrateKbps)
             << QStringLiteral("-ar") << QString::number(AUDIO_SAMPLE_RATE_HZ);
    }

    args << QStringLiteral("-f") << QStringLiteral("hls")
         << QStringLiteral("-hls_time") << QString::number(SEGMENT_DURATION_SEC)
         << QStringLiteral("-hls_list_size") << QString::number(PLAYLIST_WINDOW_SEGMENTS)
         << QStringLiteral("-hls_flags")
         << QStringLiteral("delete_segments+program_date_time+independent_segments")
         << QStringLiteral("-hls_segment_filename") << segmentPattern(outputDir)
         << playlistPath(outputDir);

    result.command.program = encoderExecutable;
    result.command.arguments = args;
    return result;
}

} // namespace ssv
