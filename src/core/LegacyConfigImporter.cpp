#include "core/LegacyConfigImporter.hpp"
#include "core/AppConfig.hpp"
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace sm {

namespace {

// Numbers were stored as strings ("30", "1200k"), but accept plain numbers too.
int intField(const QJsonObject& obj, const char* key, int fallback)
{
    const QJsonValue value = obj.value(QLatin1String(key));
    if (value.isDouble())
        return value.toInt(fallback);
    return parseKbps(value.toString(), fallback);
}

// The original ran on Windows; paths may use backslashes.
QString pathField(const QJsonObject& obj, const char* key)
{
    return obj.value(QLatin1String(key)).toString().replace(QLatin1Char('\\'), QLatin1Char('/'));
}

} // namespace

bool LegacyConfigImporter::import(const QString& jsonPath, AppConfig& config)
{
    QFile file(jsonPath);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "LegacyConfigImporter: cannot open" << jsonPath;
        return false;
    }

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &error);
    if (!doc.isObject()) {
        qWarning() << "LegacyConfigImporter:" << jsonPath << "is not a JSON object:"
                   << error.errorString();
        return false;
    }
    const QJsonObject obj = doc.object();

    const QString encoder = pathField(obj, "ffmpeg_path");
    if (!encoder.isEmpty())
        config.setEncoderExecutable(encoder);

    const QString serverDir = pathField(obj, "nginx_path");
    if (!serverDir.isEmpty()) {
        config.setServiceWorkingDir(serverDir);
        config.setServiceExecutable(QDir(serverDir).filePath(QStringLiteral("nginx")));
    }

    QString outputRoot = pathField(obj, "hls_path");
    while (outputRoot.endsWith(QLatin1Char('/')) && outputRoot.size() > 1)
        outputRoot.chop(1);
    if (outputRoot.endsWith(QLatin1String("/channel1"))) {
        outputRoot.chop(int(qstrlen("/channel1")));
        qInfo() << "LegacyConfigImporter: stripped legacy channel folder from output root";
    }
    if (!outputRoot.isEmpty())
        config.setOutputRoot(outputRoot);

    QList<ssv::ChannelConfig> channels;
    for (const QJsonValue& value : obj.value(QLatin1String("streams")).toArray()) {
        const QJsonObject stream = value.toObject();
        ssv::ChannelConfig channel;
        channel.channelName = stream.value(QLatin1String("channel_name")).toString();
        channel.videoDeviceId = stream.value(QLatin1String("video_device_alt")).toString();
        channel.audioDeviceId = stream.value(QLatin1String("audio_device_alt")).toString();
        channel.videoDeviceLabel = stream.value(QLatin1String("video_device_label")).toString();
        channel.audioDeviceLabel = stream.value(QLatin1String("audio_device_label")).toString();
        channel.frameSize = stream.value(QLatin1String("video_size")).toString(channel.frameSize);
        channel.framerate = intField(stream, "framerate", channel.framerate);
        channel.videoBitrateKbps = intField(stream, "video_bitrate", channel.videoBitrateKbps);
        channel.audioBitrateKbps = intField(stream, "audio_bitrate", channel.audioBitrateKbps);
        channel.autoStart = stream.value(QLatin1String("auto_start")).toBool(false);

        if (channel.channelName.isEmpty()) {
            qWarning() << "LegacyConfigImporter: skipping stream without a channel name";
            continue;
        }
        channels.append(channel);
    }
    if (!channels.isEmpty())
        config.setChannels(channels);

    qInfo() << "LegacyConfigImporter: imported" << channels.size() << "channel(s) from" << jsonPath;
    return true;
}

} // namespace sm
