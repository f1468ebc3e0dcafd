#include "core/AppConfig.hpp"
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QVariantList>
#include <QVariantMap>
#include <fstream>

namespace sm {

namespace {

// Maps recurse; sequences and scalars in the overlay replace the base.
YAML::Node mergeOver(const YAML::Node& base, const YAML::Node& overlay)
{
    if (!overlay.IsDefined() || overlay.IsNull())
        return YAML::Clone(base);
    if (!base.IsDefined() || base.IsNull() || !base.IsMap() || !overlay.IsMap())
        return YAML::Clone(overlay);

    YAML::Node result = YAML::Clone(base);
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        const auto key = it->first.as<std::string>();
        result[key] = result[key] ? mergeOver(result[key], it->second) : YAML::Clone(it->second);
    }
    return result;
}

QString str(const YAML::Node& node, const char* fallback)
{
    return QString::fromStdString(node.as<std::string>(fallback));
}

QVariant scalarToVariant(const YAML::Node& node)
{
    const std::string s = node.Scalar();
    if (s == "true") return QVariant(true);
    if (s == "false") return QVariant(false);

    bool ok = false;
    int i = QString::fromStdString(s).toInt(&ok);
    if (ok) return QVariant(i);

    return QVariant(QString::fromStdString(s));
}

QVariant nodeToVariant(const YAML::Node& node)
{
    if (node.IsScalar())
        return scalarToVariant(node);
    if (node.IsSequence()) {
        QVariantList list;
        for (const auto& item : node)
            list.append(nodeToVariant(item));
        return list;
    }
    if (node.IsMap()) {
        QVariantMap map;
        for (auto it = node.begin(); it != node.end(); ++it)
            map.insert(QString::fromStdString(it->first.as<std::string>()), nodeToVariant(it->second));
        return map;
    }
    return {};
}

YAML::Node defaultChannelNode()
{
    ssv::ChannelConfig config;
    config.channelName = QStringLiteral("Channel 1");

    YAML::Node node;
    node["name"] = config.channelName.toStdString();
    node["video_device_id"] = "";
    node["audio_device_id"] = "";
    node["video_device_label"] = "";
    node["audio_device_label"] = "";
    node["frame_size"] = config.frameSize.toStdString();
    node["framerate"] = config.framerate;
    node["video_bitrate_kbps"] = config.videoBitrateKbps;
    node["audio_bitrate_kbps"] = config.audioBitrateKbps;
    node["auto_start"] = config.autoStart;
    return node;
}

int kbpsNode(const YAML::Node& node, int fallback)
{
    if (!node || !node.IsScalar())
        return fallback;
    return parseKbps(QString::fromStdString(node.Scalar()), fallback);
}

} // namespace

int parseKbps(const QString& text, int fallback)
{
    QString digits = text.trimmed();
    if (digits.endsWith(QLatin1Char('k'), Qt::CaseInsensitive))
        digits.chop(1);
    bool ok = false;
    const int value = digits.toInt(&ok);
    return (ok && value > 0) ? value : fallback;
}

AppConfig::AppConfig()
{
    initDefaults();
}

QString AppConfig::defaultPath()
{
    return QDir::homePath() + QStringLiteral("/.config/stream-manager/config.yaml");
}

void AppConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["encoder"]["executable"] = "/usr/bin/ffmpeg";
    root_["encoder"]["input_format"] = "dshow";

    root_["service"]["executable"] = "/usr/sbin/nginx";
    root_["service"]["working_dir"] = "/etc/nginx";
    root_["service"]["stop_args"] = YAML::Node(YAML::NodeType::Sequence);
    root_["service"]["stop_args"].push_back("-s");
    root_["service"]["stop_args"].push_back("stop");
    root_["service"]["stop_timeout_ms"] = ssv::SERVICE_STOP_TIMEOUT_MS;

    root_["output"]["root"] = "/var/www/hls";

    root_["playback"]["port"] = 5001;
    root_["playback"]["path_prefix"] = "/hls";

    root_["control"]["socket"] = "/tmp/stream-manager.sock";

    root_["logging"]["level"] = "info";

    root_["startup"]["auto_start_delay_ms"] = 2000;

    root_["channels"] = YAML::Node(YAML::NodeType::Sequence);
    root_["channels"].push_back(defaultChannelNode());
}

bool AppConfig::load(const QString& filePath)
{
    initDefaults();
    if (!QFile::exists(filePath)) {
        qInfo() << "AppConfig: no config at" << filePath << "- using defaults";
        return false;
    }

    const YAML::Node defaults = YAML::Clone(root_);
    try {
        const YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
        root_ = mergeOver(defaults, loaded);
    } catch (const YAML::Exception& e) {
        qCritical() << "AppConfig: failed to parse" << filePath << ":" << e.what();
        root_ = defaults;
        return false;
    }

    normalize();
    return true;
}

bool AppConfig::save(const QString& filePath) const
{
    const QFileInfo info(filePath);
    if (!QDir().mkpath(info.absolutePath())) {
        qWarning() << "AppConfig: cannot create" << info.absolutePath();
        return false;
    }

    std::ofstream fout(filePath.toStdString());
    if (!fout) {
        qWarning() << "AppConfig: cannot write" << filePath;
        return false;
    }
    fout << root_ << "\n";
    return fout.good();
}

void AppConfig::normalize()
{
    if (!root_["channels"].IsSequence() || root_["channels"].size() == 0) {
        root_["channels"] = YAML::Node(YAML::NodeType::Sequence);
        root_["channels"].push_back(defaultChannelNode());
    }

    // Older setups pointed the output root at the first channel's folder.
    QString root = outputRoot();
    while (root.size() > 1 && (root.endsWith(QLatin1Char('/')) || root.endsWith(QLatin1Char('\\'))))
        root.chop(1);
    const QString last = QFileInfo(root).fileName();

    // Only the old default folder name; a root named after a channel may be deliberate.
    if (last.compare(QLatin1String("channel1"), Qt::CaseInsensitive) == 0) {
        const QString parent = QFileInfo(root).path();
        qInfo() << "AppConfig: output root" << root << "points at a channel folder, using" << parent;
        setOutputRoot(parent);
    }
}

// --- Encoder ---

QString AppConfig::encoderExecutable() const
{
    return str(root_["encoder"]["executable"], "/usr/bin/ffmpeg");
}

void AppConfig::setEncoderExecutable(const QString& v)
{
    root_["encoder"]["executable"] = v.toStdString();
}

QString AppConfig::inputFormat() const
{
    return str(root_["encoder"]["input_format"], "dshow");
}

// --- Service ---

QString AppConfig::serviceExecutable() const
{
    return str(root_["service"]["executable"], "/usr/sbin/nginx");
}

void AppConfig::setServiceExecutable(const QString& v)
{
    root_["service"]["executable"] = v.toStdString();
}

QString AppConfig::serviceWorkingDir() const
{
    return str(root_["service"]["working_dir"], "/etc/nginx");
}

void AppConfig::setServiceWorkingDir(const QString& v)
{
    root_["service"]["working_dir"] = v.toStdString();
}

QStringList AppConfig::serviceStopArgs() const
{
    QStringList args;
    const YAML::Node node = root_["service"]["stop_args"];
    if (node.IsSequence()) {
        for (const auto& arg : node)
            args << QString::fromStdString(arg.as<std::string>(""));
    }
    return args;
}

int AppConfig::serviceStopTimeoutMs() const
{
    return root_["service"]["stop_timeout_ms"].as<int>(ssv::SERVICE_STOP_TIMEOUT_MS);
}

// --- Output / playback ---

QString AppConfig::outputRoot() const
{
    return str(root_["output"]["root"], "/var/www/hls");
}

void AppConfig::setOutputRoot(const QString& v)
{
    root_["output"]["root"] = v.toStdString();
}

int AppConfig::playbackPort() const
{
    return root_["playback"]["port"].as<int>(5001);
}

QString AppConfig::playbackPathPrefix() const
{
    return str(root_["playback"]["path_prefix"], "/hls");
}

QString AppConfig::controlSocket() const
{
    return str(root_["control"]["socket"], "/tmp/stream-manager.sock");
}

QString AppConfig::logLevel() const
{
    return str(root_["logging"]["level"], "info");
}

void AppConfig::setLogLevel(const QString& v)
{
    root_["logging"]["level"] = v.toStdString();
}

int AppConfig::autoStartDelayMs() const
{
    return root_["startup"]["auto_start_delay_ms"].as<int>(2000);
}

// --- Channels ---

QList<ssv::ChannelConfig> AppConfig::channels() const
{
    QList<ssv::ChannelConfig> result;
    const YAML::Node list = root_["channels"];
    if (!list.IsSequence())
        return result;

    for (const auto& node : list) {
        if (!node.IsMap())
            continue;
        ssv::ChannelConfig config;
        config.channelName = str(node["name"], "");
        config.videoDeviceId = str(node["video_device_id"], "");
        config.audioDeviceId = str(node["audio_device_id"], "");
        config.videoDeviceLabel = str(node["video_device_label"], "");
        config.audioDeviceLabel = str(node["audio_device_label"], "");
        config.frameSize = str(node["frame_size"], "1280x720");
        config.framerate = node["framerate"].as<int>(config.framerate);
        config.videoBitrateKbps = kbpsNode(node["video_bitrate_kbps"], config.videoBitrateKbps);
        config.audioBitrateKbps = kbpsNode(node["audio_bitrate_kbps"], config.audioBitrateKbps);
        config.autoStart = node["auto_start"].as<bool>(false);
        result.append(config);
    }
    return result;
}

void AppConfig::setChannels(const QList<ssv::ChannelConfig>& channels)
{
    YAML::Node list(YAML::NodeType::Sequence);
    for (const auto& config : channels) {
        YAML::Node node;
        node["name"] = config.channelName.toStdString();
        node["video_device_id"] = config.videoDeviceId.toStdString();
        node["audio_device_id"] = config.audioDeviceId.toStdString();
        node["video_device_label"] = config.videoDeviceLabel.toStdString();
        node["audio_device_label"] = config.audioDeviceLabel.toStdString();
        node["frame_size"] = config.frameSize.toStdString();
        node["framerate"] = config.framerate;
        node["video_bitrate_kbps"] = config.videoBitrateKbps;
        node["audio_bitrate_kbps"] = config.audioBitrateKbps;
        node["auto_start"] = config.autoStart;
        list.push_back(node);
    }
    root_["channels"] = list;
}

ssv::SupervisorSettings AppConfig::toSupervisorSettings() const
{
    ssv::SupervisorSettings settings;
    settings.encoderExecutable = encoderExecutable();
    settings.inputFormat = inputFormat();
    settings.outputRoot = outputRoot();
    settings.service.executable = serviceExecutable();
    settings.service.workingDir = serviceWorkingDir();
    settings.service.stopArgs = serviceStopArgs();
    settings.service.stopTimeoutMs = serviceStopTimeoutMs();
    return settings;
}

// --- Generic access ---

QVariant AppConfig::valueByPath(const QString& dottedKey) const
{
    if (dottedKey.isEmpty()) return {};

    YAML::Node node = YAML::Clone(root_);
    for (const auto& part : dottedKey.split(QLatin1Char('.'))) {
        if (!node.IsMap()) return {};
        node.reset(node[part.toStdString()]);
        if (!node.IsDefined() || node.IsNull()) return {};
    }

    return node.IsScalar() ? scalarToVariant(node) : QVariant();
}

QVariant AppConfig::toVariant() const
{
    return nodeToVariant(root_);
}

} // namespace sm
