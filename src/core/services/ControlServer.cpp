#include "ControlServer.hpp"
#include "../AppConfig.hpp"
#include <ssv/Channel/ChannelConfig.hpp>
#include <ssv/Device/DeviceCatalog.hpp>
#include <ssv/Supervisor/Supervisor.hpp>
#include <QDebug>
#include <QFile>
#include <QHostAddress>
#include <QJsonArray>
#include <QJsonDocument>
#include <QNetworkInterface>
#include <QThread>

namespace sm {

ControlServer::ControlServer(ssv::Supervisor* supervisor, AppConfig* config,
                             const QString& configPath, QObject* parent)
    : QObject(parent)
    , supervisor_(supervisor)
    , config_(config)
    , configPath_(configPath)
{
}

ControlServer::~ControlServer()
{
    stop();
}

bool ControlServer::start(const QString& socketPath)
{
    if (server_) return false;

    // Remove stale socket file
    QFile::remove(socketPath);

    server_ = new QLocalServer(this);
    server_->setSocketOptions(QLocalServer::UserAccessOption);

    connect(server_, &QLocalServer::newConnection, this, &ControlServer::onNewConnection);

    if (!server_->listen(socketPath)) {
        qWarning() << "ControlServer: Failed to listen on" << socketPath
                   << ":" << server_->errorString();
        delete server_;
        server_ = nullptr;
        return false;
    }

    qInfo() << "ControlServer: Listening on" << socketPath;
    return true;
}

void ControlServer::stop()
{
    for (QThread* worker : stopWorkers_)
        worker->wait();
    qDeleteAll(stopWorkers_);
    stopWorkers_.clear();

    if (server_) {
        const QString path = server_->fullServerName();
        server_->close();
        delete server_;
        server_ = nullptr;
        QFile::remove(path);
    }
}

void ControlServer::onNewConnection()
{
    while (auto* socket = server_->nextPendingConnection()) {
        connect(socket, &QLocalSocket::readyRead, this, &ControlServer::onReadyRead);
        connect(socket, &QLocalSocket::disconnected, this, &ControlServer::onDisconnected);
    }
}

void ControlServer::onReadyRead()
{
    auto* socket = qobject_cast<QLocalSocket*>(sender());
    if (!socket) return;

    QByteArray& buffer = buffers_[socket];
    buffer.append(socket->readAll());

    int newline;
    while ((newline = buffer.indexOf('\n')) >= 0) {
        const QByteArray line = buffer.left(newline).trimmed();
        buffer.remove(0, newline + 1);
        if (!line.isEmpty())
            socket->write(handleRequest(line) + "\n");
    }

    // Clients that send one object per write without a terminator
    if (!buffer.trimmed().isEmpty() && QJsonDocument::fromJson(buffer).isObject()) {
        socket->write(handleRequest(buffer) + "\n");
        buffer.clear();
    }
    socket->flush();
}

void ControlServer::onDisconnected()
{
    auto* socket = qobject_cast<QLocalSocket*>(sender());
    if (socket) {
        buffers_.remove(socket);
        socket->deleteLater();
    }
}

QByteArray ControlServer::handleRequest(const QByteArray& request)
{
    QJsonDocument doc = QJsonDocument::fromJson(request);
    if (!doc.isObject())
        return errorReply(QStringLiteral("invalid_json"));

    QJsonObject obj = doc.object();
    QString command = obj.value("command").toString();
    QVariantMap data = obj.value("data").toObject().toVariantMap();

    if (command == QLatin1String("list_channels"))
        return handleListChannels();
    if (command == QLatin1String("channel_status"))
        return handleChannelStatus(data);
    if (command == QLatin1String("channel_log"))
        return handleChannelLog(data);
    if (command == QLatin1String("add_channel"))
        return handleAddChannel(data);
    if (command == QLatin1String("update_channel"))
        return handleUpdateChannel(data);
    if (command == QLatin1String("remove_channel"))
        return handleRemoveChannel(data);
    if (command == QLatin1String("start_channel"))
        return handleStartChannel(data);
    if (command == QLatin1String("stop_channel"))
        return handleStopChannel(data);
    if (command == QLatin1String("is_device_in_use"))
        return handleIsDeviceInUse(data);
    if (command == QLatin1String("list_devices"))
        return handleListDevices();
    if (command == QLatin1String("get_config"))
        return handleGetConfig();
    if (command == QLatin1String("save_config"))
        return handleSaveConfig();

    return errorReply(QStringLiteral("unknown_command"), command);
}

// --- Channels ---

QByteArray ControlServer::handleListChannels()
{
    QJsonArray channels;
    for (const QString& name : supervisor_->channelNames())
        channels.append(channelJson(name));

    QJsonObject obj;
    obj["channels"] = channels;
    obj["service_running"] = supervisor_->isServiceRunning();
    obj["service_references"] = supervisor_->serviceReferences();
    return reply(obj);
}

QByteArray ControlServer::handleChannelStatus(const QVariantMap& data)
{
    const QString name = data.value("name").toString();
    if (!supervisor_->hasChannel(name))
        return errorReply(ssv::errorCode(ssv::SupervisorError::UnknownChannel), name);
    return reply(channelJson(name));
}

QByteArray ControlServer::handleChannelLog(const QVariantMap& data)
{
    const QString name = data.value("name").toString();
    if (!supervisor_->hasChannel(name))
        return errorReply(ssv::errorCode(ssv::SupervisorError::UnknownChannel), name);

    QJsonObject obj;
    obj["name"] = name;
    obj["lines"] = QJsonArray::fromStringList(supervisor_->logTail(name));
    return reply(obj);
}

QByteArray ControlServer::handleAddChannel(const QVariantMap& data)
{
    const auto config = channelFromData(data.value("config").toMap());
    const auto result = supervisor_->addChannel(config);
    if (!result.ok())
        return errorReply(result);

    persistChannels();
    return reply(channelJson(config.channelName));
}

QByteArray ControlServer::handleUpdateChannel(const QVariantMap& data)
{
    const QString name = data.value("name").toString();
    const auto config = channelFromData(data.value("config").toMap());
    const auto result = supervisor_->updateChannel(name, config);
    if (!result.ok())
        return errorReply(result);

    persistChannels();
    return reply(channelJson(config.channelName));
}

QByteArray ControlServer::handleRemoveChannel(const QVariantMap& data)
{
    const auto result = supervisor_->removeChannel(data.value("name").toString());
    if (!result.ok())
        return errorReply(result);

    persistChannels();
    return R"({"ok":true})";
}

QByteArray ControlServer::handleStartChannel(const QVariantMap& data)
{
    const QString name = data.value("name").toString();
    const auto result = supervisor_->startChannel(name);
    if (!result.ok())
        return errorReply(result);
    return reply(channelJson(name));
}

QByteArray ControlServer::handleStopChannel(const QVariantMap& data)
{
    const QString name = data.value("name").toString();
    if (!supervisor_->hasChannel(name))
        return errorReply(ssv::errorCode(ssv::SupervisorError::UnknownChannel), name);

    // Stopping waits out the encoder's grace period; keep it off this thread
    // so the socket stays responsive.
    QThread* worker = QThread::create([this, name]() {
        const auto result = supervisor_->stopChannel(name);
        if (!result.ok())
            qWarning() << "ControlServer: stop of" << name << "failed:" << result.detail;
    });
    stopWorkers_.append(worker);
    connect(worker, &QThread::finished, this, [this, worker]() {
        if (stopWorkers_.removeAll(worker) > 0)
            worker->deleteLater();
    });
    worker->start();
    return R"({"ok":true,"pending":true})";
}

QByteArray ControlServer::handleIsDeviceInUse(const QVariantMap& data)
{
    const QString owner = supervisor_->isDeviceInUse(data.value("video_device_id").toString(),
                                                     data.value("exclude").toString());
    QJsonObject obj;
    obj["in_use"] = !owner.isEmpty();
    obj["owner"] = owner;
    return reply(obj);
}

QByteArray ControlServer::handleListDevices()
{
    const auto list = ssv::DeviceCatalog::listDevices(config_->encoderExecutable(),
                                                      config_->inputFormat());
    auto toArray = [](const QList<ssv::Device>& devices) {
        QJsonArray array;
        for (int i = 0; i < devices.size(); ++i) {
            QJsonObject device;
            device["name"] = devices[i].name;
            device["alt_id"] = devices[i].altId;
            device["label"] = devices[i].displayLabel(i + 1);
            array.append(device);
        }
        return array;
    };

    QJsonObject obj;
    obj["video"] = toArray(list.video);
    obj["audio"] = toArray(list.audio);
    if (list.video.isEmpty() && list.audio.isEmpty())
        obj["diagnostics"] = list.diagnostics;
    return reply(obj);
}

// --- Config ---

QByteArray ControlServer::handleGetConfig()
{
    config_->setChannels(supervisor_->snapshot());
    return reply(QJsonObject::fromVariantMap(config_->toVariant().toMap()));
}

QByteArray ControlServer::handleSaveConfig()
{
    if (!persistChannels())
        return errorReply(ssv::errorCode(ssv::SupervisorError::IOFailure), configPath_);
    return R"({"ok":true})";
}

bool ControlServer::persistChannels()
{
    config_->setChannels(supervisor_->snapshot());
    if (configPath_.isEmpty())
        return true;
    if (!config_->save(configPath_)) {
        qWarning() << "ControlServer: could not save" << configPath_;
        return false;
    }
    return true;
}

// --- Helpers ---

QJsonObject ControlServer::channelJson(const QString& name) const
{
    QJsonObject obj;
    ssv::ChannelState state;
    if (!supervisor_->channelState(name, &state))
        return obj;

    const ssv::ChannelConfig& c = state.config;
    obj["name"] = c.channelName;
    obj["slug"] = c.slug();
    obj["status"] = ssv::statusName(state.status);
    obj["last_exit_code"] = state.lastExitCode;
    obj["pid"] = state.processId;
    obj["video_device_id"] = c.videoDeviceId;
    obj["audio_device_id"] = c.audioDeviceId;
    obj["video_device_label"] = c.videoDeviceLabel;
    obj["audio_device_label"] = c.audioDeviceLabel;
    obj["frame_size"] = c.frameSize;
    obj["framerate"] = c.framerate;
    obj["video_bitrate_kbps"] = c.videoBitrateKbps;
    obj["audio_bitrate_kbps"] = c.audioBitrateKbps;
    obj["auto_start"] = c.autoStart;
    obj["directory"] = supervisor_->channelDirectory(c.channelName);
    obj["playback_url"] = playbackUrl(c.slug());
    return obj;
}

ssv::ChannelConfig ControlServer::channelFromData(const QVariantMap& data)
{
    ssv::ChannelConfig c;
    c.channelName = data.value("name").toString();
    c.videoDeviceId = data.value("video_device_id").toString();
    c.audioDeviceId = data.value("audio_device_id").toString();
    c.videoDeviceLabel = data.value("video_device_label").toString();
    c.audioDeviceLabel = data.value("audio_device_label").toString();
    if (data.contains("frame_size"))
        c.frameSize = data.value("frame_size").toString();
    if (data.contains("framerate"))
        c.framerate = data.value("framerate").toInt();
    if (data.contains("video_bitrate_kbps"))
        c.videoBitrateKbps = parseKbps(data.value("video_bitrate_kbps").toString(), 0);
    if (data.contains("audio_bitrate_kbps"))
        c.audioBitrateKbps = parseKbps(data.value("audio_bitrate_kbps").toString(), 0);
    c.autoStart = data.value("auto_start").toBool();
    return c;
}

QString ControlServer::playbackHost()
{
    const auto addresses = QNetworkInterface::allAddresses();
    for (const QHostAddress& address : addresses) {
        if (address.protocol() == QAbstractSocket::IPv4Protocol && !address.isLoopback())
            return address.toString();
    }
    return QStringLiteral("127.0.0.1");
}

QString ControlServer::playbackUrl(const QString& slug) const
{
    return QStringLiteral("http://%1:%2%3/%4/index.m3u8")
        .arg(playbackHost())
        .arg(config_->playbackPort())
        .arg(config_->playbackPathPrefix(), slug);
}

QByteArray ControlServer::reply(const QJsonObject& obj)
{
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

QByteArray ControlServer::errorReply(const ssv::SupervisorResult& result)
{
    QJsonObject obj;
    obj["error"] = ssv::errorCode(result.error);
    obj["detail"] = result.detail;
    if (!result.owner.isEmpty())
        obj["owner"] = result.owner;
    return reply(obj);
}

QByteArray ControlServer::errorReply(const QString& code, const QString& detail)
{
    QJsonObject obj;
    obj["error"] = code;
    obj["detail"] = detail;
    return reply(obj);
}

} // namespace sm
