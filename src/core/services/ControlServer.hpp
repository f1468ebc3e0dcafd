#pragma once

#include <QHash>
#include <QList>
#include <QObject>
#include <QLocalServer>
#include <QLocalSocket>
#include <QJsonObject>
#include <QVariantMap>

namespace ssv {
class Supervisor;
struct ChannelConfig;
struct SupervisorResult;
}

class QThread;

namespace sm {

class AppConfig;

/// Unix domain socket control surface for the supervisor.
///
/// Each request is one JSON object {"command": ..., "data": {...}}, either
/// newline-terminated or alone in a write. Each reply is one compact JSON
/// line. Mutating channel commands persist the channel list to the config
/// file. Single-writer rule: only this process writes the config.
class ControlServer : public QObject {
    Q_OBJECT

public:
    ControlServer(ssv::Supervisor* supervisor, AppConfig* config,
                  const QString& configPath, QObject* parent = nullptr);
    ~ControlServer() override;

    /// Start listening. Returns false if the socket cannot be bound.
    bool start(const QString& socketPath);
    /// Stop listening. Waits for pending stop_channel requests to finish.
    void stop();

    QByteArray handleRequest(const QByteArray& request);

    /// First non-loopback IPv4 address of this host, or 127.0.0.1.
    static QString playbackHost();
    QString playbackUrl(const QString& slug) const;

private slots:
    void onNewConnection();
    void onReadyRead();
    void onDisconnected();

private:
    QByteArray handleListChannels();
    QByteArray handleChannelStatus(const QVariantMap& data);
    QByteArray handleChannelLog(const QVariantMap& data);
    QByteArray handleAddChannel(const QVariantMap& data);
    QByteArray handleUpdateChannel(const QVariantMap& data);
    QByteArray handleRemoveChannel(const QVariantMap& data);
    QByteArray handleStartChannel(const QVariantMap& data);
    QByteArray handleStopChannel(const QVariantMap& data);
    QByteArray handleIsDeviceInUse(const QVariantMap& data);
    QByteArray handleListDevices();
    QByteArray handleGetConfig();
    QByteArray handleSaveConfig();

    QJsonObject channelJson(const QString& name) const;
    bool persistChannels();

    static ssv::ChannelConfig channelFromData(const QVariantMap& data);
    static QByteArray reply(const QJsonObject& obj);
    static QByteArray errorReply(const ssv::SupervisorResult& result);
    static QByteArray errorReply(const QString& code, const QString& detail = {});

    ssv::Supervisor* supervisor_;
    AppConfig* config_;
    QString configPath_;
    QLocalServer* server_ = nullptr;
    QHash<QLocalSocket*, QByteArray> buffers_;
    QList<QThread*> stopWorkers_;  // pending stop_channel requests
};

} // namespace sm
