#pragma once

#include <ssv/Channel/ChannelConfig.hpp>
#include <ssv/Supervisor/SupervisorSettings.hpp>
#include <QList>
#include <QString>
#include <QStringList>
#include <QVariant>
#include <yaml-cpp/yaml.h>

namespace sm {

/// Daemon configuration, persisted as YAML.
///
/// The file is deep-merged over built-in defaults, so a config only needs
/// the keys it changes. Channel entries are the one list that is replaced
/// wholesale.
class AppConfig {
public:
    AppConfig();

    /// Returns false when the file is missing or malformed; defaults are
    /// kept in that case.
    bool load(const QString& filePath);
    bool save(const QString& filePath) const;

    static QString defaultPath();

    // Encoder
    QString encoderExecutable() const;
    void setEncoderExecutable(const QString& v);
    QString inputFormat() const;

    // Dependent service
    QString serviceExecutable() const;
    void setServiceExecutable(const QString& v);
    QString serviceWorkingDir() const;
    void setServiceWorkingDir(const QString& v);
    QStringList serviceStopArgs() const;
    int serviceStopTimeoutMs() const;

    // Output and playback
    QString outputRoot() const;
    void setOutputRoot(const QString& v);
    int playbackPort() const;
    QString playbackPathPrefix() const;

    QString controlSocket() const;
    QString logLevel() const;
    void setLogLevel(const QString& v);
    int autoStartDelayMs() const;

    QList<ssv::ChannelConfig> channels() const;
    void setChannels(const QList<ssv::ChannelConfig>& channels);

    ssv::SupervisorSettings toSupervisorSettings() const;

    // Generic dot-path access (e.g. "playback.port")
    QVariant valueByPath(const QString& dottedKey) const;

    /// Whole tree as nested QVariantMap/QVariantList, for JSON export.
    QVariant toVariant() const;

private:
    YAML::Node root_;

    void initDefaults();
    void normalize();
};

/// Parses "1200k", "1200" or 1200 as kilobits per second.
int parseKbps(const QString& text, int fallback);

} // namespace sm
