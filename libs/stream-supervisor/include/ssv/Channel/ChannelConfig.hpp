#pragma once

#include <QString>
#include <QList>

namespace ssv {

/// Persisted settings for one capture-and-encode channel.
/// Device ids are backend altIds; an empty id means "no device".
struct ChannelConfig {
    QString channelName;
    QString videoDeviceId;
    QString audioDeviceId;
    QString videoDeviceLabel;
    QString audioDeviceLabel;
    QString frameSize = QStringLiteral("1280x720");  // "WxH", empty = no scaling
    int framerate = 30;
    int videoBitrateKbps = 1200;
    int audioBitrateKbps = 96;
    bool autoStart = false;

    /// Filesystem/URL-safe name: lowercase with spaces removed.
    QString slug() const;

    /// Checks the invariants a channel must satisfy before it can be added.
    /// On failure, writes a human-readable reason if requested.
    bool validate(QString* reason = nullptr) const;

    bool operator==(const ChannelConfig& other) const;
    bool operator!=(const ChannelConfig& other) const { return !(*this == other); }
};

QString channelSlug(const QString& channelName);

} // namespace ssv
