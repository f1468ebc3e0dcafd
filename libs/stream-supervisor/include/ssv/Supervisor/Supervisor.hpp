#pragma once

#include <ssv/Channel/ChannelConfig.hpp>
#include <ssv/Channel/ChannelStatus.hpp>
#include <ssv/Event/ChannelEvent.hpp>
#include <ssv/Supervisor/SupervisorError.hpp>
#include <ssv/Supervisor/SupervisorSettings.hpp>
#include <ssv/Service/DependentService.hpp>
#include <QHash>
#include <QList>
#include <QMutex>
#include <QMutexLocker>
#include <QObject>
#include <QStringList>

namespace ssv {

class ChannelProcess;
class EventBus;
class IEventBus;

/// Runtime view of one channel, as returned by Supervisor::channelState().
struct ChannelState {
    ChannelConfig config;
    ChannelStatus status = ChannelStatus::Idle;
    int lastExitCode = 0;
    qint64 processId = 0;
    bool holdsServiceReference = false;
};

// Owns every channel and the shared dependent service.
//
// Channels are addressed by name; lookups go through the slug, so "Channel 1"
// and "channel1" name the same channel. All mutating calls may come from any
// thread and are serialised by one mutex, which makes the video-device check
// and the ownership it grants a single step. Encoder exits are processed on
// the Supervisor's own thread, so that thread must run an event loop.
//
// Only video devices are exclusive; one audio device may feed any number of
// channels.
class Supervisor : public QObject {
    Q_OBJECT

public:
    explicit Supervisor(const SupervisorSettings& settings, QObject* parent = nullptr);
    ~Supervisor() override;

    SupervisorResult addChannel(const ChannelConfig& config);
    SupervisorResult removeChannel(const QString& name);
    SupervisorResult updateChannel(const QString& name, const ChannelConfig& config);

    SupervisorResult startChannel(const QString& name);

    /// Blocks the caller for up to the stop grace period while the encoder
    /// quits. Other threads can query and start channels meanwhile; the
    /// channel reports Stopping until it settles to Idle.
    SupervisorResult stopChannel(const QString& name);

    /// Name of the active channel capturing the video device, or empty.
    QString isDeviceInUse(const QString& videoDeviceId,
                          const QString& excludingChannel = {}) const;

    QList<ChannelConfig> snapshot() const;

    /// Recreates channels as Idle. Invalid and duplicate entries are skipped.
    /// Returns the number of channels restored.
    int restore(const QList<ChannelConfig>& configs);

    int startAutoStartChannels();

    /// Stops every channel, then the dependent service.
    void shutdown();

    QStringList channelNames() const;
    bool hasChannel(const QString& name) const;
    bool channelState(const QString& name, ChannelState* out) const;
    ChannelStatus status(const QString& name) const;
    int lastExitCode(const QString& name) const;
    QStringList logTail(const QString& name) const;
    QString slugFor(const QString& name) const;
    QString channelDirectory(const QString& name) const;

    int serviceReferences() const;
    bool isServiceRunning() const;
    const DependentService& dependentService() const { return service_; }

    const SupervisorSettings& settings() const { return settings_; }
    IEventBus* events() const;

private:
    struct Entry {
        ChannelState state;
        ChannelProcess* process = nullptr;
        quint64 runId = 0;
    };

    SupervisorResult addChannelLocked(const ChannelConfig& config);
    SupervisorResult startChannelLocked(Entry& entry);
    SupervisorResult stopChannelLocked(QMutexLocker<QMutex>& lock, const QString& slug);
    QString deviceOwnerLocked(const QString& videoDeviceId, const QString& excludingSlug) const;
    QString directoryForSlug(const QString& slug) const;
    void releaseServiceLocked(Entry& entry);
    void settleFailedLocked(Entry& entry);
    void setStatusLocked(Entry& entry, ChannelStatus status, const QString& text);
    void onProcessStarted(const QString& slug, quint64 runId, qint64 pid);
    void onProcessExited(const QString& slug, quint64 runId, int exitCode, ExitReason reason);
    void appendLog(const QString& channel, LogLevel level, const QString& text);

    SupervisorSettings settings_;
    DependentService service_;
    EventBus* bus_;

    mutable QMutex mutex_;
    QHash<QString, Entry> entries_;  // keyed by slug
    QStringList order_;              // slugs in insertion order

    mutable QMutex logMutex_;
    QHash<QString, QStringList> logTails_;  // keyed by slug
};

} // namespace ssv
