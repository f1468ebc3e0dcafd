#pragma once

#include <ssv/Version.hpp>
#include <QObject>
#include <QString>
#include <QStringList>

namespace ssv {

struct DependentServiceSettings {
    QString executable;
    QString workingDir;
    QStringList startArgs;
    QStringList stopArgs{QStringLiteral("-s"), QStringLiteral("stop")};
    int stopTimeoutMs = SERVICE_STOP_TIMEOUT_MS;
    bool killStrayInstances = true;  // pkill -KILL -x <name> before launching
};

// Shared media server that stays up while at least one channel needs it.
//
// The server is launched detached and tracked by pid, so it survives the
// thread that started it and is never reaped by a QProcess. Not
// thread-safe: the Supervisor calls it under its own mutex.
class DependentService : public QObject {
    Q_OBJECT

public:
    explicit DependentService(const DependentServiceSettings& settings,
                              QObject* parent = nullptr);
    ~DependentService() override;

    const DependentServiceSettings& settings() const { return settings_; }

    /// Takes a reference, launching the server first if it is down.
    /// Returns false (count unchanged) when it cannot be launched; the
    /// cause is then available from lastError().
    bool acquire();

    /// Drops a reference; stops the server when the count reaches zero.
    void release();

    /// Stops the server regardless of outstanding references.
    void forceStop();

    int references() const { return references_; }
    bool isRunning() const;
    qint64 pid() const { return pid_; }
    QString lastError() const { return lastError_; }

signals:
    void started(qint64 pid);
    void stopped();

private:
    bool launch();
    void stop();
    bool waitForExit(int timeoutMs) const;

    DependentServiceSettings settings_;
    qint64 pid_ = 0;
    int references_ = 0;
    QString lastError_;
};

} // namespace ssv
