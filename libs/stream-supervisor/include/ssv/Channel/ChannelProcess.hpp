#pragma once

#include <ssv/Channel/ChannelStatus.hpp>
#include <ssv/Channel/CommandBuilder.hpp>
#include <ssv/Event/ChannelEvent.hpp>
#include <ssv/Version.hpp>
#include <QByteArray>
#include <QThread>
#include <atomic>

class QProcess;

namespace ssv {

// Runs one encoder subprocess on a dedicated thread.
//
// The QProcess is created, read and destroyed inside run(), so nothing on
// the caller's thread ever touches it. Merged stdout/stderr is split on
// '\n' and '\r' (progress lines use carriage returns) and each non-empty
// trimmed line is emitted through logLine(). logLine() is emitted from the
// worker thread; connect with Qt::DirectConnection to see lines before
// stop() returns, or queued to receive them on the receiver's thread.
//
// Exactly one processExited() is emitted per start(), after the process
// is gone and its pipes are closed.
class ChannelProcess : public QThread {
    Q_OBJECT

public:
    explicit ChannelProcess(const QString& channel, const CommandSpec& command,
                            QObject* parent = nullptr);
    ~ChannelProcess() override;

    const QString& channel() const { return channel_; }
    const CommandSpec& command() const { return command_; }

    /// 0 until the process has started and after it has exited.
    qint64 pid() const { return pid_; }

    /// Asks the encoder to quit ("q\n" on stdin), kills it after graceMs.
    /// Blocks until the worker thread has finished.
    void stop(int graceMs = STOP_GRACE_MS);

    bool stopRequested() const { return stopRequested_; }

signals:
    void processStarted(qint64 pid);
    void logLine(ssv::LogLevel level, const QString& text);
    void processExited(int exitCode, ssv::ExitReason reason);

protected:
    void run() override;

private:
    void drainOutput(QProcess& process, bool flush);

    QString channel_;
    CommandSpec command_;
    QByteArray pending_;
    std::atomic<qint64> pid_{0};
    std::atomic<bool> stopRequested_{false};
    std::atomic<int> graceMs_{STOP_GRACE_MS};
};

} // namespace ssv

Q_DECLARE_METATYPE(ssv::LogLevel)
Q_DECLARE_METATYPE(ssv::ExitReason)
