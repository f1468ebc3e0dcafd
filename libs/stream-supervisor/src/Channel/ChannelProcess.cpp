#include <ssv/Channel/ChannelProcess.hpp>
#include <QElapsedTimer>
#include <QProcess>
#include <boost/log/trivial.hpp>

namespace ssv {

namespace {
constexpr int START_TIMEOUT_MS = 5000;
constexpr int POLL_INTERVAL_MS = 100;
constexpr int KILL_WAIT_MS = 2000;
constexpr int STOP_JOIN_MARGIN_MS = 3000;
} // namespace

ChannelProcess::ChannelProcess(const QString& channel, const CommandSpec& command,
                               QObject* parent)
    : QThread(parent)
    , channel_(channel)
    , command_(command)
{
}

ChannelProcess::~ChannelProcess()
{
    if (isRunning()) {
        stopRequested_ = true;
        wait();
    }
}

void ChannelProcess::stop(int graceMs)
{
    if (!isRunning()) {
        emit logLine(LogLevel::Info, QStringLiteral("Encoder is not running."));
        return;
    }

    graceMs_ = graceMs;
    stopRequested_ = true;

    if (!wait(graceMs + KILL_WAIT_MS + STOP_JOIN_MARGIN_MS)) {
        BOOST_LOG_TRIVIAL(error) << "[ChannelProcess] " << channel_.toStdString()
                                 << ": worker did not finish after stop";
    }
}

void ChannelProcess::run()
{
    QProcess process;
    process.setProcessChannelMode(QProcess::MergedChannels);
    process.start(command_.program, command_.arguments);

    if (!process.waitForStarted(START_TIMEOUT_MS)) {
        const QString cause = process.errorString();
        BOOST_LOG_TRIVIAL(error) << "[ChannelProcess] " << channel_.toStdString()
                                 << ": failed to launch " << command_.program.toStdString()
                                 << ": " << cause.toStdString();
        emit logLine(LogLevel::Error, QStringLiteral("Failed to start encoder: %1").arg(cause));
        emit processExited(LAUNCH_FAILURE_EXIT_CODE, ExitReason::LaunchFailed);
        return;
    }

    pid_ = process.processId();
    BOOST_LOG_TRIVIAL(info) << "[ChannelProcess] " << channel_.toStdString()
                            << ": encoder started, pid " << pid_.load();
    emit processStarted(pid_);

    ExitReason reason = ExitReason::Natural;
    bool quitSent = false;
    QElapsedTimer stopTimer;

    while (process.state() != QProcess::NotRunning) {
        if (stopRequested_ && !quitSent) {
            quitSent = true;
            reason = ExitReason::Requested;
            stopTimer.start();
            if (process.write("q\n") < 0 || !process.waitForBytesWritten(POLL_INTERVAL_MS)) {
                BOOST_LOG_TRIVIAL(warning) << "[ChannelProcess] " << channel_.toStdString()
                                           << ": could not send quit, killing";
                reason = ExitReason::Killed;
                process.kill();
                process.waitForFinished(KILL_WAIT_MS);
                break;
            }
        }

        if (quitSent && stopTimer.elapsed() > graceMs_) {
            BOOST_LOG_TRIVIAL(warning) << "[ChannelProcess] " << channel_.toStdString()
                                       << ": no exit after " << graceMs_.load() << " ms, killing";
            reason = ExitReason::Killed;
            process.kill();
            process.waitForFinished(KILL_WAIT_MS);
            break;
        }

        // waitForReadyRead returns at once when the output pipe is closed
        // but the process lingers; fall back to waiting on exit.
        if (!process.waitForReadyRead(POLL_INTERVAL_MS))
            process.waitForFinished(POLL_INTERVAL_MS);
        drainOutput(process, false);
    }

    drainOutput(process, true);

    int exitCode = process.exitCode();
    if (process.exitStatus() == QProcess::CrashExit || reason == ExitReason::Killed)
        exitCode = LAUNCH_FAILURE_EXIT_CODE;

    process.closeWriteChannel();
    process.close();
    pid_ = 0;

    BOOST_LOG_TRIVIAL(info) << "[ChannelProcess] " << channel_.toStdString()
                            << ": encoder exited, code " << exitCode
                            << " (" << exitReasonName(reason).toStdString() << ")";
    emit processExited(exitCode, reason);
}

void ChannelProcess::drainOutput(QProcess& process, bool flush)
{
    pending_.append(process.readAll());

    int start = 0;
    for (int i = 0; i < pending_.size(); ++i) {
        const char c = pending_.at(i);
        if (c != '\n' && c != '\r')
            continue;
        const QString line = QString::fromUtf8(pending_.constData() + start, i - start).trimmed();
        if (!line.isEmpty())
            emit logLine(classifyLine(line), line);
        start = i + 1;
    }
    pending_.remove(0, start);

    if (flush && !pending_.isEmpty()) {
        const QString line = QString::fromUtf8(pending_).trimmed();
        if (!line.isEmpty())
            emit logLine(classifyLine(line), line);
        pending_.clear();
    }
}

} // namespace ssv
