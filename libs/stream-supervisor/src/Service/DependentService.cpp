#include <ssv/Service/DependentService.hpp>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QProcess>
#include <QThread>
#include <boost/log/trivial.hpp>
#include <csignal>
#include <cerrno>
#include <sys/types.h>
#include <signal.h>

namespace ssv {

namespace {

constexpr int EXIT_POLL_MS = 50;
constexpr int KILL_WAIT_MS = 1000;

// A killed child of a reaper-less container lingers as a zombie and still
// answers kill(pid, 0).
bool isZombie(qint64 pid)
{
    QFile stat(QStringLiteral("/proc/%1/stat").arg(pid));
    if (!stat.open(QIODevice::ReadOnly))
        return false;
    const QByteArray line = stat.readAll();
    const int paren = line.lastIndexOf(')');
    return paren >= 0 && paren + 2 < line.size() && line.at(paren + 2) == 'Z';
}

} // namespace

DependentService::DependentService(const DependentServiceSettings& settings, QObject* parent)
    : QObject(parent)
    , settings_(settings)
{
}

DependentService::~DependentService()
{
    if (pid_ > 0)
        forceStop();
}

bool DependentService::isRunning() const
{
    if (pid_ <= 0)
        return false;
    if (::kill(static_cast<pid_t>(pid_), 0) != 0 && errno != EPERM)
        return false;
    return !isZombie(pid_);
}

bool DependentService::acquire()
{
    if (!isRunning()) {
        pid_ = 0;
        if (!launch())
            return false;
    }

    ++references_;
    BOOST_LOG_TRIVIAL(debug) << "[DependentService] acquired, references " << references_;
    return true;
}

void DependentService::release()
{
    if (references_ == 0) {
        BOOST_LOG_TRIVIAL(warning) << "[DependentService] release without a reference";
        return;
    }

    --references_;
    BOOST_LOG_TRIVIAL(debug) << "[DependentService] released, references " << references_;
    if (references_ == 0)
        stop();
}

void DependentService::forceStop()
{
    references_ = 0;
    stop();
}

bool DependentService::launch()
{
    const QFileInfo exe(settings_.executable);
    if (settings_.executable.isEmpty() || !exe.isFile() || !exe.isExecutable()) {
        lastError_ = QStringLiteral("Service executable not found at: %1").arg(settings_.executable);
        BOOST_LOG_TRIVIAL(error) << "[DependentService] " << lastError_.toStdString();
        return false;
    }

    if (settings_.killStrayInstances) {
        const int rc = QProcess::execute(QStringLiteral("pkill"),
                                         {QStringLiteral("-KILL"), QStringLiteral("-x"), exe.fileName()});
        // pkill exits 1 when nothing matched
        if (rc < 0)
            BOOST_LOG_TRIVIAL(warning) << "[DependentService] could not run pkill to clear stray instances";
        else if (rc == 0)
            BOOST_LOG_TRIVIAL(info) << "[DependentService] killed stray " << exe.fileName().toStdString();
    }

    qint64 pid = 0;
    if (!QProcess::startDetached(settings_.executable, settings_.startArgs,
                                 settings_.workingDir, &pid) || pid <= 0) {
        lastError_ = QStringLiteral("Failed to launch service: %1").arg(settings_.executable);
        BOOST_LOG_TRIVIAL(error) << "[DependentService] " << lastError_.toStdString();
        return false;
    }

    pid_ = pid;
    lastError_.clear();
    BOOST_LOG_TRIVIAL(info) << "[DependentService] started " << settings_.executable.toStdString()
                            << ", pid " << pid_;
    emit started(pid_);
    return true;
}

void DependentService::stop()
{
    if (pid_ <= 0)
        return;

    if (!isRunning()) {
        BOOST_LOG_TRIVIAL(info) << "[DependentService] already stopped externally";
        pid_ = 0;
        emit stopped();
        return;
    }

    if (!settings_.stopArgs.isEmpty()) {
        QProcess control;
        control.setWorkingDirectory(settings_.workingDir);
        control.start(settings_.executable, settings_.stopArgs);
        if (!control.waitForStarted(settings_.stopTimeoutMs)) {
            BOOST_LOG_TRIVIAL(warning) << "[DependentService] stop command failed to start: "
                                       << control.errorString().toStdString();
        } else if (!control.waitForFinished(settings_.stopTimeoutMs)) {
            BOOST_LOG_TRIVIAL(warning) << "[DependentService] stop command timed out";
            control.kill();
            control.waitForFinished(KILL_WAIT_MS);
        }
    }

    if (!waitForExit(settings_.stopTimeoutMs)) {
        BOOST_LOG_TRIVIAL(warning) << "[DependentService] pid " << pid_ << " still up, sending SIGKILL";
        ::kill(static_cast<pid_t>(pid_), SIGKILL);
        if (!waitForExit(KILL_WAIT_MS))
            BOOST_LOG_TRIVIAL(error) << "[DependentService] pid " << pid_ << " survived SIGKILL";
    }

    BOOST_LOG_TRIVIAL(info) << "[DependentService] stopped";
    pid_ = 0;
    emit stopped();
}

bool DependentService::waitForExit(int timeoutMs) const
{
    QElapsedTimer timer;
    timer.start();
    while (isRunning()) {
        if (timer.elapsed() >= timeoutMs)
            return false;
        QThread::msleep(EXIT_POLL_MS);
    }
    return true;
}

} // namespace ssv
