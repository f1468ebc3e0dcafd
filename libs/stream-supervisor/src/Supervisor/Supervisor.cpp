#include <ssv/Supervisor/Supervisor.hpp>
#include <ssv/Channel/ChannelProcess.hpp>
#include <ssv/Channel/CommandBuilder.hpp>
#include <ssv/Event/EventBus.hpp>
#include <QDir>
#include <QFile>
#include <QMutexLocker>
#include <boost/log/trivial.hpp>

namespace ssv {

namespace {

const QStringList SEGMENT_PATTERNS{QStringLiteral("*.ts"), QStringLiteral("*.m3u8")};

// Returns the names of files that could not be removed.
QStringList removeSegments(const QString& dirPath)
{
    QStringList failed;
    QDir dir(dirPath);
    if (!dir.exists())
        return failed;
    const QStringList files = dir.entryList(SEGMENT_PATTERNS, QDir::Files);
    for (const QString& file : files) {
        if (!QFile::remove(dir.filePath(file)))
            failed << file;
    }
    return failed;
}

} // namespace

Supervisor::Supervisor(const SupervisorSettings& settings, QObject* parent)
    : QObject(parent)
    , settings_(settings)
    , service_(settings.service)
    , bus_(new EventBus(this))
{
    qRegisterMetaType<ChannelEvent>();
    qRegisterMetaType<LogLevel>();
    qRegisterMetaType<ExitReason>();

    connect(&service_, &DependentService::started, this, [this](qint64 pid) {
        bus_->publish(ChannelEvent::statusChange({}, ChannelStatus::Running, 0,
                                                 QStringLiteral("Service started (pid %1)").arg(pid)));
    }, Qt::DirectConnection);
    connect(&service_, &DependentService::stopped, this, [this]() {
        bus_->publish(ChannelEvent::statusChange({}, ChannelStatus::Idle, 0,
                                                 QStringLiteral("Service stopped")));
    }, Qt::DirectConnection);
}

Supervisor::~Supervisor()
{
    shutdown();
}

IEventBus* Supervisor::events() const
{
    return bus_;
}

// ---- channel table ----

SupervisorResult Supervisor::addChannel(const ChannelConfig& config)
{
    QMutexLocker lock(&mutex_);
    return addChannelLocked(config);
}

SupervisorResult Supervisor::addChannelLocked(const ChannelConfig& config)
{
    QString reason;
    if (!config.validate(&reason))
        return SupervisorResult::failure(SupervisorError::InvalidConfig, reason);

    const QString slug = config.slug();
    if (entries_.contains(slug)) {
        return SupervisorResult::failure(
            SupervisorError::DuplicateChannel,
            QStringLiteral("A channel named '%1' already exists")
                .arg(entries_.value(slug).state.config.channelName));
    }

    Entry entry;
    entry.state.config = config;
    entries_.insert(slug, entry);
    order_.append(slug);

    BOOST_LOG_TRIVIAL(info) << "[Supervisor] added channel " << config.channelName.toStdString();
    return SupervisorResult::success();
}

SupervisorResult Supervisor::removeChannel(const QString& name)
{
    QMutexLocker lock(&mutex_);
    const QString slug = channelSlug(name);
    auto it = entries_.find(slug);
    if (it == entries_.end())
        return SupervisorResult::failure(SupervisorError::UnknownChannel, name);

    settleFailedLocked(*it);
    const ChannelStatus s = it->state.status;
    if (s != ChannelStatus::Idle) {
        return SupervisorResult::failure(
            SupervisorError::ChannelBusy,
            QStringLiteral("Channel '%1' is %2; stop it first").arg(name, statusName(s)));
    }

    if (it->state.holdsServiceReference)
        releaseServiceLocked(*it);

    entries_.erase(it);
    order_.removeAll(slug);
    {
        QMutexLocker logLock(&logMutex_);
        logTails_.remove(slug);
    }

    BOOST_LOG_TRIVIAL(info) << "[Supervisor] removed channel " << name.toStdString();
    return SupervisorResult::success();
}

SupervisorResult Supervisor::updateChannel(const QString& name, const ChannelConfig& config)
{
    QMutexLocker lock(&mutex_);
    const QString slug = channelSlug(name);
    auto it = entries_.find(slug);
    if (it == entries_.end())
        return SupervisorResult::failure(SupervisorError::UnknownChannel, name);

    settleFailedLocked(*it);
    const ChannelStatus s = it->state.status;
    if (s != ChannelStatus::Idle) {
        return SupervisorResult::failure(
            SupervisorError::ChannelBusy,
            QStringLiteral("Channel '%1' is %2; stop it first").arg(name, statusName(s)));
    }

    QString reason;
    if (!config.validate(&reason))
        return SupervisorResult::failure(SupervisorError::InvalidConfig, reason);

    const QString newSlug = config.slug();
    if (newSlug != slug && entries_.contains(newSlug)) {
        return SupervisorResult::failure(
            SupervisorError::DuplicateChannel,
            QStringLiteral("A channel named '%1' already exists").arg(config.channelName));
    }

    if (newSlug == slug) {
        it->state.config = config;
    } else {
        Entry entry = *it;
        entry.state.config = config;
        entries_.erase(it);
        entries_.insert(newSlug, entry);
        order_[order_.indexOf(slug)] = newSlug;

        QMutexLocker logLock(&logMutex_);
        if (logTails_.contains(slug))
            logTails_.insert(newSlug, logTails_.take(slug));
    }

    BOOST_LOG_TRIVIAL(info) << "[Supervisor] updated channel " << name.toStdString();
    return SupervisorResult::success();
}

// ---- lifecycle ----

SupervisorResult Supervisor::startChannel(const QString& name)
{
    QMutexLocker lock(&mutex_);
    auto it = entries_.find(channelSlug(name));
    if (it == entries_.end())
        return SupervisorResult::failure(SupervisorError::UnknownChannel, name);
    return startChannelLocked(*it);
}

SupervisorResult Supervisor::startChannelLocked(Entry& entry)
{
    ChannelState& state = entry.state;
    const QString& name = state.config.channelName;
    const QString slug = state.config.slug();

    if (isActive(state.status))
        return SupervisorResult::success();
    if (state.status == ChannelStatus::Stopping) {
        return SupervisorResult::failure(SupervisorError::ChannelBusy,
                                         QStringLiteral("Channel '%1' is stopping").arg(name));
    }

    if (!service_.acquire()) {
        appendLog(name, LogLevel::Error, service_.lastError());
        return SupervisorResult::failure(SupervisorError::DependentServiceUnavailable,
                                         service_.lastError());
    }
    state.holdsServiceReference = true;

    const QString owner = deviceOwnerLocked(state.config.videoDeviceId, slug);
    if (!owner.isEmpty()) {
        releaseServiceLocked(entry);
        const QString detail = QStringLiteral("Video device is already in use by '%1'").arg(owner);
        appendLog(name, LogLevel::Error, detail);
        return SupervisorResult::failure(SupervisorError::DeviceInUse, detail, owner);
    }

    setStatusLocked(entry, ChannelStatus::Starting, QStringLiteral("Starting channel"));

    const QString dir = directoryForSlug(slug);
    if (!QDir().mkpath(dir)) {
        const QString detail = QStringLiteral("Could not create output directory %1").arg(dir);
        releaseServiceLocked(entry);
        setStatusLocked(entry, ChannelStatus::Idle, detail);
        return SupervisorResult::failure(SupervisorError::IOFailure, detail);
    }
    const QStringList stale = removeSegments(dir);
    if (!stale.isEmpty()) {
        const QString detail = QStringLiteral("Could not clear stale segments in %1: %2")
                                   .arg(dir, stale.join(QStringLiteral(", ")));
        releaseServiceLocked(entry);
        setStatusLocked(entry, ChannelStatus::Idle, detail);
        return SupervisorResult::failure(SupervisorError::IOFailure, detail);
    }

    const CommandResult built = CommandBuilder::build(state.config, settings_.encoderExecutable,
                                                      dir, settings_.inputFormat);
    if (!built.ok()) {
        releaseServiceLocked(entry);
        setStatusLocked(entry, ChannelStatus::Idle, built.detail);
        return SupervisorResult::failure(built.error, built.detail);
    }

    const quint64 runId = ++entry.runId;
    auto* process = new ChannelProcess(name, built.command);
    process->moveToThread(thread());

    connect(process, &ChannelProcess::logLine, this,
            [this, name](LogLevel level, const QString& text) { appendLog(name, level, text); },
            Qt::DirectConnection);
    connect(process, &ChannelProcess::processStarted, this,
            [this, slug, runId](qint64 pid) { onProcessStarted(slug, runId, pid); },
            Qt::QueuedConnection);
    connect(process, &ChannelProcess::processExited, this,
            [this, slug, runId](int code, ExitReason reason) { onProcessExited(slug, runId, code, reason); },
            Qt::QueuedConnection);

    entry.process = process;
    BOOST_LOG_TRIVIAL(info) << "[Supervisor] " << name.toStdString() << ": "
                            << built.command.program.toStdString() << " "
                            << built.command.arguments.join(QLatin1Char(' ')).toStdString();
    process->start();

    setStatusLocked(entry, ChannelStatus::Running,
                    QStringLiteral("Streaming to %1").arg(CommandBuilder::playlistPath(dir)));
    return SupervisorResult::success();
}

SupervisorResult Supervisor::stopChannel(const QString& name)
{
    QMutexLocker lock(&mutex_);
    const QString slug = channelSlug(name);
    if (!entries_.contains(slug))
        return SupervisorResult::failure(SupervisorError::UnknownChannel, name);
    return stopChannelLocked(lock, slug);
}

// Drops the lock while the encoder winds down. The channel sits in Stopping
// meanwhile: it owns no device, and start, update and remove are refused.
SupervisorResult Supervisor::stopChannelLocked(QMutexLocker<QMutex>& lock, const QString& slug)
{
    Entry& entry = entries_[slug];
    ChannelState& state = entry.state;
    const QString name = state.config.channelName;

    if (state.status == ChannelStatus::Stopping)
        return SupervisorResult::success();

    if (!entry.process && !state.holdsServiceReference) {
        appendLog(name, LogLevel::Info, QStringLiteral("Channel is not running."));
        if (state.status != ChannelStatus::Idle)
            setStatusLocked(entry, ChannelStatus::Idle, {});
        return SupervisorResult::success();
    }

    setStatusLocked(entry, ChannelStatus::Stopping, QStringLiteral("Stopping channel"));

    // Outdates the queued exit notification of the process being stopped.
    ++entry.runId;
    ChannelProcess* process = entry.process;
    entry.process = nullptr;
    state.processId = 0;

    if (process) {
        lock.unlock();
        process->stop(settings_.stopGraceMs);
        process->deleteLater();
        lock.relock();
    }

    // The table may have been rehashed while unlocked.
    Entry& stopped = entries_[slug];

    const QString dir = directoryForSlug(slug);
    const QStringList failed = removeSegments(dir);
    if (!failed.isEmpty()) {
        const QString detail = QStringLiteral("Could not remove %1 from %2")
                                   .arg(failed.join(QStringLiteral(", ")), dir);
        BOOST_LOG_TRIVIAL(warning) << "[Supervisor] " << name.toStdString() << ": "
                                   << detail.toStdString();
        appendLog(name, LogLevel::Warning, detail);
    }

    releaseServiceLocked(stopped);
    setStatusLocked(stopped, ChannelStatus::Idle, QStringLiteral("Stopped"));
    return SupervisorResult::success();
}

void Supervisor::onProcessStarted(const QString& slug, quint64 runId, qint64 pid)
{
    QMutexLocker lock(&mutex_);
    auto it = entries_.find(slug);
    if (it == entries_.end() || it->runId != runId)
        return;
    it->state.processId = pid;
}

void Supervisor::onProcessExited(const QString& slug, quint64 runId, int exitCode, ExitReason reason)
{
    QMutexLocker lock(&mutex_);
    auto it = entries_.find(slug);
    if (it == entries_.end() || it->runId != runId)
        return;

    Entry& entry = *it;
    if (ChannelProcess* process = entry.process) {
        entry.process = nullptr;
        process->wait();
        process->deleteLater();
    }
    entry.state.processId = 0;
    entry.state.lastExitCode = exitCode;

    const bool clean = reason == ExitReason::Requested || reason == ExitReason::Killed
                       || (reason == ExitReason::Natural && exitCode == 0);

    BOOST_LOG_TRIVIAL(info) << "[Supervisor] " << entry.state.config.channelName.toStdString()
                            << ": encoder exited with code " << exitCode
                            << " (" << exitReasonName(reason).toStdString() << ")";

    releaseServiceLocked(entry);
    if (clean) {
        setStatusLocked(entry, ChannelStatus::Idle,
                        QStringLiteral("Encoder exited with code %1").arg(exitCode));
    } else {
        setStatusLocked(entry, ChannelStatus::Failed,
                        reason == ExitReason::LaunchFailed
                            ? QStringLiteral("Encoder failed to launch")
                            : QStringLiteral("Encoder exited with code %1").arg(exitCode));
    }
}

// ---- batch operations ----

QList<ChannelConfig> Supervisor::snapshot() const
{
    QMutexLocker lock(&mutex_);
    QList<ChannelConfig> configs;
    for (const QString& slug : order_)
        configs.append(entries_.value(slug).state.config);
    return configs;
}

int Supervisor::restore(const QList<ChannelConfig>& configs)
{
    QMutexLocker lock(&mutex_);
    int restored = 0;
    for (const ChannelConfig& config : configs) {
        const SupervisorResult result = addChannelLocked(config);
        if (!result.ok()) {
            BOOST_LOG_TRIVIAL(warning) << "[Supervisor] skipped channel '"
                                       << config.channelName.toStdString() << "': "
                                       << errorCode(result.error).toStdString() << " "
                                       << result.detail.toStdString();
            continue;
        }
        ++restored;
    }
    return restored;
}

int Supervisor::startAutoStartChannels()
{
    QMutexLocker lock(&mutex_);
    int started = 0;
    for (const QString& slug : order_) {
        Entry& entry = entries_[slug];
        if (!entry.state.config.autoStart || isActive(entry.state.status))
            continue;

        const SupervisorResult result = startChannelLocked(entry);
        if (result.ok()) {
            ++started;
        } else {
            BOOST_LOG_TRIVIAL(warning) << "[Supervisor] auto-start of '"
                                       << entry.state.config.channelName.toStdString()
                                       << "' failed: " << errorCode(result.error).toStdString()
                                       << " " << result.detail.toStdString();
        }
    }
    BOOST_LOG_TRIVIAL(info) << "[Supervisor] auto-started " << started << " channel(s)";
    return started;
}

void Supervisor::shutdown()
{
    QMutexLocker lock(&mutex_);
    const QStringList slugs = order_;
    for (const QString& slug : slugs) {
        auto it = entries_.constFind(slug);
        if (it != entries_.constEnd() && (it->process || it->state.holdsServiceReference))
            stopChannelLocked(lock, slug);
    }
    if (service_.pid() > 0 || service_.references() > 0)
        service_.forceStop();
}

// ---- queries ----

QString Supervisor::isDeviceInUse(const QString& videoDeviceId, const QString& excludingChannel) const
{
    QMutexLocker lock(&mutex_);
    return deviceOwnerLocked(videoDeviceId,
                             excludingChannel.isEmpty() ? QString() : channelSlug(excludingChannel));
}

QString Supervisor::deviceOwnerLocked(const QString& videoDeviceId, const QString& excludingSlug) const
{
    if (videoDeviceId.isEmpty())
        return {};
    for (const QString& slug : order_) {
        if (slug == excludingSlug)
            continue;
        const ChannelState& state = entries_[slug].state;
        if (isActive(state.status) && state.config.videoDeviceId == videoDeviceId)
            return state.config.channelName;
    }
    return {};
}

QStringList Supervisor::channelNames() const
{
    QMutexLocker lock(&mutex_);
    QStringList names;
    for (const QString& slug : order_)
        names << entries_.value(slug).state.config.channelName;
    return names;
}

bool Supervisor::hasChannel(const QString& name) const
{
    QMutexLocker lock(&mutex_);
    return entries_.contains(channelSlug(name));
}

bool Supervisor::channelState(const QString& name, ChannelState* out) const
{
    QMutexLocker lock(&mutex_);
    auto it = entries_.constFind(channelSlug(name));
    if (it == entries_.constEnd())
        return false;
    if (out)
        *out = it->state;
    return true;
}

ChannelStatus Supervisor::status(const QString& name) const
{
    QMutexLocker lock(&mutex_);
    return entries_.value(channelSlug(name)).state.status;
}

int Supervisor::lastExitCode(const QString& name) const
{
    QMutexLocker lock(&mutex_);
    return entries_.value(channelSlug(name)).state.lastExitCode;
}

QStringList Supervisor::logTail(const QString& name) const
{
    QMutexLocker lock(&logMutex_);
    return logTails_.value(channelSlug(name));
}

QString Supervisor::slugFor(const QString& name) const
{
    return channelSlug(name);
}

QString Supervisor::channelDirectory(const QString& name) const
{
    return directoryForSlug(channelSlug(name));
}

QString Supervisor::directoryForSlug(const QString& slug) const
{
    return QDir(settings_.outputRoot).filePath(slug);
}

int Supervisor::serviceReferences() const
{
    QMutexLocker lock(&mutex_);
    return service_.references();
}

bool Supervisor::isServiceRunning() const
{
    QMutexLocker lock(&mutex_);
    return service_.isRunning();
}

// ---- helpers ----

void Supervisor::releaseServiceLocked(Entry& entry)
{
    if (!entry.state.holdsServiceReference)
        return;
    entry.state.holdsServiceReference = false;
    service_.release();
}

// A failed channel holds neither a process nor a device; it edits as Idle.
void Supervisor::settleFailedLocked(Entry& entry)
{
    if (entry.state.status != ChannelStatus::Failed || entry.process)
        return;
    releaseServiceLocked(entry);
    setStatusLocked(entry, ChannelStatus::Idle, {});
}

void Supervisor::setStatusLocked(Entry& entry, ChannelStatus status, const QString& text)
{
    entry.state.status = status;
    const QString& name = entry.state.config.channelName;
    if (!text.isEmpty())
        appendLog(name, status == ChannelStatus::Failed ? LogLevel::Error : LogLevel::Info, text);
    bus_->publish(ChannelEvent::statusChange(name, status, entry.state.lastExitCode, text));
}

void Supervisor::appendLog(const QString& channel, LogLevel level, const QString& text)
{
    QMutexLocker lock(&logMutex_);
    QStringList& tail = logTails_[channelSlug(channel)];
    tail.append(QStringLiteral("[%1] %2")
                    .arg(QDateTime::currentDateTime().toString(QStringLiteral("HH:mm:ss")), text));
    while (tail.size() > LOG_TAIL_LINES)
        tail.removeFirst();
    bus_->publish(ChannelEvent::log(channel, level, text));
}

} // namespace ssv
