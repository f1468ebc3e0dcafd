#include <ssv/Device/DeviceCatalog.hpp>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QProcess>
#include <QStringList>
#include <boost/log/trivial.hpp>

Q_LOGGING_CATEGORY(lcDeviceCatalog, "ssv.device.catalog")

namespace ssv {

namespace {

enum class Section {
    None,
    ScanningVideo,
    ScanningAudio
};

// Text between the first pair of double quotes, or empty if unbalanced.
QString quotedValue(const QString& line)
{
    const int open = line.indexOf(QLatin1Char('"'));
    if (open < 0)
        return {};
    const int close = line.indexOf(QLatin1Char('"'), open + 1);
    if (close < 0)
        return {};
    return line.mid(open + 1, close - open - 1);
}

} // namespace

QString Device::displayLabel(int index) const
{
    return QStringLiteral("%1  [#%2]").arg(name).arg(index);
}

DeviceList DeviceCatalog::parseListing(const QString& text)
{
    DeviceList result;
    Section section = Section::None;
    QList<Device>* lastList = nullptr;

    const QStringList lines = text.split(QLatin1Char('\n'));
    for (const QString& rawLine : lines) {
        const QString line = rawLine.trimmed();
        if (line.isEmpty())
            continue;

        if (line.contains(QLatin1String("video devices"), Qt::CaseInsensitive)) {
            section = Section::ScanningVideo;
            lastList = nullptr;
            continue;
        }
        if (line.contains(QLatin1String("audio devices"), Qt::CaseInsensitive)) {
            section = Section::ScanningAudio;
            lastList = nullptr;
            continue;
        }

        if (line.contains(QLatin1String("Alternative name"))) {
            const QString alt = quotedValue(line);
            if (alt.isEmpty() || !lastList || lastList->isEmpty()) {
                qCDebug(lcDeviceCatalog) << "orphan alternative name skipped:" << line;
                continue;
            }
            lastList->last().altId = alt;
            continue;
        }

        // An alternative name only belongs to the device line right above it
        lastList = nullptr;

        const QString name = quotedValue(line);
        if (name.isEmpty())
            continue;

        // Newer backends print one flat list with a type tag per device
        QList<Device>* target = nullptr;
        if (line.contains(QLatin1String("(video)")))
            target = &result.video;
        else if (line.contains(QLatin1String("(audio)")))
            target = &result.audio;
        else if (section == Section::ScanningVideo)
            target = &result.video;
        else if (section == Section::ScanningAudio)
            target = &result.audio;

        if (!target) {
            qCDebug(lcDeviceCatalog) << "quoted line outside any section:" << line;
            continue;
        }

        target->append(Device{name, name});
        lastList = target;
    }

    return result;
}

DeviceList DeviceCatalog::listDevices(const QString& backendExecutable,
                                      const QString& inputFormat,
                                      int timeoutMs)
{
    DeviceList result;

    QFileInfo info(backendExecutable);
    if (backendExecutable.isEmpty() || !info.exists() || !info.isExecutable()) {
        result.diagnostics = QStringLiteral("Encoder executable not found: %1").arg(backendExecutable);
        BOOST_LOG_TRIVIAL(warning) << "[DeviceCatalog] " << result.diagnostics.toStdString();
        return result;
    }

    QProcess process;
    process.setProcessChannelMode(QProcess::MergedChannels);
    process.start(backendExecutable,
                  {QStringLiteral("-hide_banner"),
                   QStringLiteral("-list_devices"), QStringLiteral("true"),
                   QStringLiteral("-f"), inputFormat,
                   QStringLiteral("-i"), QStringLiteral("dummy")});

    if (!process.waitForStarted(timeoutMs)) {
        result.diagnostics = QStringLiteral("Failed to start %1: %2")
                                 .arg(backendExecutable, process.errorString());
        BOOST_LOG_TRIVIAL(warning) << "[DeviceCatalog] " << result.diagnostics.toStdString();
        return result;
    }

    if (!process.waitForFinished(timeoutMs)) {
        process.kill();
        process.waitForFinished(1000);
        result.diagnostics = QStringLiteral("Device query timed out after %1 ms").arg(timeoutMs);
        BOOST_LOG_TRIVIAL(warning) << "[DeviceCatalog] " << result.diagnostics.toStdString();
        return result;
    }

    const QString text = QString::fromUtf8(process.readAll());

    // The listing mode always ends with a non-zero "immediate exit" code,
    // so only a crash counts as abnormal.
    if (process.exitStatus() == QProcess::CrashExit) {
        result.diagnostics = text + QStringLiteral("\nDevice query crashed");
        BOOST_LOG_TRIVIAL(warning) << "[DeviceCatalog] Backend crashed while listing devices";
        return result;
    }

    result = parseListing(text);
    result.diagnostics = text.isEmpty() ? QStringLiteral("Backend produced no output") : text;

    BOOST_LOG_TRIVIAL(info) << "[DeviceCatalog] Found " << result.video.size()
                            << " video and " << result.audio.size() << " audio devices";
    return result;
}

} // namespace ssv
