#include <signal.h>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>
#include <QTimer>
#include <ssv/Device/DeviceCatalog.hpp>
#include <ssv/Event/IEventBus.hpp>
#include <ssv/Supervisor/Supervisor.hpp>
#include <ssv/Version.hpp>
#include "core/AppConfig.hpp"
#include "core/LegacyConfigImporter.hpp"
#include "core/Logging.hpp"
#include "core/services/ControlServer.hpp"

namespace {

int printDevices(const sm::AppConfig& config)
{
    QTextStream out(stdout);
    const auto list = ssv::DeviceCatalog::listDevices(config.encoderExecutable(), config.inputFormat());

    out << "Video devices:\n";
    for (int i = 0; i < list.video.size(); ++i)
        out << "  " << list.video[i].displayLabel(i + 1) << "\n    " << list.video[i].altId << "\n";
    out << "Audio devices:\n";
    for (int i = 0; i < list.audio.size(); ++i)
        out << "  " << list.audio[i].displayLabel(i + 1) << "\n    " << list.audio[i].altId << "\n";

    if (list.video.isEmpty() && list.audio.isEmpty()) {
        out << "No devices found.\n" << list.diagnostics << "\n";
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("stream-manager");
    app.setApplicationVersion(QString("%1.%2").arg(ssv::VERSION_MAJOR).arg(ssv::VERSION_MINOR));

    QCommandLineParser parser;
    parser.setApplicationDescription("Supervises capture-to-HLS encoder channels and their media server.");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption("config", "YAML config file.", "path", sm::AppConfig::defaultPath());
    QCommandLineOption importOption("import", "Import a legacy stream_config.json.", "json");
    QCommandLineOption listDevicesOption("list-devices", "Print capture devices and exit.");
    parser.addOption(configOption);
    parser.addOption(importOption);
    parser.addOption(listDevicesOption);
    parser.process(app);

    // --- Configuration ---
    const QString configPath = parser.value(configOption);
    const QString legacyPath = parser.isSet(importOption)
        ? parser.value(importOption)
        : QFileInfo(configPath).dir().filePath(sm::LegacyConfigImporter::LEGACY_FILE_NAME);

    sm::AppConfig config;
    config.load(configPath);
    if (parser.isSet(importOption) || (!QFile::exists(configPath) && QFile::exists(legacyPath))) {
        if (sm::LegacyConfigImporter::import(legacyPath, config)) {
            if (config.save(configPath))
                qInfo() << "Config: migrated" << legacyPath << "to" << configPath;
        } else if (parser.isSet(importOption)) {
            return 1;
        }
    }

    sm::applyLogLevel(config.logLevel());

    if (parser.isSet(listDevicesOption))
        return printDevices(config);

    // --- Supervisor ---
    ssv::Supervisor supervisor(config.toSupervisorSettings());
    supervisor.events()->subscribe(ssv::TOPIC_CHANNEL_LOG, [](const QVariant& payload) {
        sm::logChannelEvent(payload.value<ssv::ChannelEvent>());
    });
    supervisor.events()->subscribe(ssv::TOPIC_CHANNEL_STATUS, [](const QVariant& payload) {
        const auto event = payload.value<ssv::ChannelEvent>();
        qInfo() << "Channel:" << event.channel << "->" << ssv::statusName(event.status);
    });

    const auto channels = config.channels();
    const int restored = supervisor.restore(channels);
    qInfo() << "Supervisor: restored" << restored << "of" << channels.size() << "channel(s)";

    // --- Control socket ---
    sm::ControlServer controlServer(&supervisor, &config, configPath);
    if (!controlServer.start(config.controlSocket()))
        qWarning() << "ControlServer: running without a control socket";

    QTimer::singleShot(config.autoStartDelayMs(), &supervisor, [&supervisor]() {
        supervisor.startAutoStartChannels();
    });

    // SIGINT/SIGTERM → leave the event loop and shut down in order
    auto requestQuit = [](int) {
        QMetaObject::invokeMethod(QCoreApplication::instance(), &QCoreApplication::quit,
                                  Qt::QueuedConnection);
    };
    signal(SIGINT, requestQuit);
    signal(SIGTERM, requestQuit);

    int ret = app.exec();

    // Persist before stopping so auto-start choices survive
    controlServer.stop();
    config.setChannels(supervisor.snapshot());
    if (!config.save(configPath))
        qWarning() << "Config: could not save" << configPath;
    supervisor.shutdown();

    return ret;
}
