#include <QtTest>
#include "core/AppConfig.hpp"
#include "core/LegacyConfigImporter.hpp"

class TestLegacyConfig : public QObject {
    Q_OBJECT
private slots:
    void testImport()
    {
        sm::AppConfig config;
        QVERIFY(sm::LegacyConfigImporter::import(QString(TEST_DATA_DIR) + "/stream_config.json", config));

        QCOMPARE(config.encoderExecutable(), QString("C:/ffmpeg/bin/ffmpeg.exe"));
        QCOMPARE(config.serviceWorkingDir(), QString("C:/nginx"));
        QCOMPARE(config.serviceExecutable(), QString("C:/nginx/nginx"));
        QCOMPARE(config.outputRoot(), QString("C:/hls"));
    }

    void testStreams()
    {
        sm::AppConfig config;
        QVERIFY(sm::LegacyConfigImporter::import(QString(TEST_DATA_DIR) + "/stream_config.json", config));

        auto channels = config.channels();
        // the nameless entry is dropped
        QCOMPARE(channels.size(), 2);

        QCOMPARE(channels[0].channelName, QString("Channel 1"));
        QCOMPARE(channels[0].videoDeviceId, QString("@device_pnp_video1"));
        QCOMPARE(channels[0].audioDeviceId, QString("@device_cm_audio1"));
        QCOMPARE(channels[0].audioDeviceLabel, QString("Digital Audio Interface  [#1]"));
        QCOMPARE(channels[0].framerate, 30);
        QCOMPARE(channels[0].videoBitrateKbps, 1500);
        QCOMPARE(channels[0].audioBitrateKbps, 128);
        QCOMPARE(channels[0].autoStart, true);

        QCOMPARE(channels[1].channelName, QString("Channel 2"));
        QCOMPARE(channels[1].frameSize, QString());
        QCOMPARE(channels[1].audioDeviceId, QString());
        QCOMPARE(channels[1].framerate, 15);
        QCOMPARE(channels[1].videoBitrateKbps, 800);
    }

    void testImportedConfigRoundTripsThroughYaml()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        sm::AppConfig config;
        QVERIFY(sm::LegacyConfigImporter::import(QString(TEST_DATA_DIR) + "/stream_config.json", config));
        QVERIFY(config.save(dir.filePath("config.yaml")));

        sm::AppConfig reloaded;
        QVERIFY(reloaded.load(dir.filePath("config.yaml")));
        QCOMPARE(reloaded.channels(), config.channels());
        QCOMPARE(reloaded.outputRoot(), QString("C:/hls"));
    }

    void testMissingFile()
    {
        sm::AppConfig config;
        QVERIFY(!sm::LegacyConfigImporter::import("/nonexistent/stream_config.json", config));
        QCOMPARE(config.encoderExecutable(), QString("/usr/bin/ffmpeg"));
    }

    void testNotAnObject()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QFile file(dir.filePath("stream_config.json"));
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("[1, 2, 3]");
        file.close();

        sm::AppConfig config;
        QVERIFY(!sm::LegacyConfigImporter::import(file.fileName(), config));
        QCOMPARE(config.channels().size(), 1);
    }
};

QTEST_MAIN(TestLegacyConfig)
#include "test_legacy_config.moc"
