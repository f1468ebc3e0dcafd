#include <QtTest/QtTest>
#include <ssv/Supervisor/Supervisor.hpp>
#include <ssv/Event/IEventBus.hpp>

class TestSupervisor : public QObject {
    Q_OBJECT

    QTemporaryDir outputDir_;
    QTemporaryDir serviceDir_;

    ssv::SupervisorSettings settings() const
    {
        ssv::SupervisorSettings s;
        s.encoderExecutable = QString(TEST_DATA_DIR) + "/fake_encoder.sh";
        s.outputRoot = outputDir_.path();
        s.service.executable = QString(TEST_DATA_DIR) + "/fake_server.sh";
        s.service.workingDir = serviceDir_.path();
        s.service.killStrayInstances = false;
        s.stopGraceMs = 2000;
        return s;
    }

    static ssv::ChannelConfig channel(const QString& name, const QString& video,
                                      const QString& audio = "@audio1")
    {
        ssv::ChannelConfig config;
        config.channelName = name;
        config.videoDeviceId = video;
        config.audioDeviceId = audio;
        return config;
    }

private slots:
    void initTestCase()
    {
        QVERIFY(outputDir_.isValid());
        QVERIFY(serviceDir_.isValid());
    }

    void cleanup()
    {
        qunsetenv("FAKE_ENCODER_EXIT");
    }

    void testAddRejectsDuplicateSlug()
    {
        ssv::Supervisor sup(settings());
        QVERIFY(sup.addChannel(channel("Channel 1", "@v1")).ok());

        auto result = sup.addChannel(channel("channel1", "@v2"));
        QCOMPARE(result.error, ssv::SupervisorError::DuplicateChannel);
        QCOMPARE(sup.channelNames(), QStringList{"Channel 1"});
        QCOMPARE(sup.status("Channel 1"), ssv::ChannelStatus::Idle);
    }

    void testAddRejectsInvalidConfig()
    {
        ssv::Supervisor sup(settings());
        auto config = channel("", "@v1");
        QCOMPARE(sup.addChannel(config).error, ssv::SupervisorError::InvalidConfig);

        config = channel("Channel 1", "@v1");
        config.videoBitrateKbps = 0;
        QCOMPARE(sup.addChannel(config).error, ssv::SupervisorError::InvalidConfig);
        QVERIFY(sup.channelNames().isEmpty());
    }

    void testStartAndStop()
    {
        ssv::Supervisor sup(settings());
        QVERIFY(sup.addChannel(channel("Channel 1", "@v1")).ok());

        QVERIFY(sup.startChannel("Channel 1").ok());
        QCOMPARE(sup.status("Channel 1"), ssv::ChannelStatus::Running);
        QCOMPARE(sup.serviceReferences(), 1);
        QVERIFY(sup.isServiceRunning());

        const QString dir = sup.channelDirectory("Channel 1");
        QCOMPARE(dir, QDir(outputDir_.path()).filePath("channel1"));
        QVERIFY(QDir(dir).exists());

        ssv::ChannelState state;
        QTRY_VERIFY(sup.channelState("Channel 1", &state) && state.processId > 0);
        QVERIFY(state.holdsServiceReference);

        QTRY_VERIFY(sup.logTail("Channel 1").join("\n").contains("Input #0"));

        // segments the encoder would have written
        QFile segment(QDir(dir).filePath("segment_0.ts"));
        QVERIFY(segment.open(QIODevice::WriteOnly));
        segment.close();
        QFile playlist(QDir(dir).filePath("index.m3u8"));
        QVERIFY(playlist.open(QIODevice::WriteOnly));
        playlist.close();

        QVERIFY(sup.stopChannel("Channel 1").ok());
        QCOMPARE(sup.status("Channel 1"), ssv::ChannelStatus::Idle);
        QCOMPARE(sup.serviceReferences(), 0);
        QVERIFY(!sup.isServiceRunning());
        QVERIFY(QDir(dir).exists());
        QVERIFY(QDir(dir).entryList({"*.ts", "*.m3u8"}, QDir::Files).isEmpty());
    }

    void testStartIsIdempotent()
    {
        ssv::Supervisor sup(settings());
        QSignalSpy started(&sup.dependentService(), &ssv::DependentService::started);
        QVERIFY(sup.addChannel(channel("Channel 1", "@v1")).ok());

        QVERIFY(sup.startChannel("Channel 1").ok());
        QVERIFY(sup.startChannel("Channel 1").ok());
        QCOMPARE(sup.serviceReferences(), 1);
        QCOMPARE(started.count(), 1);
        sup.stopChannel("Channel 1");
    }

    void testVideoDeviceExclusive()
    {
        ssv::Supervisor sup(settings());
        QVERIFY(sup.addChannel(channel("Channel A", "@camera")).ok());
        QVERIFY(sup.addChannel(channel("Channel B", "@camera")).ok());

        QVERIFY(sup.startChannel("Channel A").ok());
        auto result = sup.startChannel("Channel B");
        QCOMPARE(result.error, ssv::SupervisorError::DeviceInUse);
        QCOMPARE(result.owner, QString("Channel A"));
        QCOMPARE(sup.status("Channel B"), ssv::ChannelStatus::Idle);
        QCOMPARE(sup.serviceReferences(), 1);

        QCOMPARE(sup.isDeviceInUse("@camera"), QString("Channel A"));
        QCOMPARE(sup.isDeviceInUse("@camera", "Channel A"), QString());
        QCOMPARE(sup.isDeviceInUse("@other"), QString());

        QVERIFY(sup.stopChannel("Channel A").ok());
        QCOMPARE(sup.isDeviceInUse("@camera"), QString());
        QVERIFY(sup.startChannel("Channel B").ok());
        QVERIFY(sup.stopChannel("Channel B").ok());
    }

    void testVideoDeviceExclusiveUnderConcurrency()
    {
        ssv::Supervisor sup(settings());
        QVERIFY(sup.addChannel(channel("Channel A", "@camera")).ok());
        QVERIFY(sup.addChannel(channel("Channel B", "@camera")).ok());

        ssv::SupervisorResult resultA;
        ssv::SupervisorResult resultB;
        QThread* threadA = QThread::create([&]() { resultA = sup.startChannel("Channel A"); });
        QThread* threadB = QThread::create([&]() { resultB = sup.startChannel("Channel B"); });
        threadA->start();
        threadB->start();
        QVERIFY(threadA->wait(10000));
        QVERIFY(threadB->wait(10000));
        delete threadA;
        delete threadB;

        QVERIFY(resultA.ok() != resultB.ok());
        const ssv::SupervisorResult& loser = resultA.ok() ? resultB : resultA;
        QCOMPARE(loser.error, ssv::SupervisorError::DeviceInUse);

        int running = 0;
        for (const QString& name : sup.channelNames()) {
            if (ssv::isActive(sup.status(name)))
                ++running;
        }
        QCOMPARE(running, 1);
        QCOMPARE(sup.serviceReferences(), 1);

        sup.shutdown();
        QCOMPARE(sup.serviceReferences(), 0);
    }

    void testAudioDeviceShared()
    {
        ssv::Supervisor sup(settings());
        QSignalSpy started(&sup.dependentService(), &ssv::DependentService::started);
        QSignalSpy stopped(&sup.dependentService(), &ssv::DependentService::stopped);
        QVERIFY(sup.addChannel(channel("Channel A", "@camera1", "@mic")).ok());
        QVERIFY(sup.addChannel(channel("Channel B", "@camera2", "@mic")).ok());

        QVERIFY(sup.startChannel("Channel A").ok());
        QVERIFY(sup.startChannel("Channel B").ok());
        QCOMPARE(sup.serviceReferences(), 2);

        QVERIFY(sup.stopChannel("Channel A").ok());
        QCOMPARE(sup.serviceReferences(), 1);
        QVERIFY(sup.isServiceRunning());
        QCOMPARE(stopped.count(), 0);

        QVERIFY(sup.stopChannel("Channel B").ok());
        QCOMPARE(sup.serviceReferences(), 0);
        QVERIFY(!sup.isServiceRunning());
        QCOMPARE(started.count(), 1);
        QCOMPARE(stopped.count(), 1);
    }

    void testStopIsIdempotent()
    {
        ssv::Supervisor sup(settings());
        QSignalSpy started(&sup.dependentService(), &ssv::DependentService::started);
        QSignalSpy stopped(&sup.dependentService(), &ssv::DependentService::stopped);
        QVERIFY(sup.addChannel(channel("Channel 1", "@v1")).ok());

        QVERIFY(sup.stopChannel("Channel 1").ok());
        QCOMPARE(sup.serviceReferences(), 0);
        QCOMPARE(started.count(), 0);

        QVERIFY(sup.startChannel("Channel 1").ok());
        QVERIFY(sup.stopChannel("Channel 1").ok());
        QVERIFY(sup.stopChannel("Channel 1").ok());
        QCOMPARE(sup.status("Channel 1"), ssv::ChannelStatus::Idle);
        QCOMPARE(sup.serviceReferences(), 0);
        QCOMPARE(stopped.count(), 1);
    }

    void testSpontaneousFailure()
    {
        qputenv("FAKE_ENCODER_EXIT", "3");
        ssv::Supervisor sup(settings());
        QVERIFY(sup.addChannel(channel("Channel 1", "@v1")).ok());

        QVERIFY(sup.startChannel("Channel 1").ok());
        QTRY_COMPARE(sup.status("Channel 1"), ssv::ChannelStatus::Failed);
        QCOMPARE(sup.lastExitCode("Channel 1"), 3);
        QCOMPARE(sup.serviceReferences(), 0);
        QCOMPARE(sup.isDeviceInUse("@v1"), QString());

        // a failed channel can be restarted
        qunsetenv("FAKE_ENCODER_EXIT");
        QVERIFY(sup.startChannel("Channel 1").ok());
        QCOMPARE(sup.status("Channel 1"), ssv::ChannelStatus::Running);
        QVERIFY(sup.stopChannel("Channel 1").ok());
    }

    void testSpontaneousCleanExit()
    {
        qputenv("FAKE_ENCODER_EXIT", "0");
        ssv::Supervisor sup(settings());
        QVERIFY(sup.addChannel(channel("Channel 1", "@v1")).ok());

        QVERIFY(sup.startChannel("Channel 1").ok());
        QTRY_COMPARE(sup.status("Channel 1"), ssv::ChannelStatus::Idle);
        QCOMPARE(sup.lastExitCode("Channel 1"), 0);
        QTRY_COMPARE(sup.serviceReferences(), 0);
    }

    void testRemoveBusyChannel()
    {
        ssv::Supervisor sup(settings());
        QVERIFY(sup.addChannel(channel("Channel 1", "@v1")).ok());
        QVERIFY(sup.startChannel("Channel 1").ok());

        QCOMPARE(sup.removeChannel("Channel 1").error, ssv::SupervisorError::ChannelBusy);
        QCOMPARE(sup.updateChannel("Channel 1", channel("Channel 1", "@v2")).error,
                 ssv::SupervisorError::ChannelBusy);
        QVERIFY(sup.hasChannel("Channel 1"));

        QVERIFY(sup.stopChannel("Channel 1").ok());
        QVERIFY(sup.removeChannel("Channel 1").ok());
        QVERIFY(!sup.hasChannel("Channel 1"));
        QVERIFY(sup.logTail("Channel 1").isEmpty());
    }

    void testRemoveFailedChannel()
    {
        qputenv("FAKE_ENCODER_EXIT", "1");
        ssv::Supervisor sup(settings());
        QVERIFY(sup.addChannel(channel("Channel 1", "@v1")).ok());
        QVERIFY(sup.startChannel("Channel 1").ok());
        QTRY_COMPARE(sup.status("Channel 1"), ssv::ChannelStatus::Failed);

        QList<ssv::ChannelStatus> seen;
        sup.events()->subscribeChannel(ssv::TOPIC_CHANNEL_STATUS, "Channel 1", [&](const QVariant& v) {
            seen << v.value<ssv::ChannelEvent>().status;
        });
        QVERIFY(sup.removeChannel("Channel 1").ok());
        QVERIFY(!sup.hasChannel("Channel 1"));
        QTRY_COMPARE(seen, QList<ssv::ChannelStatus>{ssv::ChannelStatus::Idle});
    }

    void testUpdateChannel()
    {
        ssv::Supervisor sup(settings());
        QVERIFY(sup.addChannel(channel("Channel 1", "@v1")).ok());
        QVERIFY(sup.addChannel(channel("Channel 2", "@v2")).ok());

        auto updated = channel("Lobby", "@v9");
        updated.framerate = 25;
        QVERIFY(sup.updateChannel("Channel 1", updated).ok());
        QCOMPARE(sup.channelNames(), (QStringList{"Lobby", "Channel 2"}));
        QCOMPARE(sup.snapshot().first(), updated);

        QCOMPARE(sup.updateChannel("Lobby", channel("Channel 2", "@v1")).error,
                 ssv::SupervisorError::DuplicateChannel);
        QCOMPARE(sup.updateChannel("Nope", updated).error, ssv::SupervisorError::UnknownChannel);
    }

    void testUnknownChannel()
    {
        ssv::Supervisor sup(settings());
        QCOMPARE(sup.startChannel("Nope").error, ssv::SupervisorError::UnknownChannel);
        QCOMPARE(sup.stopChannel("Nope").error, ssv::SupervisorError::UnknownChannel);
        QCOMPARE(sup.removeChannel("Nope").error, ssv::SupervisorError::UnknownChannel);
        QVERIFY(!sup.hasChannel("Nope"));
    }

    void testMissingEncoder()
    {
        auto s = settings();
        s.encoderExecutable = "/nonexistent/ffmpeg";
        ssv::Supervisor sup(s);
        QVERIFY(sup.addChannel(channel("Channel 1", "@v1")).ok());

        auto result = sup.startChannel("Channel 1");
        QCOMPARE(result.error, ssv::SupervisorError::MissingExecutable);
        QCOMPARE(sup.status("Channel 1"), ssv::ChannelStatus::Idle);
        QCOMPARE(sup.serviceReferences(), 0);
        QVERIFY(!sup.isServiceRunning());
    }

    void testMissingService()
    {
        auto s = settings();
        s.service.executable = "/nonexistent/nginx";
        ssv::Supervisor sup(s);
        QVERIFY(sup.addChannel(channel("Channel 1", "@v1")).ok());

        auto result = sup.startChannel("Channel 1");
        QCOMPARE(result.error, ssv::SupervisorError::DependentServiceUnavailable);
        QCOMPARE(sup.status("Channel 1"), ssv::ChannelStatus::Idle);
        QCOMPARE(sup.serviceReferences(), 0);
        QVERIFY(!QDir(sup.channelDirectory("Channel 1")).exists());
    }

    void testSnapshotRestore()
    {
        auto a = channel("Channel 1", "@v1", "@a1");
        a.videoDeviceLabel = "USB Video  [#1]";
        a.audioDeviceLabel = "Digital Audio  [#1]";
        auto b = channel("Back Yard", "@v2", QString());
        b.frameSize = QString();
        b.framerate = 15;
        b.videoBitrateKbps = 800;
        b.audioBitrateKbps = 64;
        b.autoStart = true;

        QList<ssv::ChannelConfig> saved;
        {
            ssv::Supervisor sup(settings());
            QVERIFY(sup.addChannel(a).ok());
            QVERIFY(sup.addChannel(b).ok());
            saved = sup.snapshot();
        }
        QCOMPARE(saved.size(), 2);

        ssv::Supervisor restored(settings());
        QCOMPARE(restored.restore(saved), 2);
        QCOMPARE(restored.snapshot(), saved);
        QCOMPARE(restored.status("Back Yard"), ssv::ChannelStatus::Idle);
        QCOMPARE(restored.serviceReferences(), 0);
    }

    void testRestoreSkipsBadEntries()
    {
        ssv::Supervisor sup(settings());
        QList<ssv::ChannelConfig> configs{
            channel("Channel 1", "@v1"),
            channel("channel 1", "@v2"),
            channel("", "@v3"),
            channel("Channel 2", "@v4"),
        };
        QCOMPARE(sup.restore(configs), 2);
        QCOMPARE(sup.channelNames(), (QStringList{"Channel 1", "Channel 2"}));
    }

    void testAutoStart()
    {
        ssv::Supervisor sup(settings());
        auto a = channel("Channel A", "@camera");
        a.autoStart = true;
        auto b = channel("Channel B", "@camera");
        b.autoStart = true;
        auto c = channel("Channel C", "@camera3");
        QVERIFY(sup.addChannel(a).ok());
        QVERIFY(sup.addChannel(b).ok());
        QVERIFY(sup.addChannel(c).ok());

        QCOMPARE(sup.startAutoStartChannels(), 1);
        QCOMPARE(sup.status("Channel A"), ssv::ChannelStatus::Running);
        QCOMPARE(sup.status("Channel B"), ssv::ChannelStatus::Idle);
        QCOMPARE(sup.status("Channel C"), ssv::ChannelStatus::Idle);

        sup.shutdown();
        QCOMPARE(sup.status("Channel A"), ssv::ChannelStatus::Idle);
        QVERIFY(!sup.isServiceRunning());
    }

    void testStatusEventsInOrder()
    {
        ssv::Supervisor sup(settings());
        QList<ssv::ChannelStatus> seen;
        sup.events()->subscribe(ssv::TOPIC_CHANNEL_STATUS, [&](const QVariant& v) {
            seen << v.value<ssv::ChannelEvent>().status;
        });
        int serviceEvents = 0;
        sup.events()->subscribe(ssv::TOPIC_SERVICE_STATUS, [&](const QVariant&) { ++serviceEvents; });

        QVERIFY(sup.addChannel(channel("Channel 1", "@v1")).ok());
        QVERIFY(sup.startChannel("Channel 1").ok());
        QVERIFY(sup.stopChannel("Channel 1").ok());

        const QList<ssv::ChannelStatus> expected{
            ssv::ChannelStatus::Starting, ssv::ChannelStatus::Running,
            ssv::ChannelStatus::Stopping, ssv::ChannelStatus::Idle};
        QTRY_COMPARE(seen, expected);
        QTRY_COMPARE(serviceEvents, 2);
    }

    void testKillsEncoderIgnoringQuit()
    {
        auto s = settings();
        s.encoderExecutable = QString(TEST_DATA_DIR) + "/stubborn_encoder.sh";
        s.stopGraceMs = 300;
        ssv::Supervisor sup(s);
        QVERIFY(sup.addChannel(channel("Channel 1", "@v1")).ok());

        QVERIFY(sup.startChannel("Channel 1").ok());
        QTRY_VERIFY(sup.logTail("Channel 1").join("\n").contains("stubborn encoder up"));
        QVERIFY(sup.stopChannel("Channel 1").ok());
        QCOMPARE(sup.status("Channel 1"), ssv::ChannelStatus::Idle);
        QCOMPARE(sup.serviceReferences(), 0);
    }

    void testQueriesAnswerWhileStopping()
    {
        auto s = settings();
        s.encoderExecutable = QString(TEST_DATA_DIR) + "/stubborn_encoder.sh";
        s.stopGraceMs = 1500;
        ssv::Supervisor sup(s);
        QVERIFY(sup.addChannel(channel("Channel 1", "@v1")).ok());
        QVERIFY(sup.addChannel(channel("Channel 2", "@v1")).ok());

        QVERIFY(sup.startChannel("Channel 1").ok());
        QTRY_VERIFY(sup.logTail("Channel 1").join("\n").contains("stubborn encoder up"));

        ssv::SupervisorResult stopResult;
        QThread* stopper = QThread::create([&]() { stopResult = sup.stopChannel("Channel 1"); });
        stopper->start();

        QTRY_COMPARE(sup.status("Channel 1"), ssv::ChannelStatus::Stopping);

        QElapsedTimer timer;
        timer.start();
        QCOMPARE(sup.channelNames().size(), 2);
        QCOMPARE(sup.startChannel("Channel 1").error, ssv::SupervisorError::ChannelBusy);
        QCOMPARE(sup.removeChannel("Channel 1").error, ssv::SupervisorError::ChannelBusy);
        QVERIFY(sup.isDeviceInUse("@v1").isEmpty());
        QVERIFY(timer.elapsed() < 500);
        QCOMPARE(sup.status("Channel 1"), ssv::ChannelStatus::Stopping);

        QVERIFY(stopper->wait(10000));
        delete stopper;
        QVERIFY(stopResult.ok());
        QCOMPARE(sup.status("Channel 1"), ssv::ChannelStatus::Idle);
        QCOMPARE(sup.serviceReferences(), 0);

        // a second stop of a settled channel is a no-op
        QVERIFY(sup.stopChannel("Channel 1").ok());
        QCOMPARE(sup.status("Channel 1"), ssv::ChannelStatus::Idle);
    }

    void testLogTailBounded()
    {
        ssv::Supervisor sup(settings());
        QVERIFY(sup.addChannel(channel("Channel 1", "@v1")).ok());
        for (int i = 0; i < ssv::LOG_TAIL_LINES + 20; ++i)
            sup.stopChannel("Channel 1");
        const QStringList tail = sup.logTail("Channel 1");
        QCOMPARE(tail.size(), ssv::LOG_TAIL_LINES);
        QVERIFY(tail.last().contains("not running"));
    }
};

QTEST_MAIN(TestSupervisor)
#include "test_supervisor.moc"
