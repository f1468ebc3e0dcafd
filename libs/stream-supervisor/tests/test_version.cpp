#include <QtTest/QtTest>
#include <ssv/Version.hpp>

class TestVersion : public QObject {
    Q_OBJECT
private slots:
    void testVersion() {
        QCOMPARE(ssv::VERSION_MAJOR, 0);
        QCOMPARE(ssv::VERSION_MINOR, 3);
    }
    void testHlsConstants() {
        QCOMPARE(ssv::SEGMENT_DURATION_SEC, 2);
        QCOMPARE(ssv::PLAYLIST_WINDOW_SEGMENTS, 6);
        QCOMPARE(ssv::AUDIO_SAMPLE_RATE_HZ, 44100);
    }
    void testProcessConstants() {
        QCOMPARE(ssv::STOP_GRACE_MS, 5000);
        QCOMPARE(ssv::LAUNCH_FAILURE_EXIT_CODE, -1);
        QCOMPARE(ssv::DEVICE_QUERY_TIMEOUT_MS, 10000);
        QCOMPARE(ssv::SERVICE_STOP_TIMEOUT_MS, 2000);
        QCOMPARE(ssv::LOG_TAIL_LINES, 200);
    }
};

QTEST_MAIN(TestVersion)
#include "test_version.moc"
