#include <QtTest/QtTest>
#include <ssv/Device/DeviceCatalog.hpp>

class TestDeviceCatalog : public QObject {
    Q_OBJECT

    static QString readFixture(const QString& name)
    {
        QFile file(QString(TEST_DATA_DIR) + "/" + name);
        if (!file.open(QIODevice::ReadOnly))
            return {};
        return QString::fromUtf8(file.readAll());
    }

private slots:
    void testSectionedListing()
    {
        auto list = ssv::DeviceCatalog::parseListing(readFixture("dshow_listing.txt"));

        QCOMPARE(list.video.size(), 2);
        QCOMPARE(list.audio.size(), 2);
        QCOMPARE(list.video[0].name, QString("USB Video"));
        QVERIFY(list.video[0].altId.startsWith("@device_pnp_"));
        QVERIFY(list.video[0].altId.contains("vid_534d"));
        QCOMPARE(list.video[1].name, QString("HD Webcam"));
        QVERIFY(list.video[1].altId.contains("vid_0c45"));
        QCOMPARE(list.audio[0].name, QString("Digital Audio Interface (USB Digital Audio)"));
        QVERIFY(list.audio[1].altId.endsWith("000000000002}"));
    }

    void testTaggedListing()
    {
        auto list = ssv::DeviceCatalog::parseListing(readFixture("dshow_tagged_listing.txt"));

        QCOMPARE(list.video.size(), 2);
        QCOMPARE(list.audio.size(), 1);
        QCOMPARE(list.video[0].altId, QString("@device_pnp_usbvideo"));
        // no alternative name line, so the name doubles as the id
        QCOMPARE(list.video[1].name, QString("Capture Card"));
        QCOMPARE(list.video[1].altId, QString("Capture Card"));
        QCOMPARE(list.audio[0].altId, QString("@device_cm_wave1"));
    }

    void testMalformedInput()
    {
        auto list = ssv::DeviceCatalog::parseListing(
            "garbage\n"
            "  Alternative name \"orphan\"\n"
            "\"no section\"\n"
            "DirectShow video devices\n"
            " \"unterminated\n"
            " \"Cam\"\n");
        QCOMPARE(list.video.size(), 1);
        QCOMPARE(list.video[0].name, QString("Cam"));
        QVERIFY(list.audio.isEmpty());
    }

    void testAlternativeNameMustFollowDevice()
    {
        auto list = ssv::DeviceCatalog::parseListing(
            "DirectShow video devices\n"
            " \"Cam A\"\n"
            " Alternative name \"@cam_a\"\n"
            " \"Cam B\"\n"
            " warning: device busy\n"
            " Alternative name \"@stray\"\n"
            "DirectShow audio devices\n"
            " Alternative name \"@after_header\"\n"
            " \"Mic\"\n");
        QCOMPARE(list.video.size(), 2);
        QCOMPARE(list.video[0].altId, QString("@cam_a"));
        QCOMPARE(list.video[1].altId, QString("Cam B"));
        QCOMPARE(list.audio.size(), 1);
        QCOMPARE(list.audio[0].altId, QString("Mic"));
    }

    void testEmptyInput()
    {
        auto list = ssv::DeviceCatalog::parseListing(QString());
        QVERIFY(list.video.isEmpty());
        QVERIFY(list.audio.isEmpty());
    }

    void testDisplayLabel()
    {
        ssv::Device device{"USB Video", "@device_pnp_x"};
        QCOMPARE(device.displayLabel(1), QString("USB Video  [#1]"));
    }

    void testDeviceEqualityUsesAltId()
    {
        ssv::Device a{"Camera", "@id1"};
        ssv::Device b{"Renamed camera", "@id1"};
        ssv::Device c{"Camera", "@id2"};
        QVERIFY(a == b);
        QVERIFY(a != c);
    }

    void testListFromBackend()
    {
        auto list = ssv::DeviceCatalog::listDevices(QString(TEST_DATA_DIR) + "/fake_lister.sh");
        QCOMPARE(list.video.size(), 2);
        QCOMPARE(list.audio.size(), 2);
        QVERIFY(list.diagnostics.contains("DirectShow video devices"));
    }

    void testMissingExecutable()
    {
        auto list = ssv::DeviceCatalog::listDevices("/nonexistent/ffmpeg");
        QVERIFY(list.video.isEmpty());
        QVERIFY(list.audio.isEmpty());
        QVERIFY(!list.diagnostics.isEmpty());
    }

    void testTimeout()
    {
        auto list = ssv::DeviceCatalog::listDevices(
            QString(TEST_DATA_DIR) + "/stubborn_encoder.sh", "dshow", 300);
        QVERIFY(list.video.isEmpty());
        QVERIFY(list.diagnostics.contains("timed out"));
    }
};

QTEST_MAIN(TestDeviceCatalog)
#include "test_device_catalog.moc"
