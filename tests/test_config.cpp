#include <QtTest/QtTest>

#include "utils/TestUtils.hpp"
#include "../src/core/common/Config.hpp"

using namespace Enclave;
using namespace Enclave::Test;

class TestConfig : public QObject {
    Q_OBJECT

private slots:
    void testMemoryLimitParsing_data() {
        QTest::addColumn<QString>("text");
        QTest::addColumn<qint64>("bytes");

        QTest::newRow("megabytes") << "512m" << qint64(512) * 1024 * 1024;
        QTest::newRow("gigabytes upper") << "1G" << qint64(1024) * 1024 * 1024;
        QTest::newRow("kilobytes") << "2048k" << qint64(2048) * 1024;
        QTest::newRow("bytes suffix") << "4096b" << qint64(4096);
        QTest::newRow("plain") << "1048576" << qint64(1048576);
        QTest::newRow("padded") << " 64m " << qint64(64) * 1024 * 1024;
        QTest::newRow("empty") << "" << qint64(-1);
        QTest::newRow("unknown suffix") << "5t" << qint64(-1);
        QTest::newRow("zero") << "0m" << qint64(-1);
        QTest::newRow("negative") << "-1m" << qint64(-1);
        QTest::newRow("garbage") << "lots" << qint64(-1);
        QTest::newRow("overflowing gigabytes") << "99999999999g" << qint64(-1);
        QTest::newRow("overflowing plain") << "99999999999999999999" << qint64(-1);
        QTest::newRow("largest gigabytes") << "8589934591g" << qint64(8589934591LL) * 1024 * 1024 * 1024;
    }

    void testMemoryLimitParsing() {
        QFETCH(QString, text);
        QFETCH(qint64, bytes);
        QCOMPARE(parseMemoryLimit(text), bytes);
    }

    void testDefaultsWithoutStore() {
        const Config::SandboxSettings sandbox;
        QCOMPARE(sandbox.baseDirectory, QString("/tmp/sandboxes"));
        QCOMPARE(sandbox.mountPath, QString("/sandbox"));
        QCOMPARE(sandbox.memoryLimit, QString("512m"));
        QCOMPARE(sandbox.cpuQuota, qint64(100000));
        QCOMPARE(sandbox.timeoutSeconds, 30);
        QVERIFY(!sandbox.enableNetwork);

        const Config::PolicySettings policy;
        QVERIFY(!policy.allowRelativeImports);
        QVERIFY(policy.detectDynamicImports);
    }

    void testIniRoundTrip() {
        TEST_SCOPE("config_ini");
        const QString iniPath = _testScope.getTempDirectory() + "/enclave.ini";
        TestUtils::createTestTextFile(_testScope.getTempDirectory(),
                                      "[sandbox]\n"
                                      "memoryLimit=1g\n"
                                      "timeoutSeconds=5\n"
                                      "enableNetwork=true\n"
                                      "imageName=custom-image\n"
                                      "[policy]\n"
                                      "allowRelativeImports=true\n",
                                      "enclave.ini");

        Config& config = Config::instance();
        config.initializeFromFile(iniPath);
        QVERIFY(config.isInitialized());

        Config::SandboxSettings sandbox = config.getSandboxSettings();
        QCOMPARE(sandbox.memoryLimit, QString("1g"));
        QCOMPARE(sandbox.timeoutSeconds, 5);
        QVERIFY(sandbox.enableNetwork);
        QCOMPARE(sandbox.imageName, QString("custom-image"));
        QCOMPARE(sandbox.imageTag, QString("latest"));
        QCOMPARE(sandbox.baseDirectory, QString("/tmp/sandboxes"));

        Config::PolicySettings policy = config.getPolicySettings();
        QVERIFY(policy.allowRelativeImports);
        QVERIFY(policy.detectDynamicImports);

        sandbox.cpuQuota = 50000;
        config.setSandboxSettings(sandbox);
        config.sync();

        QSettings reread(iniPath, QSettings::IniFormat);
        QCOMPARE(reread.value("sandbox/cpuQuota").toLongLong(), qint64(50000));
    }
};

int runTestConfig(int argc, char** argv) {
    TestConfig test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_config.moc"
