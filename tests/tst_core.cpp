#include "core/Config.h"
#include "core/Errors.h"
#include "core/Log.h"
#include "TestSupport.h"

#include <QTemporaryDir>
#include <QtTest>
#include <sys/stat.h>

using namespace reminders;

class TestCore : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanup();

    void userMessageHidesInternalDetail();
    void userMessageAlwaysShowsActionableErrors();
    void postureFromEnvironment_data();
    void postureFromEnvironment();
    void readsAndClampsConfig();
    void missingConfigUsesDefaults();
    void productionPicksUpPinnedDigest();
    void logFileIsPrivate();

private:
    QString writeConfig(const QByteArray &content);

    QTemporaryDir m_home;
};

void TestCore::initTestCase() {
    QVERIFY(m_home.isValid());
    testsupport::redirectHome(m_home.path());
    qputenv("REMINDERS_ENV", "test");
    const QString shared = m_home.path() + QStringLiteral("/.local/state");
    QVERIFY(QDir().mkpath(shared));
    QCOMPARE(::chmod(QFile::encodeName(shared).constData(), 0755), 0);
}

void TestCore::cleanup() {
    qputenv("REMINDERS_ENV", "test");
    qunsetenv("REMINDERS_HELPER_SHA256");
}

QString TestCore::writeConfig(const QByteArray &content) {
    const QString path = m_home.path() + QStringLiteral("/config");
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) return QString();
    f.write(content);
    return path;
}

void TestCore::userMessageHidesInternalDetail() {
    BridgeError err;
    setError(&err, ErrorKind::ProcessExecution, QStringLiteral("PROCESS_FAILED"), QStringLiteral("osascript exited with code 1"));

    QCOMPARE(userMessage(QStringLiteral("create reminder"), err, Posture::Production),
             QStringLiteral("Failed to create reminder: System error occurred"));
    QCOMPARE(userMessage(QStringLiteral("create reminder"), err, Posture::Development),
             QStringLiteral("Failed to create reminder: [PROCESS_FAILED] osascript exited with code 1"));

    setError(&err, ErrorKind::Timeout, QString(), QStringLiteral("osascript timed out after 30000 ms"));
    QCOMPARE(userMessage(QStringLiteral("read reminders"), err, Posture::Development),
             QStringLiteral("Failed to read reminders: osascript timed out after 30000 ms"));
}

void TestCore::userMessageAlwaysShowsActionableErrors() {
    BridgeError err;
    setError(&err, ErrorKind::NotFound, QStringLiteral("NOT_FOUND"), QStringLiteral("List not found: Groceries"));
    QCOMPARE(userMessage(QStringLiteral("delete reminder list"), err, Posture::Production),
             QStringLiteral("Failed to delete reminder list: List not found: Groceries"));

    setError(&err, ErrorKind::InvalidInput, QStringLiteral("INVALID_DATE"), QStringLiteral("bad date"));
    QCOMPARE(userMessage(QStringLiteral("create reminder"), err, Posture::Production),
             QStringLiteral("Failed to create reminder: bad date"));

    setError(nullptr, ErrorKind::NotFound, QString(), QString());
    QVERIFY(!BridgeError().isSet());
}

void TestCore::postureFromEnvironment_data() {
    QTest::addColumn<QByteArray>("value");
    QTest::addColumn<int>("posture");

    QTest::newRow("test") << QByteArray("test") << int(Posture::Test);
    QTest::newRow("development") << QByteArray("Development") << int(Posture::Development);
    QTest::newRow("production") << QByteArray("production") << int(Posture::Production);
    QTest::newRow("unknown") << QByteArray("staging") << int(Posture::Production);
    QTest::newRow("empty") << QByteArray() << int(Posture::Production);
}

void TestCore::postureFromEnvironment() {
    QFETCH(QByteArray, value);
    QFETCH(int, posture);
    qputenv("REMINDERS_ENV", value);
    QCOMPARE(int(reminders::postureFromEnvironment()), posture);
}

void TestCore::readsAndClampsConfig() {
    const QString path = writeConfig(
        "# comment\n"
        "AUTOMATION_TIMEOUT_MS=500\n"
        "HELPER_TIMEOUT_MS=999999\n"
        "HELPER_SEARCH_START=/opt/reminders/bin/../bin\n"
        "AUTOMATION_EXECUTABLE=/usr/local/bin/osascript\n"
        "CLOCK_READER_EXECUTABLE=/opt/tools/defaults\n"
        "lowercase=ignored\n"
        "UNKNOWN_KEY=1\n"
        "DATA=" + QByteArray(5000, 'x') + "\n");
    QVERIFY(!path.isEmpty());

    const BridgeConfig cfg = readBridgeConfig(path);
    QCOMPARE(cfg.posture, Posture::Test);
    QCOMPARE(cfg.automationTimeoutMs, 1000);
    QCOMPARE(cfg.helperTimeoutMs, 120000);
    QCOMPARE(cfg.helperSearchStart, QStringLiteral("/opt/reminders/bin"));
    QCOMPARE(cfg.automationExecutable, QStringLiteral("/usr/local/bin/osascript"));
    QCOMPARE(cfg.clockReaderExecutable, QStringLiteral("/opt/tools/defaults"));
    QCOMPARE(cfg.dataAccessProbeTimeoutMs, 10000);
    QCOMPARE(cfg.automationProbeTimeoutMs, 5000);
}

void TestCore::missingConfigUsesDefaults() {
    const BridgeConfig cfg = readBridgeConfig(m_home.path() + QStringLiteral("/does-not-exist"));
    QCOMPARE(cfg.automationExecutable, QStringLiteral("/usr/bin/osascript"));
    QCOMPARE(cfg.clockReaderExecutable, QStringLiteral("/usr/bin/defaults"));
    QCOMPARE(cfg.automationTimeoutMs, 30000);
    QCOMPARE(cfg.helperTimeoutMs, 30000);
    QVERIFY(!cfg.helperSearchStart.isEmpty());
    QVERIFY(cfg.expectedHelperSha256.isEmpty());
}

void TestCore::productionPicksUpPinnedDigest() {
    qputenv("REMINDERS_ENV", "production");
    qputenv("REMINDERS_HELPER_SHA256", " ABCDEF ");
    const BridgeConfig cfg = readBridgeConfig(m_home.path() + QStringLiteral("/does-not-exist"));
    QCOMPARE(cfg.posture, Posture::Production);
    QCOMPARE(cfg.expectedHelperSha256, QStringLiteral("abcdef"));

    qputenv("REMINDERS_ENV", "development");
    QVERIFY(readBridgeConfig(m_home.path() + QStringLiteral("/does-not-exist")).expectedHelperSha256.isEmpty());
}

void TestCore::logFileIsPrivate() {
    logEvent(QStringLiteral("core_test: hello"));
    logWarning(QStringLiteral("core_test: careful"));

    QCOMPARE(logFilePath(), m_home.path() + QStringLiteral("/.local/state/reminders-bridge/reminders-bridge.log"));
    const QString content = QString::fromUtf8(testsupport::readAll(logFilePath()));
    QVERIFY(content.contains(QStringLiteral(" core_test: hello\n")));
    QVERIFY(content.contains(QStringLiteral(" warn: core_test: careful\n")));

    struct stat st{};
    QCOMPARE(::stat(QFile::encodeName(stateDirPath()).constData(), &st), 0);
    QCOMPARE(int(st.st_mode & 0777), 0700);
    QCOMPARE(::stat(QFile::encodeName(logFilePath()).constData(), &st), 0);
    QCOMPARE(int(st.st_mode & 0777), 0600);

    // The shared XDG state directory keeps its own mode.
    QCOMPARE(::stat(QFile::encodeName(m_home.path() + QStringLiteral("/.local/state")).constData(), &st), 0);
    QCOMPARE(int(st.st_mode & 0777), 0755);
}

QTEST_GUILESS_MAIN(TestCore)
#include "tst_core.moc"
