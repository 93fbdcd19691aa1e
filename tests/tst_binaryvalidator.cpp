#include "helper/BinaryValidator.h"
#include "helper/HelperLocator.h"
#include "TestSupport.h"

#include <QCryptographicHash>
#include <QSemaphore>
#include <QTemporaryDir>
#include <QThreadPool>
#include <QtConcurrent/QtConcurrent>
#include <QtTest>

using namespace reminders;

class TestBinaryValidator : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void init();

    void acceptsHelperUnderAllowedPrefix();
    void rejectsTraversalFirst();
    void rejectsRelativePathWhenAbsoluteRequired();
    void rejectsNonExecutable();
    void rejectsForbiddenPath();
    void rejectsMissingFile();
    void rejectsDirectory();
    void rejectsOversizedFile();
    void rejectsSymlinkedHelper();
    void hashesAndComparesDigest();
    void reportsDigestMismatch();
    void postureDefaults();

    void findsProjectRootFromNestedStart();
    void ignoresMarkerWithWrongSchema();
    void locatorPrefersDistThenSrc();
    void locatorFallsBackToDefaultPath();
    void locatorComputesOnceUnderConcurrentAccess();
    void verifiedPathRefusesFallbackWithWrongDigest();
    void invocationTimeChecks();

private:
    QString helperAt(const QString &subdir) const;

    QTemporaryDir m_home;
    QScopedPointer<QTemporaryDir> m_root;
};

void TestBinaryValidator::initTestCase() {
    QVERIFY(m_home.isValid());
    testsupport::redirectHome(m_home.path());
}

void TestBinaryValidator::init() {
    m_root.reset(new QTemporaryDir());
    QVERIFY(m_root->isValid());
    QVERIFY(testsupport::writeMarker(m_root->path()));
}

QString TestBinaryValidator::helperAt(const QString &subdir) const {
    return m_root->path() + QLatin1Char('/') + subdir + QStringLiteral("/GetReminders");
}

void TestBinaryValidator::acceptsHelperUnderAllowedPrefix() {
    const QString helper = helperAt(QStringLiteral("dist/swift/bin"));
    QVERIFY(testsupport::writeScript(helper, "exit 0\n"));
    const BinarySecurityConfig cfg = binarySecurityConfigFor(Posture::Development).anchoredTo(m_root->path());

    BinaryValidationError err;
    QVERIFY2(validateBinaryPath(helper, cfg, &err), qPrintable(err.message));
    const BinaryValidationResult result = validateBinarySecurity(helper, cfg);
    QVERIFY(result.isValid);
    QCOMPARE(result.sha256.size(), 64);
    QVERIFY(result.errors.isEmpty());
}

void TestBinaryValidator::rejectsTraversalFirst() {
    const QString helper = helperAt(QStringLiteral("dist/swift/bin"));
    QVERIFY(testsupport::writeScript(helper, "exit 0\n"));
    const BinarySecurityConfig cfg = binarySecurityConfigFor(Posture::Development).anchoredTo(m_root->path());

    // Resolves to the valid helper once normalized, but the raw segment is refused.
    const QString sneaky = m_root->path() + QStringLiteral("/dist/swift/bin/../bin/GetReminders");
    BinaryValidationError err;
    QVERIFY(!validateBinaryPath(sneaky, cfg, &err));
    QCOMPARE(err.code, QStringLiteral("PATH_TRAVERSAL"));

    QVERIFY(!validateBinaryPath(QStringLiteral("/nowhere/../etc/passwd"), cfg, &err));
    QCOMPARE(err.code, QStringLiteral("PATH_TRAVERSAL"));
}

void TestBinaryValidator::rejectsRelativePathWhenAbsoluteRequired() {
    const BinarySecurityConfig cfg = binarySecurityConfigFor(Posture::Production).anchoredTo(m_root->path());
    BinaryValidationError err;
    QVERIFY(!validateBinaryPath(QStringLiteral("dist/swift/bin/GetReminders"), cfg, &err));
    QCOMPARE(err.code, QStringLiteral("INVALID_PATH"));
}

void TestBinaryValidator::rejectsNonExecutable() {
    const QString helper = helperAt(QStringLiteral("src/swift/bin"));
    QVERIFY(testsupport::writeScript(helper, "exit 0\n", false));
    const BinarySecurityConfig cfg = binarySecurityConfigFor(Posture::Development).anchoredTo(m_root->path());

    BinaryValidationError err;
    QVERIFY(!validateBinaryPath(helper, cfg, &err));
    QCOMPARE(err.code, QStringLiteral("NOT_EXECUTABLE"));
}

void TestBinaryValidator::rejectsForbiddenPath() {
    const QString helper = helperAt(QStringLiteral("other/bin"));
    QVERIFY(testsupport::writeScript(helper, "exit 0\n"));
    const BinarySecurityConfig cfg = binarySecurityConfigFor(Posture::Development).anchoredTo(m_root->path());

    BinaryValidationError err;
    QVERIFY(!validateBinaryPath(helper, cfg, &err));
    QCOMPARE(err.code, QStringLiteral("FORBIDDEN_PATH"));
}

void TestBinaryValidator::rejectsMissingFile() {
    const BinarySecurityConfig cfg = binarySecurityConfigFor(Posture::Development).anchoredTo(m_root->path());
    BinaryValidationError err;
    QVERIFY(!validateBinaryPath(helperAt(QStringLiteral("dist/swift/bin")), cfg, &err));
    QCOMPARE(err.code, QStringLiteral("FILE_NOT_FOUND"));
}

void TestBinaryValidator::rejectsDirectory() {
    const QString helper = helperAt(QStringLiteral("swift/bin"));
    QVERIFY(QDir().mkpath(helper));
    const BinarySecurityConfig cfg = binarySecurityConfigFor(Posture::Development).anchoredTo(m_root->path());
    BinaryValidationError err;
    QVERIFY(!validateBinaryPath(helper, cfg, &err));
    QCOMPARE(err.code, QStringLiteral("NOT_A_FILE"));
}

void TestBinaryValidator::rejectsOversizedFile() {
    const QString helper = helperAt(QStringLiteral("dist/swift/bin"));
    QVERIFY(testsupport::writeScript(helper, "echo this helper is larger than the limit\n"));
    BinarySecurityConfig cfg = binarySecurityConfigFor(Posture::Development).anchoredTo(m_root->path());
    cfg.maxFileSize = 8;
    BinaryValidationError err;
    QVERIFY(!validateBinaryPath(helper, cfg, &err));
    QCOMPARE(err.code, QStringLiteral("FILE_TOO_LARGE"));
}

void TestBinaryValidator::rejectsSymlinkedHelper() {
    const QString real = m_root->path() + QStringLiteral("/elsewhere/GetReminders");
    QVERIFY(testsupport::writeScript(real, "exit 0\n"));
    const QString link = helperAt(QStringLiteral("dist/swift/bin"));
    QVERIFY(QDir().mkpath(QFileInfo(link).absolutePath()));
    QVERIFY(QFile::link(real, link));
    const BinarySecurityConfig cfg = binarySecurityConfigFor(Posture::Development).anchoredTo(m_root->path());

    BinaryValidationError err;
    QVERIFY(!validateBinaryPath(link, cfg, &err));
    QCOMPARE(err.code, QStringLiteral("SYMLINK_NOT_ALLOWED"));

    QString digest;
    QVERIFY(!calculateBinaryHash(link, &digest, &err));
    QCOMPARE(err.code, QStringLiteral("HASH_CALCULATION_FAILED"));

    HelperLocator locator(m_root->path(), Posture::Development);
    QVERIFY(!locator.resolvedSecurely());
    BridgeError bridgeErr;
    QVERIFY(!locator.verifiedPath(nullptr, &bridgeErr));
    QCOMPARE(bridgeErr.kind, ErrorKind::BinaryValidation);
    QCOMPARE(bridgeErr.code, QStringLiteral("SECURITY_VALIDATION_FAILED"));
    QVERIFY(bridgeErr.message.contains(QStringLiteral("SYMLINK_NOT_ALLOWED")));
}

void TestBinaryValidator::hashesAndComparesDigest() {
    const QString helper = helperAt(QStringLiteral("dist/swift/bin"));
    QVERIFY(testsupport::writeScript(helper, "exit 0\n"));
    const QString expected = QString::fromLatin1(
        QCryptographicHash::hash(testsupport::readAll(helper), QCryptographicHash::Sha256).toHex());

    QString actual;
    BinaryValidationError err;
    QVERIFY(calculateBinaryHash(helper, &actual, &err));
    QCOMPARE(actual, expected);
    QVERIFY(validateBinaryIntegrity(helper, expected.toUpper()));
    QVERIFY(!validateBinaryIntegrity(helper, QString(64, QLatin1Char('0'))));

    QVERIFY(!calculateBinaryHash(helper + QStringLiteral(".missing"), &actual, &err));
    QCOMPARE(err.code, QStringLiteral("HASH_CALCULATION_FAILED"));
}

void TestBinaryValidator::reportsDigestMismatch() {
    const QString helper = helperAt(QStringLiteral("dist/swift/bin"));
    QVERIFY(testsupport::writeScript(helper, "exit 0\n"));
    const BinarySecurityConfig cfg =
        binarySecurityConfigFor(Posture::Production, QString(64, QLatin1Char('a'))).anchoredTo(m_root->path());

    const BinaryValidationResult result = validateBinarySecurity(helper, cfg);
    QVERIFY(!result.isValid);
    QCOMPARE(result.errors.size(), 1);
    QVERIFY(result.errors.first().startsWith(QStringLiteral("HASH_MISMATCH")));
}

void TestBinaryValidator::postureDefaults() {
    const BinarySecurityConfig test = binarySecurityConfigFor(Posture::Test, QStringLiteral("abc"));
    QVERIFY(!test.requireAbsolutePath);
    QCOMPARE(test.maxFileSize, 100LL * 1024 * 1024);
    QVERIFY(test.expectedSha256.isEmpty());

    const BinarySecurityConfig prod = binarySecurityConfigFor(Posture::Production, QStringLiteral(" ABC "));
    QVERIFY(prod.requireAbsolutePath);
    QCOMPARE(prod.maxFileSize, 50LL * 1024 * 1024);
    QCOMPARE(prod.expectedSha256, QStringLiteral("abc"));

    const BinarySecurityConfig anchored = prod.anchoredTo(QStringLiteral("/opt/app/"));
    QCOMPARE(anchored.allowedPrefixes.first(), QStringLiteral("/opt/app/dist/swift/bin/"));
}

void TestBinaryValidator::findsProjectRootFromNestedStart() {
    const QString nested = m_root->path() + QStringLiteral("/a/b/c");
    QVERIFY(QDir().mkpath(nested));
    bool found = false;
    QCOMPARE(findProjectRoot(nested, 10, &found), QDir::cleanPath(m_root->path()));
    QVERIFY(found);

    QTemporaryDir lonely;
    QVERIFY(lonely.isValid());
    QCOMPARE(findProjectRoot(lonely.path(), 10, &found), QDir::cleanPath(lonely.path()));
    QVERIFY(!found);
}

void TestBinaryValidator::ignoresMarkerWithWrongSchema() {
    QTemporaryDir other;
    QVERIFY(other.isValid());
    QVERIFY(testsupport::writeMarker(other.path(), 2));
    QVERIFY(!isProjectRoot(other.path()));
    QVERIFY(testsupport::writeMarker(other.path(), 1, QStringLiteral("something-else")));
    QVERIFY(!isProjectRoot(other.path()));
    QVERIFY(testsupport::writeMarker(other.path(), 1));
    QVERIFY(isProjectRoot(other.path()));
}

void TestBinaryValidator::locatorPrefersDistThenSrc() {
    const QString src = helperAt(QStringLiteral("src/swift/bin"));
    QVERIFY(testsupport::writeScript(src, "exit 0\n"));
    const QString start = m_root->path() + QStringLiteral("/build/bin");
    QVERIFY(QDir().mkpath(start));

    HelperLocator locator(start, Posture::Development);
    QCOMPARE(locator.resolve(), QDir::cleanPath(src));
    QVERIFY(locator.resolvedSecurely());

    const QString dist = helperAt(QStringLiteral("dist/swift/bin"));
    QVERIFY(testsupport::writeScript(dist, "exit 0\n"));
    QCOMPARE(locator.resolve(), QDir::cleanPath(src));
    locator.resetForTesting();
    QCOMPARE(locator.resolve(), QDir::cleanPath(dist));
}

void TestBinaryValidator::locatorFallsBackToDefaultPath() {
    HelperLocator locator(m_root->path(), Posture::Production);
    QCOMPARE(locator.resolve(), QDir::cleanPath(helperAt(QStringLiteral("dist/swift/bin"))));
    QVERIFY(!locator.resolvedSecurely());

    QString path;
    BridgeError err;
    QVERIFY(!locator.verifiedPath(&path, &err));
    QCOMPARE(err.code, QStringLiteral("BINARY_NOT_FOUND"));
    QVERIFY(path.isEmpty());
}

void TestBinaryValidator::locatorComputesOnceUnderConcurrentAccess() {
    const QString dist = helperAt(QStringLiteral("dist/swift/bin"));
    QVERIFY(testsupport::writeScript(dist, "exit 0\n"));
    HelperLocator locator(m_root->path(), Posture::Development);

    const int callers = 16;
    QThreadPool pool;
    pool.setMaxThreadCount(callers);
    QSemaphore gate;
    QVector<QFuture<QString>> results;
    for (int i = 0; i < callers; ++i) {
        results << QtConcurrent::run(&pool, [&locator, &gate]() {
            gate.acquire();
            return locator.resolve();
        });
    }
    gate.release(callers);
    for (QFuture<QString> &f : results) {
        QCOMPARE(f.result(), QDir::cleanPath(dist));
    }
    QCOMPARE(locator.computeCountForTesting(), 1);
    QVERIFY(locator.resolvedSecurely());
    QCOMPARE(locator.computeCountForTesting(), 1);
}

void TestBinaryValidator::verifiedPathRefusesFallbackWithWrongDigest() {
    const QString dist = helperAt(QStringLiteral("dist/swift/bin"));
    QVERIFY(testsupport::writeScript(dist, "exit 0\n"));
    HelperLocator locator(m_root->path(), Posture::Production, QString(64, QLatin1Char('a')));
    QCOMPARE(locator.resolve(), QDir::cleanPath(dist));
    QVERIFY(!locator.resolvedSecurely());

    BridgeError err;
    QVERIFY(!locator.verifiedPath(nullptr, &err));
    QCOMPARE(err.kind, ErrorKind::BinaryValidation);
    QCOMPARE(err.code, QStringLiteral("SECURITY_VALIDATION_FAILED"));
    QVERIFY(err.message.contains(QStringLiteral("HASH_MISMATCH")));

    const QString digest = QString::fromLatin1(
        QCryptographicHash::hash(testsupport::readAll(dist), QCryptographicHash::Sha256).toHex());
    HelperLocator pinned(m_root->path(), Posture::Production, digest);
    QString path;
    QVERIFY2(pinned.verifiedPath(&path, &err), qPrintable(err.message));
    QCOMPARE(path, QDir::cleanPath(dist));
}

void TestBinaryValidator::invocationTimeChecks() {
    QString code;
    QString message;
    const QString helper = helperAt(QStringLiteral("dist/swift/bin"));
    QVERIFY(!checkHelperRunnable(helper, &code, &message));
    QCOMPARE(code, QStringLiteral("BINARY_NOT_FOUND"));
    QVERIFY(message.contains(helper));
    QVERIFY(message.contains(QStringLiteral("src/swift/bin/")));
    QVERIFY(!message.contains(QStringLiteral("build.sh")));

    QVERIFY(testsupport::writeScript(helper, "exit 0\n", false));
    QVERIFY(!checkHelperRunnable(helper, &code, &message));
    QCOMPARE(code, QStringLiteral("BINARY_NOT_EXECUTABLE"));

    QVERIFY(testsupport::writeScript(helper, "exit 0\n"));
    QVERIFY(checkHelperRunnable(helper, &code, &message));
}

QTEST_GUILESS_MAIN(TestBinaryValidator)
#include "tst_binaryvalidator.moc"
