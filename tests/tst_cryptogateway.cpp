#include <QtTest>
#include <QFile>
#include <QLockFile>
#include <QTemporaryDir>

import keeper.services.crypto_gateway;

// Shell encryptor: "<sh> -c <script> keeper-encrypt encrypt <src> <dst>"
static QStringList shellArguments(const QString& script)
{
    return { QStringLiteral("-c"), script, QStringLiteral("keeper-encrypt") };
}

static bool writeFile(const QString& path, const QByteArray& data)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly)) return false;
    return file.write(data) == data.size();
}

static QByteArray readFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) return QByteArray();
    return file.readAll();
}

class TestCryptoGateway : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void notConfigured();
    void encryptsWithKeyFromEnvironment();
    void nonZeroExitIsFailure();
    void timeoutKillsEncryptor();
    void launchFailure();
    void heldLockIsConflict();
    void errorNames();

private:
    QTemporaryDir m_dir;
};

void TestCryptoGateway::initTestCase()
{
#ifdef Q_OS_WIN
    QSKIP("Shell based encryptor stubs need a POSIX shell");
#endif
    QVERIFY(m_dir.isValid());
    QVERIFY(writeFile(m_dir.filePath("plain.txt"), "secret data"));
}

void TestCryptoGateway::notConfigured()
{
    CryptoGateway gateway(QString(), {}, QStringLiteral("longenoughkey"), 1000, m_dir.filePath("lock"));
    QVERIFY(!gateway.isConfigured());
    const EncryptionResult result = gateway.encrypt(m_dir.filePath("plain.txt"), m_dir.filePath("out"));
    QCOMPARE(result.error, EncryptionError::NotConfigured);
}

void TestCryptoGateway::encryptsWithKeyFromEnvironment()
{
    CryptoGateway gateway(QStringLiteral("/bin/sh"),
                          shellArguments(R"([ "$1" = encrypt ] && [ "$KEEPER_ENCRYPTION_KEY" = "k3y-k3y-k3y" ] && tr 'a-z' 'A-Z' < "$2" > "$3")"),
                          QStringLiteral("k3y-k3y-k3y"), 5000, m_dir.filePath("lock"));
    const QString out = m_dir.filePath("upper.txt");
    const EncryptionResult result = gateway.encrypt(m_dir.filePath("plain.txt"), out);
    QVERIFY2(result.ok(), qPrintable(result.message));
    QVERIFY(result.elapsedMs >= 0);
    QCOMPARE(readFile(out), QByteArray("SECRET DATA"));
    QVERIFY(!QFile::exists(gateway.lockPath()));
}

void TestCryptoGateway::nonZeroExitIsFailure()
{
    CryptoGateway gateway(QStringLiteral("/bin/sh"), shellArguments("exit 3"),
                          QStringLiteral("k3y-k3y-k3y"), 5000, m_dir.filePath("lock"));
    const EncryptionResult result = gateway.encrypt(m_dir.filePath("plain.txt"), m_dir.filePath("never"));
    QCOMPARE(result.error, EncryptionError::Failed);
    QCOMPARE(result.exitCode, 3);
    QVERIFY(!QFile::exists(gateway.lockPath()));
}

void TestCryptoGateway::timeoutKillsEncryptor()
{
    CryptoGateway gateway(QStringLiteral("/bin/sh"), shellArguments("sleep 10"),
                          QStringLiteral("k3y-k3y-k3y"), 200, m_dir.filePath("lock"));
    QElapsedTimer timer;
    timer.start();
    const EncryptionResult result = gateway.encrypt(m_dir.filePath("plain.txt"), m_dir.filePath("never"));
    QCOMPARE(result.error, EncryptionError::Timeout);
    QVERIFY(timer.elapsed() < 5000);
}

void TestCryptoGateway::launchFailure()
{
    CryptoGateway gateway(m_dir.filePath("no-such-encryptor"), {},
                          QStringLiteral("k3y-k3y-k3y"), 2000, m_dir.filePath("lock"));
    const EncryptionResult result = gateway.encrypt(m_dir.filePath("plain.txt"), m_dir.filePath("never"));
    QCOMPARE(result.error, EncryptionError::LaunchFailed);
    QVERIFY(!QFile::exists(gateway.lockPath()));
}

void TestCryptoGateway::heldLockIsConflict()
{
    const QString lockPath = m_dir.filePath("held.lock");
    QLockFile other(lockPath);
    QVERIFY(other.tryLock(0));

    CryptoGateway gateway(QStringLiteral("/bin/sh"), shellArguments(R"(cp "$2" "$3")"),
                          QStringLiteral("k3y-k3y-k3y"), 5000, lockPath);
    const QString out = m_dir.filePath("conflict.txt");
    const EncryptionResult result = gateway.encrypt(m_dir.filePath("plain.txt"), out);
    QCOMPARE(result.error, EncryptionError::Conflict);
    QVERIFY(!QFile::exists(out));

    other.unlock();
    QVERIFY(gateway.encrypt(m_dir.filePath("plain.txt"), out).ok());
    QCOMPARE(readFile(out), QByteArray("secret data"));
}

void TestCryptoGateway::errorNames()
{
    QCOMPARE(encryptionErrorToString(EncryptionError::Conflict), QStringLiteral("EncryptionConflict"));
    QCOMPARE(encryptionErrorToString(EncryptionError::Timeout), QStringLiteral("Timeout"));
    QVERIFY(CryptoGateway::defaultLockPath().endsWith(QStringLiteral("keeper-crypt.lock")));
}

QTEST_GUILESS_MAIN(TestCryptoGateway)
#include "tst_cryptogateway.moc"
