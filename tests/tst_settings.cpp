#include <QtTest>
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QRegularExpression>
#include <QTemporaryDir>

#include <limits>

import keeper.core.jobtypes;
import keeper.core.eventbus;
import keeper.core.settings;
import keeper.core.jobregistry;
import keeper.core.snapshotstore;
import keeper.services.log_sink;
import keeper.services.state_writer;
import keeper.utils.path_utils;

namespace utils = keeper::utils;

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

class TestSettings : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();

    void defaultsWhenFileMissing();
    void loadsAndNormalizes();
    void rejectsInvalidJson();
    void hugeNumbersAreBounded();
    void shortKeyDisablesEncryption();
    void jobListRoundTrip();
    void invalidJobEntriesAreSkipped();
    void extensionHelpers();
    void replaceFileKeepsTargetOnFailure();
    void snapshotNamesDoNotCollide();
    void snapshotStore();
    void stateWriterWritesEveryJob();
    void stateWriterDebouncesChanges();
    void journalLineFormat();

private:
    QTemporaryDir m_dir;
};

void TestSettings::initTestCase()
{
    QVERIFY(m_dir.isValid());
    qunsetenv("KEEPER_STATE_DIR");
}

void TestSettings::defaultsWhenFileMissing()
{
    Settings settings;
    QString error;
    QVERIFY(loadSettings(m_dir.filePath("missing.json"), settings, &error));
    QCOMPARE(settings.remotePort, quint16(12345));
    QCOMPARE(settings.chunkSize, qint64(65536));
    QCOMPARE(settings.largeFileThresholdKb, qint64(0));
    QCOMPARE(settings.largeFileThresholdBytes(), qint64(0));
    QCOMPARE(settings.maxConcurrentJobs, 0);
    QCOMPARE(settings.encryptorTimeoutMs, 60000);
    QVERIFY(!settings.encryptionEnabled());
    QVERIFY(!settings.stateDirectory.isEmpty());
}

void TestSettings::loadsAndNormalizes()
{
    QJsonObject root;
    root.insert("priorityExtensions", QJsonArray{ "DOCX", ".pdf", "docx", "" });
    root.insert("encryptionExtensions", QJsonArray{ "txt" });
    root.insert("encryptionKey", "0123456789");
    root.insert("encryptorProgram", "/usr/bin/cryptosoft");
    root.insert("encryptorArguments", QJsonArray{ "--quiet" });
    root.insert("businessSoftware", QJsonArray{ "C:\\Windows\\System32\\calc.exe", "Calc", "excel.EXE" });
    root.insert("largeFileThresholdKb", 1000);
    root.insert("maxConcurrentJobs", 3);
    root.insert("remotePort", 23456);
    root.insert("transferRateLimit", 1000000);
    root.insert("stateDirectory", m_dir.filePath("state"));
    const QString path = m_dir.filePath("settings.json");
    QVERIFY(writeFile(path, QJsonDocument(root).toJson()));

    Settings settings;
    QString error;
    QVERIFY2(loadSettings(path, settings, &error), qPrintable(error));
    QCOMPARE(settings.priorityExtensions, QStringList({ ".docx", ".pdf" }));
    QCOMPARE(settings.encryptionExtensions, QStringList({ ".txt" }));
    QCOMPARE(settings.businessSoftware, QStringList({ "calc", "excel" }));
    QCOMPARE(settings.largeFileThresholdBytes(), qint64(1000 * 1000));
    QCOMPARE(settings.maxConcurrentJobs, 3);
    QCOMPARE(settings.remotePort, quint16(23456));
    QCOMPARE(settings.transferRateLimit, qint64(1000000));
    QCOMPARE(settings.stateDirectory, m_dir.filePath("state"));
    QVERIFY(settings.encryptionEnabled());

    const Settings again = Settings::fromJson(settings.toJson());
    QCOMPARE(again.priorityExtensions, settings.priorityExtensions);
    QCOMPARE(again.remotePort, settings.remotePort);
}

void TestSettings::hugeNumbersAreBounded()
{
    QJsonObject root;
    root.insert("largeFileThresholdKb", 1e300);
    root.insert("networkLoadThresholdBytesPerSec", 1e300);
    root.insert("chunkSize", 1e300);
    root.insert("transferRateLimit", -1e300);
    Settings settings = Settings::fromJson(root);
    QCOMPARE(settings.largeFileThresholdKb, Settings::kMaxThresholdKb);
    QCOMPARE(settings.largeFileThresholdBytes(), Settings::kMaxByteCount);
    QCOMPARE(settings.networkLoadThresholdBytesPerSec, Settings::kMaxByteCount);
    QCOMPARE(settings.chunkSize, qint64(64 * 1024 * 1024));
    QCOMPARE(settings.transferRateLimit, qint64(0));

    root.insert("largeFileThresholdKb", -1e300);
    root.insert("chunkSize", -1e300);
    root.insert("transferRateLimit", 1e300);
    settings = Settings::fromJson(root);
    QCOMPARE(settings.largeFileThresholdKb, qint64(0));
    QCOMPARE(settings.largeFileThresholdBytes(), qint64(0));
    QCOMPARE(settings.chunkSize, qint64(512));
    QCOMPARE(settings.transferRateLimit, Settings::kMaxByteCount);

    Settings direct;
    direct.largeFileThresholdKb = std::numeric_limits<qint64>::max();
    QCOMPARE(direct.largeFileThresholdBytes(), Settings::kMaxByteCount);

    // Snapshot fingerprints out of range never match a real file
    SnapshotStore store(m_dir.filePath("hugestate"));
    QVERIFY(store.save("big", FileManifest{}));
    QJsonObject entry;
    entry.insert("size", 1e300);
    entry.insert("modified", -1e300);
    QJsonObject files;
    files.insert("a.bin", entry);
    QJsonObject manifest;
    manifest.insert("job", "big");
    manifest.insert("files", files);
    QVERIFY(writeFile(store.pathFor("big"), QJsonDocument(manifest).toJson()));
    const FileManifest loaded = store.load("big");
    QCOMPARE(loaded.size(), 1);
    QCOMPARE(loaded.value("a.bin").size, qint64(-1));
    QCOMPARE(loaded.value("a.bin").modifiedMs, qint64(-1));
}

void TestSettings::rejectsInvalidJson()
{
    const QString path = m_dir.filePath("broken.json");
    QVERIFY(writeFile(path, "{ not json"));
    Settings settings;
    QString error;
    QVERIFY(!loadSettings(path, settings, &error));
    QVERIFY(!error.isEmpty());

    QVERIFY(writeFile(path, "[1, 2]"));
    QVERIFY(!loadSettings(path, settings, &error));
}

void TestSettings::shortKeyDisablesEncryption()
{
    QJsonObject root;
    root.insert("encryptionExtensions", QJsonArray{ ".txt" });
    root.insert("encryptionKey", "short");
    root.insert("encryptorProgram", "/usr/bin/cryptosoft");
    const Settings settings = Settings::fromJson(root);
    QVERIFY(settings.encryptionKey.size() < Settings::kMinimumKeyLength);
    QVERIFY(!settings.encryptionEnabled());
}

void TestSettings::jobListRoundTrip()
{
    const QString path = m_dir.filePath("jobs/jobs.json");
    const QList<BackupJob> jobs = {
        BackupJob{ "Daily", "/home/me/docs", "/mnt/backup/docs", BackupType::Full },
        BackupJob{ "Photos", "/home/me/photos", "/mnt/backup/photos", BackupType::Differential },
    };
    QString error;
    QVERIFY2(saveJobs(path, jobs, &error), qPrintable(error));

    QList<BackupJob> loaded;
    QVERIFY(loadJobs(path, loaded, &error));
    QCOMPARE(loaded.size(), 2);
    QCOMPARE(loaded[1].name, QStringLiteral("Photos"));
    QCOMPARE(loaded[1].type, BackupType::Differential);
    QCOMPARE(loaded[0].targetPath, QStringLiteral("/mnt/backup/docs"));

    QVERIFY(loadJobs(m_dir.filePath("absent.json"), loaded, &error));
    QVERIFY(loaded.isEmpty());
}

void TestSettings::invalidJobEntriesAreSkipped()
{
    const QString path = m_dir.filePath("mixed.json");
    QVERIFY(writeFile(path, R"([
        {"name": "ok", "sourcePath": "/a", "targetPath": "/b", "type": "differential"},
        {"name": "", "sourcePath": "/a", "targetPath": "/b"},
        {"name": "weird", "sourcePath": "/a", "targetPath": "/b", "type": "Incremental"},
        42
    ])"));
    QList<BackupJob> loaded;
    QString error;
    QVERIFY(loadJobs(path, loaded, &error));
    QCOMPARE(loaded.size(), 1);
    QCOMPARE(loaded[0].type, BackupType::Differential);

    QVERIFY(writeFile(path, R"({"name": "not a list"})"));
    QVERIFY(!loadJobs(path, loaded, &error));
}

void TestSettings::extensionHelpers()
{
    QCOMPARE(utils::normalizeExtension(" .PDF "), QStringLiteral(".pdf"));
    QCOMPARE(utils::extensionOf("/a/b/Report.Final.DOCX"), QStringLiteral(".docx"));
    QCOMPARE(utils::extensionOf("/a/b/Makefile"), QString());
    QVERIFY(utils::hasExtension("x/y.pdf", { ".pdf" }));
    QVERIFY(!utils::hasExtension("x/y.pdf", {}));
    QVERIFY(utils::isSamePath("/tmp/a/../b", "/tmp/b"));
    QCOMPARE(utils::formatFileSize(512), QStringLiteral("512 B"));
    QCOMPARE(utils::formatFileSize(1536), QStringLiteral("1.50 KB"));
}

void TestSettings::replaceFileKeepsTargetOnFailure()
{
    const QString target = m_dir.filePath("replace/report.txt");
    QVERIFY(QDir().mkpath(m_dir.filePath("replace")));
    QVERIFY(writeFile(target, "previous"));

    QString error;
    QVERIFY(!utils::replaceFile(m_dir.filePath("replace/missing.txt"), target, &error));
    QVERIFY(!error.isEmpty());
    QCOMPARE(readFile(target), QByteArray("previous"));
    QVERIFY(!QFile::exists(target + ".keeper-old"));

    const QString finished = m_dir.filePath("replace/report.txt.part");
    QVERIFY(writeFile(finished, "current"));
    QVERIFY(utils::replaceFile(finished, target, &error));
    QCOMPARE(readFile(target), QByteArray("current"));
    QVERIFY(!QFile::exists(finished));
    QVERIFY(!QFile::exists(target + ".keeper-old"));

    const QString fresh = m_dir.filePath("replace/fresh.txt");
    QVERIFY(writeFile(finished, "first"));
    QVERIFY(utils::replaceFile(finished, fresh));
    QCOMPARE(readFile(fresh), QByteArray("first"));
}

void TestSettings::snapshotNamesDoNotCollide()
{
    SnapshotStore store(m_dir.filePath("collide"));
    QVERIFY(store.pathFor("Daily:Docs") != store.pathFor("Daily_Docs"));
    QVERIFY(store.pathFor("Daily") != store.pathFor("daily"));

    FileManifest first;
    first.insert("a.txt", FileFingerprint{ 1, 1000 });
    FileManifest second;
    second.insert("b.txt", FileFingerprint{ 2, 2000 });
    QVERIFY(store.save("Daily:Docs", first));
    QVERIFY(store.save("Daily_Docs", second));
    QCOMPARE(store.load("Daily:Docs").keys(), QStringList({ "a.txt" }));
    QCOMPARE(store.load("Daily_Docs").keys(), QStringList({ "b.txt" }));

    QVERIFY(store.rename("Daily:Docs", "Archive"));
    QVERIFY(store.load("Daily:Docs").isEmpty());
    QCOMPARE(store.load("Archive").keys(), QStringList({ "a.txt" }));
    QVERIFY(!QFile::exists(store.pathFor("Daily:Docs")));

    // A manifest moved under another name by hand is not trusted
    QVERIFY(QFile::copy(store.pathFor("Daily_Docs"), store.pathFor("Intruder")));
    QVERIFY(store.load("Intruder").isEmpty());
}

void TestSettings::snapshotStore()
{
    SnapshotStore store(m_dir.filePath("snapstate"));
    QVERIFY(store.load("job/1").isEmpty());

    FileManifest manifest;
    manifest.insert("a.txt", FileFingerprint{ 10, 1700000000000 });
    manifest.insert("sub/b.txt", FileFingerprint{ 0, 1700000000500 });
    QString error;
    QVERIFY2(store.save("job/1", manifest, &error), qPrintable(error));
    QVERIFY(store.pathFor("job/1").startsWith(m_dir.filePath("snapstate/snapshots/")));
    QVERIFY(store.pathFor("job/1").endsWith(".json"));

    const FileManifest loaded = store.load("job/1");
    QCOMPARE(loaded.size(), 2);
    QVERIFY(loaded.value("sub/b.txt") == (FileFingerprint{ 0, 1700000000500 }));

    QVERIFY(store.remove("job/1"));
    QVERIFY(store.load("job/1").isEmpty());
}

void TestSettings::stateWriterWritesEveryJob()
{
    EventBus bus;
    JobRegistry registry(&bus);
    QVERIFY(registry.addJob(BackupJob{ "a", "/src/a", "/dst/a", BackupType::Full }).ok());
    QVERIFY(registry.addJob(BackupJob{ "b", "/src/b", "/dst/b", BackupType::Differential }).ok());
    QVERIFY(registry.transition("b", JobStatus::Active).ok());
    QVERIFY(registry.updateProgress("b", [](JobState& s) {
        s.filesTotal = 4;
        s.filesDone = 1;
        s.totalBytes = 400;
        s.bytesCopied = 100;
        s.progressPercentage = 25;
        s.currentFile = "x.bin";
    }));

    const QString path = m_dir.filePath("out/state.json");
    StateWriter writer(&registry, &bus, path);
    QCOMPARE(writer.path(), path);
    QVERIFY(writer.save());

    QFile file(path);
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QJsonArray jobs = QJsonDocument::fromJson(file.readAll()).object().value("jobs").toArray();
    QCOMPARE(jobs.size(), 2);
    const QJsonObject b = jobs[1].toObject();
    QCOMPARE(b.value("name").toString(), QStringLiteral("b"));
    QCOMPARE(b.value("status").toString(), QStringLiteral("Active"));
    QCOMPARE(b.value("type").toString(), QStringLiteral("Differential"));
    QCOMPARE(b.value("progress").toInt(), 25);
    QCOMPARE(b.value("filesRemaining").toInt(), 3);
    QCOMPARE(b.value("bytesRemaining").toInt(), 300);
    QCOMPARE(b.value("currentFile").toString(), QStringLiteral("x.bin"));
}

void TestSettings::stateWriterDebouncesChanges()
{
    EventBus bus;
    JobRegistry registry(&bus);
    const QString path = m_dir.filePath("debounced/state.json");
    StateWriter writer(&registry, &bus, path);
    writer.setDelay(50);

    QVERIFY(registry.addJob(BackupJob{ "a", "/src/a", "/dst/a", BackupType::Full }).ok());
    QVERIFY(!QFile::exists(path));
    QTRY_VERIFY(QFile::exists(path));

    QVERIFY(registry.transition("a", JobStatus::Active).ok());
    QTRY_VERIFY_WITH_TIMEOUT([&path]() {
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly)) return false;
        const QJsonArray jobs = QJsonDocument::fromJson(file.readAll()).object().value("jobs").toArray();
        return jobs.size() == 1 && jobs[0].toObject().value("status").toString() == QLatin1String("Active");
    }(), 2000);
}

void TestSettings::journalLineFormat()
{
    LogEvent event;
    event.timestamp = QDateTime(QDate(2026, 10, 18), QTime(9, 30));
    event.backupName = "Daily";
    event.backupType = BackupType::Differential;
    event.sourcePath = "/src/report.docx";
    event.targetPath = "/dst/report.docx";
    event.fileSize = 2048;
    event.transferTimeMs = 12;
    event.encryptionTimeMs = -1;
    event.message = "File copied";
    event.actionType = ActionType::FileCopy;

    const QString line = CategoryLogSink::formatLine(event);
    QVERIFY(line.contains("FILE_COPY"));
    QVERIFY(line.contains("[Daily/Differential]"));
    QVERIFY(line.contains("/src/report.docx -> /dst/report.docx"));
    QVERIFY(line.contains("2.00 KB"));
    QVERIFY(line.contains("transfer=12ms"));
    QVERIFY(line.contains("encryption=-1ms"));
    QVERIFY(line.endsWith("File copied"));

    CategoryLogSink sink;
    EventBus bus;
    bus.addSink(&sink);
    QTest::ignoreMessage(QtCriticalMsg, QRegularExpression("BACKUP_ERROR"));
    LogEvent failure;
    failure.backupName = "Daily";
    failure.logType = LogType::Error;
    failure.actionType = ActionType::BackupError;
    failure.message = "Source directory not found";
    bus.publish(failure);
    bus.removeSink(&sink);

    QCOMPARE(logTypeToString(LogType::Warning), QStringLiteral("WARNING"));
    QCOMPARE(actionTypeToString(ActionType::BusinessSoftwareDetected), QStringLiteral("BUSINESS_SOFTWARE_DETECTED"));
}

QTEST_GUILESS_MAIN(TestSettings)
#include "tst_settings.moc"
