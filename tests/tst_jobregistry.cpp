#include <QtTest>
#include <QSignalSpy>

import keeper.core.jobtypes;
import keeper.core.eventbus;
import keeper.core.jobregistry;

class RecordingSink : public LogSink {
public:
    void write(const LogEvent& event) override { events.append(event); }
    QList<LogEvent> events;
};

class TestJobRegistry : public QObject {
    Q_OBJECT

private slots:
    void transitionTable_data();
    void transitionTable();
    void terminalStates();
    void typeNames();
    void addRejectsInvalidDefinitions();
    void addPublishesCreatedEvent();
    void updateAndRemove();
    void busyJobsCannotBeEdited();
    void transitionsUpdateState();
    void invalidTransitionIsReported();
    void businessPauseMarker();
    void progressKeepsStatus();
};

void TestJobRegistry::transitionTable_data()
{
    QTest::addColumn<JobStatus>("from");
    QTest::addColumn<JobStatus>("to");
    QTest::addColumn<bool>("allowed");

    QTest::newRow("ready->active") << JobStatus::Ready << JobStatus::Active << true;
    QTest::newRow("ready->paused") << JobStatus::Ready << JobStatus::Paused << false;
    QTest::newRow("ready->completed") << JobStatus::Ready << JobStatus::Completed << false;
    QTest::newRow("active->paused") << JobStatus::Active << JobStatus::Paused << true;
    QTest::newRow("active->stopped") << JobStatus::Active << JobStatus::Stopped << true;
    QTest::newRow("active->completed") << JobStatus::Active << JobStatus::Completed << true;
    QTest::newRow("active->error") << JobStatus::Active << JobStatus::Error << true;
    QTest::newRow("active->ready") << JobStatus::Active << JobStatus::Ready << false;
    QTest::newRow("paused->active") << JobStatus::Paused << JobStatus::Active << true;
    QTest::newRow("paused->stopped") << JobStatus::Paused << JobStatus::Stopped << true;
    QTest::newRow("paused->completed") << JobStatus::Paused << JobStatus::Completed << false;
    QTest::newRow("completed->active") << JobStatus::Completed << JobStatus::Active << false;
    QTest::newRow("completed->ready") << JobStatus::Completed << JobStatus::Ready << true;
    QTest::newRow("stopped->paused") << JobStatus::Stopped << JobStatus::Paused << false;
    QTest::newRow("error->ready") << JobStatus::Error << JobStatus::Ready << true;
}

void TestJobRegistry::transitionTable()
{
    QFETCH(JobStatus, from);
    QFETCH(JobStatus, to);
    QFETCH(bool, allowed);
    QCOMPARE(isValidTransition(from, to), allowed);
}

void TestJobRegistry::terminalStates()
{
    QVERIFY(!isTerminal(JobStatus::Ready));
    QVERIFY(!isTerminal(JobStatus::Active));
    QVERIFY(!isTerminal(JobStatus::Paused));
    QVERIFY(isTerminal(JobStatus::Stopped));
    QVERIFY(isTerminal(JobStatus::Cancelled));
    QVERIFY(isTerminal(JobStatus::Completed));
    QVERIFY(isTerminal(JobStatus::Error));
}

void TestJobRegistry::typeNames()
{
    QCOMPARE(backupTypeToString(BackupType::Full), QStringLiteral("Full"));
    QCOMPARE(backupTypeToString(BackupType::Differential), QStringLiteral("Differential"));
    QCOMPARE(backupTypeFromString(QStringLiteral("differential")), std::optional<BackupType>(BackupType::Differential));
    QVERIFY(!backupTypeFromString(QStringLiteral("Incremental")).has_value());
    QCOMPARE(jobStatusToString(JobStatus::Paused), QStringLiteral("Paused"));
}

void TestJobRegistry::addRejectsInvalidDefinitions()
{
    JobRegistry registry;
    QCOMPARE(registry.addJob(BackupJob{ "", "/a", "/b", BackupType::Full }).error, ControlError::InvalidJob);
    QCOMPARE(registry.addJob(BackupJob{ "j", "", "/b", BackupType::Full }).error, ControlError::InvalidJob);
    QCOMPARE(registry.addJob(BackupJob{ "j", "/a", "/a", BackupType::Full }).error, ControlError::InvalidJob);
    QVERIFY(registry.addJob(BackupJob{ "j", "/a", "/b", BackupType::Full }).ok());
    QCOMPARE(registry.addJob(BackupJob{ "j", "/c", "/d", BackupType::Full }).error, ControlError::DuplicateJob);
    QCOMPARE(registry.count(), 1);
}

void TestJobRegistry::addPublishesCreatedEvent()
{
    EventBus bus;
    RecordingSink sink;
    bus.addSink(&sink);
    QSignalSpy stateSpy(&bus, &EventBus::jobStateChanged);

    JobRegistry registry(&bus);
    QVERIFY(registry.addJob(BackupJob{ "docs", "/src", "/dst", BackupType::Differential }).ok());

    QCOMPARE(sink.events.size(), 1);
    QCOMPARE(sink.events.first().actionType, ActionType::JobCreated);
    QCOMPARE(sink.events.first().backupName, QStringLiteral("docs"));
    QCOMPARE(sink.events.first().backupType, BackupType::Differential);
    QVERIFY(sink.events.first().timestamp.isValid());
    QCOMPARE(stateSpy.count(), 1);

    const auto state = registry.state("docs");
    QVERIFY(state.has_value());
    QCOMPARE(state->status, JobStatus::Ready);
    QCOMPARE(state->progressPercentage, 0);
    bus.removeSink(&sink);
}

void TestJobRegistry::updateAndRemove()
{
    EventBus bus;
    RecordingSink sink;
    bus.addSink(&sink);
    JobRegistry registry(&bus);
    QVERIFY(registry.addJob(BackupJob{ "a", "/s1", "/t1", BackupType::Full }).ok());
    QVERIFY(registry.addJob(BackupJob{ "b", "/s2", "/t2", BackupType::Full }).ok());

    QVERIFY(registry.updateJob("a", BackupJob{ "renamed", "/s1", "/t9", BackupType::Differential }).ok());
    QCOMPARE(registry.names(), QStringList({ "renamed", "b" }));
    QCOMPARE(registry.job("renamed")->targetPath, QStringLiteral("/t9"));
    QCOMPARE(registry.updateJob("renamed", BackupJob{ "b", "/s1", "/t9", BackupType::Full }).error,
             ControlError::DuplicateJob);
    QCOMPARE(registry.updateJob("missing", BackupJob{ "x", "/s", "/t", BackupType::Full }).error,
             ControlError::UnknownJob);

    QVERIFY(registry.removeJob("b").ok());
    QCOMPARE(registry.removeJob("b").error, ControlError::UnknownJob);
    QCOMPARE(registry.names(), QStringList({ "renamed" }));

    QCOMPARE(sink.events.last().actionType, ActionType::JobDeleted);
    QCOMPARE(sink.events.at(2).actionType, ActionType::JobEdited);
    bus.removeSink(&sink);
}

void TestJobRegistry::busyJobsCannotBeEdited()
{
    JobRegistry registry;
    QVERIFY(registry.addJob(BackupJob{ "a", "/s", "/t", BackupType::Full }).ok());
    QVERIFY(registry.transition("a", JobStatus::Active).ok());
    QCOMPARE(registry.removeJob("a").error, ControlError::JobBusy);
    QCOMPARE(registry.updateJob("a", BackupJob{ "a", "/s", "/u", BackupType::Full }).error, ControlError::JobBusy);
    QVERIFY(registry.transition("a", JobStatus::Paused).ok());
    QCOMPARE(registry.removeJob("a").error, ControlError::JobBusy);
    QVERIFY(registry.transition("a", JobStatus::Stopped).ok());
    QVERIFY(registry.removeJob("a").ok());
}

void TestJobRegistry::transitionsUpdateState()
{
    JobRegistry registry;
    QVERIFY(registry.addJob(BackupJob{ "a", "/s", "/t", BackupType::Full }).ok());
    QVERIFY(registry.transition("a", JobStatus::Active).ok());
    QVERIFY(registry.updateProgress("a", [](JobState& s) {
        s.progressPercentage = 40;
        s.currentFile = "x.txt";
    }));
    QVERIFY(registry.transition("a", JobStatus::Completed).ok());
    QCOMPARE(registry.state("a")->progressPercentage, 100);
    QVERIFY(registry.state("a")->currentFile.isEmpty());

    QVERIFY(registry.transition("a", JobStatus::Ready).ok());
    QCOMPARE(registry.state("a")->progressPercentage, 0);
    QVERIFY(registry.transition("a", JobStatus::Active).ok());
    QVERIFY(registry.transition("a", JobStatus::Error, "disk full").ok());
    QCOMPARE(registry.state("a")->status, JobStatus::Error);
    QCOMPARE(registry.state("a")->errorMessage, QStringLiteral("disk full"));
}

void TestJobRegistry::invalidTransitionIsReported()
{
    JobRegistry registry;
    QVERIFY(registry.addJob(BackupJob{ "a", "/s", "/t", BackupType::Full }).ok());
    const ControlResult r = registry.transition("a", JobStatus::Paused);
    QCOMPARE(r.error, ControlError::InvalidTransition);
    QVERIFY(!r.message.isEmpty());
    QCOMPARE(registry.state("a")->status, JobStatus::Ready);
    QCOMPARE(registry.transition("nope", JobStatus::Active).error, ControlError::UnknownJob);
}

void TestJobRegistry::businessPauseMarker()
{
    JobRegistry registry;
    QVERIFY(registry.addJob(BackupJob{ "a", "/s", "/t", BackupType::Full }).ok());
    QVERIFY(!registry.pauseForBusinessSoftware("a"));
    QVERIFY(registry.transition("a", JobStatus::Active).ok());
    QVERIFY(registry.pauseForBusinessSoftware("a"));
    QCOMPARE(registry.state("a")->status, JobStatus::Paused);
    QVERIFY(registry.state("a")->pausedByBusinessSoftware);

    QVERIFY(registry.clearBusinessSoftwareMarker("a"));
    QVERIFY(!registry.resumeFromBusinessSoftware("a"));
    QCOMPARE(registry.state("a")->status, JobStatus::Paused);

    QVERIFY(registry.transition("a", JobStatus::Active).ok());
    QVERIFY(registry.pauseForBusinessSoftware("a"));
    QVERIFY(registry.resumeFromBusinessSoftware("a"));
    QCOMPARE(registry.state("a")->status, JobStatus::Active);
    QVERIFY(!registry.state("a")->pausedByBusinessSoftware);
}

void TestJobRegistry::progressKeepsStatus()
{
    JobRegistry registry;
    QVERIFY(registry.addJob(BackupJob{ "a", "/s", "/t", BackupType::Full }).ok());
    QVERIFY(registry.transition("a", JobStatus::Active).ok());
    QVERIFY(registry.updateProgress("a", [](JobState& s) {
        s.status = JobStatus::Completed;
        s.progressPercentage = 250;
    }));
    QCOMPARE(registry.state("a")->status, JobStatus::Active);
    QCOMPARE(registry.state("a")->progressPercentage, 100);
    QVERIFY(!registry.updateProgress("missing", [](JobState&) {}));
}

QTEST_GUILESS_MAIN(TestJobRegistry)
#include "tst_jobregistry.moc"
