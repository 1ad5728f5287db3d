#include <QtTest>
#include <QtConcurrent/QtConcurrentRun>
#include <QFuture>
#include <QThreadPool>

import keeper.core.jobcontrol;
import keeper.core.prioritygate;

class TestPriorityGate : public QObject {
    Q_OBJECT

private slots:
    void normalAdmittedWhenIdle();
    void normalWaitsForPendingPriorityFiles();
    void normalWaitsForActivePriorityTransfer();
    void priorityWaitsForInFlightNormalTransfer();
    void priorityTransfersMayOverlap();
    void suspendedJobsDoNotBlock();
    void retractReleasesWaiters();
    void cancelAbortsWait();
    void tryAcquireTakesNothingWhenBlocked();
    void waitUntilAdmissibleHoldsNoPermit();

private:
    QThreadPool m_pool;
};

void TestPriorityGate::normalAdmittedWhenIdle()
{
    PriorityGate gate;
    JobControl control;
    QVERIFY(gate.acquire(false, control));
    QVERIFY(gate.acquire(false, control));
    QCOMPARE(gate.activeNormalCount(), 2);
    gate.release(false);
    gate.release(false);
    QCOMPARE(gate.activeNormalCount(), 0);
}

void TestPriorityGate::normalWaitsForPendingPriorityFiles()
{
    PriorityGate gate;
    JobControl control;
    gate.registerPending("a", 2);
    QCOMPARE(gate.pendingCount(), 2);

    QFuture<bool> normal = QtConcurrent::run(&m_pool, [&gate, &control]() { return gate.acquire(false, control); });
    QTest::qWait(150);
    QVERIFY(!normal.isFinished());

    gate.completeOne("a");
    QTest::qWait(100);
    QVERIFY(!normal.isFinished());

    gate.completeOne("a");
    QTRY_VERIFY(normal.isFinished());
    QVERIFY(normal.result());
    QCOMPARE(gate.pendingCount(), 0);
    gate.release(false);
}

void TestPriorityGate::normalWaitsForActivePriorityTransfer()
{
    PriorityGate gate;
    JobControl control;
    QVERIFY(gate.acquire(true, control));

    QFuture<bool> normal = QtConcurrent::run(&m_pool, [&gate, &control]() { return gate.acquire(false, control); });
    QTest::qWait(150);
    QVERIFY(!normal.isFinished());

    gate.release(true);
    QTRY_VERIFY(normal.isFinished());
    QVERIFY(normal.result());
    gate.release(false);
}

void TestPriorityGate::priorityWaitsForInFlightNormalTransfer()
{
    PriorityGate gate;
    JobControl control;
    QVERIFY(gate.acquire(false, control));
    gate.registerPending("b", 1);

    QFuture<bool> priority = QtConcurrent::run(&m_pool, [&gate, &control]() { return gate.acquire(true, control); });
    QTest::qWait(150);
    QVERIFY(!priority.isFinished());

    gate.release(false);
    QTRY_VERIFY(priority.isFinished());
    QVERIFY(priority.result());
    QCOMPARE(gate.activePriorityCount(), 1);
    gate.release(true);
    gate.completeOne("b");
}

void TestPriorityGate::priorityTransfersMayOverlap()
{
    PriorityGate gate;
    JobControl first;
    JobControl second;
    gate.registerPending("a", 1);
    gate.registerPending("b", 1);
    QVERIFY(gate.acquire(true, first));
    QVERIFY(gate.acquire(true, second));
    QCOMPARE(gate.activePriorityCount(), 2);
    gate.release(true);
    gate.release(true);
}

void TestPriorityGate::suspendedJobsDoNotBlock()
{
    PriorityGate gate;
    JobControl control;
    gate.registerPending("paused", 3);
    gate.setSuspended("paused", true);
    QCOMPARE(gate.pendingCount(), 0);
    QVERIFY(gate.acquire(false, control));
    gate.release(false);

    gate.setSuspended("paused", false);
    QCOMPARE(gate.pendingCount(), 3);
}

void TestPriorityGate::retractReleasesWaiters()
{
    PriorityGate gate;
    JobControl control;
    gate.registerPending("a", 5);

    QFuture<bool> normal = QtConcurrent::run(&m_pool, [&gate, &control]() { return gate.acquire(false, control); });
    QTest::qWait(100);
    QVERIFY(!normal.isFinished());

    gate.retract("a");
    QTRY_VERIFY(normal.isFinished());
    QVERIFY(normal.result());
    gate.release(false);
}

void TestPriorityGate::cancelAbortsWait()
{
    PriorityGate gate;
    JobControl control;
    gate.registerPending("a", 1);

    QFuture<bool> normal = QtConcurrent::run(&m_pool, [&gate, &control]() { return gate.acquire(false, control); });
    QTest::qWait(100);
    control.cancel(JobControl::CancelReason::Stop);
    QTRY_VERIFY(normal.isFinished());
    QVERIFY(!normal.result());
    QCOMPARE(gate.activeNormalCount(), 0);
    gate.retract("a");
}

void TestPriorityGate::tryAcquireTakesNothingWhenBlocked()
{
    PriorityGate gate;
    gate.registerPending("a", 1);
    QVERIFY(!gate.tryAcquire(false));
    QCOMPARE(gate.activeNormalCount(), 0);

    QVERIFY(gate.tryAcquire(true));
    QCOMPARE(gate.activePriorityCount(), 1);
    QVERIFY(!gate.tryAcquire(false));

    gate.release(true);
    gate.completeOne("a");
    QVERIFY(gate.tryAcquire(false));
    QVERIFY(!gate.tryAcquire(true));
    gate.release(false);
}

void TestPriorityGate::waitUntilAdmissibleHoldsNoPermit()
{
    PriorityGate gate;
    JobControl control;
    gate.registerPending("b", 1);

    QFuture<bool> waiter = QtConcurrent::run(&m_pool, [&gate, &control]() { return gate.waitUntilAdmissible(false, control); });
    QTest::qWait(150);
    QVERIFY(!waiter.isFinished());
    QCOMPARE(gate.activeNormalCount(), 0);

    // The priority transfer is not held up by the waiting normal request
    QVERIFY(gate.tryAcquire(true));
    gate.release(true);
    gate.completeOne("b");
    QTRY_VERIFY(waiter.isFinished());
    QVERIFY(waiter.result());
    QCOMPARE(gate.activeNormalCount(), 0);

    JobControl paused;
    gate.registerPending("c", 1);
    QFuture<bool> pausedWaiter = QtConcurrent::run(&m_pool, [&gate, &paused]() { return gate.waitUntilAdmissible(false, paused); });
    QTest::qWait(100);
    QVERIFY(!pausedWaiter.isFinished());
    paused.pause();
    QTRY_VERIFY(pausedWaiter.isFinished());

    JobControl cancelled;
    QFuture<bool> cancelledWaiter = QtConcurrent::run(&m_pool, [&gate, &cancelled]() { return gate.waitUntilAdmissible(false, cancelled); });
    QTest::qWait(100);
    cancelled.cancel(JobControl::CancelReason::Stop);
    QTRY_VERIFY(cancelledWaiter.isFinished());
    QVERIFY(!cancelledWaiter.result());
}

QTEST_GUILESS_MAIN(TestPriorityGate)
#include "tst_prioritygate.moc"
