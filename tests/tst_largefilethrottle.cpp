#include <QtTest>
#include <QtConcurrent/QtConcurrentRun>
#include <QFuture>
#include <QThreadPool>

import keeper.core.jobcontrol;
import keeper.core.largefilethrottle;

class TestLargeFileThrottle : public QObject {
    Q_OBJECT

private slots:
    void smallFilesBypassThrottle();
    void onlyOneLargeTransfer();
    void cancelAbortsWait();
    void controlPauseAndSleep();

private:
    QThreadPool m_pool;
};

void TestLargeFileThrottle::smallFilesBypassThrottle()
{
    LargeFileThrottle throttle;
    JobControl control;
    QVERIFY(throttle.acquire(true, control));
    QVERIFY(throttle.isHeld());
    QVERIFY(throttle.acquire(false, control));
    QVERIFY(throttle.acquire(false, control));
    throttle.release(false);
    throttle.release(false);
    throttle.release(true);
    QVERIFY(!throttle.isHeld());
}

void TestLargeFileThrottle::onlyOneLargeTransfer()
{
    LargeFileThrottle throttle;
    JobControl first;
    JobControl second;
    QVERIFY(throttle.acquire(true, first));

    QFuture<bool> waiting = QtConcurrent::run(&m_pool, [&throttle, &second]() { return throttle.acquire(true, second); });
    QTest::qWait(150);
    QVERIFY(!waiting.isFinished());

    throttle.release(true);
    QTRY_VERIFY(waiting.isFinished());
    QVERIFY(waiting.result());
    QVERIFY(throttle.isHeld());
    throttle.release(true);
}

void TestLargeFileThrottle::cancelAbortsWait()
{
    LargeFileThrottle throttle;
    JobControl holder;
    JobControl waiter;
    QVERIFY(throttle.acquire(true, holder));

    QFuture<bool> waiting = QtConcurrent::run(&m_pool, [&throttle, &waiter]() { return throttle.acquire(true, waiter); });
    QTest::qWait(100);
    waiter.cancel(JobControl::CancelReason::Shutdown);
    QTRY_VERIFY(waiting.isFinished());
    QVERIFY(!waiting.result());

    throttle.release(true);
    QVERIFY(!throttle.isHeld());
}

void TestLargeFileThrottle::controlPauseAndSleep()
{
    JobControl control;
    control.pause();
    QVERIFY(control.isPaused());

    QFuture<bool> waiting = QtConcurrent::run(&m_pool, [&control]() { return control.waitWhilePaused(); });
    QTest::qWait(100);
    QVERIFY(!waiting.isFinished());
    control.resume();
    QTRY_VERIFY(waiting.isFinished());
    QVERIFY(waiting.result());

    QElapsedTimer timer;
    timer.start();
    QVERIFY(control.sleepFor(60));
    QVERIFY(timer.elapsed() >= 50);

    control.cancel(JobControl::CancelReason::Stop);
    control.cancel(JobControl::CancelReason::Shutdown);
    QCOMPARE(control.cancelReason(), JobControl::CancelReason::Stop);
    QVERIFY(!control.sleepFor(5000));
    QVERIFY(!control.waitWhilePaused());
}

QTEST_GUILESS_MAIN(TestLargeFileThrottle)
#include "tst_largefilethrottle.moc"
