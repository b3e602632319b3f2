#include <QtTest>
#include <QKeyEvent>
#include <QSignalSpy>

#include "input/CancelKeyMonitor.h"

class tst_CancelKeyMonitor : public QObject
{
    Q_OBJECT

private slots:
    void cleanup();

    void testInstallRemove();
    void testEscapeEmitsSessionId();
    void testEscapeIsConsumed();
    void testAutoRepeatConsumedWithoutSignal();
    void testOtherKeysPassThrough();
    void testSecondMonitorRejected();
    void testRemovedMonitorIsSilent();
    void testDestructionReleasesOwnership();

private:
    static bool sendKey(QObject *receiver, int key, bool autoRepeat = false);
};

// Records key presses that reach it
class KeyReceiver : public QObject
{
public:
    int keyPresses = 0;

protected:
    bool event(QEvent *e) override
    {
        if (e->type() == QEvent::KeyPress) {
            ++keyPresses;
            return true;
        }
        return QObject::event(e);
    }
};

bool tst_CancelKeyMonitor::sendKey(QObject *receiver, int key, bool autoRepeat)
{
    QKeyEvent press(QEvent::KeyPress, key, Qt::NoModifier, QString(), autoRepeat);
    return QCoreApplication::sendEvent(receiver, &press);
}

void tst_CancelKeyMonitor::cleanup()
{
    QCOMPARE(CancelKeyMonitor::installedCount(), 0);
}

void tst_CancelKeyMonitor::testInstallRemove()
{
    CancelKeyMonitor monitor;
    QVERIFY(monitor.install(1));
    QVERIFY(monitor.isInstalled());
    QCOMPARE(CancelKeyMonitor::installedCount(), 1);

    // Re-installing for the same session is a no-op
    QVERIFY(monitor.install(1));
    QVERIFY(!monitor.install(2));

    monitor.remove();
    QVERIFY(!monitor.isInstalled());
    QCOMPARE(CancelKeyMonitor::installedCount(), 0);

    // Second remove is harmless
    monitor.remove();
}

void tst_CancelKeyMonitor::testEscapeEmitsSessionId()
{
    CancelKeyMonitor monitor;
    QSignalSpy spy(&monitor, &CancelKeyMonitor::cancelRequested);
    KeyReceiver receiver;
    QVERIFY(monitor.install(7));

    sendKey(&receiver, Qt::Key_Escape);

    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).toULongLong(), 7ull);
    monitor.remove();
}

void tst_CancelKeyMonitor::testEscapeIsConsumed()
{
    CancelKeyMonitor monitor;
    KeyReceiver receiver;
    QVERIFY(monitor.install(1));

    sendKey(&receiver, Qt::Key_Escape);

    QCOMPARE(receiver.keyPresses, 0);
    monitor.remove();
}

void tst_CancelKeyMonitor::testAutoRepeatConsumedWithoutSignal()
{
    CancelKeyMonitor monitor;
    QSignalSpy spy(&monitor, &CancelKeyMonitor::cancelRequested);
    KeyReceiver receiver;
    QVERIFY(monitor.install(1));

    sendKey(&receiver, Qt::Key_Escape, true);

    QCOMPARE(spy.count(), 0);
    QCOMPARE(receiver.keyPresses, 0);
    monitor.remove();
}

void tst_CancelKeyMonitor::testOtherKeysPassThrough()
{
    CancelKeyMonitor monitor;
    QSignalSpy spy(&monitor, &CancelKeyMonitor::cancelRequested);
    KeyReceiver receiver;
    QVERIFY(monitor.install(1));

    sendKey(&receiver, Qt::Key_A);
    sendKey(&receiver, Qt::Key_Return);

    QCOMPARE(spy.count(), 0);
    QCOMPARE(receiver.keyPresses, 2);
    monitor.remove();
}

void tst_CancelKeyMonitor::testSecondMonitorRejected()
{
    CancelKeyMonitor first;
    CancelKeyMonitor second;
    QVERIFY(first.install(1));
    QVERIFY(!second.install(2));
    QCOMPARE(CancelKeyMonitor::installedCount(), 1);

    first.remove();
    QVERIFY(second.install(2));
    second.remove();
}

void tst_CancelKeyMonitor::testRemovedMonitorIsSilent()
{
    CancelKeyMonitor monitor;
    QSignalSpy spy(&monitor, &CancelKeyMonitor::cancelRequested);
    KeyReceiver receiver;
    QVERIFY(monitor.install(1));
    monitor.remove();

    sendKey(&receiver, Qt::Key_Escape);

    QCOMPARE(spy.count(), 0);
    QCOMPARE(receiver.keyPresses, 1);
}

void tst_CancelKeyMonitor::testDestructionReleasesOwnership()
{
    {
        CancelKeyMonitor monitor;
        QVERIFY(monitor.install(3));
    }
    QCOMPARE(CancelKeyMonitor::installedCount(), 0);
}

QTEST_MAIN(tst_CancelKeyMonitor)
#include "tst_CancelKeyMonitor.moc"
