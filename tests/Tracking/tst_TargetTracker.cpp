#include <QtTest>
#include <QSignalSpy>

#include "tracking/TargetTracker.h"
#include "MockDisplayProvider.h"
#include "MockElementInspector.h"
#include "MockWindowLister.h"

/**
 * @brief Tests for TargetTracker hit-testing, clamping and hysteresis.
 *
 * The tick() method is driven directly; the internal timer is not used.
 */
class tst_TargetTracker : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // Hit-testing
    void testElementHitIsPadded();
    void testPointerIsConvertedToCaptureSpace();
    void testFallsBackToWindowList();
    void testWindowFallback_SkipsSmallWindows();
    void testWindowFallback_SkipsExcludedProcess();
    void testWindowFallback_FrontmostWins();
    void testWindowFallback_SkipsShellSurfaces();
    void testNoInspector_UsesWindowList();

    // Clamping
    void testOversizedElementIsClampedToDisplay();
    void testOversizedElementOffDisplayMeansNoTarget();

    // Hysteresis and loss
    void testSmallMovementIsIgnored();
    void testLargeMovementIsReported();
    void testNoTargetReportedOnce();
    void testTargetLossResetsBaseline();
    void testPointerOutsideDisplays();

    // Display changes
    void testDisplayChangeResetsBaseline();

    // Immediate modes
    void testResolveFullscreen_PointerDisplay();
    void testResolveFullscreen_FallsBackToPrimary();
    void testResolveWindow();
    void testResolveWindow_NoWindow();
    void testResolveElement_ReturnsNothing();

    // Timer
    void testStartStop();

private:
    void pointAt(qreal x, qreal y);

    MockDisplayProvider *m_displays = nullptr;
    MockPointerSource *m_pointer = nullptr;
    MockElementInspector *m_inspector = nullptr;
    MockWindowLister *m_windows = nullptr;
    TargetTracker *m_tracker = nullptr;
};

void tst_TargetTracker::init()
{
    m_displays = new MockDisplayProvider();
    m_pointer = new MockPointerSource();
    m_inspector = new MockElementInspector();
    m_windows = new MockWindowLister();
    m_tracker = new TargetTracker(m_displays, m_pointer, m_inspector, m_windows);
    m_tracker->setExcludedProcessId(42);
    pointAt(300, 300);
}

void tst_TargetTracker::cleanup()
{
    delete m_tracker;
    delete m_windows;
    delete m_inspector;
    delete m_pointer;
    delete m_displays;
    m_tracker = nullptr;
    m_windows = nullptr;
    m_inspector = nullptr;
    m_pointer = nullptr;
    m_displays = nullptr;
}

void tst_TargetTracker::pointAt(qreal x, qreal y)
{
    m_pointer->setCapturePosition(QPointF(x, y), 1080.0);
}

// ============================================================================
// Hit-testing
// ============================================================================

void tst_TargetTracker::testElementHitIsPadded()
{
    QSignalSpy spy(m_tracker, &TargetTracker::targetChanged);
    m_inspector->setElementRect(QRectF(250, 280, 100, 40));

    m_tracker->tick();

    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).toBool(), true);
    QCOMPARE(spy.at(0).at(1).toRectF(), QRectF(246, 276, 108, 48));
    QCOMPARE(spy.at(0).at(2).toString(), QStringLiteral("primary"));
    QVERIFY(m_tracker->hasTarget());
    QCOMPARE(m_tracker->activeDisplayId(), QStringLiteral("primary"));
}

void tst_TargetTracker::testPointerIsConvertedToCaptureSpace()
{
    m_inspector->setElementRect(QRectF(250, 280, 100, 40));
    pointAt(120.5, 40.5);

    m_tracker->tick();

    QCOMPARE(m_inspector->lastQuery(), QPointF(120.5, 40.5));
}

void tst_TargetTracker::testFallsBackToWindowList()
{
    m_windows->addWindow(QRectF(100, 100, 800, 600));

    m_tracker->tick();

    QVERIFY(m_tracker->hasTarget());
    QCOMPARE(m_tracker->currentTarget(), QRectF(96, 96, 808, 608));
    QCOMPARE(m_windows->callCount(), 1);
}

void tst_TargetTracker::testWindowFallback_SkipsSmallWindows()
{
    // Exactly 50 is not enough; the guard is strictly greater
    m_windows->addWindow(QRectF(280, 280, 50, 200));
    QVERIFY(!m_tracker->hitTestWindowAt(QPointF(300, 300)).has_value());

    m_windows->addWindow(QRectF(200, 200, 51, 200));
    QCOMPARE(*m_tracker->hitTestWindowAt(QPointF(210, 300)), QRectF(200, 200, 51, 200));
}

void tst_TargetTracker::testWindowFallback_SkipsExcludedProcess()
{
    m_windows->addWindow(QRectF(0, 0, 1000, 1000), 42);
    m_windows->addWindow(QRectF(200, 200, 400, 400), 7);

    QCOMPARE(*m_tracker->hitTestWindowAt(QPointF(300, 300)), QRectF(200, 200, 400, 400));
}

void tst_TargetTracker::testWindowFallback_FrontmostWins()
{
    m_windows->addWindow(QRectF(250, 250, 100, 100));
    m_windows->addWindow(QRectF(0, 0, 1920, 1080));

    QCOMPARE(*m_tracker->hitTestWindowAt(QPointF(300, 300)), QRectF(250, 250, 100, 100));
}

void tst_TargetTracker::testWindowFallback_SkipsShellSurfaces()
{
    // A taskbar and the wallpaper both cover the point; neither is a capture target
    m_windows->addWindow(QRectF(0, 1040, 1920, 40), 1000, WindowLayer::Panel);
    m_windows->addWindow(QRectF(0, 0, 1920, 1080), 1000, WindowLayer::Desktop);
    QVERIFY(!m_tracker->hitTestWindowAt(QPointF(300, 1050)).has_value());

    m_tracker->tick();
    QVERIFY(!m_tracker->hasTarget());

    m_windows->addWindow(QRectF(100, 900, 600, 300));
    QCOMPARE(*m_tracker->hitTestWindowAt(QPointF(300, 1050)), QRectF(100, 900, 600, 300));
}

void tst_TargetTracker::testNoInspector_UsesWindowList()
{
    TargetTracker tracker(m_displays, m_pointer, nullptr, m_windows);
    m_windows->addWindow(QRectF(100, 100, 400, 400));

    tracker.tick();

    QVERIFY(tracker.hasTarget());
    QCOMPARE(tracker.currentTarget(), QRectF(96, 96, 408, 408));
}

// ============================================================================
// Clamping
// ============================================================================

void tst_TargetTracker::testOversizedElementIsClampedToDisplay()
{
    m_inspector->setElementRect(QRectF(200, -100000, 600, 200000));

    m_tracker->tick();

    QVERIFY(m_tracker->hasTarget());
    // Clamped to the display, then padded
    QCOMPARE(m_tracker->currentTarget(), QRectF(196, -4, 608, 1088));
}

void tst_TargetTracker::testOversizedElementOffDisplayMeansNoTarget()
{
    QSignalSpy spy(m_tracker, &TargetTracker::targetChanged);
    m_inspector->setElementRect(QRectF(5000, 0, 20000, 500));

    m_tracker->tick();

    QVERIFY(!m_tracker->hasTarget());
    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).toBool(), false);
}

// ============================================================================
// Hysteresis and loss
// ============================================================================

void tst_TargetTracker::testSmallMovementIsIgnored()
{
    QSignalSpy spy(m_tracker, &TargetTracker::targetChanged);
    m_inspector->setElementRect(QRectF(250, 280, 100, 40));
    m_tracker->tick();

    m_inspector->setElementRect(QRectF(251.5, 279, 100, 41));
    m_tracker->tick();

    QCOMPARE(spy.count(), 1);
    QCOMPARE(m_tracker->currentTarget(), QRectF(246, 276, 108, 48));
}

void tst_TargetTracker::testLargeMovementIsReported()
{
    QSignalSpy spy(m_tracker, &TargetTracker::targetChanged);
    m_inspector->setElementRect(QRectF(250, 280, 100, 40));
    m_tracker->tick();

    m_inspector->setElementRect(QRectF(250, 280, 103, 40));
    m_tracker->tick();

    QCOMPARE(spy.count(), 2);
    QCOMPARE(m_tracker->currentTarget(), QRectF(246, 276, 111, 48));
}

void tst_TargetTracker::testNoTargetReportedOnce()
{
    QSignalSpy spy(m_tracker, &TargetTracker::targetChanged);

    m_tracker->tick();
    m_tracker->tick();
    m_tracker->tick();

    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).toBool(), false);
}

void tst_TargetTracker::testTargetLossResetsBaseline()
{
    QSignalSpy spy(m_tracker, &TargetTracker::targetChanged);
    m_inspector->setElementRect(QRectF(250, 280, 100, 40));
    m_tracker->tick();

    m_inspector->clearElement();
    m_tracker->tick();
    QVERIFY(!m_tracker->hasTarget());
    QVERIFY(m_tracker->lastStableRect().isNull());

    // Same rect again is reported, not swallowed by hysteresis
    m_inspector->setElementRect(QRectF(250, 280, 100, 40));
    m_tracker->tick();

    QCOMPARE(spy.count(), 3);
    QCOMPARE(spy.at(1).at(0).toBool(), false);
    QCOMPARE(spy.at(2).at(0).toBool(), true);
}

void tst_TargetTracker::testPointerOutsideDisplays()
{
    QSignalSpy spy(m_tracker, &TargetTracker::targetChanged);
    m_inspector->setElementRect(QRectF(250, 280, 100, 40));
    pointAt(-500, 300);

    m_tracker->tick();

    QVERIFY(!m_tracker->hasTarget());
    QCOMPARE(spy.count(), 1);
    QCOMPARE(m_inspector->queryCount(), 0);
}

// ============================================================================
// Display changes
// ============================================================================

void tst_TargetTracker::testDisplayChangeResetsBaseline()
{
    m_displays->setDualDisplays();
    QSignalSpy targetSpy(m_tracker, &TargetTracker::targetChanged);
    QSignalSpy displaySpy(m_tracker, &TargetTracker::activeDisplayChanged);

    m_windows->addWindow(QRectF(1800, 100, 400, 400));
    pointAt(1850, 300);
    m_tracker->tick();

    // Same window, pointer crosses onto the secondary display
    pointAt(2000, 300);
    m_tracker->tick();

    QCOMPARE(displaySpy.count(), 2);
    QCOMPARE(displaySpy.at(1).at(0).toString(), QStringLiteral("secondary"));
    QCOMPARE(targetSpy.count(), 2);
    QCOMPARE(targetSpy.at(1).at(2).toString(), QStringLiteral("secondary"));
}

// ============================================================================
// Immediate modes
// ============================================================================

void tst_TargetTracker::testResolveFullscreen_PointerDisplay()
{
    m_displays->setDualDisplays();
    pointAt(2500, 500);

    auto target = m_tracker->resolveImmediateTarget(CaptureMode::Fullscreen);
    QVERIFY(target.has_value());
    QCOMPARE(target->displayId, QStringLiteral("secondary"));
    QCOMPARE(target->rect, QRectF(1920, 56, 1280, 1024));
}

void tst_TargetTracker::testResolveFullscreen_FallsBackToPrimary()
{
    pointAt(-100, -100);

    auto target = m_tracker->resolveImmediateTarget(CaptureMode::Fullscreen);
    QVERIFY(target.has_value());
    QCOMPARE(target->displayId, QStringLiteral("primary"));
    QCOMPARE(target->rect, QRectF(0, 0, 1920, 1080));
}

void tst_TargetTracker::testResolveWindow()
{
    m_windows->addWindow(QRectF(100, 100, 800, 600));

    auto target = m_tracker->resolveImmediateTarget(CaptureMode::Window);
    QVERIFY(target.has_value());
    // No padding in immediate modes
    QCOMPARE(target->rect, QRectF(100, 100, 800, 600));
    QCOMPARE(target->displayId, QStringLiteral("primary"));
}

void tst_TargetTracker::testResolveWindow_NoWindow()
{
    QVERIFY(!m_tracker->resolveImmediateTarget(CaptureMode::Window).has_value());
}

void tst_TargetTracker::testResolveElement_ReturnsNothing()
{
    m_inspector->setElementRect(QRectF(250, 280, 100, 40));
    QVERIFY(!m_tracker->resolveImmediateTarget(CaptureMode::Element).has_value());
}

// ============================================================================
// Timer
// ============================================================================

void tst_TargetTracker::testStartStop()
{
    QVERIFY(!m_tracker->isRunning());
    m_inspector->setElementRect(QRectF(250, 280, 100, 40));

    m_tracker->start();
    QVERIFY(m_tracker->isRunning());
    QTRY_VERIFY(m_tracker->hasTarget());

    m_tracker->stop();
    QVERIFY(!m_tracker->isRunning());
}

QTEST_MAIN(tst_TargetTracker)
#include "tst_TargetTracker.moc"
