#include <QtTest>
#include <QGuiApplication>
#include <QScreen>

#include "ui/ElementHighlightOverlay.h"

/**
 * @brief Tests for ElementHighlightOverlay window behavior.
 *
 * Runs on the offscreen platform; only the primary screen exists.
 */
class tst_ElementHighlightOverlay : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testInactiveIgnoresTargets();
    void testFirstTargetShowsWindow();
    void testGlidesToNextTarget();
    void testSameTargetIsNoOp();
    void testDisplayChangeSnaps();
    void testUnknownDisplayFallsBackToPrimary();
    void testHideTarget();
    void testFlash();
    void testFlashWithoutTargetIgnored();
    void testDeactivate();
    void testPaintsWithoutCrash();

private:
    QString primaryName() const { return QGuiApplication::primaryScreen()->name(); }

    ElementHighlightOverlay *m_overlay = nullptr;
};

void tst_ElementHighlightOverlay::init()
{
    m_overlay = new ElementHighlightOverlay();
}

void tst_ElementHighlightOverlay::cleanup()
{
    delete m_overlay;
    m_overlay = nullptr;
}

void tst_ElementHighlightOverlay::testInactiveIgnoresTargets()
{
    m_overlay->animateTo(QRectF(10, 10, 100, 100), primaryName());

    QVERIFY(!m_overlay->isVisible());
    QVERIFY(!m_overlay->isActive());
}

void tst_ElementHighlightOverlay::testFirstTargetShowsWindow()
{
    m_overlay->activate();
    m_overlay->animateTo(QRectF(10, 10, 100, 100), primaryName());

    QVERIFY(m_overlay->isActive());
    QVERIFY(m_overlay->isVisible());
    QCOMPARE(m_overlay->displayId(), primaryName());
    QCOMPARE(m_overlay->displayedRect(), QRectF(10, 10, 100, 100));
    QCOMPARE(m_overlay->geometry(), QGuiApplication::primaryScreen()->geometry());
}

void tst_ElementHighlightOverlay::testGlidesToNextTarget()
{
    m_overlay->activate();
    m_overlay->animateTo(QRectF(10, 10, 100, 100), primaryName());
    m_overlay->animateTo(QRectF(300, 200, 80, 60), primaryName());

    // No snap on the same display
    QCOMPARE(m_overlay->displayedRect(), QRectF(10, 10, 100, 100));
    QTRY_COMPARE(m_overlay->displayedRect(), QRectF(300, 200, 80, 60));
}

void tst_ElementHighlightOverlay::testSameTargetIsNoOp()
{
    m_overlay->activate();
    m_overlay->animateTo(QRectF(10, 10, 100, 100), primaryName());
    const QRect geometry = m_overlay->geometry();

    m_overlay->animateTo(QRectF(10, 10, 100, 100), primaryName());

    QCOMPARE(m_overlay->displayedRect(), QRectF(10, 10, 100, 100));
    QCOMPARE(m_overlay->geometry(), geometry);
}

void tst_ElementHighlightOverlay::testDisplayChangeSnaps()
{
    m_overlay->activate();
    m_overlay->animateTo(QRectF(10, 10, 100, 100), primaryName());

    m_overlay->animateTo(QRectF(500, 400, 50, 50), QStringLiteral("elsewhere"));

    QCOMPARE(m_overlay->displayId(), QStringLiteral("elsewhere"));
    QCOMPARE(m_overlay->displayedRect(), QRectF(500, 400, 50, 50));
}

void tst_ElementHighlightOverlay::testUnknownDisplayFallsBackToPrimary()
{
    m_overlay->activate();
    m_overlay->animateTo(QRectF(10, 10, 100, 100), QStringLiteral("no-such-display"));

    QVERIFY(m_overlay->isVisible());
    QCOMPARE(m_overlay->geometry(), QGuiApplication::primaryScreen()->geometry());
}

void tst_ElementHighlightOverlay::testHideTarget()
{
    m_overlay->activate();
    m_overlay->animateTo(QRectF(10, 10, 100, 100), primaryName());

    m_overlay->hideTarget();

    QVERIFY(!m_overlay->isVisible());
    QVERIFY(m_overlay->isActive());

    // The next target appears without gliding from the old one
    m_overlay->animateTo(QRectF(300, 300, 40, 40), primaryName());
    QVERIFY(m_overlay->isVisible());
    QCOMPARE(m_overlay->displayedRect(), QRectF(300, 300, 40, 40));
}

void tst_ElementHighlightOverlay::testFlash()
{
    m_overlay->activate();
    m_overlay->animateTo(QRectF(10, 10, 100, 100), primaryName());

    m_overlay->flash();

    QVERIFY(m_overlay->isFlashing());
    QTRY_VERIFY(!m_overlay->isFlashing());
}

void tst_ElementHighlightOverlay::testFlashWithoutTargetIgnored()
{
    m_overlay->activate();
    m_overlay->flash();

    QVERIFY(!m_overlay->isFlashing());
}

void tst_ElementHighlightOverlay::testDeactivate()
{
    m_overlay->activate();
    m_overlay->animateTo(QRectF(10, 10, 100, 100), primaryName());

    m_overlay->deactivate();

    QVERIFY(!m_overlay->isActive());
    QVERIFY(!m_overlay->isVisible());
    QVERIFY(m_overlay->displayId().isEmpty());

    m_overlay->animateTo(QRectF(10, 10, 100, 100), primaryName());
    QVERIFY(!m_overlay->isVisible());
}

void tst_ElementHighlightOverlay::testPaintsWithoutCrash()
{
    m_overlay->activate();
    m_overlay->animateTo(QRectF(10, 10, 100, 100), primaryName());
    m_overlay->flash();

    const QPixmap pixmap = m_overlay->grab();
    QVERIFY(!pixmap.isNull());
}

QTEST_MAIN(tst_ElementHighlightOverlay)
#include "tst_ElementHighlightOverlay.moc"
