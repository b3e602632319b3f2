#include <QtTest>
#include "tracking/HighlightAnimator.h"

class tst_HighlightAnimator : public QObject
{
    Q_OBJECT

private slots:
    void testFirstTargetSnaps();
    void testSecondTargetAnimates();
    void testStepMovesTowardTarget();
    void testConvergesAndSnaps();
    void testSmoothingFactor();
    void testEmptyTargetResets();
    void testResetThenTargetSnapsAgain();
    void testSameTargetDoesNotAnimate();
};

void tst_HighlightAnimator::testFirstTargetSnaps()
{
    HighlightAnimator animator;
    animator.setTarget(QRectF(10, 20, 100, 50));

    QVERIFY(animator.hasTarget());
    QVERIFY(!animator.isAnimating());
    QCOMPARE(animator.displayedRect(), QRectF(10, 20, 100, 50));
    QVERIFY(!animator.step());
}

void tst_HighlightAnimator::testSecondTargetAnimates()
{
    HighlightAnimator animator;
    animator.setTarget(QRectF(0, 0, 100, 100));
    animator.setTarget(QRectF(200, 0, 100, 100));

    QVERIFY(animator.isAnimating());
    QCOMPARE(animator.displayedRect(), QRectF(0, 0, 100, 100));
    QCOMPARE(animator.targetRect(), QRectF(200, 0, 100, 100));
}

void tst_HighlightAnimator::testStepMovesTowardTarget()
{
    HighlightAnimator animator;
    animator.setTarget(QRectF(0, 0, 100, 100));
    animator.setTarget(QRectF(200, 0, 100, 100));

    QVERIFY(animator.step());

    // Distance 200 doubles the base factor: 0.18 * 2 = 0.36
    QCOMPARE(animator.displayedRect().x(), 200 * 0.36);
    QCOMPARE(animator.displayedRect().width(), 100.0);
}

void tst_HighlightAnimator::testConvergesAndSnaps()
{
    HighlightAnimator animator;
    animator.setTarget(QRectF(0, 0, 10, 10));
    animator.setTarget(QRectF(500, 300, 400, 200));

    int frames = 0;
    while (animator.step()) {
        ++frames;
        QVERIFY2(frames < 200, "animation did not converge");
    }

    QCOMPARE(animator.displayedRect(), QRectF(500, 300, 400, 200));
    QVERIFY(!animator.isAnimating());
}

void tst_HighlightAnimator::testSmoothingFactor()
{
    QCOMPARE(HighlightAnimator::smoothingFactor(0.0), 0.18);
    QCOMPARE(HighlightAnimator::smoothingFactor(100.0), 0.27);
    // Capped for long jumps
    QCOMPARE(HighlightAnimator::smoothingFactor(5000.0), 0.4);
}

void tst_HighlightAnimator::testEmptyTargetResets()
{
    HighlightAnimator animator;
    animator.setTarget(QRectF(0, 0, 10, 10));
    animator.setTarget(QRectF());

    QVERIFY(!animator.hasTarget());
    QVERIFY(animator.displayedRect().isNull());
}

void tst_HighlightAnimator::testResetThenTargetSnapsAgain()
{
    HighlightAnimator animator;
    animator.setTarget(QRectF(0, 0, 10, 10));
    animator.reset();
    animator.setTarget(QRectF(900, 900, 30, 30));

    QVERIFY(!animator.isAnimating());
    QCOMPARE(animator.displayedRect(), QRectF(900, 900, 30, 30));
}

void tst_HighlightAnimator::testSameTargetDoesNotAnimate()
{
    HighlightAnimator animator;
    animator.setTarget(QRectF(5, 5, 50, 50));
    animator.setTarget(QRectF(5, 5, 50, 50));

    QVERIFY(!animator.isAnimating());
}

QTEST_MAIN(tst_HighlightAnimator)
#include "tst_HighlightAnimator.moc"
