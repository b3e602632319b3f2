#include <QtTest>
#include "capture/CaptureGeometry.h"

class tst_CaptureGeometry : public QObject
{
    Q_OBJECT

private slots:
    // clampOversizedTarget
    void testClampOversized_NormalPassesThrough();
    void testClampOversized_HugeIsIntersected();
    void testClampOversized_HugeOffDisplayIsRejected();
    void testClampOversized_SubUnitIsRejected();

    // padTarget / isSignificantChange
    void testPadTarget();
    void testSignificantChange_WithinTolerance();
    void testSignificantChange_SingleEdge();
    void testSignificantChange_ExactlyTolerance();

    // isValidCaptureRect
    void testValidCaptureRect_data();
    void testValidCaptureRect();

    // clampToDisplayBounds
    void testClampBounds_Inside();
    void testClampBounds_NegativeOrigin();
    void testClampBounds_FarEdge();
    void testClampBounds_OriginPastBound();
    void testClampBounds_Idempotent_data();
    void testClampBounds_Idempotent();

    void testMinimumCaptureSize();
};

// ============================================================================
// clampOversizedTarget
// ============================================================================

void tst_CaptureGeometry::testClampOversized_NormalPassesThrough()
{
    const QRectF rect(-50, 10, 300, 200);
    auto result = CaptureGeometry::clampOversizedTarget(rect, QRectF(0, 0, 1920, 1080));
    QVERIFY(result.has_value());
    // Below the threshold the rect is not touched, even if it overhangs the display
    QCOMPARE(*result, rect);
}

void tst_CaptureGeometry::testClampOversized_HugeIsIntersected()
{
    const QRectF frame(0, 0, 1920, 1080);
    auto result = CaptureGeometry::clampOversizedTarget(QRectF(100, -5000, 400, 200000), frame);
    QVERIFY(result.has_value());
    QCOMPARE(*result, QRectF(100, 0, 400, 1080));
    QVERIFY(frame.contains(*result));
}

void tst_CaptureGeometry::testClampOversized_HugeOffDisplayIsRejected()
{
    auto result = CaptureGeometry::clampOversizedTarget(QRectF(5000, 0, 20000, 100),
                                                        QRectF(0, 0, 1920, 1080));
    QVERIFY(!result.has_value());
}

void tst_CaptureGeometry::testClampOversized_SubUnitIsRejected()
{
    QVERIFY(!CaptureGeometry::clampOversizedTarget(QRectF(10, 10, 0.5, 40),
                                                   QRectF(0, 0, 1920, 1080)).has_value());
}

// ============================================================================
// padTarget / isSignificantChange
// ============================================================================

void tst_CaptureGeometry::testPadTarget()
{
    QCOMPARE(CaptureGeometry::padTarget(QRectF(100, 100, 50, 20)), QRectF(96, 96, 58, 28));
}

void tst_CaptureGeometry::testSignificantChange_WithinTolerance()
{
    const QRectF a(100, 100, 200, 100);
    const QRectF b(101.5, 98.5, 200, 101);
    QVERIFY(!CaptureGeometry::isSignificantChange(a, b, 2.0));
}

void tst_CaptureGeometry::testSignificantChange_SingleEdge()
{
    const QRectF a(100, 100, 200, 100);
    const QRectF b(100, 100, 203, 100);
    QVERIFY(CaptureGeometry::isSignificantChange(a, b, 2.0));
}

void tst_CaptureGeometry::testSignificantChange_ExactlyTolerance()
{
    const QRectF a(100, 100, 200, 100);
    const QRectF b(102, 100, 198, 100);
    QVERIFY(!CaptureGeometry::isSignificantChange(a, b, 2.0));
}

// ============================================================================
// isValidCaptureRect
// ============================================================================

void tst_CaptureGeometry::testValidCaptureRect_data()
{
    QTest::addColumn<QRectF>("rect");
    QTest::addColumn<bool>("valid");

    QTest::newRow("normal") << QRectF(0, 0, 100, 100) << true;
    QTest::newRow("zero width") << QRectF(0, 0, 0, 100) << false;
    QTest::newRow("negative height") << QRectF(0, 0, 100, -1) << false;
    QTest::newRow("just below max") << QRectF(0, 0, 49999, 10) << true;
    QTest::newRow("at max") << QRectF(0, 0, 50000, 10) << false;
    QTest::newRow("huge") << QRectF(0, 0, 10, 200000) << false;
}

void tst_CaptureGeometry::testValidCaptureRect()
{
    QFETCH(QRectF, rect);
    QFETCH(bool, valid);
    QCOMPARE(CaptureGeometry::isValidCaptureRect(rect), valid);
}

// ============================================================================
// clampToDisplayBounds
// ============================================================================

void tst_CaptureGeometry::testClampBounds_Inside()
{
    const QRectF r(10, 20, 100, 50);
    QCOMPARE(CaptureGeometry::clampToDisplayBounds(r, QSizeF(1920, 1080)), r);
}

void tst_CaptureGeometry::testClampBounds_NegativeOrigin()
{
    QCOMPARE(CaptureGeometry::clampToDisplayBounds(QRectF(-30, -10, 100, 50), QSizeF(1920, 1080)),
             QRectF(0, 0, 70, 40));
}

void tst_CaptureGeometry::testClampBounds_FarEdge()
{
    QCOMPARE(CaptureGeometry::clampToDisplayBounds(QRectF(1900, 1000, 100, 200), QSizeF(1920, 1080)),
             QRectF(1900, 1000, 20, 80));
}

void tst_CaptureGeometry::testClampBounds_OriginPastBound()
{
    const QRectF result = CaptureGeometry::clampToDisplayBounds(QRectF(2000, 10, 100, 100),
                                                                QSizeF(1920, 1080));
    QCOMPARE(result.x(), 1920.0);
    QCOMPARE(result.width(), 0.0);
    QVERIFY(!CaptureGeometry::meetsMinimumCaptureSize(result));
}

void tst_CaptureGeometry::testClampBounds_Idempotent_data()
{
    QTest::addColumn<QRectF>("rect");

    QTest::newRow("inside") << QRectF(5, 5, 10, 10);
    QTest::newRow("negative origin") << QRectF(-40, -40, 100, 100);
    QTest::newRow("overhang") << QRectF(1800, 900, 500, 500);
    QTest::newRow("outside") << QRectF(3000, 3000, 10, 10);
    QTest::newRow("entirely left") << QRectF(-500, 10, 100, 10);
}

void tst_CaptureGeometry::testClampBounds_Idempotent()
{
    QFETCH(QRectF, rect);
    const QSizeF bounds(1920, 1080);

    const QRectF once = CaptureGeometry::clampToDisplayBounds(rect, bounds);
    const QRectF twice = CaptureGeometry::clampToDisplayBounds(once, bounds);
    QCOMPARE(twice, once);
    QVERIFY(once.x() >= 0 && once.y() >= 0);
    QVERIFY(once.right() <= bounds.width() && once.bottom() <= bounds.height());
}

void tst_CaptureGeometry::testMinimumCaptureSize()
{
    QVERIFY(CaptureGeometry::meetsMinimumCaptureSize(QRectF(0, 0, 1, 1)));
    QVERIFY(!CaptureGeometry::meetsMinimumCaptureSize(QRectF(0, 0, 0.99, 10)));
}

QTEST_MAIN(tst_CaptureGeometry)
#include "tst_CaptureGeometry.moc"
