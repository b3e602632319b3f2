#include <QtTest>
#include "display/DisplayLayout.h"

namespace {

DisplayDescriptor makeDisplay(const QString &id, const QRectF &frame, qreal scale, bool primary)
{
    DisplayDescriptor d;
    d.id = id;
    d.frame = frame;
    d.scaleFactor = scale;
    d.isPrimary = primary;
    return d;
}

DisplayLayout dualLayout()
{
    return DisplayLayout({
        makeDisplay("primary", QRectF(0, 0, 1920, 1080), 1.0, true),
        makeDisplay("secondary", QRectF(1920, 0, 1280, 1024), 2.0, false),
    });
}

}  // namespace

class tst_DisplayLayout : public QObject
{
    Q_OBJECT

private slots:
    void testEmptyLayout();
    void testPrimary();
    void testPrimaryMissing();
    void testDisplayAt();
    void testDisplayAt_SharedEdgeBelongsToRightDisplay();
    void testDisplayAt_Outside();
    void testFindById();
    void testFindById_EmptyId();
    void testCaptureFrame_Primary();
    void testCaptureFrame_BottomAlignedSecondary();
};

void tst_DisplayLayout::testEmptyLayout()
{
    DisplayLayout layout;
    QVERIFY(layout.isEmpty());
    QVERIFY(!layout.primary().has_value());
    QCOMPARE(layout.primaryHeight(), 0.0);
    QVERIFY(!layout.displayAt(QPointF(10, 10)).has_value());
}

void tst_DisplayLayout::testPrimary()
{
    const DisplayLayout layout = dualLayout();
    QVERIFY(layout.primary().has_value());
    QCOMPARE(layout.primary()->id, QStringLiteral("primary"));
    QCOMPARE(layout.primaryHeight(), 1080.0);
}

void tst_DisplayLayout::testPrimaryMissing()
{
    DisplayLayout layout({makeDisplay("a", QRectF(0, 0, 800, 600), 1.0, false)});
    QVERIFY(!layout.primary().has_value());
    QCOMPARE(layout.primaryHeight(), 0.0);
}

void tst_DisplayLayout::testDisplayAt()
{
    const DisplayLayout layout = dualLayout();
    QCOMPARE(layout.displayAt(QPointF(100.5, 500.5))->id, QStringLiteral("primary"));
    QCOMPARE(layout.displayAt(QPointF(2500.5, 10.5))->id, QStringLiteral("secondary"));
}

void tst_DisplayLayout::testDisplayAt_SharedEdgeBelongsToRightDisplay()
{
    const DisplayLayout layout = dualLayout();
    QCOMPARE(layout.displayAt(QPointF(1920, 10))->id, QStringLiteral("secondary"));
    QCOMPARE(layout.displayAt(QPointF(1919.5, 10))->id, QStringLiteral("primary"));
}

void tst_DisplayLayout::testDisplayAt_Outside()
{
    const DisplayLayout layout = dualLayout();
    // Above the shorter secondary display
    QVERIFY(!layout.displayAt(QPointF(2500, 1050)).has_value());
    QVERIFY(!layout.displayAt(QPointF(-1, 10)).has_value());
}

void tst_DisplayLayout::testFindById()
{
    const DisplayLayout layout = dualLayout();
    auto found = layout.findById("secondary");
    QVERIFY(found.has_value());
    QCOMPARE(found->scaleFactor, 2.0);
    QVERIFY(!layout.findById("gone").has_value());
}

void tst_DisplayLayout::testFindById_EmptyId()
{
    QVERIFY(!dualLayout().findById(QString()).has_value());
}

void tst_DisplayLayout::testCaptureFrame_Primary()
{
    const DisplayLayout layout = dualLayout();
    QCOMPARE(layout.captureFrame(*layout.primary()), QRectF(0, 0, 1920, 1080));
}

void tst_DisplayLayout::testCaptureFrame_BottomAlignedSecondary()
{
    const DisplayLayout layout = dualLayout();
    // Bottom-aligned in input space means its top sits 56 below the primary's top
    QCOMPARE(layout.captureFrame(*layout.findById("secondary")), QRectF(1920, 56, 1280, 1024));
}

QTEST_MAIN(tst_DisplayLayout)
#include "tst_DisplayLayout.moc"
