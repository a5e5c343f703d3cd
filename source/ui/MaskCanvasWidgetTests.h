#ifndef MASKCANVASWIDGETTESTS_H
#define MASKCANVASWIDGETTESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include <QWheelEvent>
#include <QFocusEvent>
#include <QApplication>
#include <memory>

#include "../core/MaskSession.h"
#include "../core/StrokeOrchestrator.h"
#include "../viewport/MaskCanvasWidget.h"
#include "../viewport/CheckerboardPattern.h"

/**
 * Widget tests for MaskCanvasWidget.
 * Run with: maskpainter --test-canvas
 *
 * Every test starts from a 400x300 gray image shown in an 800x600 canvas,
 * which fits at zoom 2.0 with no offset (screen = image * 2).
 */
class MaskCanvasWidgetTests : public QObject {
    Q_OBJECT

private:
    std::unique_ptr<MaskSession> m_session;
    std::unique_ptr<StrokeOrchestrator> m_orchestrator;
    std::unique_ptr<MaskCanvasWidget> m_canvas;
    CheckerboardPattern m_checkerboard;

    void sendWheel(int angleDelta, const QPointF& pos) {
        QWheelEvent event(pos, m_canvas->mapToGlobal(pos), QPoint(), QPoint(0, angleDelta),
                          Qt::NoButton, Qt::NoModifier, Qt::NoScrollPhase, false);
        QApplication::sendEvent(m_canvas.get(), &event);
    }

private slots:
    void init() {
        m_session = MaskSession::open(PixelBuffer(400, 300, qRgba(90, 90, 90, 255)), PixelBuffer());
        QVERIFY(m_session);
        m_orchestrator = std::make_unique<StrokeOrchestrator>(m_session.get());
        m_canvas = std::make_unique<MaskCanvasWidget>();
        m_canvas->setCheckerboard(&m_checkerboard);
        m_canvas->resize(800, 600);
        m_canvas->setOrchestrator(m_orchestrator.get());
        m_canvas->show();
        QVERIFY(QTest::qWaitForWindowExposed(m_canvas.get()));
    }

    void cleanup() {
        m_canvas.reset();
        m_orchestrator.reset();
        m_session.reset();
    }

    // Attaching fits the image into the widget
    void testFitOnAttach() {
        QCOMPARE(m_orchestrator->transform().zoom(), 2.0);
        QCOMPARE(m_orchestrator->transform().translation(), QPointF(0, 0));
    }

    // Left drag paints a stroke into the mask and the display
    void testMouseStroke() {
        QTest::mousePress(m_canvas.get(), Qt::LeftButton, Qt::NoModifier, QPoint(200, 200));
        QVERIFY(m_session->compositor().isLive());

        QTest::mouseMove(m_canvas.get(), QPoint(400, 200));
        QTest::mouseRelease(m_canvas.get(), Qt::LeftButton, Qt::NoModifier, QPoint(400, 200));

        QVERIFY(!m_session->compositor().isLive());
        QVERIFY(m_orchestrator->state() == InteractionState::Idle);

        // Screen (300, 200) is image (150, 100), on the stroke
        QCOMPARE(m_session->maskLayer().pixel(150, 100), qRgba(255, 0, 0, 255));
        QCOMPARE(m_session->compositor().displayImage().pixel(150, 100), qRgba(255, 0, 0, 255));
        QVERIFY(m_orchestrator->canUndo());
    }

    // Right drag pans without painting
    void testRightButtonPans() {
        QTest::mousePress(m_canvas.get(), Qt::RightButton, Qt::NoModifier, QPoint(100, 100));
        QTest::mouseMove(m_canvas.get(), QPoint(130, 110));
        QTest::mouseRelease(m_canvas.get(), Qt::RightButton, Qt::NoModifier, QPoint(130, 110));

        QCOMPARE(m_orchestrator->transform().translation(), QPointF(30, 10));
        QCOMPARE(m_session->maskLayer().countNonTransparent(), 0);
        QVERIFY(!m_orchestrator->canUndo());
    }

    // Wheel zooms by 8% and reports the new zoom
    void testWheelZoom() {
        QSignalSpy spy(m_canvas.get(), &MaskCanvasWidget::zoomChanged);
        sendWheel(120, QPointF(400, 300));

        QCOMPARE(spy.count(), 1);
        QVERIFY(qFuzzyCompare(m_orchestrator->transform().zoom(), 2.16));
        QVERIFY(qFuzzyCompare(spy.at(0).at(0).toReal(), 2.16));

        // Anchor stays on the same image point
        const QPointF anchorImage = m_orchestrator->transform().screenToImage(QPointF(400, 300));
        QVERIFY(qAbs(anchorImage.x() - 200.0) < 1e-6);
        QVERIFY(qAbs(anchorImage.y() - 150.0) < 1e-6);
    }

    // Cursor circle follows the pointer and spans the pixels a dab paints
    void testCursorRect() {
        QTest::mouseMove(m_canvas.get(), QPoint(200, 150));

        QVERIFY(m_canvas->isCursorVisible());
        // Brush 20 paints radius 10, 21 image pixels, 42 screen pixels at zoom 2
        QCOMPARE(m_canvas->cursorRect(), QRectF(179, 129, 42, 42));

        // Odd sizes paint the same disc as the even size below them
        m_orchestrator->setBrushSize(21);
        QCOMPARE(m_canvas->cursorRect(), QRectF(179, 129, 42, 42));
        m_orchestrator->setBrushSize(22);
        QCOMPARE(m_canvas->cursorRect(), QRectF(177, 127, 46, 46));
    }

    // Losing focus mid-stroke never leaves the canvas in live mode
    void testFocusOutEndsStroke() {
        QTest::mousePress(m_canvas.get(), Qt::LeftButton, Qt::NoModifier, QPoint(200, 200));
        QVERIFY(m_session->compositor().isLive());

        QFocusEvent focusOut(QEvent::FocusOut, Qt::ActiveWindowFocusReason);
        QApplication::sendEvent(m_canvas.get(), &focusOut);

        QVERIFY(!m_session->compositor().isLive());
        QVERIFY(m_orchestrator->state() == InteractionState::Idle);
    }

    // Mask-only view draws the checkerboard where the mask is empty
    void testMaskOnlyView() {
        const QImage normal = m_canvas->grab().toImage();
        QCOMPARE(QColor(normal.pixel(5, 5)), QColor(90, 90, 90));

        m_canvas->setMaskOnlyView(true);
        QVERIFY(m_canvas->maskOnlyView());
        const QImage maskOnly = m_canvas->grab().toImage();
        QCOMPARE(QColor(maskOnly.pixel(5, 5)), m_checkerboard.lightColor());
        QCOMPARE(QColor(maskOnly.pixel(15, 5)), m_checkerboard.darkColor());
    }

    // Checkerboard tile layout
    void testCheckerboardPattern() {
        const CheckerboardPattern pattern;
        QCOMPARE(pattern.tile().size(), QSize(100, 100));
        QCOMPARE(pattern.colorAt(0, 0), QColor(Qt::lightGray));
        QCOMPARE(pattern.colorAt(10, 0), QColor(Qt::gray));
        QCOMPARE(pattern.colorAt(10, 10), QColor(Qt::lightGray));
        QCOMPARE(pattern.colorAt(-1, 0), QColor(Qt::gray));
        QCOMPARE(QColor(pattern.tile().pixel(15, 5)), QColor(Qt::gray));
    }
};

#endif // MASKCANVASWIDGETTESTS_H
