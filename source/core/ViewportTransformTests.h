// ============================================================================
// ViewportTransformTests - Unit tests for zoom/pan math and input states
// ============================================================================
// Run with: maskpainter --test-viewport
// ============================================================================

#pragma once

#include "ViewportTransform.h"

#include <QLineF>
#include <QtMath>
#include <cmath>
#include <cstdio>
#include <limits>

class ViewportTransformTests {
public:

    // ===== Zoom =====

    /**
     * @brief setZoom clamps to [min, max]; NaN and non-positive go to min.
     */
    static bool testZoomClamping() {
        printf("  testZoomClamping... ");

        ViewportTransform vt;
        vt.setZoom(2.0);
        if (!qFuzzyCompare(vt.zoom(), 2.0)) {
            printf("FAILED: zoom 2.0 not set\n");
            return false;
        }
        vt.setZoom(0.01);
        if (!qFuzzyCompare(vt.zoom(), 0.1)) {
            printf("FAILED: zoom should clamp to min 0.1\n");
            return false;
        }
        vt.setZoom(50.0);
        if (!qFuzzyCompare(vt.zoom(), 10.0)) {
            printf("FAILED: zoom should clamp to max 10.0\n");
            return false;
        }
        vt.setZoom(-3.0);
        if (!qFuzzyCompare(vt.zoom(), 0.1)) {
            printf("FAILED: negative zoom should clamp to min\n");
            return false;
        }
        vt.setZoom(std::numeric_limits<qreal>::quiet_NaN());
        if (!qFuzzyCompare(vt.zoom(), 0.1)) {
            printf("FAILED: NaN zoom should clamp to min\n");
            return false;
        }

        // Inverted range falls back to the defaults
        vt.setZoomRange(5.0, 1.0);
        if (!qFuzzyCompare(vt.minZoom(), ViewportTransform::DEFAULT_MIN_ZOOM)
            || !qFuzzyCompare(vt.maxZoom(), ViewportTransform::DEFAULT_MAX_ZOOM)) {
            printf("FAILED: inverted zoom range accepted\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    /**
     * @brief Zooming at an anchor keeps the image point under it fixed.
     */
    static bool testAnchorPreserved() {
        printf("  testAnchorPreserved... ");

        ViewportTransform vt;
        vt.setImageSize(QSize(1000, 750));
        vt.setZoom(0.8);
        vt.setTranslation(QPointF(37, -12));

        const QPointF anchors[] = { QPointF(0, 0), QPointF(400, 300), QPointF(799, 5) };
        const qreal zooms[] = { 0.1, 0.55, 1.0, 3.3, 10.0 };

        for (const QPointF& anchor : anchors) {
            for (qreal z : zooms) {
                const QPointF before = vt.screenToImage(anchor);
                vt.zoomAtAnchor(z, anchor);
                const QPointF after = vt.screenToImage(anchor);
                if (QLineF(before, after).length() > 1.0) {
                    printf("FAILED: anchor (%.0f,%.0f) drifted %.3f px at zoom %.2f\n",
                           anchor.x(), anchor.y(), QLineF(before, after).length(), z);
                    return false;
                }
            }
        }

        printf("PASSED\n");
        return true;
    }

    /**
     * @brief Each wheel notch changes zoom by the step, anchored at the pointer.
     */
    static bool testWheelZoom() {
        printf("  testWheelZoom... ");

        ViewportTransform vt;
        vt.setImageSize(QSize(200, 200));
        vt.setZoom(1.0);

        vt.wheelZoom(120, QPointF(50, 50));
        if (!qFuzzyCompare(vt.zoom(), 1.08)) {
            printf("FAILED: wheel up should give 1.08, got %.4f\n", vt.zoom());
            return false;
        }
        if (QLineF(vt.screenToImage(QPointF(50, 50)), QPointF(50, 50)).length() > 1e-6) {
            printf("FAILED: wheel zoom moved the anchor\n");
            return false;
        }

        vt.setZoom(1.0);
        vt.wheelZoom(-120, QPointF(0, 0));
        if (!qFuzzyCompare(vt.zoom(), 0.92)) {
            printf("FAILED: wheel down should give 0.92, got %.4f\n", vt.zoom());
            return false;
        }

        // Repeated zoom-out stops at the minimum
        for (int i = 0; i < 200; ++i) {
            vt.wheelZoom(-120, QPointF(10, 10));
        }
        if (!qFuzzyCompare(vt.zoom(), vt.minZoom())) {
            printf("FAILED: wheel zoom went past the minimum\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    // ===== Fit =====

    /**
     * @brief Fit centers the image and stays within the zoom range, even for
     *        degenerate viewports.
     */
    static bool testFitToViewport() {
        printf("  testFitToViewport... ");

        ViewportTransform vt;
        vt.setImageSize(QSize(1000, 500));
        vt.fitToViewport(QSizeF(800, 600));

        if (!qFuzzyCompare(vt.zoom(), 0.8)) {
            printf("FAILED: expected zoom 0.8, got %.4f\n", vt.zoom());
            return false;
        }
        // 1000x500 at 0.8 = 800x400, centered vertically in 600
        if (!qFuzzyCompare(vt.translation().y(), 100.0) || qAbs(vt.translation().x()) > 1e-9) {
            printf("FAILED: not centered, t=(%.2f, %.2f)\n", vt.translation().x(), vt.translation().y());
            return false;
        }

        const QSizeF degenerate[] = { QSizeF(0, 0), QSizeF(-50, 300), QSizeF(10, -10) };
        for (const QSizeF& size : degenerate) {
            vt.fitToViewport(size);
            if (vt.zoom() < vt.minZoom() || vt.zoom() > vt.maxZoom() || std::isnan(vt.zoom())) {
                printf("FAILED: degenerate viewport gave zoom %.4f\n", vt.zoom());
                return false;
            }
        }

        // Tiny image in a big viewport caps at max zoom
        vt.setImageSize(QSize(2, 2));
        vt.fitToViewport(QSizeF(4000, 4000));
        if (!qFuzzyCompare(vt.zoom(), vt.maxZoom())) {
            printf("FAILED: fit should cap at max zoom\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    // ===== Conversion & Pan =====

    static bool testConversionAndPan() {
        printf("  testConversionAndPan... ");

        ViewportTransform vt;
        vt.setZoom(2.0);
        vt.setTranslation(QPointF(10, 20));

        if (vt.screenToImage(QPointF(30, 60)) != QPointF(10, 20)) {
            printf("FAILED: screenToImage\n");
            return false;
        }
        if (vt.imageToScreen(QPointF(10, 20)) != QPointF(30, 60)) {
            printf("FAILED: imageToScreen\n");
            return false;
        }

        vt.pan(QPointF(5, -5));
        if (vt.translation() != QPointF(15, 15) || !qFuzzyCompare(vt.zoom(), 2.0)) {
            printf("FAILED: pan should only move the translation\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    // ===== Interaction State Machine =====

    static bool testStateMachine() {
        printf("  testStateMachine... ");

        ViewportTransform vt;

        // Left press off the image does not start drawing
        if (vt.pressButton(Qt::LeftButton, false) || vt.state() != InteractionState::Idle) {
            printf("FAILED: left press off canvas should stay Idle\n");
            return false;
        }

        if (!vt.pressButton(Qt::LeftButton, true) || !vt.isDrawing()) {
            printf("FAILED: left press should start drawing\n");
            return false;
        }
        // Right press while drawing must not start panning
        if (vt.pressButton(Qt::RightButton, true) || !vt.isDrawing()) {
            printf("FAILED: right press while drawing changed state\n");
            return false;
        }
        // Releasing another button does not end the stroke
        if (vt.releaseButton(Qt::RightButton) || !vt.isDrawing()) {
            printf("FAILED: foreign release ended drawing\n");
            return false;
        }
        if (!vt.releaseButton(Qt::LeftButton) || vt.state() != InteractionState::Idle) {
            printf("FAILED: left release should return to Idle\n");
            return false;
        }

        if (!vt.pressButton(Qt::MiddleButton, false) || !vt.isPanning()) {
            printf("FAILED: middle press should pan\n");
            return false;
        }
        vt.releaseButton(Qt::MiddleButton);

        if (!vt.pressButton(Qt::RightButton, true) || !vt.isPanning()) {
            printf("FAILED: right press when idle should pan\n");
            return false;
        }
        vt.resetState();
        if (vt.state() != InteractionState::Idle) {
            printf("FAILED: resetState\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    static bool runAllTests() {
        printf("\n=== ViewportTransform Unit Tests ===\n\n");

        int passed = 0;
        int failed = 0;

        auto runTest = [&](bool (*test)(), const char* name) {
            if (test()) {
                passed++;
            } else {
                failed++;
                printf("  [FAILED] %s\n", name);
            }
        };

        runTest(testZoomClamping, "testZoomClamping");
        runTest(testAnchorPreserved, "testAnchorPreserved");
        runTest(testWheelZoom, "testWheelZoom");
        runTest(testFitToViewport, "testFitToViewport");
        runTest(testConversionAndPan, "testConversionAndPan");
        runTest(testStateMachine, "testStateMachine");

        printf("\n=== Results: %d passed, %d failed ===\n\n", passed, failed);

        return failed == 0;
    }
};
