#pragma once

// ============================================================================
// CompositorTests - Unit tests for DualResolutionCompositor and DamageTracker
// ============================================================================
// Run with: maskpainter --test-compositor
// ============================================================================

#include "DualResolutionCompositor.h"
#include "DamageTracker.h"
#include "BrushStampEngine.h"
#include "PixelBuffer.h"

#include <QDebug>

namespace CompositorTests {

inline PixelBuffer makeSolidImage(int w, int h, QRgb color)
{
    return PixelBuffer(w, h, color);
}

/**
 * @brief Opaque mask pixels show the mask color, transparent ones the image.
 */
inline bool testBlendRule()
{
    qDebug() << "=== Test: Blend Rule ===";

    const QRgb image = qRgba(10, 20, 30, 255);
    bool success = true;

    if (DualResolutionCompositor::blendPixel(image, qRgba(200, 0, 0, 255)) != qRgba(200, 0, 0, 255)) {
        qDebug() << "FAIL: opaque mask should replace the image pixel";
        success = false;
    }
    if (DualResolutionCompositor::blendPixel(image, qRgba(200, 0, 0, 0)) != image) {
        qDebug() << "FAIL: transparent mask should leave the image pixel";
        success = false;
    }

    // Half-transparent mask: result between both, always opaque
    const QRgb half = DualResolutionCompositor::blendPixel(qRgba(0, 0, 0, 255), qRgba(255, 255, 255, 128));
    if (qAlpha(half) != 255 || qRed(half) < 120 || qRed(half) > 135) {
        qDebug() << "FAIL: partial blend gave" << qRed(half) << "alpha" << qAlpha(half);
        success = false;
    }

    // Image alpha never leaks into the display
    if (qAlpha(DualResolutionCompositor::blendPixel(qRgba(1, 2, 3, 0), qRgba(0, 0, 0, 0))) != 255) {
        qDebug() << "FAIL: display pixel should always be opaque";
        success = false;
    }

    qDebug() << (success ? "PASSED" : "FAILED");
    return success;
}

/**
 * @brief Preview pair is max(1, round(working * scale)) on each axis.
 */
inline bool testPreviewSizes()
{
    qDebug() << "=== Test: Preview Sizes ===";

    bool success = true;
    DualResolutionCompositor compositor;

    compositor.setWorkingImage(makeSolidImage(1000, 750, qRgba(50, 50, 50, 255)));
    if (compositor.previewSize() != QSize(500, 375)) {
        qDebug() << "FAIL: 1000x750 at 0.5 gave" << compositor.previewSize();
        success = false;
    }
    if (compositor.previewMask().size() != QSize(500, 375)
        || compositor.previewBaseImage().size() != QSize(500, 375)
        || compositor.previewOverlayImage().size() != QSize(500, 375)) {
        qDebug() << "FAIL: preview buffers not allocated at preview size";
        success = false;
    }

    // Tiny images never get a zero-sized preview
    compositor.setWorkingImage(makeSolidImage(1, 3, qRgba(0, 0, 0, 255)));
    if (compositor.previewSize() != QSize(1, 2)) {
        qDebug() << "FAIL: 1x3 at 0.5 gave" << compositor.previewSize();
        success = false;
    }

    // Invalid scale falls back to the default
    compositor.setPreviewScale(0.0);
    if (!qFuzzyCompare(compositor.previewScale(), DualResolutionCompositor::DEFAULT_PREVIEW_SCALE)) {
        qDebug() << "FAIL: zero preview scale accepted";
        success = false;
    }

    compositor.setWorkingImage(makeSolidImage(400, 300, qRgba(0, 0, 0, 255)));
    compositor.setPreviewScale(0.25);
    if (compositor.previewSize() != QSize(100, 75) || compositor.previewMask().size() != QSize(100, 75)) {
        qDebug() << "FAIL: rescaled preview gave" << compositor.previewSize();
        success = false;
    }

    qDebug() << (success ? "PASSED" : "FAILED");
    return success;
}

/**
 * @brief Mask layer always matches the working image; setMaskLayer rejects mismatches.
 */
inline bool testMaskDimensions()
{
    qDebug() << "=== Test: Mask Dimensions ===";

    bool success = true;
    DualResolutionCompositor compositor;
    compositor.setWorkingImage(makeSolidImage(120, 80, qRgba(0, 0, 255, 255)));

    if (compositor.maskLayer().size() != QSize(120, 80)) {
        qDebug() << "FAIL: mask size" << compositor.maskLayer().size();
        success = false;
    }
    if (compositor.maskLayer().countNonTransparent() != 0) {
        qDebug() << "FAIL: new mask should be fully transparent";
        success = false;
    }
    if (compositor.setMaskLayer(PixelBuffer(60, 40))) {
        qDebug() << "FAIL: mismatched mask accepted";
        success = false;
    }
    if (!compositor.setMaskLayer(PixelBuffer(120, 80, qRgba(255, 0, 0, 255)))) {
        qDebug() << "FAIL: matching mask rejected";
        success = false;
    }
    if (compositor.displayImage().pixel(5, 5) != qRgba(255, 0, 0, 255)) {
        qDebug() << "FAIL: display not recomposited after setMaskLayer";
        success = false;
    }

    compositor.clearMask();
    if (compositor.maskLayer().countNonTransparent() != 0
        || compositor.displayImage().pixel(5, 5) != qRgba(0, 0, 255, 255)) {
        qDebug() << "FAIL: clearMask did not clear mask and display";
        success = false;
    }

    qDebug() << (success ? "PASSED" : "FAILED");
    return success;
}

/**
 * @brief Entering live mode downsamples the mask into the preview.
 */
inline bool testSyncToPreview()
{
    qDebug() << "=== Test: Sync Mask To Preview ===";

    bool success = true;
    DualResolutionCompositor compositor;
    compositor.setWorkingImage(makeSolidImage(100, 100, qRgba(0, 0, 0, 255)));

    // Paint the left half of the full-res mask
    PixelBuffer& mask = compositor.maskLayer();
    for (int y = 0; y < 100; ++y) {
        for (int x = 0; x < 50; ++x) {
            mask.setPixel(x, y, qRgba(0, 255, 0, 255));
        }
    }

    compositor.enterLiveMode();
    if (!compositor.isLive()) {
        qDebug() << "FAIL: not in live mode";
        success = false;
    }

    // Preview pixel x samples source column min(99, round(x * 2))
    const PixelBuffer& preview = compositor.previewMask();
    if (preview.pixel(10, 10) != qRgba(0, 255, 0, 255)) {
        qDebug() << "FAIL: preview left half not synced";
        success = false;
    }
    if (qAlpha(preview.pixel(40, 10)) != 0) {
        qDebug() << "FAIL: preview right half should be transparent";
        success = false;
    }
    if (compositor.previewOverlayImage().pixel(10, 10) != qRgba(0, 255, 0, 255)) {
        qDebug() << "FAIL: overlay not copied from preview mask";
        success = false;
    }
    if (qAlpha(compositor.previewBaseImage().pixel(40, 40)) != 255) {
        qDebug() << "FAIL: preview base should be opaque";
        success = false;
    }

    qDebug() << (success ? "PASSED" : "FAILED");
    return success;
}

/**
 * @brief A live stroke shows in the preview immediately and in the display
 *        only after exitLiveMode.
 */
inline bool testLiveStrokeFlow()
{
    qDebug() << "=== Test: Live Stroke Flow ===";

    bool success = true;
    DualResolutionCompositor compositor;
    compositor.setWorkingImage(makeSolidImage(200, 200, qRgba(100, 100, 100, 255)));
    compositor.enterLiveMode();

    const QRect previewDirty = compositor.drawLive(QPointF(100, 100), 10, Qt::red, false);
    const QRect fullDirty = BrushStampEngine::stamp(compositor.maskLayer(), QPoint(100, 100), 10,
                                                    Qt::red, false);

    if (previewDirty.isEmpty() || qAlpha(compositor.previewMask().pixel(50, 50)) != 255) {
        qDebug() << "FAIL: preview dab missing";
        success = false;
    }
    if (compositor.displayImage().pixel(100, 100) != qRgba(100, 100, 100, 255)) {
        qDebug() << "FAIL: display changed during live mode";
        success = false;
    }

    const QRect mapped = compositor.previewRectToImage(previewDirty);
    if (!mapped.contains(QPoint(100, 100))) {
        qDebug() << "FAIL: preview rect maps to" << mapped;
        success = false;
    }

    compositor.exitLiveMode(fullDirty);
    if (compositor.isLive()) {
        qDebug() << "FAIL: still live after exit";
        success = false;
    }
    if (compositor.displayImage().pixel(100, 100) != qRgba(255, 0, 0, 255)) {
        qDebug() << "FAIL: display not recomposited on exit";
        success = false;
    }
    if (compositor.displayImage().pixel(150, 150) != qRgba(100, 100, 100, 255)) {
        qDebug() << "FAIL: untouched display pixel changed";
        success = false;
    }

    qDebug() << (success ? "PASSED" : "FAILED");
    return success;
}

/**
 * @brief Operations on a compositor without an image are harmless no-ops.
 */
inline bool testNullImage()
{
    qDebug() << "=== Test: Null Image ===";

    bool success = true;
    DualResolutionCompositor compositor;

    compositor.enterLiveMode();
    compositor.composite(QRect(0, 0, 10, 10));
    compositor.exitLiveMode(QRect());

    if (compositor.hasImage() || compositor.isLive()) {
        qDebug() << "FAIL: compositor without image reports state";
        success = false;
    }
    if (!compositor.drawLive(QPointF(1, 1), 3, Qt::red, false).isEmpty()) {
        qDebug() << "FAIL: drawLive without image returned damage";
        success = false;
    }
    if (compositor.previewSize().isValid()) {
        qDebug() << "FAIL: preview size without image";
        success = false;
    }

    qDebug() << (success ? "PASSED" : "FAILED");
    return success;
}

/**
 * @brief Damage accumulates as a union clamped to bounds and resets on flush.
 */
inline bool testDamageTracker()
{
    qDebug() << "=== Test: Damage Tracker ===";

    bool success = true;
    DamageTracker tracker(QRect(0, 0, 100, 100));

    tracker.accumulate(QRect(10, 10, 5, 5));
    tracker.accumulate(QRect(50, 60, 10, 10));
    tracker.accumulate(QRect());   // ignored
    if (tracker.current() != QRect(QPoint(10, 10), QPoint(59, 69))) {
        qDebug() << "FAIL: union is" << tracker.current();
        success = false;
    }

    tracker.accumulate(QRect(90, 90, 50, 50));
    if (tracker.current().bottomRight() != QPoint(99, 99)) {
        qDebug() << "FAIL: damage not clamped:" << tracker.current();
        success = false;
    }

    const QRect flushed = tracker.flushAndClear();
    if (flushed.isEmpty() || !tracker.isEmpty()) {
        qDebug() << "FAIL: flushAndClear did not hand over and reset";
        success = false;
    }

    tracker.accumulate(QRect(-20, -20, 10, 10));
    if (!tracker.isEmpty()) {
        qDebug() << "FAIL: out-of-bounds rect should add nothing";
        success = false;
    }

    qDebug() << (success ? "PASSED" : "FAILED");
    return success;
}

/**
 * @brief Run all compositor tests.
 */
inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running Compositor Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testBlendRule();
    allPass &= testPreviewSizes();
    allPass &= testMaskDimensions();
    allPass &= testSyncToPreview();
    allPass &= testLiveStrokeFlow();
    allPass &= testNullImage();
    allPass &= testDamageTracker();

    qDebug() << "\n========================================";
    qDebug() << (allPass ? "ALL TESTS PASSED!" : "SOME TESTS FAILED!");
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace CompositorTests
