#pragma once

// ============================================================================
// DualResolutionCompositor - Full-res mask + reduced-res live preview
// ============================================================================
// Two buffer roles are kept on purpose:
//
// FULL RESOLUTION (authoritative)
//   - m_maskLayer: the mask being edited, same size as the working image
//   - m_display:   working image blended with the mask, recomposited only
//                  over damaged rectangles
//
// PREVIEW RESOLUTION (live stroke feedback, previewScale of the working size)
//   - m_previewImage:   nearest-neighbor copy of the working image (static)
//   - m_previewMask:    preview copy of the mask, synced on demand
//   - m_previewBase:    opaque render of m_previewImage, built once per stroke
//   - m_previewOverlay: ONLY the preview mask pixels, no blend
//
// While a stroke is live the display layer draws m_previewBase and then
// m_previewOverlay on top, both scaled up by 1/previewScale. Mouse moves
// therefore only copy mask pixels into the overlay instead of re-blending
// image and mask, which is what makes painting on large images responsive.
// On stroke end the full-resolution display is recomposited once over the
// accumulated damage rectangle.
// ============================================================================

#include "PixelBuffer.h"

#include <QColor>
#include <QImage>
#include <QPoint>
#include <QPointF>
#include <QRect>

class DualResolutionCompositor {
public:
    /// CUSTOMIZABLE: Preview resolution relative to the working image (range: 0.1-1.0)
    static constexpr qreal DEFAULT_PREVIEW_SCALE = 0.5;

    explicit DualResolutionCompositor(qreal previewScale = DEFAULT_PREVIEW_SCALE);

    // ===== Setup =====

    /**
     * @brief Set the working image (never mutated afterwards).
     *
     * Rebuilds the preview pair and the display. If the current mask does not
     * match the new size it is replaced by an empty mask.
     */
    void setWorkingImage(const PixelBuffer& workingImage);
    const PixelBuffer& workingImage() const { return m_workingImage; }

    /**
     * @brief True once a non-null working image has been set.
     */
    bool hasImage() const { return !m_workingImage.isNull(); }

    /**
     * @brief Change the preview scale (clamped to (0, 1]); rebuilds preview buffers.
     */
    void setPreviewScale(qreal scale);
    qreal previewScale() const { return m_previewScale; }

    /**
     * @brief Size of the preview pair: max(1, round(working × previewScale)).
     */
    QSize previewSize() const;

    // ===== Mask Layer =====

    const PixelBuffer& maskLayer() const { return m_maskLayer; }

    /**
     * @brief Mutable access for the full-resolution brush pass.
     *
     * Callers that write through this reference are responsible for calling
     * composite() (or exitLiveMode()) over the damaged area afterwards.
     */
    PixelBuffer& maskLayer() { return m_maskLayer; }

    /**
     * @brief Replace the mask (e.g. restoring an undo snapshot).
     * @return False if the buffer size does not match the working image; the
     *         mask is then left unchanged.
     *
     * Recomposites the full display and resyncs the preview if live.
     */
    bool setMaskLayer(const PixelBuffer& mask);

    /**
     * @brief Clear the mask to fully transparent and recomposite.
     */
    void clearMask();

    // ===== Live Mode =====

    /**
     * @brief Prepare preview buffers for a stroke.
     *
     * Downsamples the mask into the preview mask (nearest neighbor), copies it
     * into the overlay and renders the static preview base image.
     */
    void enterLiveMode();

    /**
     * @brief Stamp into the preview mask and overlay only.
     * @param imagePoint Center in working-image coordinates.
     * @param radius Radius in working-image pixels.
     * @return Affected rectangle in PREVIEW coordinates.
     */
    QRect drawLive(const QPointF& imagePoint, int radius, const QColor& color, bool erase);

    /**
     * @brief Stamp a gap-free segment into the preview mask and overlay.
     * @param from,to Segment endpoints in working-image coordinates.
     * @return Affected rectangle in PREVIEW coordinates.
     */
    QRect drawLiveSegment(const QPoint& from, const QPoint& to, int radius,
                          const QColor& color, bool erase);

    /**
     * @brief Leave live mode and recomposite the full-res display once.
     * @param damage Region touched by the stroke; empty means the whole image.
     */
    void exitLiveMode(const QRect& damage);

    bool isLive() const { return m_live; }

    /**
     * @brief Re-copy the full mask into the preview mask and overlay.
     */
    void syncMaskToPreview();

    // ===== Compositing =====

    /**
     * @brief Blend working image and mask into the display for @p rect.
     *
     * The rectangle is clamped to the image bounds first.
     */
    void composite(const QRect& rect);

    /**
     * @brief Recomposite the entire display.
     */
    void compositeAll();

    /**
     * @brief Blend rule for a single pixel.
     *
     * alpha 255 -> mask RGB, alpha 0 -> image RGB, otherwise a linear blend
     * weighted by the mask alpha. The result is always fully opaque.
     */
    static QRgb blendPixel(QRgb imagePixel, QRgb maskPixel);

    // ===== Display Accessors =====

    const QImage& displayImage() const { return m_display; }
    const QImage& previewBaseImage() const { return m_previewBase; }
    const QImage& previewOverlayImage() const { return m_previewOverlay; }
    const PixelBuffer& previewMask() const { return m_previewMask; }
    const PixelBuffer& previewImage() const { return m_previewImage; }

    /**
     * @brief Map a preview-space rectangle to working-image coordinates (rounded out).
     */
    QRect previewRectToImage(const QRect& previewRect) const;

private:
    void ensurePreviewBuffers();
    void renderPreviewBase();
    void copyPreviewMaskToOverlay(const QRect& previewRect);
    int previewRadius(int radius) const;
    QPoint toPreview(const QPointF& imagePoint) const;

    PixelBuffer m_workingImage;
    PixelBuffer m_maskLayer;
    QImage m_display;

    qreal m_previewScale = DEFAULT_PREVIEW_SCALE;
    PixelBuffer m_previewImage;
    PixelBuffer m_previewMask;
    QImage m_previewBase;
    QImage m_previewOverlay;

    bool m_live = false;
};
