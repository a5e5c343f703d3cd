#pragma once

// ============================================================================
// ViewportTransform - Zoom/pan mapping between screen and image space
// ============================================================================
// The canvas shows the working image under a uniform scale (zoom) followed by
// a translation, both in screen pixels:
//
//     screenPt = imagePt * zoom + translation
//     imagePt  = (screenPt - translation) / zoom
//
// Also owns the pointer interaction state machine (Idle / Drawing / Panning)
// so drawing and panning can never be active at the same time.
// ============================================================================

#include <QPointF>
#include <QRectF>
#include <QSize>
#include <QSizeF>
#include <qnamespace.h>

/**
 * @brief Pointer interaction state. Exactly one is active at a time.
 */
enum class InteractionState {
    Idle,       ///< No button held
    Drawing,    ///< Left button held, a stroke is in progress
    Panning     ///< Middle (or right) button held, dragging the view
};

class ViewportTransform {
public:
    // ----- Zoom Limits -----
    /// CUSTOMIZABLE: Minimum zoom level (range: 0.01-1.0)
    static constexpr qreal DEFAULT_MIN_ZOOM = 0.1;   // 10%
    /// CUSTOMIZABLE: Maximum zoom level (range: 2.0-50.0)
    static constexpr qreal DEFAULT_MAX_ZOOM = 10.0;  // 1000%
    /// CUSTOMIZABLE: Relative zoom change per wheel event
    static constexpr qreal DEFAULT_WHEEL_STEP = 0.08; // 8%

    ViewportTransform() = default;

    // ===== Configuration =====

    /**
     * @brief Set the size of the image being displayed (working resolution).
     */
    void setImageSize(const QSize& size) { m_imageSize = size; }
    QSize imageSize() const { return m_imageSize; }

    /**
     * @brief Set the allowed zoom range.
     *
     * Non-positive or inverted bounds fall back to the defaults. The current
     * zoom is re-clamped into the new range.
     */
    void setZoomRange(qreal minZoom, qreal maxZoom);
    qreal minZoom() const { return m_minZoom; }
    qreal maxZoom() const { return m_maxZoom; }

    /**
     * @brief Set the relative zoom step applied per wheel event (e.g. 0.08 = 8%).
     */
    void setWheelStep(qreal step);
    qreal wheelStep() const { return m_wheelStep; }

    // ===== Transform State =====

    qreal zoom() const { return m_zoom; }
    QPointF translation() const { return m_translation; }

    /**
     * @brief Set the zoom directly, keeping the translation (clamped to range).
     */
    void setZoom(qreal zoom);
    void setTranslation(const QPointF& translation) { m_translation = translation; }

    // ===== Coordinate Conversion =====

    QPointF screenToImage(const QPointF& screenPt) const;
    QPointF imageToScreen(const QPointF& imagePt) const;
    QRectF imageRectToScreen(const QRectF& imageRect) const;

    /**
     * @brief Screen-space rectangle covered by the whole image.
     */
    QRectF imageScreenRect() const;

    // ===== Navigation =====

    /**
     * @brief Zoom so the image point under @p screenAnchor stays under it.
     * @param targetZoom Requested zoom (clamped to [minZoom, maxZoom]).
     * @param screenAnchor Anchor in screen coordinates.
     */
    void zoomAtAnchor(qreal targetZoom, const QPointF& screenAnchor);

    /**
     * @brief Fit the whole image inside the viewport and center it.
     *
     * Degenerate (zero or negative) viewport sizes clamp the zoom to
     * minZoom() instead of failing.
     */
    void fitToViewport(const QSizeF& viewportSize);

    /**
     * @brief Translate the view by a screen-space delta (not scaled by zoom).
     */
    void pan(const QPointF& deltaScreen);

    /**
     * @brief Apply one wheel event: zoom by ±wheelStep() anchored at the pointer.
     * @param angleDelta Wheel delta; only its sign is used.
     */
    void wheelZoom(int angleDelta, const QPointF& screenAnchor);

    // ===== Interaction State Machine =====

    InteractionState state() const { return m_state; }
    bool isDrawing() const { return m_state == InteractionState::Drawing; }
    bool isPanning() const { return m_state == InteractionState::Panning; }

    /**
     * @brief Feed a button press into the state machine.
     * @param button The pressed button.
     * @param overCanvas True if the pointer is over the image.
     * @return True if the press caused a state transition.
     *
     * Idle -> Drawing on left press over the canvas.
     * Idle -> Panning on middle press, or right press (never while drawing).
     * Presses in any other state are ignored.
     */
    bool pressButton(Qt::MouseButton button, bool overCanvas);

    /**
     * @brief Feed a button release into the state machine.
     * @return True if the release returned the machine to Idle.
     *
     * Only the button that started the current state ends it.
     */
    bool releaseButton(Qt::MouseButton button);

    /**
     * @brief Force the machine back to Idle (e.g. focus lost mid-gesture).
     */
    void resetState();

private:
    qreal clampZoom(qreal zoom) const;

    QSize m_imageSize;
    qreal m_zoom = 1.0;
    QPointF m_translation;

    qreal m_minZoom = DEFAULT_MIN_ZOOM;
    qreal m_maxZoom = DEFAULT_MAX_ZOOM;
    qreal m_wheelStep = DEFAULT_WHEEL_STEP;

    InteractionState m_state = InteractionState::Idle;
    Qt::MouseButton m_activeButton = Qt::NoButton;
};
