#pragma once

// ============================================================================
// StrokeOrchestrator - Routes pointer input into the mask editing session
// ============================================================================
// Coordinates one stroke from press to release:
//
//   Press   -> undo snapshot, compositor enters live mode, first dab
//   Move    -> dab (or line of dabs) on BOTH the preview mask and the
//              full-resolution mask; damage accumulated at full resolution
//   Release -> compositor leaves live mode, recomposites the damage once
//
// Panning and wheel zoom go to the ViewportTransform. The orchestrator does
// no painting of its own: it emits signals the canvas widget repaints from.
//
// Input is widget-agnostic (PointerEvent), so the whole flow is testable
// without a window.
// ============================================================================

#include "BrushTool.h"
#include "DamageTracker.h"
#include "ViewportTransform.h"

#include <QObject>
#include <QColor>
#include <QPointF>
#include <QVector>

class MaskSession;

/**
 * @brief Widget-agnostic pointer event.
 */
struct PointerEvent {
    enum Type { Press, Move, Release };

    Type type = Move;
    QPointF screenPos;                          ///< Position in canvas widget coordinates
    Qt::MouseButton button = Qt::NoButton;      ///< Button that changed (Press/Release)
    Qt::MouseButtons buttons = Qt::NoButton;    ///< Buttons held
};

/**
 * @brief Per-stroke bookkeeping, discarded on release.
 */
struct StrokeState {
    QVector<QPointF> points;    ///< Image-space points received during the stroke
    QPoint lastPoint;           ///< Last full-resolution pixel stamped
    DamageTracker damage;       ///< Full-resolution area touched so far

    bool isEmpty() const { return points.isEmpty(); }
    void clear()
    {
        points.clear();
        lastPoint = QPoint();
        damage.clear();
    }
};

class StrokeOrchestrator : public QObject {
    Q_OBJECT

public:
    /**
     * @param session Open session to edit (not owned, must outlive this object).
     */
    explicit StrokeOrchestrator(MaskSession* session, QObject* parent = nullptr);

    MaskSession* session() const { return m_session; }
    bool hasSession() const;

    ViewportTransform& transform() { return m_transform; }
    const ViewportTransform& transform() const { return m_transform; }

    // ===== Brush =====

    void setBrushSize(int size);
    int brushSize() const { return m_brushSize; }
    int brushRadius() const;

    /**
     * @brief Set the paint color. Alpha is ignored (mask color is always opaque).
     */
    void setBrushColor(const QColor& color);
    QColor brushColor() const { return m_brushColor; }

    void setBrushTool(BrushTool tool);
    BrushTool brushTool() const { return m_tool; }

    // ===== Input =====

    void handlePointerEvent(const PointerEvent& pe);

    /**
     * @brief One wheel event: zoom by the configured step anchored at @p screenPos.
     */
    void handleWheel(int angleDelta, const QPointF& screenPos);

    /**
     * @brief Abort any gesture in progress (e.g. focus lost).
     *
     * A stroke in progress is finished as if the button had been released, so
     * the display never stays in live mode.
     */
    void cancelActiveGesture();

    InteractionState state() const { return m_transform.state(); }
    const StrokeState& strokeState() const { return m_stroke; }

    // ===== Navigation =====

    void fitToViewport(const QSizeF& viewportSize);

    /**
     * @brief Set an absolute zoom level anchored at @p screenAnchor.
     */
    void setZoom(qreal zoom, const QPointF& screenAnchor);

    // ===== Actions =====

    /**
     * @brief Restore the most recent snapshot.
     * @return false if there is nothing to undo or a stroke is in progress.
     */
    bool undo();
    bool canUndo() const;

    /**
     * @brief Clear the whole mask (undoable).
     * @return false if a stroke is in progress or there is no session.
     */
    bool resetMask();

signals:
    /// Full-resolution display changed within @p imageRect (working-image coordinates)
    void displayChanged(const QRect& imageRect);

    /// Live preview changed within @p previewRect (preview coordinates)
    void previewChanged(const QRect& previewRect);

    void liveModeChanged(bool live);
    void transformChanged();
    void undoAvailableChanged(bool available);
    void maskModified();
    void brushChanged();

private:
    void handlePointerPress(const PointerEvent& pe);
    void handlePointerMove(const PointerEvent& pe);
    void handlePointerRelease(const PointerEvent& pe);

    void beginStroke(const QPointF& imagePt);
    void continueStroke(const QPointF& imagePt);
    void endStroke();

    static QPoint toPixel(const QPointF& imagePt);
    bool isOverImage(const QPointF& imagePt) const;
    bool isErasing() const { return m_tool == BrushTool::Erase; }

    MaskSession* m_session = nullptr;
    ViewportTransform m_transform;
    StrokeState m_stroke;
    QPointF m_lastPanPos;

    int m_brushSize = 20;
    QColor m_brushColor = QColor(255, 0, 0);
    BrushTool m_tool = BrushTool::Paint;
};
