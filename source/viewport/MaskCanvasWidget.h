// ============================================================================
// MaskCanvasWidget - Displays the mask session and feeds it pointer input
// ============================================================================
// Two paint paths:
//
// LIVE (stroke in progress):
//   preview base + preview overlay, scaled up by 1/previewScale with
//   nearest-neighbor sampling. Only the preview pair changes per move, so
//   a repaint never touches the full-resolution display image.
//
// IDLE:
//   the compositor's full-resolution display image.
//
// In mask-only view the mask is drawn over the checkerboard instead of the
// image. The brush cursor is a black circle of brush-size diameter (image
// pixels) following the pointer.
//
// The widget owns no editing state: mouse and wheel events are converted to
// PointerEvent and handed to the StrokeOrchestrator.
// ============================================================================

#pragma once

#include <QWidget>
#include <QPointer>

class StrokeOrchestrator;
class CheckerboardPattern;

class MaskCanvasWidget : public QWidget {
    Q_OBJECT

public:
    explicit MaskCanvasWidget(QWidget* parent = nullptr);
    ~MaskCanvasWidget() override = default;

    // ===== Configuration =====

    /**
     * @brief Attach the orchestrator to display and drive.
     * @param orchestrator Not owned. The widget refits the image on attach.
     */
    void setOrchestrator(StrokeOrchestrator* orchestrator);
    StrokeOrchestrator* orchestrator() const { return m_orchestrator; }

    /**
     * @brief Set the backdrop for the mask-only view.
     * @param pattern Not owned, must outlive the widget.
     */
    void setCheckerboard(const CheckerboardPattern* pattern);

    void setMaskOnlyView(bool maskOnly);
    bool maskOnlyView() const { return m_maskOnly; }

    /**
     * @brief Fit the whole image into the widget and center it.
     */
    void fitToView();

    // ===== Cursor =====

    bool isCursorVisible() const { return m_cursorVisible; }
    QPointF cursorPos() const { return m_cursorPos; }

    /**
     * @brief Screen-space bounds of the brush cursor at the current position.
     */
    QRectF cursorRect() const;

signals:
    /**
     * @brief Emitted when the zoom level changes.
     * @param zoom New zoom level (1.0 = 100%).
     */
    void zoomChanged(qreal zoom);

protected:
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void leaveEvent(QEvent* event) override;
    void focusOutEvent(QFocusEvent* event) override;

private slots:
    void onDisplayChanged(const QRect& imageRect);
    void onPreviewChanged(const QRect& previewRect);
    void onLiveModeChanged(bool live);
    void onTransformChanged();

private:
    void paintMaskOnly(QPainter& painter);
    void paintLive(QPainter& painter);
    void paintDisplay(QPainter& painter);
    void paintCursor(QPainter& painter);

    void moveCursor(const QPointF& pos);
    void updateImageRect(const QRect& imageRect);
    bool hasSession() const;

    QPointer<StrokeOrchestrator> m_orchestrator;
    const CheckerboardPattern* m_checkerboard = nullptr;

    bool m_maskOnly = false;
    bool m_cursorVisible = false;
    QPointF m_cursorPos;
};
