// ============================================================================
// StrokeOrchestrator - Implementation
// ============================================================================

#include "StrokeOrchestrator.h"
#include "BrushStampEngine.h"
#include "MaskSession.h"

#include <QDebug>
#include <QtMath>

StrokeOrchestrator::StrokeOrchestrator(MaskSession* session, QObject* parent)
    : QObject(parent)
    , m_session(session)
{
    if (!m_session) {
        qWarning() << "StrokeOrchestrator: created without a session";
        return;
    }

    const MaskSettings& settings = m_session->settings();
    m_transform.setImageSize(m_session->workingImage().size());
    m_transform.setZoomRange(settings.zoomMin, settings.zoomMax);
    m_transform.setWheelStep(settings.wheelZoomStep);

    m_brushSize = settings.brushSize;
    setBrushColor(settings.brushColor);
}

bool StrokeOrchestrator::hasSession() const
{
    return m_session && m_session->isOpen();
}

// ===== Brush =====

void StrokeOrchestrator::setBrushSize(int size)
{
    size = qBound(MaskSettings::MIN_BRUSH_SIZE, size, MaskSettings::MAX_BRUSH_SIZE);
    if (size == m_brushSize) {
        return;
    }
    m_brushSize = size;
    emit brushChanged();
}

int StrokeOrchestrator::brushRadius() const
{
    return BrushStampEngine::radiusForBrushSize(m_brushSize);
}

void StrokeOrchestrator::setBrushColor(const QColor& color)
{
    if (!color.isValid()) {
        return;
    }
    QColor opaque = color;
    opaque.setAlpha(255);
    if (opaque == m_brushColor) {
        return;
    }
    m_brushColor = opaque;
    emit brushChanged();
}

void StrokeOrchestrator::setBrushTool(BrushTool tool)
{
    if (tool == m_tool) {
        return;
    }
    m_tool = tool;
    emit brushChanged();
}

// ===== Input =====

void StrokeOrchestrator::handlePointerEvent(const PointerEvent& pe)
{
    if (!hasSession()) {
        return;
    }

    switch (pe.type) {
        case PointerEvent::Press:
            handlePointerPress(pe);
            break;
        case PointerEvent::Move:
            handlePointerMove(pe);
            break;
        case PointerEvent::Release:
            handlePointerRelease(pe);
            break;
    }
}

void StrokeOrchestrator::handlePointerPress(const PointerEvent& pe)
{
    const QPointF imagePt = m_transform.screenToImage(pe.screenPos);
    if (!m_transform.pressButton(pe.button, isOverImage(imagePt))) {
        return;
    }

    if (m_transform.isDrawing()) {
        beginStroke(imagePt);
    } else if (m_transform.isPanning()) {
        m_lastPanPos = pe.screenPos;
    }
}

void StrokeOrchestrator::handlePointerMove(const PointerEvent& pe)
{
    if (m_transform.isDrawing()) {
        continueStroke(m_transform.screenToImage(pe.screenPos));
    } else if (m_transform.isPanning()) {
        const QPointF delta = pe.screenPos - m_lastPanPos;
        m_lastPanPos = pe.screenPos;
        if (!delta.isNull()) {
            m_transform.pan(delta);
            emit transformChanged();
        }
    }
}

void StrokeOrchestrator::handlePointerRelease(const PointerEvent& pe)
{
    const bool wasDrawing = m_transform.isDrawing();
    if (!m_transform.releaseButton(pe.button)) {
        return;
    }
    if (wasDrawing) {
        endStroke();
    }
}

void StrokeOrchestrator::handleWheel(int angleDelta, const QPointF& screenPos)
{
    if (!hasSession() || angleDelta == 0) {
        return;
    }
    const qreal before = m_transform.zoom();
    m_transform.wheelZoom(angleDelta, screenPos);
    if (!qFuzzyCompare(before, m_transform.zoom())) {
        emit transformChanged();
    }
}

void StrokeOrchestrator::cancelActiveGesture()
{
    if (m_transform.isDrawing()) {
        m_transform.resetState();
        endStroke();
    } else if (m_transform.isPanning()) {
        m_transform.resetState();
    }
}

// ===== Stroke Lifecycle =====

void StrokeOrchestrator::beginStroke(const QPointF& imagePt)
{
    DualResolutionCompositor& compositor = m_session->compositor();

    m_session->undoManager().snapshot(compositor.maskLayer());
    emit undoAvailableChanged(true);

    m_stroke.clear();
    m_stroke.damage.setBounds(compositor.maskLayer().rect());

    const QPoint px = toPixel(imagePt);
    const int radius = brushRadius();

    compositor.enterLiveMode();
    emit liveModeChanged(true);

    const QRect previewDirty = compositor.drawLive(imagePt, radius, m_brushColor, isErasing());
    m_stroke.damage.accumulate(
        BrushStampEngine::stamp(compositor.maskLayer(), px, radius, m_brushColor, isErasing()));

    m_stroke.points.append(imagePt);
    m_stroke.lastPoint = px;

    emit previewChanged(previewDirty);
}

void StrokeOrchestrator::continueStroke(const QPointF& imagePt)
{
    DualResolutionCompositor& compositor = m_session->compositor();
    const QPoint px = toPixel(imagePt);
    const int radius = brushRadius();

    // Segment from the last stamped pixel, so fast moves leave no gaps
    const QRect previewDirty = compositor.drawLiveSegment(m_stroke.lastPoint, px, radius,
                                                          m_brushColor, isErasing());
    m_stroke.damage.accumulate(
        BrushStampEngine::strokeSegment(compositor.maskLayer(), m_stroke.lastPoint, px,
                                        radius, m_brushColor, isErasing()));

    m_stroke.points.append(imagePt);
    m_stroke.lastPoint = px;

    if (!previewDirty.isEmpty()) {
        emit previewChanged(previewDirty);
    }
}

void StrokeOrchestrator::endStroke()
{
    const QRect damage = m_stroke.damage.flushAndClear();

    // Recomposite once at full resolution
    m_session->compositor().exitLiveMode(damage);
    m_stroke.clear();

    emit liveModeChanged(false);
    emit displayChanged(damage.isEmpty() ? m_session->workingImage().rect() : damage);
    emit maskModified();
}

QPoint StrokeOrchestrator::toPixel(const QPointF& imagePt)
{
    return QPoint(qFloor(imagePt.x()), qFloor(imagePt.y()));
}

bool StrokeOrchestrator::isOverImage(const QPointF& imagePt) const
{
    const QSize size = m_transform.imageSize();
    return imagePt.x() >= 0 && imagePt.y() >= 0
        && imagePt.x() < size.width() && imagePt.y() < size.height();
}

// ===== Navigation =====

void StrokeOrchestrator::fitToViewport(const QSizeF& viewportSize)
{
    m_transform.fitToViewport(viewportSize);
    emit transformChanged();
}

void StrokeOrchestrator::setZoom(qreal zoom, const QPointF& screenAnchor)
{
    const qreal before = m_transform.zoom();
    m_transform.zoomAtAnchor(zoom, screenAnchor);
    if (!qFuzzyCompare(before, m_transform.zoom())) {
        emit transformChanged();
    }
}

// ===== Actions =====

bool StrokeOrchestrator::canUndo() const
{
    return hasSession() && m_session->undoManager().canUndo();
}

bool StrokeOrchestrator::undo()
{
    if (!hasSession() || m_transform.isDrawing()) {
        return false;
    }

    std::optional<PixelBuffer> snapshot = m_session->undoManager().undo();
    if (!snapshot) {
        return false;
    }
    if (!m_session->compositor().setMaskLayer(*snapshot)) {
        return false;
    }

    emit displayChanged(m_session->workingImage().rect());
    emit maskModified();
    emit undoAvailableChanged(m_session->undoManager().canUndo());
    return true;
}

bool StrokeOrchestrator::resetMask()
{
    if (!hasSession() || m_transform.isDrawing()) {
        return false;
    }

    DualResolutionCompositor& compositor = m_session->compositor();
    m_session->undoManager().snapshot(compositor.maskLayer());
    compositor.clearMask();

    emit undoAvailableChanged(true);
    emit displayChanged(m_session->workingImage().rect());
    emit maskModified();
    return true;
}
