// ============================================================================
// ViewportTransform - Implementation
// ============================================================================

#include "ViewportTransform.h"

#include <QtGlobal>

// ===== Configuration =====

void ViewportTransform::setZoomRange(qreal minZoom, qreal maxZoom)
{
    if (minZoom <= 0 || maxZoom <= 0 || minZoom > maxZoom) {
        minZoom = DEFAULT_MIN_ZOOM;
        maxZoom = DEFAULT_MAX_ZOOM;
    }
    m_minZoom = minZoom;
    m_maxZoom = maxZoom;
    m_zoom = clampZoom(m_zoom);
}

void ViewportTransform::setWheelStep(qreal step)
{
    // A step of 1.0 or more would let a single zoom-out notch reach zero
    m_wheelStep = (step > 0 && step < 1.0) ? step : DEFAULT_WHEEL_STEP;
}

void ViewportTransform::setZoom(qreal zoom)
{
    m_zoom = clampZoom(zoom);
}

qreal ViewportTransform::clampZoom(qreal zoom) const
{
    // NaN compares false everywhere, qBound would pass it through
    if (!(zoom > 0)) {
        return m_minZoom;
    }
    return qBound(m_minZoom, zoom, m_maxZoom);
}

// ===== Coordinate Conversion =====

QPointF ViewportTransform::screenToImage(const QPointF& screenPt) const
{
    return (screenPt - m_translation) / m_zoom;
}

QPointF ViewportTransform::imageToScreen(const QPointF& imagePt) const
{
    return imagePt * m_zoom + m_translation;
}

QRectF ViewportTransform::imageRectToScreen(const QRectF& imageRect) const
{
    return QRectF(imageToScreen(imageRect.topLeft()), imageRect.size() * m_zoom);
}

QRectF ViewportTransform::imageScreenRect() const
{
    return imageRectToScreen(QRectF(QPointF(0, 0), QSizeF(m_imageSize)));
}

// ===== Navigation =====

void ViewportTransform::zoomAtAnchor(qreal targetZoom, const QPointF& screenAnchor)
{
    targetZoom = clampZoom(targetZoom);
    const qreal oldZoom = m_zoom;
    if (qAbs(targetZoom - oldZoom) < 0.000001) {
        return;
    }

    // Image point under the anchor before the change:
    //   anchorImage = (screenAnchor - oldTranslate) / oldZoom
    // Keep it under the anchor afterwards:
    //   newTranslate = screenAnchor - targetZoom * anchorImage
    const QPointF anchorImage = (screenAnchor - m_translation) / oldZoom;
    m_translation = screenAnchor - targetZoom * anchorImage;
    m_zoom = targetZoom;
}

void ViewportTransform::fitToViewport(const QSizeF& viewportSize)
{
    const qreal viewportW = qMax<qreal>(0.0, viewportSize.width());
    const qreal viewportH = qMax<qreal>(0.0, viewportSize.height());

    if (m_imageSize.isEmpty()) {
        m_zoom = clampZoom(m_zoom);
        m_translation = QPointF(viewportW / 2.0, viewportH / 2.0);
        return;
    }

    const qreal sx = viewportW / m_imageSize.width();
    const qreal sy = viewportH / m_imageSize.height();
    m_zoom = clampZoom(qMin(sx, sy));

    // Center the scaled image (may go negative if the image overflows at minZoom)
    m_translation = QPointF((viewportW - m_imageSize.width() * m_zoom) / 2.0,
                            (viewportH - m_imageSize.height() * m_zoom) / 2.0);
}

void ViewportTransform::pan(const QPointF& deltaScreen)
{
    m_translation += deltaScreen;
}

void ViewportTransform::wheelZoom(int angleDelta, const QPointF& screenAnchor)
{
    if (angleDelta == 0) {
        return;
    }
    const qreal direction = angleDelta > 0 ? 1.0 : -1.0;
    zoomAtAnchor(m_zoom * (1.0 + direction * m_wheelStep), screenAnchor);
}

// ===== Interaction State Machine =====

bool ViewportTransform::pressButton(Qt::MouseButton button, bool overCanvas)
{
    if (m_state != InteractionState::Idle) {
        return false;
    }

    switch (button) {
        case Qt::LeftButton:
            if (!overCanvas) {
                return false;
            }
            m_state = InteractionState::Drawing;
            break;
        case Qt::MiddleButton:
        case Qt::RightButton:
            // Right button only pans when not drawing; being Idle guarantees that
            m_state = InteractionState::Panning;
            break;
        default:
            return false;
    }
    m_activeButton = button;
    return true;
}

bool ViewportTransform::releaseButton(Qt::MouseButton button)
{
    if (m_state == InteractionState::Idle || button != m_activeButton) {
        return false;
    }
    resetState();
    return true;
}

void ViewportTransform::resetState()
{
    m_state = InteractionState::Idle;
    m_activeButton = Qt::NoButton;
}
