// ============================================================================
// DualResolutionCompositor - Implementation
// ============================================================================

#include "DualResolutionCompositor.h"
#include "BrushStampEngine.h"

#include <QDebug>
#include <QtMath>

DualResolutionCompositor::DualResolutionCompositor(qreal previewScale)
{
    setPreviewScale(previewScale);
}

// ===== Setup =====

void DualResolutionCompositor::setWorkingImage(const PixelBuffer& workingImage)
{
    m_workingImage = workingImage;
    m_live = false;

    // Force a preview rebuild even if the new image happens to have the same size
    m_previewImage = PixelBuffer();
    m_previewMask = PixelBuffer();
    m_previewBase = QImage();
    m_previewOverlay = QImage();

    if (!hasImage()) {
        m_maskLayer = PixelBuffer();
        m_display = QImage();
        return;
    }

    if (m_maskLayer.size() != m_workingImage.size()) {
        m_maskLayer = PixelBuffer(m_workingImage.width(), m_workingImage.height());
    }

    m_display = QImage(m_workingImage.size(), QImage::Format_ARGB32);
    ensurePreviewBuffers();
    compositeAll();
}

void DualResolutionCompositor::setPreviewScale(qreal scale)
{
    if (!(scale > 0) || scale > 1.0) {
        qWarning() << "DualResolutionCompositor: invalid preview scale" << scale
                   << "- using" << DEFAULT_PREVIEW_SCALE;
        scale = DEFAULT_PREVIEW_SCALE;
    }
    if (qFuzzyCompare(m_previewScale, scale) && !m_previewImage.isNull()) {
        return;
    }
    m_previewScale = scale;
    // Size changes are picked up lazily by ensurePreviewBuffers()
    ensurePreviewBuffers();
    if (m_live) {
        syncMaskToPreview();
        renderPreviewBase();
    }
}

QSize DualResolutionCompositor::previewSize() const
{
    if (!hasImage()) {
        return QSize();
    }
    return QSize(qMax(1, qRound(m_workingImage.width() * m_previewScale)),
                 qMax(1, qRound(m_workingImage.height() * m_previewScale)));
}

void DualResolutionCompositor::ensurePreviewBuffers()
{
    if (!hasImage()) {
        return;
    }
    const QSize pSize = previewSize();

    // Any mismatch means a full rebuild of that buffer, never an error
    if (m_previewImage.size() != pSize) {
        m_previewImage = m_workingImage.scaledNearest(pSize);
    }
    if (m_previewMask.size() != pSize) {
        m_previewMask = PixelBuffer(pSize.width(), pSize.height());
    }
    if (m_previewBase.size() != pSize) {
        m_previewBase = QImage(pSize, QImage::Format_ARGB32);
        m_previewBase.fill(Qt::black);
    }
    if (m_previewOverlay.size() != pSize) {
        m_previewOverlay = QImage(pSize, QImage::Format_ARGB32);
        m_previewOverlay.fill(Qt::transparent);
    }
}

// ===== Mask Layer =====

bool DualResolutionCompositor::setMaskLayer(const PixelBuffer& mask)
{
    if (!hasImage()) {
        return false;
    }
    if (mask.size() != m_workingImage.size()) {
        qWarning() << "DualResolutionCompositor: rejected mask of size" << mask.size()
                   << "expected" << m_workingImage.size();
        return false;
    }

    m_maskLayer = mask;
    compositeAll();
    if (m_live) {
        syncMaskToPreview();
    }
    return true;
}

void DualResolutionCompositor::clearMask()
{
    if (!hasImage()) {
        return;
    }
    m_maskLayer.fill(qRgba(0, 0, 0, 0));
    compositeAll();
    if (m_live) {
        syncMaskToPreview();
    }
}

// ===== Live Mode =====

void DualResolutionCompositor::enterLiveMode()
{
    if (!hasImage()) {
        return;
    }
    ensurePreviewBuffers();
    syncMaskToPreview();
    renderPreviewBase();
    m_live = true;
}

void DualResolutionCompositor::syncMaskToPreview()
{
    if (!hasImage()) {
        return;
    }
    ensurePreviewBuffers();

    const int pW = m_previewMask.width();
    const int pH = m_previewMask.height();
    const int srcW = m_maskLayer.width();
    const int srcH = m_maskLayer.height();
    const qreal invScale = 1.0 / m_previewScale;

    for (int y = 0; y < pH; ++y) {
        const int srcY = qMin(srcH - 1, qRound(y * invScale));
        const QRgb* srcRow = m_maskLayer.constScanLine(srcY);
        QRgb* dstRow = m_previewMask.scanLine(y);
        for (int x = 0; x < pW; ++x) {
            const int srcX = qMin(srcW - 1, qRound(x * invScale));
            dstRow[x] = srcRow[srcX];
        }
    }

    copyPreviewMaskToOverlay(m_previewMask.rect());
}

QRect DualResolutionCompositor::drawLive(const QPointF& imagePoint, int radius,
                                         const QColor& color, bool erase)
{
    if (!hasImage()) {
        return QRect();
    }
    ensurePreviewBuffers();

    const QRect touched = BrushStampEngine::stamp(m_previewMask, toPreview(imagePoint),
                                                  previewRadius(radius), color, erase);
    copyPreviewMaskToOverlay(touched);
    return touched;
}

QRect DualResolutionCompositor::drawLiveSegment(const QPoint& from, const QPoint& to, int radius,
                                                const QColor& color, bool erase)
{
    if (!hasImage()) {
        return QRect();
    }
    ensurePreviewBuffers();

    // Walk the line in preview space: fewer steps than the full-res walk and
    // still gap-free at preview resolution
    const QRect touched = BrushStampEngine::strokeSegment(m_previewMask, toPreview(from), toPreview(to),
                                                          previewRadius(radius), color, erase);
    copyPreviewMaskToOverlay(touched);
    return touched;
}

void DualResolutionCompositor::exitLiveMode(const QRect& damage)
{
    if (!hasImage()) {
        return;
    }
    m_live = false;

    if (damage.isEmpty()) {
        compositeAll();
    } else {
        composite(damage);
    }
}

void DualResolutionCompositor::renderPreviewBase()
{
    if (m_previewImage.isNull()) {
        return;
    }
    const int pW = m_previewImage.width();
    const int pH = m_previewImage.height();
    for (int y = 0; y < pH; ++y) {
        const QRgb* src = m_previewImage.constScanLine(y);
        QRgb* dst = reinterpret_cast<QRgb*>(m_previewBase.scanLine(y));
        for (int x = 0; x < pW; ++x) {
            dst[x] = src[x] | 0xff000000u;  // Base is always opaque
        }
    }
}

void DualResolutionCompositor::copyPreviewMaskToOverlay(const QRect& previewRect)
{
    const QRect r = previewRect.intersected(m_previewMask.rect());
    if (r.isEmpty()) {
        return;
    }
    // Mask pixels only - the display layer composites the overlay itself
    for (int y = r.top(); y <= r.bottom(); ++y) {
        const QRgb* src = m_previewMask.constScanLine(y);
        QRgb* dst = reinterpret_cast<QRgb*>(m_previewOverlay.scanLine(y));
        for (int x = r.left(); x <= r.right(); ++x) {
            dst[x] = src[x];
        }
    }
}

int DualResolutionCompositor::previewRadius(int radius) const
{
    return qMax(1, qRound(radius * m_previewScale));
}

QPoint DualResolutionCompositor::toPreview(const QPointF& imagePoint) const
{
    return QPoint(qRound(imagePoint.x() * m_previewScale),
                  qRound(imagePoint.y() * m_previewScale));
}

QRect DualResolutionCompositor::previewRectToImage(const QRect& previewRect) const
{
    if (!hasImage() || previewRect.isEmpty()) {
        return QRect();
    }
    const qreal inv = 1.0 / m_previewScale;
    const int x0 = qFloor(previewRect.left() * inv);
    const int y0 = qFloor(previewRect.top() * inv);
    const int x1 = qCeil((previewRect.right() + 1) * inv);
    const int y1 = qCeil((previewRect.bottom() + 1) * inv);
    return QRect(QPoint(x0, y0), QPoint(x1 - 1, y1 - 1)).intersected(m_workingImage.rect());
}

// ===== Compositing =====

QRgb DualResolutionCompositor::blendPixel(QRgb imagePixel, QRgb maskPixel)
{
    const int alpha = qAlpha(maskPixel);
    if (alpha == 255) {
        // Solid mask reads as painted
        return qRgba(qRed(maskPixel), qGreen(maskPixel), qBlue(maskPixel), 255);
    }
    if (alpha == 0) {
        return qRgba(qRed(imagePixel), qGreen(imagePixel), qBlue(imagePixel), 255);
    }

    // Soft-edged masks authored elsewhere
    const float a = alpha / 255.0f;
    const int r = static_cast<int>(qRed(maskPixel) * a + qRed(imagePixel) * (1.0f - a));
    const int g = static_cast<int>(qGreen(maskPixel) * a + qGreen(imagePixel) * (1.0f - a));
    const int b = static_cast<int>(qBlue(maskPixel) * a + qBlue(imagePixel) * (1.0f - a));
    return qRgba(r, g, b, 255);
}

void DualResolutionCompositor::composite(const QRect& rect)
{
    if (!hasImage()) {
        return;
    }
    const QRect r = rect.normalized().intersected(m_workingImage.rect());
    if (r.isEmpty()) {
        return;
    }

    for (int y = r.top(); y <= r.bottom(); ++y) {
        const QRgb* imageRow = m_workingImage.constScanLine(y);
        const QRgb* maskRow = m_maskLayer.constScanLine(y);
        QRgb* out = reinterpret_cast<QRgb*>(m_display.scanLine(y));
        for (int x = r.left(); x <= r.right(); ++x) {
            out[x] = blendPixel(imageRow[x], maskRow[x]);
        }
    }
}

void DualResolutionCompositor::compositeAll()
{
    if (!hasImage()) {
        return;
    }
    composite(m_workingImage.rect());
}
