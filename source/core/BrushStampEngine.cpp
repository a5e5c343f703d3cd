// ============================================================================
// BrushStampEngine - Implementation
// ============================================================================

#include "BrushStampEngine.h"

#include <QtGlobal>
#include <cstdlib>

QRgb BrushStampEngine::stampValue(const QColor& color, bool erase)
{
    if (erase) {
        return qRgba(0, 0, 0, 0);
    }
    return qRgba(color.red(), color.green(), color.blue(), 255);
}

QRect BrushStampEngine::stamp(PixelBuffer& target, const QPoint& center, int radius,
                              const QColor& color, bool erase)
{
    if (target.isNull()) {
        return QRect();
    }
    if (radius < 0) {
        radius = 0;
    }

    // Clip in 64-bit so very large radii cannot overflow the dab bounds
    const qint64 left = qMax<qint64>(0, qint64(center.x()) - radius);
    const qint64 top = qMax<qint64>(0, qint64(center.y()) - radius);
    const qint64 right = qMin<qint64>(target.width() - 1, qint64(center.x()) + radius);
    const qint64 bottom = qMin<qint64>(target.height() - 1, qint64(center.y()) + radius);
    if (left > right || top > bottom) {
        return QRect();
    }
    const QRect clipped(QPoint(int(left), int(top)), QPoint(int(right), int(bottom)));

    const QRgb value = stampValue(color, erase);
    const qint64 radiusSq = qint64(radius) * radius;

    for (int py = clipped.top(); py <= clipped.bottom(); ++py) {
        const qint64 dy = py - center.y();
        const qint64 dySq = dy * dy;
        QRgb* row = target.scanLine(py);
        for (int px = clipped.left(); px <= clipped.right(); ++px) {
            const qint64 dx = px - center.x();
            if (dx * dx + dySq <= radiusSq) {
                row[px] = value;
            }
        }
    }

    return clipped;
}

QRect BrushStampEngine::strokeSegment(PixelBuffer& target, const QPoint& from, const QPoint& to,
                                      int radius, const QColor& color, bool erase)
{
    if (target.isNull()) {
        return QRect();
    }

    int x0 = from.x();
    int y0 = from.y();
    const int x1 = to.x();
    const int y1 = to.y();

    const int dx = std::abs(x1 - x0);
    const int dy = std::abs(y1 - y0);
    const int sx = x0 < x1 ? 1 : -1;
    const int sy = y0 < y1 ? 1 : -1;
    int err = dx - dy;

    QRect damage;
    while (true) {
        damage = damage.united(stamp(target, QPoint(x0, y0), radius, color, erase));
        if (x0 == x1 && y0 == y1) {
            break;
        }
        const int e2 = 2 * err;
        if (e2 > -dy) {
            err -= dy;
            x0 += sx;
        }
        if (e2 < dx) {
            err += dx;
            y0 += sy;
        }
    }
    return damage;
}
