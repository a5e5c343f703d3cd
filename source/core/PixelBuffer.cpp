// ============================================================================
// PixelBuffer - Implementation
// ============================================================================

#include "PixelBuffer.h"

PixelBuffer::PixelBuffer(int width, int height, QRgb fillValue)
{
    if (width <= 0 || height <= 0) {
        return;
    }
    m_image = QImage(width, height, QImage::Format_ARGB32);
    m_image.fill(fillValue);
}

PixelBuffer::PixelBuffer(const QImage& image)
{
    if (image.isNull()) {
        return;
    }
    m_image = (image.format() == QImage::Format_ARGB32)
              ? image
              : image.convertToFormat(QImage::Format_ARGB32);
}

void PixelBuffer::fill(QRgb value)
{
    if (isNull()) {
        return;
    }
    // QImage::fill(uint) writes the raw value for 32-bit formats
    m_image.fill(value);
}

PixelBuffer PixelBuffer::clone() const
{
    PixelBuffer copy;
    copy.m_image = m_image.copy();
    return copy;
}

PixelBuffer PixelBuffer::scaledNearest(const QSize& targetSize) const
{
    if (isNull() || targetSize.isEmpty()) {
        return PixelBuffer();
    }
    if (targetSize == size()) {
        return clone();
    }
    // Qt::FastTransformation is nearest-neighbor sampling
    PixelBuffer result;
    result.m_image = m_image.scaled(targetSize, Qt::IgnoreAspectRatio, Qt::FastTransformation)
                         .convertToFormat(QImage::Format_ARGB32);
    return result;
}

PixelBuffer PixelBuffer::scaledSmooth(const QSize& targetSize) const
{
    if (isNull() || targetSize.isEmpty()) {
        return PixelBuffer();
    }
    if (targetSize == size()) {
        return clone();
    }
    PixelBuffer result;
    result.m_image = m_image.scaled(targetSize, Qt::IgnoreAspectRatio, Qt::SmoothTransformation)
                         .convertToFormat(QImage::Format_ARGB32);
    return result;
}

int PixelBuffer::countNonTransparent() const
{
    if (isNull()) {
        return 0;
    }
    int count = 0;
    const int w = width();
    for (int y = 0; y < height(); ++y) {
        const QRgb* row = constScanLine(y);
        for (int x = 0; x < w; ++x) {
            if (qAlpha(row[x]) > 0) {
                ++count;
            }
        }
    }
    return count;
}
