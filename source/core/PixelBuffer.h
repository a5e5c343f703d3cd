#pragma once

// ============================================================================
// PixelBuffer - A 2D grid of RGBA pixels
// ============================================================================
// Shared primitive for every buffer role in the editor: the working image,
// the full-resolution mask layer, the preview pair and the undo snapshots.
//
// Backed by a QImage in Format_ARGB32 (non-premultiplied), so each pixel is a
// QRgb and rows can be walked directly through scanLine().
// ============================================================================

#include <QImage>
#include <QRect>
#include <QSize>
#include <QRgb>

/**
 * @brief RGBA pixel grid with explicit deep-copy semantics.
 *
 * Copying a PixelBuffer is cheap (QImage is implicitly shared) and any write
 * detaches, so two buffers never alias each other's pixels. clone() forces an
 * immediate deep copy for callers that hold on to a snapshot.
 */
class PixelBuffer {
public:
    /**
     * @brief Construct a null buffer (0x0).
     */
    PixelBuffer() = default;

    /**
     * @brief Construct a buffer filled with a single value.
     * @param width Width in pixels.
     * @param height Height in pixels.
     * @param fillValue Initial pixel value (default fully transparent).
     */
    PixelBuffer(int width, int height, QRgb fillValue = qRgba(0, 0, 0, 0));

    /**
     * @brief Wrap an existing image, converting it to ARGB32 if needed.
     */
    explicit PixelBuffer(const QImage& image);

    // ===== Geometry =====

    int width() const { return m_image.width(); }
    int height() const { return m_image.height(); }
    QSize size() const { return m_image.size(); }
    QRect rect() const { return m_image.rect(); }

    /**
     * @brief True if the buffer has no pixels (null or zero-sized).
     */
    bool isNull() const { return m_image.isNull() || m_image.width() <= 0 || m_image.height() <= 0; }

    bool contains(int x, int y) const { return x >= 0 && y >= 0 && x < width() && y < height(); }

    // ===== Pixel Access =====

    /**
     * @brief Read a pixel. Coordinates must be inside the buffer.
     */
    QRgb pixel(int x, int y) const { return constScanLine(y)[x]; }

    /**
     * @brief Write a pixel. Coordinates must be inside the buffer.
     */
    void setPixel(int x, int y, QRgb value) { scanLine(y)[x] = value; }

    QRgb* scanLine(int y) { return reinterpret_cast<QRgb*>(m_image.scanLine(y)); }
    const QRgb* constScanLine(int y) const { return reinterpret_cast<const QRgb*>(m_image.constScanLine(y)); }

    /**
     * @brief Fill every pixel with a value.
     */
    void fill(QRgb value);

    // ===== Copies & Resampling =====

    /**
     * @brief Deep copy, detached from this buffer's storage.
     */
    PixelBuffer clone() const;

    /**
     * @brief Nearest-neighbor resample to a new size.
     * @return Resampled buffer, or a null buffer if the target size is empty.
     */
    PixelBuffer scaledNearest(const QSize& targetSize) const;

    /**
     * @brief Smooth (filtered) resample to a new size. Used for the working image only.
     */
    PixelBuffer scaledSmooth(const QSize& targetSize) const;

    // ===== Queries =====

    /**
     * @brief Count pixels whose alpha is greater than zero.
     */
    int countNonTransparent() const;

    /**
     * @brief Read-only access to the underlying image (for painting and saving).
     */
    const QImage& image() const { return m_image; }

    bool operator==(const PixelBuffer& other) const { return m_image == other.m_image; }
    bool operator!=(const PixelBuffer& other) const { return !(*this == other); }

private:
    QImage m_image;
};
