#pragma once

// ============================================================================
// BrushStampEngine - Circular brush rasterization
// ============================================================================
// Stamps hard-edged circular dabs into a PixelBuffer and walks integer line
// segments between pointer samples so fast strokes never leave gaps.
//
// Every operation returns the rectangle of pixels it touched (clipped to the
// buffer), which feeds the DamageTracker.
// ============================================================================

#include "PixelBuffer.h"

#include <QColor>
#include <QPoint>
#include <QRect>

class BrushStampEngine {
public:
    /**
     * @brief Convert a brush size (diameter in pixels) to a stamp radius.
     *
     * Uses integer division, so odd sizes round down (size 21 -> radius 10).
     * Kept this way so masks painted with earlier builds reproduce exactly.
     */
    static int radiusForBrushSize(int brushSize) { return brushSize > 0 ? brushSize / 2 : 0; }

    /**
     * @brief Stamp a single circular dab.
     * @param target Buffer to mutate in place.
     * @param center Dab center in buffer pixels.
     * @param radius Dab radius; pixels with dx²+dy² <= radius² are written.
     * @param color Paint color (alpha is forced to 255).
     * @param erase If true, pixels are cleared to fully transparent instead.
     * @return Bounding rectangle of the affected pixels, empty if none.
     */
    static QRect stamp(PixelBuffer& target, const QPoint& center, int radius,
                       const QColor& color, bool erase);

    /**
     * @brief Stamp along the integer line from @p from to @p to (both inclusive).
     *
     * Bresenham stepping, one stamp per step, so consecutive dabs are at most
     * one pixel apart regardless of how sparse the pointer samples are.
     *
     * @return Union of all stamp rectangles.
     */
    static QRect strokeSegment(PixelBuffer& target, const QPoint& from, const QPoint& to,
                               int radius, const QColor& color, bool erase);

    /**
     * @brief Pixel value written by a stamp for the given color/mode.
     */
    static QRgb stampValue(const QColor& color, bool erase);
};
