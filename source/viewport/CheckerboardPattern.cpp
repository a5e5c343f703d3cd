// ============================================================================
// CheckerboardPattern - Implementation
// ============================================================================

#include "CheckerboardPattern.h"

#include <QPainter>

CheckerboardPattern::CheckerboardPattern(int cellSize, int cellsPerSide,
                                         const QColor& lightColor, const QColor& darkColor)
    : m_cellSize(qMax(1, cellSize))
    , m_cellsPerSide(qMax(2, cellsPerSide))
    , m_light(lightColor)
    , m_dark(darkColor)
{
    const int side = m_cellSize * m_cellsPerSide;
    m_tile = QImage(side, side, QImage::Format_RGB32);

    QPainter painter(&m_tile);
    for (int row = 0; row < m_cellsPerSide; ++row) {
        for (int col = 0; col < m_cellsPerSide; ++col) {
            painter.fillRect(col * m_cellSize, row * m_cellSize, m_cellSize, m_cellSize,
                             ((row + col) % 2 == 0) ? m_light : m_dark);
        }
    }
}

QColor CheckerboardPattern::colorAt(int x, int y) const
{
    const int side = m_cellSize * m_cellsPerSide;
    // Positive modulo so negative coordinates wrap too
    const int tx = ((x % side) + side) % side;
    const int ty = ((y % side) + side) % side;
    return ((tx / m_cellSize + ty / m_cellSize) % 2 == 0) ? m_light : m_dark;
}
