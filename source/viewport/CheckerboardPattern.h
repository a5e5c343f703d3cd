#pragma once

// ============================================================================
// CheckerboardPattern - Transparency backdrop for the mask-only view
// ============================================================================
// Immutable after construction. The canvas uses the tile as a repeating
// brush, so only one tile (cellsPerSide × cellsPerSide cells) is rendered.
// ============================================================================

#include <QColor>
#include <QImage>

class CheckerboardPattern {
public:
    /// CUSTOMIZABLE: Size of one checker cell in screen pixels (range: 4-64)
    static constexpr int DEFAULT_CELL_SIZE = 10;
    static constexpr int DEFAULT_CELLS_PER_SIDE = 10;

    CheckerboardPattern(int cellSize = DEFAULT_CELL_SIZE,
                        int cellsPerSide = DEFAULT_CELLS_PER_SIDE,
                        const QColor& lightColor = QColor(Qt::lightGray),
                        const QColor& darkColor = QColor(Qt::gray));

    int cellSize() const { return m_cellSize; }
    int cellsPerSide() const { return m_cellsPerSide; }
    QColor lightColor() const { return m_light; }
    QColor darkColor() const { return m_dark; }

    /**
     * @brief The rendered tile: cell (0,0) is light, colors alternate per cell.
     */
    const QImage& tile() const { return m_tile; }

    /**
     * @brief Color of the cell covering tile pixel (x, y), wrapping outside the tile.
     */
    QColor colorAt(int x, int y) const;

private:
    int m_cellSize;
    int m_cellsPerSide;
    QColor m_light;
    QColor m_dark;
    QImage m_tile;
};
