#pragma once

// ============================================================================
// MaskSettings - User-tunable editor settings
// ============================================================================
// Loaded from QSettings("MaskPainter", "App"). Every value is validated on
// load; out-of-range values fall back to (or clamp to) the defaults below so
// the editing core never sees a degenerate configuration.
// ============================================================================

#include <QColor>
#include <QString>

class QSettings;

struct MaskSettings {
    // ----- Working Image -----
    /// CUSTOMIZABLE: Larger working-image dimension; bigger sources are downscaled (range: 256-8192)
    int maxWorkingDimension = 1000;

    // ----- Preview -----
    /// CUSTOMIZABLE: Live preview resolution relative to the working image (range: 0.1-1.0)
    qreal previewScale = 0.5;

    // ----- History -----
    /// CUSTOMIZABLE: Undo snapshots kept per session - higher = more RAM (range: 1-200)
    int undoCapacity = 20;

    // ----- Navigation -----
    qreal zoomMin = 0.1;
    qreal zoomMax = 10.0;
    qreal wheelZoomStep = 0.08;     ///< 8% per wheel notch

    // ----- Brush Defaults -----
    static constexpr int MIN_BRUSH_SIZE = 1;
    static constexpr int MAX_BRUSH_SIZE = 200;    ///< Matches the editor's size slider
    int brushSize = 20;             ///< Diameter in working-image pixels
    QColor brushColor = QColor(255, 0, 0);

    /**
     * @brief Clamp every field into its valid range.
     */
    void sanitize();

    /**
     * @brief Load settings from the application's QSettings store.
     */
    static MaskSettings load();

    /**
     * @brief Load settings from an explicit QSettings object (used by tests).
     */
    static MaskSettings load(QSettings& settings);

    /**
     * @brief Persist the brush defaults (size and color) the user last picked.
     */
    void saveBrushDefaults() const;
    void saveBrushDefaults(QSettings& settings) const;
};
