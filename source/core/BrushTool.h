#pragma once

// ============================================================================
// BrushTool - Available mask brush tools
// ============================================================================

/**
 * @brief Tools that can be applied to the mask layer.
 *
 * Both tools write only fully painted (alpha 255) or fully cleared (alpha 0)
 * pixels; partial alpha only ever comes from masks authored elsewhere.
 */
enum class BrushTool {
    Paint,      ///< Paint mask color at full opacity
    Erase       ///< Clear pixels to fully transparent
};
