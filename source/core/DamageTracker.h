#pragma once

// ============================================================================
// DamageTracker - Accumulated dirty rectangle
// ============================================================================
// Tracks the single bounding rectangle of pixels touched since the last
// flush, so recompositing after a stroke only walks what actually changed.
// ============================================================================

#include <QRect>

class DamageTracker {
public:
    DamageTracker() = default;

    /**
     * @brief Construct with the buffer bounds every rectangle is clamped to.
     */
    explicit DamageTracker(const QRect& bounds) : m_bounds(bounds) {}

    /**
     * @brief Set the clamp bounds (usually the mask layer rect).
     *
     * The currently tracked rectangle is re-clamped to the new bounds.
     */
    void setBounds(const QRect& bounds);
    QRect bounds() const { return m_bounds; }

    /**
     * @brief Grow the tracked rectangle to include @p rect.
     *
     * Empty rectangles are ignored. The result never extends past bounds().
     */
    void accumulate(const QRect& rect);

    /**
     * @brief Return the tracked rectangle and reset to empty.
     */
    QRect flushAndClear();

    QRect current() const { return m_damage; }
    bool isEmpty() const { return m_damage.isEmpty(); }
    void clear() { m_damage = QRect(); }

private:
    QRect clamp(const QRect& rect) const;

    QRect m_bounds;   ///< Null bounds = no clamping
    QRect m_damage;
};
